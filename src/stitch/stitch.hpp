#ifndef DIFFEO_STITCH_HPP
#define DIFFEO_STITCH_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include "details/canvas.hpp"
#include "details/patch_name.hpp"
#include "details/stitcher.hpp"

namespace Diffeo::Stitch {
    using OverlapPolicy = Details::OverlapPolicy;
    using PatchName = Details::PatchName;
    using StitchOptions = Details::StitchOptions;
    using StitchResult = Details::StitchResult;

    [[nodiscard]] inline auto ParsePatchName(const std::filesystem::path& path) -> PatchName {
        return Details::parse_patch_name(path);
    }

    [[nodiscard]] inline auto Run(const std::filesystem::path& patch_folder, const StitchOptions& options = {}) -> StitchResult {
        return Details::stitch(patch_folder, options);
    }
}

#endif // DIFFEO_STITCH_HPP
