#ifndef DIFFEO_ORIENTATION_HPP
#define DIFFEO_ORIENTATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <vector>

#include <torch/torch.h>

#include "details/dihedral.hpp"
#include "details/matcher.hpp"
#include "details/ncc.hpp"

namespace Diffeo::Orientation {
    using FlipRotation = Details::FlipRotation;
    using Alignment = Details::Alignment;
    using NCCOptions = Details::NCCOptions;

    inline constexpr const auto& kDihedralGroup = Details::kDihedralGroup;
    inline constexpr const auto& kDihedralInverses = Details::kDihedralInverses;

    [[nodiscard]] inline Alignment BestAlignment(const torch::Tensor& fixed,
                                                 const torch::Tensor& moving,
                                                 const NCCOptions& options = {}) {
        return Details::best_alignment(fixed, moving, options);
    }

    [[nodiscard]] inline torch::Tensor Apply(const torch::Tensor& images, const std::vector<FlipRotation>& transforms) {
        return Details::apply_batch(images, transforms);
    }
}

#endif // DIFFEO_ORIENTATION_HPP
