#ifndef DIFFEO_STITCH_STITCHER_HPP
#define DIFFEO_STITCH_STITCHER_HPP
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <map>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include "../../utils/files.hpp"
#include "canvas.hpp"
#include "patch_name.hpp"

namespace Diffeo::Stitch::Details {
    struct StitchOptions {
        std::int64_t canvas_rows{1000};
        std::int64_t canvas_cols{1000};
        std::int64_t patch_size{32};
        OverlapPolicy overlap{OverlapPolicy::Overwrite};
        // Empty folders default to siblings of the patch folder.
        std::filesystem::path output_folder{};
        std::filesystem::path colored_folder{};
        std::ostream* stream{&std::cout};
    };

    struct StitchResult {
        std::vector<std::pair<std::string, cv::Mat>> canvases{};
        std::filesystem::path output_folder{};
        std::filesystem::path colored_folder{};
        std::size_t patch_count{0};
    };

    inline void validate(const StitchOptions& options)
    {
        if (options.canvas_rows <= 0 || options.canvas_cols <= 0) {
            throw std::invalid_argument("Stitch canvas dimensions must be strictly positive.");
        }
        if (options.patch_size <= 0) {
            throw std::invalid_argument("Stitch patch size must be strictly positive.");
        }
    }

    inline std::filesystem::path sibling(const std::filesystem::path& folder, const std::string& name)
    {
        auto normalized = folder.lexically_normal();
        if (!normalized.has_filename()) {
            normalized = normalized.parent_path();
        }
        return normalized.parent_path() / name;
    }

    inline cv::Mat read_patch(const std::filesystem::path& path)
    {
        cv::Mat patch = cv::imread(path.string(), cv::IMREAD_GRAYSCALE);
        if (patch.empty()) {
            throw std::runtime_error("Failed to decode patch: " + path.string());
        }
        return patch;
    }

    inline void write_image(const std::filesystem::path& path, const cv::Mat& image)
    {
        if (!cv::imwrite(path.string(), image)) {
            throw std::runtime_error("Failed to write image: " + path.string());
        }
    }

    // Groups every patch by base identifier and pastes each group, in filename order, onto one canvas.
    inline StitchResult stitch(const std::filesystem::path& patch_folder, const StitchOptions& options = {})
    {
        validate(options);
        StitchResult result;
        result.output_folder = options.output_folder.empty() ? sibling(patch_folder, "stitched_labels") : options.output_folder;
        result.colored_folder = options.colored_folder.empty() ? sibling(patch_folder, "colored_stitched_labels") : options.colored_folder;
        std::filesystem::create_directories(result.output_folder);
        std::filesystem::create_directories(result.colored_folder);

        const auto patches = Utils::Files::collect(patch_folder, ".png");
        result.patch_count = patches.size();

        std::map<std::string, std::vector<std::pair<std::filesystem::path, PatchName>>> groups;
        for (const auto& path : patches) {
            auto name = parse_patch_name(path);
            groups[name.base_id].emplace_back(path, std::move(name));
        }

        for (const auto& [base_id, members] : groups) {
            cv::Mat canvas = cv::Mat::zeros(static_cast<int>(options.canvas_rows), static_cast<int>(options.canvas_cols), CV_8UC1);
            for (const auto& [path, name] : members) {
                const auto placement = place(name.row_offset, name.col_offset, options.patch_size,
                                             options.canvas_rows, options.canvas_cols);
                if (placement.empty()) {
                    continue;
                }
                paste(canvas, read_patch(path), placement, options.overlap);
            }

            write_image(result.output_folder / (base_id + ".png"), canvas);
            write_image(result.colored_folder / (base_id + ".png"), colorize(canvas));
            result.canvases.emplace_back(base_id, std::move(canvas));
        }

        if (options.stream != nullptr) {
            *options.stream << "Done stitching " << result.patch_count << " patches. Stitched: "
                            << result.canvases.size() << "." << std::endl;
        }
        return result;
    }
}

#endif // DIFFEO_STITCH_STITCHER_HPP
