#ifndef DIFFEO_STITCH_CANVAS_HPP
#define DIFFEO_STITCH_CANVAS_HPP
#include <algorithm>
#include <cstdint>
#include <stdexcept>

#include <opencv2/core.hpp>

namespace Diffeo::Stitch::Details {
    enum class OverlapPolicy {
        Overwrite, // the later patch in filename order wins
        Maximum,   // pixel-wise maximum of old and new values
    };

    // Canvas rectangle [start, end) and the matching top-left corner inside the patch.
    struct Placement {
        std::int64_t start_row{0};
        std::int64_t start_col{0};
        std::int64_t end_row{0};
        std::int64_t end_col{0};
        std::int64_t crop_row{0};
        std::int64_t crop_col{0};

        [[nodiscard]] std::int64_t rows() const noexcept { return end_row - start_row; }
        [[nodiscard]] std::int64_t cols() const noexcept { return end_col - start_col; }
        [[nodiscard]] bool empty() const noexcept { return rows() <= 0 || cols() <= 0; }
    };

    // A negative offset crops the leading rows/cols of the patch; the canvas border clips the rest.
    [[nodiscard]] inline Placement place(std::int64_t row_offset,
                                         std::int64_t col_offset,
                                         std::int64_t patch_size,
                                         std::int64_t canvas_rows,
                                         std::int64_t canvas_cols) noexcept
    {
        Placement placement;
        const auto offset_row = std::min<std::int64_t>(0, row_offset);
        const auto offset_col = std::min<std::int64_t>(0, col_offset);
        placement.start_row = std::max<std::int64_t>(0, row_offset);
        placement.start_col = std::max<std::int64_t>(0, col_offset);
        placement.end_row = std::min(placement.start_row + patch_size + offset_row, canvas_rows);
        placement.end_col = std::min(placement.start_col + patch_size + offset_col, canvas_cols);
        placement.crop_row = -offset_row;
        placement.crop_col = -offset_col;
        return placement;
    }

    // Returns false when nothing of the patch lands on the canvas.
    inline bool paste(cv::Mat& canvas, const cv::Mat& patch, Placement placement, OverlapPolicy policy)
    {
        if (canvas.type() != patch.type()) {
            throw std::invalid_argument("Patch and canvas pixel types differ.");
        }
        placement.end_row = std::min<std::int64_t>(placement.end_row, placement.start_row + patch.rows - placement.crop_row);
        placement.end_col = std::min<std::int64_t>(placement.end_col, placement.start_col + patch.cols - placement.crop_col);
        if (placement.empty()) {
            return false;
        }

        const cv::Rect source(static_cast<int>(placement.crop_col), static_cast<int>(placement.crop_row),
                              static_cast<int>(placement.cols()), static_cast<int>(placement.rows()));
        const cv::Rect target(static_cast<int>(placement.start_col), static_cast<int>(placement.start_row),
                              static_cast<int>(placement.cols()), static_cast<int>(placement.rows()));
        cv::Mat region = canvas(target);
        if (policy == OverlapPolicy::Maximum) {
            cv::max(region, patch(source), region);
        } else {
            patch(source).copyTo(region);
        }
        return true;
    }

    inline cv::Mat colorize(const cv::Mat& canvas)
    {
        cv::Mat colored(canvas.size(), CV_8UC3, cv::Scalar(0, 0, 0));
        colored.setTo(cv::Scalar(0, 255, 0), canvas != 0);
        return colored;
    }
}

#endif // DIFFEO_STITCH_CANVAS_HPP
