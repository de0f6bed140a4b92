#ifndef DIFFEO_PLOT_SIDE_BY_SIDE_HPP
#define DIFFEO_PLOT_SIDE_BY_SIDE_HPP
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <torch/torch.h>

namespace Diffeo::Plot::Details {
    // Single-sample tensors: images [C, H, W] in [-1, 1], labels [1, H, W] or [H, W].
    struct SideBySide {
        std::filesystem::path save_path{};
        torch::Tensor unannotated_image{};
        torch::Tensor annotated_image{};
        torch::Tensor cycled_image{};
        torch::Tensor warped_image{};
        torch::Tensor unannotated_label{};
        torch::Tensor annotated_label{};
        torch::Tensor projected_label{};
        std::string metric_name{};
        double reference_metric{0.0};
        double registered_metric{0.0};
    };

    using Sink = std::function<void(const SideBySide&)>;

    struct RenderOptions {
        int scale{4};
        int margin{4};
        int title_height{28};
    };

    inline std::filesystem::path figure_path(const std::filesystem::path& output,
                                             const std::string& phase,
                                             std::int64_t epoch,
                                             std::int64_t sample)
    {
        char name[64];
        std::snprintf(name, sizeof(name), "figure_log_epoch%05lld_sample%05lld.png",
                      static_cast<long long>(epoch), static_cast<long long>(sample));
        return output / phase / name;
    }

    inline cv::Mat image_tile(const torch::Tensor& image)
    {
        auto tensor = image.detach().to(torch::kCPU, torch::kFloat32);
        if (tensor.dim() == 2) {
            tensor = tensor.unsqueeze(0);
        }
        if (tensor.dim() != 3) {
            throw std::invalid_argument("Side-by-side panels expect [C, H, W] images.");
        }
        tensor = ((tensor + 1.0) * 0.5).clamp(0.0, 1.0).mul(255.0).to(torch::kUInt8);
        if (tensor.size(0) == 1) {
            tensor = tensor.expand({3, tensor.size(1), tensor.size(2)});
        } else if (tensor.size(0) != 3) {
            throw std::invalid_argument("Side-by-side panels expect 1 or 3 image channels.");
        }
        // RGB tensor to BGR pixels.
        tensor = tensor.flip({0}).permute({1, 2, 0}).contiguous();
        cv::Mat tile(static_cast<int>(tensor.size(0)), static_cast<int>(tensor.size(1)), CV_8UC3, tensor.data_ptr<std::uint8_t>());
        return tile.clone();
    }

    inline cv::Mat label_tile(const torch::Tensor& label)
    {
        auto tensor = label.detach().to(torch::kCPU, torch::kFloat32);
        if (tensor.dim() == 3) {
            tensor = tensor.squeeze(0);
        }
        if (tensor.dim() != 2) {
            throw std::invalid_argument("Side-by-side panels expect [1, H, W] labels.");
        }
        tensor = tensor.clamp(0.0, 1.0).mul(255.0).to(torch::kUInt8).contiguous();
        cv::Mat gray(static_cast<int>(tensor.size(0)), static_cast<int>(tensor.size(1)), CV_8UC1, tensor.data_ptr<std::uint8_t>());
        cv::Mat tile;
        cv::cvtColor(gray, tile, cv::COLOR_GRAY2BGR);
        return tile;
    }

    // 2x4 grid: images U, A and labels U, A on top; cycled U->A->U, warped U->A and projected A->U below.
    inline cv::Mat render(const SideBySide& request, const RenderOptions& options = {})
    {
        const std::vector<cv::Mat> top{image_tile(request.unannotated_image), image_tile(request.annotated_image),
                                       label_tile(request.unannotated_label), label_tile(request.annotated_label)};
        const std::vector<cv::Mat> bottom{image_tile(request.cycled_image), image_tile(request.warped_image),
                                          label_tile(request.projected_label)};

        const int cell_rows = top.front().rows * options.scale;
        const int cell_cols = top.front().cols * options.scale;
        const int width = 4 * cell_cols + 5 * options.margin;
        const int height = options.title_height + 2 * cell_rows + 3 * options.margin;
        cv::Mat canvas(height, width, CV_8UC3, cv::Scalar(255, 255, 255));

        const auto place = [&](const cv::Mat& tile, int row, int col) {
            cv::Mat scaled;
            cv::resize(tile, scaled, cv::Size(cell_cols, cell_rows), 0.0, 0.0, cv::INTER_NEAREST);
            const int y = options.title_height + options.margin + row * (cell_rows + options.margin);
            const int x = options.margin + col * (cell_cols + options.margin);
            scaled.copyTo(canvas(cv::Rect(x, y, cell_cols, cell_rows)));
        };
        for (std::size_t col = 0; col < top.size(); ++col) {
            place(top[col], 0, static_cast<int>(col));
        }
        for (std::size_t col = 0; col < bottom.size(); ++col) {
            place(bottom[col], 1, static_cast<int>(col));
        }

        char title[160];
        std::snprintf(title, sizeof(title), "%s (U, A) = %.3f, %s (U, A->U) = %.3f",
                      request.metric_name.c_str(), request.reference_metric,
                      request.metric_name.c_str(), request.registered_metric);
        cv::putText(canvas, title, cv::Point(options.margin, options.title_height - 8),
                    cv::FONT_HERSHEY_SIMPLEX, 0.45, cv::Scalar(0, 0, 0), 1, cv::LINE_AA);
        return canvas;
    }

    inline void save(const SideBySide& request, const RenderOptions& options = {})
    {
        if (request.save_path.empty()) {
            throw std::invalid_argument("Side-by-side figures require a save path.");
        }
        if (request.save_path.has_parent_path()) {
            std::filesystem::create_directories(request.save_path.parent_path());
        }
        if (!cv::imwrite(request.save_path.string(), render(request, options))) {
            throw std::runtime_error("Failed to write figure '" + request.save_path.string() + "'.");
        }
    }
}

#endif // DIFFEO_PLOT_SIDE_BY_SIDE_HPP
