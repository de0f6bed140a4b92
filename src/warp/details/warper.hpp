#ifndef DIFFEO_WARP_WARPER_HPP
#define DIFFEO_WARP_WARPER_HPP

#include <cstdint>

#include <torch/nn/functional.h>
#include <torch/torch.h>

#include "field.hpp"

namespace Diffeo::Warp::Details {
    // Pixel coordinate -> grid_sample coordinate under align_corners=true (0 -> -1, size-1 -> +1).
    inline torch::Tensor normalize_coordinates(const torch::Tensor& coordinates, int64_t size) {
        if (size <= 1) {
            return torch::zeros_like(coordinates);
        }
        return coordinates * (2.0 / static_cast<double>(size - 1)) - 1.0;
    }

    // Output(r, c) = bilinear sample of the input at (r + field[0, r, c], c + field[1, r, c]).
    // Out-of-bounds samples are clamped to the nearest edge pixel (border padding).
    inline torch::Tensor warp(const torch::Tensor& image, const torch::Tensor& field) {
        validate_field(image, field);

        auto source = image.is_floating_point() ? image : image.to(torch::kFloat32);
        auto flow = field.to(source.device(), source.scalar_type());

        const auto height = source.size(2);
        const auto width = source.size(3);
        const auto coordinate_options = torch::TensorOptions().dtype(source.scalar_type()).device(source.device());

        auto rows = torch::arange(height, coordinate_options).view({1, height, 1});
        auto cols = torch::arange(width, coordinate_options).view({1, 1, width});

        auto sample_rows = rows + flow.select(1, 0);
        auto sample_cols = cols + flow.select(1, 1);

        // grid_sample reads (x, y) = (col, row) from the last axis.
        auto grid = torch::stack({normalize_coordinates(sample_cols, width),
                                  normalize_coordinates(sample_rows, height)}, -1);

        namespace F = torch::nn::functional;
        return F::grid_sample(source, grid,
                              F::GridSampleFuncOptions()
                                  .mode(torch::kBilinear)
                                  .padding_mode(torch::kBorder)
                                  .align_corners(true));
    }
}

#endif // DIFFEO_WARP_WARPER_HPP
