#ifndef DIFFEO_ORIENTATION_NCC_HPP
#define DIFFEO_ORIENTATION_NCC_HPP

#include <cstdint>
#include <stdexcept>

#include <torch/nn/functional.h>
#include <torch/torch.h>

namespace Diffeo::Orientation::Details {
    struct NCCOptions {
        int64_t window{9};
        double eps{1e-5};
    };

    // Local normalized cross-correlation, one value per pixel in [-1, 1].
    // Channels are averaged first; windows are zero-padded at the border.
    [[nodiscard]] inline torch::Tensor ncc_response(const torch::Tensor& fixed,
                                                    const torch::Tensor& moving,
                                                    const NCCOptions& options = {}) {
        if (options.window <= 0 || options.window % 2 == 0) {
            throw std::invalid_argument("NCC window must be a positive odd size.");
        }
        if (!fixed.defined() || !moving.defined() || fixed.dim() != 4 || fixed.sizes() != moving.sizes()) {
            throw std::invalid_argument("NCC expects two [B, C, H, W] tensors of identical shape.");
        }

        namespace F = torch::nn::functional;
        auto I = fixed.to(torch::kFloat32).mean(1, /*keepdim=*/true);
        auto J = moving.to(torch::kFloat32).mean(1, /*keepdim=*/true);

        auto kernel = torch::ones({1, 1, options.window, options.window}, I.options());
        const auto conv_options = F::Conv2dFuncOptions().padding(options.window / 2);
        auto box = [&](const torch::Tensor& tensor) { return F::conv2d(tensor, kernel, conv_options); };

        const double window_size = static_cast<double>(options.window * options.window);

        auto I_sum = box(I);
        auto J_sum = box(J);
        auto I2_sum = box(I * I);
        auto J2_sum = box(J * J);
        auto IJ_sum = box(I * J);

        auto u_I = I_sum / window_size;
        auto u_J = J_sum / window_size;

        auto cross = IJ_sum - u_J * I_sum - u_I * J_sum + u_I * u_J * window_size;
        auto I_var = I2_sum - 2.0 * u_I * I_sum + u_I * u_I * window_size;
        auto J_var = J2_sum - 2.0 * u_J * J_sum + u_J * u_J * window_size;

        return cross / ((I_var * J_var).clamp_min(0.0).sqrt() + options.eps);
    }

    // Peak response per batch element, shape [B].
    [[nodiscard]] inline torch::Tensor ncc_peak(const torch::Tensor& fixed,
                                                const torch::Tensor& moving,
                                                const NCCOptions& options = {}) {
        return ncc_response(fixed, moving, options).amax({1, 2, 3});
    }
}

#endif // DIFFEO_ORIENTATION_NCC_HPP
