#ifndef DIFFEO_MODEL_UNET_HPP
#define DIFFEO_MODEL_UNET_HPP
// "U-Net: Convolutional Networks for Biomedical Image Segmentation" https://arxiv.org/abs/1505.04597
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "predictor.hpp"

namespace Diffeo::Model::Details {

    class ConvBlockImpl : public torch::nn::Module {
    public:
        ConvBlockImpl(std::int64_t in_channels, std::int64_t out_channels)
        {
            first_ = register_module("conv_0", torch::nn::Conv2d(torch::nn::Conv2dOptions(in_channels, out_channels, 3).padding(1)));
            first_norm_ = register_module("norm_0", torch::nn::BatchNorm2d(out_channels));
            second_ = register_module("conv_1", torch::nn::Conv2d(torch::nn::Conv2dOptions(out_channels, out_channels, 3).padding(1)));
            second_norm_ = register_module("norm_1", torch::nn::BatchNorm2d(out_channels));
        }

        torch::Tensor forward(torch::Tensor input)
        {
            namespace F = torch::nn::functional;
            const auto activation = F::LeakyReLUFuncOptions().negative_slope(0.2);
            auto output = F::leaky_relu(first_norm_(first_(std::move(input))), activation);
            return F::leaky_relu(second_norm_(second_(std::move(output))), activation);
        }

    private:
        torch::nn::Conv2d first_{nullptr};
        torch::nn::BatchNorm2d first_norm_{nullptr};
        torch::nn::Conv2d second_{nullptr};
        torch::nn::BatchNorm2d second_norm_{nullptr};
    };

    TORCH_MODULE(ConvBlock);

    // Encoder widths double at every level; decoder upsamples to the skip resolution so any H, W is accepted.
    class UNetImpl final : public PredictorImpl {
    public:
        static constexpr const char* kTag = "UNet";

        explicit UNetImpl(PredictorOptions options) : PredictorImpl(options)
        {
            const auto depth = static_cast<std::size_t>(options.depth);
            std::vector<std::int64_t> widths;
            widths.reserve(depth);
            for (std::size_t level = 0; level < depth; ++level) {
                widths.push_back(options.num_filters << level);
            }

            std::int64_t channels = options.in_channels;
            for (std::size_t level = 0; level < depth; ++level) {
                encoders_.push_back(register_module("encoder_" + std::to_string(level), ConvBlock(channels, widths[level])));
                channels = widths[level];
            }
            for (std::size_t level = depth - 1; level > 0; --level) {
                decoders_.push_back(register_module("decoder_" + std::to_string(level - 1),
                                                    ConvBlock(widths[level] + widths[level - 1], widths[level - 1])));
            }

            head_ = register_module("head", torch::nn::Conv2d(torch::nn::Conv2dOptions(widths.front(), options.out_channels, 1)));
            // Near-zero displacement at initialization.
            torch::NoGradGuard no_grad{};
            torch::nn::init::normal_(head_->weight, 0.0, 1e-5);
            torch::nn::init::zeros_(head_->bias);
        }

        torch::Tensor forward(torch::Tensor input) override
        {
            namespace F = torch::nn::functional;
            std::vector<torch::Tensor> skips;
            skips.reserve(encoders_.size());

            auto output = std::move(input);
            for (std::size_t level = 0; level < encoders_.size(); ++level) {
                if (level > 0) {
                    output = F::max_pool2d(output, F::MaxPool2dFuncOptions(2).ceil_mode(true));
                }
                output = encoders_[level]->forward(output);
                skips.push_back(output);
            }

            for (std::size_t step = 0; step < decoders_.size(); ++step) {
                const auto& skip = skips[skips.size() - 2 - step];
                output = F::interpolate(output, F::InterpolateFuncOptions()
                                                    .size(std::vector<std::int64_t>{skip.size(2), skip.size(3)})
                                                    .mode(torch::kBilinear)
                                                    .align_corners(false));
                output = decoders_[step]->forward(torch::cat({output, skip}, 1));
            }
            return head_(output);
        }

        [[nodiscard]] std::string tag() const override { return kTag; }

    private:
        std::vector<ConvBlock> encoders_{};
        std::vector<ConvBlock> decoders_{};
        torch::nn::Conv2d head_{nullptr};
    };
}

#endif // DIFFEO_MODEL_UNET_HPP
