#ifndef DIFFEO_MODEL_PREDICTOR_HPP
#define DIFFEO_MODEL_PREDICTOR_HPP

#include <cstdint>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

namespace Diffeo::Model::Details {
    struct PredictorOptions {
        std::int64_t in_channels{6};
        std::int64_t out_channels{4};
        std::int64_t num_filters{32};
        std::int64_t depth{4};
    };

    inline void validate(const PredictorOptions& options) {
        if (options.in_channels <= 0 || options.out_channels <= 0) {
            throw std::invalid_argument("Warp predictors require positive channel counts.");
        }
        if (options.num_filters <= 0) {
            throw std::invalid_argument("Warp predictors require a positive filter count.");
        }
        if (options.depth <= 0) {
            throw std::invalid_argument("Warp predictors require a positive depth.");
        }
    }

    // Maps a concatenated [annotated, unannotated] image pair to a forward and a reverse field.
    class PredictorImpl : public torch::nn::Module {
    public:
        explicit PredictorImpl(PredictorOptions options) : options_(options) { validate(options_); }
        ~PredictorImpl() override = default;

        virtual torch::Tensor forward(torch::Tensor input) = 0;
        [[nodiscard]] virtual std::string tag() const = 0;

        // Shape-checked entry point used by the training and inference loops.
        torch::Tensor predict(const torch::Tensor& pair) {
            if (pair.dim() != 4 || pair.size(1) != options_.in_channels) {
                std::ostringstream message;
                message << tag() << " expects input of shape [B, " << options_.in_channels << ", H, W], got " << pair.sizes();
                throw std::invalid_argument(message.str());
            }
            auto output = forward(pair);
            if (output.dim() != 4 || output.size(1) != options_.out_channels ||
                output.size(2) != pair.size(2) || output.size(3) != pair.size(3)) {
                std::ostringstream message;
                message << tag() << " produced an output of shape " << output.sizes() << " for input " << pair.sizes();
                throw std::runtime_error(message.str());
            }
            return output;
        }

        [[nodiscard]] const PredictorOptions& options() const noexcept { return options_; }

    private:
        PredictorOptions options_{};
    };

    using Predictor = std::shared_ptr<PredictorImpl>;
}

#endif // DIFFEO_MODEL_PREDICTOR_HPP
