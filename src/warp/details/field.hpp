#ifndef DIFFEO_WARP_FIELD_HPP
#define DIFFEO_WARP_FIELD_HPP

#include <sstream>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

namespace Diffeo::Warp::Details {
    // Predictor output layout: [B, 4, H, W] = forward (row, col) then reverse (row, col).
    inline constexpr int64_t kFieldChannels = 2;
    inline constexpr int64_t kPredictionChannels = 2 * kFieldChannels;

    struct FieldPair {
        torch::Tensor forward;
        torch::Tensor reverse;
    };

    inline std::string format_shape(const torch::Tensor& tensor) {
        std::ostringstream stream;
        stream << '(';
        for (int64_t i = 0; i < tensor.dim(); ++i) {
            if (i > 0) {
                stream << ", ";
            }
            stream << tensor.size(i);
        }
        stream << ')';
        return stream.str();
    }

    inline void validate_field(const torch::Tensor& image, const torch::Tensor& field) {
        if (!image.defined() || !field.defined()) {
            throw std::invalid_argument("Warp requires defined image and field tensors.");
        }
        if (image.dim() != 4) {
            throw std::invalid_argument("Warp expects an image of shape [B, C, H, W], got " + format_shape(image) + ".");
        }
        if (field.dim() != 4 || field.size(1) != kFieldChannels) {
            throw std::invalid_argument("Warp expects a field of shape [B, 2, H, W], got " + format_shape(field) + ".");
        }
        if (image.size(0) != field.size(0) || image.size(2) != field.size(2) || image.size(3) != field.size(3)) {
            throw std::invalid_argument("Image " + format_shape(image) + " and field " + format_shape(field)
                                        + " disagree on batch or spatial dimensions.");
        }
    }

    [[nodiscard]] inline FieldPair split_fields(const torch::Tensor& prediction) {
        if (!prediction.defined() || prediction.dim() != 4 || prediction.size(1) != kPredictionChannels) {
            throw std::invalid_argument("Warp prediction must have shape [B, 4, H, W], got "
                                        + (prediction.defined() ? format_shape(prediction) : std::string{"undefined"}) + ".");
        }
        return {prediction.narrow(1, 0, kFieldChannels), prediction.narrow(1, kFieldChannels, kFieldChannels)};
    }
}

#endif // DIFFEO_WARP_FIELD_HPP
