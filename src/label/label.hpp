#ifndef DIFFEO_LABEL_HPP
#define DIFFEO_LABEL_HPP

#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

namespace Diffeo::Label {
    // Integral label tensors are segmentation masks, floating ones are continuous maps.
    enum class Kind { Binary, Continuous };

    struct Normalized {
        Kind kind{Kind::Binary};
        torch::Tensor tensor;
    };

    inline constexpr double kThreshold = 0.5;

    [[nodiscard]] inline Kind classify(const torch::Tensor& label) {
        return torch::is_floating_point(label) ? Kind::Continuous : Kind::Binary;
    }

    [[nodiscard]] inline torch::Tensor threshold(const torch::Tensor& label) {
        return label.gt(kThreshold).to(torch::kFloat32);
    }

    // [B, H, W] -> [B, 1, H, W]; [B, C, H, W] passes through.
    [[nodiscard]] inline torch::Tensor ensure_channel_dim(const torch::Tensor& label) {
        if (label.dim() == 3) {
            return label.unsqueeze(1);
        }
        if (label.dim() == 4) {
            return label;
        }
        throw std::invalid_argument("Label tensors must be [B, H, W] or [B, C, H, W], got rank "
                                    + std::to_string(label.dim()) + ".");
    }

    [[nodiscard]] inline Normalized classify_and_normalize(const torch::Tensor& label) {
        if (!label.defined()) {
            throw std::invalid_argument("classify_and_normalize requires a defined label tensor.");
        }
        auto working = ensure_channel_dim(label);
        const auto kind = classify(working);
        if (kind == Kind::Continuous) {
            return {kind, working.to(torch::kFloat32)};
        }

        auto as_float = working.to(torch::kFloat32);
        const bool in_range = as_float.eq(0.0).logical_or(as_float.eq(1.0)).all().item<bool>();
        if (!in_range) {
            throw std::invalid_argument("Binary label tensors must only contain the values {0, 1}.");
        }
        return {kind, threshold(as_float)};
    }

    // Both views of a batch must agree on the label kind.
    [[nodiscard]] inline std::pair<Normalized, Normalized> classify_pair(const torch::Tensor& annotated,
                                                                         const torch::Tensor& unannotated) {
        auto first = classify_and_normalize(annotated);
        auto second = classify_and_normalize(unannotated);
        if (first.kind != second.kind) {
            throw std::invalid_argument("Annotated and unannotated labels of a batch must share the same element kind.");
        }
        return {std::move(first), std::move(second)};
    }

    [[nodiscard]] inline std::string metric_name(Kind kind) {
        return kind == Kind::Binary ? "DSC" : "L1";
    }
}

#endif // DIFFEO_LABEL_HPP
