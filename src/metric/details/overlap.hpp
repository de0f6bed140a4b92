#ifndef DIFFEO_METRIC_OVERLAP_HPP
#define DIFFEO_METRIC_OVERLAP_HPP

#include <stdexcept>

#include <torch/torch.h>

namespace Diffeo::Metric::Details {
    struct Confusion {
        double true_positive{0.0};
        double false_positive{0.0};
        double false_negative{0.0};
    };

    inline void require_same_shape(const torch::Tensor& prediction, const torch::Tensor& truth) {
        if (!prediction.defined() || !truth.defined()) {
            throw std::invalid_argument("Overlap metrics require defined prediction and ground-truth tensors.");
        }
        if (prediction.sizes() != truth.sizes()) {
            throw std::invalid_argument("Prediction and ground-truth label maps must have identical shape.");
        }
    }

    // Foreground is any non-zero pixel.
    [[nodiscard]] inline Confusion confusion(const torch::Tensor& prediction, const torch::Tensor& truth) {
        require_same_shape(prediction, truth);
        auto p = prediction.ne(0);
        auto t = truth.to(prediction.device()).ne(0);
        Confusion counts;
        counts.true_positive = p.logical_and(t).sum().item<double>();
        counts.false_positive = p.logical_and(t.logical_not()).sum().item<double>();
        counts.false_negative = p.logical_not().logical_and(t).sum().item<double>();
        return counts;
    }

    // 2|A n B| / (|A| + |B|). Two empty masks give 0/0 = NaN.
    [[nodiscard]] inline double dice(const torch::Tensor& prediction, const torch::Tensor& truth) {
        const auto c = confusion(prediction, truth);
        return (2.0 * c.true_positive) / (2.0 * c.true_positive + c.false_positive + c.false_negative);
    }

    [[nodiscard]] inline double iou(const torch::Tensor& prediction, const torch::Tensor& truth) {
        const auto c = confusion(prediction, truth);
        return c.true_positive / (c.true_positive + c.false_positive + c.false_negative);
    }

    // Harmonic mean of pixel precision and recall; coincides with dice on binary maps.
    [[nodiscard]] inline double pixel_f1(const torch::Tensor& prediction, const torch::Tensor& truth) {
        const auto c = confusion(prediction, truth);
        const double precision = c.true_positive / (c.true_positive + c.false_positive);
        const double recall = c.true_positive / (c.true_positive + c.false_negative);
        if (c.true_positive == 0.0 && (c.false_positive > 0.0 || c.false_negative > 0.0)) {
            return 0.0;
        }
        return 2.0 * precision * recall / (precision + recall);
    }

    // Mean absolute pixel difference for continuous labels.
    [[nodiscard]] inline double l1(const torch::Tensor& prediction, const torch::Tensor& truth) {
        require_same_shape(prediction, truth);
        auto p = prediction.to(torch::kDouble);
        auto t = truth.to(prediction.device(), torch::kDouble);
        return (p - t).abs().mean().item<double>();
    }
}

#endif // DIFFEO_METRIC_OVERLAP_HPP
