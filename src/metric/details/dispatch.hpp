#ifndef DIFFEO_METRIC_DISPATCH_HPP
#define DIFFEO_METRIC_DISPATCH_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <torch/torch.h>

#include "aji.hpp"
#include "overlap.hpp"

namespace Diffeo::Metric::Details {
    enum class Kind {
        Dice,
        IoU,
        PixelF1,
        AggregatedJaccard,
        L1,
    };

    inline std::string name_of(Kind kind) {
        switch (kind) {
            case Kind::Dice: return "dice";
            case Kind::IoU: return "iou";
            case Kind::PixelF1: return "p_F1";
            case Kind::AggregatedJaccard: return "aji";
            case Kind::L1: return "l1";
        }
        throw std::invalid_argument("Unknown metric kind.");
    }

    inline Kind from_name(const std::string& name) {
        if (name == "dice" || name == "DSC") return Kind::Dice;
        if (name == "iou") return Kind::IoU;
        if (name == "p_F1") return Kind::PixelF1;
        if (name == "aji") return Kind::AggregatedJaccard;
        if (name == "l1" || name == "L1") return Kind::L1;
        throw std::invalid_argument("Unsupported metric '" + name + "'.");
    }

    // Copies a single-channel map into an owning int32 tensor.
    inline torch::Tensor map_to_tensor(const cv::Mat& map) {
        if (map.empty() || map.channels() != 1) {
            throw std::invalid_argument("Label maps must be non-empty and single-channel.");
        }
        cv::Mat as_int;
        map.convertTo(as_int, CV_32S);
        return torch::from_blob(as_int.data, {as_int.rows, as_int.cols}, torch::kInt32).clone();
    }

    [[nodiscard]] inline double evaluate(Kind kind, const torch::Tensor& prediction, const torch::Tensor& truth) {
        switch (kind) {
            case Kind::Dice: return dice(prediction, truth);
            case Kind::IoU: return iou(prediction, truth);
            case Kind::PixelF1: return pixel_f1(prediction, truth);
            case Kind::L1: return l1(prediction, truth);
            case Kind::AggregatedJaccard:
                throw std::invalid_argument("AJI is computed on label maps, not tensors.");
        }
        throw std::invalid_argument("Unknown metric kind.");
    }

    [[nodiscard]] inline double evaluate(Kind kind, const cv::Mat& prediction, const cv::Mat& truth) {
        if (prediction.size() != truth.size()) {
            throw std::invalid_argument("Prediction and ground-truth label maps must have identical shape.");
        }
        if (kind == Kind::AggregatedJaccard) {
            return aggregated_jaccard(prediction, truth);
        }
        return evaluate(kind, map_to_tensor(prediction), map_to_tensor(truth));
    }

    // One value per batch element of two [B, ...] tensors.
    [[nodiscard]] inline std::vector<double> per_sample(Kind kind, const torch::Tensor& prediction, const torch::Tensor& truth) {
        require_same_shape(prediction, truth);
        std::vector<double> values;
        values.reserve(static_cast<std::size_t>(prediction.size(0)));
        for (int64_t index = 0; index < prediction.size(0); ++index) {
            values.push_back(evaluate(kind, prediction[index], truth[index]));
        }
        return values;
    }
}

#endif // DIFFEO_METRIC_DISPATCH_HPP
