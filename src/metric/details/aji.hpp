#ifndef DIFFEO_METRIC_AJI_HPP
#define DIFFEO_METRIC_AJI_HPP
// Aggregated Jaccard Index, Kumar et al. "A Dataset and a Technique for Generalized Nuclear Segmentation
// for Computational Pathology" (IEEE TMI 2017).
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace Diffeo::Metric::Details {
    // Maps holding a single foreground value ({0,1} or {0,255}) are split into 8-connected components;
    // maps with several foreground values are read as instance ids.
    inline cv::Mat instance_map(const cv::Mat& label) {
        if (label.empty() || label.channels() != 1) {
            throw std::invalid_argument("Instance extraction expects a non-empty single-channel label map.");
        }
        const cv::Mat foreground = label > 0;
        double min_value = 0.0;
        double max_value = 0.0;
        if (cv::countNonZero(foreground) > 0) {
            cv::minMaxLoc(label, &min_value, &max_value, nullptr, nullptr, foreground);
        }

        cv::Mat instances;
        if (min_value == max_value) {
            cv::connectedComponents(foreground, instances, 8, CV_32S);
        } else {
            label.convertTo(instances, CV_32S);
        }
        return instances;
    }

    [[nodiscard]] inline double aggregated_jaccard(const cv::Mat& prediction, const cv::Mat& truth) {
        if (prediction.size() != truth.size()) {
            throw std::invalid_argument("AJI requires prediction and ground-truth maps of identical shape.");
        }
        const cv::Mat pred_ids = instance_map(prediction);
        const cv::Mat true_ids = instance_map(truth);

        std::unordered_map<int32_t, int64_t> pred_area;
        std::unordered_map<int32_t, int64_t> true_area;
        std::unordered_map<int64_t, int64_t> intersection;
        auto key = [](int32_t t, int32_t p) { return (static_cast<int64_t>(t) << 32) | static_cast<uint32_t>(p); };

        for (int row = 0; row < true_ids.rows; ++row) {
            const auto* t_row = true_ids.ptr<int32_t>(row);
            const auto* p_row = pred_ids.ptr<int32_t>(row);
            for (int col = 0; col < true_ids.cols; ++col) {
                const auto t = t_row[col];
                const auto p = p_row[col];
                if (t > 0) {
                    ++true_area[t];
                }
                if (p > 0) {
                    ++pred_area[p];
                }
                if (t > 0 && p > 0) {
                    ++intersection[key(t, p)];
                }
            }
        }

        std::unordered_map<int32_t, std::vector<std::pair<int32_t, int64_t>>> overlaps;
        for (const auto& [pair_key, count] : intersection) {
            const auto t = static_cast<int32_t>(pair_key >> 32);
            const auto p = static_cast<int32_t>(pair_key & 0xffffffff);
            overlaps[t].emplace_back(p, count);
        }

        double overall_inter = 0.0;
        double overall_union = 0.0;
        std::unordered_set<int32_t> paired_pred;
        for (const auto& [t, t_area] : true_area) {
            const auto found = overlaps.find(t);
            if (found == overlaps.end()) {
                overall_union += static_cast<double>(t_area);
                continue;
            }
            double best_iou = -1.0;
            int32_t best_pred = 0;
            int64_t best_inter = 0;
            for (const auto& [p, inter] : found->second) {
                const double u = static_cast<double>(t_area + pred_area[p] - inter);
                const double value = static_cast<double>(inter) / u;
                if (value > best_iou) {
                    best_iou = value;
                    best_pred = p;
                    best_inter = inter;
                }
            }
            overall_inter += static_cast<double>(best_inter);
            overall_union += static_cast<double>(t_area + pred_area[best_pred] - best_inter);
            paired_pred.insert(best_pred);
        }

        for (const auto& [p, p_area] : pred_area) {
            if (paired_pred.count(p) == 0) {
                overall_union += static_cast<double>(p_area);
            }
        }

        if (overall_union == 0.0) {
            return std::numeric_limits<double>::quiet_NaN();
        }
        return overall_inter / overall_union;
    }
}

#endif // DIFFEO_METRIC_AJI_HPP
