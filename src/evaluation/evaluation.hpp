#ifndef DIFFEO_EVALUATION_HPP
#define DIFFEO_EVALUATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "details/folder.hpp"

namespace Diffeo::Evaluation {
    using Options = Details::Options;
    using Report = Details::Report;

    [[nodiscard]] inline auto ComputeMetrics(const cv::Mat& prediction,
                                             const cv::Mat& truth,
                                             const std::vector<std::string>& metric_names)
        -> std::vector<std::pair<std::string, double>> {
        return Details::compute_named_metrics(prediction, truth, metric_names);
    }

    [[nodiscard]] inline auto EvaluateFolders(const std::filesystem::path& prediction_folder,
                                              const std::filesystem::path& truth_folder,
                                              const Options& options = {}) -> Report {
        return Details::evaluate_folders(prediction_folder, truth_folder, options);
    }
}

#endif // DIFFEO_EVALUATION_HPP
