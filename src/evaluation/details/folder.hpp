#ifndef DIFFEO_EVALUATION_FOLDER_HPP
#define DIFFEO_EVALUATION_FOLDER_HPP

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <limits>
#include <map>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include "../../metric/metric.hpp"
#include "../../utils/files.hpp"
#include "../../utils/terminal.hpp"

namespace Diffeo::Evaluation::Details {
    struct Options {
        // Ground-truth files are kept only when their name contains one of these ids; empty keeps all.
        std::vector<std::string> file_ids{};
        std::vector<Metric::Descriptor> metrics{Metric::PixelF1, Metric::AggregatedJaccard, Metric::IoU};
        bool print_summary{false};
        std::ostream* stream{&std::cout};
    };

    struct Report {
        std::vector<Metric::Kind> order{};
        std::vector<double> mean{};
        std::vector<std::filesystem::path> predictions{};
        std::vector<std::vector<double>> per_file{};

        [[nodiscard]] double value(Metric::Kind kind) const
        {
            for (std::size_t index = 0; index < order.size(); ++index) {
                if (order[index] == kind) {
                    return mean[index];
                }
            }
            throw std::invalid_argument("Metric '" + Metric::Details::name_of(kind) + "' was not evaluated.");
        }
    };

    inline std::vector<std::pair<std::string, double>> compute_metrics(const cv::Mat& prediction,
                                                                       const cv::Mat& truth,
                                                                       const std::vector<Metric::Descriptor>& metrics)
    {
        if (prediction.size() != truth.size()) {
            throw std::invalid_argument("Prediction and ground-truth label maps must have identical shape.");
        }
        std::vector<std::pair<std::string, double>> values;
        values.reserve(metrics.size());
        for (const auto& metric : metrics) {
            values.emplace_back(Metric::Details::name_of(metric.kind), Metric::Details::evaluate(metric.kind, prediction, truth));
        }
        return values;
    }

    // Metric names as used by configuration: "p_F1", "aji", "iou", "dice", "l1".
    inline std::vector<std::pair<std::string, double>> compute_named_metrics(const cv::Mat& prediction,
                                                                             const cv::Mat& truth,
                                                                             const std::vector<std::string>& metric_names)
    {
        std::vector<Metric::Descriptor> metrics;
        metrics.reserve(metric_names.size());
        for (const auto& name : metric_names) {
            metrics.push_back(Metric::Make(Metric::Details::from_name(name)));
        }
        return compute_metrics(prediction, truth, metrics);
    }

    inline bool matches_any(const std::filesystem::path& path, const std::vector<std::string>& file_ids)
    {
        if (file_ids.empty()) {
            return true;
        }
        const auto name = path.filename().string();
        return std::any_of(file_ids.begin(), file_ids.end(), [&](const std::string& id) {
            return name.find(id) != std::string::npos;
        });
    }

    // Pairs every prediction with the ground-truth file of the same name.
    inline std::vector<std::pair<std::filesystem::path, std::filesystem::path>>
    match_pairs(const std::filesystem::path& prediction_folder,
                const std::filesystem::path& truth_folder,
                const std::vector<std::string>& file_ids)
    {
        const auto predictions = Utils::Files::collect(prediction_folder, ".png");
        std::map<std::string, std::filesystem::path> truths;
        for (const auto& path : Utils::Files::collect(truth_folder, ".png")) {
            if (matches_any(path, file_ids)) {
                truths.emplace(path.lexically_relative(truth_folder).generic_string(), path);
            }
        }

        if (predictions.size() != truths.size()) {
            std::ostringstream message;
            message << "Found " << predictions.size() << " predictions in '" << prediction_folder.string()
                    << "' but " << truths.size() << " ground-truth labels in '" << truth_folder.string() << "'.";
            throw std::runtime_error(message.str());
        }

        std::vector<std::pair<std::filesystem::path, std::filesystem::path>> pairs;
        pairs.reserve(predictions.size());
        for (const auto& prediction : predictions) {
            const auto key = prediction.lexically_relative(prediction_folder).generic_string();
            const auto found = truths.find(key);
            if (found == truths.end()) {
                throw std::runtime_error("No ground-truth label matches prediction '" + key + "'.");
            }
            pairs.emplace_back(prediction, found->second);
        }
        return pairs;
    }

    inline cv::Mat read_label(const std::filesystem::path& path)
    {
        cv::Mat label = cv::imread(path.string(), cv::IMREAD_GRAYSCALE);
        if (label.empty()) {
            throw std::runtime_error("Failed to decode label map: " + path.string());
        }
        return label;
    }

    inline void print(const Report& report, std::ostream& stream)
    {
        stream << Utils::Terminal::ApplyColor("Stitched evaluation", Utils::Terminal::Colors::kBrightCyan)
               << " (" << report.predictions.size() << " maps)\n";
        for (std::size_t index = 0; index < report.order.size(); ++index) {
            stream << "  " << std::left << std::setw(6) << Metric::Details::name_of(report.order[index])
                   << std::right << std::fixed << std::setprecision(4) << report.mean[index] << '\n';
        }
        stream << std::flush;
    }

    inline Report evaluate_folders(const std::filesystem::path& prediction_folder,
                                   const std::filesystem::path& truth_folder,
                                   const Options& options = {})
    {
        if (options.metrics.empty()) {
            throw std::invalid_argument("evaluate_folders requires at least one metric.");
        }
        Report report;
        for (const auto& metric : options.metrics) {
            report.order.push_back(metric.kind);
        }
        report.mean.assign(report.order.size(), 0.0);

        for (const auto& [prediction_path, truth_path] : match_pairs(prediction_folder, truth_folder, options.file_ids)) {
            const auto prediction = read_label(prediction_path);
            const auto truth = read_label(truth_path);
            if (prediction.size() != truth.size()) {
                throw std::invalid_argument("Label maps '" + prediction_path.string() + "' and '" + truth_path.string()
                                            + "' differ in shape.");
            }
            std::vector<double> values;
            values.reserve(report.order.size());
            for (const auto kind : report.order) {
                values.push_back(Metric::Details::evaluate(kind, prediction, truth));
            }
            report.predictions.push_back(prediction_path);
            report.per_file.push_back(std::move(values));
        }

        const auto count = static_cast<double>(report.per_file.size());
        for (std::size_t index = 0; index < report.order.size(); ++index) {
            double sum = 0.0;
            for (const auto& values : report.per_file) {
                sum += values[index];
            }
            report.mean[index] = report.per_file.empty() ? std::numeric_limits<double>::quiet_NaN() : sum / count;
        }

        if (options.print_summary && options.stream != nullptr) {
            print(report, *options.stream);
        }
        return report;
    }
}

#endif // DIFFEO_EVALUATION_FOLDER_HPP
