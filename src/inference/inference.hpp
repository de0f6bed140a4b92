#ifndef DIFFEO_INFERENCE_HPP
#define DIFFEO_INFERENCE_HPP
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <torch/torch.h>

#include "../common/log.hpp"
#include "../data/data.hpp"
#include "../evaluation/evaluation.hpp"
#include "../label/label.hpp"
#include "../metric/metric.hpp"
#include "../model/model.hpp"
#include "../plot/plot.hpp"
#include "../stitch/stitch.hpp"
#include "../training/step.hpp"
#include "../utils/files.hpp"
#include "../utils/progressbar.hpp"

namespace Diffeo::Inference {
    struct InferenceOptions {
        std::filesystem::path prediction_folder{};
        // Stitched maps are evaluated only when a ground-truth folder is set.
        std::filesystem::path groundtruth_folder{};
        std::filesystem::path output_path{};
        Stitch::StitchOptions stitch{};
        Evaluation::Options evaluation{};
        torch::Device device{torch::kCPU};
        std::ostream* stream{&std::cout};
        Common::Log::MetricLog log{};
        Plot::Sink plot{};
        std::int64_t plot_every{10};
    };

    struct InferenceReport {
        std::vector<std::filesystem::path> predictions{};
        Stitch::StitchResult stitched{};
        std::optional<Evaluation::Report> evaluation{};
        Metric::Summary dice{};
        Metric::Summary iou{};
        std::int64_t patches{0};
    };

    inline std::filesystem::path figure_path(const std::filesystem::path& output, std::int64_t sample)
    {
        char name[48];
        std::snprintf(name, sizeof(name), "figure_sample%05lld.png", static_cast<long long>(sample));
        return output / "infer" / name;
    }

    // [1, H, W] or [H, W] mask -> 8-bit {0, 1} map.
    inline cv::Mat to_label_map(const torch::Tensor& label)
    {
        auto mask = label.dim() == 3 ? label.select(0, 0) : label;
        if (mask.dim() != 2) {
            throw std::invalid_argument("Predicted label maps must be [1, H, W] or [H, W].");
        }
        mask = mask.detach().to(torch::kCPU, torch::kUInt8).contiguous();
        cv::Mat map(static_cast<int>(mask.size(0)), static_cast<int>(mask.size(1)), CV_8UC1, mask.data_ptr<std::uint8_t>());
        return map.clone();
    }

    inline void write_label_map(const std::filesystem::path& path, const torch::Tensor& label)
    {
        if (!cv::imwrite(path.string(), to_label_map(label))) {
            throw std::runtime_error("Failed to write predicted label '" + path.string() + "'.");
        }
    }

    // Runs a trained predictor over held-out pairs, writes per-patch predictions, stitches and evaluates them.
    class InferenceRunner {
    public:
        InferenceRunner(Model::Predictor predictor, InferenceOptions options)
            : predictor_(std::move(predictor)), options_(std::move(options))
        {
            if (!predictor_) {
                throw std::invalid_argument("InferenceRunner requires a warp predictor.");
            }
            if (options_.prediction_folder.empty()) {
                throw std::invalid_argument("InferenceRunner requires a prediction folder.");
            }
            if (options_.plot_every < 0) {
                throw std::invalid_argument("plot_every must be non-negative.");
            }
            predictor_->to(options_.device);
        }

        InferenceReport run(Data::InferenceLoader& loader)
        {
            InferenceReport report;
            Utils::Files::recreate_directory(options_.prediction_folder);

            predictor_->eval();
            torch::NoGradGuard no_grad;

            std::vector<double> dice;
            std::vector<double> iou;
            Utils::ProgressBar progress(loader.batches(), "Inference", options_.stream);

            loader.reset();
            std::int64_t iteration = 0;
            while (auto batch = loader.next()) {
                Data::Details::validate(*batch);
                const auto closest_images = batch->closest_images.to(options_.device, torch::kFloat32);
                const auto test_images = batch->test_images.to(options_.device, torch::kFloat32);
                const auto closest_labels = Label::classify_and_normalize(batch->closest_labels.to(options_.device));

                auto registration = Training::register_pair(*predictor_, closest_images, test_images,
                                                             closest_labels.tensor, closest_labels.kind);
                const auto predicted = Label::threshold(registration.projected);

                for (std::size_t index = 0; index < batch->test_paths.size(); ++index) {
                    const auto target = options_.prediction_folder
                                      / std::filesystem::path(batch->test_paths[index]).filename();
                    write_label_map(target, predicted[static_cast<std::int64_t>(index)]);
                    report.predictions.push_back(target);
                }
                report.patches += static_cast<std::int64_t>(batch->test_paths.size());

                if (batch->test_labels) {
                    auto truth = Label::classify_and_normalize(batch->test_labels->to(options_.device));
                    const auto reference = Label::threshold(truth.tensor);
                    const auto batch_dice = Metric::Details::per_sample(Metric::Kind::Dice, predicted, reference);
                    const auto batch_iou = Metric::Details::per_sample(Metric::Kind::IoU, predicted, reference);
                    dice.insert(dice.end(), batch_dice.begin(), batch_dice.end());
                    iou.insert(iou.end(), batch_iou.begin(), batch_iou.end());

                    if (options_.plot && options_.plot_every > 0 && iteration % options_.plot_every == 0) {
                        const auto reference_dice = Metric::Details::dice(Label::threshold(closest_labels.tensor[0]), reference[0]);
                        Plot::SideBySide request;
                        request.save_path = figure_path(options_.output_path, iteration);
                        request.unannotated_image = test_images[0];
                        request.annotated_image = closest_images[0];
                        request.cycled_image = registration.cycled[0];
                        request.warped_image = registration.warped[0];
                        request.unannotated_label = reference[0];
                        request.annotated_label = closest_labels.tensor[0];
                        request.projected_label = predicted[0];
                        request.metric_name = Label::metric_name(Label::Kind::Binary);
                        request.reference_metric = reference_dice;
                        request.registered_metric = batch_dice.front();
                        options_.plot(request);
                    }
                }

                ++iteration;
                progress.update(iteration);
            }
            progress.complete();

            report.stitched = Stitch::Run(options_.prediction_folder, options_.stitch);

            if (!options_.groundtruth_folder.empty()) {
                report.evaluation = Evaluation::EvaluateFolders(report.stitched.output_folder,
                                                                options_.groundtruth_folder, options_.evaluation);
                for (std::size_t index = 0; index < report.evaluation->order.size(); ++index) {
                    std::ostringstream line;
                    line << "[Eval] Stitched " << Metric::Details::name_of(report.evaluation->order[index]) << ": "
                         << report.evaluation->mean[index];
                    options_.log.write(line.str());
                }
            }

            if (loader.has_test_labels()) {
                report.dice = Metric::Details::summarize(dice);
                report.iou = Metric::Details::summarize(iou);
                options_.log.write("[Eval] Dice coeff (seg): " + Metric::Details::format(report.dice) + ".");
                options_.log.write("[Eval] IoU (seg): " + Metric::Details::format(report.iou) + ".");
            }
            return report;
        }

        [[nodiscard]] Model::PredictorImpl& predictor() noexcept { return *predictor_; }
        [[nodiscard]] const InferenceOptions& options() const noexcept { return options_; }

    private:
        Model::Predictor predictor_;
        InferenceOptions options_;
    };
}

#endif // DIFFEO_INFERENCE_HPP
