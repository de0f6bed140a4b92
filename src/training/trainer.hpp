#ifndef DIFFEO_TRAINING_TRAINER_HPP
#define DIFFEO_TRAINING_TRAINER_HPP
#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <limits>
#include <memory>
#include <ostream>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../common/log.hpp"
#include "../common/save_load.hpp"
#include "../data/data.hpp"
#include "../label/label.hpp"
#include "../loss/loss.hpp"
#include "../lrscheduler/lrscheduler.hpp"
#include "../metric/metric.hpp"
#include "../model/model.hpp"
#include "../optimizer/optimizer.hpp"
#include "../plot/plot.hpp"
#include "../utils/progressbar.hpp"
#include "../utils/terminal.hpp"
#include "early_stopping.hpp"
#include "step.hpp"

namespace Diffeo::Training {
    enum class Phase { Train, Validation, Test };

    inline std::string phase_title(Phase phase)
    {
        switch (phase) {
            case Phase::Train: return "Train";
            case Phase::Validation: return "Validation";
            case Phase::Test: return "Test";
        }
        throw std::invalid_argument("Unknown training phase.");
    }

    inline std::string phase_folder(Phase phase)
    {
        switch (phase) {
            case Phase::Train: return "train";
            case Phase::Validation: return "val";
            case Phase::Test: return "test";
        }
        throw std::invalid_argument("Unknown training phase.");
    }

    struct TrainerOptions {
        std::int64_t max_epochs{50};
        PairingMode pairing{PairingMode::Weak};
        EarlyStoppingOptions early_stopping{};
        std::int64_t plots_per_epoch{2};
        Optimizer::AdamWDescriptor optimizer{Optimizer::AdamW()};
        LrScheduler::CosineAnnealingDescriptor scheduler{LrScheduler::CosineAnnealing()};
        Loss::CyclicDescriptor loss{Loss::Cyclic()};
        std::filesystem::path checkpoint_path{};
        std::filesystem::path output_path{};
        std::ostream* stream{&std::cout};
        Common::Log::MetricLog log{};
        std::uint64_t seed{1};
        torch::Device device{torch::kCPU};
        bool orientation_prealign{false};
        Plot::Sink plot{};
    };

    struct PhaseSummary {
        double loss{std::numeric_limits<double>::quiet_NaN()};
        double forward{std::numeric_limits<double>::quiet_NaN()};
        double cyclic{std::numeric_limits<double>::quiet_NaN()};
        std::string metric_name{Label::metric_name(Label::Kind::Binary)};
        Metric::Summary reference{};
        Metric::Summary registered{};
        std::int64_t samples{0};
    };

    struct FitReport {
        std::vector<PhaseSummary> train{};
        std::vector<PhaseSummary> validation{};
        double best_validation_loss{std::numeric_limits<double>::infinity()};
        std::int64_t epochs_run{0};
        bool stopped_early{false};
    };

    inline std::string format_summary(const PhaseSummary& summary)
    {
        char buffer[256];
        std::snprintf(buffer, sizeof(buffer), "loss: %.3f, forward: %.3f, cyclic: %.3f, ",
                      summary.loss, summary.forward, summary.cyclic);
        return std::string(buffer)
             + summary.metric_name + " (ref): " + Metric::Details::format(summary.reference) + ", "
             + summary.metric_name + " (seg): " + Metric::Details::format(summary.registered) + ".";
    }

    class CyclicRegistrationTrainer {
    public:
        CyclicRegistrationTrainer(Model::Predictor predictor, TrainerOptions options)
            : predictor_(std::move(predictor)), options_(std::move(options)), generator_(options_.seed)
        {
            if (!predictor_) {
                throw std::invalid_argument("CyclicRegistrationTrainer requires a warp predictor.");
            }
            if (options_.max_epochs < 0) {
                throw std::invalid_argument("max_epochs must be non-negative.");
            }
            if (options_.plots_per_epoch < 0) {
                throw std::invalid_argument("plots_per_epoch must be non-negative.");
            }
            predictor_->to(options_.device);
            optimizer_ = Optimizer::Details::build_optimizer(*predictor_, options_.optimizer);
            scheduler_ = LrScheduler::Details::build_scheduler(*optimizer_, options_.scheduler);
        }

        FitReport fit(Data::PairLoader& train_loader, Data::PairLoader& validation_loader)
        {
            FitReport report;
            EarlyStopping early_stopping(options_.early_stopping);

            for (std::int64_t epoch = 0; epoch < options_.max_epochs; ++epoch) {
                auto train = run_phase(train_loader, Phase::Train, epoch);
                scheduler_->step();
                options_.log.write(epoch_line(Phase::Train, epoch, train), /*to_console=*/false);
                report.train.push_back(train);

                auto validation = run_phase(validation_loader, Phase::Validation, epoch);
                options_.log.write(epoch_line(Phase::Validation, epoch, validation), /*to_console=*/false);
                report.validation.push_back(validation);
                report.epochs_run = epoch + 1;

                if (validation.loss < report.best_validation_loss) {
                    report.best_validation_loss = validation.loss;
                    if (!options_.checkpoint_path.empty()) {
                        Common::SaveLoad::save_checkpoint(*predictor_, options_.checkpoint_path);
                        options_.log.write(predictor_->tag() + ": Model weights successfully saved.", /*to_console=*/false);
                    }
                }

                if (early_stopping.step(validation.loss)) {
                    options_.log.write("Early stopping criterion met. Ending training.", /*to_console=*/true,
                                       Utils::Terminal::Colors::kYellow);
                    report.stopped_early = true;
                    break;
                }
            }
            return report;
        }

        PhaseSummary test(Data::PairLoader& loader)
        {
            auto summary = run_phase(loader, Phase::Test, 0);
            options_.log.write("Test " + format_summary(summary), /*to_console=*/true);
            return summary;
        }

        PhaseSummary run_phase(Data::PairLoader& loader, Phase phase, std::int64_t epoch)
        {
            const bool training = phase == Phase::Train;
            predictor_->train(training);
            std::unique_ptr<torch::NoGradGuard> no_grad;
            if (!training) {
                no_grad = std::make_unique<torch::NoGradGuard>();
            }

            const auto batches = loader.batches();
            const auto plot_every = plot_frequency(batches);
            Utils::ProgressBar progress(batches, phase_title(phase), options_.stream);

            double loss_sum = 0.0;
            double forward_sum = 0.0;
            double cyclic_sum = 0.0;
            std::int64_t samples = 0;
            std::vector<double> reference;
            std::vector<double> registered;
            PhaseSummary summary;

            loader.reset();
            std::int64_t iteration = 0;
            while (auto batch = loader.next()) {
                auto views = split_views(*batch, options_.pairing, generator_, options_.device);
                if (options_.orientation_prealign) {
                    torch::NoGradGuard prealign_guard;
                    prealign(views);
                }
                const auto kind = views.annotated_labels.kind;
                const auto metric = kind == Label::Kind::Binary ? Metric::Kind::Dice : Metric::Kind::L1;
                summary.metric_name = Label::metric_name(kind);

                auto registration = register_pair(*predictor_, views.annotated_images, views.unannotated_images,
                                                   views.annotated_labels.tensor, kind);
                auto terms = Loss::Details::compute(options_.loss, views.annotated_images, views.unannotated_images,
                                                    registration.warped, registration.cycled);

                if (training) {
                    optimizer_->zero_grad();
                    terms.total.backward();
                    optimizer_->step();
                }

                const auto batch_size = views.unannotated_images.size(0);
                loss_sum += terms.total.item<double>() * static_cast<double>(batch_size);
                forward_sum += terms.forward.item<double>() * static_cast<double>(batch_size);
                cyclic_sum += terms.cyclic.item<double>() * static_cast<double>(batch_size);
                samples += batch_size;

                const auto batch_reference = Metric::Details::per_sample(metric, views.annotated_labels.tensor.detach(),
                                                                         views.unannotated_labels.tensor);
                const auto batch_registered = Metric::Details::per_sample(metric, registration.projected.detach(),
                                                                          views.unannotated_labels.tensor);
                reference.insert(reference.end(), batch_reference.begin(), batch_reference.end());
                registered.insert(registered.end(), batch_registered.begin(), batch_registered.end());

                if (plot_every > 0 && iteration % plot_every == plot_every - 1 && options_.plot) {
                    Plot::SideBySide request;
                    request.save_path = Plot::Details::figure_path(options_.output_path, phase_folder(phase), epoch, iteration);
                    request.unannotated_image = views.unannotated_images[0].detach();
                    request.annotated_image = views.annotated_images[0].detach();
                    request.cycled_image = registration.cycled[0].detach();
                    request.warped_image = registration.warped[0].detach();
                    request.unannotated_label = views.unannotated_labels.tensor[0];
                    request.annotated_label = views.annotated_labels.tensor[0];
                    request.projected_label = registration.projected[0].detach();
                    request.metric_name = summary.metric_name;
                    request.reference_metric = batch_reference.front();
                    request.registered_metric = batch_registered.front();
                    options_.plot(request);
                }

                ++iteration;
                progress.update(iteration);
            }
            progress.complete();

            const auto count = static_cast<double>(samples);
            summary.loss = loss_sum / count;
            summary.forward = forward_sum / count;
            summary.cyclic = cyclic_sum / count;
            summary.reference = Metric::Details::summarize(reference);
            summary.registered = Metric::Details::summarize(registered);
            summary.samples = samples;
            return summary;
        }

        [[nodiscard]] Model::PredictorImpl& predictor() noexcept { return *predictor_; }
        [[nodiscard]] const TrainerOptions& options() const noexcept { return options_; }
        [[nodiscard]] torch::optim::Optimizer& optimizer() noexcept { return *optimizer_; }
        [[nodiscard]] LrScheduler::Scheduler& scheduler() noexcept { return *scheduler_; }

    private:
        // Last batch of every len(loader) / plots_per_epoch interval; 0 disables plotting.
        [[nodiscard]] std::int64_t plot_frequency(std::int64_t batches) const noexcept
        {
            if (options_.plots_per_epoch == 0 || batches <= 0) {
                return 0;
            }
            return std::max<std::int64_t>(1, batches / options_.plots_per_epoch);
        }

        [[nodiscard]] std::string epoch_line(Phase phase, std::int64_t epoch, const PhaseSummary& summary) const
        {
            return phase_title(phase) + " [" + std::to_string(epoch + 1) + "/" + std::to_string(options_.max_epochs)
                 + "] " + format_summary(summary);
        }

        Model::Predictor predictor_;
        TrainerOptions options_;
        std::mt19937_64 generator_;
        std::unique_ptr<torch::optim::Optimizer> optimizer_{};
        std::unique_ptr<LrScheduler::Scheduler> scheduler_{};
    };
}

#endif // DIFFEO_TRAINING_TRAINER_HPP
