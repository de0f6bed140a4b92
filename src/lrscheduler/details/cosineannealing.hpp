#ifndef DIFFEO_LRSCHEDULER_COSINEANNEALING_HPP
#define DIFFEO_LRSCHEDULER_COSINEANNEALING_HPP
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <vector>
// "SGDR: Stochastic Gradient Descent with Warm Restarts" (cosine annealing) https://arxiv.org/pdf/1608.03983
#include <torch/torch.h>

#include "common.hpp"

namespace Diffeo::LrScheduler::Details {
    struct CosineAnnealingOptions {
        std::size_t T_max{5};
        double eta_min{0.0};
        // When false the rate stays at eta_min after T_max steps instead of rising again.
        bool periodic{true};
    };

    struct CosineAnnealingDescriptor {
        CosineAnnealingOptions options{};
    };

    // Stepped once per epoch by the trainer.
    class CosineAnnealingScheduler final : public Scheduler {
    public:
        CosineAnnealingScheduler(torch::optim::Optimizer& optimizer, CosineAnnealingOptions options)
            : optimizer_(optimizer),
              options_(options),
              base_lrs_(capture_base_lrs(optimizer)),
              step_count_(0) {
            if (options_.T_max == 0) {
                throw std::invalid_argument("CosineAnnealingScheduler requires T_max to be greater than zero.");
            }
            if (options_.eta_min < 0.0) {
                throw std::invalid_argument("CosineAnnealingScheduler eta_min must be non-negative.");
            }
            apply(step_count_);
        }

        void step() override {
            if (step_count_ < std::numeric_limits<std::size_t>::max()) {
                ++step_count_;
            }
            apply(step_count_);
        }

        [[nodiscard]] std::size_t step_count() const noexcept override { return step_count_; }

        [[nodiscard]] std::vector<double> last_lr() const override {
            std::vector<double> rates;
            rates.reserve(base_lrs_.size());
            for (const auto base_lr : base_lrs_) {
                rates.push_back(compute_lr(base_lr, step_count_));
            }
            return rates;
        }

        [[nodiscard]] double compute_lr(double base_lr, std::size_t step) const {
            const auto T_max = static_cast<double>(options_.T_max);
            double position = static_cast<double>(step);
            if (!options_.periodic) {
                position = std::min(position, T_max);
            }
            constexpr double kPi = 3.14159265358979323846;
            const double cosine = std::cos(kPi * position / T_max);
            return options_.eta_min + (base_lr - options_.eta_min) * (1.0 + cosine) * 0.5;
        }

    private:
        void apply(std::size_t step) {
            auto& param_groups = optimizer_.param_groups();
            if (base_lrs_.size() != param_groups.size()) {
                throw std::runtime_error("Optimizer param group count changed after scheduler creation.");
            }

            for (std::size_t index = 0; index < param_groups.size(); ++index) {
                param_groups[index].options().set_lr(compute_lr(base_lrs_[index], step));
            }
        }

        static std::vector<double> capture_base_lrs(torch::optim::Optimizer& optimizer) {
            std::vector<double> base_lrs;
            base_lrs.reserve(optimizer.param_groups().size());
            for (auto& group : optimizer.param_groups()) {
                base_lrs.push_back(group.options().get_lr());
            }
            return base_lrs;
        }

        torch::optim::Optimizer& optimizer_;
        CosineAnnealingOptions options_{};
        std::vector<double> base_lrs_{};
        std::size_t step_count_{};
    };
}

#endif // DIFFEO_LRSCHEDULER_COSINEANNEALING_HPP
