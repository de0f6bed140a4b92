#ifndef DIFFEO_TRAINING_EARLY_STOPPING_HPP
#define DIFFEO_TRAINING_EARLY_STOPPING_HPP
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace Diffeo::Training {
    struct EarlyStoppingOptions {
        enum class Mode { Min, Max };
        Mode mode{Mode::Min};
        std::int64_t patience{50};
        double min_delta{0.0};
    };

    class EarlyStopping {
    public:
        explicit EarlyStopping(EarlyStoppingOptions options = {}) : options_(options)
        {
            if (options_.patience < 0) {
                throw std::invalid_argument("EarlyStopping patience must be non-negative.");
            }
            if (options_.min_delta < 0.0) {
                throw std::invalid_argument("EarlyStopping min_delta must be non-negative.");
            }
        }

        // Returns true once `patience` consecutive steps after the first failed to improve, so patience 0 stops on
        // the first non-improving step. A NaN value stops immediately.
        [[nodiscard]] bool step(double value)
        {
            if (std::isnan(value)) {
                return true;
            }
            if (!has_best_) {
                best_ = value;
                has_best_ = true;
                return false;
            }
            if (improves(value)) {
                best_ = value;
                bad_steps_ = 0;
                return false;
            }
            ++bad_steps_;
            return bad_steps_ >= options_.patience;
        }

        [[nodiscard]] double best() const noexcept { return best_; }
        [[nodiscard]] std::int64_t bad_steps() const noexcept { return bad_steps_; }

    private:
        [[nodiscard]] bool improves(double value) const noexcept
        {
            if (options_.mode == EarlyStoppingOptions::Mode::Min) {
                return value < best_ - options_.min_delta;
            }
            return value > best_ + options_.min_delta;
        }

        EarlyStoppingOptions options_{};
        double best_{std::numeric_limits<double>::quiet_NaN()};
        bool has_best_{false};
        std::int64_t bad_steps_{0};
    };
}

#endif // DIFFEO_TRAINING_EARLY_STOPPING_HPP
