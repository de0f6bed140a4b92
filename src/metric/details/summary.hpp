#ifndef DIFFEO_METRIC_SUMMARY_HPP
#define DIFFEO_METRIC_SUMMARY_HPP

#include <cmath>
#include <cstdio>
#include <limits>
#include <string>
#include <vector>

#include "../../utils/terminal.hpp"

namespace Diffeo::Metric::Details {
    struct Summary {
        double mean{std::numeric_limits<double>::quiet_NaN()};
        double stddev{std::numeric_limits<double>::quiet_NaN()};
    };

    // Population standard deviation. NaN inputs and empty lists propagate as NaN.
    [[nodiscard]] inline Summary summarize(const std::vector<double>& values) {
        Summary summary;
        if (values.empty()) {
            return summary;
        }
        double sum = 0.0;
        for (const double value : values) {
            sum += value;
        }
        summary.mean = sum / static_cast<double>(values.size());
        double squared = 0.0;
        for (const double value : values) {
            squared += (value - summary.mean) * (value - summary.mean);
        }
        summary.stddev = std::sqrt(squared / static_cast<double>(values.size()));
        return summary;
    }

    inline std::string format(const Summary& summary, int precision = 3) {
        char mean[48];
        char stddev[48];
        std::snprintf(mean, sizeof(mean), "%.*f", precision, summary.mean);
        std::snprintf(stddev, sizeof(stddev), "%.*f", precision, summary.stddev);
        return std::string(mean) + " " + std::string(Utils::Terminal::Symbols::kPlusMinus) + " " + stddev;
    }
}

#endif // DIFFEO_METRIC_SUMMARY_HPP
