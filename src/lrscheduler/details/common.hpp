#ifndef DIFFEO_LRSCHEDULER_COMMON_HPP
#define DIFFEO_LRSCHEDULER_COMMON_HPP

#include <cstddef>
#include <vector>

namespace Diffeo::LrScheduler::Details {

    class Scheduler {
    public:
        virtual ~Scheduler() = default;
        virtual void step() = 0;
        [[nodiscard]] virtual std::size_t step_count() const noexcept = 0;
        [[nodiscard]] virtual std::vector<double> last_lr() const = 0;
    };

}  // namespace Diffeo::LrScheduler::Details

#endif // DIFFEO_LRSCHEDULER_COMMON_HPP
