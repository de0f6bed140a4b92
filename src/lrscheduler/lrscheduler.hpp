#ifndef DIFFEO_LRSCHEDULER_HPP
#define DIFFEO_LRSCHEDULER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include "details/common.hpp"
#include "details/cosineannealing.hpp"
#include "registry.hpp"

namespace Diffeo::LrScheduler {
    using Scheduler = Details::Scheduler;
    using CosineAnnealingOptions = Details::CosineAnnealingOptions;
    using CosineAnnealingDescriptor = Details::CosineAnnealingDescriptor;
    using CosineAnnealingScheduler = Details::CosineAnnealingScheduler;

    [[nodiscard]] constexpr auto CosineAnnealing(const CosineAnnealingOptions& options = {}) noexcept
        -> CosineAnnealingDescriptor {
        return {options};
    }
}

#endif // DIFFEO_LRSCHEDULER_HPP
