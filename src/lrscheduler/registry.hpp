#ifndef DIFFEO_LRSCHEDULER_REGISTRY_HPP
#define DIFFEO_LRSCHEDULER_REGISTRY_HPP

#include <memory>

#include <torch/torch.h>

#include "details/cosineannealing.hpp"

namespace Diffeo::LrScheduler::Details {
    template <class Descriptor>
    std::unique_ptr<Scheduler> build_scheduler(torch::optim::Optimizer&, const Descriptor&) {
        static_assert(sizeof(Descriptor) == 0, "Unsupported scheduler descriptor provided to build_scheduler.");
        return nullptr;
    }

    inline std::unique_ptr<Scheduler> build_scheduler(torch::optim::Optimizer& optimizer, const CosineAnnealingDescriptor& descriptor) {
        return std::make_unique<CosineAnnealingScheduler>(optimizer, descriptor.options);
    }
}

#endif // DIFFEO_LRSCHEDULER_REGISTRY_HPP
