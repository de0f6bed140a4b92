#ifndef DIFFEO_OPTIMIZER_REGISTRY_HPP
#define DIFFEO_OPTIMIZER_REGISTRY_HPP

#include <memory>

#include <torch/torch.h>

#include "details/adamw.hpp"

namespace Diffeo::Optimizer::Details {
    template <class Owner, class Descriptor>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(Owner&, const Descriptor&) {
        static_assert(sizeof(Descriptor) == 0, "Unsupported optimizer descriptor provided to build_optimizer.");
        return nullptr;
    }

    template <class Owner>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(Owner& owner, const AdamWDescriptor& descriptor) {
        auto options = to_torch_options(descriptor.options);
        return std::make_unique<torch::optim::AdamW>(owner.parameters(), options);
    }
}

#endif // DIFFEO_OPTIMIZER_REGISTRY_HPP
