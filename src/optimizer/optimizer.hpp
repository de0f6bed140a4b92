#ifndef DIFFEO_OPTIMIZER_HPP
#define DIFFEO_OPTIMIZER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include "details/adamw.hpp"
#include "registry.hpp"

namespace Diffeo::Optimizer {
    using AdamWOptions = Details::AdamWOptions;
    using AdamWDescriptor = Details::AdamWDescriptor;

    [[nodiscard]] constexpr auto AdamW(const AdamWOptions& options = {}) noexcept -> AdamWDescriptor {
        return AdamWDescriptor{.options = options};
    }
}

#endif // DIFFEO_OPTIMIZER_HPP
