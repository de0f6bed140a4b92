#ifndef DIFFEO_LOSS_HPP
#define DIFFEO_LOSS_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include "details/reduction.hpp"
#include "details/mse.hpp"
#include "details/cyclic.hpp"

namespace Diffeo::Loss {
    using Reduction = Details::Reduction;
    using MSEOptions = Details::MSEOptions;
    using CyclicOptions = Details::CyclicOptions;
    using CyclicTerms = Details::CyclicTerms;

    using MSEDescriptor = Details::MSEDescriptor;
    using CyclicDescriptor = Details::CyclicDescriptor;

    [[nodiscard]] constexpr auto MSE(const Details::MSEOptions& options = {}) noexcept -> Details::MSEDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto Cyclic(const Details::CyclicOptions& options = {}) noexcept -> Details::CyclicDescriptor {
        return {options};
    }
}

#endif // DIFFEO_LOSS_HPP
