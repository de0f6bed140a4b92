#ifndef DIFFEO_LOSS_MSE_HPP
#define DIFFEO_LOSS_MSE_HPP

#include <stdexcept>
#include <torch/torch.h>

#include "reduction.hpp"

namespace Diffeo::Loss::Details {

    namespace F = torch::nn::functional;

    struct MSEOptions {
        Reduction reduction{Reduction::Mean};
    };

    struct MSEDescriptor {
        MSEOptions options{};
    };

    inline torch::Tensor compute(const MSEDescriptor& descriptor,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target)
    {
        if (!prediction.defined() || !target.defined()) {
            throw std::invalid_argument("MSE requires defined prediction and target tensors.");
        }
        if (prediction.sizes() != target.sizes()) {
            throw std::invalid_argument("MSE requires prediction and target tensors of identical shape.");
        }
        return F::mse_loss(
            prediction,
            target.to(prediction.scalar_type()),
            F::MSELossFuncOptions().reduction(to_torch_reduction<F::MSELossFuncOptions>(descriptor.options.reduction))
        );
    }

}

#endif // DIFFEO_LOSS_MSE_HPP
