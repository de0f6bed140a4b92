#ifndef DIFFEO_OPTIMIZER_ADAMW_HPP
#define DIFFEO_OPTIMIZER_ADAMW_HPP
// "Decoupled Weight Decay Regularization" https://arxiv.org/abs/1711.05101
#include <stdexcept>
#include <tuple>

#include <torch/torch.h>

namespace Diffeo::Optimizer::Details {
    struct AdamWOptions {
        double learning_rate{1e-3};
        double beta1{0.9};
        double beta2{0.999};
        double eps{1e-8};
        double weight_decay{1e-2};
        bool amsgrad{false};
    };

    struct AdamWDescriptor {
        AdamWOptions options{};
    };

    inline void validate(const AdamWOptions& options) {
        if (!(options.learning_rate > 0.0)) {
            throw std::invalid_argument("AdamW requires a strictly positive learning rate.");
        }
        if (options.beta1 < 0.0 || options.beta1 >= 1.0 || options.beta2 < 0.0 || options.beta2 >= 1.0) {
            throw std::invalid_argument("AdamW betas must lie in [0, 1).");
        }
    }

    inline torch::optim::AdamWOptions to_torch_options(const AdamWOptions& options) {
        validate(options);
        torch::optim::AdamWOptions torch_options(options.learning_rate);
        torch_options = torch_options.betas(std::make_tuple(options.beta1, options.beta2));
        torch_options = torch_options.eps(options.eps);
        torch_options = torch_options.weight_decay(options.weight_decay);
        torch_options = torch_options.amsgrad(options.amsgrad);
        return torch_options;
    }

    // Reads the learning rate currently applied to the first parameter group.
    [[nodiscard]] inline double current_learning_rate(torch::optim::Optimizer& optimizer) {
        if (optimizer.param_groups().empty()) {
            throw std::runtime_error("Optimizer has no parameter groups.");
        }
        return optimizer.param_groups().front().options().get_lr();
    }
}

#endif // DIFFEO_OPTIMIZER_ADAMW_HPP
