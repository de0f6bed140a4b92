#ifndef DIFFEO_LOSS_CYCLIC_HPP
#define DIFFEO_LOSS_CYCLIC_HPP

#include <torch/torch.h>

#include "mse.hpp"

namespace Diffeo::Loss::Details {

    struct CyclicOptions {
        MSEOptions similarity{};
    };

    struct CyclicDescriptor {
        CyclicOptions options{};
    };

    struct CyclicTerms {
        torch::Tensor total;
        torch::Tensor forward;
        torch::Tensor cyclic;
    };

    // forward: the unannotated image pushed onto the annotated frame must match the annotated image.
    // cyclic:  pushing it back with the reverse field must return the unannotated image.
    // No label term: labels never supervise the fields.
    inline CyclicTerms compute(const CyclicDescriptor& descriptor,
                               const torch::Tensor& annotated_images,
                               const torch::Tensor& unannotated_images,
                               const torch::Tensor& unannotated_to_annotated,
                               const torch::Tensor& cycled)
    {
        const MSEDescriptor similarity{descriptor.options.similarity};
        auto forward = compute(similarity, annotated_images, unannotated_to_annotated);
        auto cyclic = compute(similarity, unannotated_images, cycled);
        auto total = forward + cyclic;
        return {std::move(total), std::move(forward), std::move(cyclic)};
    }

}

#endif // DIFFEO_LOSS_CYCLIC_HPP
