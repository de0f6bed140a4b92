#ifndef DIFFEO_WARP_HPP
#define DIFFEO_WARP_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include <torch/torch.h>

#include "details/field.hpp"
#include "details/warper.hpp"

namespace Diffeo::Warp {
    using FieldPair = Details::FieldPair;

    [[nodiscard]] inline torch::Tensor Apply(const torch::Tensor& image, const torch::Tensor& field) {
        return Details::warp(image, field);
    }

    [[nodiscard]] inline FieldPair Split(const torch::Tensor& prediction) {
        return Details::split_fields(prediction);
    }
}

#endif // DIFFEO_WARP_HPP
