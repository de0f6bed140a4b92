#ifndef DIFFEO_DATA_HPP
#define DIFFEO_DATA_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include "details/pairs.hpp"

namespace Diffeo::Data {
    using PairBatch = Details::PairBatch;
    using PairLoader = Details::PairLoader;
    using TensorPairLoader = Details::TensorPairLoader;

    using InferenceBatch = Details::InferenceBatch;
    using InferenceLoader = Details::InferenceLoader;
    using TensorInferenceLoader = Details::TensorInferenceLoader;

    inline constexpr auto kUnannotatedView = Details::kUnannotatedView;
    inline constexpr auto kAnnotatedView = Details::kAnnotatedView;
}

#endif // DIFFEO_DATA_HPP
