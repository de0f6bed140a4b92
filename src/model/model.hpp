#ifndef DIFFEO_MODEL_HPP
#define DIFFEO_MODEL_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include "details/predictor.hpp"
#include "details/unet.hpp"
#include "registry.hpp"

namespace Diffeo::Model {
    using PredictorOptions = Details::PredictorOptions;
    using PredictorImpl = Details::PredictorImpl;
    using Predictor = Details::Predictor;
    using UNetImpl = Details::UNetImpl;
    using Registry = Details::Registry;
    using Constructor = Details::Constructor;

    [[nodiscard]] inline auto DefaultRegistry() -> Registry { return Details::default_registry(); }

    [[nodiscard]] inline auto Create(const std::string& tag, const PredictorOptions& options = {}) -> Predictor {
        return Details::default_registry().create(tag, options);
    }
}

#endif // DIFFEO_MODEL_HPP
