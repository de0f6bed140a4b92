#ifndef DIFFEO_RUN_HPP
#define DIFFEO_RUN_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include "details/assemble.hpp"

namespace Diffeo::Run {
    using RunConfig = Details::RunConfig;

    [[nodiscard]] inline auto OpenLog(const RunConfig& config, std::ostream* console = &std::cout) -> Common::Log::MetricLog {
        return Details::open_log(config, console);
    }

    [[nodiscard]] inline auto CreatePredictor(const RunConfig& config,
                                              const Model::Registry& registry = Model::DefaultRegistry()) -> Model::Predictor {
        return Details::create_predictor(config, registry);
    }

    [[nodiscard]] inline auto StitchOptionsFor(const RunConfig& config, std::ostream* stream = &std::cout) -> Stitch::StitchOptions {
        return Details::stitch_options(config, stream);
    }

    [[nodiscard]] inline auto TrainerOptionsFor(const RunConfig& config, const Common::Log::MetricLog& log)
        -> Training::TrainerOptions {
        return Details::trainer_options(config, log);
    }

    [[nodiscard]] inline auto InferenceOptionsFor(const RunConfig& config, const Common::Log::MetricLog& log)
        -> Inference::InferenceOptions {
        return Details::inference_options(config, log);
    }

    [[nodiscard]] inline auto PairLoaderFor(const RunConfig& config, torch::Tensor images, torch::Tensor labels,
                                            bool shuffle = false) -> Data::TensorPairLoader {
        return Details::pair_loader(config, std::move(images), std::move(labels), shuffle);
    }

    [[nodiscard]] inline auto InferenceLoaderFor(const RunConfig& config,
                                                 torch::Tensor closest_images,
                                                 torch::Tensor test_images,
                                                 torch::Tensor closest_labels,
                                                 std::optional<torch::Tensor> test_labels,
                                                 std::vector<std::string> test_paths) -> Data::TensorInferenceLoader {
        return Details::inference_loader(config, std::move(closest_images), std::move(test_images),
                                         std::move(closest_labels), std::move(test_labels), std::move(test_paths));
    }
}

#endif // DIFFEO_RUN_HPP
