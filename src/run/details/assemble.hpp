#ifndef DIFFEO_RUN_ASSEMBLE_HPP
#define DIFFEO_RUN_ASSEMBLE_HPP
#include <cstdint>
#include <iostream>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../common/config.hpp"
#include "../../common/log.hpp"
#include "../../data/data.hpp"
#include "../../inference/inference.hpp"
#include "../../model/model.hpp"
#include "../../optimizer/optimizer.hpp"
#include "../../plot/plot.hpp"
#include "../../stitch/stitch.hpp"
#include "../../training/trainer.hpp"

namespace Diffeo::Run::Details {
    using RunConfig = Common::Config::RunConfig;

    inline torch::Device device_of(const RunConfig& config)
    {
        try {
            return torch::Device(config.device);
        } catch (const c10::Error&) {
            throw std::invalid_argument("Unsupported device '" + config.device + "'.");
        }
    }

    // Opens the run log and records every option at its top, as "key: value" lines.
    inline Common::Log::MetricLog open_log(const RunConfig& config, std::ostream* console = &std::cout)
    {
        Common::Log::MetricLog log(Common::Config::log_path(config), console);
        std::ostringstream header;
        Common::Config::describe(config, header);
        std::istringstream lines(header.str());
        for (std::string line; std::getline(lines, line);) {
            log.write(line, /*to_console=*/false);
        }
        return log;
    }

    inline Model::Predictor create_predictor(const RunConfig& config, const Model::Registry& registry)
    {
        Model::PredictorOptions options;
        options.num_filters = config.num_filters;
        options.depth = config.depth;
        return registry.create(config.model, options);
    }

    inline Stitch::StitchOptions stitch_options(const RunConfig& config, std::ostream* stream = &std::cout)
    {
        Stitch::StitchOptions options;
        options.canvas_rows = config.canvas_size[0];
        options.canvas_cols = config.canvas_size[1];
        options.patch_size = config.patch_size;
        options.stream = stream;
        return options;
    }

    inline Training::TrainerOptions trainer_options(const RunConfig& config, Common::Log::MetricLog log)
    {
        Training::TrainerOptions options;
        options.max_epochs = config.max_epochs;
        options.pairing = config.strong ? Training::PairingMode::Strong : Training::PairingMode::Weak;
        options.early_stopping.patience = config.patience;
        options.plots_per_epoch = config.plots_per_epoch;

        Optimizer::AdamWOptions adamw;
        adamw.learning_rate = config.learning_rate;
        options.optimizer = Optimizer::AdamW(adamw);

        options.checkpoint_path = Common::Config::checkpoint_path(config);
        options.output_path = Common::Config::output_save_path(config);
        if (log.console() != nullptr) {
            options.stream = log.console();
        }
        options.log = std::move(log);
        options.seed = config.random_seed;
        options.device = device_of(config);
        options.plot = Plot::FileSink();
        return options;
    }

    inline Inference::InferenceOptions inference_options(const RunConfig& config, Common::Log::MetricLog log)
    {
        Inference::InferenceOptions options;
        options.prediction_folder = Common::Config::prediction_folder(config);
        options.groundtruth_folder = config.groundtruth_folder;
        options.output_path = Common::Config::output_save_path(config);
        if (log.console() != nullptr) {
            options.stream = log.console();
        }
        options.stitch = stitch_options(config, options.stream);
        options.evaluation.file_ids = config.eval_file_ids;
        options.evaluation.stream = options.stream;
        options.device = device_of(config);
        options.log = std::move(log);
        options.plot = Plot::FileSink();
        return options;
    }

    // Patches reach the predictor at target_dim; anything else means the dataset was prepared for another run.
    inline void check_target_dim(const RunConfig& config, const torch::Tensor& images)
    {
        if (!images.defined() || images.dim() < 2) {
            throw std::invalid_argument("Run images must carry two trailing spatial dimensions.");
        }
        if (images.size(-2) != config.target_dim[0] || images.size(-1) != config.target_dim[1]) {
            std::ostringstream message;
            message << "Run images are " << images.size(-2) << "x" << images.size(-1) << " but target_dim is "
                    << config.target_dim[0] << "x" << config.target_dim[1] << ".";
            throw std::invalid_argument(message.str());
        }
    }

    inline Data::TensorPairLoader pair_loader(const RunConfig& config,
                                              torch::Tensor images,
                                              torch::Tensor labels,
                                              bool shuffle)
    {
        check_target_dim(config, images);
        return Data::TensorPairLoader(std::move(images), std::move(labels), {}, {}, config.batch_size, shuffle,
                                      config.random_seed);
    }

    inline Data::TensorInferenceLoader inference_loader(const RunConfig& config,
                                                        torch::Tensor closest_images,
                                                        torch::Tensor test_images,
                                                        torch::Tensor closest_labels,
                                                        std::optional<torch::Tensor> test_labels,
                                                        std::vector<std::string> test_paths)
    {
        check_target_dim(config, test_images);
        return Data::TensorInferenceLoader(std::move(closest_images), std::move(test_images), std::move(closest_labels),
                                           std::move(test_labels), std::move(test_paths), config.batch_size);
    }
}

#endif // DIFFEO_RUN_ASSEMBLE_HPP
