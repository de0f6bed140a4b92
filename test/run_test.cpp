#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

#include "../include/Diffeo.h"
#include "support.hpp"

namespace Config = Diffeo::Common::Config;
namespace Run = Diffeo::Run;

namespace {
    Config::RunConfig scratch_config(const Diffeo::Test::TempDir& scratch) {
        Config::RunConfig config;
        config.model_save_folder = (scratch.path() / "checkpoints").string();
        config.output_save_folder = (scratch.path() / "results").string();
        config.groundtruth_folder = (scratch.path() / "groundtruth").string();
        config.eval_file_ids = {"slide_07"};
        config.strong = true;
        config.patience = 3;
        config.learning_rate = 5e-4;
        config.max_epochs = 4;
        config.plots_per_epoch = 1;
        config.random_seed = 7;
        config.num_filters = 8;
        config.depth = 2;
        config.batch_size = 2;
        config.canvas_size = {64, 48};
        config.patch_size = 16;
        return config;
    }

    std::string read_file(const std::filesystem::path& path) {
        std::ifstream stream(path);
        std::stringstream contents;
        contents << stream.rdbuf();
        return contents.str();
    }
}

TEST(RunTest, OpenLogRecordsEveryOptionInTheFileOnly) {
    Diffeo::Test::TempDir scratch;
    const auto config = scratch_config(scratch);
    std::ostringstream console;

    const auto log = Run::OpenLog(config, &console);

    EXPECT_EQ(log.path().string(), Config::log_path(config).string());
    const auto contents = read_file(log.path());
    EXPECT_NE(contents.find("mode: train\n"), std::string::npos);
    EXPECT_NE(contents.find("DiffeoMappingNet_model: UNet\n"), std::string::npos);
    EXPECT_NE(contents.find("target_dim: [32, 32]\n"), std::string::npos);
    EXPECT_TRUE(console.str().empty());
}

TEST(RunTest, TrainerOptionsCarryTheConfiguredRun) {
    Diffeo::Test::TempDir scratch;
    const auto config = scratch_config(scratch);
    std::ostringstream console;
    const auto log = Run::OpenLog(config, &console);

    const auto options = Run::TrainerOptionsFor(config, log);

    EXPECT_EQ(options.pairing, Diffeo::Training::PairingMode::Strong);
    EXPECT_EQ(options.early_stopping.patience, 3);
    EXPECT_DOUBLE_EQ(options.optimizer.options.learning_rate, 5e-4);
    EXPECT_EQ(options.max_epochs, 4);
    EXPECT_EQ(options.plots_per_epoch, 1);
    EXPECT_EQ(options.seed, 7u);
    EXPECT_EQ(options.checkpoint_path.string(), Config::checkpoint_path(config).string());
    EXPECT_EQ(options.output_path.string(), Config::output_save_path(config).string());
    EXPECT_EQ(options.log.path().string(), Config::log_path(config).string());
    EXPECT_EQ(options.stream, &console);
    EXPECT_TRUE(options.device.is_cpu());
    EXPECT_TRUE(static_cast<bool>(options.plot));

    Diffeo::Training::CyclicRegistrationTrainer trainer(Run::CreatePredictor(config), options);
    EXPECT_EQ(trainer.predictor().tag(), "UNet");
}

TEST(RunTest, InferenceOptionsCarryStitchAndEvaluationSettings) {
    Diffeo::Test::TempDir scratch;
    const auto config = scratch_config(scratch);
    std::ostringstream console;

    const auto options = Run::InferenceOptionsFor(config, Run::OpenLog(config, &console));

    EXPECT_EQ(options.prediction_folder.string(), Config::prediction_folder(config).string());
    EXPECT_EQ(options.groundtruth_folder.string(), config.groundtruth_folder);
    EXPECT_EQ(options.output_path.string(), Config::output_save_path(config).string());
    EXPECT_EQ(options.stitch.canvas_rows, 64);
    EXPECT_EQ(options.stitch.canvas_cols, 48);
    EXPECT_EQ(options.stitch.patch_size, 16);
    EXPECT_EQ(options.stitch.stream, &console);
    EXPECT_EQ(options.evaluation.file_ids, std::vector<std::string>{"slide_07"});
    EXPECT_TRUE(static_cast<bool>(options.plot));
}

TEST(RunTest, PredictorFollowsTheConfiguredModelTag) {
    Diffeo::Test::TempDir scratch;
    auto config = scratch_config(scratch);

    const auto unet = Run::CreatePredictor(config);
    EXPECT_EQ(unet->tag(), "UNet");
    EXPECT_EQ(unet->options().num_filters, 8);
    EXPECT_EQ(unet->options().depth, 2);
    EXPECT_EQ(unet->options().in_channels, 6);
    EXPECT_EQ(unet->options().out_channels, 4);

    Diffeo::Model::Registry registry;
    registry.add(Diffeo::Test::ConstantFieldImpl::kTag, [](const Diffeo::Model::PredictorOptions&) {
        return Diffeo::Test::constant_field();
    });
    config.model = Diffeo::Test::ConstantFieldImpl::kTag;
    EXPECT_EQ(Run::CreatePredictor(config, registry)->tag(), Diffeo::Test::ConstantFieldImpl::kTag);

    config.model = "VoxelMorph";
    EXPECT_THROW((void)Run::CreatePredictor(config), std::invalid_argument);
}

TEST(RunTest, LoadersUseBatchSizeAndRejectOtherPatchSizes) {
    Diffeo::Test::TempDir scratch;
    const auto config = scratch_config(scratch);

    auto loader = Run::PairLoaderFor(config, torch::zeros({3, 2, 3, 32, 32}), torch::zeros({3, 2, 32, 32}));
    EXPECT_EQ(loader.batches(), 2);
    EXPECT_EQ(loader.next()->images.size(0), 2);

    auto inference = Run::InferenceLoaderFor(config, torch::zeros({3, 3, 32, 32}), torch::zeros({3, 3, 32, 32}),
                                             torch::zeros({3, 1, 32, 32}), std::nullopt, {"a.png", "b.png", "c.png"});
    EXPECT_EQ(inference.batches(), 2);

    EXPECT_THROW((void)Run::PairLoaderFor(config, torch::zeros({3, 2, 3, 16, 16}), torch::zeros({3, 2, 16, 16})),
                 std::invalid_argument);
}

TEST(RunTest, UnknownDeviceIsRejected) {
    Diffeo::Test::TempDir scratch;
    auto config = scratch_config(scratch);
    config.device = "abacus";

    EXPECT_THROW((void)Run::TrainerOptionsFor(config, Diffeo::Common::Log::MetricLog{}), std::invalid_argument);
}
