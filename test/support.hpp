#ifndef DIFFEO_TEST_SUPPORT_HPP
#define DIFFEO_TEST_SUPPORT_HPP
#include <filesystem>
#include <random>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <torch/torch.h>

#include "../include/Diffeo.h"

namespace Diffeo::Test {
    // Scratch directory under the system temp folder, removed with its contents on destruction.
    class TempDir {
    public:
        TempDir()
        {
            const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
            std::random_device device;
            const std::string name = std::string("diffeo_") + (info != nullptr ? info->name() : "test") + "_"
                                   + std::to_string(device());
            path_ = std::filesystem::temp_directory_path() / name;
            std::filesystem::create_directories(path_);
        }

        ~TempDir()
        {
            std::error_code ignored;
            std::filesystem::remove_all(path_, ignored);
        }

        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;

        [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    private:
        std::filesystem::path path_{};
    };

    inline void write_png(const std::filesystem::path& path, const cv::Mat& image)
    {
        std::filesystem::create_directories(path.parent_path());
        if (!cv::imwrite(path.string(), image)) {
            throw std::runtime_error("Failed to write test image " + path.string());
        }
    }

    // Predicts the same learnable (forward, reverse) field for every pixel of every pair.
    class ConstantFieldImpl final : public Model::PredictorImpl {
    public:
        static constexpr const char* kTag = "ConstantField";

        explicit ConstantFieldImpl(const std::vector<float>& field = {0.0f, 0.0f, 0.0f, 0.0f},
                                   Model::PredictorOptions options = {})
            : PredictorImpl(options)
        {
            field_ = register_parameter("field", torch::tensor(field).view({1, options.out_channels, 1, 1}));
        }

        torch::Tensor forward(torch::Tensor input) override
        {
            return field_.expand({input.size(0), field_.size(1), input.size(2), input.size(3)});
        }

        [[nodiscard]] std::string tag() const override { return kTag; }

        [[nodiscard]] const torch::Tensor& field() const noexcept { return field_; }

    private:
        torch::Tensor field_{};
    };

    inline Model::Predictor constant_field(const std::vector<float>& field = {0.0f, 0.0f, 0.0f, 0.0f})
    {
        return std::make_shared<ConstantFieldImpl>(field);
    }
}

#endif // DIFFEO_TEST_SUPPORT_HPP
