#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <vector>

#include <opencv2/core.hpp>
#include <torch/torch.h>

#include "../include/Diffeo.h"

namespace Metric = Diffeo::Metric;

namespace {
    // Top half of a 32x32 map set, against a fully set map.
    std::pair<torch::Tensor, torch::Tensor> half_against_full() {
        auto prediction = torch::zeros({32, 32});
        prediction.narrow(0, 0, 16).fill_(1.0);
        return {prediction, torch::ones({32, 32})};
    }
}

TEST(MetricTest, HalfCoverageDiceAndIoU) {
    const auto [prediction, truth] = half_against_full();

    EXPECT_NEAR(Metric::Details::dice(prediction, truth), 2.0 / 3.0, 1e-3);
    EXPECT_NEAR(Metric::Details::iou(prediction, truth), 0.5, 1e-9);
    EXPECT_NEAR(Metric::Details::pixel_f1(prediction, truth), 2.0 / 3.0, 1e-9);
}

TEST(MetricTest, OverlapMetricsAreSymmetric) {
    torch::manual_seed(9);
    const auto a = torch::rand({16, 16}).gt(0.5);
    const auto b = torch::rand({16, 16}).gt(0.4);

    EXPECT_DOUBLE_EQ(Metric::Details::dice(a, b), Metric::Details::dice(b, a));
    EXPECT_DOUBLE_EQ(Metric::Details::iou(a, b), Metric::Details::iou(b, a));
}

TEST(MetricTest, EmptyMasksGiveNaN) {
    const auto empty = torch::zeros({8, 8});

    EXPECT_TRUE(std::isnan(Metric::Details::dice(empty, empty)));
    EXPECT_TRUE(std::isnan(Metric::Details::iou(empty, empty)));
    EXPECT_DOUBLE_EQ(Metric::Details::dice(empty, torch::ones({8, 8})), 0.0);
}

TEST(MetricTest, L1IsMeanAbsoluteDifference) {
    const auto prediction = torch::tensor({0.0f, 0.5f, 1.0f, 1.0f});
    const auto truth = torch::tensor({0.0f, 1.0f, 0.0f, 1.0f});

    EXPECT_NEAR(Metric::Details::l1(prediction, truth), 0.375, 1e-9);
}

TEST(MetricTest, ShapeMismatchThrows) {
    EXPECT_THROW((void)Metric::Details::dice(torch::zeros({4, 4}), torch::zeros({4, 5})), std::invalid_argument);
    EXPECT_THROW((void)Metric::Details::evaluate(Metric::Kind::IoU, cv::Mat::zeros(4, 4, CV_8UC1), cv::Mat::zeros(5, 4, CV_8UC1)),
                 std::invalid_argument);
}

TEST(MetricTest, PerSampleEvaluatesEachBatchElement) {
    auto prediction = torch::zeros({2, 1, 4, 4});
    prediction[0].fill_(1.0);
    const auto truth = torch::ones({2, 1, 4, 4});

    const auto values = Metric::Details::per_sample(Metric::Kind::Dice, prediction, truth);

    ASSERT_EQ(values.size(), 2u);
    EXPECT_DOUBLE_EQ(values[0], 1.0);
    EXPECT_DOUBLE_EQ(values[1], 0.0);
}

TEST(MetricTest, AggregatedJaccardCountsMissedInstances) {
    cv::Mat truth = cv::Mat::zeros(10, 10, CV_8UC1);
    truth(cv::Rect(0, 0, 3, 3)).setTo(1);
    truth(cv::Rect(6, 6, 3, 3)).setTo(1);

    cv::Mat partial = cv::Mat::zeros(10, 10, CV_8UC1);
    partial(cv::Rect(0, 0, 3, 3)).setTo(1);

    EXPECT_DOUBLE_EQ(Metric::Details::aggregated_jaccard(truth, truth), 1.0);
    EXPECT_DOUBLE_EQ(Metric::Details::aggregated_jaccard(partial, truth), 0.5);
    EXPECT_DOUBLE_EQ(Metric::Details::evaluate(Metric::Kind::AggregatedJaccard, partial, truth), 0.5);
    EXPECT_THROW((void)Metric::Details::evaluate(Metric::Kind::AggregatedJaccard, torch::ones({2, 2}), torch::ones({2, 2})),
                 std::invalid_argument);
}

TEST(MetricTest, AggregatedJaccardIgnoresBinaryEncoding) {
    cv::Mat truth = cv::Mat::zeros(10, 10, CV_8UC1);
    truth(cv::Rect(0, 0, 3, 3)).setTo(255);
    truth(cv::Rect(6, 6, 3, 3)).setTo(255);

    cv::Mat prediction = cv::Mat::zeros(10, 10, CV_8UC1);
    prediction(cv::Rect(0, 0, 3, 3)).setTo(1);
    prediction(cv::Rect(6, 6, 3, 3)).setTo(1);

    EXPECT_DOUBLE_EQ(Metric::Details::aggregated_jaccard(prediction, truth), 1.0);
    EXPECT_DOUBLE_EQ(Metric::Details::aggregated_jaccard(truth, prediction), 1.0);
}

TEST(MetricTest, AggregatedJaccardReadsSeveralValuesAsInstanceIds) {
    cv::Mat truth = cv::Mat::zeros(10, 10, CV_8UC1);
    truth(cv::Rect(0, 0, 6, 3)).setTo(1);
    truth(cv::Rect(3, 0, 3, 3)).setTo(2);

    cv::Mat prediction = cv::Mat::zeros(10, 10, CV_8UC1);
    prediction(cv::Rect(0, 0, 6, 3)).setTo(1);

    // Both touching instances pair with the merged component: (9 + 9) / (18 + 18).
    EXPECT_DOUBLE_EQ(Metric::Details::aggregated_jaccard(prediction, truth), 0.5);
}

TEST(MetricTest, NamesRoundTripThroughConfigurationSpelling) {
    EXPECT_EQ(Metric::Details::from_name("p_F1"), Metric::Kind::PixelF1);
    EXPECT_EQ(Metric::Details::from_name("aji"), Metric::Kind::AggregatedJaccard);
    EXPECT_EQ(Metric::Details::from_name("DSC"), Metric::Kind::Dice);
    EXPECT_EQ(Metric::Details::name_of(Metric::Kind::IoU), "iou");
    EXPECT_THROW((void)Metric::Details::from_name("hausdorff"), std::invalid_argument);
}

TEST(MetricTest, SummaryUsesPopulationStandardDeviation) {
    const auto summary = Metric::Details::summarize({1.0, 3.0});

    EXPECT_DOUBLE_EQ(summary.mean, 2.0);
    EXPECT_DOUBLE_EQ(summary.stddev, 1.0);
    EXPECT_EQ(Metric::Details::format(summary), "2.000 \xC2\xB1 1.000");
    EXPECT_TRUE(std::isnan(Metric::Details::summarize({}).mean));
}
