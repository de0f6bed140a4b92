#include <gtest/gtest.h>

#include <stdexcept>

#include <torch/torch.h>

#include "../include/Diffeo.h"

TEST(WarpTest, ZeroFieldIsIdentity) {
    torch::manual_seed(0);
    const auto image = torch::rand({2, 3, 8, 8});
    const auto field = torch::zeros({2, 2, 8, 8});

    const auto warped = Diffeo::Warp::Apply(image, field);

    EXPECT_EQ(warped.sizes(), image.sizes());
    EXPECT_TRUE(torch::allclose(warped, image, 1e-5, 1e-6));
}

TEST(WarpTest, IntegerRowShiftSamplesNextRowAndClampsAtBorder) {
    const auto image = torch::arange(16, torch::kFloat32).view({1, 1, 4, 4});
    auto field = torch::zeros({1, 2, 4, 4});
    field.select(1, 0).fill_(1.0);

    const auto warped = Diffeo::Warp::Apply(image, field);

    EXPECT_TRUE(torch::allclose(warped.narrow(2, 0, 3), image.narrow(2, 1, 3), 1e-4, 1e-5));
    EXPECT_TRUE(torch::allclose(warped.select(2, 3), image.select(2, 3), 1e-4, 1e-5));
}

TEST(WarpTest, ColumnChannelMovesAlongWidth) {
    const auto image = torch::arange(16, torch::kFloat32).view({1, 1, 4, 4});
    auto field = torch::zeros({1, 2, 4, 4});
    field.select(1, 1).fill_(-1.0);

    const auto warped = Diffeo::Warp::Apply(image, field);

    EXPECT_TRUE(torch::allclose(warped.narrow(3, 1, 3), image.narrow(3, 0, 3), 1e-4, 1e-5));
    EXPECT_TRUE(torch::allclose(warped.select(3, 0), image.select(3, 0), 1e-4, 1e-5));
}

TEST(WarpTest, IntegralImagesAreWarpedAsFloat) {
    const auto label = torch::ones({1, 1, 5, 5}, torch::kLong);
    const auto warped = Diffeo::Warp::Apply(label, torch::zeros({1, 2, 5, 5}));

    EXPECT_TRUE(warped.is_floating_point());
    EXPECT_TRUE(torch::allclose(warped, torch::ones({1, 1, 5, 5})));
}

TEST(WarpTest, RejectsMismatchedShapes) {
    const auto image = torch::rand({1, 3, 8, 8});

    EXPECT_THROW((void)Diffeo::Warp::Apply(image, torch::zeros({1, 2, 8, 7})), std::invalid_argument);
    EXPECT_THROW((void)Diffeo::Warp::Apply(image, torch::zeros({2, 2, 8, 8})), std::invalid_argument);
    EXPECT_THROW((void)Diffeo::Warp::Apply(image, torch::zeros({1, 3, 8, 8})), std::invalid_argument);
    EXPECT_THROW((void)Diffeo::Warp::Apply(torch::rand({3, 8, 8}), torch::zeros({1, 2, 8, 8})), std::invalid_argument);
}

TEST(WarpTest, SplitSeparatesForwardAndReverseFields) {
    const auto prediction = torch::arange(4, torch::kFloat32).view({1, 4, 1, 1}).expand({1, 4, 3, 3}).contiguous();

    const auto fields = Diffeo::Warp::Split(prediction);

    ASSERT_EQ(fields.forward.sizes(), (torch::IntArrayRef{1, 2, 3, 3}));
    ASSERT_EQ(fields.reverse.sizes(), (torch::IntArrayRef{1, 2, 3, 3}));
    EXPECT_FLOAT_EQ(fields.forward[0][1][0][0].item<float>(), 1.0f);
    EXPECT_FLOAT_EQ(fields.reverse[0][0][0][0].item<float>(), 2.0f);
    EXPECT_THROW((void)Diffeo::Warp::Split(torch::zeros({1, 3, 3, 3})), std::invalid_argument);
}
