#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include <torch/torch.h>

#include "../include/Diffeo.h"

namespace {
    using Diffeo::Orientation::FlipRotation;
}

TEST(OrientationTest, InverseUndoesEveryGroupElement) {
    torch::manual_seed(3);
    const auto image = torch::rand({3, 6, 6});

    for (std::size_t index = 0; index < Diffeo::Orientation::kDihedralGroup.size(); ++index) {
        const auto element = Diffeo::Orientation::kDihedralGroup[index];
        const auto inverse = Diffeo::Orientation::kDihedralInverses[index];
        const auto round_trip = Diffeo::Orientation::Details::apply(Diffeo::Orientation::Details::apply(image, element), inverse);
        EXPECT_TRUE(torch::equal(round_trip, image)) << Diffeo::Orientation::Details::to_string(element);
    }
}

TEST(OrientationTest, FlipMirrorsWidthBeforeRotating) {
    const auto image = torch::arange(4, torch::kFloat32).view({1, 2, 2});

    const auto flipped = Diffeo::Orientation::Details::apply(image, FlipRotation{true, 0});
    const auto rotated = Diffeo::Orientation::Details::apply(image, FlipRotation{false, 1});

    EXPECT_TRUE(torch::equal(flipped, torch::tensor({1.0f, 0.0f, 3.0f, 2.0f}).view({1, 2, 2})));
    // rot90 counter-clockwise: top row becomes the right column read upwards.
    EXPECT_TRUE(torch::equal(rotated, torch::tensor({1.0f, 3.0f, 0.0f, 2.0f}).view({1, 2, 2})));
}

TEST(OrientationTest, IdenticalImagesSelectIdentity) {
    torch::manual_seed(7);
    const auto image = torch::rand({2, 3, 16, 16});

    const auto alignment = Diffeo::Orientation::BestAlignment(image, image.clone());

    ASSERT_EQ(alignment.forward.size(), 2u);
    for (std::size_t b = 0; b < 2; ++b) {
        EXPECT_EQ(alignment.candidate[b], 0u);
        EXPECT_EQ(alignment.forward[b], (FlipRotation{false, 0})) << Diffeo::Orientation::Details::to_string(alignment.forward[b]);
        EXPECT_EQ(alignment.reverse[b], (FlipRotation{false, 0}));
    }
    EXPECT_EQ(alignment.scores.sizes(), (torch::IntArrayRef{8, 2}));
}

TEST(OrientationTest, RecoversAppliedTransformPerSample) {
    torch::manual_seed(11);
    const auto fixed = torch::rand({2, 1, 16, 16});
    const std::vector<FlipRotation> distortions{FlipRotation{false, 1}, FlipRotation{true, 2}};
    const auto moving = Diffeo::Orientation::Apply(fixed, distortions);

    const auto alignment = Diffeo::Orientation::BestAlignment(fixed, moving);

    EXPECT_TRUE(torch::allclose(Diffeo::Orientation::Apply(moving, alignment.forward), fixed));
    EXPECT_TRUE(torch::allclose(Diffeo::Orientation::Apply(fixed, alignment.reverse), moving));
    EXPECT_EQ(alignment.forward[0], (FlipRotation{false, 3}));
    EXPECT_EQ(alignment.forward[1], (FlipRotation{true, 2}));
}

TEST(OrientationTest, RejectsMismatchedOrNonSquareInputs) {
    EXPECT_THROW((void)Diffeo::Orientation::BestAlignment(torch::rand({1, 1, 8, 8}), torch::rand({1, 1, 8, 6})),
                 std::invalid_argument);
    EXPECT_THROW((void)Diffeo::Orientation::Apply(torch::rand({1, 1, 8, 6}), {FlipRotation{false, 1}}),
                 std::invalid_argument);
    EXPECT_THROW((void)Diffeo::Orientation::Apply(torch::rand({2, 1, 8, 8}), {FlipRotation{false, 1}}),
                 std::invalid_argument);
}
