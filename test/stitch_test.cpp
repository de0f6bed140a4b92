#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>
#include <stdexcept>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include "../include/Diffeo.h"
#include "support.hpp"

namespace {
    Diffeo::Stitch::StitchOptions small_canvas(std::ostream& stream) {
        Diffeo::Stitch::StitchOptions options;
        options.canvas_rows = 48;
        options.canvas_cols = 48;
        options.patch_size = 32;
        options.stream = &stream;
        return options;
    }
}

TEST(PatchNameTest, ParsesOffsetsAndStripsToken) {
    const auto name = Diffeo::Stitch::ParsePatchName("slide_07_H-5_W12.png");

    EXPECT_EQ(name.base_id, "slide_07");
    EXPECT_EQ(name.row_offset, -5);
    EXPECT_EQ(name.col_offset, 12);
}

TEST(PatchNameTest, KeepsTextAfterTheToken) {
    const auto name = Diffeo::Stitch::ParsePatchName("/data/pred/organ_H64_W0_mask.png");

    EXPECT_EQ(name.base_id, "organ_mask");
    EXPECT_EQ(name.row_offset, 64);
    EXPECT_EQ(name.col_offset, 0);
}

TEST(PatchNameTest, RequiresExactlyOneOffsetToken) {
    EXPECT_THROW((void)Diffeo::Stitch::ParsePatchName("slide.png"), std::invalid_argument);
    EXPECT_THROW((void)Diffeo::Stitch::ParsePatchName("slide_H1_W2_H3_W4.png"), std::invalid_argument);
}

TEST(CanvasTest, NegativeOffsetCropsLeadingRows) {
    const auto placement = Diffeo::Stitch::Details::place(-5, 0, 32, 48, 48);

    EXPECT_EQ(placement.start_row, 0);
    EXPECT_EQ(placement.end_row, 27);
    EXPECT_EQ(placement.crop_row, 5);
    EXPECT_EQ(placement.start_col, 0);
    EXPECT_EQ(placement.end_col, 32);
    EXPECT_EQ(placement.crop_col, 0);
}

TEST(CanvasTest, CanvasBorderClipsTrailingPixels) {
    const auto placement = Diffeo::Stitch::Details::place(40, 20, 32, 48, 48);

    EXPECT_EQ(placement.rows(), 8);
    EXPECT_EQ(placement.cols(), 28);
    EXPECT_TRUE(Diffeo::Stitch::Details::place(60, 0, 32, 48, 48).empty());
    EXPECT_TRUE(Diffeo::Stitch::Details::place(-40, 0, 32, 48, 48).empty());
}

TEST(CanvasTest, MaximumPolicyKeepsLargerValues) {
    cv::Mat canvas(4, 4, CV_8UC1, cv::Scalar(3));
    const cv::Mat patch(4, 4, CV_8UC1, cv::Scalar(2));
    const auto placement = Diffeo::Stitch::Details::place(0, 0, 4, 4, 4);

    ASSERT_TRUE(Diffeo::Stitch::Details::paste(canvas, patch, placement, Diffeo::Stitch::OverlapPolicy::Maximum));
    EXPECT_EQ(cv::countNonZero(canvas != 3), 0);

    ASSERT_TRUE(Diffeo::Stitch::Details::paste(canvas, patch, placement, Diffeo::Stitch::OverlapPolicy::Overwrite));
    EXPECT_EQ(cv::countNonZero(canvas != 2), 0);
}

TEST(StitchTest, LaterPatchOverwritesOverlap) {
    Diffeo::Test::TempDir scratch;
    const auto patches = scratch.path() / "pred_patches";
    Diffeo::Test::write_png(patches / "slide_H0_W0.png", cv::Mat(32, 32, CV_8UC1, cv::Scalar(1)));
    Diffeo::Test::write_png(patches / "slide_H0_W16.png", cv::Mat(32, 32, CV_8UC1, cv::Scalar(2)));

    std::ostringstream log;
    const auto result = Diffeo::Stitch::Run(patches, small_canvas(log));

    ASSERT_EQ(result.canvases.size(), 1u);
    EXPECT_EQ(result.canvases.front().first, "slide");
    EXPECT_EQ(result.patch_count, 2u);
    const auto& canvas = result.canvases.front().second;
    EXPECT_EQ(cv::countNonZero(canvas(cv::Rect(0, 0, 16, 32)) != 1), 0);
    EXPECT_EQ(cv::countNonZero(canvas(cv::Rect(16, 0, 32, 32)) != 2), 0);
    EXPECT_EQ(cv::countNonZero(canvas(cv::Rect(0, 32, 48, 16))), 0);

    EXPECT_EQ(result.output_folder, scratch.path() / "stitched_labels");
    EXPECT_EQ(result.colored_folder, scratch.path() / "colored_stitched_labels");
    const auto written = cv::imread((result.output_folder / "slide.png").string(), cv::IMREAD_GRAYSCALE);
    ASSERT_FALSE(written.empty());
    EXPECT_EQ(cv::countNonZero(written != canvas), 0);

    const auto colored = cv::imread((result.colored_folder / "slide.png").string(), cv::IMREAD_COLOR);
    ASSERT_FALSE(colored.empty());
    EXPECT_EQ(colored.at<cv::Vec3b>(0, 0), cv::Vec3b(0, 255, 0));
    EXPECT_EQ(colored.at<cv::Vec3b>(40, 40), cv::Vec3b(0, 0, 0));
    EXPECT_NE(log.str().find("Done stitching 2 patches. Stitched: 1."), std::string::npos);
}

TEST(StitchTest, NegativeRowOffsetLandsCroppedRowsAtTop) {
    Diffeo::Test::TempDir scratch;
    const auto patches = scratch.path() / "pred_patches";
    cv::Mat patch(32, 32, CV_8UC1);
    for (int row = 0; row < 32; ++row) {
        patch.row(row).setTo(row + 1);
    }
    Diffeo::Test::write_png(patches / "slide_H-5_W0.png", patch);

    std::ostringstream log;
    const auto result = Diffeo::Stitch::Run(patches, small_canvas(log));

    const auto& canvas = result.canvases.front().second;
    for (int row = 0; row < 27; ++row) {
        EXPECT_EQ(canvas.at<unsigned char>(row, 0), row + 6) << "row " << row;
    }
    EXPECT_EQ(cv::countNonZero(canvas(cv::Rect(0, 27, 48, 21))), 0);
}

TEST(StitchTest, GroupsPatchesByBaseIdentifier) {
    Diffeo::Test::TempDir scratch;
    const auto patches = scratch.path() / "pred_patches";
    Diffeo::Test::write_png(patches / "a_H0_W0.png", cv::Mat(32, 32, CV_8UC1, cv::Scalar(1)));
    Diffeo::Test::write_png(patches / "b_H16_W16.png", cv::Mat(32, 32, CV_8UC1, cv::Scalar(1)));

    std::ostringstream log;
    const auto result = Diffeo::Stitch::Run(patches, small_canvas(log));

    ASSERT_EQ(result.canvases.size(), 2u);
    EXPECT_EQ(result.canvases[0].first, "a");
    EXPECT_EQ(result.canvases[1].first, "b");
    EXPECT_EQ(cv::countNonZero(result.canvases[1].second), 32 * 32);
    EXPECT_EQ(result.canvases[1].second.at<unsigned char>(15, 15), 0);
    EXPECT_TRUE(std::filesystem::exists(result.output_folder / "a.png"));
    EXPECT_TRUE(std::filesystem::exists(result.output_folder / "b.png"));
}

TEST(StitchTest, MissingFolderThrows) {
    Diffeo::Test::TempDir scratch;
    std::ostringstream log;

    EXPECT_THROW((void)Diffeo::Stitch::Run(scratch.path() / "absent", small_canvas(log)), std::runtime_error);
}
