/**
 * @file    image_io_test.cpp
 * @brief   Unit tests for image discovery, decoding and encoding
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include <gtest/gtest.h>
#include "core/image_io.hpp"
#include "test_helpers.hpp"

#include <opencv2/imgproc.hpp>

#include <vector>

namespace fs = std::filesystem;

namespace pwt {

class ImageIoTest : public ::testing::Test {
protected:
    test::TempDir temp_;
};

// =============================================================================
// Discovery Tests
// =============================================================================

TEST_F(ImageIoTest, SupportedExtensionsAreCaseInsensitive) {
    EXPECT_TRUE(is_supported_extension("photo.JPG"));
    EXPECT_TRUE(is_supported_extension("photo.jpeg"));
    EXPECT_TRUE(is_supported_extension("scan.TIFF"));
    EXPECT_TRUE(is_supported_extension("icon.Png"));
    EXPECT_FALSE(is_supported_extension("notes.txt"));
    EXPECT_FALSE(is_supported_extension("README"));
}

TEST_F(ImageIoTest, CollectWalksDirectoriesRecursively) {
    fs::create_directories(temp_ / "album/nested");
    test::write_png(temp_ / "album/b.png", test::solid_bgra(4, 4));
    test::write_png(temp_ / "album/a.png", test::solid_bgra(4, 4));
    test::write_png(temp_ / "album/nested/c.png", test::solid_bgra(4, 4));
    test::write_garbage(temp_ / "album/notes.txt");

    const std::vector<fs::path> inputs = {temp_ / "album"};
    const auto found = collect_images(inputs);

    ASSERT_EQ(found.size(), 3u);
    EXPECT_EQ(found[0].filename(), "a.png");
    EXPECT_EQ(found[1].filename(), "b.png");
    EXPECT_EQ(found[2].filename(), "c.png");
}

TEST_F(ImageIoTest, CollectDropsDuplicatesKeepingOrder) {
    test::write_png(temp_ / "x.png", test::solid_bgra(4, 4));
    test::write_png(temp_ / "y.png", test::solid_bgra(4, 4));

    const std::vector<fs::path> inputs = {
        temp_ / "y.png",
        temp_.path(),
        temp_.path() / "." / "x.png",
    };
    const auto found = collect_images(inputs);

    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0].filename(), "y.png");
    EXPECT_EQ(found[1].filename(), "x.png");
}

TEST_F(ImageIoTest, CollectSkipsMissingAndUnsupportedFiles) {
    test::write_garbage(temp_ / "doc.txt");

    const std::vector<fs::path> inputs = {temp_ / "missing.png", temp_ / "doc.txt"};
    EXPECT_TRUE(collect_images(inputs).empty());
}

// =============================================================================
// Decoding Tests
// =============================================================================

TEST_F(ImageIoTest, LoadConvertsBgrToBgra) {
    const auto path = temp_ / "rgb.png";
    test::write_png(path, test::gradient_bgr(32, 16));

    const cv::Mat image = load_image(path);
    EXPECT_EQ(image.type(), CV_8UC4);
    EXPECT_EQ(image.size(), cv::Size(32, 16));
    EXPECT_DOUBLE_EQ(test::channel_max(image, 3), 255.0);
}

TEST_F(ImageIoTest, LoadKeepsAlpha) {
    const auto path = temp_ / "alpha.png";
    test::write_png(path, cv::Mat(8, 8, CV_8UC4, cv::Scalar(1, 2, 3, 77)));

    const cv::Mat image = load_image(path);
    EXPECT_EQ(image.at<cv::Vec4b>(3, 3), cv::Vec4b(1, 2, 3, 77));
}

TEST_F(ImageIoTest, ToBgraHandlesGrayAndSixteenBit) {
    const cv::Mat gray(4, 4, CV_8UC1, cv::Scalar(90));
    EXPECT_EQ(to_bgra(gray).at<cv::Vec4b>(0, 0), cv::Vec4b(90, 90, 90, 255));

    const cv::Mat deep(4, 4, CV_16UC3, cv::Scalar(65535, 0, 257 * 10));
    EXPECT_EQ(to_bgra(deep).at<cv::Vec4b>(0, 0), cv::Vec4b(255, 0, 10, 255));
}

TEST_F(ImageIoTest, ToBgraScalesFloatSamples) {
    const cv::Mat unit(4, 4, CV_32FC3, cv::Scalar(1.0, 0.5, 0.0));
    EXPECT_EQ(to_bgra(unit).at<cv::Vec4b>(0, 0), cv::Vec4b(255, 128, 0, 255));

    const cv::Mat gray(4, 4, CV_64FC1, cv::Scalar(0.2));
    EXPECT_EQ(to_bgra(gray).at<cv::Vec4b>(0, 0), cv::Vec4b(51, 51, 51, 255));
}

TEST_F(ImageIoTest, ToBgraRejectsSignedDepth) {
    const cv::Mat signed_image(4, 4, CV_16SC3, cv::Scalar(100, 100, 100));
    try {
        (void)to_bgra(signed_image);
        FAIL() << "Expected WatermarkError";
    } catch (const WatermarkError& e) {
        EXPECT_EQ(e.code(), ErrorCode::LoadFailure);
    }
}

TEST_F(ImageIoTest, LoadFailsForCorruptFile) {
    const auto path = temp_ / "broken.jpg";
    test::write_garbage(path);

    try {
        (void)load_image(path);
        FAIL() << "Expected WatermarkError";
    } catch (const WatermarkError& e) {
        EXPECT_EQ(e.code(), ErrorCode::LoadFailure);
    }
}

TEST_F(ImageIoTest, LoadFailsForMissingFile) {
    EXPECT_THROW((void)load_image(temp_ / "nope.png"), WatermarkError);
}

// =============================================================================
// Preview Fit Tests
// =============================================================================

TEST_F(ImageIoTest, FitForPreviewDownscales) {
    const cv::Mat big = test::solid_bgra(1800, 1400);
    const cv::Mat fitted = fit_for_preview(big, {900, 700});
    EXPECT_EQ(fitted.size(), cv::Size(900, 700));
    EXPECT_EQ(fitted.type(), CV_8UC4);
}

TEST_F(ImageIoTest, FitForPreviewLeavesSmallImage) {
    const cv::Mat small = test::solid_bgra(300, 200);
    const cv::Mat fitted = fit_for_preview(small, {900, 700});
    EXPECT_EQ(fitted.data, small.data);
}

// =============================================================================
// Encoding Tests
// =============================================================================

TEST_F(ImageIoTest, PngIsLossless) {
    const auto path = temp_ / "out.png";
    cv::Mat image;
    cv::cvtColor(test::gradient_bgr(64, 48), image, cv::COLOR_BGR2BGRA);

    write_image(path, image, OutputFormat::Png, 90);
    EXPECT_EQ(test::diff_count(load_image(path), image), 0);
}

TEST_F(ImageIoTest, JpegDropsAlpha) {
    const auto path = temp_ / "out.jpg";
    write_image(path, test::solid_bgra(64, 48), OutputFormat::Jpeg, 85);

    const cv::Mat raw = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
    ASSERT_FALSE(raw.empty());
    EXPECT_EQ(raw.channels(), 3);
    EXPECT_EQ(raw.size(), cv::Size(64, 48));
}

TEST_F(ImageIoTest, WriteIntoMissingDirectoryFails) {
    const auto path = temp_ / "no_such_dir" / "out.png";
    try {
        write_image(path, test::solid_bgra(8, 8), OutputFormat::Png, 90);
        FAIL() << "Expected WatermarkError";
    } catch (const WatermarkError& e) {
        EXPECT_EQ(e.code(), ErrorCode::WriteFailure);
    }
}

}  // namespace pwt
