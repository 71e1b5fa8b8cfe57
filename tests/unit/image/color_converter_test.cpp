#include "image/ColorConverter.hpp"

#include <cstdlib>

#include <gtest/gtest.h>

#include "core/FramePool.hpp"
#include "support/TestFrames.hpp"

namespace image {
namespace {

using testing_support::PlanarFrame;

[[nodiscard]] cv::Vec3b pixelAt(const core::PackedImage& image, int x, int y) {
    return image.pixels.at<cv::Vec3b>(y, x);
}

TEST(ColorConverterTest, OutputHasFrameGeometry) {
    const PlanarFrame frame(640, 480, 128, 128, 128);

    const core::PackedImage image = ColorConverter().convert(frame.view());

    EXPECT_FALSE(image.placeholder);
    EXPECT_EQ(image.width(), 640);
    EXPECT_EQ(image.height(), 480);
    EXPECT_EQ(image.pixelCount(), 640U * 480U);
    EXPECT_EQ(image.pixels.type(), CV_8UC3);
}

TEST(ColorConverterTest, NeutralChromaGivesGray) {
    const PlanarFrame frame(16, 16, 128, 128, 128);

    const cv::Vec3b p = pixelAt(ColorConverter().convert(frame.view()), 5, 5);

    EXPECT_LE(std::abs(p[0] - p[1]), 2);
    EXPECT_LE(std::abs(p[1] - p[2]), 2);
}

TEST(ColorConverterTest, FullRangeKeepsLumaLevels) {
    const ColorConverter converter;
    ASSERT_EQ(converter.range(), ColorConverter::YuvRange::Full);

    for (const int luma : {16, 128, 235}) {
        const PlanarFrame frame(16, 16, static_cast<uint8_t>(luma), 128, 128);
        const cv::Vec3b p = pixelAt(converter.convert(frame.view()), 7, 7);
        for (int c = 0; c < 3; ++c) {
            EXPECT_LE(std::abs(p[c] - luma), 1) << "luma " << luma << " channel " << c;
        }
    }
}

TEST(ColorConverterTest, FullRangeRedMatchesJfifCoefficient) {
    // R = Y + 1.402 (V - 128) = 100 + 1.402 * 50 = 170.1
    const PlanarFrame frame(16, 16, 100, 128, 178);

    const cv::Vec3b p = pixelAt(ColorConverter().convert(frame.view()), 7, 7);

    EXPECT_LE(std::abs(p[0] - 170), 1);
    EXPECT_LE(std::abs(p[2] - 100), 1);
}

TEST(ColorConverterTest, VideoRangeStretchesLuma) {
    const ColorConverter converter(ColorConverter::YuvRange::Video);

    const cv::Vec3b black = pixelAt(converter.convert(PlanarFrame(16, 16, 16, 128, 128).view()), 7, 7);
    const cv::Vec3b white = pixelAt(converter.convert(PlanarFrame(16, 16, 235, 128, 128).view()), 7, 7);

    EXPECT_LE(black[1], 1);
    EXPECT_GE(white[1], 254);
}

TEST(ColorConverterTest, HighVIsRedDominant) {
    // V drives the red difference term; swapping U/V would make this blue
    const PlanarFrame frame(16, 16, 128, 128, 255);

    const cv::Vec3b p = pixelAt(ColorConverter().convert(frame.view()), 8, 8);

    EXPECT_GT(p[0], p[1]);
    EXPECT_GT(p[0], p[2]);
}

TEST(ColorConverterTest, HighUIsBlueDominant) {
    const PlanarFrame frame(16, 16, 128, 255, 128);

    const cv::Vec3b p = pixelAt(ColorConverter().convert(frame.view()), 8, 8);

    EXPECT_GT(p[2], p[0]);
    EXPECT_GT(p[2], p[1]);
}

TEST(ColorConverterTest, ChromaIsInterleavedVThenU) {
    const PlanarFrame frame(4, 2, 100, 11, 22);

    const std::vector<uint8_t> nv21 = ColorConverter::toNv21(frame.view());

    ASSERT_EQ(nv21.size(), 4U * 2U * 3U / 2U);
    EXPECT_EQ(nv21[8], 22);
    EXPECT_EQ(nv21[9], 11);
    EXPECT_EQ(nv21[10], 22);
    EXPECT_EQ(nv21[11], 11);
}

TEST(ColorConverterTest, OddDimensionsAreKept) {
    const PlanarFrame frame(5, 3, 128, 128, 255);

    const core::PackedImage image = ColorConverter().convert(frame.view());

    EXPECT_EQ(image.width(), 5);
    EXPECT_EQ(image.height(), 3);
    const cv::Vec3b corner = pixelAt(image, 4, 2);
    EXPECT_GT(corner[0], corner[2]);
}

TEST(ColorConverterTest, FrameWithoutImageYieldsPlaceholder) {
    const core::RawFrame empty;

    const core::PackedImage image = ColorConverter().convert(empty);

    EXPECT_TRUE(image.placeholder);
    EXPECT_EQ(image.pixelCount(), 1U);
    EXPECT_EQ(pixelAt(image, 0, 0), cv::Vec3b(core::NEUTRAL_GRAY, core::NEUTRAL_GRAY, core::NEUTRAL_GRAY));
}

TEST(ColorConverterTest, TruncatedChromaYieldsPlaceholder) {
    const PlanarFrame frame(16, 16, 128, 128, 128);
    core::RawFrame raw = frame.view();
    raw.chromaV.size = 10;

    EXPECT_FALSE(ColorConverter::isConvertible(raw));
    EXPECT_TRUE(ColorConverter().convert(raw).placeholder);
}

TEST(ColorConverterTest, SemiPlanarAndPlanarInputsAgree) {
    PlanarFrame planar(32, 24, 90, 100, 200);
    for (size_t i = 0; i < planar.y.size(); ++i) {
        planar.y[i] = static_cast<uint8_t>(i * 7);
    }
    for (size_t i = 0; i < planar.u.size(); ++i) {
        planar.u[i] = static_cast<uint8_t>(60 + i);
        planar.v[i] = static_cast<uint8_t>(220 - i);
    }

    core::FramePool pool(1, core::Frame::yuv420Size(32, 24));
    core::FrameHandle handle = pool.acquire();
    ASSERT_TRUE(handle);
    testing_support::fillNv12(*handle, planar);

    const ColorConverter converter;
    const core::PackedImage fromPlanar = converter.convert(planar.view());
    const core::PackedImage fromNv12 = converter.convert(handle->view());

    ASSERT_EQ(fromPlanar.pixels.size(), fromNv12.pixels.size());
    EXPECT_EQ(cv::norm(fromPlanar.pixels, fromNv12.pixels, cv::NORM_INF), 0.0);
}

} // namespace
} // namespace image
