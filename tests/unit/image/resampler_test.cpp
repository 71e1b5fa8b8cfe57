#include "image/Resampler.hpp"

#include <stdexcept>

#include <gtest/gtest.h>

namespace image {
namespace {

[[nodiscard]] core::PackedImage makeImage(int width, int height, uint8_t value) {
    core::PackedImage image;
    image.pixels = cv::Mat(height, width, CV_8UC3, cv::Scalar(value, value, value));
    return image;
}

TEST(ResamplerTest, ProducesExactTargetSize) {
    const core::ResizedImage resized = Resampler().resize(makeImage(640, 480, 10), 224, 224);

    EXPECT_EQ(resized.width(), 224);
    EXPECT_EQ(resized.height(), 224);
    EXPECT_EQ(resized.pixels.type(), CV_8UC3);
}

TEST(ResamplerTest, UniformImageStaysUniform) {
    const core::ResizedImage resized = Resampler().resize(makeImage(64, 48, 77), 30, 20);

    EXPECT_EQ(cv::norm(resized.pixels, cv::Mat(20, 30, CV_8UC3, cv::Scalar(77, 77, 77)), cv::NORM_INF), 0.0);
}

TEST(ResamplerTest, SameSizeReturnsIndependentCopy) {
    const core::PackedImage source = makeImage(8, 8, 5);
    const core::ResizedImage resized = Resampler().resize(source, 8, 8);

    EXPECT_NE(resized.pixels.data, source.pixels.data);
    EXPECT_EQ(cv::norm(resized.pixels, source.pixels, cv::NORM_INF), 0.0);
}

TEST(ResamplerTest, PlaceholderIsUpscaledAndStaysMarked) {
    const core::ResizedImage resized = Resampler().resize(core::PackedImage::empty(), 224, 224);

    EXPECT_TRUE(resized.placeholder);
    EXPECT_EQ(resized.pixelCount(), 224U * 224U);
    EXPECT_EQ(resized.pixels.at<cv::Vec3b>(100, 100),
              cv::Vec3b(core::NEUTRAL_GRAY, core::NEUTRAL_GRAY, core::NEUTRAL_GRAY));
}

TEST(ResamplerTest, RejectsNonPositiveTarget) {
    const Resampler resampler;
    EXPECT_THROW((void)resampler.resize(makeImage(4, 4, 0), 0, 4), std::invalid_argument);
    EXPECT_THROW((void)resampler.resize(makeImage(4, 4, 0), 4, -1), std::invalid_argument);
    EXPECT_THROW((void)resampler.resize(core::PackedImage{}, 4, 4), std::invalid_argument);
}

} // namespace
} // namespace image
