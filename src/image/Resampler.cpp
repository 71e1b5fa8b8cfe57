#include "image/Resampler.hpp"

#include <stdexcept>
#include <string>
#include <opencv2/imgproc.hpp>

namespace image {

core::ResizedImage Resampler::resize(const core::PackedImage& source,
                                     int targetWidth, int targetHeight) const {
    if (targetWidth <= 0 || targetHeight <= 0) {
        throw std::invalid_argument("Resampler: invalid target size " + std::to_string(targetWidth) +
                                    "x" + std::to_string(targetHeight));
    }
    if (source.pixels.empty()) {
        throw std::invalid_argument("Resampler: source image is empty");
    }

    core::ResizedImage resized;
    resized.placeholder = source.placeholder;

    if (source.width() == targetWidth && source.height() == targetHeight) {
        resized.pixels = source.pixels.clone();
        return resized;
    }

    cv::resize(source.pixels, resized.pixels, cv::Size(targetWidth, targetHeight),
               0.0, 0.0, cv::INTER_LINEAR);
    return resized;
}

} // namespace image
