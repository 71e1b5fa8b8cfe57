#include "inference/Preprocessor.hpp"
#include "core/PipelineError.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace inference {

Preprocessor::Preprocessor(const Config& config) : config_(config) {
    if (config_.scale == 0.0f || !std::isfinite(config_.scale) || !std::isfinite(config_.mean)) {
        throw core::ConfigurationError("invalid normalization mean=" + std::to_string(config_.mean) +
                                       " scale=" + std::to_string(config_.scale));
    }
}

core::InputTensor Preprocessor::normalize(const core::ResizedImage& image) const {
    if (image.pixels.empty() || image.pixels.type() != CV_8UC3) {
        throw std::invalid_argument("Preprocessor: expected a non-empty 8-bit RGB image");
    }

    const int width = image.width();
    const int height = image.height();
    const int planeSize = width * height;

    core::InputTensor tensor;
    tensor.shape.batch = 1;
    tensor.shape.height = height;
    tensor.shape.width = width;
    tensor.shape.channels = core::INPUT_CHANNELS;
    tensor.shape.layout = config_.layout;
    tensor.data.resize(static_cast<size_t>(planeSize) * core::INPUT_CHANNELS);

    const float mean = config_.mean;
    const float scale = config_.scale;
    float* out = tensor.data.data();

    for (int y = 0; y < height; ++y) {
        const uint8_t* row = image.pixels.ptr<uint8_t>(y);
        for (int x = 0; x < width; ++x) {
            const int pixel = y * width + x;
            for (int c = 0; c < core::INPUT_CHANNELS; ++c) {
                const float value = (static_cast<float>(row[x * core::INPUT_CHANNELS + c]) - mean) / scale;
                if (config_.layout == core::TensorLayout::NHWC) {
                    out[pixel * core::INPUT_CHANNELS + c] = value;
                } else {
                    out[c * planeSize + pixel] = value;
                }
            }
        }
    }

    return tensor;
}

} // namespace inference
