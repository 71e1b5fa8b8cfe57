#pragma once

#include "core/Types.hpp"

namespace inference {

/**
 * Maps 8-bit RGB pixels into the model's float input domain:
 * out = (value - mean) / scale, applied identically to every channel.
 * Channel order (R,G,B) is kept as produced by the ColorConverter.
 */
class Preprocessor {
public:
    struct Config {
        float mean = core::DEFAULT_NORM_MEAN;
        float scale = core::DEFAULT_NORM_SCALE;
        core::TensorLayout layout = core::TensorLayout::NHWC;
    };

    /**
     * @throws core::ConfigurationError if scale is zero or not finite
     */
    explicit Preprocessor(const Config& config);
    Preprocessor() : Preprocessor(Config{}) {}

    /**
     * Produces a (1, H, W, 3) or (1, 3, H, W) tensor from image.
     * Deterministic: identical image and config give bit-identical output.
     */
    [[nodiscard]] core::InputTensor normalize(const core::ResizedImage& image) const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    Config config_;
};

} // namespace inference
