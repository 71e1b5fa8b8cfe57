#pragma once

#include "core/Types.hpp"

namespace image {

/**
 * Bilinear resize to an exact target size.
 * Aspect ratio is not preserved; the output is always targetWidth x targetHeight.
 */
class Resampler {
public:
    /**
     * @throws std::invalid_argument if a target dimension is not positive
     */
    [[nodiscard]] core::ResizedImage resize(const core::PackedImage& source,
                                            int targetWidth, int targetHeight) const;
};

} // namespace image
