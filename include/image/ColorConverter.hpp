#pragma once

#include "core/Types.hpp"
#include <vector>

namespace image {

/**
 * Planar YUV 4:2:0 → interleaved RGB.
 *
 * The chroma planes are first repacked into an NV21 buffer: the Y plane
 * followed by interleaved chroma pairs in V,U order. This order is a fixed
 * contract of both decode paths (Cr before Cb); writing U,V instead
 * swaps the red and blue color-difference terms.
 *
 * The default decode is full range (JFIF YCbCr, Y 0..255), the convention of
 * camera JPEG pipelines: R = Y + 1.402 (V - 128). YuvRange::Video selects
 * BT.601 studio range (Y 16..235) instead.
 *
 * Stateless after construction; safe to call from any thread.
 */
class ColorConverter {
public:
    enum class YuvRange {
        Full,
        Video
    };

    explicit ColorConverter(YuvRange range = YuvRange::Full);

    [[nodiscard]] YuvRange range() const { return range_; }

    /**
     * Converts frame to a W*H RGB image.
     * Frames without pixel data, or whose planes are too small for the
     * declared geometry, yield PackedImage::empty() instead of failing.
     */
    [[nodiscard]] core::PackedImage convert(const core::RawFrame& frame) const;

    /**
     * True if frame has pixel data and its planes cover the declared geometry.
     */
    [[nodiscard]] static bool isConvertible(const core::RawFrame& frame);

    /**
     * Repacks frame into NV21 of size evenW x evenH (W and H rounded up to
     * even), replicating the last row/column when rounding was needed.
     * Precondition: isConvertible(frame).
     */
    [[nodiscard]] static std::vector<uint8_t> toNv21(const core::RawFrame& frame);

private:
    // Nearest-neighbour chroma upsampling, then YCrCb → RGB
    static void decodeFullRange(std::vector<uint8_t>& nv21, int evenW, int evenH, cv::Mat& rgb);

    YuvRange range_;
};

} // namespace image
