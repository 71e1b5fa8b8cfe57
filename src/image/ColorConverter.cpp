/**
 * YUV 4:2:0 → RGB conversion
 *
 * Handles planar (I420), semi-planar (NV12/NV21) and strided sensor layouts
 * through the per-plane row/pixel strides of RawFrame.
 */

#include "image/ColorConverter.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <cstring>
#include <opencv2/imgproc.hpp>

namespace image {

namespace {

int roundUpEven(int n) {
    return (n + 1) & ~1;
}

// Bytes needed to address rows x cols samples with the plane's strides
size_t requiredBytes(const core::PlaneView& plane, int cols, int rows) {
    return static_cast<size_t>(plane.rowStride) * (rows - 1) +
           static_cast<size_t>(plane.pixelStride) * (cols - 1) + 1;
}

bool planeCovers(const core::PlaneView& plane, int cols, int rows) {
    if (!plane.data || plane.pixelStride < 1) return false;
    if (plane.rowStride < plane.pixelStride * (cols - 1) + 1) return false;
    return plane.size >= requiredBytes(plane, cols, rows);
}

} // namespace

bool ColorConverter::isConvertible(const core::RawFrame& frame) {
    if (!frame.hasImage()) return false;

    const int chromaW = (frame.width + 1) / 2;
    const int chromaH = (frame.height + 1) / 2;

    return planeCovers(frame.luma, frame.width, frame.height) &&
           planeCovers(frame.chromaU, chromaW, chromaH) &&
           planeCovers(frame.chromaV, chromaW, chromaH);
}

std::vector<uint8_t> ColorConverter::toNv21(const core::RawFrame& frame) {
    const int w = frame.width;
    const int h = frame.height;
    const int evenW = roundUpEven(w);
    const int evenH = roundUpEven(h);
    const size_t lumaSize = static_cast<size_t>(evenW) * evenH;

    std::vector<uint8_t> nv21(lumaSize + lumaSize / 2);

    // Y plane, row by row (row stride may exceed width)
    for (int row = 0; row < evenH; ++row) {
        const int srcRow = std::min(row, h - 1);
        const uint8_t* src = frame.luma.data + static_cast<size_t>(srcRow) * frame.luma.rowStride;
        uint8_t* dst = nv21.data() + static_cast<size_t>(row) * evenW;

        if (frame.luma.pixelStride == 1) {
            std::memcpy(dst, src, w);
        } else {
            for (int col = 0; col < w; ++col) {
                dst[col] = src[static_cast<size_t>(col) * frame.luma.pixelStride];
            }
        }
        if (evenW != w) {
            dst[w] = dst[w - 1];
        }
    }

    // Chroma: interleave as V,U
    const int chromaW = evenW / 2;
    const int chromaH = evenH / 2;
    uint8_t* vu = nv21.data() + lumaSize;

    for (int row = 0; row < chromaH; ++row) {
        const uint8_t* uRow = frame.chromaU.data + static_cast<size_t>(row) * frame.chromaU.rowStride;
        const uint8_t* vRow = frame.chromaV.data + static_cast<size_t>(row) * frame.chromaV.rowStride;
        uint8_t* dst = vu + static_cast<size_t>(row) * evenW;

        for (int col = 0; col < chromaW; ++col) {
            dst[2 * col + 0] = vRow[static_cast<size_t>(col) * frame.chromaV.pixelStride];
            dst[2 * col + 1] = uRow[static_cast<size_t>(col) * frame.chromaU.pixelStride];
        }
    }

    return nv21;
}

ColorConverter::ColorConverter(YuvRange range) : range_(range) {}

void ColorConverter::decodeFullRange(std::vector<uint8_t>& nv21, int evenW, int evenH, cv::Mat& rgb) {
    const size_t lumaSize = static_cast<size_t>(evenW) * evenH;
    cv::Mat luma(evenH, evenW, CV_8UC1, nv21.data());
    // Channel 0 is V (Cr), channel 1 is U (Cb)
    cv::Mat vu(evenH / 2, evenW / 2, CV_8UC2, nv21.data() + lumaSize);

    cv::Mat vuFull;
    cv::resize(vu, vuFull, cv::Size(evenW, evenH), 0.0, 0.0, cv::INTER_NEAREST);

    cv::Mat chroma[2];
    cv::split(vuFull, chroma);

    // Y, Cr, Cb is the channel order COLOR_YCrCb2RGB expects
    cv::Mat ycrcb;
    cv::merge(std::vector<cv::Mat>{luma, chroma[0], chroma[1]}, ycrcb);
    cv::cvtColor(ycrcb, rgb, cv::COLOR_YCrCb2RGB);
}

core::PackedImage ColorConverter::convert(const core::RawFrame& frame) const {
    if (!isConvertible(frame)) {
        if (frame.hasImage()) {
            core::Logger::debug("ColorConverter: planes too small for ", frame.width, "x", frame.height,
                               " (seq=", frame.sequenceNum, "), using placeholder");
        } else {
            core::Logger::debug("ColorConverter: frame seq=", frame.sequenceNum, " has no image");
        }
        return core::PackedImage::empty();
    }

    std::vector<uint8_t> nv21 = toNv21(frame);

    const int evenW = roundUpEven(frame.width);
    const int evenH = roundUpEven(frame.height);

    core::PackedImage image;
    if (range_ == YuvRange::Video) {
        // NV21 as a single-channel matrix: evenH rows of Y, evenH/2 rows of VU
        cv::Mat yuv(evenH + evenH / 2, evenW, CV_8UC1, nv21.data());
        cv::cvtColor(yuv, image.pixels, cv::COLOR_YUV2RGB_NV21);
    } else {
        decodeFullRange(nv21, evenW, evenH, image.pixels);
    }

    if (evenW != frame.width || evenH != frame.height) {
        image.pixels = image.pixels(cv::Rect(0, 0, frame.width, frame.height)).clone();
    }

    return image;
}

} // namespace image
