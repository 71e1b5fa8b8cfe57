#pragma once

#include <cstdint>
#include <cstring>
#include <vector>

#include "core/Frame.hpp"

namespace testing_support {

/**
 * Planar (I420) test image with uniform Y, U and V values.
 * Owns its planes; view() stays valid while the object lives.
 */
struct PlanarFrame {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> y;
    std::vector<uint8_t> u;
    std::vector<uint8_t> v;

    PlanarFrame(int w, int h, uint8_t luma, uint8_t cb, uint8_t cr)
        : width(w), height(h),
          y(static_cast<size_t>(w) * h, luma),
          u(static_cast<size_t>((w + 1) / 2) * ((h + 1) / 2), cb),
          v(static_cast<size_t>((w + 1) / 2) * ((h + 1) / 2), cr) {}

    [[nodiscard]] core::RawFrame view() const {
        const int chromaW = (width + 1) / 2;
        core::RawFrame frame;
        frame.width = width;
        frame.height = height;
        frame.luma = {y.data(), y.size(), width, 1};
        frame.chromaU = {u.data(), u.size(), chromaW, 1};
        frame.chromaV = {v.data(), v.size(), chromaW, 1};
        return frame;
    }
};

// Writes src into frame as NV12 (Y plane, then U,V pairs)
inline void fillNv12(core::Frame& frame, const PlanarFrame& src) {
    const size_t lumaSize = src.y.size();
    std::memcpy(frame.data.get(), src.y.data(), lumaSize);
    uint8_t* uv = frame.data.get() + lumaSize;
    for (size_t i = 0; i < src.u.size(); ++i) {
        uv[2 * i + 0] = src.u[i];
        uv[2 * i + 1] = src.v[i];
    }
    frame.setNv12Layout(src.width, src.height);
}

} // namespace testing_support
