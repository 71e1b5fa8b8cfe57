#include "core/Frame.hpp"

namespace core {

namespace {

int chromaExtent(int n) {
    return (n + 1) / 2;
}

} // namespace

size_t Frame::yuv420Size(int w, int h) {
    if (w <= 0 || h <= 0) return 0;
    const size_t lumaSize = static_cast<size_t>(w) * h;
    const size_t chromaSize = static_cast<size_t>(chromaExtent(w)) * chromaExtent(h);
    return lumaSize + 2 * chromaSize;
}

void Frame::setNv12Layout(int w, int h) {
    width = w;
    height = h;
    size = yuv420Size(w, h);

    const size_t lumaSize = static_cast<size_t>(w) * h;
    const int uvRowStride = chromaExtent(w) * 2;
    const size_t uvSize = static_cast<size_t>(uvRowStride) * chromaExtent(h);

    y = {0, lumaSize, w, 1};
    // U and V share one interleaved plane, V starts one byte later
    u = {lumaSize, uvSize, uvRowStride, 2};
    v = {lumaSize + 1, uvSize - 1, uvRowStride, 2};
}

void Frame::setNv21Layout(int w, int h) {
    width = w;
    height = h;
    size = yuv420Size(w, h);

    const size_t lumaSize = static_cast<size_t>(w) * h;
    const int vuRowStride = chromaExtent(w) * 2;
    const size_t vuSize = static_cast<size_t>(vuRowStride) * chromaExtent(h);

    y = {0, lumaSize, w, 1};
    v = {lumaSize, vuSize, vuRowStride, 2};
    u = {lumaSize + 1, vuSize - 1, vuRowStride, 2};
}

void Frame::setI420Layout(int w, int h) {
    width = w;
    height = h;
    size = yuv420Size(w, h);

    const size_t lumaSize = static_cast<size_t>(w) * h;
    const int cw = chromaExtent(w);
    const size_t chromaSize = static_cast<size_t>(cw) * chromaExtent(h);

    y = {0, lumaSize, w, 1};
    u = {lumaSize, chromaSize, cw, 1};
    v = {lumaSize + chromaSize, chromaSize, cw, 1};
}

void Frame::clearImage() {
    size = 0;
    width = 0;
    height = 0;
    y = {};
    u = {};
    v = {};
}

RawFrame Frame::view() const {
    RawFrame raw;
    raw.sequenceNum = sequenceNum;
    raw.timestamp = timestamp;

    if (size == 0 || !data || size > capacity) {
        // No pixel data: RawFrame::hasImage() reports false
        return raw;
    }

    const uint8_t* base = data.get();
    auto plane = [base](const PlaneLayout& layout) {
        PlaneView view;
        view.data = base + layout.offset;
        view.size = layout.size;
        view.rowStride = layout.rowStride;
        view.pixelStride = layout.pixelStride;
        return view;
    };

    raw.luma = plane(y);
    raw.chromaU = plane(u);
    raw.chromaV = plane(v);
    raw.width = width;
    raw.height = height;
    return raw;
}

} // namespace core
