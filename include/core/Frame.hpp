#pragma once

#include <memory>
#include <cstdint>
#include <cstddef>
#include <chrono>
#include "core/MemoryUtils.hpp"

namespace core {

/**
 * Read-only view of one image plane.
 * rowStride is the byte distance between rows, pixelStride the byte distance
 * between two samples of the same row (1 = planar, 2 = semi-planar UV/VU).
 */
struct PlaneView {
    const uint8_t* data = nullptr;
    size_t size = 0;
    int rowStride = 0;
    int pixelStride = 1;
};

/**
 * Planar YUV 4:2:0 frame as delivered by the frame source.
 * Chroma planes hold ceil(width/2) x ceil(height/2) samples.
 * The view does not own its planes; see Frame and FrameHandle.
 */
struct RawFrame {
    PlaneView luma;
    PlaneView chromaU;
    PlaneView chromaV;

    int width = 0;
    int height = 0;

    uint32_t sequenceNum = 0;
    std::chrono::steady_clock::time_point timestamp;

    [[nodiscard]] bool hasImage() const {
        return luma.data != nullptr && luma.size > 0 && width > 0 && height > 0;
    }
};

/**
 * Pooled frame storage.
 *
 * Holds one aligned byte buffer sized for the largest expected frame plus the
 * plane layout describing how the currently stored image is arranged in it.
 * Frames are handed around as FrameHandle and never copied.
 */
struct Frame {
    // ═══════════════════════════════════════════════════════════
    // Buffer
    // ═══════════════════════════════════════════════════════════

    std::unique_ptr<uint8_t, AlignedDeleter> data;
    size_t capacity = 0;       // Allocated bytes
    size_t size = 0;           // Bytes of the stored image (0 = no image)

    // ═══════════════════════════════════════════════════════════
    // Geometry / Plane layout (offsets into data)
    // ═══════════════════════════════════════════════════════════

    int width = 0;
    int height = 0;

    struct PlaneLayout {
        size_t offset = 0;
        size_t size = 0;
        int rowStride = 0;
        int pixelStride = 1;
    };

    PlaneLayout y;
    PlaneLayout u;
    PlaneLayout v;

    uint32_t sequenceNum = 0;
    std::chrono::time_point<std::chrono::steady_clock> timestamp; // Host arrival

    Frame() = default;
    Frame(Frame&&) = default;
    Frame& operator=(Frame&&) = default;
    Frame(const Frame&) = delete;
    Frame& operator=(const Frame&) = delete;

    /**
     * Describes the buffer as NV12 (Y plane, then interleaved U,V).
     * The caller must already have written width*height*3/2 bytes (rounded
     * up for odd sizes) into data.
     */
    void setNv12Layout(int w, int h);

    /**
     * Describes the buffer as NV21 (Y plane, then interleaved V,U).
     */
    void setNv21Layout(int w, int h);

    /**
     * Describes the buffer as I420 (Y plane, U plane, V plane).
     */
    void setI420Layout(int w, int h);

    /**
     * Marks the frame as carrying no pixel data (capture failure).
     */
    void clearImage();

    /**
     * Number of bytes a 4:2:0 image of the given size occupies.
     */
    static size_t yuv420Size(int w, int h);

    [[nodiscard]] RawFrame view() const;
};

} // namespace core
