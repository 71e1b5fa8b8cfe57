#pragma once

#include <chrono>
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "Frame.hpp"
#include "FramePool.hpp"
#include "LatestValue.hpp"

namespace core {

// ============================================================
// Service Constants
// ============================================================

// Camera Configuration (NV12 from OAK-D)
constexpr int FRAME_WIDTH = 640;
constexpr int FRAME_HEIGHT = 480;
constexpr size_t FRAME_SIZE = static_cast<size_t>(FRAME_WIDTH) * FRAME_HEIGHT * 3 / 2;
constexpr float CAMERA_FPS = 30.0f;

// Pool sizing: one frame being filled, one pending, one in flight, one spare
constexpr size_t POOL_SIZE = 4;

// Normalization defaults: (value - mean) / scale maps 0..255 to 0..1
constexpr float DEFAULT_NORM_MEAN = 0.0f;
constexpr float DEFAULT_NORM_SCALE = 255.0f;

// Placeholder pixel for frames without image data
constexpr uint8_t NEUTRAL_GRAY = 128;

// Model input is always 3-channel RGB
constexpr int INPUT_CHANNELS = 3;

// ============================================================
// Image / Tensor Data Structures
// ============================================================

/**
 * Interleaved RGB image (CV_8UC3, R,G,B byte order).
 * Always owns its pixels; never aliases a RawFrame plane.
 */
struct PackedImage {
    cv::Mat pixels;
    bool placeholder = false;  // True for the CaptureUnavailable sentinel

    [[nodiscard]] int width() const { return pixels.cols; }
    [[nodiscard]] int height() const { return pixels.rows; }
    [[nodiscard]] size_t pixelCount() const { return pixels.total(); }

    /**
     * 1x1 neutral gray image used when a frame carries no pixel data.
     */
    static PackedImage empty() {
        PackedImage image;
        image.pixels = cv::Mat(1, 1, CV_8UC3, cv::Scalar(NEUTRAL_GRAY, NEUTRAL_GRAY, NEUTRAL_GRAY));
        image.placeholder = true;
        return image;
    }
};

// A PackedImage with the model's input width/height
using ResizedImage = PackedImage;

enum class TensorLayout {
    NHWC,   // (1, H, W, 3), interleaved
    NCHW    // (1, 3, H, W), planar
};

enum class DataType {
    Float32,
    Float16,
    Int8,
    UInt8,
    Int32,
    Unknown
};

inline const char* toString(DataType type) {
    switch (type) {
        case DataType::Float32: return "float32";
        case DataType::Float16: return "float16";
        case DataType::Int8:    return "int8";
        case DataType::UInt8:   return "uint8";
        case DataType::Int32:   return "int32";
        case DataType::Unknown: return "unknown";
    }
    return "unknown";
}

/**
 * Model input shape in (N, H, W, C) terms, independent of memory layout.
 */
struct InputShape {
    int batch = 0;
    int height = 0;
    int width = 0;
    int channels = 0;
    TensorLayout layout = TensorLayout::NHWC;

    [[nodiscard]] size_t elementCount() const {
        if (batch <= 0 || height <= 0 || width <= 0 || channels <= 0) return 0;
        return static_cast<size_t>(batch) * height * width * channels;
    }
};

struct InputTensor {
    std::vector<float> data;
    InputShape shape;
};

struct OutputTensor {
    std::vector<float> data;       // Widened to float regardless of dtype
    std::vector<int> shape;
    DataType dtype = DataType::Float32;
};

// ============================================================
// Prediction
// ============================================================

enum class FrameOutcome {
    Ok = 0,
    Degraded = 1,          // Frame had no pixel data, placeholder was classified
    ShapeMismatch = 2,     // Inference skipped
    InferenceFailed = 3    // Engine reported an error
};

inline const char* toString(FrameOutcome outcome) {
    switch (outcome) {
        case FrameOutcome::Ok:              return "ok";
        case FrameOutcome::Degraded:        return "degraded";
        case FrameOutcome::ShapeMismatch:   return "shape-mismatch";
        case FrameOutcome::InferenceFailed: return "inference-failed";
    }
    return "unknown";
}

struct Prediction {
    static constexpr int NONE = -1;

    int labelIndex = NONE;
    float confidence = 0.0f;
    std::vector<float> rawScores;

    FrameOutcome outcome = FrameOutcome::Ok;
    uint32_t sequenceNum = 0;
    std::chrono::steady_clock::time_point timestamp;   // Frame arrival

    [[nodiscard]] bool hasLabel() const { return labelIndex != NONE; }
};

// Type Aliases
using FrameMailbox = LatestValue<FrameHandle>;
using PredictionChannel = LatestValue<Prediction>;

} // namespace core
