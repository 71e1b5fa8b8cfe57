#pragma once

#include <memory>
#include <string>
#include <vector>

#include "core/Types.hpp"
#include "image/ColorConverter.hpp"
#include "image/Resampler.hpp"
#include "inference/InferenceEngine.hpp"
#include "inference/Preprocessor.hpp"
#include "inference/ResultDecoder.hpp"

namespace core {

/**
 * Per-frame chain: ColorConverter → Resampler → Preprocessor → engine → ResultDecoder.
 *
 * Owns the inference engine. The model input shape is read once at
 * construction and validated against the preprocessing configuration; a
 * disagreement throws ConfigurationError. Per-frame failures never throw,
 * they are reported through Prediction::outcome.
 *
 * Not thread-safe: only the worker thread calls process().
 */
class GesturePipeline {
public:
    struct Config {
        float mean = DEFAULT_NORM_MEAN;
        float scale = DEFAULT_NORM_SCALE;
        std::vector<std::string> labels;    // Optional index → name table
    };

    /**
     * @throws ConfigurationError if the engine's input is not (1, H, W, 3)/(1, 3, H, W)
     *         or the normalization parameters are invalid
     */
    GesturePipeline(inference::InferenceEnginePtr engine, const Config& config);
    ~GesturePipeline();

    GesturePipeline(const GesturePipeline&) = delete;
    GesturePipeline& operator=(const GesturePipeline&) = delete;

    /**
     * Runs the full chain for one frame.
     * A frame without pixel data is classified from the neutral placeholder
     * and reported as FrameOutcome::Degraded.
     */
    Prediction process(const RawFrame& frame);

    /**
     * Convert, resize and normalize only.
     */
    [[nodiscard]] InputTensor prepare(const RawFrame& frame) const;

    /**
     * Validates tensor against the cached model input size, runs inference
     * and decodes. A size mismatch skips inference (FrameOutcome::ShapeMismatch).
     */
    Prediction classify(const InputTensor& tensor);

    [[nodiscard]] const InputShape& inputShape() const { return inputShape_; }
    [[nodiscard]] size_t expectedInputSize() const { return expectedInputSize_; }
    [[nodiscard]] const std::vector<int>& outputShape() const { return outputShape_; }
    [[nodiscard]] const inference::ResultDecoder& decoder() const { return decoder_; }

private:
    inference::InferenceEnginePtr engine_;

    // Cached at construction (declared before the stages that depend on it)
    InputShape inputShape_;
    size_t expectedInputSize_ = 0;
    std::vector<int> outputShape_;

    image::ColorConverter converter_;
    image::Resampler resampler_;
    inference::Preprocessor preprocessor_;
    inference::ResultDecoder decoder_;

    static inference::Preprocessor::Config makePreprocessorConfig(const Config& config,
                                                                  const InputShape& shape);
    static InputShape validateInputShape(const inference::InferenceEngine* engine);
};

} // namespace core
