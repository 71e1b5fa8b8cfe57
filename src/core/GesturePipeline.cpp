#include "core/GesturePipeline.hpp"
#include "core/Logger.hpp"
#include "core/PipelineError.hpp"

#include <string>
#include <utility>

namespace core {

InputShape GesturePipeline::validateInputShape(const inference::InferenceEngine* engine) {
    if (!engine) {
        throw ConfigurationError("no inference engine");
    }

    InputShape shape = engine->inputShape();
    if (shape.batch != 1) {
        throw ConfigurationError("model batch size must be 1, is " + std::to_string(shape.batch));
    }
    if (shape.channels != INPUT_CHANNELS) {
        throw ConfigurationError("model expects " + std::to_string(shape.channels) +
                                 " input channels, pipeline produces " + std::to_string(INPUT_CHANNELS));
    }
    if (shape.width <= 0 || shape.height <= 0) {
        throw ConfigurationError("model input has no spatial size");
    }
    return shape;
}

inference::Preprocessor::Config GesturePipeline::makePreprocessorConfig(const Config& config,
                                                                        const InputShape& shape) {
    inference::Preprocessor::Config pre;
    pre.mean = config.mean;
    pre.scale = config.scale;
    pre.layout = shape.layout;
    return pre;
}

GesturePipeline::GesturePipeline(inference::InferenceEnginePtr engine, const Config& config)
    : engine_(std::move(engine)),
      inputShape_(validateInputShape(engine_.get())),
      expectedInputSize_(inputShape_.elementCount()),
      outputShape_(engine_->outputShape()),
      preprocessor_(makePreprocessorConfig(config, inputShape_)),
      decoder_(config.labels) {

    Logger::info("GesturePipeline initialized");
    Logger::info("  Model input: ", inputShape_.width, "x", inputShape_.height, "x", inputShape_.channels,
                 inputShape_.layout == TensorLayout::NHWC ? " (NHWC)" : " (NCHW)");
    Logger::info("  Output dtype: ", toString(engine_->outputDType()), ", rank ", outputShape_.size());
    Logger::info("  Normalize: (v - ", config.mean, ") / ", config.scale);
    if (!config.labels.empty()) {
        Logger::info("  Labels: ", config.labels.size());
    }
}

GesturePipeline::~GesturePipeline() = default;

InputTensor GesturePipeline::prepare(const RawFrame& frame) const {
    PackedImage packed = converter_.convert(frame);
    ResizedImage resized = resampler_.resize(packed, inputShape_.width, inputShape_.height);
    return preprocessor_.normalize(resized);
}

Prediction GesturePipeline::classify(const InputTensor& tensor) {
    if (tensor.data.size() != expectedInputSize_) {
        Logger::error("ShapeMismatch: model expects ", expectedInputSize_, " input elements, got ",
                      tensor.data.size(), " - inference skipped");
        Prediction skipped;
        skipped.outcome = FrameOutcome::ShapeMismatch;
        return skipped;
    }

    try {
        OutputTensor output = engine_->run(tensor);
        return decoder_.decode(output);
    } catch (const ShapeMismatchError& e) {
        Logger::error(e.what());
        Prediction skipped;
        skipped.outcome = FrameOutcome::ShapeMismatch;
        return skipped;
    } catch (const InferenceError& e) {
        Logger::error(e.what());
        Prediction failed;
        failed.outcome = FrameOutcome::InferenceFailed;
        return failed;
    }
}

Prediction GesturePipeline::process(const RawFrame& frame) {
    const bool degraded = !image::ColorConverter::isConvertible(frame);
    if (degraded) {
        Logger::warn("CaptureUnavailable: frame seq=", frame.sequenceNum,
                     " has no usable pixel data, classifying placeholder");
    }

    Prediction prediction = classify(prepare(frame));
    if (degraded && prediction.outcome == FrameOutcome::Ok) {
        prediction.outcome = FrameOutcome::Degraded;
    }
    prediction.sequenceNum = frame.sequenceNum;
    prediction.timestamp = frame.timestamp;

    Logger::debug("Frame seq=", frame.sequenceNum, " → ", decoder_.labelName(prediction.labelIndex),
                  " (", prediction.confidence, ", ", toString(prediction.outcome), ")");
    return prediction;
}

} // namespace core
