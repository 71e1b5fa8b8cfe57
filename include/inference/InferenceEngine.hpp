#pragma once

#include "core/Types.hpp"
#include <vector>
#include <memory>

namespace inference {

/**
 * Fixed-shape, synchronous inference.
 *
 * Shapes and the output element type are fixed once the model is loaded.
 * run() blocks for one inference and is not reentrant: callers must not
 * invoke it concurrently on the same instance.
 */
class InferenceEngine {
public:
    virtual ~InferenceEngine() = default;

    [[nodiscard]] virtual core::InputShape inputShape() const = 0;
    [[nodiscard]] virtual std::vector<int> outputShape() const = 0;
    [[nodiscard]] virtual core::DataType outputDType() const = 0;

    /**
     * Runs one inference.
     * @throws core::ShapeMismatchError if input does not hold inputShape().elementCount() floats
     * @throws core::InferenceError if the runtime fails
     */
    virtual core::OutputTensor run(const core::InputTensor& input) = 0;
};

using InferenceEnginePtr = std::unique_ptr<InferenceEngine>;

/**
 * Interprets raw 4-D model input dims.
 * (1, H, W, 3) is NHWC; (1, 3, H, W) is NCHW. Anything else is reported as
 * NHWC with the trailing dimension as channel count, so the caller's
 * channel validation rejects it.
 * @throws core::ConfigurationError if dims is not 4-D
 */
core::InputShape resolveInputShape(const std::vector<int>& dims);

} // namespace inference
