#include "inference/InferenceEngine.hpp"
#include "core/PipelineError.hpp"

#include <string>

namespace inference {

core::InputShape resolveInputShape(const std::vector<int>& dims) {
    if (dims.size() != 4) {
        throw core::ConfigurationError("model input must be 4-D, got rank " + std::to_string(dims.size()));
    }

    core::InputShape shape;
    shape.batch = dims[0];

    const bool channelsLast = dims[3] == core::INPUT_CHANNELS;
    const bool channelsFirst = dims[1] == core::INPUT_CHANNELS;

    if (!channelsLast && channelsFirst) {
        shape.layout = core::TensorLayout::NCHW;
        shape.channels = dims[1];
        shape.height = dims[2];
        shape.width = dims[3];
    } else {
        shape.layout = core::TensorLayout::NHWC;
        shape.height = dims[1];
        shape.width = dims[2];
        shape.channels = dims[3];
    }
    return shape;
}

} // namespace inference
