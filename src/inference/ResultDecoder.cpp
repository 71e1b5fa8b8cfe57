#include "inference/ResultDecoder.hpp"

#include <cmath>
#include <cstddef>
#include <string>
#include <utility>

namespace inference {

ResultDecoder::ResultDecoder(std::vector<std::string> labels) : labels_(std::move(labels)) {}

int ResultDecoder::argmax(const float* scores, size_t count) {
    int best = core::Prediction::NONE;
    for (size_t i = 0; i < count; ++i) {
        if (std::isnan(scores[i])) continue;
        // Strict '>' keeps the lowest index on ties
        if (best == core::Prediction::NONE || scores[i] > scores[best]) {
            best = static_cast<int>(i);
        }
    }
    return best;
}

core::Prediction ResultDecoder::decode(const core::OutputTensor& output) const {
    size_t count = output.data.size();

    // Batched output: decode the first item only
    if (output.shape.size() >= 2 && output.shape[0] > 1 && count > 0) {
        count /= static_cast<size_t>(output.shape[0]);
    }

    core::Prediction prediction;
    prediction.rawScores.assign(output.data.begin(), output.data.begin() + static_cast<std::ptrdiff_t>(count));
    prediction.labelIndex = argmax(prediction.rawScores.data(), prediction.rawScores.size());
    if (prediction.hasLabel()) {
        prediction.confidence = prediction.rawScores[prediction.labelIndex];
    }
    return prediction;
}

std::string ResultDecoder::labelName(int index) const {
    if (index < 0) return "none";
    if (static_cast<size_t>(index) < labels_.size()) return labels_[index];
    return "#" + std::to_string(index);
}

} // namespace inference
