#pragma once

#include "core/Types.hpp"
#include <string>
#include <vector>

namespace inference {

/**
 * Reduces a classifier output to a single label.
 *
 * The output is treated as a flat score vector (a leading batch dimension is
 * dropped; with batch > 1 only the first item is decoded). The label is the
 * first index holding the maximum score. NaN scores never win. An empty
 * vector, or one holding only NaN, yields Prediction::NONE.
 */
class ResultDecoder {
public:
    explicit ResultDecoder(std::vector<std::string> labels = {});

    [[nodiscard]] core::Prediction decode(const core::OutputTensor& output) const;

    /**
     * Human readable name for logging: the configured label, "#<index>"
     * when no label table covers it, or "none".
     */
    [[nodiscard]] std::string labelName(int index) const;

    [[nodiscard]] const std::vector<std::string>& labels() const { return labels_; }

    /**
     * Index of the first maximum, ignoring NaN. -1 if there is none.
     */
    static int argmax(const float* scores, size_t count);

private:
    std::vector<std::string> labels_;
};

} // namespace inference
