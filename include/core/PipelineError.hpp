#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace core {

/**
 * Failure categories of the gesture pipeline.
 *
 * Transient kinds (CaptureUnavailable, ShapeMismatch, InferenceFailure) only
 * cost a single frame. Structural kinds (ModelLoadFailure, Configuration)
 * surface at startup and stop the service.
 */
enum class ErrorKind {
    CaptureUnavailable,
    ShapeMismatch,
    InferenceFailure,
    ModelLoadFailure,
    Configuration
};

inline const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CaptureUnavailable: return "CaptureUnavailable";
        case ErrorKind::ShapeMismatch:      return "ShapeMismatch";
        case ErrorKind::InferenceFailure:   return "InferenceFailure";
        case ErrorKind::ModelLoadFailure:   return "ModelLoadFailure";
        case ErrorKind::Configuration:      return "Configuration";
    }
    return "Unknown";
}

inline bool isStructural(ErrorKind kind) {
    return kind == ErrorKind::ModelLoadFailure || kind == ErrorKind::Configuration;
}

class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(toString(kind)) + ": " + message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// Serialized engine could not be parsed or is unusable.
class ModelLoadError : public PipelineError {
public:
    explicit ModelLoadError(const std::string& message)
        : PipelineError(ErrorKind::ModelLoadFailure, message) {}
};

// Model and preprocessing configuration disagree.
class ConfigurationError : public PipelineError {
public:
    explicit ConfigurationError(const std::string& message)
        : PipelineError(ErrorKind::Configuration, message) {}
};

class ShapeMismatchError : public PipelineError {
public:
    ShapeMismatchError(size_t expected, size_t actual)
        : PipelineError(ErrorKind::ShapeMismatch,
                        "expected " + std::to_string(expected) + " input elements, got " +
                            std::to_string(actual)),
          expected_(expected), actual_(actual) {}

    [[nodiscard]] size_t expected() const noexcept { return expected_; }
    [[nodiscard]] size_t actual() const noexcept { return actual_; }

private:
    size_t expected_;
    size_t actual_;
};

class InferenceError : public PipelineError {
public:
    explicit InferenceError(const std::string& message)
        : PipelineError(ErrorKind::InferenceFailure, message) {}
};

} // namespace core
