#pragma once

#include "inference/InferenceEngine.hpp"
#include <string>
#include <vector>
#include <memory>

// Forward declarations for TensorRT / CUDA
namespace nvinfer1 {
    class IRuntime;
    class ICudaEngine;
    class IExecutionContext;
}
struct CUstream_st;

namespace inference {

/**
 * TensorRT Engine Wrapper
 *
 * Handles:
 * - Deserializing a pre-built engine (from memory or a .engine/.trt file)
 * - CUDA memory management for input/outputs (allocated once, reused per frame)
 * - Synchronous inference execution
 *
 * Every failure while loading throws core::ModelLoadError. Native objects
 * and device buffers are released once, in the destructor.
 */
class TensorRTEngine : public InferenceEngine {
public:
    struct Config {
        std::string modelPath;      // Path to a serialized .engine / .trt file
        int dlaCore = -1;           // -1 = GPU, 0/1 = DLA core
    };

    struct TensorInfo {
        std::string name;
        std::vector<int> dims;
        size_t size = 0;            // Total elements
        core::DataType dtype = core::DataType::Unknown;
        bool isInput = false;
    };

    TensorRTEngine();
    ~TensorRTEngine() override;

    // Non-copyable
    TensorRTEngine(const TensorRTEngine&) = delete;
    TensorRTEngine& operator=(const TensorRTEngine&) = delete;

    /**
     * Reads the engine file named by config.modelPath and loads it.
     * @throws core::ModelLoadError
     */
    void load(const Config& config);

    /**
     * Deserializes an engine from an in-memory byte buffer.
     * @throws core::ModelLoadError
     */
    void loadFromMemory(const std::vector<char>& engineData, int dlaCore = -1);

    [[nodiscard]] core::InputShape inputShape() const override;
    [[nodiscard]] std::vector<int> outputShape() const override;
    [[nodiscard]] core::DataType outputDType() const override;

    core::OutputTensor run(const core::InputTensor& input) override;

    /**
     * Get input tensor info
     */
    [[nodiscard]] const TensorInfo& getInputInfo() const { return inputInfo_; }

    /**
     * Get all output tensor infos (the first one is decoded)
     */
    [[nodiscard]] const std::vector<TensorInfo>& getOutputInfos() const { return outputInfos_; }

    [[nodiscard]] bool isLoaded() const { return loaded_; }

    [[nodiscard]] const std::string& getModelPath() const { return modelPath_; }

private:
    std::string modelPath_;
    bool loaded_ = false;

    std::unique_ptr<nvinfer1::IRuntime> runtime_;
    std::unique_ptr<nvinfer1::ICudaEngine> engine_;
    std::unique_ptr<nvinfer1::IExecutionContext> context_;
    CUstream_st* stream_ = nullptr;

    // Tensor info - supports multiple outputs
    TensorInfo inputInfo_;
    std::vector<TensorInfo> outputInfos_;

    // CUDA buffers - supports multiple outputs
    void* d_input_ = nullptr;
    std::vector<void*> d_outputs_;

    // Host staging for the decoded output (raw bytes of outputInfos_[0])
    std::vector<unsigned char> h_output_;

    // Helper methods
    void extractTensorInfo();
    void allocateBuffers();
    void freeBuffers();
    void release();
};

/**
 * Reads a whole file into memory.
 * @throws core::ModelLoadError if the file cannot be read or is empty
 */
std::vector<char> readModelFile(const std::string& path);

} // namespace inference
