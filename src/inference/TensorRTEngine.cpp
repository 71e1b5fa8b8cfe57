/**
 * TensorRT Engine Wrapper Implementation
 *
 * Supports:
 * - Deserializing pre-built engines (TensorRT 8.5+ named I/O tensor API)
 * - Fixed-shape float input, float/half/int8/uint8/int32 outputs
 * - GPU or DLA execution
 */

#include "inference/TensorRTEngine.hpp"
#include "core/Logger.hpp"
#include "core/PipelineError.hpp"

#include <cstring>
#include <fstream>
#include <sstream>

#include <NvInfer.h>
#include <cuda_runtime.h>
#include <cuda_fp16.h>

namespace inference {

namespace {

// TensorRT Logger
class TRTLogger : public nvinfer1::ILogger {
public:
    void log(Severity severity, const char* msg) noexcept override {
        if (severity <= Severity::kERROR) {
            core::Logger::error("[TensorRT] ", msg);
        } else if (severity == Severity::kWARNING) {
            core::Logger::warn("[TensorRT] ", msg);
        } else if (severity == Severity::kINFO) {
            core::Logger::debug("[TensorRT] ", msg);
        }
    }
};

TRTLogger gLogger;

core::DataType toDataType(nvinfer1::DataType type) {
    switch (type) {
        case nvinfer1::DataType::kFLOAT: return core::DataType::Float32;
        case nvinfer1::DataType::kHALF:  return core::DataType::Float16;
        case nvinfer1::DataType::kINT8:  return core::DataType::Int8;
        case nvinfer1::DataType::kUINT8: return core::DataType::UInt8;
        case nvinfer1::DataType::kINT32: return core::DataType::Int32;
        default:                         return core::DataType::Unknown;
    }
}

size_t elementBytes(core::DataType type) {
    switch (type) {
        case core::DataType::Float32: return 4;
        case core::DataType::Float16: return 2;
        case core::DataType::Int8:    return 1;
        case core::DataType::UInt8:   return 1;
        case core::DataType::Int32:   return 4;
        case core::DataType::Unknown: return 0;
    }
    return 0;
}

std::string describe(const std::vector<int>& dims) {
    std::ostringstream os;
    os << "[";
    for (size_t i = 0; i < dims.size(); ++i) {
        if (i > 0) os << "x";
        os << dims[i];
    }
    os << "]";
    return os.str();
}

// Widens count elements of the given type to float
void widenToFloat(const unsigned char* src, core::DataType type, size_t count, float* dst) {
    switch (type) {
        case core::DataType::Float32:
            std::memcpy(dst, src, count * sizeof(float));
            break;
        case core::DataType::Float16: {
            __half value;
            for (size_t i = 0; i < count; ++i) {
                std::memcpy(&value, src + i * sizeof(__half), sizeof(__half));
                dst[i] = __half2float(value);
            }
            break;
        }
        case core::DataType::Int8:
            for (size_t i = 0; i < count; ++i) dst[i] = static_cast<float>(static_cast<int8_t>(src[i]));
            break;
        case core::DataType::UInt8:
            for (size_t i = 0; i < count; ++i) dst[i] = static_cast<float>(src[i]);
            break;
        case core::DataType::Int32: {
            int32_t value = 0;
            for (size_t i = 0; i < count; ++i) {
                std::memcpy(&value, src + i * sizeof(int32_t), sizeof(int32_t));
                dst[i] = static_cast<float>(value);
            }
            break;
        }
        case core::DataType::Unknown:
            break;
    }
}

} // namespace

std::vector<char> readModelFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.good()) {
        throw core::ModelLoadError("cannot open engine file: " + path);
    }

    const std::streamsize size = file.tellg();
    if (size <= 0) {
        throw core::ModelLoadError("engine file is empty: " + path);
    }
    file.seekg(0, std::ios::beg);

    std::vector<char> data(static_cast<size_t>(size));
    if (!file.read(data.data(), size)) {
        throw core::ModelLoadError("failed to read engine file: " + path);
    }
    return data;
}

TensorRTEngine::TensorRTEngine() = default;

TensorRTEngine::~TensorRTEngine() {
    release();
}

void TensorRTEngine::release() {
    freeBuffers();

    // Destruction order: context before engine before runtime
    context_.reset();
    engine_.reset();
    runtime_.reset();

    if (stream_) {
        cudaStreamDestroy(stream_);
        stream_ = nullptr;
    }

    inputInfo_ = TensorInfo{};
    outputInfos_.clear();

    if (loaded_) {
        core::Logger::info("TensorRT engine released: ", modelPath_.empty() ? "<memory>" : modelPath_);
    }
    loaded_ = false;
}

void TensorRTEngine::load(const Config& config) {
    core::Logger::info("Loading TensorRT engine: ", config.modelPath);
    std::vector<char> engineData = readModelFile(config.modelPath);
    modelPath_ = config.modelPath;
    loadFromMemory(engineData, config.dlaCore);
}

void TensorRTEngine::loadFromMemory(const std::vector<char>& engineData, int dlaCore) {
    // Also clears what a previous failed load left behind
    release();
    if (engineData.empty()) {
        throw core::ModelLoadError("engine buffer is empty");
    }

    // Create runtime
    runtime_.reset(nvinfer1::createInferRuntime(gLogger));
    if (!runtime_) {
        throw core::ModelLoadError("failed to create TensorRT runtime");
    }

    if (dlaCore >= 0) {
        if (dlaCore >= runtime_->getNbDLACores()) {
            throw core::ModelLoadError("DLA core " + std::to_string(dlaCore) + " not available");
        }
        runtime_->setDLACore(dlaCore);
        core::Logger::info("Using DLA core ", dlaCore);
    }

    // Deserialize engine
    engine_.reset(runtime_->deserializeCudaEngine(engineData.data(), engineData.size()));
    if (!engine_) {
        throw core::ModelLoadError("failed to deserialize engine (" + std::to_string(engineData.size()) + " bytes)");
    }

    // Create execution context
    context_.reset(engine_->createExecutionContext());
    if (!context_) {
        throw core::ModelLoadError("failed to create execution context");
    }

    if (cudaStreamCreate(&stream_) != cudaSuccess) {
        stream_ = nullptr;
        throw core::ModelLoadError("failed to create CUDA stream");
    }

    // Extract tensor info
    extractTensorInfo();

    // Allocate CUDA buffers
    allocateBuffers();

    loaded_ = true;
    const TensorInfo& output = outputInfos_.front();
    core::Logger::info("TensorRT engine loaded successfully");
    core::Logger::info("  Input: ", inputInfo_.name, " ", describe(inputInfo_.dims), " ", core::toString(inputInfo_.dtype));
    core::Logger::info("  Output: ", output.name, " ", describe(output.dims), " ", core::toString(output.dtype),
                       " size=", output.size);
}

void TensorRTEngine::extractTensorInfo() {
    inputInfo_ = TensorInfo{};
    outputInfos_.clear();
    bool haveInput = false;

    // TensorRT 8.5+ API uses getNbIOTensors instead of getNbBindings
    const int numTensors = engine_->getNbIOTensors();

    for (int i = 0; i < numTensors; ++i) {
        const char* name = engine_->getIOTensorName(i);
        auto dims = engine_->getTensorShape(name);
        auto mode = engine_->getTensorIOMode(name);

        TensorInfo info;
        info.name = name;
        info.isInput = (mode == nvinfer1::TensorIOMode::kINPUT);
        info.dtype = toDataType(engine_->getTensorDataType(name));
        info.size = 1;

        for (int d = 0; d < dims.nbDims; ++d) {
            if (dims.d[d] <= 0) {
                throw core::ModelLoadError("tensor '" + info.name + "' has a dynamic dimension; "
                                           "only fixed-shape engines are supported");
            }
            info.dims.push_back(static_cast<int>(dims.d[d]));
            info.size *= static_cast<size_t>(dims.d[d]);
        }

        if (info.dtype == core::DataType::Unknown) {
            throw core::ModelLoadError("tensor '" + info.name + "' has an unsupported data type");
        }

        if (info.isInput) {
            if (haveInput) {
                throw core::ModelLoadError("engine has more than one input tensor");
            }
            if (info.dtype != core::DataType::Float32) {
                throw core::ModelLoadError("input tensor '" + info.name + "' must be float32, is " +
                                           core::toString(info.dtype));
            }
            inputInfo_ = info;
            haveInput = true;
        } else {
            outputInfos_.push_back(info);
        }
    }

    if (!haveInput) {
        throw core::ModelLoadError("engine has no input tensor");
    }
    if (outputInfos_.empty()) {
        throw core::ModelLoadError("engine has no output tensor");
    }
}

void TensorRTEngine::allocateBuffers() {
    const size_t inputBytes = inputInfo_.size * sizeof(float);
    if (cudaMalloc(&d_input_, inputBytes) != cudaSuccess) {
        d_input_ = nullptr;
        throw core::ModelLoadError("cudaMalloc failed for input (" + std::to_string(inputBytes) + " bytes)");
    }
    context_->setTensorAddress(inputInfo_.name.c_str(), d_input_);

    size_t totalOutputBytes = 0;
    for (const auto& info : outputInfos_) {
        const size_t bytes = info.size * elementBytes(info.dtype);
        void* buffer = nullptr;
        if (cudaMalloc(&buffer, bytes) != cudaSuccess) {
            throw core::ModelLoadError("cudaMalloc failed for output '" + info.name + "'");
        }
        d_outputs_.push_back(buffer);
        context_->setTensorAddress(info.name.c_str(), buffer);
        totalOutputBytes += bytes;
    }

    h_output_.resize(outputInfos_.front().size * elementBytes(outputInfos_.front().dtype));

    core::Logger::info("CUDA buffers allocated: input=", inputBytes, " outputs=", totalOutputBytes);
}

void TensorRTEngine::freeBuffers() {
    if (d_input_) {
        cudaFree(d_input_);
        d_input_ = nullptr;
    }
    for (void* buffer : d_outputs_) {
        cudaFree(buffer);
    }
    d_outputs_.clear();
    h_output_.clear();
}

core::InputShape TensorRTEngine::inputShape() const {
    return resolveInputShape(inputInfo_.dims);
}

std::vector<int> TensorRTEngine::outputShape() const {
    return outputInfos_.empty() ? std::vector<int>{} : outputInfos_.front().dims;
}

core::DataType TensorRTEngine::outputDType() const {
    return outputInfos_.empty() ? core::DataType::Unknown : outputInfos_.front().dtype;
}

core::OutputTensor TensorRTEngine::run(const core::InputTensor& input) {
    if (!loaded_) {
        throw core::InferenceError("engine not loaded");
    }
    if (input.data.size() != inputInfo_.size) {
        throw core::ShapeMismatchError(inputInfo_.size, input.data.size());
    }

    // Copy input to GPU
    const size_t inputBytes = inputInfo_.size * sizeof(float);
    cudaError_t err = cudaMemcpyAsync(d_input_, input.data.data(), inputBytes,
                                      cudaMemcpyHostToDevice, stream_);
    if (err != cudaSuccess) {
        throw core::InferenceError(std::string("input upload failed: ") + cudaGetErrorString(err));
    }

    // Run inference (addresses were bound once in allocateBuffers)
    if (!context_->enqueueV3(stream_)) {
        throw core::InferenceError("enqueueV3 failed");
    }

    // Copy output to host
    err = cudaMemcpyAsync(h_output_.data(), d_outputs_.front(), h_output_.size(),
                          cudaMemcpyDeviceToHost, stream_);
    if (err == cudaSuccess) {
        err = cudaStreamSynchronize(stream_);
    }
    if (err != cudaSuccess) {
        throw core::InferenceError(std::string("output download failed: ") + cudaGetErrorString(err));
    }

    const TensorInfo& info = outputInfos_.front();
    core::OutputTensor output;
    output.shape = info.dims;
    output.dtype = info.dtype;
    output.data.resize(info.size);
    widenToFloat(h_output_.data(), info.dtype, info.size, output.data.data());
    return output;
}

} // namespace inference
