#include "core/CameraSource.hpp"
#include "core/Logger.hpp"

#include <chrono>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

#include <depthai/depthai.hpp>
#include <depthai/pipeline/node/Camera.hpp>
#include <depthai/pipeline/datatype/ImgFrame.hpp>

namespace core {

CameraSource::CameraSource(std::shared_ptr<FramePool> framePool,
                           std::shared_ptr<FrameMailbox> outputMailbox)
    : framePool_(std::move(framePool)), outputMailbox_(std::move(outputMailbox)) {
}

CameraSource::~CameraSource() {
    stop();
}

void CameraSource::init(const Config& config) {
    Logger::info("Initializing CameraSource...");
    config_ = config;

    const size_t required = Frame::yuv420Size(config.width, config.height);
    if (required > framePool_->bufferSize()) {
        throw std::runtime_error("CameraSource: " + std::to_string(config.width) + "x" +
                                 std::to_string(config.height) + " NV12 does not fit pool buffers of " +
                                 std::to_string(framePool_->bufferSize()) + " bytes");
    }

    connect(config);

    try {
        pipeline_ = std::make_unique<dai::Pipeline>(device_);
        createPipeline(config);
        Logger::info("DepthAI Device initialized: ", device_->getDeviceId());
    } catch (const std::exception& e) {
        Logger::error("Failed to initialize device: ", e.what());
        throw;
    }
}

void CameraSource::connect(const Config& config) {
    bool connected = false;
    int retries = 0;

    while (!connected && retries < config.maxRetries) {
        try {
            if (retries > 0) {
                Logger::info("Attempting to connect to OAK device (Attempt ", retries + 1, "/",
                             config.maxRetries, ")...");
            }

            if (!config.deviceIp.empty()) {
                Logger::info("Connecting to PoE device at: ", config.deviceIp);
                device_ = std::make_shared<dai::Device>(config.deviceIp);
            } else {
                Logger::info("Connecting to any available device (USB/PoE auto-detect)...");
                device_ = std::make_shared<dai::Device>();
            }
            connected = true;
            Logger::info("Successfully connected to device!");

        } catch (const std::exception& e) {
            retries++;
            Logger::warn("Connection failed: ", e.what());
            if (retries < config.maxRetries) {
                Logger::warn("Waiting ", config.retryDelayMs, "ms before retry ", retries + 1, "/",
                             config.maxRetries, "...");
                std::this_thread::sleep_for(std::chrono::milliseconds(config.retryDelayMs));
            }
        }
    }

    if (!connected) {
        throw std::runtime_error("Device connection failed after " + std::to_string(config.maxRetries) +
                                 " retries.");
    }
}

void CameraSource::createPipeline(const Config& config) {
    Logger::debug("Creating pipeline nodes...");

    auto camRgb = pipeline_->create<dai::node::Camera>()->build(
        dai::CameraBoardSocket::CAM_A,
        std::make_pair(config.width, config.height),
        config.fps
    );

    camRgb->initialControl.setAutoFocusMode(dai::CameraControl::AutoFocusMode::CONTINUOUS_VIDEO);
    camRgb->initialControl.setAutoExposureEnable();
    camRgb->initialControl.setAutoWhiteBalanceMode(dai::CameraControl::AutoWhiteBalanceMode::AUTO);

    auto rgbOutput = camRgb->requestOutput(
        std::make_pair(config.width, config.height),
        dai::ImgFrame::Type::NV12,
        dai::ImgResizeMode::CROP,
        config.fps
    );

    // Non-blocking, depth 1: the device side also keeps only the latest frame
    queue_ = rgbOutput->createOutputQueue(1, false);

    Logger::info("RGB: ", config.width, "x", config.height, " NV12 @ ", config.fps, " FPS");
}

void CameraSource::start() {
    if (running_) return;
    if (!pipeline_) {
        throw std::runtime_error("Pipeline not initialized. Call init() first.");
    }

    Logger::info("Starting pipeline...");
    pipeline_->start();

    hasError_ = false;
    running_ = true;
    thread_ = std::thread(&CameraSource::loop, this);
    Logger::info("CameraSource started.");
}

void CameraSource::stop() {
    running_ = false;
    // Joinable even when the loop already exited on a device error
    if (thread_.joinable()) {
        thread_.join();
        Logger::info("CameraSource capture thread stopped.");
    }

    if (!device_) return;

    try {
        // Pipeline first (releases resources on device), then queues, then the connection
        if (pipeline_) {
            pipeline_->stop();
            pipeline_.reset();
        }
        queue_.reset();
        if (!device_->isClosed()) {
            device_->close();
        }
        device_.reset();
        Logger::info("Device connection closed.");
    } catch (const std::exception& e) {
        Logger::error("Error during device shutdown: ", e.what());
        pipeline_.reset();
        queue_.reset();
        device_.reset();
    }
}

void CameraSource::loop() {
    Logger::debug("CameraSource: Waiting for frames from queue: ", queue_->getName());

    while (running_) {
        try {
            std::shared_ptr<dai::ImgFrame> imgFrame = queue_->tryGet<dai::ImgFrame>();
            if (!imgFrame) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                continue;
            }

            // 1. Acquire Frame from Pool
            FrameHandle frame = framePool_->acquire();
            if (!frame) {
                // Pool empty (Backpressure) -> Drop frame
                ++poolStarvations_;
                Logger::warn("CameraSource: FramePool empty, dropping frame seq=", imgFrame->getSequenceNum());
                continue;
            }

            // 2. Copy Data into the pooled buffer
            const auto& data = imgFrame->getData();
            const int width = static_cast<int>(imgFrame->getWidth());
            const int height = static_cast<int>(imgFrame->getHeight());
            const size_t expected = Frame::yuv420Size(width, height);

            if (imgFrame->getType() != dai::ImgFrame::Type::NV12 || data.size() < expected ||
                expected > frame->capacity) {
                // Published without image: the worker degrades to the placeholder
                Logger::warn("CameraSource: unusable frame seq=", imgFrame->getSequenceNum(),
                             " (", width, "x", height, ", ", data.size(), " bytes)");
                frame->clearImage();
            } else {
                std::memcpy(frame->data.get(), data.data(), expected);
                frame->setNv12Layout(width, height);
            }

            // 3. Fill Metadata
            frame->sequenceNum = static_cast<uint32_t>(imgFrame->getSequenceNum());
            frame->timestamp = std::chrono::steady_clock::now(); // Host arrival

            // 4. Hand over; a frame still pending in the mailbox is dropped
            outputMailbox_->publish(std::move(frame));

        } catch (const std::exception& e) {
            Logger::error("CameraSource Critical Error (Connection lost?): ", e.what());
            hasError_ = true;
            running_ = false; // Stop loop so main can detect and restart
        }
    }
}

} // namespace core
