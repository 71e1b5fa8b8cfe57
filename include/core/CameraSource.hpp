#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "core/Types.hpp"

namespace dai {
    class Device;
    class Pipeline;
    class MessageQueue;
}

namespace core {

/**
 * OAK-D frame source.
 *
 * Connects to the device, requests an NV12 RGB stream and, on its own thread,
 * copies every received frame into a pooled Frame which is published to the
 * keep-only-latest mailbox. A newer frame replaces a pending one; the
 * replaced frame returns to the pool.
 */
class CameraSource {
public:
    struct Config {
        float fps = CAMERA_FPS;
        int width = FRAME_WIDTH;
        int height = FRAME_HEIGHT;
        std::string deviceIp;       // IP address for PoE devices, empty = auto-detect
        int maxRetries = 10;
        int retryDelayMs = 5000;
    };

    CameraSource(std::shared_ptr<FramePool> framePool,
                 std::shared_ptr<FrameMailbox> outputMailbox);
    ~CameraSource();

    // Non-copyable
    CameraSource(const CameraSource&) = delete;
    CameraSource& operator=(const CameraSource&) = delete;

    /**
     * Connects to the device and builds the pipeline.
     * Throws std::runtime_error if the device cannot be bound.
     */
    void init(const Config& config);

    /**
     * Starts the device pipeline and the capture thread.
     */
    void start();

    /**
     * Stops frame delivery and closes the device connection.
     */
    void stop();

    // True after the capture thread lost the device
    [[nodiscard]] bool hasError() const { return hasError_; }

    [[nodiscard]] uint64_t poolStarvations() const { return poolStarvations_; }

private:
    void connect(const Config& config);
    void createPipeline(const Config& config);
    void loop();

    std::shared_ptr<FramePool> framePool_;
    std::shared_ptr<FrameMailbox> outputMailbox_;

    std::shared_ptr<dai::Device> device_;
    std::unique_ptr<dai::Pipeline> pipeline_;
    std::shared_ptr<dai::MessageQueue> queue_;
    Config config_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> hasError_{false};
    std::atomic<uint64_t> poolStarvations_{0};
};

} // namespace core
