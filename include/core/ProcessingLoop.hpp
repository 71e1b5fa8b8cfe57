#pragma once

#include <atomic>
#include <thread>
#include <memory>
#include <chrono>
#include <cstdint>

#include "Types.hpp"
#include "Logger.hpp"

namespace core {

class GesturePipeline;

enum class PipelineState {
    Idle,
    Processing,
    Closed
};

const char* toString(PipelineState state);

/**
 * Dedicated worker thread running the gesture pipeline.
 *
 * Takes the latest frame from the mailbox, runs it through the pipeline and
 * publishes the Prediction to the prediction channel. Frames are returned to
 * their pool when the FrameHandle leaves scope, on every path.
 *
 * State: Idle → Processing → Idle, terminal Closed. stop() closes the
 * mailbox (no further delivery), waits for the in-flight frame, then
 * destroys the pipeline and with it the inference engine.
 */
class ProcessingLoop {
public:
    struct Stats {
        uint64_t processed = 0;
        uint64_t degraded = 0;
        uint64_t failed = 0;     // ShapeMismatch + InferenceFailed
    };

    ProcessingLoop(std::unique_ptr<GesturePipeline> pipeline,
                   std::shared_ptr<FrameMailbox> inputMailbox,
                   std::shared_ptr<PredictionChannel> predictionChannel);
    ~ProcessingLoop();

    ProcessingLoop(const ProcessingLoop&) = delete;
    ProcessingLoop& operator=(const ProcessingLoop&) = delete;

    void start();
    void stop();
    bool isRunning() const;

    [[nodiscard]] PipelineState state() const { return _state.load(); }
    [[nodiscard]] Stats stats() const;

private:
    void loop();
    void processFrame(FrameHandle frame);
    void reportThroughput(const Prediction& prediction);

    std::unique_ptr<GesturePipeline> _pipeline;
    std::shared_ptr<FrameMailbox> _inputMailbox;
    std::shared_ptr<PredictionChannel> _predictionChannel;

    std::atomic<bool> _running;
    std::atomic<PipelineState> _state;
    std::thread _thread;

    std::atomic<uint64_t> _processed{0};
    std::atomic<uint64_t> _degraded{0};
    std::atomic<uint64_t> _failed{0};

    // FPS Counting (worker thread only)
    std::chrono::steady_clock::time_point _lastFpsTime;
    int _frameCount = 0;
    float _currentFps = 0.0f;
};

} // namespace core
