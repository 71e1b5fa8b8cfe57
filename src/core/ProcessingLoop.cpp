#include "core/ProcessingLoop.hpp"
#include "core/GesturePipeline.hpp"

#include <exception>
#include <optional>
#include <utility>

namespace core {

const char* toString(PipelineState state) {
    switch (state) {
        case PipelineState::Idle:       return "Idle";
        case PipelineState::Processing: return "Processing";
        case PipelineState::Closed:     return "Closed";
    }
    return "Unknown";
}

ProcessingLoop::ProcessingLoop(std::unique_ptr<GesturePipeline> pipeline,
                               std::shared_ptr<FrameMailbox> inputMailbox,
                               std::shared_ptr<PredictionChannel> predictionChannel)
    : _pipeline(std::move(pipeline)),
      _inputMailbox(std::move(inputMailbox)),
      _predictionChannel(std::move(predictionChannel)),
      _running(false),
      _state(PipelineState::Idle) {
}

ProcessingLoop::~ProcessingLoop() {
    stop();
}

void ProcessingLoop::start() {
    if (_running) return;
    if (_state == PipelineState::Closed || !_pipeline) {
        Logger::error("ProcessingLoop: cannot start, pipeline is closed");
        return;
    }
    _running = true;
    _lastFpsTime = std::chrono::steady_clock::now();
    _thread = std::thread(&ProcessingLoop::loop, this);
    Logger::info("ProcessingLoop started.");
}

void ProcessingLoop::stop() {
    if (_state == PipelineState::Closed) return;

    // No further frame delivery; a pending frame goes back to the pool
    _running = false;
    _inputMailbox->close();

    // Drain: the worker finishes the in-flight frame before exiting
    if (_thread.joinable()) {
        _thread.join();
    }

    // Worker is gone, the engine can be released
    _pipeline.reset();
    _state = PipelineState::Closed;

    const Stats s = stats();
    Logger::info("ProcessingLoop stopped. processed=", s.processed, " degraded=", s.degraded,
                 " failed=", s.failed, " dropped=", _inputMailbox->dropped());
}

bool ProcessingLoop::isRunning() const {
    return _running;
}

ProcessingLoop::Stats ProcessingLoop::stats() const {
    Stats s;
    s.processed = _processed.load();
    s.degraded = _degraded.load();
    s.failed = _failed.load();
    return s;
}

void ProcessingLoop::loop() {
    while (_running) {
        // Blocks until a frame arrives or the mailbox is closed
        std::optional<FrameHandle> frame = _inputMailbox->waitPop();
        if (!frame) {
            break;
        }
        processFrame(std::move(*frame));
    }
}

void ProcessingLoop::processFrame(FrameHandle frame) {
    _state = PipelineState::Processing;

    Prediction prediction;
    try {
        // An empty handle reads as a frame without image (CaptureUnavailable)
        const RawFrame raw = frame ? frame->view() : RawFrame{};
        prediction = _pipeline->process(raw);
    } catch (const std::exception& e) {
        // Unexpected per-frame failure (e.g. OpenCV); keep the live feed running
        Logger::error("ProcessingLoop: frame processing failed: ", e.what());
        prediction = Prediction{};
        prediction.outcome = FrameOutcome::InferenceFailed;
        if (frame) {
            prediction.sequenceNum = frame->sequenceNum;
            prediction.timestamp = frame->timestamp;
        }
    }

    // Frame storage is not referenced past this point
    frame.reset();

    ++_processed;
    if (prediction.outcome == FrameOutcome::Degraded) {
        ++_degraded;
    } else if (prediction.outcome != FrameOutcome::Ok) {
        ++_failed;
    }

    reportThroughput(prediction);
    _predictionChannel->publish(std::move(prediction));

    _state = PipelineState::Idle;
}

void ProcessingLoop::reportThroughput(const Prediction& prediction) {
    _frameCount++;
    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - _lastFpsTime).count();
    if (elapsed >= 1000) {
        _currentFps = _frameCount * 1000.0f / elapsed;
        _frameCount = 0;
        _lastFpsTime = now;

        Logger::info("FPS: ", _currentFps,
                     " | last: ", _pipeline->decoder().labelName(prediction.labelIndex),
                     " (", prediction.confidence, ")",
                     " | dropped: ", _inputMailbox->dropped());
    }
}

} // namespace core
