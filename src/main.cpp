#include "core/CameraSource.hpp"
#include "core/GesturePipeline.hpp"
#include "core/Logger.hpp"
#include "core/PipelineError.hpp"
#include "core/ProcessingLoop.hpp"
#include "core/Types.hpp"
#include "inference/TensorRTEngine.hpp"
#include "net/OscSender.hpp"
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <thread>
#include <chrono>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// Global flag for shutdown
std::atomic<bool> g_running{true};

void signalHandler(int signum) {
    (void)signum;
    g_running = false;
}

namespace {

std::string envOr(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : fallback;
}

float envFloat(const char* name, float fallback) {
    const char* value = std::getenv(name);
    if (!value || !*value) return fallback;
    try {
        size_t pos = 0;
        float parsed = std::stof(value, &pos);
        if (pos != std::string(value).size()) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    } catch (const std::exception&) {
        throw core::ConfigurationError(std::string(name) + " is not a number: '" + value + "'");
    }
}

std::vector<std::string> splitLabels(const std::string& csv) {
    std::vector<std::string> labels;
    if (csv.empty()) return labels;
    std::stringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, ',')) {
        labels.push_back(item);
    }
    return labels;
}

// Sleeps in short steps so a shutdown request is noticed
void sleepWhileRunning(std::chrono::milliseconds duration) {
    auto until = std::chrono::steady_clock::now() + duration;
    while (g_running && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

} // namespace

int main() {
    // Register signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    core::Logger::setLevel(core::Logger::parseLevel(envOr("GESTURE_LOG_LEVEL", "info")));
    core::Logger::info("Starting GestureRecognitionService...");

    // Configuration
    const std::string OSC_HOST = envOr("GESTURE_OSC_HOST", "127.0.0.1");
    const std::string OSC_PORT = envOr("GESTURE_OSC_PORT", "9000");

    inference::TensorRTEngine::Config engineConfig;
    engineConfig.modelPath = envOr("GESTURE_MODEL_PATH", "models/gesture.engine");

    core::GesturePipeline::Config pipelineConfig;
    core::CameraSource::Config cameraConfig;
    try {
        pipelineConfig.mean = envFloat("GESTURE_NORM_MEAN", core::DEFAULT_NORM_MEAN);
        pipelineConfig.scale = envFloat("GESTURE_NORM_SCALE", core::DEFAULT_NORM_SCALE);
    } catch (const core::ConfigurationError& e) {
        core::Logger::error("Configuration error: ", e.what());
        return 2;
    }
    pipelineConfig.labels = splitLabels(envOr("GESTURE_LABELS", ""));
    cameraConfig.deviceIp = envOr("GESTURE_DEVICE_IP", "");

    // 1. Model (fatal on failure)
    auto engine = std::make_unique<inference::TensorRTEngine>();
    try {
        engine->load(engineConfig);
    } catch (const core::ModelLoadError& e) {
        core::Logger::error("Model load failed: ", e.what());
        return 1;
    }

    // 2. Pipeline (structural shape validation)
    std::unique_ptr<core::GesturePipeline> pipeline;
    try {
        pipeline = std::make_unique<core::GesturePipeline>(std::move(engine), pipelineConfig);
    } catch (const core::ConfigurationError& e) {
        core::Logger::error("Configuration error: ", e.what());
        return 2;
    }

    // 3. Infrastructure
    auto framePool = std::make_shared<core::FramePool>(core::POOL_SIZE, core::FRAME_SIZE);
    auto frameMailbox = std::make_shared<core::FrameMailbox>();
    auto predictionChannel = std::make_shared<core::PredictionChannel>();

    // 4. Start OSC Sender
    net::OscSender oscSender(predictionChannel, OSC_HOST, OSC_PORT);
    if (!oscSender.start()) {
        core::Logger::warn("OSC output disabled, predictions are only logged.");
    }

    // 5. Start Processing Loop (owns the engine from here on)
    core::ProcessingLoop processingLoop(std::move(pipeline), frameMailbox, predictionChannel);
    processingLoop.start();

    // 6. Camera source with auto-restart
    while (g_running) {
        core::CameraSource cameraSource(framePool, frameMailbox);
        try {
            cameraSource.init(cameraConfig);
            cameraSource.start();
            core::Logger::info("Service running. Press Ctrl+C to exit.");

            // Main loop (Orchestrator)
            while (g_running) {
                // Check for camera errors (e.g. device disconnected)
                if (cameraSource.hasError()) {
                    core::Logger::warn("CameraSource reported critical error. Restarting camera...");
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
        } catch (const std::exception& e) {
            core::Logger::error("Camera source failed: ", e.what());
        }

        // Stop delivery before anything downstream is torn down
        cameraSource.stop();

        if (g_running) {
            core::Logger::info("Restarting camera in 5 seconds...");
            sleepWhileRunning(std::chrono::seconds(5));
        }
    }

    // Shutdown order: source (already stopped) → worker (drain, release engine) → sink
    core::Logger::info("Interrupt received. Stopping modules...");
    processingLoop.stop();
    predictionChannel->close();
    oscSender.stop();

    core::Logger::info("Service stopped cleanly.");
    return 0;
}
