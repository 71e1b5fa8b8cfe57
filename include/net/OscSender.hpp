#pragma once

#include <thread>
#include <atomic>
#include <memory>
#include <string>
#include <lo/lo.h>
#include "core/Types.hpp"
#include "core/Logger.hpp"

namespace net {

/**
 * Forwards predictions to the presentation layer over OSC.
 *
 * Message: /gesture/prediction  i:label  f:confidence  i:outcome  i:sequence  b:scores
 * The channel is latest-value-wins: a pending prediction is replaced by a
 * newer one, but a prediction is never discarded for its age.
 */
class OscSender {
public:
    static constexpr const char* ADDRESS = "/gesture/prediction";

    OscSender(std::shared_ptr<core::PredictionChannel> inputChannel, const std::string& host, const std::string& port);
    ~OscSender();

    OscSender(const OscSender&) = delete;
    OscSender& operator=(const OscSender&) = delete;

    /**
     * Returns false if the OSC address cannot be created.
     */
    bool start();
    void stop();

    [[nodiscard]] uint64_t sentCount() const { return _sent; }

private:
    void loop();
    void send(const core::Prediction& prediction);

    std::shared_ptr<core::PredictionChannel> _inputChannel;
    std::string _host;
    std::string _port;

    lo_address _loAddress = nullptr;

    std::atomic<bool> _running;
    std::atomic<uint64_t> _sent{0};
    std::thread _thread;
};

} // namespace net
