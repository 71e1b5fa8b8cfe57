#include "net/OscSender.hpp"

#include <chrono>

namespace net {

OscSender::OscSender(std::shared_ptr<core::PredictionChannel> inputChannel, const std::string& host, const std::string& port)
    : _inputChannel(std::move(inputChannel)), _host(host), _port(port), _running(false) {
}

OscSender::~OscSender() {
    stop();
    if (_loAddress) {
        lo_address_free(_loAddress);
    }
}

bool OscSender::start() {
    if (_running) return true;

    if (!_loAddress) {
        _loAddress = lo_address_new(_host.c_str(), _port.c_str());
    }
    if (!_loAddress) {
        core::Logger::error("OscSender: Failed to create LO address for ", _host, ":", _port);
        return false;
    }

    _running = true;
    _thread = std::thread(&OscSender::loop, this);
    core::Logger::info("OscSender started. Target: ", _host, ":", _port, ADDRESS);
    return true;
}

void OscSender::stop() {
    if (!_running) return;
    _running = false;
    if (_thread.joinable()) {
        _thread.join();
    }
    core::Logger::info("OscSender stopped. Sent ", _sent.load(), " predictions.");
}

void OscSender::loop() {
    while (_running) {
        // Short timeout so stop() is noticed without closing the channel
        auto prediction = _inputChannel->waitPop(std::chrono::milliseconds(20));
        if (!prediction) {
            if (_inputChannel->isClosed()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }
            continue;
        }

        // Late predictions are still sent; only a newer one in the channel supersedes them
        auto now = std::chrono::steady_clock::now();
        auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(now - prediction->timestamp).count();
        core::Logger::debug("OscSender: seq=", prediction->sequenceNum, " frame-to-send ", latency, "ms");

        send(*prediction);
    }
}

void OscSender::send(const core::Prediction& prediction) {
    if (!_loAddress) return;

    lo_message msg = lo_message_new();

    lo_message_add_int32(msg, prediction.labelIndex);
    lo_message_add_float(msg, prediction.confidence);
    lo_message_add_int32(msg, static_cast<int32_t>(prediction.outcome));
    lo_message_add_int32(msg, static_cast<int32_t>(prediction.sequenceNum));

    // Raw scores as one compact blob (float32, host byte order)
    lo_blob blob = lo_blob_new(static_cast<int32_t>(prediction.rawScores.size() * sizeof(float)),
                               prediction.rawScores.data());
    lo_message_add_blob(msg, blob);

    int ret = lo_send_message(_loAddress, ADDRESS, msg);
    if (ret == -1) {
        core::Logger::error("OscSender: Failed to send message: ", lo_address_errstr(_loAddress));
    } else {
        ++_sent;
    }

    lo_blob_free(blob);
    lo_message_free(msg);
}

} // namespace net
