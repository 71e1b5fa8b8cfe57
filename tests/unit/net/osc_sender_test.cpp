#include "net/OscSender.hpp"

#include <chrono>
#include <cstring>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <gtest/gtest.h>
#include <lo/lo.h>

#include "core/GesturePipeline.hpp"
#include "core/ProcessingLoop.hpp"
#include "support/FakeInferenceEngine.hpp"
#include "support/TestFrames.hpp"

namespace net {
namespace {

struct Received {
    int count = 0;
    int label = 0;
    float confidence = 0.0F;
    int outcome = 0;
    int sequence = 0;
    std::vector<float> scores;
};

int onPrediction(const char* /*path*/, const char* /*types*/, lo_arg** argv, int /*argc*/,
                 lo_message /*msg*/, void* userData) {
    auto* received = static_cast<Received*>(userData);
    received->count++;
    received->label = argv[0]->i;
    received->confidence = argv[1]->f;
    received->outcome = argv[2]->i;
    received->sequence = argv[3]->i;

    auto blob = reinterpret_cast<lo_blob>(argv[4]);
    const auto size = static_cast<size_t>(lo_blob_datasize(blob));
    received->scores.resize(size / sizeof(float));
    std::memcpy(received->scores.data(), lo_blob_dataptr(blob), size);
    return 0;
}

class OscSenderTest : public ::testing::Test {
protected:
    void SetUp() override {
        server = lo_server_new_with_proto(nullptr, LO_UDP, nullptr);
        ASSERT_NE(server, nullptr);
        lo_server_add_method(server, OscSender::ADDRESS, "ifiib", onPrediction, &received);
        port = std::to_string(lo_server_get_port(server));
        channel = std::make_shared<core::PredictionChannel>();
    }

    void TearDown() override {
        if (server) {
            lo_server_free(server);
        }
    }

    // Polls the server until count messages arrived or the timeout expires
    void receive(int count, std::chrono::milliseconds timeout) {
        auto until = std::chrono::steady_clock::now() + timeout;
        while (received.count < count && std::chrono::steady_clock::now() < until) {
            lo_server_recv_noblock(server, 10);
        }
    }

    lo_server server = nullptr;
    std::string port;
    Received received;
    std::shared_ptr<core::PredictionChannel> channel;
};

TEST_F(OscSenderTest, SendsLatestPrediction) {
    OscSender sender(channel, "127.0.0.1", port);
    ASSERT_TRUE(sender.start());

    core::Prediction prediction;
    prediction.labelIndex = 2;
    prediction.confidence = 0.8F;
    prediction.rawScores = {0.1F, 0.1F, 0.8F};
    prediction.sequenceNum = 17;
    prediction.timestamp = std::chrono::steady_clock::now();
    channel->publish(prediction);

    receive(1, std::chrono::seconds(2));
    sender.stop();

    ASSERT_EQ(received.count, 1);
    EXPECT_EQ(received.label, 2);
    EXPECT_FLOAT_EQ(received.confidence, 0.8F);
    EXPECT_EQ(received.outcome, static_cast<int>(core::FrameOutcome::Ok));
    EXPECT_EQ(received.sequence, 17);
    EXPECT_EQ(received.scores, (std::vector<float>{0.1F, 0.1F, 0.8F}));
    EXPECT_EQ(sender.sentCount(), 1U);
}

TEST_F(OscSenderTest, SendsLatePrediction) {
    OscSender sender(channel, "127.0.0.1", port);
    ASSERT_TRUE(sender.start());

    core::Prediction late;
    late.labelIndex = 0;
    late.sequenceNum = 5;
    late.timestamp = std::chrono::steady_clock::now() - std::chrono::milliseconds(500);
    channel->publish(late);

    receive(1, std::chrono::seconds(2));
    sender.stop();

    ASSERT_EQ(received.count, 1);
    EXPECT_EQ(received.sequence, 5);
    EXPECT_EQ(sender.sentCount(), 1U);
}

TEST_F(OscSenderTest, SlowModelPredictionsStillArrive) {
    auto pool = std::make_shared<core::FramePool>(2, core::Frame::yuv420Size(64, 48));
    auto mailbox = std::make_shared<core::FrameMailbox>();

    auto engine = std::make_unique<testing_support::FakeInferenceEngine>(std::vector<int>{1, 32, 32, 3});
    engine->setDelay(std::chrono::milliseconds(120));
    auto pipeline = std::make_unique<core::GesturePipeline>(std::move(engine), core::GesturePipeline::Config{});
    core::ProcessingLoop loop(std::move(pipeline), mailbox, channel);

    OscSender sender(channel, "127.0.0.1", port);
    ASSERT_TRUE(sender.start());
    loop.start();

    core::FrameHandle frame = pool->acquire();
    ASSERT_TRUE(frame);
    testing_support::fillNv12(*frame, testing_support::PlanarFrame(64, 48, 128, 128, 128));
    frame->sequenceNum = 21;
    frame->timestamp = std::chrono::steady_clock::now();
    ASSERT_TRUE(mailbox->publish(std::move(frame)));

    receive(1, std::chrono::seconds(3));
    loop.stop();
    sender.stop();

    ASSERT_EQ(received.count, 1);
    EXPECT_EQ(received.sequence, 21);
    EXPECT_EQ(received.label, 1);
    EXPECT_EQ(sender.sentCount(), 1U);
}

} // namespace
} // namespace net
