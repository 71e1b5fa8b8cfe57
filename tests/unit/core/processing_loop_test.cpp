#include "core/ProcessingLoop.hpp"

#include <chrono>
#include <memory>
#include <utility>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "core/GesturePipeline.hpp"
#include "support/FakeInferenceEngine.hpp"
#include "support/TestFrames.hpp"

namespace core {
namespace {

using testing_support::FakeInferenceEngine;

constexpr int kWidth = 64;
constexpr int kHeight = 48;

class ProcessingLoopTest : public ::testing::Test {
protected:
    void SetUp() override {
        pool = std::make_shared<FramePool>(2, Frame::yuv420Size(kWidth, kHeight));
        mailbox = std::make_shared<FrameMailbox>();
        channel = std::make_shared<PredictionChannel>();

        auto engine = std::make_unique<FakeInferenceEngine>(std::vector<int>{1, 32, 32, 3});
        engineDestroyed = engine->destroyedFlag();
        auto pipeline = std::make_unique<GesturePipeline>(std::move(engine), GesturePipeline::Config{});
        loop = std::make_unique<ProcessingLoop>(std::move(pipeline), mailbox, channel);
    }

    [[nodiscard]] FrameHandle makeFrame(uint32_t sequenceNum) {
        FrameHandle frame = pool->acquire();
        if (frame) {
            testing_support::fillNv12(*frame, testing_support::PlanarFrame(kWidth, kHeight, 128, 128, 128));
            frame->sequenceNum = sequenceNum;
            frame->timestamp = std::chrono::steady_clock::now();
        }
        return frame;
    }

    std::shared_ptr<FramePool> pool;
    std::shared_ptr<FrameMailbox> mailbox;
    std::shared_ptr<PredictionChannel> channel;
    std::shared_ptr<std::atomic<bool>> engineDestroyed;
    std::unique_ptr<ProcessingLoop> loop;
};

TEST_F(ProcessingLoopTest, StartsIdle) {
    EXPECT_EQ(loop->state(), PipelineState::Idle);
    EXPECT_FALSE(loop->isRunning());
}

TEST_F(ProcessingLoopTest, PublishesPredictionForFrame) {
    loop->start();
    ASSERT_TRUE(mailbox->publish(makeFrame(7)));

    auto prediction = channel->waitPop(std::chrono::seconds(5));

    ASSERT_TRUE(prediction.has_value());
    EXPECT_EQ(prediction->sequenceNum, 7U);
    EXPECT_EQ(prediction->outcome, FrameOutcome::Ok);
    EXPECT_EQ(prediction->labelIndex, 1);

    // Frame was released before the prediction went out
    EXPECT_EQ(pool->available(), pool->capacity());
    EXPECT_EQ(loop->stats().processed, 1U);
}

TEST_F(ProcessingLoopTest, EmptyFrameIsReportedAsDegraded) {
    loop->start();
    FrameHandle frame = pool->acquire();
    ASSERT_TRUE(frame);
    frame->sequenceNum = 4;
    ASSERT_TRUE(mailbox->publish(std::move(frame)));

    auto prediction = channel->waitPop(std::chrono::seconds(5));

    ASSERT_TRUE(prediction.has_value());
    EXPECT_EQ(prediction->outcome, FrameOutcome::Degraded);
    EXPECT_EQ(prediction->sequenceNum, 4U);
}

TEST_F(ProcessingLoopTest, StopDrainsAndReleasesEngine) {
    loop->start();
    ASSERT_TRUE(mailbox->publish(makeFrame(1)));
    ASSERT_TRUE(channel->waitPop(std::chrono::seconds(5)).has_value());

    loop->stop();

    EXPECT_EQ(loop->state(), PipelineState::Closed);
    EXPECT_FALSE(loop->isRunning());
    EXPECT_TRUE(engineDestroyed->load());
    EXPECT_TRUE(mailbox->isClosed());
    EXPECT_FALSE(mailbox->publish(makeFrame(2)));
    EXPECT_EQ(pool->available(), pool->capacity());
}

TEST_F(ProcessingLoopTest, StopReturnsPendingFrameToPool) {
    ASSERT_TRUE(mailbox->publish(makeFrame(1)));
    EXPECT_EQ(pool->available(), pool->capacity() - 1);

    loop->stop();

    EXPECT_EQ(pool->available(), pool->capacity());
    EXPECT_EQ(loop->state(), PipelineState::Closed);
    EXPECT_TRUE(engineDestroyed->load());
}

TEST_F(ProcessingLoopTest, ClosedLoopCannotRestart) {
    loop->stop();
    loop->start();

    EXPECT_FALSE(loop->isRunning());
    EXPECT_EQ(loop->state(), PipelineState::Closed);
}

TEST_F(ProcessingLoopTest, KeepsUpUnderBurst) {
    loop->start();
    for (uint32_t seq = 1; seq <= 50; ++seq) {
        FrameHandle frame = makeFrame(seq);
        if (frame) {
            mailbox->publish(std::move(frame));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    loop->stop();

    // Every frame went back to the pool, processed or dropped
    EXPECT_EQ(pool->available(), pool->capacity());
    EXPECT_GE(loop->stats().processed, 1U);
    EXPECT_EQ(loop->stats().failed, 0U);
}

} // namespace
} // namespace core
