#include "core/FramePool.hpp"
#include "core/Logger.hpp"

namespace core {

void FrameHandle::reset() noexcept {
    if (frame_ && pool_) {
        pool_->release(frame_);
    }
    frame_ = nullptr;
    pool_ = nullptr;
}

FramePool::FramePool(size_t poolSize, size_t bufferSize)
    : bufferSize_(bufferSize) {
    storage_.reserve(poolSize);
    free_.reserve(poolSize);

    for (size_t i = 0; i < poolSize; ++i) {
        auto frame = std::make_unique<Frame>();
        frame->data = allocate_aligned<uint8_t>(bufferSize);
        frame->capacity = bufferSize;

        free_.push_back(frame.get());
        storage_.push_back(std::move(frame));
    }

    Logger::info("FramePool initialized with ", poolSize, " frames of ", bufferSize, " bytes");
}

FrameHandle FramePool::acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (free_.empty()) {
        return {};
    }
    Frame* frame = free_.back();
    free_.pop_back();

    frame->clearImage();
    frame->sequenceNum = 0;
    return FrameHandle(frame, this);
}

void FramePool::release(Frame* frame) {
    if (!frame) return;
    std::lock_guard<std::mutex> lock(mutex_);
    if (free_.size() >= storage_.size()) {
        Logger::error("FramePool: release of frame beyond pool capacity (double release?)");
        return;
    }
    free_.push_back(frame);
}

size_t FramePool::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return free_.size();
}

} // namespace core
