#pragma once

#include "core/Frame.hpp"
#include <vector>
#include <memory>
#include <mutex>

namespace core {

class FramePool;

/**
 * Exclusive, move-only ownership of one pooled Frame.
 * The frame goes back to its pool exactly once: on destruction, on
 * reset(), or when the handle is overwritten by a move.
 * The pool must outlive every handle it gave out.
 */
class FrameHandle {
public:
    FrameHandle() = default;
    FrameHandle(Frame* frame, FramePool* pool) : frame_(frame), pool_(pool) {}
    ~FrameHandle() { reset(); }

    FrameHandle(FrameHandle&& other) noexcept
        : frame_(other.frame_), pool_(other.pool_) {
        other.frame_ = nullptr;
        other.pool_ = nullptr;
    }

    FrameHandle& operator=(FrameHandle&& other) noexcept {
        if (this != &other) {
            reset();
            frame_ = other.frame_;
            pool_ = other.pool_;
            other.frame_ = nullptr;
            other.pool_ = nullptr;
        }
        return *this;
    }

    FrameHandle(const FrameHandle&) = delete;
    FrameHandle& operator=(const FrameHandle&) = delete;

    void reset() noexcept;

    Frame* get() const { return frame_; }
    Frame* operator->() const { return frame_; }
    Frame& operator*() const { return *frame_; }
    explicit operator bool() const { return frame_ != nullptr; }

private:
    Frame* frame_ = nullptr;
    FramePool* pool_ = nullptr;
};

/**
 * Fixed set of pre-allocated frame buffers.
 *
 * acquire() and release may be called from different threads (capture thread
 * acquires and drops superseded frames, worker thread releases processed ones).
 */
class FramePool {
public:
    FramePool(size_t poolSize, size_t bufferSize);

    FramePool(const FramePool&) = delete;
    FramePool& operator=(const FramePool&) = delete;

    /**
     * Acquires a free frame from the pool.
     * Returns an empty handle if no frames are available (backpressure/starvation).
     */
    FrameHandle acquire();

    [[nodiscard]] size_t available() const;
    [[nodiscard]] size_t capacity() const { return storage_.size(); }
    [[nodiscard]] size_t bufferSize() const { return bufferSize_; }

private:
    friend class FrameHandle;

    /**
     * Releases a frame back to the pool.
     */
    void release(Frame* frame);

    size_t bufferSize_;

    // Storage to keep frames alive
    std::vector<std::unique_ptr<Frame>> storage_;

    mutable std::mutex mutex_;
    std::vector<Frame*> free_;
};

} // namespace core
