#pragma once

#include <mutex>
#include <condition_variable>
#include <optional>
#include <chrono>
#include <cstdint>

namespace core {

/**
 * Single-slot mailbox with keep-only-latest semantics.
 *
 * publish() replaces any value that was not taken yet; the replaced value is
 * destroyed outside the lock (for FrameHandle this returns the frame to its
 * pool). close() drops the pending value, wakes all waiters and rejects
 * further publishes.
 *
 * @tparam T Move-constructible value type (FrameHandle, Prediction)
 */
template<typename T>
class LatestValue {
public:
    LatestValue() = default;

    LatestValue(const LatestValue&) = delete;
    LatestValue& operator=(const LatestValue&) = delete;

    /**
     * Stores value as the latest one.
     * Returns false if the mailbox is closed (value is discarded).
     */
    bool publish(T value) {
        std::optional<T> replaced;
        bool accepted = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                replaced.emplace(std::move(value));
            } else {
                accepted = true;
                if (slot_) {
                    replaced.emplace(std::move(*slot_));
                    ++dropped_;
                }
                slot_.emplace(std::move(value));
                ++published_;
            }
        }
        if (accepted) {
            cv_.notify_one();
        }
        return accepted;
    }

    /**
     * Takes the latest value if there is one.
     */
    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mutex_);
        return take();
    }

    /**
     * Blocks until a value arrives, the mailbox is closed, or timeout expires.
     * Returns std::nullopt on close or timeout.
     */
    template<typename Rep, typename Period>
    std::optional<T> waitPop(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return closed_ || slot_.has_value(); });
        return take();
    }

    /**
     * Blocks until a value arrives or the mailbox is closed.
     */
    std::optional<T> waitPop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || slot_.has_value(); });
        return take();
    }

    void close() {
        std::optional<T> pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            pending.swap(slot_);
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool isClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]] bool hasValue() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return slot_.has_value();
    }

    // Values replaced before anybody took them
    [[nodiscard]] uint64_t dropped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

    [[nodiscard]] uint64_t published() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return published_;
    }

private:
    // Caller holds mutex_
    std::optional<T> take() {
        if (closed_ || !slot_) {
            return std::nullopt;
        }
        std::optional<T> value(std::move(slot_));
        slot_.reset();
        return value;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<T> slot_;
    bool closed_ = false;
    uint64_t dropped_ = 0;
    uint64_t published_ = 0;
};

} // namespace core
