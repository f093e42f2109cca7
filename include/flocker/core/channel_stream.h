#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <utility>

#include <flocker/core/types.h>

namespace flocker {

/**
 * Lazy, cancellable sequence of samples produced by a background source.
 *
 * next() blocks for at most `timeout` and returns std::nullopt when no item
 * arrived in time or the stream is finished; closed() tells the two apart.
 * cancel() only affects this stream: the producer notices on its next push and
 * winds down, pending items are dropped.
 */
template <typename T> class Stream {
public:
    virtual ~Stream() = default;

    virtual std::optional<T> next(std::chrono::milliseconds timeout) = 0;

    virtual void cancel() = 0;

    // True once the producer finished (or the stream was cancelled) and the
    // buffer is drained.
    virtual bool closed() const = 0;

    virtual bool cancelled() const = 0;

    // Set when the producer ended because of an error rather than end-of-data.
    virtual std::optional<Error> failure() const = 0;
};

template <typename T> class ChannelStream : public Stream<T> {
public:
    explicit ChannelStream(std::size_t capacity = 256) : capacity_(capacity) {}

    ChannelStream(const ChannelStream&) = delete;
    ChannelStream& operator=(const ChannelStream&) = delete;

    ~ChannelStream() override { cancel(); }

    // Producer side. Returns false once the consumer cancelled; the producer
    // should stop. The oldest item is dropped when the buffer is full.
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_ || finished_)
                return false;
            if (items_.size() >= capacity_)
                items_.pop_front();
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    void finish(std::optional<Error> failure = std::nullopt) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (finished_)
                return;
            finished_ = true;
            if (!cancelled_)
                failure_ = std::move(failure);
        }
        cv_.notify_all();
    }

    // Invoked once, outside the lock, when the consumer cancels.
    void onCancel(std::function<void()> hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelHook_ = std::move(hook);
    }

    std::optional<T> next(std::chrono::milliseconds timeout) override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout,
                     [this] { return cancelled_ || finished_ || !items_.empty(); });
        if (cancelled_ || items_.empty())
            return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    void cancel() override {
        std::function<void()> hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_)
                return;
            cancelled_ = true;
            items_.clear();
            hook = std::move(cancelHook_);
        }
        cv_.notify_all();
        if (hook)
            hook();
    }

    bool closed() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_ || (finished_ && items_.empty());
    }

    bool cancelled() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    std::optional<Error> failure() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return failure_;
    }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool cancelled_{false};
    bool finished_{false};
    std::optional<Error> failure_;
    std::function<void()> cancelHook_;
};

} // namespace flocker
