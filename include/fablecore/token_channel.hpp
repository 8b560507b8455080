#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

namespace fablecore {

/**
 * Bounded single-producer/single-consumer queue of narration tokens.
 *
 * push() blocks while the queue is full, which slows the narrator down to
 * the consumer's pace. Once the consumer cancels, push() returns false and
 * the producer is expected to stop.
 */
class TokenChannel {
public:
    enum class PopStatus {
        Token,
        Finished,
        Failed,
        TimedOut,
        Cancelled,
    };

    explicit TokenChannel(std::size_t capacity);

    TokenChannel(const TokenChannel&) = delete;
    TokenChannel& operator=(const TokenChannel&) = delete;

    /// Producer side. Returns false when the channel was cancelled.
    bool push(std::string token);

    /// Producer finished normally.
    void finish();

    /// Producer gave up; the reason is reported to the consumer.
    void fail(std::string reason);

    /**
     * Consumer side. Waits until a token is available, the producer ended,
     * or the deadline passes. Tokens queued before finish() or fail() are
     * still delivered first.
     */
    PopStatus pop_until(std::string& token, std::chrono::steady_clock::time_point deadline);

    /// Consumer gone: wakes a blocked producer and drops queued tokens.
    void cancel();

    bool cancelled() const;
    std::optional<std::string> failure() const;
    std::size_t capacity() const { return capacity_; }

private:
    std::size_t capacity_;
    std::queue<std::string> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool finished_{false};
    bool cancelled_{false};
    std::optional<std::string> failure_;
};

} // namespace fablecore
