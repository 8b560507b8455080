#include "fablecore/token_channel.hpp"
#include "fablecore/errors.hpp"

namespace fablecore {

TokenChannel::TokenChannel(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw ValidationError("Token channel capacity must be positive");
    }
}

bool TokenChannel::push(std::string token) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return cancelled_ || queue_.size() < capacity_; });
    if (cancelled_ || finished_ || failure_) {
        return false;
    }
    queue_.push(std::move(token));
    lock.unlock();
    cv_.notify_all();
    return true;
}

void TokenChannel::finish() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_ = true;
    }
    cv_.notify_all();
}

void TokenChannel::fail(std::string reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!failure_) {
            failure_ = std::move(reason);
        }
    }
    cv_.notify_all();
}

TokenChannel::PopStatus TokenChannel::pop_until(std::string& token,
                                                std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_until(lock, deadline, [this] {
        return cancelled_ || !queue_.empty() || finished_ || failure_.has_value();
    });

    if (cancelled_) {
        return PopStatus::Cancelled;
    }
    if (!queue_.empty()) {
        token = std::move(queue_.front());
        queue_.pop();
        lock.unlock();
        cv_.notify_all();
        return PopStatus::Token;
    }
    if (failure_) {
        return PopStatus::Failed;
    }
    if (finished_) {
        return PopStatus::Finished;
    }
    return PopStatus::TimedOut;
}

void TokenChannel::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        std::queue<std::string>().swap(queue_);
    }
    cv_.notify_all();
}

bool TokenChannel::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

std::optional<std::string> TokenChannel::failure() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_;
}

} // namespace fablecore
