#include "keypack/progress_channel.hpp"

#include <algorithm>
#include <utility>

namespace keypack {

float ProgressChannel::Progress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.progress;
}

bool ProgressChannel::IsComplete() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.complete;
}

bool ProgressChannel::Success() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.success;
}

ProgressState ProgressChannel::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void ProgressChannel::SetProgress(const float value) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.progress = std::clamp(value, 0.0F, 1.0F);
        MarkChangedLocked();
    }
    changed_.notify_all();
}

void ProgressChannel::AddProgress(const float delta) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.progress = std::clamp(state_.progress + delta, 0.0F, 1.0F);
        MarkChangedLocked();
    }
    changed_.notify_all();
}

void ProgressChannel::Finish(const bool success) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.success = success;
        state_.complete = true;
        MarkChangedLocked();
    }
    changed_.notify_all();
}

void ProgressChannel::Log(std::string message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.push_back(std::move(message));
        MarkChangedLocked();
    }
    changed_.notify_all();
}

bool ProgressChannel::HasMessages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !messages_.empty();
}

bool ProgressChannel::NextMessage(std::string& out_message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (messages_.empty()) {
        return false;
    }
    out_message = std::move(messages_.front());
    messages_.pop_front();
    return true;
}

std::vector<std::string> ProgressChannel::DrainMessages() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(messages_.size());
    while (!messages_.empty()) {
        out.push_back(std::move(messages_.front()));
        messages_.pop_front();
    }
    return out;
}

bool ProgressChannel::WaitForUpdate(const std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    const bool updated = changed_.wait_for(lock, timeout, [this] { return pending_update_; });
    pending_update_ = false;
    return updated;
}

void ProgressChannel::MarkChangedLocked() {
    pending_update_ = true;
}

}  // namespace keypack
