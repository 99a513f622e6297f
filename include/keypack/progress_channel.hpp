#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace keypack {

struct ProgressState {
    float progress = 0.0F;
    bool complete = false;
    bool success = false;
};

// Shared state between a running operation (the only writer of the
// progress fields) and the thread polling it. Every accessor takes the same
// mutex, so a snapshot always shows all three fields from one instant.
// Log messages are delivered in FIFO order.
class ProgressChannel {
public:
    float Progress() const;
    bool IsComplete() const;
    bool Success() const;
    ProgressState Snapshot() const;

    void SetProgress(float value);
    // Clamped to [0, 1].
    void AddProgress(float delta);

    // Publishes the final outcome; success is visible no later than complete.
    void Finish(bool success);

    void Log(std::string message);
    bool HasMessages() const;
    bool NextMessage(std::string& out_message);
    std::vector<std::string> DrainMessages();

    // Blocks until any field changes or a message arrives since the last
    // call, or until timeout expires. Returns false on timeout.
    bool WaitForUpdate(std::chrono::milliseconds timeout);

private:
    void MarkChangedLocked();

    mutable std::mutex mutex_;
    std::condition_variable changed_;
    ProgressState state_;
    std::deque<std::string> messages_;
    bool pending_update_ = false;
};

}  // namespace keypack
