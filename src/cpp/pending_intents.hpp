#pragma once

#include <mutex>
#include <string>
#include <vector>

// File-open intents that arrived before a UI surface could take them.
// Enqueue runs from native callbacks, drain from the UI's startup request;
// every operation holds the queue lock for its whole duration.
class PendingIntentQueue {
public:
    PendingIntentQueue() = default;

    PendingIntentQueue(const PendingIntentQueue&) = delete;
    PendingIntentQueue& operator=(const PendingIntentQueue&) = delete;

    // Append supported paths in arrival order. Unsupported paths are dropped.
    void enqueue(const std::vector<std::string>& paths);

    // Remove and return everything queued, oldest first
    std::vector<std::string> drain_all();

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::string> paths_;
};
