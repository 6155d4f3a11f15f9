#include "pending_intents.hpp"
#include "extension_filter.hpp"
#include "debug.hpp"

void PendingIntentQueue::enqueue(const std::vector<std::string>& paths) {
    std::vector<std::string> supported = filter_supported(paths);
    if (supported.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    paths_.insert(paths_.end(), supported.begin(), supported.end());
    DEBUG_LOGLN << "PendingIntentQueue: queued " << supported.size()
                << " path(s), " << paths_.size() << " pending";
}

std::vector<std::string> PendingIntentQueue::drain_all() {
    std::vector<std::string> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(paths_);
    }
    return drained;
}

size_t PendingIntentQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paths_.size();
}
