#ifndef DEDUP_WINDOW_H
#define DEDUP_WINDOW_H

// =============================================================================
// FileBridge Hub: Message Dedup Window
// =============================================================================
// msg_id -> first-seen time. Entries older than the window are pruned on
// every lookup, so uniqueness only holds inside the window.
// =============================================================================

#include <string>
#include <mutex>
#include <unordered_map>

#include "hub_common.h"

class DedupWindow {
public:
    DedupWindow(double window_sec, const HubClock* clock)
        : window_(window_sec), clock_(clock) {}

    DedupWindow(const DedupWindow&) = delete;
    DedupWindow& operator=(const DedupWindow&) = delete;

    // true if msg_id was already seen inside the window; otherwise records it
    bool is_dup(const std::string& msg_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        double now = clock_->now();
        for (auto it = seen_.begin(); it != seen_.end(); ) {
            if (now - it->second > window_) it = seen_.erase(it);
            else ++it;
        }
        if (seen_.count(msg_id)) return true;
        seen_.emplace(msg_id, now);
        return false;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return seen_.size();
    }

private:
    double window_;
    const HubClock* clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, double> seen_;
};

#endif
