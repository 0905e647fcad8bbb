#pragma once

#include <deque>
#include <vector>
#include "usage_event.h"

// Ordered buffer of events waiting for delivery
class OutboundQueue {
public:
    void append(const std::vector<UsageEvent>& events);

    size_t size() const { return events_.size(); }
    bool empty() const { return events_.empty(); }

    // Takes everything queued so far and leaves the queue empty
    std::vector<UsageEvent> snapshot();

    // Puts a failed snapshot back ahead of anything queued since it was taken
    void restoreFront(std::vector<UsageEvent> snapshot);

    const std::deque<UsageEvent>& peek() const { return events_; }

private:
    std::deque<UsageEvent> events_;
};
