#include "outbound_queue.h"
#include <iterator>

void OutboundQueue::append(const std::vector<UsageEvent>& events) {
    events_.insert(events_.end(), events.begin(), events.end());
}

std::vector<UsageEvent> OutboundQueue::snapshot() {
    std::vector<UsageEvent> taken(std::make_move_iterator(events_.begin()),
                                  std::make_move_iterator(events_.end()));
    events_.clear();
    return taken;
}

void OutboundQueue::restoreFront(std::vector<UsageEvent> snapshot) {
    events_.insert(events_.begin(),
                   std::make_move_iterator(snapshot.begin()),
                   std::make_move_iterator(snapshot.end()));
}
