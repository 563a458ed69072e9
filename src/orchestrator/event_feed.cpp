/**
 * @file event_feed.cpp
 * @brief EventFeed implementation.
 */

#include "orchestrator/event_feed.hpp"

namespace hybrid_orchestrator {

namespace {

std::vector<FeedEvent> tail(const std::vector<FeedEvent>& events, uint64_t after) {
    // sequence == index + 1
    if (after >= events.size()) return {};
    return {events.begin() + static_cast<std::ptrdiff_t>(after), events.end()};
}

}  // anonymous namespace

uint64_t EventFeed::publish(FeedEvent event) {
    uint64_t sequence = 0;
    {
        std::lock_guard lock(mutex_);
        auto& log = events_[event.job];
        sequence = log.size() + 1;
        event.sequence = sequence;
        if (event.at == Timestamp{}) event.at = std::chrono::system_clock::now();
        log.push_back(std::move(event));
    }
    cv_.notify_all();
    return sequence;
}

std::vector<FeedEvent> EventFeed::read(const JobId& job, uint64_t after) const {
    std::lock_guard lock(mutex_);
    auto it = events_.find(job);
    if (it == events_.end()) return {};
    return tail(it->second, after);
}

std::vector<FeedEvent> EventFeed::wait_for(const JobId& job, uint64_t after,
                                           std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, timeout, [&] {
        auto it = events_.find(job);
        return it != events_.end() && it->second.size() > after;
    });
    auto it = events_.find(job);
    if (it == events_.end()) return {};
    return tail(it->second, after);
}

uint64_t EventFeed::last_sequence(const JobId& job) const {
    std::lock_guard lock(mutex_);
    auto it = events_.find(job);
    return it == events_.end() ? 0 : it->second.size();
}

void EventFeed::forget(const JobId& job) {
    std::lock_guard lock(mutex_);
    events_.erase(job);
}

}  // namespace hybrid_orchestrator
