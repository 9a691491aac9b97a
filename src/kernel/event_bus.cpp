#include "kernel/event_bus.hpp"
#include <spdlog/spdlog.h>

namespace reverie::kernel {

namespace {

nlohmann::json event_to_json(const KernelEvent& event) {
    nlohmann::json j;
    j["seq"] = event.seq;
    j["type"] = kernel_event_type_to_string(event.type);
    j["data"] = event.data;
    j["source_agent_id"] = event.source_agent_id;
    j["timestamp"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        event.timestamp.time_since_epoch()).count();
    return j;
}

} // namespace

void EventBus::emit(KernelEventType type, const nlohmann::json& data, uint32_t source_agent_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    KernelEvent event;
    event.seq = next_seq_++;
    event.type = type;
    event.data = data;
    event.timestamp = std::chrono::system_clock::now();
    event.source_agent_id = source_agent_id;

    for (const auto& [agent_id, subscriptions] : subscriptions_) {
        if (subscriptions.count(type) == 0) {
            continue;
        }
        auto& queue = queues_[agent_id];
        if (max_queued_ > 0 && queue.events.size() >= max_queued_) {
            queue.events.pop_front();
            queue.dropped++;
            spdlog::warn("EventBus: queue for agent {} full, oldest event dropped", agent_id);
        }
        queue.events.push_back(event);
        spdlog::debug("EventBus: {} queued for agent {}", kernel_event_type_to_string(type), agent_id);
    }
}

void EventBus::subscribe(uint32_t agent_id, const std::vector<KernelEventType>& types) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& subs = subscriptions_[agent_id];
    subs.insert(types.begin(), types.end());
}

void EventBus::unsubscribe(uint32_t agent_id, const std::vector<KernelEventType>& types, bool unsubscribe_all) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (unsubscribe_all) {
        subscriptions_.erase(agent_id);
        queues_.erase(agent_id);
        return;
    }

    auto it = subscriptions_.find(agent_id);
    if (it == subscriptions_.end()) {
        return;
    }
    for (auto type : types) {
        it->second.erase(type);
    }
}

nlohmann::json EventBus::poll(uint32_t agent_id, int max_events) {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json events_array = nlohmann::json::array();
    auto it = queues_.find(agent_id);
    if (it == queues_.end()) {
        return events_array;
    }

    auto& events = it->second.events;
    for (int count = 0; !events.empty() && count < max_events; ++count) {
        events_array.push_back(event_to_json(events.front()));
        events.pop_front();
    }
    return events_array;
}

uint64_t EventBus::dropped(uint32_t agent_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = queues_.find(agent_id);
    return it == queues_.end() ? 0 : it->second.dropped;
}

} // namespace reverie::kernel
