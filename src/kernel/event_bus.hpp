#pragma once
#include <cstdint>
#include <deque>
#include <set>
#include <unordered_map>
#include <mutex>
#include <chrono>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace reverie::kernel {

// Memory events published to subscribed agents
enum class KernelEventType {
    EPISODE_APPENDED,         // New episode stored
    CONSOLIDATION_COMMITTED,  // Dream cycle applied a batch
    CONSOLIDATION_ABORTED,    // Dream cycle failed, nothing applied
    BELIEF_DISPUTED,          // Belief entered disputed
    HYPOTHESIS_RESOLVED,      // Hypothesis verified or rejected
    GOAL_UPDATED,             // Goal created or changed
    CUSTOM                    // User-defined event
};

// Kernel event
struct KernelEvent {
    uint64_t seq = 0;          // bus-wide, gaps mean dropped events
    KernelEventType type;
    nlohmann::json data;
    std::chrono::system_clock::time_point timestamp;
    uint32_t source_agent_id;  // 0 = kernel
};

// Convert KernelEventType to string
inline std::string kernel_event_type_to_string(KernelEventType type) {
    switch (type) {
        case KernelEventType::EPISODE_APPENDED:        return "EPISODE_APPENDED";
        case KernelEventType::CONSOLIDATION_COMMITTED: return "CONSOLIDATION_COMMITTED";
        case KernelEventType::CONSOLIDATION_ABORTED:   return "CONSOLIDATION_ABORTED";
        case KernelEventType::BELIEF_DISPUTED:         return "BELIEF_DISPUTED";
        case KernelEventType::HYPOTHESIS_RESOLVED:     return "HYPOTHESIS_RESOLVED";
        case KernelEventType::GOAL_UPDATED:            return "GOAL_UPDATED";
        case KernelEventType::CUSTOM:                  return "CUSTOM";
        default: return "UNKNOWN";
    }
}

// Parse KernelEventType from string
inline KernelEventType kernel_event_type_from_string(const std::string& str) {
    if (str == "EPISODE_APPENDED")        return KernelEventType::EPISODE_APPENDED;
    if (str == "CONSOLIDATION_COMMITTED") return KernelEventType::CONSOLIDATION_COMMITTED;
    if (str == "CONSOLIDATION_ABORTED")   return KernelEventType::CONSOLIDATION_ABORTED;
    if (str == "BELIEF_DISPUTED")         return KernelEventType::BELIEF_DISPUTED;
    if (str == "HYPOTHESIS_RESOLVED")     return KernelEventType::HYPOTHESIS_RESOLVED;
    if (str == "GOAL_UPDATED")            return KernelEventType::GOAL_UPDATED;
    return KernelEventType::CUSTOM;
}

// Per-agent event queues. A queue holds at most max_queued events; the
// oldest are dropped first.
class EventBus {
public:
    explicit EventBus(size_t max_queued = 1024) : max_queued_(max_queued) {}

    void emit(KernelEventType type, const nlohmann::json& data, uint32_t source_agent_id);
    void subscribe(uint32_t agent_id, const std::vector<KernelEventType>& types);
    void unsubscribe(uint32_t agent_id, const std::vector<KernelEventType>& types, bool unsubscribe_all);
    nlohmann::json poll(uint32_t agent_id, int max_events);

    uint64_t dropped(uint32_t agent_id);

private:
    struct AgentQueue {
        std::deque<KernelEvent> events;
        uint64_t dropped = 0;
    };

    size_t max_queued_;
    uint64_t next_seq_ = 1;
    std::unordered_map<uint32_t, std::set<KernelEventType>> subscriptions_;
    std::unordered_map<uint32_t, AgentQueue> queues_;
    std::mutex mutex_;
};

} // namespace reverie::kernel
