#pragma once
#include <cstddef>
#include <set>
#include "memory/config.hpp"
#include "memory/replay_miner.hpp"

namespace reverie::memory {

struct ResolutionSummary {
    size_t links_added = 0;
    size_t disputed = 0;        // beliefs that entered disputed this run
    size_t confirmed = 0;       // beliefs that entered confirmed this run
    size_t retracted = 0;
    size_t decayed = 0;
    std::set<EntityId> newly_disputed;
};

// Flags conflicting beliefs in a DreamWorkspace and re-evaluates every
// belief's status.
class ContradictionResolver {
public:
    explicit ContradictionResolver(const MemoryConfig& config) : config_(config) {}

    ResolutionSummary resolve(DreamWorkspace& ws) const;

    // Same scope, similar subjects, opposite polarities.
    bool contradicts(const Belief& a, const Belief& b) const;

private:
    MemoryConfig config_;

    void link(DreamWorkspace& ws, Belief& a, Belief& b, ResolutionSummary& summary) const;
    void decay_stale(DreamWorkspace& ws, ResolutionSummary& summary) const;
    void supersede(DreamWorkspace& ws, const std::set<EntityId>& was_disputed,
                   ResolutionSummary& summary) const;
    void recompute_status(DreamWorkspace& ws, ResolutionSummary& summary) const;
};

} // namespace reverie::memory
