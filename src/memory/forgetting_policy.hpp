#pragma once
#include <map>
#include <vector>
#include "memory/config.hpp"
#include "memory/replay_miner.hpp"
#include "memory/store.hpp"

namespace reverie::memory {

struct ForgettingResult {
    std::map<EntityId, SalienceUpdate> salience_updates;
    std::vector<EntityId> prunes;
};

// Salience decay and pruning of consolidated episodes. Cited episodes are
// left untouched.
class ForgettingPolicy {
public:
    explicit ForgettingPolicy(const MemoryConfig& config) : config_(config) {}

    // Considers episodes up to ws.watermark; citations come from the
    // workspace as it will be committed.
    ForgettingResult apply(const MemoryState& state, const DreamWorkspace& ws) const;

    double decayed_salience(const Episode& episode, Timestamp now) const;

private:
    MemoryConfig config_;
};

} // namespace reverie::memory
