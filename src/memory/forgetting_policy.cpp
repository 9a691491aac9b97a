#include "memory/forgetting_policy.hpp"
#include <cmath>
#include <spdlog/spdlog.h>

namespace reverie::memory {

double ForgettingPolicy::decayed_salience(const Episode& episode, Timestamp now) const {
    const Timestamp elapsed = now - episode.salience_updated_at;
    if (elapsed <= 0 || config_.salience_half_life_ms <= 0) {
        return episode.salience;
    }
    return episode.salience *
           std::pow(0.5, static_cast<double>(elapsed) / static_cast<double>(config_.salience_half_life_ms));
}

ForgettingResult ForgettingPolicy::apply(const MemoryState& state, const DreamWorkspace& ws) const {
    ForgettingResult result;
    const auto cited = cited_episodes(ws.beliefs, ws.skills);

    for (auto it = state.episodes.begin();
         it != state.episodes.end() && it->first <= ws.watermark; ++it) {
        const Episode& e = it->second;
        if (e.pruned || cited.count(e.id) > 0) continue;

        const double salience = decayed_salience(e, ws.now);
        if (salience < e.salience) {
            result.salience_updates[e.id] = SalienceUpdate{salience, ws.now};
        }

        const bool expired = ws.now - e.timestamp > config_.retention_ms;
        if (expired && salience < config_.prune_floor) {
            result.prunes.push_back(e.id);
        }
    }

    if (!result.prunes.empty()) {
        spdlog::info("ForgettingPolicy: pruning {} episode(s), {} decayed",
                     result.prunes.size(), result.salience_updates.size());
    }
    return result;
}

} // namespace reverie::memory
