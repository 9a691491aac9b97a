#include "memory/contradiction_resolver.hpp"
#include "memory/text.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace reverie::memory {

bool ContradictionResolver::contradicts(const Belief& a, const Belief& b) const {
    if (a.id == b.id || a.scope != b.scope) {
        return false;
    }
    if (a.polarity == Polarity::NEUTRAL || b.polarity != opposite(a.polarity)) {
        return false;
    }
    return text::jaccard(a.subject, b.subject) >= config_.contradiction_threshold;
}

ResolutionSummary ContradictionResolver::resolve(DreamWorkspace& ws) const {
    ResolutionSummary summary;

    std::set<EntityId> was_disputed;
    for (const auto& [id, b] : ws.beliefs) {
        if (b.status == BeliefStatus::DISPUTED) was_disputed.insert(id);
    }

    for (EntityId id : ws.touched_beliefs) {
        Belief& belief = ws.beliefs.at(id);
        if (!belief.is_live()) continue;
        for (auto& [other_id, other] : ws.beliefs) {
            if (other_id == id || !other.is_live()) continue;
            if (contradicts(belief, other)) {
                link(ws, belief, other, summary);
            }
        }
    }

    // Time-driven rules only run when the window had episodes, so an empty
    // run changes nothing.
    if (!ws.processed.empty()) {
        decay_stale(ws, summary);
        supersede(ws, was_disputed, summary);
    }

    recompute_status(ws, summary);

    if (summary.links_added > 0 || summary.retracted > 0) {
        spdlog::info("ContradictionResolver: {} new conflict link(s), {} disputed, {} retracted",
                     summary.links_added, summary.disputed, summary.retracted);
    }
    return summary;
}

void ContradictionResolver::link(DreamWorkspace& ws, Belief& a, Belief& b,
                                 ResolutionSummary& summary) const {
    if (a.conflicts_with_ids.count(b.id) > 0 && b.conflicts_with_ids.count(a.id) > 0) {
        return;
    }
    a.conflicts_with_ids.insert(b.id);
    b.conflicts_with_ids.insert(a.id);

    for (Belief* side : {&a, &b}) {
        side->confidence = std::max(0.0, side->confidence - config_.dispute_penalty);
        side->updated_at = ws.now;
        ws.changed_beliefs.insert(side->id);
    }
    summary.links_added++;

    spdlog::debug("ContradictionResolver: belief {} conflicts with {}", a.id, b.id);
}

void ContradictionResolver::decay_stale(DreamWorkspace& ws, ResolutionSummary& summary) const {
    for (auto& [id, b] : ws.beliefs) {
        if (b.verified || ws.touched_beliefs.count(id) > 0) continue;
        if (b.status != BeliefStatus::PROPOSED && b.status != BeliefStatus::DISPUTED) continue;
        if (ws.now - b.last_corroborated_at <= config_.belief_stale_after_ms) continue;
        if (b.confidence <= config_.belief_decay_floor) continue;

        b.confidence = std::max(config_.belief_decay_floor, b.confidence * config_.belief_decay);
        b.updated_at = ws.now;
        ws.changed_beliefs.insert(id);
        summary.decayed++;
    }
}

void ContradictionResolver::supersede(DreamWorkspace& ws, const std::set<EntityId>& was_disputed,
                                      ResolutionSummary& summary) const {
    for (EntityId id : was_disputed) {
        Belief& b = ws.beliefs.at(id);
        if (b.verified || ws.corroborated_beliefs.count(id) > 0) continue;
        if (b.confidence >= config_.retract_threshold) continue;

        b.status = BeliefStatus::RETRACTED;
        b.updated_at = ws.now;
        ws.changed_beliefs.insert(id);
        summary.retracted++;
        spdlog::info("ContradictionResolver: belief {} superseded ({:.3f})", id, b.confidence);
    }
}

void ContradictionResolver::recompute_status(DreamWorkspace& ws, ResolutionSummary& summary) const {
    for (auto& [id, b] : ws.beliefs) {
        if (!b.is_live()) continue;

        bool live_conflict = false;
        for (EntityId other : b.conflicts_with_ids) {
            auto it = ws.beliefs.find(other);
            if (it != ws.beliefs.end() && it->second.is_live()) {
                live_conflict = true;
                break;
            }
        }

        BeliefStatus next = b.status;
        if (live_conflict) {
            next = BeliefStatus::DISPUTED;
        } else if (b.confidence > config_.confirm_threshold) {
            next = BeliefStatus::CONFIRMED;
        } else if (b.status == BeliefStatus::DISPUTED) {
            next = BeliefStatus::PROPOSED;
        }
        if (next == b.status) continue;

        b.status = next;
        b.updated_at = ws.now;
        if (next == BeliefStatus::CONFIRMED) {
            b.last_confirmed_at = ws.now;
            summary.confirmed++;
        } else if (next == BeliefStatus::DISPUTED) {
            summary.disputed++;
            summary.newly_disputed.insert(id);
        }
        ws.changed_beliefs.insert(id);
    }
}

} // namespace reverie::memory
