#include "memory/replay_miner.hpp"
#include "memory/errors.hpp"
#include "memory/text.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <spdlog/spdlog.h>

namespace reverie::memory {

std::vector<Belief> DreamWorkspace::belief_upserts() const {
    std::vector<Belief> out;
    for (EntityId id : changed_beliefs) {
        auto it = beliefs.find(id);
        if (it != beliefs.end()) out.push_back(it->second);
    }
    return out;
}

std::vector<Skill> DreamWorkspace::skill_upserts() const {
    std::vector<Skill> out;
    for (EntityId id : changed_skills) {
        auto it = skills.find(id);
        if (it != skills.end()) out.push_back(it->second);
    }
    return out;
}

ReplayMiner::ReplayMiner(Store& store, const MemoryConfig& config,
                         std::shared_ptr<ExtractionProvider> extractor,
                         std::shared_ptr<EmbeddingProvider> embedder)
    : store_(store)
    , config_(config)
    , extractor_(std::move(extractor))
    , embedder_(std::move(embedder))
    , heuristic_(config) {}

std::vector<EntityId> ReplayMiner::select_window(const MemoryState& state, EntityId high,
                                                 size_t batch_size) {
    std::vector<const Episode*> window;
    for (auto it = state.episodes.upper_bound(state.watermark);
         it != state.episodes.end() && it->first <= high && window.size() < batch_size; ++it) {
        window.push_back(&it->second);
    }

    std::stable_sort(window.begin(), window.end(), [](const Episode* a, const Episode* b) {
        if (a->timestamp != b->timestamp) return a->timestamp < b->timestamp;
        return a->id < b->id;
    });

    std::vector<EntityId> ids;
    ids.reserve(window.size());
    for (const auto* e : window) ids.push_back(e->id);
    return ids;
}

DreamWorkspace ReplayMiner::mine(const MemoryState& state, EntityId high) {
    DreamWorkspace ws;
    ws.prior_watermark = state.watermark;
    ws.watermark = state.watermark;
    ws.now = store_.now();
    ws.beliefs = state.beliefs;
    ws.skills = state.skills;
    ws.processed = select_window(state, high, config_.batch_size);

    for (EntityId id : ws.processed) {
        const Episode& episode = state.episodes.at(id);
        ws.watermark = std::max(ws.watermark, id);
        if (episode.pruned) continue;

        const auto& fields = episode.payload.fields;
        if (fields.contains("tags") && fields["tags"].is_array()) {
            for (const auto& tag : fields["tags"]) {
                if (tag.is_string()) ws.tag_counts[tag.get<std::string>()]++;
            }
        }

        for (auto& candidate : candidates_for(episode)) {
            absorb(ws, std::move(candidate), episode);
        }

        if (auto outcome = extract_skill_outcome(episode)) {
            record_outcome(ws, *outcome);
        }
    }

    refresh_self_model(ws, state);
    promote_hypotheses(ws, state);

    spdlog::debug("ReplayMiner: {} episode(s) in ({}, {}], {} new belief(s), {} corroborated",
                  ws.processed.size(), ws.prior_watermark, ws.watermark,
                  ws.created_beliefs.size(), ws.corroborated_beliefs.size());
    return ws;
}

std::vector<CandidateBelief> ReplayMiner::candidates_for(const Episode& episode) {
    if (extractor_) {
        if (auto delegated = extractor_->extract(episode)) {
            if (!delegated->empty()) {
                return std::move(*delegated);
            }
        }
    }
    return heuristic_.extract(episode).value_or(std::vector<CandidateBelief>{});
}

Belief ReplayMiner::new_belief(const CandidateBelief& candidate, Timestamp now) {
    Belief b;
    b.id = store_.reserve_belief_id();
    b.statement = candidate.statement;
    b.subject = candidate.subject;
    b.polarity = candidate.polarity;
    b.scope = candidate.scope.empty() ? "global" : candidate.scope;
    b.verified = candidate.verified;
    b.confidence = candidate.verified ? candidate.confidence
                                      : std::min(candidate.confidence, config_.max_unverified_confidence);
    b.status = BeliefStatus::PROPOSED;
    b.created_at = now;
    b.updated_at = now;
    if (embedder_) {
        b.embedding = embedder_->embed(b.statement);
    }
    return b;
}

void ReplayMiner::absorb(DreamWorkspace& ws, CandidateBelief candidate, const Episode& episode) {
    if (!std::isfinite(candidate.confidence) || candidate.confidence < 0.0 ||
        candidate.confidence > 1.0) {
        throw ValidationFailure("candidate confidence outside [0,1] from episode " +
                                std::to_string(episode.id));
    }
    if (candidate.statement.empty()) {
        spdlog::warn("ReplayMiner: empty candidate from episode {}, skipped", episode.id);
        return;
    }
    derive_subject(candidate);
    if (candidate.subject.empty()) {
        return;
    }
    if (candidate.scope.empty()) {
        candidate.scope = "global";
    }
    // Only ground truth may start at certainty.
    if (!candidate.verified && candidate.confidence >= 1.0) {
        candidate.confidence = config_.max_unverified_confidence;
    }

    Belief* match = nullptr;
    for (auto& [id, b] : ws.beliefs) {
        if (b.is_live() && b.subject == candidate.subject &&
            b.polarity == candidate.polarity && b.scope == candidate.scope) {
            match = &b;
            break;
        }
    }

    if (match == nullptr) {
        Belief b = new_belief(candidate, ws.now);
        b.evidence_ids.insert(episode.id);
        b.last_corroborated_at = episode.timestamp;
        const EntityId id = b.id;
        ws.beliefs.emplace(id, std::move(b));
        ws.created_beliefs.insert(id);
        ws.touched_beliefs.insert(id);
        ws.changed_beliefs.insert(id);
        return;
    }

    Belief& b = *match;
    if (b.evidence_ids.count(episode.id) > 0) {
        return;
    }
    b.evidence_ids.insert(episode.id);
    if (candidate.verified) {
        b.verified = true;
        b.confidence = std::max(b.confidence, candidate.confidence);
    } else {
        double raised = b.confidence + (1.0 - b.confidence) * config_.corroboration_gain;
        if (!b.verified) {
            raised = std::min(raised, config_.max_unverified_confidence);
        }
        b.confidence = std::clamp(raised, 0.0, 1.0);
    }
    b.last_corroborated_at = std::max(b.last_corroborated_at, episode.timestamp);
    b.updated_at = ws.now;

    if (ws.created_beliefs.count(b.id) == 0) {
        ws.corroborated_beliefs.insert(b.id);
    }
    ws.touched_beliefs.insert(b.id);
    ws.changed_beliefs.insert(b.id);
}

void ReplayMiner::record_outcome(DreamWorkspace& ws, const SkillOutcome& outcome) {
    Skill* skill = nullptr;
    for (auto& [id, s] : ws.skills) {
        if (s.name == outcome.skill) {
            skill = &s;
            break;
        }
    }
    if (skill == nullptr) {
        Skill s;
        s.id = store_.reserve_skill_id();
        s.name = outcome.skill;
        s.created_at = ws.now;
        const EntityId id = s.id;
        skill = &ws.skills.emplace(id, std::move(s)).first->second;
    }

    if (skill->evidence_ids.count(outcome.episode_id) > 0) {
        return;
    }

    skill->attempts += 1;
    if (outcome.success) {
        skill->successes += 1;
    } else if (!outcome.failure_mode.empty()) {
        skill->failure_modes.insert(outcome.failure_mode);
    }
    skill->success_rate = static_cast<double>(skill->successes) / skill->attempts;
    skill->success_history.push_back(skill->success_rate);
    if (skill->success_history.size() > config_.skill_history_limit) {
        skill->success_history.erase(
            skill->success_history.begin(),
            skill->success_history.end() - static_cast<std::ptrdiff_t>(config_.skill_history_limit));
    }
    if (!outcome.preconditions.empty()) skill->preconditions = outcome.preconditions;
    if (!outcome.steps.empty()) skill->steps = outcome.steps;
    skill->evidence_ids.insert(outcome.episode_id);
    skill->last_used = std::max(skill->last_used, outcome.at);
    skill->updated_at = ws.now;

    ws.changed_skills.insert(skill->id);
}

void ReplayMiner::refresh_self_model(DreamWorkspace& ws, const MemoryState& state) {
    for (EntityId skill_id : ws.changed_skills) {
        const Skill& skill = ws.skills.at(skill_id);

        SelfModelEntry entry;
        bool found = false;
        for (const auto& [id, existing] : state.self_model) {
            if (existing.capability == skill.name) {
                entry = existing;
                found = true;
                break;
            }
        }
        if (!found) {
            entry.id = store_.reserve_self_model_id();
            entry.capability = skill.name;
            entry.created_at = ws.now;
        }

        const auto& history = skill.success_history;
        entry.reliability_score = history.empty()
            ? skill.success_rate
            : std::accumulate(history.begin(), history.end(), 0.0) / history.size();
        entry.reliability_score = std::clamp(entry.reliability_score, 0.0, 1.0);
        entry.limitations = skill.failure_modes;
        entry.updated_at = ws.now;
        ws.self_model_upserts.push_back(std::move(entry));
    }
}

void ReplayMiner::promote_hypotheses(DreamWorkspace& ws, const MemoryState& state) {
    for (const auto& [id, h] : state.hypotheses) {
        if (h.status != HypothesisStatus::VERIFIED || h.promoted_belief_id) {
            continue;
        }

        CandidateBelief candidate;
        if (auto preference = preference_from_claim(h.claim)) {
            candidate = std::move(*preference);
        } else {
            candidate.statement = h.claim;
            derive_subject(candidate);
        }
        candidate.confidence = 1.0;
        candidate.verified = true;
        if (candidate.subject.empty()) {
            spdlog::warn("ReplayMiner: hypothesis {} has no usable subject, not promoted", id);
            continue;
        }

        EntityId belief_id = 0;
        for (auto& [bid, b] : ws.beliefs) {
            if (b.is_live() && b.subject == candidate.subject &&
                b.polarity == candidate.polarity && b.scope == candidate.scope) {
                b.verified = true;
                b.confidence = 1.0;
                b.updated_at = ws.now;
                belief_id = bid;
                if (ws.created_beliefs.count(bid) == 0) {
                    ws.corroborated_beliefs.insert(bid);
                }
                break;
            }
        }
        if (belief_id == 0) {
            Belief b = new_belief(candidate, ws.now);
            b.last_corroborated_at = ws.now;
            belief_id = b.id;
            ws.beliefs.emplace(belief_id, std::move(b));
            ws.created_beliefs.insert(belief_id);
        }

        ws.touched_beliefs.insert(belief_id);
        ws.changed_beliefs.insert(belief_id);
        ws.promotions.push_back({id, belief_id});
    }
}

} // namespace reverie::memory
