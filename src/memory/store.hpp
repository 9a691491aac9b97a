/**
 * Reverie Store
 *
 * Owns every memory relation and the consolidation watermark. Episodes are
 * appended continuously; beliefs, skills, self-model entries and hypothesis
 * promotions change only through apply_consolidation_batch(). Readers copy
 * what they need under a short lock and never wait for a consolidation run.
 */
#pragma once
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <vector>
#include <nlohmann/json.hpp>
#include "memory/config.hpp"
#include "memory/storage_backend.hpp"
#include "memory/types.hpp"

namespace reverie::memory {

// Point-in-time copy of all relations
struct MemoryState {
    std::map<EntityId, Episode> episodes;
    std::map<EntityId, Belief> beliefs;
    std::map<EntityId, Skill> skills;
    std::map<EntityId, Goal> goals;
    std::map<EntityId, SelfModelEntry> self_model;
    std::map<EntityId, Hypothesis> hypotheses;
    EntityId watermark = 0;

    EntityId max_episode_id() const {
        return episodes.empty() ? 0 : episodes.rbegin()->first;
    }
};

// Decayed salience of one episode
struct SalienceUpdate {
    double salience = 0.0;
    Timestamp at = 0;
};

// A verified hypothesis turned into the belief it was promoted to
struct HypothesisPromotion {
    EntityId hypothesis_id = 0;
    EntityId belief_id = 0;
};

// Everything one consolidation run wants to change. Applied completely or
// not at all.
struct ConsolidationBatch {
    EntityId expected_prior_watermark = 0;
    EntityId watermark = 0;
    std::vector<Belief> belief_upserts;
    std::vector<Skill> skill_upserts;
    std::vector<SelfModelEntry> self_model_upserts;
    std::map<EntityId, SalienceUpdate> salience_updates;
    std::vector<EntityId> prunes;
    std::vector<HypothesisPromotion> promotions;
};

// Episodes some non-retracted belief or any skill cites
std::set<EntityId> cited_episodes(const std::map<EntityId, Belief>& beliefs,
                                  const std::map<EntityId, Skill>& skills);

class Store {
public:
    // Loads persisted state from the backend. Throws StorageUnavailable.
    Store(MemoryConfig config, std::unique_ptr<StorageBackend> backend);

    // Episodes
    EntityId append_episode(EpisodeKind kind, const EpisodePayload& payload,
                            std::optional<double> salience = std::nullopt,
                            std::optional<Embedding> embedding = std::nullopt);
    std::optional<Episode> get_episode(EntityId id) const;
    std::vector<Episode> list_episodes(bool include_pruned = true) const;

    // Beliefs, skills, self-model
    std::optional<Belief> get_belief(EntityId id) const;
    std::vector<Belief> list_beliefs() const;
    std::optional<Skill> get_skill(EntityId id) const;
    std::optional<Skill> find_skill(const std::string& name) const;
    std::vector<Skill> list_skills() const;
    std::optional<SelfModelEntry> get_self_model(EntityId id) const;
    std::vector<SelfModelEntry> list_self_model() const;

    // Cited episodes of a belief with their hashes. nullopt for an unknown belief.
    std::optional<std::vector<EvidenceRef>> evidence_for(EntityId belief_id) const;

    // Goals
    Goal create_goal(const std::string& description, int priority = 5);
    Goal update_goal_progress(EntityId id, double progress);
    Goal update_goal_status(EntityId id, GoalStatus status);
    std::optional<Goal> get_goal(EntityId id) const;
    std::vector<Goal> list_goals() const;

    // Hypotheses
    Hypothesis register_hypothesis(const std::string& claim,
                                   const std::string& verification_plan,
                                   double confidence = 0.5);
    Hypothesis resolve_hypothesis(EntityId id, HypothesisStatus outcome,
                                  std::optional<double> confidence = std::nullopt);
    std::optional<Hypothesis> get_hypothesis(EntityId id) const;
    std::vector<Hypothesis> list_hypotheses() const;

    // Consolidation
    MemoryState snapshot() const;
    EntityId watermark() const;
    EntityId max_episode_id() const;
    EntityId reserve_belief_id();
    EntityId reserve_skill_id();
    EntityId reserve_self_model_id();

    // Validates the batch against current state, persists the result and
    // swaps it in. Throws ValidationFailure or StorageUnavailable with
    // state unchanged.
    void apply_consolidation_batch(const ConsolidationBatch& batch);

    Timestamp now() const;
    void set_clock(Clock clock);

    const MemoryConfig& config() const { return config_; }
    std::string backend_name() const { return backend_->describe(); }

private:
    MemoryConfig config_;
    std::unique_ptr<StorageBackend> backend_;

    // io_mutex_ serializes writers and the medium; state_mutex_ only guards
    // the in-memory relations and is never held across I/O.
    mutable std::mutex io_mutex_;
    mutable std::mutex state_mutex_;
    MemoryState state_;

    std::atomic<EntityId> next_episode_id_{1};
    std::atomic<EntityId> next_belief_id_{1};
    std::atomic<EntityId> next_skill_id_{1};
    std::atomic<EntityId> next_goal_id_{1};
    std::atomic<EntityId> next_self_model_id_{1};
    std::atomic<EntityId> next_hypothesis_id_{1};

    mutable std::mutex clock_mutex_;
    Clock clock_;

    void load();
    nlohmann::json to_snapshot(const MemoryState& state) const;
    void commit(MemoryState next);   // requires io_mutex_

    // Journal one record, then publish it. Require io_mutex_.
    void put_goal(const Goal& goal);
    void put_hypothesis(const Hypothesis& h);
    Goal goal_copy(EntityId id) const;
    Hypothesis hypothesis_copy(EntityId id) const;
};

} // namespace reverie::memory
