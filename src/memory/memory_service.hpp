/**
 * Reverie memory service
 *
 * Facade over Store, Retriever and Consolidator exposing the operations the
 * control loop uses.
 */
#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "memory/config.hpp"
#include "memory/consolidator.hpp"
#include "memory/providers.hpp"
#include "memory/retriever.hpp"
#include "memory/storage_backend.hpp"
#include "memory/store.hpp"

namespace reverie::memory {

class MemoryService {
public:
    // A null backend keeps state in memory only. Throws StorageUnavailable
    // when persisted state cannot be loaded.
    MemoryService(const MemoryConfig& config,
                  std::unique_ptr<StorageBackend> backend = nullptr,
                  std::shared_ptr<ExtractionProvider> extractor = nullptr,
                  std::shared_ptr<EmbeddingProvider> embedder = nullptr);

    // JsonFileBackend under config.data_dir, or in-memory when it is empty.
    static std::unique_ptr<MemoryService> open(const MemoryConfig& config,
                                               std::shared_ptr<ExtractionProvider> extractor = nullptr,
                                               std::shared_ptr<EmbeddingProvider> embedder = nullptr);

    EntityId append_episode(EpisodeKind kind, const EpisodePayload& payload,
                            std::optional<double> salience = std::nullopt);

    std::vector<ScoredRef> query_memory(const MemoryQuery& query) const;

    std::optional<Episode> get_episode(EntityId id) const { return store_.get_episode(id); }
    std::vector<Episode> list_episodes(bool include_pruned = true) const { return store_.list_episodes(include_pruned); }
    std::optional<Belief> get_belief(EntityId id) const { return store_.get_belief(id); }
    std::vector<Belief> list_beliefs() const { return store_.list_beliefs(); }
    std::optional<Skill> get_skill(EntityId id) const { return store_.get_skill(id); }
    std::vector<Skill> list_skills() const { return store_.list_skills(); }
    std::optional<Goal> get_goal(EntityId id) const { return store_.get_goal(id); }
    std::vector<Goal> list_goals() const { return store_.list_goals(); }
    std::optional<SelfModelEntry> get_self_model(EntityId id) const { return store_.get_self_model(id); }
    std::vector<SelfModelEntry> list_self_model() const { return store_.list_self_model(); }
    std::optional<Hypothesis> get_hypothesis(EntityId id) const { return store_.get_hypothesis(id); }
    std::vector<Hypothesis> list_hypotheses() const { return store_.list_hypotheses(); }
    std::optional<std::vector<EvidenceRef>> evidence_for(EntityId belief_id) const {
        return store_.evidence_for(belief_id);
    }

    Hypothesis register_hypothesis(const std::string& claim, const std::string& verification_plan,
                                   double confidence = 0.5) {
        return store_.register_hypothesis(claim, verification_plan, confidence);
    }
    Hypothesis resolve_hypothesis(EntityId id, HypothesisStatus outcome,
                                  std::optional<double> confidence = std::nullopt) {
        return store_.resolve_hypothesis(id, outcome, confidence);
    }

    Goal create_goal(const std::string& description, int priority = 5) {
        return store_.create_goal(description, priority);
    }
    Goal update_goal_progress(EntityId id, double progress) {
        return store_.update_goal_progress(id, progress);
    }
    Goal update_goal_status(EntityId id, GoalStatus status) {
        return store_.update_goal_status(id, status);
    }

    ConsolidationReport consolidate() { return consolidator_.consolidate(); }
    EntityId watermark() const { return store_.watermark(); }

    // Compact view of the latest episodes, beliefs and goals for prompts and
    // operator inspection.
    nlohmann::json inspect_recent(size_t limit = 10) const;

    Store& store() { return store_; }
    Consolidator& consolidator() { return consolidator_; }
    const MemoryConfig& config() const { return config_; }

private:
    MemoryConfig config_;
    std::shared_ptr<EmbeddingProvider> embedder_;
    Store store_;
    Retriever retriever_;
    Consolidator consolidator_;
};

} // namespace reverie::memory
