/**
 * Replay Miner
 *
 * Walks the unconsolidated window of episodes and turns them into belief
 * and skill updates on a private working copy. Nothing here touches the
 * Store's state; the Consolidator commits the result as one batch.
 */
#pragma once
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "memory/config.hpp"
#include "memory/providers.hpp"
#include "memory/store.hpp"

namespace reverie::memory {

// Working copy shared by the dream-cycle stages of one run
struct DreamWorkspace {
    EntityId prior_watermark = 0;
    EntityId watermark = 0;
    Timestamp now = 0;
    std::vector<EntityId> processed;          // in processing order

    std::map<EntityId, Belief> beliefs;       // every belief, mutable copy
    std::set<EntityId> created_beliefs;
    std::set<EntityId> corroborated_beliefs;  // existing beliefs that gained evidence
    std::set<EntityId> touched_beliefs;       // created, corroborated or promoted
    std::set<EntityId> changed_beliefs;       // to upsert

    std::map<EntityId, Skill> skills;
    std::set<EntityId> changed_skills;
    std::vector<SelfModelEntry> self_model_upserts;

    std::vector<HypothesisPromotion> promotions;
    std::map<std::string, size_t> tag_counts;

    // Beliefs in the workspace that differ from the Store
    std::vector<Belief> belief_upserts() const;
    std::vector<Skill> skill_upserts() const;
};

class ReplayMiner {
public:
    // extractor and embedder may be null: the heuristic extractor is used and
    // new beliefs get no embedding.
    ReplayMiner(Store& store, const MemoryConfig& config,
                std::shared_ptr<ExtractionProvider> extractor = nullptr,
                std::shared_ptr<EmbeddingProvider> embedder = nullptr);

    // Mines episodes in (state.watermark, high], capped at batch_size.
    // Provider exceptions and invalid candidates propagate.
    DreamWorkspace mine(const MemoryState& state, EntityId high);

    static std::vector<EntityId> select_window(const MemoryState& state, EntityId high,
                                               size_t batch_size);

private:
    Store& store_;
    MemoryConfig config_;
    std::shared_ptr<ExtractionProvider> extractor_;
    std::shared_ptr<EmbeddingProvider> embedder_;
    HeuristicExtractor heuristic_;

    std::vector<CandidateBelief> candidates_for(const Episode& episode);
    void absorb(DreamWorkspace& ws, CandidateBelief candidate, const Episode& episode);
    void record_outcome(DreamWorkspace& ws, const SkillOutcome& outcome);
    void refresh_self_model(DreamWorkspace& ws, const MemoryState& state);
    void promote_hypotheses(DreamWorkspace& ws, const MemoryState& state);
    Belief new_belief(const CandidateBelief& candidate, Timestamp now);
};

} // namespace reverie::memory
