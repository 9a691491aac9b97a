/**
 * Reverie Consolidator
 *
 * One dream cycle: replay -> contradiction resolution -> forgetting, applied
 * to the Store as a single batch.
 *
 *   IDLE -> RUNNING -> COMMITTING -> IDLE     (committed)
 *   IDLE -> RUNNING -> ABORTED -> IDLE        (aborted, nothing applied)
 *
 * A trigger while a run is active is rejected, not queued.
 */
#pragma once
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "memory/config.hpp"
#include "memory/contradiction_resolver.hpp"
#include "memory/forgetting_policy.hpp"
#include "memory/providers.hpp"
#include "memory/replay_miner.hpp"
#include "memory/store.hpp"

namespace reverie::memory {

enum class ConsolidatorState {
    IDLE,
    RUNNING,
    COMMITTING,
    ABORTED
};

enum class ConsolidationStatus {
    COMMITTED,
    ABORTED,      // ConsolidationAborted: nothing applied, safe to retry
    REJECTED      // ConcurrentConsolidationRejected: a run was active, no-op
};

const char* consolidator_state_to_string(ConsolidatorState state);
const char* consolidation_status_to_string(ConsolidationStatus status);

struct ConsolidationReport {
    ConsolidationStatus status = ConsolidationStatus::ABORTED;
    std::string reason;

    EntityId prior_watermark = 0;
    EntityId watermark = 0;

    size_t episodes_processed = 0;
    size_t beliefs_created = 0;
    size_t beliefs_updated = 0;
    size_t beliefs_disputed = 0;
    size_t beliefs_confirmed = 0;
    size_t beliefs_retracted = 0;
    size_t beliefs_decayed = 0;
    size_t hypotheses_promoted = 0;
    size_t skills_updated = 0;
    size_t episodes_decayed = 0;
    size_t episodes_pruned = 0;

    std::vector<EntityId> disputed_belief_ids;
    std::vector<EntityId> promoted_hypothesis_ids;
    std::map<std::string, size_t> tag_counts;
    int64_t duration_ms = 0;

    bool committed() const { return status == ConsolidationStatus::COMMITTED; }
    nlohmann::json to_json() const;
};

class Consolidator {
public:
    using StateListener = std::function<void(ConsolidatorState)>;

    Consolidator(Store& store, const MemoryConfig& config,
                 std::shared_ptr<ExtractionProvider> extractor = nullptr,
                 std::shared_ptr<EmbeddingProvider> embedder = nullptr);

    // Runs one cycle synchronously. Never throws for run failures; they are
    // reported as ABORTED.
    ConsolidationReport consolidate();

    ConsolidatorState state() const { return state_.load(); }

    // Called on every transition, from the consolidating thread.
    void set_state_listener(StateListener listener);

private:
    Store& store_;
    MemoryConfig config_;
    ReplayMiner miner_;
    ContradictionResolver resolver_;
    ForgettingPolicy forgetting_;

    std::atomic<ConsolidatorState> state_{ConsolidatorState::IDLE};
    std::mutex listener_mutex_;
    StateListener listener_;

    void transition(ConsolidatorState next);
    ConsolidationReport run();
};

} // namespace reverie::memory
