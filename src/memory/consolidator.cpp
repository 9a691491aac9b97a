#include "memory/consolidator.hpp"
#include <chrono>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace reverie::memory {

const char* consolidator_state_to_string(ConsolidatorState state) {
    switch (state) {
        case ConsolidatorState::IDLE:       return "idle";
        case ConsolidatorState::RUNNING:    return "running";
        case ConsolidatorState::COMMITTING: return "committing";
        case ConsolidatorState::ABORTED:    return "aborted";
        default: return "unknown";
    }
}

const char* consolidation_status_to_string(ConsolidationStatus status) {
    switch (status) {
        case ConsolidationStatus::COMMITTED: return "committed";
        case ConsolidationStatus::ABORTED:   return "aborted";
        case ConsolidationStatus::REJECTED:  return "rejected";
        default: return "unknown";
    }
}

json ConsolidationReport::to_json() const {
    json j;
    j["status"] = consolidation_status_to_string(status);
    if (!reason.empty()) {
        j["reason"] = reason;
    }
    j["prior_watermark"] = prior_watermark;
    j["watermark"] = watermark;
    j["episodes_processed"] = episodes_processed;
    j["beliefs_created"] = beliefs_created;
    j["beliefs_updated"] = beliefs_updated;
    j["beliefs_disputed"] = beliefs_disputed;
    j["beliefs_confirmed"] = beliefs_confirmed;
    j["beliefs_retracted"] = beliefs_retracted;
    j["beliefs_decayed"] = beliefs_decayed;
    j["hypotheses_promoted"] = hypotheses_promoted;
    j["skills_updated"] = skills_updated;
    j["episodes_decayed"] = episodes_decayed;
    j["episodes_pruned"] = episodes_pruned;
    j["disputed_belief_ids"] = disputed_belief_ids;
    j["tag_counts"] = tag_counts;
    j["duration_ms"] = duration_ms;
    return j;
}

Consolidator::Consolidator(Store& store, const MemoryConfig& config,
                           std::shared_ptr<ExtractionProvider> extractor,
                           std::shared_ptr<EmbeddingProvider> embedder)
    : store_(store)
    , config_(config)
    , miner_(store, config, std::move(extractor), std::move(embedder))
    , resolver_(config)
    , forgetting_(config) {}

void Consolidator::set_state_listener(StateListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = std::move(listener);
}

void Consolidator::transition(ConsolidatorState next) {
    state_.store(next);
    StateListener listener;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener = listener_;
    }
    if (!listener) {
        return;
    }
    try {
        listener(next);
    } catch (const std::exception& e) {
        spdlog::warn("Consolidator: state listener failed on {}: {}",
                     consolidator_state_to_string(next), e.what());
    }
}

ConsolidationReport Consolidator::consolidate() {
    ConsolidatorState expected = ConsolidatorState::IDLE;
    if (!state_.compare_exchange_strong(expected, ConsolidatorState::RUNNING)) {
        ConsolidationReport report;
        report.status = ConsolidationStatus::REJECTED;
        report.reason = std::string("consolidation already ") + consolidator_state_to_string(expected);
        report.prior_watermark = store_.watermark();
        report.watermark = report.prior_watermark;
        spdlog::info("Consolidator: trigger rejected, run already {}", consolidator_state_to_string(expected));
        return report;
    }

    // The run owns the state from here; it is IDLE again on every exit path.
    // Disarmed before the final transition, which may let the next run in.
    struct IdleOnExit {
        std::atomic<ConsolidatorState>& state;
        bool armed = true;
        ~IdleOnExit() {
            if (armed) state.store(ConsolidatorState::IDLE);
        }
    } idle_on_exit{state_};

    transition(ConsolidatorState::RUNNING);

    const auto started = std::chrono::steady_clock::now();
    ConsolidationReport report = run();
    report.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    if (report.committed()) {
        spdlog::info("Consolidator: committed watermark {} -> {} ({} episode(s), {} new belief(s), "
                     "{} disputed, {} pruned) in {}ms",
                     report.prior_watermark, report.watermark, report.episodes_processed,
                     report.beliefs_created, report.beliefs_disputed, report.episodes_pruned,
                     report.duration_ms);
    } else {
        spdlog::warn("Consolidator: aborted at watermark {}: {}", report.prior_watermark, report.reason);
    }

    idle_on_exit.armed = false;
    transition(ConsolidatorState::IDLE);
    return report;
}

ConsolidationReport Consolidator::run() {
    ConsolidationReport report;

    try {
        // Everything appended after this point waits for the next run.
        MemoryState snapshot = store_.snapshot();
        const EntityId high = snapshot.max_episode_id();
        report.prior_watermark = snapshot.watermark;
        report.watermark = snapshot.watermark;

        DreamWorkspace ws = miner_.mine(snapshot, high);
        ResolutionSummary resolution = resolver_.resolve(ws);
        ForgettingResult forgetting = forgetting_.apply(snapshot, ws);

        ConsolidationBatch batch;
        batch.expected_prior_watermark = snapshot.watermark;
        batch.watermark = ws.watermark;
        batch.belief_upserts = ws.belief_upserts();
        batch.skill_upserts = ws.skill_upserts();
        batch.self_model_upserts = ws.self_model_upserts;
        batch.salience_updates = forgetting.salience_updates;
        batch.prunes = forgetting.prunes;
        batch.promotions = ws.promotions;

        transition(ConsolidatorState::COMMITTING);
        store_.apply_consolidation_batch(batch);

        report.status = ConsolidationStatus::COMMITTED;
        report.watermark = batch.watermark;
        report.episodes_processed = ws.processed.size();
        report.beliefs_created = ws.created_beliefs.size();
        for (EntityId id : ws.changed_beliefs) {
            if (ws.created_beliefs.count(id) == 0) report.beliefs_updated++;
        }
        report.beliefs_disputed = resolution.disputed;
        report.beliefs_confirmed = resolution.confirmed;
        report.beliefs_retracted = resolution.retracted;
        report.beliefs_decayed = resolution.decayed;
        report.disputed_belief_ids.assign(resolution.newly_disputed.begin(),
                                          resolution.newly_disputed.end());
        report.hypotheses_promoted = ws.promotions.size();
        for (const auto& promotion : ws.promotions) {
            report.promoted_hypothesis_ids.push_back(promotion.hypothesis_id);
        }
        report.skills_updated = ws.changed_skills.size();
        report.episodes_decayed = forgetting.salience_updates.size();
        report.episodes_pruned = forgetting.prunes.size();
        report.tag_counts = ws.tag_counts;
    } catch (const std::exception& e) {
        transition(ConsolidatorState::ABORTED);
        report.status = ConsolidationStatus::ABORTED;
        report.reason = e.what();
        report.watermark = report.prior_watermark;
    }

    return report;
}

} // namespace reverie::memory
