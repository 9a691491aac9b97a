#pragma once
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>
#include "memory/types.hpp"

namespace reverie::memory {

// Retrieval signal weights. Renormalized per candidate when the vector
// term is absent.
struct RetrievalWeights {
    double lexical = 0.30;
    double recency = 0.20;
    double confidence = 0.25;
    double vector = 0.15;
    double goal = 0.10;
};

// Policy constants for the store, retriever and dream cycle
struct MemoryConfig {
    std::string data_dir;                          // empty = in-memory only

    // Episodes
    double default_salience = 1.0;

    // Replay
    size_t batch_size = 256;
    double base_candidate_confidence = 0.6;
    double corroboration_gain = 0.3;               // new = old + (1 - old) * gain
    double max_unverified_confidence = 0.99;

    // Contradictions
    double contradiction_threshold = 0.8;          // subject similarity
    double dispute_penalty = 0.2;
    double confirm_threshold = 0.85;
    double retract_threshold = 0.25;
    Timestamp belief_stale_after_ms = 30 * MS_PER_DAY;
    double belief_decay = 0.95;
    double belief_decay_floor = 0.1;

    // Forgetting
    Timestamp salience_half_life_ms = 7 * MS_PER_DAY;
    double prune_floor = 0.1;
    Timestamp retention_ms = 30 * MS_PER_DAY;

    // Retrieval
    Timestamp recency_half_life_ms = 7 * MS_PER_DAY;
    RetrievalWeights weights;

    // Skills
    size_t skill_history_limit = 20;

    // Dream scheduler; 0 disables periodic consolidation
    Timestamp dream_interval_ms = 0;

    // Throws ValidationFailure when a constant is out of range.
    void validate() const;

    // Defaults overridden by REVERIE_* environment variables.
    static MemoryConfig from_env();

    // Defaults overridden by keys present in the object.
    static MemoryConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

} // namespace reverie::memory
