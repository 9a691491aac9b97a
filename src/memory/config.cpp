#include "memory/config.hpp"
#include "core/config.hpp"
#include "memory/errors.hpp"
#include <cmath>

using json = nlohmann::json;

namespace reverie::memory {

namespace {

void require_unit(double value, const char* name) {
    if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
        throw ValidationFailure(std::string(name) + " must be in [0,1]");
    }
}

void require_positive(Timestamp value, const char* name) {
    if (value <= 0) {
        throw ValidationFailure(std::string(name) + " must be positive");
    }
}

size_t require_count(long long value, const char* name) {
    if (value <= 0) {
        throw ValidationFailure(std::string(name) + " must be positive");
    }
    return static_cast<size_t>(value);
}

} // namespace

void MemoryConfig::validate() const {
    if (default_salience < 0.0 || !std::isfinite(default_salience)) {
        throw ValidationFailure("default_salience must be >= 0");
    }
    if (batch_size == 0) {
        throw ValidationFailure("batch_size must be positive");
    }
    if (skill_history_limit == 0) {
        throw ValidationFailure("skill_history_limit must be positive");
    }
    require_unit(base_candidate_confidence, "base_candidate_confidence");
    require_unit(corroboration_gain, "corroboration_gain");
    require_unit(max_unverified_confidence, "max_unverified_confidence");
    if (max_unverified_confidence >= 1.0) {
        throw ValidationFailure("max_unverified_confidence must be below 1.0");
    }
    if (corroboration_gain <= 0.0 || corroboration_gain >= 1.0) {
        throw ValidationFailure("corroboration_gain must be in (0,1)");
    }
    require_unit(contradiction_threshold, "contradiction_threshold");
    require_unit(dispute_penalty, "dispute_penalty");
    require_unit(confirm_threshold, "confirm_threshold");
    require_unit(retract_threshold, "retract_threshold");
    if (retract_threshold >= confirm_threshold) {
        throw ValidationFailure("retract_threshold must be below confirm_threshold");
    }
    require_unit(belief_decay, "belief_decay");
    require_unit(belief_decay_floor, "belief_decay_floor");
    require_positive(belief_stale_after_ms, "belief_stale_after_ms");
    require_positive(salience_half_life_ms, "salience_half_life_ms");
    if (prune_floor < 0.0 || !std::isfinite(prune_floor)) {
        throw ValidationFailure("prune_floor must be >= 0");
    }
    if (retention_ms < 0) {
        throw ValidationFailure("retention_ms must be >= 0");
    }
    require_positive(recency_half_life_ms, "recency_half_life_ms");

    const double weights_sum = weights.lexical + weights.recency + weights.confidence +
                               weights.vector + weights.goal;
    for (double w : {weights.lexical, weights.recency, weights.confidence, weights.vector, weights.goal}) {
        if (w < 0.0 || !std::isfinite(w)) {
            throw ValidationFailure("retrieval weights must be non-negative");
        }
    }
    if (weights_sum <= 0.0) {
        throw ValidationFailure("at least one retrieval weight must be positive");
    }
    if (dream_interval_ms < 0) {
        throw ValidationFailure("dream_interval_ms must be >= 0");
    }
}

MemoryConfig MemoryConfig::from_env() {
    using namespace core::config;

    MemoryConfig c;
    c.data_dir = get_env_or("REVERIE_DATA_DIR", c.data_dir);
    c.default_salience = get_env_double("REVERIE_DEFAULT_SALIENCE", c.default_salience);
    c.batch_size = require_count(
        get_env_int("REVERIE_BATCH_SIZE", static_cast<long long>(c.batch_size)), "REVERIE_BATCH_SIZE");
    c.base_candidate_confidence = get_env_double("REVERIE_BASE_CONFIDENCE", c.base_candidate_confidence);
    c.corroboration_gain = get_env_double("REVERIE_CORROBORATION_GAIN", c.corroboration_gain);
    c.max_unverified_confidence = get_env_double("REVERIE_MAX_UNVERIFIED_CONFIDENCE",
                                                 c.max_unverified_confidence);
    c.contradiction_threshold = get_env_double("REVERIE_CONTRADICTION_THRESHOLD", c.contradiction_threshold);
    c.dispute_penalty = get_env_double("REVERIE_DISPUTE_PENALTY", c.dispute_penalty);
    c.confirm_threshold = get_env_double("REVERIE_CONFIRM_THRESHOLD", c.confirm_threshold);
    c.retract_threshold = get_env_double("REVERIE_RETRACT_THRESHOLD", c.retract_threshold);
    c.belief_decay = get_env_double("REVERIE_BELIEF_DECAY", c.belief_decay);
    c.belief_decay_floor = get_env_double("REVERIE_BELIEF_DECAY_FLOOR", c.belief_decay_floor);
    c.belief_stale_after_ms = get_env_int("REVERIE_BELIEF_STALE_DAYS", 30) * MS_PER_DAY;
    c.salience_half_life_ms = static_cast<Timestamp>(
        get_env_double("REVERIE_SALIENCE_HALF_LIFE_DAYS", 7.0) * MS_PER_DAY);
    c.prune_floor = get_env_double("REVERIE_PRUNE_FLOOR", c.prune_floor);
    c.retention_ms = get_env_int("REVERIE_RETENTION_DAYS", 30) * MS_PER_DAY;
    c.recency_half_life_ms = static_cast<Timestamp>(
        get_env_double("REVERIE_RECENCY_HALF_LIFE_DAYS", 7.0) * MS_PER_DAY);
    c.weights.lexical = get_env_double("REVERIE_WEIGHT_LEXICAL", c.weights.lexical);
    c.weights.recency = get_env_double("REVERIE_WEIGHT_RECENCY", c.weights.recency);
    c.weights.confidence = get_env_double("REVERIE_WEIGHT_CONFIDENCE", c.weights.confidence);
    c.weights.vector = get_env_double("REVERIE_WEIGHT_VECTOR", c.weights.vector);
    c.weights.goal = get_env_double("REVERIE_WEIGHT_GOAL", c.weights.goal);
    c.skill_history_limit = require_count(
        get_env_int("REVERIE_SKILL_HISTORY_LIMIT", static_cast<long long>(c.skill_history_limit)),
        "REVERIE_SKILL_HISTORY_LIMIT");
    c.dream_interval_ms = get_env_int("REVERIE_DREAM_INTERVAL_SEC", 0) * 1000;
    return c;
}

MemoryConfig MemoryConfig::from_json(const json& j) {
    MemoryConfig c;
    c.data_dir = j.value("data_dir", c.data_dir);
    c.default_salience = j.value("default_salience", c.default_salience);
    c.batch_size = require_count(
        j.value("batch_size", static_cast<long long>(c.batch_size)), "batch_size");
    c.base_candidate_confidence = j.value("base_candidate_confidence", c.base_candidate_confidence);
    c.corroboration_gain = j.value("corroboration_gain", c.corroboration_gain);
    c.max_unverified_confidence = j.value("max_unverified_confidence", c.max_unverified_confidence);
    c.contradiction_threshold = j.value("contradiction_threshold", c.contradiction_threshold);
    c.dispute_penalty = j.value("dispute_penalty", c.dispute_penalty);
    c.confirm_threshold = j.value("confirm_threshold", c.confirm_threshold);
    c.retract_threshold = j.value("retract_threshold", c.retract_threshold);
    c.belief_stale_after_ms = j.value("belief_stale_after_ms", c.belief_stale_after_ms);
    c.belief_decay = j.value("belief_decay", c.belief_decay);
    c.belief_decay_floor = j.value("belief_decay_floor", c.belief_decay_floor);
    c.salience_half_life_ms = j.value("salience_half_life_ms", c.salience_half_life_ms);
    c.prune_floor = j.value("prune_floor", c.prune_floor);
    c.retention_ms = j.value("retention_ms", c.retention_ms);
    c.recency_half_life_ms = j.value("recency_half_life_ms", c.recency_half_life_ms);
    c.skill_history_limit = require_count(
        j.value("skill_history_limit", static_cast<long long>(c.skill_history_limit)), "skill_history_limit");
    c.dream_interval_ms = j.value("dream_interval_ms", c.dream_interval_ms);

    if (j.contains("weights") && j["weights"].is_object()) {
        const auto& w = j["weights"];
        c.weights.lexical = w.value("lexical", c.weights.lexical);
        c.weights.recency = w.value("recency", c.weights.recency);
        c.weights.confidence = w.value("confidence", c.weights.confidence);
        c.weights.vector = w.value("vector", c.weights.vector);
        c.weights.goal = w.value("goal", c.weights.goal);
    }
    return c;
}

json MemoryConfig::to_json() const {
    json j;
    j["data_dir"] = data_dir;
    j["default_salience"] = default_salience;
    j["batch_size"] = batch_size;
    j["base_candidate_confidence"] = base_candidate_confidence;
    j["corroboration_gain"] = corroboration_gain;
    j["max_unverified_confidence"] = max_unverified_confidence;
    j["contradiction_threshold"] = contradiction_threshold;
    j["dispute_penalty"] = dispute_penalty;
    j["confirm_threshold"] = confirm_threshold;
    j["retract_threshold"] = retract_threshold;
    j["belief_stale_after_ms"] = belief_stale_after_ms;
    j["belief_decay"] = belief_decay;
    j["belief_decay_floor"] = belief_decay_floor;
    j["salience_half_life_ms"] = salience_half_life_ms;
    j["prune_floor"] = prune_floor;
    j["retention_ms"] = retention_ms;
    j["recency_half_life_ms"] = recency_half_life_ms;
    j["skill_history_limit"] = skill_history_limit;
    j["dream_interval_ms"] = dream_interval_ms;
    j["weights"] = {
        {"lexical", weights.lexical},
        {"recency", weights.recency},
        {"confidence", weights.confidence},
        {"vector", weights.vector},
        {"goal", weights.goal},
    };
    return j;
}

} // namespace reverie::memory
