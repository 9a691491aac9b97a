/**
 * Reverie memory data model
 *
 * Entities held by the Store. Cross-entity links are identifier sets only,
 * resolved through the Store at read time.
 */
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace reverie::memory {

using EntityId = uint64_t;
using Timestamp = int64_t;  // milliseconds since the Unix epoch
using Embedding = std::vector<float>;
using Clock = std::function<Timestamp()>;

constexpr Timestamp MS_PER_HOUR = 3600LL * 1000LL;
constexpr Timestamp MS_PER_DAY = 24LL * MS_PER_HOUR;

// Wall-clock now in milliseconds
Timestamp system_now_ms();

enum class EpisodeKind {
    ACTION,
    OBSERVATION,
    PERCEPTION,
    SYSTEM
};

enum class BeliefStatus {
    PROPOSED,
    CONFIRMED,
    DISPUTED,
    RETRACTED,
    ARCHIVED
};

// Direction of a claim about its subject. NEUTRAL claims never conflict.
enum class Polarity {
    NEUTRAL,
    POSITIVE,
    NEGATIVE
};

enum class GoalStatus {
    ACTIVE,
    BLOCKED,
    COMPLETED,
    ABANDONED
};

enum class HypothesisStatus {
    OPEN,
    VERIFIED,
    REJECTED
};

enum class EntityType {
    EPISODE,
    BELIEF,
    SKILL,
    GOAL,
    SELF_MODEL,
    HYPOTHESIS
};

const char* episode_kind_to_string(EpisodeKind kind);
std::optional<EpisodeKind> episode_kind_from_string(const std::string& str);

const char* belief_status_to_string(BeliefStatus status);
std::optional<BeliefStatus> belief_status_from_string(const std::string& str);

const char* polarity_to_string(Polarity polarity);
Polarity polarity_from_string(const std::string& str);

inline Polarity opposite(Polarity polarity) {
    switch (polarity) {
        case Polarity::POSITIVE: return Polarity::NEGATIVE;
        case Polarity::NEGATIVE: return Polarity::POSITIVE;
        default: return Polarity::NEUTRAL;
    }
}

const char* goal_status_to_string(GoalStatus status);
std::optional<GoalStatus> goal_status_from_string(const std::string& str);

const char* hypothesis_status_to_string(HypothesisStatus status);
std::optional<HypothesisStatus> hypothesis_status_from_string(const std::string& str);

const char* entity_type_to_string(EntityType type);
std::optional<EntityType> entity_type_from_string(const std::string& str);

struct EpisodePayload {
    std::string text;
    nlohmann::json fields = nlohmann::json::object();
    bool verified = false;               // explicit ground truth
    std::optional<EntityId> goal_id;     // goal the episode served, if any
};

struct Episode {
    EntityId id = 0;
    Timestamp timestamp = 0;
    Timestamp updated_at = 0;
    EpisodeKind kind = EpisodeKind::OBSERVATION;
    EpisodePayload payload;
    double salience = 1.0;
    Timestamp salience_updated_at = 0;
    std::string content_hash;
    bool pruned = false;                 // payload removed, hash kept
    std::optional<Embedding> embedding;
};

struct Belief {
    EntityId id = 0;
    std::string statement;
    std::string subject;                 // normalized topic
    Polarity polarity = Polarity::NEUTRAL;
    std::string scope = "global";
    double confidence = 0.5;
    BeliefStatus status = BeliefStatus::PROPOSED;
    std::set<EntityId> evidence_ids;
    std::set<EntityId> conflicts_with_ids;
    bool verified = false;
    Timestamp created_at = 0;
    Timestamp updated_at = 0;
    Timestamp last_corroborated_at = 0;
    Timestamp last_confirmed_at = 0;     // 0 = never confirmed
    std::optional<Embedding> embedding;

    // Retracted and archived beliefs no longer take part in conflicts.
    bool is_live() const {
        return status != BeliefStatus::RETRACTED && status != BeliefStatus::ARCHIVED;
    }
};

struct Skill {
    EntityId id = 0;
    std::string name;
    std::string preconditions;
    std::vector<std::string> steps;
    std::set<std::string> failure_modes;
    double success_rate = 0.0;
    uint32_t attempts = 0;
    uint32_t successes = 0;
    std::vector<double> success_history;  // success_rate after each update, bounded
    std::set<EntityId> evidence_ids;
    Timestamp last_used = 0;
    Timestamp created_at = 0;
    Timestamp updated_at = 0;
};

struct Goal {
    EntityId id = 0;
    std::string description;
    GoalStatus status = GoalStatus::ACTIVE;
    int priority = 5;
    double progress = 0.0;
    Timestamp created_at = 0;
    Timestamp updated_at = 0;

    bool is_terminal() const {
        return status == GoalStatus::COMPLETED || status == GoalStatus::ABANDONED;
    }
};

struct SelfModelEntry {
    EntityId id = 0;
    std::string capability;
    double reliability_score = 0.0;
    std::set<std::string> limitations;
    Timestamp created_at = 0;
    Timestamp updated_at = 0;
};

struct Hypothesis {
    EntityId id = 0;
    std::string claim;
    std::string verification_plan;
    double confidence = 0.5;
    HypothesisStatus status = HypothesisStatus::OPEN;
    std::optional<EntityId> promoted_belief_id;
    Timestamp created_at = 0;
    Timestamp updated_at = 0;
};

struct EntityRef {
    EntityType type = EntityType::BELIEF;
    EntityId id = 0;

    bool operator==(const EntityRef& other) const {
        return type == other.type && id == other.id;
    }
    bool operator!=(const EntityRef& other) const { return !(*this == other); }
};

// Provenance of one cited episode, available even after pruning
struct EvidenceRef {
    EntityId episode_id = 0;
    std::string content_hash;
    Timestamp timestamp = 0;
    bool pruned = false;
    bool missing = false;                // id never existed in the store
};

void to_json(nlohmann::json& j, const EpisodePayload& p);
void from_json(const nlohmann::json& j, EpisodePayload& p);
void to_json(nlohmann::json& j, const Episode& e);
void from_json(const nlohmann::json& j, Episode& e);
void to_json(nlohmann::json& j, const Belief& b);
void from_json(const nlohmann::json& j, Belief& b);
void to_json(nlohmann::json& j, const Skill& s);
void from_json(const nlohmann::json& j, Skill& s);
void to_json(nlohmann::json& j, const Goal& g);
void from_json(const nlohmann::json& j, Goal& g);
void to_json(nlohmann::json& j, const SelfModelEntry& s);
void from_json(const nlohmann::json& j, SelfModelEntry& s);
void to_json(nlohmann::json& j, const Hypothesis& h);
void from_json(const nlohmann::json& j, Hypothesis& h);
void to_json(nlohmann::json& j, const EntityRef& r);
void to_json(nlohmann::json& j, const EvidenceRef& r);

} // namespace reverie::memory
