#include "memory/types.hpp"
#include "memory/errors.hpp"
#include <chrono>

using json = nlohmann::json;

namespace reverie::memory {

Timestamp system_now_ms() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

const char* episode_kind_to_string(EpisodeKind kind) {
    switch (kind) {
        case EpisodeKind::ACTION:      return "action";
        case EpisodeKind::OBSERVATION: return "observation";
        case EpisodeKind::PERCEPTION:  return "perception";
        case EpisodeKind::SYSTEM:      return "system";
        default: return "unknown";
    }
}

std::optional<EpisodeKind> episode_kind_from_string(const std::string& str) {
    if (str == "action")      return EpisodeKind::ACTION;
    if (str == "observation") return EpisodeKind::OBSERVATION;
    if (str == "perception")  return EpisodeKind::PERCEPTION;
    if (str == "system")      return EpisodeKind::SYSTEM;
    return std::nullopt;
}

const char* belief_status_to_string(BeliefStatus status) {
    switch (status) {
        case BeliefStatus::PROPOSED:  return "proposed";
        case BeliefStatus::CONFIRMED: return "confirmed";
        case BeliefStatus::DISPUTED:  return "disputed";
        case BeliefStatus::RETRACTED: return "retracted";
        case BeliefStatus::ARCHIVED:  return "archived";
        default: return "unknown";
    }
}

std::optional<BeliefStatus> belief_status_from_string(const std::string& str) {
    if (str == "proposed")  return BeliefStatus::PROPOSED;
    if (str == "confirmed") return BeliefStatus::CONFIRMED;
    if (str == "disputed")  return BeliefStatus::DISPUTED;
    if (str == "retracted") return BeliefStatus::RETRACTED;
    if (str == "archived")  return BeliefStatus::ARCHIVED;
    return std::nullopt;
}

const char* polarity_to_string(Polarity polarity) {
    switch (polarity) {
        case Polarity::POSITIVE: return "positive";
        case Polarity::NEGATIVE: return "negative";
        default: return "neutral";
    }
}

Polarity polarity_from_string(const std::string& str) {
    if (str == "positive" || str == "likes" || str == "+") return Polarity::POSITIVE;
    if (str == "negative" || str == "dislikes" || str == "-") return Polarity::NEGATIVE;
    return Polarity::NEUTRAL;
}

const char* goal_status_to_string(GoalStatus status) {
    switch (status) {
        case GoalStatus::ACTIVE:    return "active";
        case GoalStatus::BLOCKED:   return "blocked";
        case GoalStatus::COMPLETED: return "completed";
        case GoalStatus::ABANDONED: return "abandoned";
        default: return "unknown";
    }
}

std::optional<GoalStatus> goal_status_from_string(const std::string& str) {
    if (str == "active")    return GoalStatus::ACTIVE;
    if (str == "blocked")   return GoalStatus::BLOCKED;
    if (str == "completed") return GoalStatus::COMPLETED;
    if (str == "abandoned") return GoalStatus::ABANDONED;
    return std::nullopt;
}

const char* hypothesis_status_to_string(HypothesisStatus status) {
    switch (status) {
        case HypothesisStatus::OPEN:     return "open";
        case HypothesisStatus::VERIFIED: return "verified";
        case HypothesisStatus::REJECTED: return "rejected";
        default: return "unknown";
    }
}

std::optional<HypothesisStatus> hypothesis_status_from_string(const std::string& str) {
    if (str == "open")     return HypothesisStatus::OPEN;
    if (str == "verified") return HypothesisStatus::VERIFIED;
    if (str == "rejected") return HypothesisStatus::REJECTED;
    return std::nullopt;
}

const char* entity_type_to_string(EntityType type) {
    switch (type) {
        case EntityType::EPISODE:    return "episode";
        case EntityType::BELIEF:     return "belief";
        case EntityType::SKILL:      return "skill";
        case EntityType::GOAL:       return "goal";
        case EntityType::SELF_MODEL: return "self_model";
        case EntityType::HYPOTHESIS: return "hypothesis";
        default: return "unknown";
    }
}

std::optional<EntityType> entity_type_from_string(const std::string& str) {
    if (str == "episode")    return EntityType::EPISODE;
    if (str == "belief")     return EntityType::BELIEF;
    if (str == "skill")      return EntityType::SKILL;
    if (str == "goal")       return EntityType::GOAL;
    if (str == "self_model") return EntityType::SELF_MODEL;
    if (str == "hypothesis") return EntityType::HYPOTHESIS;
    return std::nullopt;
}

namespace {

template <typename T>
T require_enum(const std::optional<T>& value, const char* field, const std::string& raw) {
    if (!value.has_value()) {
        throw ValidationFailure(std::string("unknown ") + field + " '" + raw + "'");
    }
    return *value;
}

void write_embedding(json& j, const std::optional<Embedding>& embedding) {
    if (embedding.has_value()) {
        j["embedding"] = *embedding;
    }
}

std::optional<Embedding> read_embedding(const json& j) {
    if (j.contains("embedding") && j["embedding"].is_array()) {
        return j["embedding"].get<Embedding>();
    }
    return std::nullopt;
}

} // namespace

void to_json(json& j, const EpisodePayload& p) {
    j = json{{"text", p.text}, {"fields", p.fields}, {"verified", p.verified}};
    if (p.goal_id.has_value()) {
        j["goal_id"] = *p.goal_id;
    }
}

void from_json(const json& j, EpisodePayload& p) {
    p.text = j.value("text", "");
    p.fields = j.contains("fields") && j["fields"].is_object() ? j["fields"] : json::object();
    p.verified = j.value("verified", false);
    p.goal_id.reset();
    if (j.contains("goal_id") && j["goal_id"].is_number_unsigned()) {
        p.goal_id = j["goal_id"].get<EntityId>();
    }
}

void to_json(json& j, const Episode& e) {
    j = json{
        {"id", e.id},
        {"timestamp", e.timestamp},
        {"updated_at", e.updated_at},
        {"kind", episode_kind_to_string(e.kind)},
        {"salience", e.salience},
        {"salience_updated_at", e.salience_updated_at},
        {"content_hash", e.content_hash},
        {"pruned", e.pruned},
    };
    if (!e.pruned) {
        j["payload"] = e.payload;
    }
    write_embedding(j, e.embedding);
}

void from_json(const json& j, Episode& e) {
    e.id = j.at("id").get<EntityId>();
    e.timestamp = j.value("timestamp", Timestamp{0});
    e.updated_at = j.value("updated_at", e.timestamp);
    auto kind = j.value("kind", "observation");
    e.kind = require_enum(episode_kind_from_string(kind), "episode kind", kind);
    e.salience = j.value("salience", 1.0);
    e.salience_updated_at = j.value("salience_updated_at", e.timestamp);
    e.content_hash = j.value("content_hash", "");
    e.pruned = j.value("pruned", false);
    e.payload = EpisodePayload{};
    if (!e.pruned && j.contains("payload")) {
        e.payload = j["payload"].get<EpisodePayload>();
    }
    e.embedding = read_embedding(j);
}

void to_json(json& j, const Belief& b) {
    j = json{
        {"id", b.id},
        {"statement", b.statement},
        {"subject", b.subject},
        {"polarity", polarity_to_string(b.polarity)},
        {"scope", b.scope},
        {"confidence", b.confidence},
        {"status", belief_status_to_string(b.status)},
        {"evidence_ids", b.evidence_ids},
        {"conflicts_with_ids", b.conflicts_with_ids},
        {"verified", b.verified},
        {"created_at", b.created_at},
        {"updated_at", b.updated_at},
        {"last_corroborated_at", b.last_corroborated_at},
        {"last_confirmed_at", b.last_confirmed_at},
    };
    write_embedding(j, b.embedding);
}

void from_json(const json& j, Belief& b) {
    b.id = j.at("id").get<EntityId>();
    b.statement = j.value("statement", "");
    b.subject = j.value("subject", "");
    b.polarity = polarity_from_string(j.value("polarity", "neutral"));
    b.scope = j.value("scope", "global");
    b.confidence = j.value("confidence", 0.5);
    auto status = j.value("status", "proposed");
    b.status = require_enum(belief_status_from_string(status), "belief status", status);
    b.evidence_ids = j.value("evidence_ids", std::set<EntityId>{});
    b.conflicts_with_ids = j.value("conflicts_with_ids", std::set<EntityId>{});
    b.verified = j.value("verified", false);
    b.created_at = j.value("created_at", Timestamp{0});
    b.updated_at = j.value("updated_at", b.created_at);
    b.last_corroborated_at = j.value("last_corroborated_at", b.created_at);
    b.last_confirmed_at = j.value("last_confirmed_at", Timestamp{0});
    b.embedding = read_embedding(j);
}

void to_json(json& j, const Skill& s) {
    j = json{
        {"id", s.id},
        {"name", s.name},
        {"preconditions", s.preconditions},
        {"steps", s.steps},
        {"failure_modes", s.failure_modes},
        {"success_rate", s.success_rate},
        {"attempts", s.attempts},
        {"successes", s.successes},
        {"success_history", s.success_history},
        {"evidence_ids", s.evidence_ids},
        {"last_used", s.last_used},
        {"created_at", s.created_at},
        {"updated_at", s.updated_at},
    };
}

void from_json(const json& j, Skill& s) {
    s.id = j.at("id").get<EntityId>();
    s.name = j.value("name", "");
    s.preconditions = j.value("preconditions", "");
    s.steps = j.value("steps", std::vector<std::string>{});
    s.failure_modes = j.value("failure_modes", std::set<std::string>{});
    s.success_rate = j.value("success_rate", 0.0);
    s.attempts = j.value("attempts", 0u);
    s.successes = j.value("successes", 0u);
    s.success_history = j.value("success_history", std::vector<double>{});
    s.evidence_ids = j.value("evidence_ids", std::set<EntityId>{});
    s.last_used = j.value("last_used", Timestamp{0});
    s.created_at = j.value("created_at", Timestamp{0});
    s.updated_at = j.value("updated_at", s.created_at);
}

void to_json(json& j, const Goal& g) {
    j = json{
        {"id", g.id},
        {"description", g.description},
        {"status", goal_status_to_string(g.status)},
        {"priority", g.priority},
        {"progress", g.progress},
        {"created_at", g.created_at},
        {"updated_at", g.updated_at},
    };
}

void from_json(const json& j, Goal& g) {
    g.id = j.at("id").get<EntityId>();
    g.description = j.value("description", "");
    auto status = j.value("status", "active");
    g.status = require_enum(goal_status_from_string(status), "goal status", status);
    g.priority = j.value("priority", 5);
    g.progress = j.value("progress", 0.0);
    g.created_at = j.value("created_at", Timestamp{0});
    g.updated_at = j.value("updated_at", g.created_at);
}

void to_json(json& j, const SelfModelEntry& s) {
    j = json{
        {"id", s.id},
        {"capability", s.capability},
        {"reliability_score", s.reliability_score},
        {"limitations", s.limitations},
        {"created_at", s.created_at},
        {"updated_at", s.updated_at},
    };
}

void from_json(const json& j, SelfModelEntry& s) {
    s.id = j.at("id").get<EntityId>();
    s.capability = j.value("capability", "");
    s.reliability_score = j.value("reliability_score", 0.0);
    s.limitations = j.value("limitations", std::set<std::string>{});
    s.created_at = j.value("created_at", Timestamp{0});
    s.updated_at = j.value("updated_at", s.created_at);
}

void to_json(json& j, const Hypothesis& h) {
    j = json{
        {"id", h.id},
        {"claim", h.claim},
        {"verification_plan", h.verification_plan},
        {"confidence", h.confidence},
        {"status", hypothesis_status_to_string(h.status)},
        {"created_at", h.created_at},
        {"updated_at", h.updated_at},
    };
    if (h.promoted_belief_id.has_value()) {
        j["promoted_belief_id"] = *h.promoted_belief_id;
    }
}

void from_json(const json& j, Hypothesis& h) {
    h.id = j.at("id").get<EntityId>();
    h.claim = j.value("claim", "");
    h.verification_plan = j.value("verification_plan", "");
    h.confidence = j.value("confidence", 0.5);
    auto status = j.value("status", "open");
    h.status = require_enum(hypothesis_status_from_string(status), "hypothesis status", status);
    h.promoted_belief_id.reset();
    if (j.contains("promoted_belief_id") && j["promoted_belief_id"].is_number_unsigned()) {
        h.promoted_belief_id = j["promoted_belief_id"].get<EntityId>();
    }
    h.created_at = j.value("created_at", Timestamp{0});
    h.updated_at = j.value("updated_at", h.created_at);
}

void to_json(json& j, const EntityRef& r) {
    j = json{{"type", entity_type_to_string(r.type)}, {"id", r.id}};
}

void to_json(json& j, const EvidenceRef& r) {
    j = json{
        {"episode_id", r.episode_id},
        {"content_hash", r.content_hash},
        {"timestamp", r.timestamp},
        {"pruned", r.pruned},
        {"missing", r.missing},
    };
}

} // namespace reverie::memory
