#include "memory/store.hpp"
#include "memory/errors.hpp"
#include "memory/provenance.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace reverie::memory {

namespace {

constexpr int SNAPSHOT_VERSION = 1;

bool is_unit(double value) {
    return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

template <typename T>
std::vector<T> values_of(const std::map<EntityId, T>& relation) {
    std::vector<T> out;
    out.reserve(relation.size());
    for (const auto& [id, value] : relation) {
        out.push_back(value);
    }
    return out;
}

template <typename T>
std::optional<T> find_in(const std::map<EntityId, T>& relation, EntityId id) {
    auto it = relation.find(id);
    if (it == relation.end()) return std::nullopt;
    return it->second;
}

template <typename T>
void read_relation(const json& j, const char* key, std::map<EntityId, T>& out) {
    if (!j.contains(key)) return;
    if (!j[key].is_array()) {
        throw StorageUnavailable(std::string("corrupt relation ") + key);
    }
    for (const auto& item : j[key]) {
        T value = item.get<T>();
        out[value.id] = std::move(value);
    }
}

template <typename T>
json write_relation(const std::map<EntityId, T>& relation) {
    json arr = json::array();
    for (const auto& [id, value] : relation) {
        arr.push_back(json(value));
    }
    return arr;
}

void bump(std::atomic<EntityId>& counter, EntityId seen) {
    if (counter.load() <= seen) counter.store(seen + 1);
}

void validate_belief(const Belief& b, const MemoryState& state) {
    const std::string who = "belief " + std::to_string(b.id);
    if (b.id == 0) {
        throw ValidationFailure("belief without identifier");
    }
    if (!is_unit(b.confidence)) {
        throw ValidationFailure(who + " confidence outside [0,1]");
    }
    if (b.status == BeliefStatus::PROPOSED && !b.verified && b.confidence >= 1.0) {
        throw ValidationFailure(who + " is unverified with confidence 1.0");
    }
    if (b.statement.empty()) {
        throw ValidationFailure(who + " has an empty statement");
    }
    for (EntityId ev : b.evidence_ids) {
        if (state.episodes.count(ev) == 0) {
            throw ValidationFailure(who + " cites unknown episode " + std::to_string(ev));
        }
    }
    for (EntityId other : b.conflicts_with_ids) {
        if (other == b.id) {
            throw ValidationFailure(who + " conflicts with itself");
        }
        auto it = state.beliefs.find(other);
        if (it == state.beliefs.end()) {
            throw ValidationFailure(who + " conflicts with unknown belief " + std::to_string(other));
        }
        if (it->second.conflicts_with_ids.count(b.id) == 0) {
            throw ValidationFailure("asymmetric conflict between beliefs " +
                                    std::to_string(b.id) + " and " + std::to_string(other));
        }
    }
}

void validate_skill(const Skill& s, const MemoryState& state) {
    const std::string who = "skill " + std::to_string(s.id);
    if (s.id == 0 || s.name.empty()) {
        throw ValidationFailure("skill without identifier or name");
    }
    if (!is_unit(s.success_rate)) {
        throw ValidationFailure(who + " success_rate outside [0,1]");
    }
    if (s.successes > s.attempts) {
        throw ValidationFailure(who + " has more successes than attempts");
    }
    for (EntityId ev : s.evidence_ids) {
        if (state.episodes.count(ev) == 0) {
            throw ValidationFailure(who + " cites unknown episode " + std::to_string(ev));
        }
    }
}

} // namespace

std::set<EntityId> cited_episodes(const std::map<EntityId, Belief>& beliefs,
                                  const std::map<EntityId, Skill>& skills) {
    std::set<EntityId> cited;
    for (const auto& [id, b] : beliefs) {
        if (b.status == BeliefStatus::RETRACTED) continue;
        cited.insert(b.evidence_ids.begin(), b.evidence_ids.end());
    }
    for (const auto& [id, s] : skills) {
        cited.insert(s.evidence_ids.begin(), s.evidence_ids.end());
    }
    return cited;
}

Store::Store(MemoryConfig config, std::unique_ptr<StorageBackend> backend)
    : config_(std::move(config))
    , backend_(backend ? std::move(backend) : std::make_unique<InMemoryBackend>())
    , clock_(system_now_ms) {
    config_.validate();
    load();
}

void Store::load() {
    auto persisted = backend_->load();
    if (!persisted) {
        spdlog::info("Store: starting empty ({})", backend_->describe());
        return;
    }

    MemoryState loaded;
    try {
        const json& j = *persisted;
        read_relation(j, "beliefs", loaded.beliefs);
        read_relation(j, "skills", loaded.skills);
        read_relation(j, "goals", loaded.goals);
        read_relation(j, "self_model", loaded.self_model);
        read_relation(j, "hypotheses", loaded.hypotheses);
        loaded.watermark = j.value("watermark", static_cast<EntityId>(0));

        // Journal replay may repeat episodes already in the snapshot when a
        // truncate was lost; the first copy wins.
        if (j.contains("episodes") && j["episodes"].is_array()) {
            for (const auto& item : j["episodes"]) {
                Episode e = item.get<Episode>();
                loaded.episodes.emplace(e.id, std::move(e));
            }
        }

        if (j.contains("next_ids") && j["next_ids"].is_object()) {
            const auto& ids = j["next_ids"];
            next_episode_id_ = ids.value("episode", static_cast<EntityId>(1));
            next_belief_id_ = ids.value("belief", static_cast<EntityId>(1));
            next_skill_id_ = ids.value("skill", static_cast<EntityId>(1));
            next_goal_id_ = ids.value("goal", static_cast<EntityId>(1));
            next_self_model_id_ = ids.value("self_model", static_cast<EntityId>(1));
            next_hypothesis_id_ = ids.value("hypothesis", static_cast<EntityId>(1));
        }
    } catch (const json::exception& e) {
        throw StorageUnavailable(std::string("corrupt state: ") + e.what());
    } catch (const ValidationFailure& e) {
        throw StorageUnavailable(std::string("corrupt state: ") + e.what());
    }

    if (!loaded.episodes.empty()) bump(next_episode_id_, loaded.episodes.rbegin()->first);
    if (!loaded.beliefs.empty()) bump(next_belief_id_, loaded.beliefs.rbegin()->first);
    if (!loaded.skills.empty()) bump(next_skill_id_, loaded.skills.rbegin()->first);
    if (!loaded.goals.empty()) bump(next_goal_id_, loaded.goals.rbegin()->first);
    if (!loaded.self_model.empty()) bump(next_self_model_id_, loaded.self_model.rbegin()->first);
    if (!loaded.hypotheses.empty()) bump(next_hypothesis_id_, loaded.hypotheses.rbegin()->first);

    if (loaded.watermark > loaded.max_episode_id()) {
        spdlog::warn("Store: watermark {} beyond last episode {}, clamping",
                     loaded.watermark, loaded.max_episode_id());
        loaded.watermark = loaded.max_episode_id();
    }

    spdlog::info("Store: loaded {} episode(s), {} belief(s), {} skill(s), watermark {} ({})",
                 loaded.episodes.size(), loaded.beliefs.size(), loaded.skills.size(),
                 loaded.watermark, backend_->describe());

    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = std::move(loaded);
}

json Store::to_snapshot(const MemoryState& state) const {
    return {
        {"version", SNAPSHOT_VERSION},
        {"watermark", state.watermark},
        {"next_ids", {
            {"episode", next_episode_id_.load()},
            {"belief", next_belief_id_.load()},
            {"skill", next_skill_id_.load()},
            {"goal", next_goal_id_.load()},
            {"self_model", next_self_model_id_.load()},
            {"hypothesis", next_hypothesis_id_.load()}
        }},
        {"episodes", write_relation(state.episodes)},
        {"beliefs", write_relation(state.beliefs)},
        {"skills", write_relation(state.skills)},
        {"goals", write_relation(state.goals)},
        {"self_model", write_relation(state.self_model)},
        {"hypotheses", write_relation(state.hypotheses)}
    };
}

void Store::commit(MemoryState next) {
    backend_->write_snapshot(to_snapshot(next));
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = std::move(next);
}

// =============================================================================
// Episodes
// =============================================================================

EntityId Store::append_episode(EpisodeKind kind, const EpisodePayload& payload,
                               std::optional<double> salience,
                               std::optional<Embedding> embedding) {
    const double initial = salience.value_or(config_.default_salience);
    if (!std::isfinite(initial) || initial < 0.0) {
        throw ValidationFailure("salience must be a finite value >= 0");
    }
    if (!payload.fields.is_object()) {
        throw ValidationFailure("payload fields must be an object");
    }

    Episode episode;
    episode.kind = kind;
    episode.payload = payload;
    episode.salience = initial;
    episode.content_hash = episode_content_hash(kind, payload);
    episode.embedding = std::move(embedding);

    std::lock_guard<std::mutex> io(io_mutex_);

    if (payload.goal_id) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_.goals.count(*payload.goal_id) == 0) {
            throw ValidationFailure("unknown goal " + std::to_string(*payload.goal_id));
        }
    }

    const Timestamp at = now();
    episode.id = next_episode_id_.load();
    episode.timestamp = at;
    episode.updated_at = at;
    episode.salience_updated_at = at;

    // Journal first; the id is only consumed once the episode is durable.
    backend_->append_record("episodes", episode);
    next_episode_id_.store(episode.id + 1);

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_.episodes.emplace(episode.id, episode);
    }

    spdlog::debug("Store: appended episode {} ({})", episode.id, episode_kind_to_string(kind));
    return episode.id;
}

std::optional<Episode> Store::get_episode(EntityId id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return find_in(state_.episodes, id);
}

std::vector<Episode> Store::list_episodes(bool include_pruned) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    std::vector<Episode> out;
    out.reserve(state_.episodes.size());
    for (const auto& [id, e] : state_.episodes) {
        if (!include_pruned && e.pruned) continue;
        out.push_back(e);
    }
    return out;
}

// =============================================================================
// Beliefs, skills, self-model
// =============================================================================

std::optional<Belief> Store::get_belief(EntityId id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return find_in(state_.beliefs, id);
}

std::vector<Belief> Store::list_beliefs() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return values_of(state_.beliefs);
}

std::optional<Skill> Store::get_skill(EntityId id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return find_in(state_.skills, id);
}

std::optional<Skill> Store::find_skill(const std::string& name) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    for (const auto& [id, s] : state_.skills) {
        if (s.name == name) return s;
    }
    return std::nullopt;
}

std::vector<Skill> Store::list_skills() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return values_of(state_.skills);
}

std::optional<SelfModelEntry> Store::get_self_model(EntityId id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return find_in(state_.self_model, id);
}

std::vector<SelfModelEntry> Store::list_self_model() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return values_of(state_.self_model);
}

std::optional<std::vector<EvidenceRef>> Store::evidence_for(EntityId belief_id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = state_.beliefs.find(belief_id);
    if (it == state_.beliefs.end()) {
        return std::nullopt;
    }

    std::vector<EvidenceRef> refs;
    for (EntityId ev : it->second.evidence_ids) {
        EvidenceRef ref;
        ref.episode_id = ev;
        auto ep = state_.episodes.find(ev);
        if (ep == state_.episodes.end()) {
            ref.missing = true;
        } else {
            ref.content_hash = ep->second.content_hash;
            ref.timestamp = ep->second.timestamp;
            ref.pruned = ep->second.pruned;
        }
        refs.push_back(std::move(ref));
    }
    return refs;
}

// =============================================================================
// Goals
// =============================================================================

Goal Store::create_goal(const std::string& description, int priority) {
    if (description.empty()) {
        throw ValidationFailure("goal description is empty");
    }

    std::lock_guard<std::mutex> io(io_mutex_);

    Goal goal;
    goal.id = next_goal_id_.load();
    goal.description = description;
    goal.priority = priority;
    goal.created_at = now();
    goal.updated_at = goal.created_at;

    put_goal(goal);
    next_goal_id_.store(goal.id + 1);
    spdlog::debug("Store: created goal {}", goal.id);
    return goal;
}

Goal Store::update_goal_progress(EntityId id, double progress) {
    if (!is_unit(progress)) {
        throw ValidationFailure("goal progress outside [0,1]");
    }

    std::lock_guard<std::mutex> io(io_mutex_);
    Goal goal = goal_copy(id);
    if (goal.is_terminal()) {
        throw ValidationFailure("goal " + std::to_string(id) + " is " +
                                goal_status_to_string(goal.status));
    }
    goal.progress = progress;
    goal.updated_at = now();

    put_goal(goal);
    return goal;
}

Goal Store::update_goal_status(EntityId id, GoalStatus status) {
    std::lock_guard<std::mutex> io(io_mutex_);
    Goal goal = goal_copy(id);
    if (goal.is_terminal() && goal.status != status) {
        throw ValidationFailure("goal " + std::to_string(id) + " is " +
                                goal_status_to_string(goal.status));
    }
    goal.status = status;
    if (status == GoalStatus::COMPLETED) {
        goal.progress = 1.0;
    }
    goal.updated_at = now();

    put_goal(goal);
    return goal;
}

Goal Store::goal_copy(EntityId id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = state_.goals.find(id);
    if (it == state_.goals.end()) {
        throw ValidationFailure("unknown goal " + std::to_string(id));
    }
    return it->second;
}

void Store::put_goal(const Goal& goal) {
    backend_->append_record("goals", goal);
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.goals[goal.id] = goal;
}

std::optional<Goal> Store::get_goal(EntityId id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return find_in(state_.goals, id);
}

std::vector<Goal> Store::list_goals() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return values_of(state_.goals);
}

// =============================================================================
// Hypotheses
// =============================================================================

Hypothesis Store::register_hypothesis(const std::string& claim,
                                      const std::string& verification_plan,
                                      double confidence) {
    if (claim.empty()) {
        throw ValidationFailure("hypothesis claim is empty");
    }
    if (!is_unit(confidence)) {
        throw ValidationFailure("hypothesis confidence outside [0,1]");
    }

    std::lock_guard<std::mutex> io(io_mutex_);

    Hypothesis h;
    h.id = next_hypothesis_id_.load();
    h.claim = claim;
    h.verification_plan = verification_plan;
    h.confidence = confidence;
    h.created_at = now();
    h.updated_at = h.created_at;

    put_hypothesis(h);
    next_hypothesis_id_.store(h.id + 1);
    spdlog::debug("Store: registered hypothesis {}", h.id);
    return h;
}

Hypothesis Store::resolve_hypothesis(EntityId id, HypothesisStatus outcome,
                                     std::optional<double> confidence) {
    if (outcome == HypothesisStatus::OPEN) {
        throw ValidationFailure("a hypothesis resolves to verified or rejected");
    }
    if (confidence && !is_unit(*confidence)) {
        throw ValidationFailure("hypothesis confidence outside [0,1]");
    }

    std::lock_guard<std::mutex> io(io_mutex_);
    Hypothesis h = hypothesis_copy(id);
    if (h.status != HypothesisStatus::OPEN) {
        throw ValidationFailure("hypothesis " + std::to_string(id) + " is already " +
                                hypothesis_status_to_string(h.status));
    }
    h.status = outcome;
    if (confidence) {
        h.confidence = *confidence;
    } else {
        h.confidence = outcome == HypothesisStatus::VERIFIED ? 1.0 : 0.0;
    }
    h.updated_at = now();

    put_hypothesis(h);
    return h;
}

Hypothesis Store::hypothesis_copy(EntityId id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = state_.hypotheses.find(id);
    if (it == state_.hypotheses.end()) {
        throw ValidationFailure("unknown hypothesis " + std::to_string(id));
    }
    return it->second;
}

void Store::put_hypothesis(const Hypothesis& h) {
    backend_->append_record("hypotheses", h);
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.hypotheses[h.id] = h;
}

std::optional<Hypothesis> Store::get_hypothesis(EntityId id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return find_in(state_.hypotheses, id);
}

std::vector<Hypothesis> Store::list_hypotheses() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return values_of(state_.hypotheses);
}

// =============================================================================
// Consolidation
// =============================================================================

MemoryState Store::snapshot() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

EntityId Store::watermark() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_.watermark;
}

EntityId Store::max_episode_id() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_.max_episode_id();
}

EntityId Store::reserve_belief_id() { return next_belief_id_.fetch_add(1); }
EntityId Store::reserve_skill_id() { return next_skill_id_.fetch_add(1); }
EntityId Store::reserve_self_model_id() { return next_self_model_id_.fetch_add(1); }

void Store::apply_consolidation_batch(const ConsolidationBatch& batch) {
    std::lock_guard<std::mutex> io(io_mutex_);
    MemoryState next = snapshot();

    if (next.watermark != batch.expected_prior_watermark) {
        throw ValidationFailure("watermark moved from " +
                                std::to_string(batch.expected_prior_watermark) +
                                " to " + std::to_string(next.watermark));
    }
    if (batch.watermark < next.watermark) {
        throw ValidationFailure("watermark may not move backwards");
    }
    if (batch.watermark > next.max_episode_id()) {
        throw ValidationFailure("watermark " + std::to_string(batch.watermark) +
                                " beyond last episode");
    }

    for (const auto& belief : batch.belief_upserts) {
        next.beliefs[belief.id] = belief;
    }
    for (const auto& skill : batch.skill_upserts) {
        next.skills[skill.id] = skill;
    }
    for (const auto& entry : batch.self_model_upserts) {
        if (!is_unit(entry.reliability_score)) {
            throw ValidationFailure("self-model reliability outside [0,1]");
        }
        next.self_model[entry.id] = entry;
    }

    for (const auto& promotion : batch.promotions) {
        auto it = next.hypotheses.find(promotion.hypothesis_id);
        if (it == next.hypotheses.end()) {
            throw ValidationFailure("unknown hypothesis " + std::to_string(promotion.hypothesis_id));
        }
        Hypothesis& h = it->second;
        if (h.status != HypothesisStatus::VERIFIED || h.promoted_belief_id) {
            throw ValidationFailure("hypothesis " + std::to_string(h.id) + " is not promotable");
        }
        if (next.beliefs.count(promotion.belief_id) == 0) {
            throw ValidationFailure("promotion of hypothesis " + std::to_string(h.id) +
                                    " names no belief");
        }
        h.promoted_belief_id = promotion.belief_id;
        h.updated_at = now();
    }

    for (const auto& belief : batch.belief_upserts) {
        validate_belief(belief, next);
    }
    for (const auto& skill : batch.skill_upserts) {
        validate_skill(skill, next);
    }

    for (const auto& [id, update] : batch.salience_updates) {
        auto it = next.episodes.find(id);
        if (it == next.episodes.end() || id > batch.watermark) {
            throw ValidationFailure("salience update for episode " + std::to_string(id) +
                                    " outside the window");
        }
        if (!std::isfinite(update.salience) || update.salience < 0.0) {
            throw ValidationFailure("salience must be a finite value >= 0");
        }
        it->second.salience = update.salience;
        it->second.salience_updated_at = update.at;
    }

    const auto cited = cited_episodes(next.beliefs, next.skills);
    const Timestamp at = now();
    for (EntityId id : batch.prunes) {
        auto it = next.episodes.find(id);
        if (it == next.episodes.end() || id > batch.watermark) {
            throw ValidationFailure("prune of episode " + std::to_string(id) + " outside the window");
        }
        if (cited.count(id) > 0) {
            throw ValidationFailure("episode " + std::to_string(id) + " is cited as evidence");
        }
        Episode& e = it->second;
        if (e.pruned) continue;
        e.pruned = true;
        e.payload = EpisodePayload{};
        e.embedding.reset();
        e.updated_at = at;
    }

    next.watermark = batch.watermark;
    commit(std::move(next));

    spdlog::debug("Store: committed batch, watermark {} -> {}",
                  batch.expected_prior_watermark, batch.watermark);
}

Timestamp Store::now() const {
    std::lock_guard<std::mutex> lock(clock_mutex_);
    return clock_();
}

void Store::set_clock(Clock clock) {
    std::lock_guard<std::mutex> lock(clock_mutex_);
    clock_ = clock ? std::move(clock) : Clock(system_now_ms);
}

} // namespace reverie::memory
