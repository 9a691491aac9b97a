#include "memory/retriever.hpp"
#include "memory/errors.hpp"
#include "memory/text.hpp"
#include <algorithm>
#include <cmath>

using json = nlohmann::json;

namespace reverie::memory {

namespace {

// One rankable record flattened out of its relation
struct Candidate {
    EntityRef ref;
    std::string text;
    double confidence = 1.0;
    Timestamp updated_at = 0;
    const Embedding* embedding = nullptr;
    const std::set<EntityId>* evidence = nullptr;
    std::optional<EntityId> goal_id;     // episodes only
};

std::string join_steps(const std::vector<std::string>& steps) {
    std::string out;
    for (const auto& step : steps) {
        out += ' ';
        out += step;
    }
    return out;
}

std::string join_set(const std::set<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        out += ' ';
        out += item;
    }
    return out;
}

bool wants(const MemoryQuery& query, EntityType type) {
    return query.types.empty() || query.types.count(type) > 0;
}

std::vector<Candidate> collect(const MemoryState& state, const MemoryQuery& query) {
    std::vector<Candidate> out;

    if (wants(query, EntityType::EPISODE)) {
        for (const auto& [id, e] : state.episodes) {
            if (e.pruned && !query.include_inactive) continue;
            Candidate c;
            c.ref = {EntityType::EPISODE, id};
            c.text = e.payload.text;
            c.updated_at = e.updated_at;
            c.embedding = e.embedding ? &*e.embedding : nullptr;
            c.goal_id = e.payload.goal_id;
            out.push_back(std::move(c));
        }
    }
    if (wants(query, EntityType::BELIEF)) {
        for (const auto& [id, b] : state.beliefs) {
            if (!b.is_live() && !query.include_inactive) continue;
            Candidate c;
            c.ref = {EntityType::BELIEF, id};
            c.text = b.statement;
            c.confidence = b.confidence;
            c.updated_at = b.updated_at;
            c.embedding = b.embedding ? &*b.embedding : nullptr;
            c.evidence = &b.evidence_ids;
            out.push_back(std::move(c));
        }
    }
    if (wants(query, EntityType::SKILL)) {
        for (const auto& [id, s] : state.skills) {
            Candidate c;
            c.ref = {EntityType::SKILL, id};
            c.text = s.name + " " + s.preconditions + join_steps(s.steps);
            c.confidence = s.success_rate;
            c.updated_at = s.updated_at;
            c.evidence = &s.evidence_ids;
            out.push_back(std::move(c));
        }
    }
    if (wants(query, EntityType::GOAL)) {
        for (const auto& [id, g] : state.goals) {
            if (g.is_terminal() && !query.include_inactive) continue;
            Candidate c;
            c.ref = {EntityType::GOAL, id};
            c.text = g.description;
            c.updated_at = g.updated_at;
            out.push_back(std::move(c));
        }
    }
    if (wants(query, EntityType::SELF_MODEL)) {
        for (const auto& [id, m] : state.self_model) {
            Candidate c;
            c.ref = {EntityType::SELF_MODEL, id};
            c.text = m.capability + join_set(m.limitations);
            c.confidence = m.reliability_score;
            c.updated_at = m.updated_at;
            out.push_back(std::move(c));
        }
    }
    if (wants(query, EntityType::HYPOTHESIS)) {
        for (const auto& [id, h] : state.hypotheses) {
            Candidate c;
            c.ref = {EntityType::HYPOTHESIS, id};
            c.text = h.claim + " " + h.verification_plan;
            c.confidence = h.confidence;
            c.updated_at = h.updated_at;
            out.push_back(std::move(c));
        }
    }
    return out;
}

} // namespace

MemoryQuery MemoryQuery::from_json(const json& j) {
    MemoryQuery q;
    q.text = j.value("query", j.value("text", std::string{}));
    if (j.contains("vector") && j["vector"].is_array()) {
        q.vector = j["vector"].get<Embedding>();
    }
    if (j.contains("goal_id") && j["goal_id"].is_number_integer()) {
        q.active_goal_id = j["goal_id"].get<EntityId>();
    }
    if (j.contains("types") && j["types"].is_array()) {
        for (const auto& t : j["types"]) {
            const std::string raw = t.get<std::string>();
            auto type = entity_type_from_string(raw);
            if (!type) {
                throw ValidationFailure("unknown entity type '" + raw + "'");
            }
            q.types.insert(*type);
        }
    }
    q.top_k = j.value("top_k", static_cast<size_t>(5));
    q.include_inactive = j.value("include_inactive", false);
    return q;
}

void to_json(json& j, const ScoredRef& r) {
    j = json{
        {"ref", r.ref},
        {"score", r.score},
        {"updated_at", r.updated_at},
        {"text", r.text}
    };
}

std::vector<ScoredRef> Retriever::query(const MemoryQuery& query) const {
    return rank(store_.snapshot(), query, config_, store_.now());
}

std::vector<ScoredRef> Retriever::rank(const MemoryState& state, const MemoryQuery& query,
                                       const MemoryConfig& config, Timestamp now) {
    const auto& w = config.weights;

    // Active goal: its description and the episodes that served it
    const Goal* goal = nullptr;
    std::set<EntityId> goal_episodes;
    if (query.active_goal_id) {
        auto it = state.goals.find(*query.active_goal_id);
        if (it != state.goals.end()) {
            goal = &it->second;
            for (const auto& [id, e] : state.episodes) {
                if (e.payload.goal_id == goal->id) goal_episodes.insert(id);
            }
        }
    }

    std::vector<ScoredRef> ranked;
    for (const auto& c : collect(state, query)) {
        double total = 0.0;
        double weight = 0.0;

        total += w.lexical * text::lexical_overlap(query.text, c.text);
        weight += w.lexical;

        const double age = static_cast<double>(std::max<Timestamp>(0, now - c.updated_at));
        const double recency = config.recency_half_life_ms > 0
            ? std::pow(0.5, age / static_cast<double>(config.recency_half_life_ms))
            : 1.0;
        total += w.recency * recency;
        weight += w.recency;

        total += w.confidence * std::clamp(c.confidence, 0.0, 1.0);
        weight += w.confidence;

        // Omitted, not zeroed, so a missing provider does not drag scores down.
        if (query.vector && c.embedding) {
            total += w.vector * text::cosine(*query.vector, *c.embedding);
            weight += w.vector;
        }

        if (goal) {
            double relevance = 0.0;
            if (c.goal_id && *c.goal_id == goal->id) {
                relevance = 1.0;
            } else if (c.evidence) {
                for (EntityId ev : *c.evidence) {
                    if (goal_episodes.count(ev)) {
                        relevance = 1.0;
                        break;
                    }
                }
            }
            if (relevance < 1.0) {
                relevance = text::lexical_overlap(goal->description, c.text);
            }
            total += w.goal * relevance;
            weight += w.goal;
        }

        ScoredRef scored;
        scored.ref = c.ref;
        scored.score = weight > 0.0 ? total / weight : 0.0;
        scored.updated_at = c.updated_at;
        scored.text = c.text;
        ranked.push_back(std::move(scored));
    }

    std::sort(ranked.begin(), ranked.end(), [](const ScoredRef& a, const ScoredRef& b) {
        if (a.score != b.score) return a.score > b.score;
        if (a.updated_at != b.updated_at) return a.updated_at > b.updated_at;
        if (a.ref.id != b.ref.id) return a.ref.id < b.ref.id;
        return static_cast<int>(a.ref.type) < static_cast<int>(b.ref.type);
    });

    if (ranked.size() > query.top_k) {
        ranked.resize(query.top_k);
    }
    return ranked;
}

} // namespace reverie::memory
