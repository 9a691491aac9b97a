#pragma once
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "memory/config.hpp"
#include "memory/store.hpp"
#include "memory/types.hpp"

namespace reverie::memory {

struct MemoryQuery {
    std::string text;
    std::optional<Embedding> vector;
    std::optional<EntityId> active_goal_id;
    std::set<EntityType> types;          // empty = every type
    size_t top_k = 5;
    bool include_inactive = false;       // pruned episodes, retracted/archived beliefs

    static MemoryQuery from_json(const nlohmann::json& j);
};

struct ScoredRef {
    EntityRef ref;
    double score = 0.0;
    Timestamp updated_at = 0;
    std::string text;                    // what the lexical signal matched against
};

void to_json(nlohmann::json& j, const ScoredRef& r);

// Stateless hybrid ranking over a Store snapshot. Never writes.
class Retriever {
public:
    Retriever(const Store& store, const MemoryConfig& config)
        : store_(store), config_(config) {}

    std::vector<ScoredRef> query(const MemoryQuery& query) const;

    // Ranking over an explicit state, usable without a Store.
    static std::vector<ScoredRef> rank(const MemoryState& state, const MemoryQuery& query,
                                       const MemoryConfig& config, Timestamp now);

private:
    const Store& store_;
    MemoryConfig config_;
};

} // namespace reverie::memory
