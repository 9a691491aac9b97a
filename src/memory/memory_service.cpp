#include "memory/memory_service.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace reverie::memory {

namespace {

template <typename T>
std::vector<T> latest(std::vector<T> items, size_t limit) {
    std::stable_sort(items.begin(), items.end(), [](const T& a, const T& b) {
        return a.updated_at > b.updated_at;
    });
    if (items.size() > limit) items.resize(limit);
    return items;
}

} // namespace

MemoryService::MemoryService(const MemoryConfig& config,
                             std::unique_ptr<StorageBackend> backend,
                             std::shared_ptr<ExtractionProvider> extractor,
                             std::shared_ptr<EmbeddingProvider> embedder)
    : config_(config)
    , embedder_(embedder)
    , store_(config, std::move(backend))
    , retriever_(store_, config)
    , consolidator_(store_, config, std::move(extractor), std::move(embedder)) {}

std::unique_ptr<MemoryService> MemoryService::open(const MemoryConfig& config,
                                                   std::shared_ptr<ExtractionProvider> extractor,
                                                   std::shared_ptr<EmbeddingProvider> embedder) {
    std::unique_ptr<StorageBackend> backend;
    if (config.data_dir.empty()) {
        backend = std::make_unique<InMemoryBackend>();
    } else {
        backend = std::make_unique<JsonFileBackend>(config.data_dir);
    }
    spdlog::info("MemoryService: opening {}", backend->describe());
    return std::make_unique<MemoryService>(config, std::move(backend),
                                           std::move(extractor), std::move(embedder));
}

EntityId MemoryService::append_episode(EpisodeKind kind, const EpisodePayload& payload,
                                       std::optional<double> salience) {
    std::optional<Embedding> embedding;
    if (embedder_ && !payload.text.empty()) {
        embedding = embedder_->embed(payload.text);
    }
    return store_.append_episode(kind, payload, salience, std::move(embedding));
}

std::vector<ScoredRef> MemoryService::query_memory(const MemoryQuery& query) const {
    return retriever_.query(query);
}

json MemoryService::inspect_recent(size_t limit) const {
    json out;

    out["watermark"] = store_.watermark();

    json episodes = json::array();
    auto all_episodes = store_.list_episodes(true);
    const size_t first = all_episodes.size() > limit ? all_episodes.size() - limit : 0;
    for (size_t i = all_episodes.size(); i > first; --i) {
        const Episode& e = all_episodes[i - 1];
        json row;
        row["id"] = e.id;
        row["kind"] = episode_kind_to_string(e.kind);
        row["timestamp"] = e.timestamp;
        row["salience"] = e.salience;
        row["pruned"] = e.pruned;
        if (!e.pruned) {
            row["text"] = e.payload.text;
        }
        episodes.push_back(row);
    }
    out["episodes"] = episodes;

    json beliefs = json::array();
    for (const auto& b : latest(store_.list_beliefs(), limit)) {
        beliefs.push_back({
            {"id", b.id},
            {"statement", b.statement},
            {"confidence", b.confidence},
            {"status", belief_status_to_string(b.status)}
        });
    }
    out["beliefs"] = beliefs;

    json goals = json::array();
    for (const auto& g : latest(store_.list_goals(), limit)) {
        goals.push_back({
            {"id", g.id},
            {"description", g.description},
            {"status", goal_status_to_string(g.status)},
            {"progress", g.progress}
        });
    }
    out["goals"] = goals;

    return out;
}

} // namespace reverie::memory
