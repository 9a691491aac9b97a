/**
 * Reverie storage backends
 *
 * The Store keeps all relations in memory and hands every durable change to
 * a backend. Backends throw StorageUnavailable when the medium cannot be
 * used; they never retry.
 */
#pragma once
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace reverie::memory {

class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    // Full persisted state: the last snapshot with journaled records merged
    // into their relation arrays. nullopt when nothing was stored yet.
    virtual std::optional<nlohmann::json> load() = 0;

    // Durably record one new or changed record of a journaled relation
    // ("episodes", "goals", "hypotheses").
    virtual void append_record(const std::string& relation, const nlohmann::json& record) = 0;

    // Atomically replace the persisted state with a full snapshot.
    virtual void write_snapshot(const nlohmann::json& snapshot) = 0;

    virtual std::string describe() const = 0;
};

// Keeps nothing; state lives only as long as the Store.
class InMemoryBackend : public StorageBackend {
public:
    std::optional<nlohmann::json> load() override { return std::nullopt; }
    void append_record(const std::string&, const nlohmann::json&) override {}
    void write_snapshot(const nlohmann::json&) override {}
    std::string describe() const override { return "in-memory"; }
};

// <dir>/memory.json holds the last snapshot, written to a temp file and
// renamed into place. <dir>/journal.jsonl holds one {"relation", "record"}
// line per episode, goal or hypothesis change since; it is truncated once a
// snapshot containing them is in place. On load a journaled episode never
// replaces a snapshot copy, and a journaled goal or hypothesis replaces it
// unless the snapshot copy is newer.
class JsonFileBackend : public StorageBackend {
public:
    explicit JsonFileBackend(std::filesystem::path dir);

    std::optional<nlohmann::json> load() override;
    void append_record(const std::string& relation, const nlohmann::json& record) override;
    void write_snapshot(const nlohmann::json& snapshot) override;
    std::string describe() const override;

    const std::filesystem::path& dir() const { return dir_; }

private:
    std::filesystem::path dir_;
    std::filesystem::path snapshot_path_;
    std::filesystem::path journal_path_;
    std::mutex mutex_;

    void ensure_dir();
};

} // namespace reverie::memory
