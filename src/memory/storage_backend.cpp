#include "memory/storage_backend.hpp"
#include "core/paths.hpp"
#include "memory/errors.hpp"
#include <fstream>
#include <system_error>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace reverie::memory {

namespace {

// Merges one journaled record into the relation array it belongs to.
void replay_record(json& state, const std::string& relation, json record) {
    if (!state.contains(relation) || !state[relation].is_array()) {
        state[relation] = json::array();
    }
    auto& items = state[relation];
    const auto id = record.value("id", static_cast<uint64_t>(0));
    for (auto& existing : items) {
        if (existing.value("id", static_cast<uint64_t>(0)) != id) {
            continue;
        }
        if (relation != "episodes" &&
            record.value("updated_at", static_cast<int64_t>(0)) >=
                existing.value("updated_at", static_cast<int64_t>(0))) {
            existing = std::move(record);
        }
        return;
    }
    items.push_back(std::move(record));
}

} // namespace

JsonFileBackend::JsonFileBackend(std::filesystem::path dir)
    : dir_(std::move(dir))
    , snapshot_path_(dir_ / "memory.json")
    , journal_path_(dir_ / "journal.jsonl") {}

std::string JsonFileBackend::describe() const {
    return "json-file:" + dir_.string();
}

void JsonFileBackend::ensure_dir() {
    if (!core::paths::ensure_dir(dir_)) {
        throw StorageUnavailable("cannot create directory " + dir_.string());
    }
}

std::optional<json> JsonFileBackend::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;

    json state;
    bool found = false;

    if (std::filesystem::exists(snapshot_path_, ec)) {
        std::ifstream in(snapshot_path_);
        if (!in) {
            throw StorageUnavailable("cannot open " + snapshot_path_.string());
        }
        state = json::parse(in, nullptr, false);
        if (state.is_discarded() || !state.is_object()) {
            throw StorageUnavailable("corrupt snapshot " + snapshot_path_.string());
        }
        found = true;
    }

    if (std::filesystem::exists(journal_path_, ec)) {
        std::ifstream in(journal_path_);
        if (!in) {
            throw StorageUnavailable("cannot open " + journal_path_.string());
        }
        if (!found) {
            state = json::object();
            found = true;
        }

        std::string line;
        size_t line_no = 0;
        size_t replayed = 0;
        while (std::getline(in, line)) {
            ++line_no;
            if (line.empty()) continue;
            json entry = json::parse(line, nullptr, false);
            if (entry.is_discarded() || !entry.is_object() ||
                !entry.contains("relation") || !entry["relation"].is_string() ||
                !entry.contains("record") || !entry["record"].is_object()) {
                // A torn final line is the only expected corruption.
                spdlog::warn("JsonFileBackend: skipping unreadable journal line {}", line_no);
                continue;
            }
            replay_record(state, entry["relation"].get<std::string>(), std::move(entry["record"]));
            ++replayed;
        }
        if (replayed > 0) {
            spdlog::info("JsonFileBackend: replayed {} journaled record(s)", replayed);
        }
    }

    if (!found) {
        return std::nullopt;
    }
    return state;
}

void JsonFileBackend::append_record(const std::string& relation, const json& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_dir();

    std::ofstream out(journal_path_, std::ios::app);
    if (!out) {
        throw StorageUnavailable("cannot open " + journal_path_.string());
    }
    json entry;
    entry["relation"] = relation;
    entry["record"] = record;
    out << entry.dump() << '\n';
    out.flush();
    if (!out) {
        throw StorageUnavailable("write failed on " + journal_path_.string());
    }
}

void JsonFileBackend::write_snapshot(const json& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_dir();

    auto tmp_path = snapshot_path_;
    tmp_path += ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out) {
            throw StorageUnavailable("cannot open " + tmp_path.string());
        }
        out << snapshot.dump();
        out.flush();
        if (!out) {
            throw StorageUnavailable("write failed on " + tmp_path.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, snapshot_path_, ec);
    if (ec) {
        std::filesystem::remove(tmp_path, ec);
        throw StorageUnavailable("cannot replace " + snapshot_path_.string());
    }

    // Every journaled record is now part of the snapshot.
    std::ofstream truncate(journal_path_, std::ios::trunc);
    if (!truncate) {
        spdlog::warn("JsonFileBackend: could not truncate {}, replay will deduplicate",
                     journal_path_.string());
    }
}

} // namespace reverie::memory
