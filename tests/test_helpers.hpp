#pragma once
#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "memory/memory_service.hpp"
#include "memory/providers.hpp"
#include "memory/storage_backend.hpp"
#include "memory/types.hpp"

namespace reverie::testing {

using memory::Timestamp;

constexpr Timestamp kEpoch = 1'700'000'000'000LL;

// Time that only moves when a test says so
class ManualClock {
public:
    explicit ManualClock(Timestamp start = kEpoch)
        : now_(std::make_shared<std::atomic<Timestamp>>(start)) {}

    memory::Clock fn() const {
        auto now = now_;
        return [now]() { return now->load(); };
    }
    Timestamp now() const { return now_->load(); }
    void advance(Timestamp ms) { now_->fetch_add(ms); }

private:
    std::shared_ptr<std::atomic<Timestamp>> now_;
};

memory::EpisodePayload text_payload(const std::string& text, bool verified = false);

// In-memory service on a manual clock
std::unique_ptr<memory::MemoryService> make_service(
    const ManualClock& clock,
    memory::MemoryConfig config = {},
    std::shared_ptr<memory::ExtractionProvider> extractor = nullptr,
    std::unique_ptr<memory::StorageBackend> backend = nullptr);

// Backend whose writes can be switched to fail
class FlakyBackend : public memory::StorageBackend {
public:
    std::atomic<bool> fail_appends{false};
    std::atomic<bool> fail_snapshots{false};
    std::atomic<int> snapshots_written{0};
    std::atomic<int> records_appended{0};

    std::optional<nlohmann::json> load() override { return std::nullopt; }
    void append_record(const std::string& relation, const nlohmann::json& record) override;
    void write_snapshot(const nlohmann::json& snapshot) override;
    std::string describe() const override { return "flaky"; }
};

// Extractor that parks inside extract() until released
class BlockingExtractor : public memory::ExtractionProvider {
public:
    std::optional<std::vector<memory::CandidateBelief>> extract(const memory::Episode& episode) override;

    void wait_until_entered();
    void release();

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool entered_ = false;
    bool released_ = false;
};

// Extractor that always fails
class ThrowingExtractor : public memory::ExtractionProvider {
public:
    std::optional<std::vector<memory::CandidateBelief>> extract(const memory::Episode& episode) override;
};

// Fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
    TempDir();
    ~TempDir();
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Every conflict link has its mirror
bool conflicts_symmetric(const std::vector<memory::Belief>& beliefs);

std::optional<memory::Belief> find_belief(const std::vector<memory::Belief>& beliefs,
                                          const std::string& statement);

} // namespace reverie::testing
