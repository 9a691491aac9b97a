#include <gtest/gtest.h>
#include <atomic>
#include <set>
#include <stdexcept>
#include <thread>
#include "memory/consolidator.hpp"
#include "test_helpers.hpp"

using namespace reverie::memory;
using reverie::testing::BlockingExtractor;
using reverie::testing::conflicts_symmetric;
using reverie::testing::FlakyBackend;
using reverie::testing::make_service;
using reverie::testing::ManualClock;
using reverie::testing::text_payload;
using reverie::testing::ThrowingExtractor;
using json = nlohmann::json;

namespace {

class StateRecorder {
public:
    Consolidator::StateListener listener() {
        return [this](ConsolidatorState state) {
            std::lock_guard<std::mutex> lock(mutex_);
            states_.push_back(state);
        };
    }

    std::vector<ConsolidatorState> states() {
        std::lock_guard<std::mutex> lock(mutex_);
        return states_;
    }

private:
    std::mutex mutex_;
    std::vector<ConsolidatorState> states_;
};

json dump_state(MemoryService& memory) {
    return {
        {"episodes", memory.list_episodes()},
        {"beliefs", memory.list_beliefs()},
        {"skills", memory.list_skills()},
        {"self_model", memory.list_self_model()},
        {"watermark", memory.watermark()}
    };
}

} // namespace

class ConsolidatorTest : public ::testing::Test {
protected:
    ManualClock clock_;
};

TEST_F(ConsolidatorTest, SecondRunWithoutEpisodesChangesNothing) {
    auto memory = make_service(clock_);
    for (int i = 0; i < 4; ++i) {
        memory->append_episode(EpisodeKind::OBSERVATION, text_payload("I love lo-fi music"));
    }
    memory->append_episode(EpisodeKind::OBSERVATION, text_payload("I hate lo-fi music"));
    EpisodePayload skill;
    skill.fields = {{"skill", "compile"}, {"success", true}};
    memory->append_episode(EpisodeKind::ACTION, skill);

    ASSERT_TRUE(memory->consolidate().committed());
    const json before = dump_state(*memory);

    auto report = memory->consolidate();
    ASSERT_TRUE(report.committed());
    EXPECT_EQ(report.episodes_processed, 0u);
    EXPECT_EQ(report.beliefs_created, 0u);
    EXPECT_EQ(report.beliefs_updated, 0u);
    EXPECT_EQ(report.prior_watermark, report.watermark);
    EXPECT_EQ(dump_state(*memory), before);
}

TEST_F(ConsolidatorTest, EpisodeAppendedMidRunWaitsForNextRun) {
    auto extractor = std::make_shared<BlockingExtractor>();
    auto memory = make_service(clock_, MemoryConfig{}, extractor);
    memory->append_episode(EpisodeKind::OBSERVATION, text_payload("I like sushi"));

    ConsolidationReport report;
    std::thread worker([&]() { report = memory->consolidate(); });

    extractor->wait_until_entered();
    EntityId late = memory->append_episode(EpisodeKind::OBSERVATION, text_payload("I like ramen"));
    extractor->release();
    worker.join();

    ASSERT_TRUE(report.committed());
    EXPECT_EQ(report.watermark, 1u);
    EXPECT_EQ(memory->list_beliefs().size(), 1u);

    auto next = memory->consolidate();
    EXPECT_EQ(next.watermark, late);
    EXPECT_EQ(next.episodes_processed, 1u);
    EXPECT_EQ(memory->list_beliefs().size(), 2u);
}

TEST_F(ConsolidatorTest, ConcurrentTriggerIsRejected) {
    auto extractor = std::make_shared<BlockingExtractor>();
    auto memory = make_service(clock_, MemoryConfig{}, extractor);
    StateRecorder recorder;
    memory->consolidator().set_state_listener(recorder.listener());
    memory->append_episode(EpisodeKind::OBSERVATION, text_payload("I like sushi"));

    ConsolidationReport first;
    std::thread worker([&]() { first = memory->consolidate(); });
    extractor->wait_until_entered();

    EXPECT_EQ(memory->consolidator().state(), ConsolidatorState::RUNNING);
    auto second = memory->consolidate();
    EXPECT_EQ(second.status, ConsolidationStatus::REJECTED);
    EXPECT_EQ(second.watermark, 0u);

    extractor->release();
    worker.join();

    ASSERT_TRUE(first.committed());
    EXPECT_EQ(memory->consolidator().state(), ConsolidatorState::IDLE);
    EXPECT_EQ(recorder.states(), (std::vector<ConsolidatorState>{
        ConsolidatorState::RUNNING, ConsolidatorState::COMMITTING, ConsolidatorState::IDLE}));
}

TEST_F(ConsolidatorTest, FailedCommitAbortsAndCanBeRetried) {
    auto backend = std::make_unique<FlakyBackend>();
    FlakyBackend* flaky = backend.get();
    auto memory = make_service(clock_, MemoryConfig{}, nullptr, std::move(backend));
    StateRecorder recorder;
    memory->consolidator().set_state_listener(recorder.listener());
    memory->append_episode(EpisodeKind::OBSERVATION, text_payload("I like sushi"));

    flaky->fail_snapshots = true;
    auto aborted = memory->consolidate();
    EXPECT_EQ(aborted.status, ConsolidationStatus::ABORTED);
    EXPECT_FALSE(aborted.reason.empty());
    EXPECT_EQ(aborted.watermark, 0u);
    EXPECT_EQ(memory->watermark(), 0u);
    EXPECT_TRUE(memory->list_beliefs().empty());
    EXPECT_EQ(memory->consolidator().state(), ConsolidatorState::IDLE);
    EXPECT_EQ(recorder.states(), (std::vector<ConsolidatorState>{
        ConsolidatorState::RUNNING, ConsolidatorState::COMMITTING,
        ConsolidatorState::ABORTED, ConsolidatorState::IDLE}));

    flaky->fail_snapshots = false;
    auto retried = memory->consolidate();
    ASSERT_TRUE(retried.committed());
    EXPECT_EQ(retried.watermark, 1u);
    EXPECT_EQ(memory->list_beliefs().size(), 1u);
}

TEST_F(ConsolidatorTest, ProviderFailureAbortsTheRun) {
    auto memory = make_service(clock_, MemoryConfig{}, std::make_shared<ThrowingExtractor>());
    memory->append_episode(EpisodeKind::OBSERVATION, text_payload("I like sushi"));

    auto report = memory->consolidate();
    EXPECT_EQ(report.status, ConsolidationStatus::ABORTED);
    EXPECT_EQ(report.reason, "extraction service unreachable");
    EXPECT_EQ(memory->watermark(), 0u);
    EXPECT_EQ(memory->consolidator().state(), ConsolidatorState::IDLE);
}

TEST_F(ConsolidatorTest, ReportCountsTagsAndSerializes) {
    auto memory = make_service(clock_);
    EpisodePayload a = text_payload("focus session");
    a.fields = {{"tags", {"music", "focus"}}};
    EpisodePayload b = text_payload("playlist");
    b.fields = {{"tags", {"music"}}};
    memory->append_episode(EpisodeKind::OBSERVATION, a);
    memory->append_episode(EpisodeKind::OBSERVATION, b);

    auto report = memory->consolidate();
    ASSERT_TRUE(report.committed());
    EXPECT_EQ(report.tag_counts.at("music"), 2u);
    EXPECT_EQ(report.tag_counts.at("focus"), 1u);

    json j = report.to_json();
    EXPECT_EQ(j["status"], "committed");
    EXPECT_EQ(j["watermark"], 2);
    EXPECT_EQ(j["episodes_processed"], 2);
    EXPECT_EQ(j["tag_counts"]["music"], 2);
    EXPECT_FALSE(j.contains("reason"));
}

TEST_F(ConsolidatorTest, ThrowingListenerDoesNotWedgeTheRun) {
    auto memory = make_service(clock_);
    int calls = 0;
    memory->consolidator().set_state_listener([&calls](ConsolidatorState state) {
        ++calls;
        if (state == ConsolidatorState::RUNNING && calls == 1) {
            throw std::runtime_error("observer crashed");
        }
    });
    memory->append_episode(EpisodeKind::OBSERVATION, text_payload("I like sushi"));

    auto first = memory->consolidate();
    ASSERT_TRUE(first.committed());
    EXPECT_EQ(first.watermark, 1u);
    EXPECT_EQ(memory->consolidator().state(), ConsolidatorState::IDLE);

    memory->append_episode(EpisodeKind::OBSERVATION, text_payload("I like ramen"));
    auto second = memory->consolidate();
    ASSERT_TRUE(second.committed());
    EXPECT_EQ(second.watermark, 2u);
}

TEST_F(ConsolidatorTest, ListenerThrowingOnAbortStillReturnsToIdle) {
    auto memory = make_service(clock_, MemoryConfig{}, std::make_shared<ThrowingExtractor>());
    memory->consolidator().set_state_listener([](ConsolidatorState state) {
        if (state == ConsolidatorState::ABORTED) {
            throw std::runtime_error("observer crashed");
        }
    });
    memory->append_episode(EpisodeKind::OBSERVATION, text_payload("I like sushi"));

    auto report = memory->consolidate();
    EXPECT_EQ(report.status, ConsolidationStatus::ABORTED);
    EXPECT_EQ(memory->consolidator().state(), ConsolidatorState::IDLE);
    EXPECT_EQ(memory->consolidate().status, ConsolidationStatus::ABORTED);
}

TEST_F(ConsolidatorTest, AppendsQueriesAndRunsInterleave) {
    auto memory = make_service(clock_);
    constexpr int kAppenders = 4;
    constexpr int kPerAppender = 50;
    const std::vector<std::string> lines = {
        "I love lo-fi music", "I hate lo-fi music", "I like green tea", "I dislike green tea",
    };

    std::atomic<bool> appending{true};
    std::atomic<int> out_of_order{0};
    std::atomic<int> aborted{0};
    std::atomic<int> watermark_regressions{0};
    std::atomic<int> queries{0};
    std::vector<std::vector<EntityId>> ids(kAppenders);

    std::vector<std::thread> appenders;
    for (int t = 0; t < kAppenders; ++t) {
        appenders.emplace_back([&, t]() {
            for (int i = 0; i < kPerAppender; ++i) {
                EntityId id = memory->append_episode(EpisodeKind::OBSERVATION,
                                                     text_payload(lines[(t + i) % lines.size()]));
                if (!ids[t].empty() && id <= ids[t].back()) {
                    out_of_order++;
                }
                ids[t].push_back(id);
            }
        });
    }

    std::vector<std::thread> runners;
    for (int r = 0; r < 2; ++r) {
        runners.emplace_back([&]() {
            EntityId last = 0;
            while (appending.load()) {
                auto report = memory->consolidate();
                if (report.status == ConsolidationStatus::ABORTED) {
                    aborted++;
                }
                if (report.committed()) {
                    if (report.watermark < last || report.watermark < report.prior_watermark) {
                        watermark_regressions++;
                    }
                    last = report.watermark;
                }
            }
        });
    }

    std::thread reader([&]() {
        MemoryQuery query;
        query.text = "lo-fi music";
        do {
            auto results = memory->query_memory(query);
            if (results.size() <= query.top_k) {
                queries++;
            }
        } while (appending.load());
    });

    for (auto& t : appenders) t.join();
    appending = false;
    for (auto& t : runners) t.join();
    reader.join();

    ConsolidationReport last = memory->consolidate();
    ASSERT_TRUE(last.committed());

    std::set<EntityId> all;
    for (const auto& per_thread : ids) {
        all.insert(per_thread.begin(), per_thread.end());
    }
    const EntityId total = kAppenders * kPerAppender;
    EXPECT_EQ(all.size(), static_cast<size_t>(total));
    EXPECT_EQ(*all.begin(), 1u);
    EXPECT_EQ(*all.rbegin(), total);
    EXPECT_EQ(out_of_order.load(), 0);
    EXPECT_EQ(aborted.load(), 0);
    EXPECT_EQ(watermark_regressions.load(), 0);
    EXPECT_GT(queries.load(), 0);

    EXPECT_EQ(memory->watermark(), total);
    EXPECT_EQ(memory->list_episodes().size(), static_cast<size_t>(total));
    auto beliefs = memory->list_beliefs();
    EXPECT_EQ(beliefs.size(), 4u);
    EXPECT_TRUE(conflicts_symmetric(beliefs));
}
