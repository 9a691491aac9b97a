#include <gtest/gtest.h>
#include "memory/forgetting_policy.hpp"
#include "test_helpers.hpp"

using namespace reverie::memory;
using reverie::testing::find_belief;
using reverie::testing::make_service;
using reverie::testing::ManualClock;
using reverie::testing::text_payload;

class ForgettingTest : public ::testing::Test {
protected:
    ManualClock clock_;
};

TEST_F(ForgettingTest, LowSalienceEpisodeIsPrunedAfterRetention) {
    auto memory = make_service(clock_);
    EntityId id = memory->append_episode(EpisodeKind::PERCEPTION,
                                         text_payload("fan noise in the background"), 0.05);
    const auto original = memory->get_episode(id).value();

    memory->consolidate();
    EXPECT_FALSE(memory->get_episode(id)->pruned);

    clock_.advance(31 * MS_PER_DAY);
    auto report = memory->consolidate();
    ASSERT_TRUE(report.committed());
    EXPECT_EQ(report.episodes_pruned, 1u);

    auto pruned = memory->get_episode(id);
    ASSERT_TRUE(pruned.has_value());
    EXPECT_TRUE(pruned->pruned);
    EXPECT_TRUE(pruned->payload.text.empty());
    EXPECT_EQ(pruned->content_hash, original.content_hash);
    EXPECT_EQ(pruned->timestamp, original.timestamp);
    EXPECT_TRUE(memory->list_episodes(false).empty());
}

TEST_F(ForgettingTest, CitedEpisodeSurvives) {
    auto memory = make_service(clock_);
    EntityId id = memory->append_episode(EpisodeKind::OBSERVATION, text_payload("I like chess"), 0.01);
    memory->consolidate();

    clock_.advance(60 * MS_PER_DAY);
    auto report = memory->consolidate();
    EXPECT_EQ(report.episodes_pruned, 0u);
    EXPECT_FALSE(memory->get_episode(id)->pruned);
    EXPECT_EQ(memory->get_episode(id)->payload.text, "I like chess");
}

TEST_F(ForgettingTest, SalienceHalvesEachHalfLife) {
    auto memory = make_service(clock_);
    EntityId id = memory->append_episode(EpisodeKind::OBSERVATION, text_payload("opened the terminal"));
    memory->consolidate();
    EXPECT_DOUBLE_EQ(memory->get_episode(id)->salience, 1.0);

    clock_.advance(7 * MS_PER_DAY);
    auto report = memory->consolidate();
    EXPECT_EQ(report.episodes_decayed, 1u);
    EXPECT_NEAR(memory->get_episode(id)->salience, 0.5, 1e-9);

    clock_.advance(7 * MS_PER_DAY);
    memory->consolidate();
    EXPECT_NEAR(memory->get_episode(id)->salience, 0.25, 1e-9);
    EXPECT_FALSE(memory->get_episode(id)->pruned);
}

TEST_F(ForgettingTest, EpisodesPastTheWatermarkAreUntouched) {
    MemoryConfig config;
    config.batch_size = 1;
    auto memory = make_service(clock_, config);
    memory->append_episode(EpisodeKind::OBSERVATION, text_payload("first"), 0.01);
    EntityId later = memory->append_episode(EpisodeKind::OBSERVATION, text_payload("second"), 0.01);

    clock_.advance(40 * MS_PER_DAY);
    auto report = memory->consolidate();
    EXPECT_EQ(report.watermark, 1u);
    EXPECT_EQ(report.episodes_pruned, 1u);
    EXPECT_FALSE(memory->get_episode(later)->pruned);
}

TEST_F(ForgettingTest, RetractedEvidenceKeepsItsHashAfterPruning) {
    MemoryConfig config;
    config.retract_threshold = 0.5;
    auto memory = make_service(clock_, config);

    for (int i = 0; i < 4; ++i) {
        memory->append_episode(EpisodeKind::OBSERVATION, text_payload("I love lo-fi music"));
    }
    memory->consolidate();
    EntityId hate = memory->append_episode(EpisodeKind::OBSERVATION, text_payload("I hate lo-fi music"));
    const std::string hash = memory->get_episode(hate)->content_hash;
    memory->consolidate();
    memory->append_episode(EpisodeKind::OBSERVATION, text_payload("Nothing notable happened"));
    memory->consolidate();

    auto dislikes = find_belief(memory->list_beliefs(), "User dislikes lo-fi music");
    ASSERT_TRUE(dislikes.has_value());
    ASSERT_EQ(dislikes->status, BeliefStatus::RETRACTED);

    clock_.advance(31 * MS_PER_DAY);
    memory->consolidate();
    EXPECT_TRUE(memory->get_episode(hate)->pruned);

    auto refs = memory->evidence_for(dislikes->id);
    ASSERT_TRUE(refs.has_value());
    ASSERT_EQ(refs->size(), 1u);
    EXPECT_EQ(refs->front().episode_id, hate);
    EXPECT_TRUE(refs->front().pruned);
    EXPECT_EQ(refs->front().content_hash, hash);

    // The surviving belief still cites live episodes
    auto likes = find_belief(memory->list_beliefs(), "User likes lo-fi music");
    ASSERT_TRUE(likes.has_value());
    for (EntityId ev : likes->evidence_ids) {
        EXPECT_FALSE(memory->get_episode(ev)->pruned);
    }
}

TEST(DecayedSalienceTest, FollowsHalfLife) {
    MemoryConfig config;
    ForgettingPolicy policy(config);

    Episode e;
    e.salience = 0.8;
    e.salience_updated_at = 1000;
    EXPECT_DOUBLE_EQ(policy.decayed_salience(e, 1000), 0.8);
    EXPECT_DOUBLE_EQ(policy.decayed_salience(e, 500), 0.8);
    EXPECT_NEAR(policy.decayed_salience(e, 1000 + 14 * MS_PER_DAY), 0.2, 1e-12);
}
