#include <gtest/gtest.h>
#include "memory/replay_miner.hpp"
#include "test_helpers.hpp"

using namespace reverie::memory;
using reverie::testing::find_belief;
using reverie::testing::make_service;
using reverie::testing::ManualClock;
using reverie::testing::text_payload;

namespace {

// Answers with a fixed candidate list, or nullopt when empty
class FixedExtractor : public ExtractionProvider {
public:
    explicit FixedExtractor(std::vector<CandidateBelief> reply) : reply_(std::move(reply)) {}

    std::optional<std::vector<CandidateBelief>> extract(const Episode&) override {
        calls++;
        if (reply_.empty()) return std::nullopt;
        return reply_;
    }

    int calls = 0;

private:
    std::vector<CandidateBelief> reply_;
};

EpisodePayload skill_payload(const std::string& skill, bool success, const std::string& failure_mode = "") {
    EpisodePayload payload;
    payload.text = "ran " + skill;
    payload.fields = {{"skill", skill}, {"outcome", success ? "success" : "failure"}};
    if (!failure_mode.empty()) {
        payload.fields["failure_mode"] = failure_mode;
    }
    return payload;
}

} // namespace

class ReplayMinerTest : public ::testing::Test {
protected:
    ManualClock clock_;
};

TEST_F(ReplayMinerTest, PreferenceBecomesProposedBelief) {
    auto memory = make_service(clock_);
    EntityId episode = memory->append_episode(EpisodeKind::OBSERVATION,
                                              text_payload("User said: I love lo-fi music"));

    auto report = memory->consolidate();
    ASSERT_TRUE(report.committed());
    EXPECT_EQ(report.episodes_processed, 1u);
    EXPECT_EQ(report.beliefs_created, 1u);
    EXPECT_EQ(memory->watermark(), episode);

    auto beliefs = memory->list_beliefs();
    ASSERT_EQ(beliefs.size(), 1u);
    const Belief& b = beliefs[0];
    EXPECT_EQ(b.statement, "User likes lo-fi music");
    EXPECT_EQ(b.subject, "lo-fi music");
    EXPECT_EQ(b.polarity, Polarity::POSITIVE);
    EXPECT_DOUBLE_EQ(b.confidence, 0.6);
    EXPECT_EQ(b.status, BeliefStatus::PROPOSED);
    EXPECT_EQ(b.evidence_ids, std::set<EntityId>{episode});
    EXPECT_FALSE(b.verified);
}

TEST_F(ReplayMinerTest, CorroborationRaisesConfidenceUntilConfirmed) {
    auto memory = make_service(clock_);
    for (int i = 0; i < 4; ++i) {
        memory->append_episode(EpisodeKind::OBSERVATION, text_payload("I love lo-fi music"));
    }

    auto report = memory->consolidate();
    ASSERT_TRUE(report.committed());
    EXPECT_EQ(report.beliefs_created, 1u);
    EXPECT_EQ(report.beliefs_confirmed, 1u);

    auto beliefs = memory->list_beliefs();
    ASSERT_EQ(beliefs.size(), 1u);
    EXPECT_NEAR(beliefs[0].confidence, 0.8628, 1e-9);
    EXPECT_EQ(beliefs[0].status, BeliefStatus::CONFIRMED);
    EXPECT_EQ(beliefs[0].evidence_ids.size(), 4u);
    EXPECT_EQ(beliefs[0].last_confirmed_at, clock_.now());
}

TEST_F(ReplayMinerTest, CorroborationAcrossRuns) {
    auto memory = make_service(clock_);
    memory->append_episode(EpisodeKind::OBSERVATION, text_payload("I enjoy hiking."));
    memory->consolidate();

    clock_.advance(MS_PER_HOUR);
    memory->append_episode(EpisodeKind::OBSERVATION, text_payload("i really like hiking"));
    auto report = memory->consolidate();
    EXPECT_EQ(report.beliefs_created, 0u);
    EXPECT_EQ(report.beliefs_updated, 1u);

    auto b = find_belief(memory->list_beliefs(), "User likes hiking");
    ASSERT_TRUE(b.has_value());
    EXPECT_NEAR(b->confidence, 0.72, 1e-9);
    EXPECT_EQ(b->updated_at, clock_.now());
}

TEST_F(ReplayMinerTest, UnverifiedEvidenceNeverReachesCertainty) {
    auto memory = make_service(clock_);
    for (int i = 0; i < 40; ++i) {
        memory->append_episode(EpisodeKind::OBSERVATION, text_payload("I like green tea"));
    }
    memory->consolidate();

    auto beliefs = memory->list_beliefs();
    ASSERT_EQ(beliefs.size(), 1u);
    EXPECT_LT(beliefs[0].confidence, 1.0);
    EXPECT_LE(beliefs[0].confidence, memory->config().max_unverified_confidence);
}

TEST_F(ReplayMinerTest, VerifiedEpisodeGivesCertainBelief) {
    auto memory = make_service(clock_);
    memory->append_episode(EpisodeKind::OBSERVATION, text_payload("I prefer dark mode", true));
    memory->consolidate();

    auto b = find_belief(memory->list_beliefs(), "User likes dark mode");
    ASSERT_TRUE(b.has_value());
    EXPECT_TRUE(b->verified);
    EXPECT_DOUBLE_EQ(b->confidence, 1.0);
    EXPECT_EQ(b->status, BeliefStatus::CONFIRMED);
}

TEST_F(ReplayMinerTest, WindowIsCappedByBatchSize) {
    MemoryConfig config;
    config.batch_size = 2;
    auto memory = make_service(clock_, config);
    for (int i = 0; i < 5; ++i) {
        memory->append_episode(EpisodeKind::OBSERVATION, text_payload("tick"));
    }

    EXPECT_EQ(memory->consolidate().watermark, 2u);
    EXPECT_EQ(memory->consolidate().watermark, 4u);
    auto last = memory->consolidate();
    EXPECT_EQ(last.watermark, 5u);
    EXPECT_EQ(last.episodes_processed, 1u);
}

TEST_F(ReplayMinerTest, WindowOrderedByTimestampThenId) {
    MemoryState state;
    for (EntityId id = 1; id <= 4; ++id) {
        Episode e;
        e.id = id;
        e.timestamp = 100;
        state.episodes[id] = e;
    }
    state.episodes[2].timestamp = 50;
    state.watermark = 1;

    auto window = ReplayMiner::select_window(state, 4, 10);
    EXPECT_EQ(window, (std::vector<EntityId>{2, 3, 4}));

    window = ReplayMiner::select_window(state, 3, 10);
    EXPECT_EQ(window, (std::vector<EntityId>{2, 3}));
}

TEST_F(ReplayMinerTest, SkillOutcomesFeedSelfModel) {
    auto memory = make_service(clock_);
    memory->append_episode(EpisodeKind::ACTION, skill_payload("open_notepad", true));
    memory->append_episode(EpisodeKind::ACTION, skill_payload("open_notepad", false, "window not found"));

    auto report = memory->consolidate();
    EXPECT_EQ(report.skills_updated, 1u);

    auto skills = memory->list_skills();
    ASSERT_EQ(skills.size(), 1u);
    const Skill& s = skills[0];
    EXPECT_EQ(s.name, "open_notepad");
    EXPECT_EQ(s.attempts, 2u);
    EXPECT_EQ(s.successes, 1u);
    EXPECT_DOUBLE_EQ(s.success_rate, 0.5);
    EXPECT_EQ(s.success_history, (std::vector<double>{1.0, 0.5}));
    EXPECT_EQ(s.failure_modes.count("window not found"), 1u);
    EXPECT_EQ(s.evidence_ids.size(), 2u);

    auto self_model = memory->list_self_model();
    ASSERT_EQ(self_model.size(), 1u);
    EXPECT_EQ(self_model[0].capability, "open_notepad");
    EXPECT_DOUBLE_EQ(self_model[0].reliability_score, 0.75);
    EXPECT_EQ(self_model[0].limitations.count("window not found"), 1u);

    // A later run updates the same entry instead of adding one
    memory->append_episode(EpisodeKind::ACTION, skill_payload("open_notepad", true));
    memory->consolidate();
    self_model = memory->list_self_model();
    ASSERT_EQ(self_model.size(), 1u);
    EXPECT_EQ(memory->list_skills()[0].attempts, 3u);
}

TEST_F(ReplayMinerTest, VerifiedHypothesisIsPromotedOnce) {
    auto memory = make_service(clock_);
    Hypothesis h = memory->register_hypothesis("The staging server restarts nightly",
                                               "Check uptime at 8am for a week");
    memory->resolve_hypothesis(h.id, HypothesisStatus::VERIFIED);

    auto report = memory->consolidate();
    ASSERT_TRUE(report.committed());
    EXPECT_EQ(report.hypotheses_promoted, 1u);
    EXPECT_EQ(report.promoted_hypothesis_ids, std::vector<EntityId>{h.id});

    auto promoted = memory->get_hypothesis(h.id);
    ASSERT_TRUE(promoted->promoted_belief_id.has_value());
    auto belief = memory->get_belief(*promoted->promoted_belief_id);
    ASSERT_TRUE(belief.has_value());
    EXPECT_EQ(belief->statement, "The staging server restarts nightly");
    EXPECT_TRUE(belief->verified);
    EXPECT_DOUBLE_EQ(belief->confidence, 1.0);

    EXPECT_EQ(memory->consolidate().hypotheses_promoted, 0u);
    EXPECT_EQ(memory->list_beliefs().size(), 1u);
}

TEST_F(ReplayMinerTest, PromotedPreferenceMergesWithExtractedBelief) {
    auto memory = make_service(clock_);
    memory->append_episode(EpisodeKind::OBSERVATION, text_payload("I love lo-fi music"));
    ASSERT_TRUE(memory->consolidate().committed());
    auto extracted = find_belief(memory->list_beliefs(), "User likes lo-fi music");
    ASSERT_TRUE(extracted.has_value());

    Hypothesis h = memory->register_hypothesis("User likes lo-fi music", "Ask after the next session");
    memory->resolve_hypothesis(h.id, HypothesisStatus::VERIFIED);
    auto report = memory->consolidate();
    ASSERT_TRUE(report.committed());
    EXPECT_EQ(report.hypotheses_promoted, 1u);
    EXPECT_EQ(report.beliefs_created, 0u);

    auto beliefs = memory->list_beliefs();
    ASSERT_EQ(beliefs.size(), 1u);
    EXPECT_EQ(beliefs[0].id, extracted->id);
    EXPECT_EQ(beliefs[0].scope, "user_preferences");
    EXPECT_TRUE(beliefs[0].verified);
    EXPECT_DOUBLE_EQ(beliefs[0].confidence, 1.0);
    auto promoted = memory->get_hypothesis(h.id)->promoted_belief_id;
    ASSERT_TRUE(promoted.has_value());
    EXPECT_EQ(*promoted, extracted->id);

    memory->append_episode(EpisodeKind::OBSERVATION, text_payload("I hate lo-fi music"));
    ASSERT_TRUE(memory->consolidate().committed());
    auto dislike = find_belief(memory->list_beliefs(), "User dislikes lo-fi music");
    ASSERT_TRUE(dislike.has_value());
    EXPECT_EQ(dislike->conflicts_with_ids, std::set<EntityId>{extracted->id});
}

TEST(PreferenceClaimTest, RecognizesBothWordings) {
    auto stated = preference_from_claim("The user doesn't like jazz.");
    ASSERT_TRUE(stated.has_value());
    EXPECT_EQ(stated->statement, "User dislikes jazz");
    EXPECT_EQ(stated->scope, "user_preferences");
    EXPECT_EQ(stated->polarity, Polarity::NEGATIVE);

    auto spoken = preference_from_claim("I really enjoy hiking");
    ASSERT_TRUE(spoken.has_value());
    EXPECT_EQ(spoken->statement, "User likes hiking");

    EXPECT_FALSE(preference_from_claim("The staging server restarts nightly").has_value());
}

TEST_F(ReplayMinerTest, RejectedHypothesisIsNotPromoted) {
    auto memory = make_service(clock_);
    Hypothesis h = memory->register_hypothesis("The build cache is corrupt", "Clear it and rebuild");
    memory->resolve_hypothesis(h.id, HypothesisStatus::REJECTED);

    EXPECT_EQ(memory->consolidate().hypotheses_promoted, 0u);
    EXPECT_TRUE(memory->list_beliefs().empty());
}

TEST_F(ReplayMinerTest, UnavailableProviderFallsBackToHeuristic) {
    auto extractor = std::make_shared<FixedExtractor>(std::vector<CandidateBelief>{});
    auto memory = make_service(clock_, MemoryConfig{}, extractor);
    memory->append_episode(EpisodeKind::OBSERVATION, text_payload("I hate cold coffee"));

    ASSERT_TRUE(memory->consolidate().committed());
    EXPECT_EQ(extractor->calls, 1);
    auto b = find_belief(memory->list_beliefs(), "User dislikes cold coffee");
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->polarity, Polarity::NEGATIVE);
}

TEST_F(ReplayMinerTest, ProviderCandidatesReplaceHeuristic) {
    CandidateBelief c;
    c.statement = "User works night shifts";
    c.confidence = 0.7;
    auto extractor = std::make_shared<FixedExtractor>(std::vector<CandidateBelief>{c});
    auto memory = make_service(clock_, MemoryConfig{}, extractor);
    memory->append_episode(EpisodeKind::OBSERVATION, text_payload("I love lo-fi music"));

    ASSERT_TRUE(memory->consolidate().committed());
    auto beliefs = memory->list_beliefs();
    ASSERT_EQ(beliefs.size(), 1u);
    EXPECT_EQ(beliefs[0].statement, "User works night shifts");
    EXPECT_DOUBLE_EQ(beliefs[0].confidence, 0.7);
}

TEST_F(ReplayMinerTest, OutOfRangeCandidateAbortsRun) {
    CandidateBelief c;
    c.statement = "User owns a boat";
    c.confidence = 1.7;
    auto memory = make_service(clock_, MemoryConfig{},
                               std::make_shared<FixedExtractor>(std::vector<CandidateBelief>{c}));
    memory->append_episode(EpisodeKind::OBSERVATION, text_payload("bought a boat"));

    auto report = memory->consolidate();
    EXPECT_EQ(report.status, ConsolidationStatus::ABORTED);
    EXPECT_EQ(memory->watermark(), 0u);
    EXPECT_TRUE(memory->list_beliefs().empty());
}
