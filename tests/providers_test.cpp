#include <gtest/gtest.h>
#include "memory/errors.hpp"
#include "memory/providers.hpp"

using namespace reverie::memory;
using json = nlohmann::json;

namespace {

Episode make_episode(EntityId id, const std::string& body, bool verified = false,
                     json fields = json::object()) {
    Episode e;
    e.id = id;
    e.timestamp = 1000 * static_cast<Timestamp>(id);
    e.payload.text = body;
    e.payload.verified = verified;
    e.payload.fields = std::move(fields);
    return e;
}

} // namespace

TEST(HeuristicExtractorTest, PositivePreference) {
    HeuristicExtractor extractor(MemoryConfig{});
    auto out = extractor.extract(make_episode(7, "User said: I love lo-fi music"));

    ASSERT_TRUE(out.has_value());
    ASSERT_EQ(out->size(), 1u);
    const auto& c = out->front();
    EXPECT_EQ(c.statement, "User likes lo-fi music");
    EXPECT_EQ(c.subject, "lo-fi music");
    EXPECT_EQ(c.polarity, Polarity::POSITIVE);
    EXPECT_EQ(c.scope, "user_preferences");
    EXPECT_DOUBLE_EQ(c.confidence, 0.6);
    EXPECT_EQ(c.evidence_episode_id, 7u);
    EXPECT_FALSE(c.verified);
}

TEST(HeuristicExtractorTest, NegativePreferences) {
    HeuristicExtractor extractor(MemoryConfig{});

    auto hate = extractor.extract(make_episode(1, "User said: I hate lo-fi music"));
    ASSERT_EQ(hate->size(), 1u);
    EXPECT_EQ(hate->front().statement, "User dislikes lo-fi music");
    EXPECT_EQ(hate->front().polarity, Polarity::NEGATIVE);

    auto dont = extractor.extract(make_episode(2, "Honestly, I don't like jazz."));
    ASSERT_EQ(dont->size(), 1u);
    EXPECT_EQ(dont->front().subject, "jazz");
    EXPECT_EQ(dont->front().polarity, Polarity::NEGATIVE);
}

TEST(HeuristicExtractorTest, NoPreferenceYieldsNothing) {
    HeuristicExtractor extractor(MemoryConfig{});
    auto out = extractor.extract(make_episode(1, "Opened the settings window"));
    ASSERT_TRUE(out.has_value());
    EXPECT_TRUE(out->empty());
}

TEST(HeuristicExtractorTest, VerifiedEpisodeIsCertain) {
    HeuristicExtractor extractor(MemoryConfig{});
    auto out = extractor.extract(make_episode(3, "I prefer dark mode", true));
    ASSERT_EQ(out->size(), 1u);
    EXPECT_TRUE(out->front().verified);
    EXPECT_DOUBLE_EQ(out->front().confidence, 1.0);
}

TEST(HeuristicExtractorTest, StructuredAssertionsSkipMalformedEntries) {
    json fields = {
        {"assertions", json::array({
            {{"statement", "The build server is offline"}, {"confidence", 0.7}},
            {{"subject", "missing statement"}},
            {{"statement", "Disk usage is high"}, {"confidence", 3.0}}
        })}
    };
    HeuristicExtractor extractor(MemoryConfig{});
    auto out = extractor.extract(make_episode(4, "", false, fields));

    ASSERT_EQ(out->size(), 1u);
    EXPECT_EQ(out->front().statement, "The build server is offline");
    EXPECT_EQ(out->front().subject, "build server is offline");
    EXPECT_EQ(out->front().polarity, Polarity::POSITIVE);
    EXPECT_DOUBLE_EQ(out->front().confidence, 0.7);
}

TEST(DelegatedExtractorTest, ParsesArrayFromReply) {
    std::string seen_prompt;
    DelegatedExtractor extractor(
        [&](const std::string& prompt) {
            seen_prompt = prompt;
            return std::string("Sure! [{\"claim\": \"User enjoys hiking\", \"confidence\": 0.8}]");
        },
        MemoryConfig{});

    auto out = extractor.extract(make_episode(5, "We went up the ridge again"));
    ASSERT_TRUE(out.has_value());
    ASSERT_EQ(out->size(), 1u);
    EXPECT_EQ(out->front().statement, "User enjoys hiking");
    EXPECT_DOUBLE_EQ(out->front().confidence, 0.8);
    EXPECT_EQ(out->front().evidence_episode_id, 5u);
    EXPECT_NE(seen_prompt.find("We went up the ridge again"), std::string::npos);
}

TEST(DelegatedExtractorTest, UnusableReplyIsUnavailable) {
    DelegatedExtractor no_json([](const std::string&) { return std::string("I cannot help"); },
                               MemoryConfig{});
    EXPECT_FALSE(no_json.extract(make_episode(1, "x")).has_value());

    DelegatedExtractor empty([](const std::string&) { return std::string("[]"); }, MemoryConfig{});
    EXPECT_FALSE(empty.extract(make_episode(1, "x")).has_value());

    DelegatedExtractor missing(nullptr, MemoryConfig{});
    EXPECT_FALSE(missing.extract(make_episode(1, "x")).has_value());
}

TEST(DelegatedExtractorTest, OutOfRangeConfidenceIsRejected) {
    DelegatedExtractor extractor(
        [](const std::string&) { return std::string("[{\"claim\": \"x is y\", \"confidence\": 1.5}]"); },
        MemoryConfig{});
    EXPECT_THROW(extractor.extract(make_episode(1, "x")), ValidationFailure);
}

TEST(SkillOutcomeTest, ReadsOutcomeFields) {
    json fields = {
        {"skill", "open_notepad"},
        {"outcome", "failure"},
        {"failure_mode", "window not found"},
        {"steps", {"press win+r", "type notepad"}}
    };
    auto outcome = extract_skill_outcome(make_episode(9, "tried notepad", false, fields));
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->skill, "open_notepad");
    EXPECT_FALSE(outcome->success);
    EXPECT_EQ(outcome->failure_mode, "window not found");
    EXPECT_EQ(outcome->steps.size(), 2u);
    EXPECT_EQ(outcome->episode_id, 9u);

    EXPECT_FALSE(extract_skill_outcome(make_episode(10, "", false, {{"skill", "x"}})).has_value());
    EXPECT_FALSE(extract_skill_outcome(make_episode(11, "no fields")).has_value());
}
