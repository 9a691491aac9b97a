/**
 * Reverie capability providers
 *
 * Narrow interfaces for the optional collaborators consulted during
 * consolidation and retrieval. A provider answers std::nullopt when it is
 * unavailable; callers then degrade deterministically (heuristic extraction,
 * no vector term).
 */
#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "memory/config.hpp"
#include "memory/types.hpp"

namespace reverie::memory {

// A belief statement proposed from one episode
struct CandidateBelief {
    std::string statement;
    std::string subject;
    Polarity polarity = Polarity::NEUTRAL;
    std::string scope = "global";
    double confidence = 0.6;
    EntityId evidence_episode_id = 0;
    bool verified = false;
};

// One use of a skill reported by an episode
struct SkillOutcome {
    std::string skill;
    bool success = false;
    std::string failure_mode;
    std::string preconditions;
    std::vector<std::string> steps;
    EntityId episode_id = 0;
    Timestamp at = 0;
};

class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    // Vector for text, or nullopt when no embedding can be produced.
    virtual std::optional<Embedding> embed(const std::string& text) = 0;
};

// Always unavailable. Used when no embedding model is configured.
class NullEmbeddingProvider : public EmbeddingProvider {
public:
    std::optional<Embedding> embed(const std::string&) override { return std::nullopt; }
};

class ExtractionProvider {
public:
    virtual ~ExtractionProvider() = default;

    // Candidate beliefs for an episode, or nullopt when the provider cannot
    // answer (the heuristic is used instead). Exceptions abort the run.
    virtual std::optional<std::vector<CandidateBelief>> extract(const Episode& episode) = 0;
};

// Deterministic pattern rules: preference phrases in the payload text and
// explicit "assertions" in the structured fields.
class HeuristicExtractor : public ExtractionProvider {
public:
    explicit HeuristicExtractor(const MemoryConfig& config) : config_(config) {}

    std::optional<std::vector<CandidateBelief>> extract(const Episode& episode) override;

private:
    MemoryConfig config_;
};

// Delegates phrasing to a text-completion collaborator (an LLM). The reply
// must contain a JSON array of {"claim"|"statement", "confidence",
// "subject"?, "polarity"?, "scope"?}. Replies without one are unavailable.
class DelegatedExtractor : public ExtractionProvider {
public:
    using CompletionFn = std::function<std::string(const std::string& prompt)>;

    DelegatedExtractor(CompletionFn completion, const MemoryConfig& config)
        : completion_(std::move(completion)), config_(config) {}

    std::optional<std::vector<CandidateBelief>> extract(const Episode& episode) override;

    static std::string build_prompt(const Episode& episode);

private:
    CompletionFn completion_;
    MemoryConfig config_;
};

// Skill outcomes declared in episode fields:
// {"skill": "...", "outcome": "success"|"failure", "failure_mode": "...",
//  "preconditions": "...", "steps": [...]}
std::optional<SkillOutcome> extract_skill_outcome(const Episode& episode);

// Subject and polarity of a free-form statement: negation words flip the
// polarity and are stripped from the subject.
void derive_subject(CandidateBelief& candidate);

// A claim worded as a preference ("User likes X", "I hate X"), phrased the
// way HeuristicExtractor phrases it. nullopt for any other claim.
std::optional<CandidateBelief> preference_from_claim(const std::string& claim);

} // namespace reverie::memory
