#include "memory/providers.hpp"
#include "memory/errors.hpp"
#include "memory/text.hpp"
#include <cmath>
#include <regex>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace reverie::memory {

namespace {

struct PreferenceRule {
    std::regex pattern;
    Polarity polarity;
};

const std::string& topic_pattern() {
    static const std::string topic = R"(([a-z0-9][a-z0-9\s'-]*?)(?:\s+and\b|[.,;!?]|$))";
    return topic;
}

const std::vector<PreferenceRule>& preference_rules() {
    const std::string& topic = topic_pattern();
    static const std::vector<PreferenceRule> rules = {
        {std::regex(R"(\bi\s+(?:don't|do\s+not|never)\s+(?:like|enjoy|love)\s+)" + topic, std::regex::icase),
         Polarity::NEGATIVE},
        {std::regex(R"(\bi\s+(?:really\s+)?(?:dislike|hate|detest|can't\s+stand)\s+)" + topic, std::regex::icase),
         Polarity::NEGATIVE},
        {std::regex(R"(\bi\s+(?:really\s+)?(?:love|like|enjoy|prefer)\s+)" + topic, std::regex::icase),
         Polarity::POSITIVE},
    };
    return rules;
}

// Third-person wording, as in "User likes X"
const std::vector<PreferenceRule>& stated_preference_rules() {
    const std::string& topic = topic_pattern();
    static const std::vector<PreferenceRule> rules = {
        {std::regex(R"(^\s*(?:the\s+)?user\s+(?:dislikes|hates|detests|doesn't\s+like|does\s+not\s+like|never\s+likes)\s+)" + topic,
                    std::regex::icase),
         Polarity::NEGATIVE},
        {std::regex(R"(^\s*(?:the\s+)?user\s+(?:really\s+)?(?:likes|loves|enjoys|prefers)\s+)" + topic,
                    std::regex::icase),
         Polarity::POSITIVE},
    };
    return rules;
}

CandidateBelief preference_candidate(const std::string& raw_topic, Polarity polarity) {
    CandidateBelief c;
    c.subject = text::normalize_subject(raw_topic);
    c.polarity = polarity;
    c.scope = "user_preferences";
    c.statement = std::string("User ") +
                  (polarity == Polarity::NEGATIVE ? "dislikes " : "likes ") + c.subject;
    return c;
}

double candidate_confidence(const Episode& episode, double requested, const MemoryConfig& config) {
    if (episode.payload.verified) {
        return 1.0;
    }
    return std::min(requested, config.max_unverified_confidence);
}

} // namespace

void derive_subject(CandidateBelief& candidate) {
    if (candidate.subject.empty()) {
        candidate.subject = text::normalize_subject(text::strip_negation(candidate.statement));
    } else {
        candidate.subject = text::normalize_subject(candidate.subject);
    }
    if (candidate.polarity == Polarity::NEUTRAL) {
        candidate.polarity = text::has_negation(candidate.statement) ? Polarity::NEGATIVE
                                                                     : Polarity::POSITIVE;
    }
}

std::optional<CandidateBelief> preference_from_claim(const std::string& claim) {
    for (const auto* rules : {&stated_preference_rules(), &preference_rules()}) {
        for (const auto& rule : *rules) {
            std::smatch match;
            if (!std::regex_search(claim, match, rule.pattern)) {
                continue;
            }
            auto candidate = preference_candidate(match[1].str(), rule.polarity);
            if (!candidate.subject.empty()) {
                return candidate;
            }
        }
    }
    return std::nullopt;
}

std::optional<std::vector<CandidateBelief>> HeuristicExtractor::extract(const Episode& episode) {
    std::vector<CandidateBelief> candidates;
    const std::string& body = episode.payload.text;

    for (const auto& rule : preference_rules()) {
        std::smatch match;
        if (!std::regex_search(body, match, rule.pattern)) {
            continue;
        }
        auto candidate = preference_candidate(match[1].str(), rule.polarity);
        if (candidate.subject.empty()) {
            continue;
        }
        bool duplicate = false;
        for (const auto& existing : candidates) {
            if (existing.subject == candidate.subject) {
                duplicate = true;
                break;
            }
        }
        if (duplicate) {
            continue;
        }
        candidate.confidence = candidate_confidence(episode, config_.base_candidate_confidence, config_);
        candidate.verified = episode.payload.verified;
        candidate.evidence_episode_id = episode.id;
        candidates.push_back(std::move(candidate));
    }

    const auto& fields = episode.payload.fields;
    if (fields.contains("assertions") && fields["assertions"].is_array()) {
        for (const auto& item : fields["assertions"]) {
            if (!item.is_object() || !item.contains("statement") || !item["statement"].is_string()) {
                spdlog::warn("HeuristicExtractor: episode {} has a malformed assertion, skipped", episode.id);
                continue;
            }
            CandidateBelief c;
            c.statement = item["statement"].get<std::string>();
            c.subject = item.value("subject", "");
            c.polarity = polarity_from_string(item.value("polarity", "neutral"));
            c.scope = item.value("scope", "global");
            double requested = item.value("confidence", config_.base_candidate_confidence);
            if (!std::isfinite(requested) || requested < 0.0 || requested > 1.0) {
                spdlog::warn("HeuristicExtractor: episode {} assertion confidence {} out of range, skipped",
                             episode.id, requested);
                continue;
            }
            derive_subject(c);
            if (c.subject.empty()) {
                continue;
            }
            c.confidence = candidate_confidence(episode, requested, config_);
            c.verified = episode.payload.verified;
            c.evidence_episode_id = episode.id;
            candidates.push_back(std::move(c));
        }
    }

    return candidates;
}

std::string DelegatedExtractor::build_prompt(const Episode& episode) {
    std::string prompt =
        "Extract distinct user preferences, facts, or beliefs from the following text. "
        "Return ONLY a JSON array of objects with keys 'claim' (string), 'confidence' "
        "(float 0.0-1.0), and optionally 'subject' and 'polarity' ('positive' or 'negative'). "
        "Text: ";
    prompt += episode.payload.text;
    if (episode.payload.fields.contains("outcome") && episode.payload.fields["outcome"].is_string()) {
        prompt += " Outcome: " + episode.payload.fields["outcome"].get<std::string>();
    }
    return prompt;
}

std::optional<std::vector<CandidateBelief>> DelegatedExtractor::extract(const Episode& episode) {
    if (!completion_) {
        return std::nullopt;
    }

    std::string reply = completion_(build_prompt(episode));

    size_t open = reply.find('[');
    size_t close = reply.rfind(']');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        spdlog::debug("DelegatedExtractor: no JSON array in reply for episode {}", episode.id);
        return std::nullopt;
    }

    json parsed = json::parse(reply.substr(open, close - open + 1), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_array()) {
        spdlog::debug("DelegatedExtractor: unparsable reply for episode {}", episode.id);
        return std::nullopt;
    }

    std::vector<CandidateBelief> candidates;
    for (const auto& item : parsed) {
        if (!item.is_object()) continue;
        std::string statement = item.value("claim", item.value("statement", ""));
        if (statement.empty()) continue;

        double requested = item.value("confidence", config_.base_candidate_confidence);
        if (!std::isfinite(requested) || requested < 0.0 || requested > 1.0) {
            throw ValidationFailure("extraction confidence " + std::to_string(requested) +
                                    " outside [0,1] for episode " + std::to_string(episode.id));
        }

        CandidateBelief c;
        c.statement = statement;
        c.subject = item.value("subject", "");
        c.polarity = polarity_from_string(item.value("polarity", "neutral"));
        c.scope = item.value("scope", "global");
        derive_subject(c);
        if (c.subject.empty()) continue;
        c.confidence = candidate_confidence(episode, requested, config_);
        c.verified = episode.payload.verified;
        c.evidence_episode_id = episode.id;
        candidates.push_back(std::move(c));
    }

    if (candidates.empty()) {
        return std::nullopt;
    }
    return candidates;
}

std::optional<SkillOutcome> extract_skill_outcome(const Episode& episode) {
    const auto& fields = episode.payload.fields;
    if (!fields.contains("skill") || !fields["skill"].is_string()) {
        return std::nullopt;
    }

    SkillOutcome outcome;
    outcome.skill = fields["skill"].get<std::string>();
    if (outcome.skill.empty()) {
        return std::nullopt;
    }

    if (fields.contains("success") && fields["success"].is_boolean()) {
        outcome.success = fields["success"].get<bool>();
    } else if (fields.contains("outcome") && fields["outcome"].is_string()) {
        auto value = fields["outcome"].get<std::string>();
        if (value != "success" && value != "failure") {
            return std::nullopt;
        }
        outcome.success = (value == "success");
    } else {
        return std::nullopt;
    }

    outcome.failure_mode = fields.value("failure_mode", "");
    outcome.preconditions = fields.value("preconditions", "");
    if (fields.contains("steps") && fields["steps"].is_array()) {
        for (const auto& step : fields["steps"]) {
            if (step.is_string()) outcome.steps.push_back(step.get<std::string>());
        }
    }
    outcome.episode_id = episode.id;
    outcome.at = episode.timestamp;
    return outcome;
}

} // namespace reverie::memory
