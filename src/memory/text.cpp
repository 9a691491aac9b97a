#include "memory/text.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>
#include <sstream>

namespace reverie::memory::text {

std::vector<std::string> tokenize(const std::string& input) {
    std::vector<std::string> tokens;
    std::string current;
    for (unsigned char c : input) {
        if (std::isalnum(c)) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else if (!current.empty()) {
            tokens.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(current);
    }
    return tokens;
}

std::set<std::string> token_set(const std::string& input) {
    auto tokens = tokenize(input);
    return std::set<std::string>(tokens.begin(), tokens.end());
}

std::string normalize_subject(const std::string& input) {
    std::string lowered;
    lowered.reserve(input.size());
    bool last_space = true;
    for (unsigned char c : input) {
        if (std::isspace(c)) {
            if (!last_space) lowered.push_back(' ');
            last_space = true;
        } else {
            lowered.push_back(static_cast<char>(std::tolower(c)));
            last_space = false;
        }
    }

    auto is_trim = [](unsigned char c) {
        return std::isspace(c) || (std::ispunct(c) && c != '-' && c != '+' && c != '#');
    };
    size_t start = 0;
    while (start < lowered.size() && is_trim(lowered[start])) ++start;
    size_t end = lowered.size();
    while (end > start && is_trim(lowered[end - 1])) --end;
    std::string result = lowered.substr(start, end - start);

    for (const char* article : {"the ", "a ", "an "}) {
        std::string prefix(article);
        if (result.size() > prefix.size() && result.compare(0, prefix.size(), prefix) == 0) {
            result = result.substr(prefix.size());
            break;
        }
    }
    return result;
}

double lexical_overlap(const std::string& query, const std::string& text) {
    auto q = token_set(query);
    auto t = token_set(text);
    if (q.empty() || t.empty()) {
        return 0.0;
    }
    size_t shared = 0;
    for (const auto& token : q) {
        if (t.count(token)) ++shared;
    }
    return static_cast<double>(shared) / static_cast<double>(q.size());
}

double jaccard(const std::string& a, const std::string& b) {
    auto sa = token_set(a);
    auto sb = token_set(b);
    if (sa.empty() && sb.empty()) {
        return 0.0;
    }
    size_t shared = 0;
    for (const auto& token : sa) {
        if (sb.count(token)) ++shared;
    }
    size_t total = sa.size() + sb.size() - shared;
    return total == 0 ? 0.0 : static_cast<double>(shared) / static_cast<double>(total);
}

bool has_negation(const std::string& input) {
    static const std::regex negation(R"(\b(not|never|no)\b|n't\b)", std::regex::icase);
    return std::regex_search(input, negation);
}

std::string strip_negation(const std::string& input) {
    static const std::regex negation(R"(\b(not|never|no)\b|n't\b)", std::regex::icase);
    std::string stripped = std::regex_replace(input, negation, " ");

    std::istringstream in(stripped);
    std::string word;
    std::string out;
    while (in >> word) {
        if (!out.empty()) out.push_back(' ');
        out += word;
    }
    return out;
}

double cosine(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.empty() || a.size() != b.size()) {
        return 0.0;
    }
    double dot = 0.0, norm_a = 0.0, norm_b = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        norm_a += static_cast<double>(a[i]) * a[i];
        norm_b += static_cast<double>(b[i]) * b[i];
    }
    if (norm_a <= 0.0 || norm_b <= 0.0) {
        return 0.0;
    }
    double sim = dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
    return std::clamp(sim, 0.0, 1.0);
}

} // namespace reverie::memory::text
