#pragma once
#include <set>
#include <string>
#include <vector>

namespace reverie::memory::text {

// Lowercased alphanumeric tokens; everything else separates.
std::vector<std::string> tokenize(const std::string& input);
std::set<std::string> token_set(const std::string& input);

// Lowercase, collapse whitespace, trim punctuation at both ends and drop a
// leading article. "The Lo-Fi  music." -> "lo-fi music"
std::string normalize_subject(const std::string& input);

// Fraction of query tokens present in text, in [0,1].
double lexical_overlap(const std::string& query, const std::string& text);

// Jaccard similarity of token sets, in [0,1]. Two empty inputs score 0.
double jaccard(const std::string& a, const std::string& b);

// True when the text contains a standalone negation (not, never, no, n't).
bool has_negation(const std::string& input);

// Text with negation words removed and whitespace collapsed.
std::string strip_negation(const std::string& input);

// Cosine similarity clamped to [0,1]; 0 on size mismatch or zero norm.
double cosine(const std::vector<float>& a, const std::vector<float>& b);

} // namespace reverie::memory::text
