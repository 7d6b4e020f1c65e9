#pragma once

#include "segmentation/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace overlapseg {
namespace segmentation {

/**
 * Lowercases a raw token and strips punctuation (hyphens are kept)
 */
std::string normalizeToken(const std::string& token);

/**
 * Splits text on whitespace, dropping empty pieces
 */
std::vector<std::string> splitTokens(const std::string& text);

/**
 * Joins tokens with single spaces
 */
std::string joinTokens(const std::vector<std::string>& tokens);

/**
 * True when the symbol has no characters left after normalization
 */
bool isPunctuationOnly(const std::string& symbol);

/**
 * Position inside an alignment: the entry being consumed and how many of
 * its normalized sub-words have already been matched.
 */
struct AlignmentCursor {
    size_t entry = 0;
    size_t subword = 0;
};

/**
 * Outcome of matching an utterance's text against its alignment inside a
 * time window.
 */
struct MatchResult {
    std::vector<std::string> tokens;      // selected raw tokens, filler included
    std::vector<Word> words;              // alignment entries backing the selection
    std::optional<double> first_start;    // start of the first selected aligned token
    double last_end = 0.0;                // end of the last selected aligned token
    size_t consumed_entries = 0;          // alignment entries fully consumed
    bool alignment_exhausted = false;     // no alignment left when matching stopped

    bool hasSelection() const { return first_start.has_value(); }

    /**
     * Alignment absent or used up before a single token could be selected
     */
    bool exhaustedBeforeMatch() const { return !hasSelection() && alignment_exhausted; }
};

/**
 * Aligns whitespace-separated text tokens with word-level timings.
 *
 * Tokens and alignment entries are consumed in lock-step. A token whose
 * normalized form does not equal the next alignment sub-word is treated as
 * untimed filler: it is skipped until the first aligned token is selected
 * and kept afterwards. Matching stops at the first aligned token whose
 * entry ends after the window.
 */
class WordAlignmentMatcher {
public:
    WordAlignmentMatcher() = default;

    /**
     * Select the tokens of an utterance that fall inside
     * [window_start, window_end]
     * @param utterance Utterance to match
     * @param window_start Tokens whose entry starts earlier are consumed but not selected
     * @param window_end Matching stops at the first entry ending later than this
     * @return Selected tokens and timings
     */
    MatchResult select(const UtteranceSpan& utterance, double window_start, double window_end) const;

    /**
     * True when a normalized text token may be matched against a normalized
     * alignment sub-word
     */
    static bool tokensEquivalent(const std::string& token, const std::string& subword);

private:
    using SubwordTable = std::vector<std::vector<std::string>>;

    static SubwordTable buildSubwords(const std::vector<Word>& alignment);
    static void skipEmptyEntries(AlignmentCursor& cursor, const SubwordTable& subwords);
    static void advance(AlignmentCursor& cursor, const SubwordTable& subwords);
};

} // namespace segmentation
} // namespace overlapseg
