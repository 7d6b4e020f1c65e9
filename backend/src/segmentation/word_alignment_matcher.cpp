#include "segmentation/word_alignment_matcher.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_map>

namespace overlapseg {
namespace segmentation {

namespace {

// The hyphen is not in the set
const std::string kPunctuation = "!\"#$%&()*+,./:;<=>?@[\\]^_`'{|}~";

// Spellings used in transcripts that the aligner emits differently
const std::unordered_map<std::string, std::string> kAlignmentWordMap = {
    {"mm-hmm", "mmm"},
};

constexpr size_t kNoEntry = static_cast<size_t>(-1);

} // anonymous namespace

std::string normalizeToken(const std::string& token) {
    std::string normalized;
    normalized.reserve(token.size());
    for (char c : token) {
        if (kPunctuation.find(c) != std::string::npos) {
            continue;
        }
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return normalized;
}

std::vector<std::string> splitTokens(const std::string& text) {
    std::vector<std::string> tokens;
    std::istringstream iss(text);
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::string joinTokens(const std::vector<std::string>& tokens) {
    std::string joined;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) {
            joined += ' ';
        }
        joined += tokens[i];
    }
    return joined;
}

bool isPunctuationOnly(const std::string& symbol) {
    for (const auto& piece : splitTokens(symbol)) {
        if (!normalizeToken(piece).empty()) {
            return false;
        }
    }
    return true;
}

bool WordAlignmentMatcher::tokensEquivalent(const std::string& token, const std::string& subword) {
    if (token == subword) {
        return true;
    }
    auto it = kAlignmentWordMap.find(token);
    return it != kAlignmentWordMap.end() && it->second == subword;
}

WordAlignmentMatcher::SubwordTable WordAlignmentMatcher::buildSubwords(const std::vector<Word>& alignment) {
    SubwordTable table;
    table.reserve(alignment.size());
    for (const auto& word : alignment) {
        std::vector<std::string> pieces;
        for (const auto& piece : splitTokens(word.symbol)) {
            std::string normalized = normalizeToken(piece);
            if (!normalized.empty()) {
                pieces.push_back(std::move(normalized));
            }
        }
        table.push_back(std::move(pieces));
    }
    return table;
}

void WordAlignmentMatcher::skipEmptyEntries(AlignmentCursor& cursor, const SubwordTable& subwords) {
    while (cursor.entry < subwords.size() && subwords[cursor.entry].empty()) {
        ++cursor.entry;
        cursor.subword = 0;
    }
}

void WordAlignmentMatcher::advance(AlignmentCursor& cursor, const SubwordTable& subwords) {
    ++cursor.subword;
    if (cursor.subword >= subwords[cursor.entry].size()) {
        ++cursor.entry;
        cursor.subword = 0;
        skipEmptyEntries(cursor, subwords);
    }
}

MatchResult WordAlignmentMatcher::select(const UtteranceSpan& utterance,
                                         double window_start, double window_end) const {
    MatchResult result;
    result.last_end = utterance.start;

    if (!utterance.hasAlignment()) {
        result.alignment_exhausted = true;
        return result;
    }

    const auto& alignment = *utterance.alignment;
    const SubwordTable subwords = buildSubwords(alignment);

    AlignmentCursor cursor;
    skipEmptyEntries(cursor, subwords);
    size_t last_appended = kNoEntry;

    for (const auto& token : splitTokens(utterance.text)) {
        if (cursor.entry >= alignment.size()) {
            // Trailing text the aligner did not time
            if (result.hasSelection()) {
                result.tokens.push_back(token);
            }
            continue;
        }

        const std::string normalized = normalizeToken(token);
        if (normalized.empty() || !tokensEquivalent(normalized, subwords[cursor.entry][cursor.subword])) {
            if (result.hasSelection()) {
                result.tokens.push_back(token);
            }
            continue;
        }

        const Word& entry = alignment[cursor.entry];
        if (entry.end() > window_end) {
            break;
        }

        if (entry.start >= window_start) {
            if (!result.first_start) {
                result.first_start = entry.start;
            }
            if (last_appended != cursor.entry) {
                result.words.push_back(entry);
                last_appended = cursor.entry;
            }
            result.tokens.push_back(token);
            result.last_end = entry.end();
        }
        advance(cursor, subwords);
    }

    result.consumed_entries = std::min(cursor.entry, alignment.size());
    result.alignment_exhausted = cursor.entry >= alignment.size();
    return result;
}

} // namespace segmentation
} // namespace overlapseg
