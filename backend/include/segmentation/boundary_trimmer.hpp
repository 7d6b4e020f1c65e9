#pragma once

#include "segmentation/types.hpp"
#include "segmentation/word_alignment_matcher.hpp"
#include <optional>

namespace overlapseg {
namespace segmentation {

/**
 * An utterance cut at a word boundary
 */
struct TrimmedUtterance {
    UtteranceSpan utterance;
    bool truncated = false;
};

/**
 * Cuts single utterances at word-exact boundaries so they fit a window of
 * at most max_len seconds.
 */
class BoundaryTrimmer {
public:
    explicit BoundaryTrimmer(double max_len, double epsilon = kBoundaryEpsilon);

    /**
     * Longest word-exact prefix of the utterance that fits inside
     * [window_start, window_start + max_len - epsilon]
     * @param utterance Utterance that overflows the window
     * @param window_start Start of the owning group
     * @return The trimmed utterance, or nullopt when no aligned word fits
     */
    std::optional<TrimmedUtterance> trim(const UtteranceSpan& utterance, double window_start) const;

    /**
     * Part of an utterance that follows a trim point: every aligned word
     * starting at or after trim_point. The span starts at trim_point and
     * ends with the utterance.
     * @return nullopt when no aligned word remains
     */
    std::optional<UtteranceSpan> remainder(const UtteranceSpan& utterance, double trim_point) const;

    double windowEnd(double window_start) const { return window_start + max_len_ - epsilon_; }
    double maxLength() const { return max_len_; }
    double epsilon() const { return epsilon_; }

private:
    double max_len_;
    double epsilon_;
    WordAlignmentMatcher matcher_;
};

} // namespace segmentation
} // namespace overlapseg
