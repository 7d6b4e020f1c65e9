#include "segmentation/boundary_trimmer.hpp"
#include <algorithm>
#include <limits>

namespace overlapseg {
namespace segmentation {

BoundaryTrimmer::BoundaryTrimmer(double max_len, double epsilon)
    : max_len_(max_len), epsilon_(epsilon) {
}

std::optional<TrimmedUtterance> BoundaryTrimmer::trim(const UtteranceSpan& utterance, double window_start) const {
    MatchResult match = matcher_.select(utterance, window_start, windowEnd(window_start));
    if (!match.hasSelection()) {
        return std::nullopt;
    }

    TrimmedUtterance trimmed;
    trimmed.utterance = utterance;
    trimmed.utterance.duration = match.last_end - utterance.start;
    trimmed.utterance.text = joinTokens(match.tokens);
    trimmed.utterance.alignment = std::move(match.words);
    trimmed.truncated = true;
    return trimmed;
}

std::optional<UtteranceSpan> BoundaryTrimmer::remainder(const UtteranceSpan& utterance, double trim_point) const {
    MatchResult match = matcher_.select(utterance, trim_point, std::numeric_limits<double>::infinity());
    if (!match.hasSelection()) {
        return std::nullopt;
    }

    UtteranceSpan rest = utterance;
    rest.start = trim_point;
    rest.duration = std::max(utterance.end(), match.last_end) - trim_point;
    rest.text = joinTokens(match.tokens);
    rest.alignment = std::move(match.words);
    return rest;
}

} // namespace segmentation
} // namespace overlapseg
