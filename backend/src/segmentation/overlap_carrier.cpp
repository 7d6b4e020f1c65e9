#include "segmentation/overlap_carrier.hpp"
#include "utils/logging.hpp"

namespace overlapseg {
namespace segmentation {

OverlapCarrier::OverlapCarrier(double max_len, double epsilon)
    : max_len_(max_len), epsilon_(epsilon) {
}

bool OverlapCarrier::overlaps(const UtteranceSpan& other, const UtteranceSpan& seed) {
    return other.start <= seed.start && seed.start < other.end();
}

std::optional<UtteranceSpan> OverlapCarrier::extract(const UtteranceSpan& source, double window_start) const {
    MatchResult match = matcher_.select(source, window_start, window_start + max_len_ - epsilon_);
    if (!match.hasSelection()) {
        return std::nullopt;
    }

    UtteranceSpan fragment = source;
    fragment.start = *match.first_start;
    fragment.duration = match.last_end - *match.first_start;
    fragment.text = joinTokens(match.tokens);
    fragment.alignment = std::move(match.words);
    return fragment;
}

std::vector<CarriedFragment> OverlapCarrier::carry(const UtteranceSpan& seed,
                                                   size_t seed_position,
                                                   const std::vector<UtteranceSpan>& utterances,
                                                   const std::vector<size_t>& candidates,
                                                   size_t first_group_position) const {
    std::vector<CarriedFragment> fragments;

    for (size_t position : candidates) {
        if (position == seed_position || position >= utterances.size()) {
            continue;
        }
        const UtteranceSpan& source = utterances[position];
        if (source.speaker_id == seed.speaker_id || !overlaps(source, seed)) {
            continue;
        }

        auto fragment = extract(source, seed.start);
        if (!fragment) {
            utils::Logger::debug("No words of " + source.id + " fit after " + std::to_string(seed.start));
            continue;
        }

        fragment->id = derivedUtteranceId(source.id, position,
                                          first_group_position + fragments.size()) + "_ovl";
        fragments.push_back(CarriedFragment{position, std::move(*fragment)});
    }

    return fragments;
}

} // namespace segmentation
} // namespace overlapseg
