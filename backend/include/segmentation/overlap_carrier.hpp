#pragma once

#include "segmentation/types.hpp"
#include "segmentation/word_alignment_matcher.hpp"
#include <optional>
#include <vector>

namespace overlapseg {
namespace segmentation {

/**
 * Word-exact piece of another speaker's utterance copied into a new group
 */
struct CarriedFragment {
    size_t position = 0;        // scan position of the source utterance
    UtteranceSpan utterance;
};

/**
 * Re-injects cross-speaker overlap context when a group is reopened after a
 * rollback. Every candidate utterance of a different speaker that is still
 * talking when the new seed starts contributes the words that fall inside
 * the new window.
 */
class OverlapCarrier {
public:
    explicit OverlapCarrier(double max_len, double epsilon = kBoundaryEpsilon);

    /**
     * True when other is active at the seed's start
     * (other.start <= seed.start < other.end)
     */
    static bool overlaps(const UtteranceSpan& other, const UtteranceSpan& seed);

    /**
     * Words of source inside [window_start, window_start + max_len - epsilon]
     * @return Fragment spanning the selected words, or nullopt if none fit
     */
    std::optional<UtteranceSpan> extract(const UtteranceSpan& source, double window_start) const;

    /**
     * Collect overlap fragments for a freshly seeded group
     * @param seed The group's seed utterance
     * @param seed_position Scan position of the seed
     * @param utterances All utterances of the segment, in scan order
     * @param candidates Scan positions of the previously closed group
     * @param first_group_position Position in the group the first fragment will take
     * @return Fragments in candidate order, with "_ovl" ids
     */
    std::vector<CarriedFragment> carry(const UtteranceSpan& seed,
                                       size_t seed_position,
                                       const std::vector<UtteranceSpan>& utterances,
                                       const std::vector<size_t>& candidates,
                                       size_t first_group_position) const;

private:
    double max_len_;
    double epsilon_;
    WordAlignmentMatcher matcher_;
};

} // namespace segmentation
} // namespace overlapseg
