#pragma once

#include "segmentation/types.hpp"

namespace overlapseg {
namespace segmentation {

/**
 * Input checks and alignment clean-up performed before a segment is split
 */
class SegmentValidator {
public:
    explicit SegmentValidator(double epsilon = kBoundaryEpsilon);

    /**
     * Reject segments the splitter cannot reason about
     * @throws utils::InvalidSegmentException on non-finite or negative times,
     *         negative durations, empty utterance ids or utterances outside
     *         the segment
     */
    void validate(const RecordingSegment& segment) const;

    /**
     * Copy of the segment with every alignment stably sorted by start and,
     * when requested, stripped of punctuation-only entries
     */
    RecordingSegment normalize(const RecordingSegment& segment, bool filter_punctuation = true) const;

    /**
     * Largest silence between consecutive utterances (ordered by start)
     */
    static double maxInternalPause(const RecordingSegment& segment);

private:
    double epsilon_;
};

} // namespace segmentation
} // namespace overlapseg
