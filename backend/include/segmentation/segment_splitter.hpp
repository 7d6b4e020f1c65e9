#pragma once

#include "segmentation/boundary_trimmer.hpp"
#include "segmentation/overlap_carrier.hpp"
#include "segmentation/segment_validator.hpp"
#include "segmentation/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace overlapseg {
namespace segmentation {

/**
 * Splitter settings
 */
struct SplitterOptions {
    double max_len = 30.0;
    double epsilon = kBoundaryEpsilon;
    bool carry_overlaps = true;
    bool filter_punctuation = true;
};

/**
 * Scan control: plain accumulation, or re-seeding after a rollback where
 * overlap context from the previous group is carried into the new one
 */
enum class ScanState {
    SCANNING,
    FALLING_BACK
};

/**
 * Where a group entry came from
 */
enum class EntryKind {
    SCANNED,     // utterance taken from the sorted input
    CONTINUED,   // moved over from the previous group: a rest after a trim point, or a deferred utterance
    CARRIED      // overlap fragment copied from the previous group
};

/**
 * One slot of the working group. A dropped entry keeps its slot with an
 * empty utterance.
 */
struct GroupEntry {
    std::optional<UtteranceSpan> utterance;
    size_t position = 0;
    EntryKind kind = EntryKind::SCANNED;
    size_t continuation = 0;   // how many earlier pieces of this utterance were emitted

    bool dropped() const { return !utterance.has_value(); }
};

/**
 * A finished group, before it is turned into an output segment
 */
struct ClosedGroup {
    std::vector<UtteranceSpan> utterances;
    std::map<std::string, bool> continuation;
    std::vector<size_t> positions;   // scan positions touched, dropped ones included
};

/**
 * Splits one long multi-speaker segment into sub-segments of at most
 * max_len seconds without cutting through words.
 *
 * Utterances are scanned in start order and accumulated while they start
 * within max_len of the group's first utterance. When a group closes, every
 * utterance running past the window is trimmed at a word boundary. If only
 * later scanned utterances ran over, the scan rolls back to the earliest of
 * them, which is reprocessed in full and receives the overlapping words of
 * the other speakers. Otherwise each overflowing utterance continues in the
 * next group from the end of its trimmed piece.
 */
class SegmentSplitter {
public:
    explicit SegmentSplitter(const SplitterOptions& options = SplitterOptions());

    /**
     * Split a segment
     * @param segment Input segment, left untouched
     * @return Sub-segments ordered by start; the input itself when it is
     *         already short enough; nothing for a segment without utterances
     * @throws utils::InvalidSegmentException for unusable input
     * @throws utils::SegmentationException if an output breaks its bounds
     */
    std::vector<RecordingSegment> split(const RecordingSegment& segment) const;

    const SplitterOptions& getOptions() const { return options_; }

private:
    struct CloseOutcome {
        ClosedGroup group;
        std::vector<GroupEntry> pending;   // opens the next group, ordered by start
        size_t resume_index = 0;
        ScanState next_state = ScanState::SCANNING;
    };

    std::vector<ClosedGroup> scan(const std::vector<UtteranceSpan>& utterances) const;

    void seedGroup(std::vector<GroupEntry>& group,
                   GroupEntry seed,
                   ScanState state,
                   const std::vector<UtteranceSpan>& utterances,
                   const ClosedGroup* previous,
                   size_t resume_index) const;

    void openWithContinuations(std::vector<GroupEntry>& group,
                               std::vector<GroupEntry> pending,
                               const std::vector<UtteranceSpan>& utterances) const;

    std::optional<GroupEntry> continueOverflow(const GroupEntry& source,
                                               std::optional<double> trim_point,
                                               bool is_seed) const;

    CloseOutcome closeGroup(std::vector<GroupEntry>& group, size_t trigger_index) const;

    RecordingSegment buildSegment(const RecordingSegment& source,
                                  const ClosedGroup& group,
                                  size_t index) const;

    SplitterOptions options_;
    BoundaryTrimmer trimmer_;
    OverlapCarrier carrier_;
    SegmentValidator validator_;
};

} // namespace segmentation
} // namespace overlapseg
