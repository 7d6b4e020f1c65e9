#include "segmentation/segment_splitter.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <limits>
#include <sstream>

namespace overlapseg {
namespace segmentation {

namespace {

GroupEntry scannedEntry(const std::vector<UtteranceSpan>& utterances, size_t position, size_t group_position) {
    GroupEntry entry;
    entry.utterance = utterances[position];
    entry.utterance->id = derivedUtteranceId(utterances[position].id, position, group_position);
    entry.position = position;
    entry.kind = EntryKind::SCANNED;
    return entry;
}

} // anonymous namespace

SegmentSplitter::SegmentSplitter(const SplitterOptions& options)
    : options_(options),
      trimmer_(options.max_len, options.epsilon),
      carrier_(options.max_len, options.epsilon),
      validator_(options.epsilon) {
    if (!(options_.max_len > 0.0)) {
        throw utils::ConfigurationException("max_len must be positive", "SegmentSplitter");
    }
    if (options_.epsilon < 0.0 || options_.epsilon >= options_.max_len) {
        throw utils::ConfigurationException("epsilon must be in [0, max_len)", "SegmentSplitter");
    }
}

std::vector<RecordingSegment> SegmentSplitter::split(const RecordingSegment& segment) const {
    validator_.validate(segment);

    if (segment.utterances.empty()) {
        utils::Logger::debug("Segment " + segment.id + " has no utterances, nothing to split");
        return {};
    }
    if (segment.duration <= options_.max_len) {
        return {segment};
    }

    std::vector<UtteranceSpan> utterances =
        validator_.normalize(segment, options_.filter_punctuation).utterances;
    std::stable_sort(utterances.begin(), utterances.end(),
                     [](const UtteranceSpan& a, const UtteranceSpan& b) { return a.start < b.start; });

    std::vector<ClosedGroup> groups = scan(utterances);

    std::vector<RecordingSegment> output;
    output.reserve(groups.size());
    for (const auto& group : groups) {
        output.push_back(buildSegment(segment, group, output.size()));
    }

    utils::Logger::debug("Segment " + segment.id + " split into " + std::to_string(output.size()) +
                         " sub-segments");
    return output;
}

std::vector<ClosedGroup> SegmentSplitter::scan(const std::vector<UtteranceSpan>& utterances) const {
    std::vector<ClosedGroup> emitted;
    std::optional<ClosedGroup> last_closed;
    std::vector<GroupEntry> group;
    std::vector<GroupEntry> pending;

    ScanState state = ScanState::SCANNING;
    size_t index = 0;
    size_t resume_index = 0;
    const size_t count = utterances.size();

    while (true) {
        if (group.empty()) {
            if (!pending.empty()) {
                openWithContinuations(group, std::move(pending), utterances);
                pending.clear();
            } else if (index < count) {
                seedGroup(group, scannedEntry(utterances, index, 0), state, utterances,
                          last_closed ? &*last_closed : nullptr, resume_index);
                ++index;
            } else {
                break;
            }
            state = ScanState::SCANNING;
            continue;
        }

        const double group_start = group.front().utterance->start;
        if (index < count && utterances[index].start - group_start < options_.max_len) {
            group.push_back(scannedEntry(utterances, index, group.size()));
            ++index;
            continue;
        }

        CloseOutcome outcome = closeGroup(group, index);
        if (!outcome.group.utterances.empty()) {
            emitted.push_back(outcome.group);
        }
        last_closed = std::move(outcome.group);
        pending = std::move(outcome.pending);
        index = outcome.resume_index;
        resume_index = outcome.resume_index;
        state = outcome.next_state;
        group.clear();
    }

    return emitted;
}

void SegmentSplitter::seedGroup(std::vector<GroupEntry>& group,
                                GroupEntry seed,
                                ScanState state,
                                const std::vector<UtteranceSpan>& utterances,
                                const ClosedGroup* previous,
                                size_t resume_index) const {
    group.push_back(std::move(seed));

    if (state != ScanState::FALLING_BACK || !options_.carry_overlaps || previous == nullptr) {
        return;
    }

    // Utterances at or past the resume index are scanned again
    std::vector<size_t> candidates;
    for (size_t position : previous->positions) {
        if (position < resume_index) {
            candidates.push_back(position);
        }
    }

    const GroupEntry& head = group.front();
    auto fragments = carrier_.carry(*head.utterance, head.position, utterances, candidates, group.size());
    for (auto& fragment : fragments) {
        GroupEntry entry;
        entry.position = fragment.position;
        entry.kind = EntryKind::CARRIED;
        entry.utterance = std::move(fragment.utterance);
        group.push_back(std::move(entry));
    }
}

void SegmentSplitter::openWithContinuations(std::vector<GroupEntry>& group,
                                            std::vector<GroupEntry> pending,
                                            const std::vector<UtteranceSpan>& utterances) const {
    for (auto& entry : pending) {
        const UtteranceSpan& source = utterances[entry.position];
        std::string id = derivedUtteranceId(source.id, entry.position, group.size());
        if (entry.continuation > 0) {
            id += "_cont" + std::to_string(entry.continuation);
        }
        entry.utterance->id = std::move(id);
        group.push_back(std::move(entry));
    }
}

std::optional<GroupEntry> SegmentSplitter::continueOverflow(const GroupEntry& source,
                                                            std::optional<double> trim_point,
                                                            bool is_seed) const {
    const UtteranceSpan& utterance = *source.utterance;

    GroupEntry next;
    next.position = source.position;
    next.kind = EntryKind::CONTINUED;

    if (!trim_point) {
        if (!is_seed) {
            // Nothing fits yet, the whole utterance moves on
            next.utterance = utterance;
            next.continuation = source.continuation;
            return next;
        }
        if (!utterance.hasAlignment()) {
            OVERLAPSEG_HANDLE_ERROR(utils::ErrorCategory::SEGMENTATION, utils::ErrorSeverity::WARNING,
                                    "Utterance " + utterance.id + " has no word that fits in " +
                                        std::to_string(options_.max_len) + "s, dropping it",
                                    "no alignment");
            return std::nullopt;
        }
        // Skip the leading gap, or the leading word when it alone exceeds the window
        const Word& first = utterance.alignment->front();
        if (first.start > utterance.start) {
            trim_point = first.start;
        } else {
            OVERLAPSEG_HANDLE_ERROR(utils::ErrorCategory::SEGMENTATION, utils::ErrorSeverity::WARNING,
                                    "Word '" + first.symbol + "' of " + utterance.id + " is longer than " +
                                        std::to_string(options_.max_len) + "s, dropping it",
                                    "start " + std::to_string(first.start));
            trim_point = first.end();
        }
    }

    if (*trim_point <= utterance.start) {
        OVERLAPSEG_HANDLE_ERROR(utils::ErrorCategory::SEGMENTATION, utils::ErrorSeverity::WARNING,
                                "Utterance " + utterance.id + " cannot be advanced past " +
                                    std::to_string(utterance.start) + ", dropping its remainder",
                                "");
        return std::nullopt;
    }

    auto rest = trimmer_.remainder(utterance, *trim_point);
    if (!rest) {
        utils::Logger::debug("Nothing aligned left of " + utterance.id + " after " +
                             std::to_string(*trim_point));
        return std::nullopt;
    }

    next.utterance = std::move(*rest);
    next.continuation = source.continuation + 1;
    return next;
}

SegmentSplitter::CloseOutcome SegmentSplitter::closeGroup(std::vector<GroupEntry>& group,
                                                          size_t trigger_index) const {
    CloseOutcome outcome;
    outcome.resume_index = trigger_index;
    outcome.next_state = ScanState::SCANNING;

    const double group_start = group.front().utterance->start;
    const double limit = group_start + options_.max_len;

    struct Overflow {
        GroupEntry source;                  // entry as it was before trimming
        std::optional<double> trim_point;   // end of the kept piece
        bool is_seed;
    };
    std::vector<Overflow> overflows;
    bool rescan = true;

    for (size_t i = 0; i < group.size(); ++i) {
        GroupEntry& entry = group[i];
        outcome.group.positions.push_back(entry.position);
        if (entry.dropped()) {
            continue;
        }

        outcome.group.continuation.emplace(entry.utterance->speaker_id, false);
        if (entry.utterance->end() <= limit) {
            continue;
        }

        Overflow overflow{entry, std::nullopt, i == 0};
        auto trimmed = trimmer_.trim(*entry.utterance, group_start);
        if (!trimmed) {
            utils::Logger::debug("No word of " + entry.utterance->id + " fits before " +
                                 std::to_string(limit) + ", deferring it");
            entry.utterance.reset();
        } else {
            entry.utterance = std::move(trimmed->utterance);
            outcome.group.continuation[entry.utterance->speaker_id] = true;
            overflow.trim_point = entry.utterance->end();
        }

        // Carried fragments are bounded by the window already
        if (entry.kind == EntryKind::CARRIED) {
            continue;
        }
        // Only later input utterances can be scanned again from the start
        if (entry.kind != EntryKind::SCANNED || i == 0) {
            rescan = false;
        }
        overflows.push_back(std::move(overflow));
    }

    for (const auto& entry : group) {
        if (!entry.dropped()) {
            outcome.group.utterances.push_back(*entry.utterance);
        }
    }
    auto& positions = outcome.group.positions;
    std::sort(positions.begin(), positions.end());
    positions.erase(std::unique(positions.begin(), positions.end()), positions.end());

    if (overflows.empty()) {
        return outcome;
    }

    if (rescan) {
        size_t target = trigger_index;
        for (const auto& overflow : overflows) {
            target = std::min(target, overflow.source.position);
        }
        outcome.resume_index = target;
        outcome.next_state = ScanState::FALLING_BACK;
        return outcome;
    }

    // Every overflowing utterance continues from its own trim point
    for (const auto& overflow : overflows) {
        auto next = continueOverflow(overflow.source, overflow.trim_point, overflow.is_seed);
        if (next) {
            outcome.pending.push_back(std::move(*next));
        }
    }
    std::stable_sort(outcome.pending.begin(), outcome.pending.end(),
                     [](const GroupEntry& a, const GroupEntry& b) {
                         return a.utterance->start < b.utterance->start;
                     });
    return outcome;
}

RecordingSegment SegmentSplitter::buildSegment(const RecordingSegment& source,
                                               const ClosedGroup& group,
                                               size_t index) const {
    double min_start = std::numeric_limits<double>::infinity();
    double max_end = -std::numeric_limits<double>::infinity();
    for (const auto& utterance : group.utterances) {
        min_start = std::min(min_start, utterance.start);
        max_end = std::max(max_end, utterance.end());
    }

    RecordingSegment segment;
    segment.id = source.id + "-" + std::to_string(index);
    segment.start_in_recording = source.start_in_recording + min_start;
    segment.duration = max_end - min_start;
    segment.attributes = source.attributes;
    segment.metadata = source.metadata.is_object() ? source.metadata : nlohmann::json::object();

    nlohmann::json flags = nlohmann::json::object();
    for (const auto& kv : group.continuation) {
        flags[kv.first] = kv.second;
    }
    segment.metadata[kContinuationKey] = flags;

    if (segment.duration > options_.max_len + options_.epsilon) {
        std::ostringstream oss;
        oss << "Sub-segment " << segment.id << " lasts " << segment.duration << "s, more than "
            << options_.max_len << "s";
        throw utils::SegmentationException(oss.str(), source.id);
    }

    segment.utterances.reserve(group.utterances.size());
    for (const auto& utterance : group.utterances) {
        UtteranceSpan moved = utterance.shifted(min_start);
        if (moved.start < 0.0 || moved.end() > segment.duration + options_.epsilon) {
            throw utils::SegmentationException("Utterance " + moved.id + " falls outside sub-segment " +
                                               segment.id, source.id);
        }
        segment.utterances.push_back(std::move(moved));
    }

    return segment;
}

} // namespace segmentation
} // namespace overlapseg
