#include "segmentation/segment_validator.hpp"
#include "segmentation/word_alignment_matcher.hpp"
#include "utils/error_handler.hpp"
#include <algorithm>
#include <cmath>

namespace overlapseg {
namespace segmentation {

namespace {

bool finite(double value) {
    return std::isfinite(value);
}

} // anonymous namespace

SegmentValidator::SegmentValidator(double epsilon) : epsilon_(epsilon) {
}

void SegmentValidator::validate(const RecordingSegment& segment) const {
    if (!finite(segment.start_in_recording) || segment.start_in_recording < 0.0) {
        throw utils::InvalidSegmentException("Segment start must be a non-negative number", segment.id);
    }
    if (!finite(segment.duration) || segment.duration < 0.0) {
        throw utils::InvalidSegmentException("Segment duration must be a non-negative number", segment.id);
    }

    for (const auto& utterance : segment.utterances) {
        if (utterance.id.empty()) {
            throw utils::InvalidSegmentException("Utterance without id", segment.id);
        }
        if (!finite(utterance.start) || !finite(utterance.duration)) {
            throw utils::InvalidSegmentException("Utterance " + utterance.id + " has non-finite times", segment.id);
        }
        if (utterance.start < -epsilon_ || utterance.duration < 0.0) {
            throw utils::InvalidSegmentException("Utterance " + utterance.id + " has negative start or duration",
                                                 segment.id);
        }
        if (utterance.end() > segment.duration + epsilon_) {
            throw utils::InvalidSegmentException("Utterance " + utterance.id + " ends after the segment",
                                                 segment.id);
        }
        if (!utterance.alignment) {
            continue;
        }
        for (const auto& word : *utterance.alignment) {
            if (!finite(word.start) || !finite(word.duration) || word.duration < 0.0) {
                throw utils::InvalidSegmentException("Utterance " + utterance.id + " has an invalid word timing for '" +
                                                     word.symbol + "'", segment.id);
            }
        }
    }
}

RecordingSegment SegmentValidator::normalize(const RecordingSegment& segment, bool filter_punctuation) const {
    RecordingSegment normalized = segment;
    for (auto& utterance : normalized.utterances) {
        if (!utterance.alignment) {
            continue;
        }
        auto& words = *utterance.alignment;
        if (filter_punctuation) {
            words.erase(std::remove_if(words.begin(), words.end(),
                                       [](const Word& w) { return isPunctuationOnly(w.symbol); }),
                        words.end());
        }
        std::stable_sort(words.begin(), words.end(),
                         [](const Word& a, const Word& b) { return a.start < b.start; });
    }
    return normalized;
}

double SegmentValidator::maxInternalPause(const RecordingSegment& segment) {
    if (segment.utterances.size() < 2) {
        return 0.0;
    }

    std::vector<const UtteranceSpan*> ordered;
    ordered.reserve(segment.utterances.size());
    for (const auto& utterance : segment.utterances) {
        ordered.push_back(&utterance);
    }
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const UtteranceSpan* a, const UtteranceSpan* b) { return a->start < b->start; });

    double max_pause = 0.0;
    double covered_until = ordered.front()->end();
    for (size_t i = 1; i < ordered.size(); ++i) {
        max_pause = std::max(max_pause, ordered[i]->start - covered_until);
        covered_until = std::max(covered_until, ordered[i]->end());
    }
    return max_pause;
}

} // namespace segmentation
} // namespace overlapseg
