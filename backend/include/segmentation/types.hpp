#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace overlapseg {
namespace segmentation {

/**
 * Default tolerance used to keep trimmed words strictly inside a window
 */
constexpr double kBoundaryEpsilon = 1e-5;

/**
 * Metadata key holding the per-speaker continuation flags of a split segment
 */
constexpr const char* kContinuationKey = "per_speaker_continuation";

/**
 * One timed entry of a word-level alignment. The symbol may hold several
 * space-separated written words. The aligner's confidence is kept when the
 * manifest has one.
 */
struct Word {
    std::string symbol;
    double start = 0.0;
    double duration = 0.0;
    std::optional<double> score;

    Word() = default;
    Word(std::string sym, double s, double d, std::optional<double> sc = std::nullopt)
        : symbol(std::move(sym)), start(s), duration(d), score(sc) {}

    double end() const { return start + duration; }

    bool operator==(const Word& other) const {
        return symbol == other.symbol && start == other.start && duration == other.duration &&
               score == other.score;
    }
};

/**
 * One speaker's continuous spoken span (a supervision). Times are relative
 * to the start of the owning segment, alignment included.
 */
struct UtteranceSpan {
    std::string id;
    std::string speaker_id;
    double start = 0.0;
    double duration = 0.0;
    std::string text;
    std::optional<std::vector<Word>> alignment;

    // Manifest fields with no meaning to the splitter, kept verbatim
    nlohmann::json attributes = nlohmann::json::object();

    double end() const { return start + duration; }
    bool hasAlignment() const { return alignment.has_value() && !alignment->empty(); }

    /**
     * Copy of this span with start and alignment moved by -offset
     */
    UtteranceSpan shifted(double offset) const;
};

/**
 * A bounded window of one recording plus the utterances active within it
 * (a cut).
 */
struct RecordingSegment {
    std::string id;
    double start_in_recording = 0.0;
    double duration = 0.0;
    std::vector<UtteranceSpan> utterances;
    nlohmann::json metadata = nlohmann::json::object();

    // Manifest fields with no meaning to the splitter, kept verbatim
    nlohmann::json attributes = nlohmann::json::object();

    double end() const { return start_in_recording + duration; }
};

/**
 * Builds the derived id used for utterances placed into a group:
 * "<id>-<scan position>-<position in group>"
 */
std::string derivedUtteranceId(const std::string& id, size_t scan_position, size_t group_position);

} // namespace segmentation
} // namespace overlapseg
