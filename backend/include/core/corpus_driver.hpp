#pragma once

#include "segmentation/segment_splitter.hpp"
#include "segmentation/types.hpp"
#include "utils/config.hpp"
#include <string>
#include <vector>

namespace overlapseg {
namespace core {

/**
 * Settings of a corpus run
 */
struct DriverOptions {
    segmentation::SplitterOptions splitter;
    size_t num_jobs = 8;
    double max_pause = 2.0;

    static DriverOptions fromConfig(const utils::SegmenterConfig& config);
};

/**
 * A segment that could not be split
 */
struct SegmentFailure {
    size_t index = 0;
    std::string segment_id;
    std::string message;
};

/**
 * Summary of a corpus run
 */
struct DriverReport {
    size_t input_segments = 0;
    size_t output_segments = 0;
    size_t pause_warnings = 0;
    std::vector<SegmentFailure> failures;

    bool succeeded() const { return failures.empty(); }
};

/**
 * Runs the segment splitter over a whole corpus, optionally on a thread
 * pool. Output keeps the input order; a failing segment is reported and
 * left out without affecting the others.
 */
class CorpusDriver {
public:
    explicit CorpusDriver(const DriverOptions& options);

    /**
     * Split every segment
     * @param segments Input segments
     * @param report Filled with counts and failures when not null
     * @return Sub-segments of all segments, in input order
     */
    std::vector<segmentation::RecordingSegment> process(
        const std::vector<segmentation::RecordingSegment>& segments,
        DriverReport* report = nullptr) const;

    /**
     * Read a manifest, split it and write the result
     * @return Report of the run
     * @throws utils::ManifestException if reading or writing fails
     */
    DriverReport run(const std::string& input_path, const std::string& output_path) const;

    const DriverOptions& getOptions() const { return options_; }

private:
    struct SegmentOutcome {
        std::vector<segmentation::RecordingSegment> segments;
        bool pause_warning = false;
    };

    SegmentOutcome processOne(const segmentation::RecordingSegment& segment) const;

    DriverOptions options_;
    segmentation::SegmentSplitter splitter_;
};

} // namespace core
} // namespace overlapseg
