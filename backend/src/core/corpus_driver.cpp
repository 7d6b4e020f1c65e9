#include "core/corpus_driver.hpp"
#include "core/task_queue.hpp"
#include "io/manifest_io.hpp"
#include "segmentation/segment_validator.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <future>
#include <memory>
#include <sstream>

namespace overlapseg {
namespace core {

using segmentation::RecordingSegment;

DriverOptions DriverOptions::fromConfig(const utils::SegmenterConfig& config) {
    DriverOptions options;
    options.splitter.max_len = config.maxSegmentDuration;
    options.splitter.epsilon = config.boundaryEpsilon;
    options.splitter.carry_overlaps = config.carryOverlaps;
    options.splitter.filter_punctuation = config.filterPunctuationAlignments;
    options.num_jobs = config.numJobs > 0 ? static_cast<size_t>(config.numJobs) : 1;
    options.max_pause = config.maxPause;
    return options;
}

CorpusDriver::CorpusDriver(const DriverOptions& options)
    : options_(options), splitter_(options.splitter) {
}

CorpusDriver::SegmentOutcome CorpusDriver::processOne(const RecordingSegment& segment) const {
    utils::ErrorContext context("CorpusDriver", segment.id);

    SegmentOutcome outcome;
    const double pause = segmentation::SegmentValidator::maxInternalPause(segment);
    if (pause > options_.max_pause) {
        std::ostringstream oss;
        oss << "Segment " << segment.id << " has a " << pause << "s pause between utterances (limit "
            << options_.max_pause << "s), overlap context may be lost";
        utils::Logger::warn(oss.str());
        outcome.pause_warning = true;
    }

    outcome.segments = splitter_.split(segment);
    return outcome;
}

std::vector<RecordingSegment> CorpusDriver::process(const std::vector<RecordingSegment>& segments,
                                                    DriverReport* report) const {
    DriverReport local;
    local.input_segments = segments.size();

    std::vector<std::vector<RecordingSegment>> results(segments.size());

    auto collect = [&](size_t index, SegmentOutcome outcome) {
        if (outcome.pause_warning) {
            local.pause_warnings++;
        }
        results[index] = std::move(outcome.segments);
    };

    auto fail = [&](size_t index, const std::exception& e) {
        utils::ErrorContext context("CorpusDriver", segments[index].id);
        OVERLAPSEG_HANDLE_EXCEPTION(e, "CorpusDriver");
        SegmentFailure failure;
        failure.index = index;
        failure.segment_id = segments[index].id;
        failure.message = e.what();
        local.failures.push_back(std::move(failure));
    };

    if (options_.num_jobs <= 1 || segments.size() <= 1) {
        for (size_t i = 0; i < segments.size(); ++i) {
            try {
                collect(i, processOne(segments[i]));
            } catch (const std::exception& e) {
                fail(i, e);
            }
        }
    } else {
        auto queue = std::make_shared<TaskQueue>();
        ThreadPool pool(std::min(options_.num_jobs, segments.size()));
        pool.start(queue);

        std::vector<std::future<SegmentOutcome>> futures;
        futures.reserve(segments.size());
        for (size_t i = 0; i < segments.size(); ++i) {
            futures.push_back(queue->enqueueWithFuture(segments[i].id, [this, &segments, i]() {
                return processOne(segments[i]);
            }));
        }

        // Collected in submission order
        for (size_t i = 0; i < futures.size(); ++i) {
            try {
                collect(i, futures[i].get());
            } catch (const std::exception& e) {
                fail(i, e);
            }
        }

        pool.stop();
    }

    std::vector<RecordingSegment> output;
    for (auto& parts : results) {
        for (auto& part : parts) {
            output.push_back(std::move(part));
        }
    }
    local.output_segments = output.size();

    utils::Logger::info("Split " + std::to_string(local.input_segments) + " segments into " +
                        std::to_string(local.output_segments) + " sub-segments, " +
                        std::to_string(local.failures.size()) + " failed");
    for (const auto& failure : local.failures) {
        utils::Logger::error("Segment " + failure.segment_id + " failed: " + failure.message);
    }

    if (report) {
        *report = std::move(local);
    }
    return output;
}

DriverReport CorpusDriver::run(const std::string& input_path, const std::string& output_path) const {
    auto segments = io::ManifestReader::load(input_path);

    DriverReport report;
    auto output = process(segments, &report);

    io::ManifestWriter::save(output, output_path);
    return report;
}

} // namespace core
} // namespace overlapseg
