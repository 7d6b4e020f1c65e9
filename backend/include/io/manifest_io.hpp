#pragma once

#include "segmentation/types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace overlapseg {
namespace io {

enum class ManifestFormat {
    JSONL,   // one cut per line
    JSON     // a single array of cuts
};

/**
 * Pick the format from the file extension (.jsonl or .json)
 * @throws utils::ManifestException for compressed or unknown extensions
 */
ManifestFormat detectFormat(const std::string& path);

/**
 * Reads lhotse-style cut manifests. Fields the splitter does not use are
 * kept in the attributes of each cut and supervision.
 */
class ManifestReader {
public:
    /**
     * @throws utils::ManifestException if the file is missing or malformed
     */
    static std::vector<segmentation::RecordingSegment> load(const std::string& path);

    static std::vector<segmentation::RecordingSegment> parse(const std::string& content, ManifestFormat format);

    static segmentation::RecordingSegment parseCut(const nlohmann::json& cut);
    static segmentation::UtteranceSpan parseSupervision(const nlohmann::json& supervision);
    static segmentation::Word parseAlignmentItem(const nlohmann::json& item);
};

/**
 * Writes cuts back in the lhotse layout, word alignments as
 * [symbol, start, duration] triples
 */
class ManifestWriter {
public:
    /**
     * @throws utils::ManifestException if the file cannot be written
     */
    static void save(const std::vector<segmentation::RecordingSegment>& segments, const std::string& path);

    static std::string serialize(const std::vector<segmentation::RecordingSegment>& segments, ManifestFormat format);

    static nlohmann::json toJson(const segmentation::RecordingSegment& segment);
    static nlohmann::json toJson(const segmentation::UtteranceSpan& utterance);
};

} // namespace io
} // namespace overlapseg
