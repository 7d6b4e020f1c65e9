#include "io/manifest_io.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace overlapseg {
namespace io {

using segmentation::RecordingSegment;
using segmentation::UtteranceSpan;
using segmentation::Word;

namespace {

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

double requireNumber(const nlohmann::json& object, const char* key, const std::string& owner) {
    if (!object.contains(key) || !object.at(key).is_number()) {
        throw utils::ManifestException("Missing or non-numeric '" + std::string(key) + "'", owner);
    }
    return object.at(key).get<double>();
}

std::string optionalString(const nlohmann::json& object, const char* key) {
    if (!object.contains(key) || object.at(key).is_null()) {
        return "";
    }
    if (!object.at(key).is_string()) {
        throw utils::ManifestException("Field '" + std::string(key) + "' must be a string");
    }
    return object.at(key).get<std::string>();
}

std::string describe(const nlohmann::json& object) {
    if (object.is_object() && object.contains("id") && object.at("id").is_string()) {
        return object.at("id").get<std::string>();
    }
    return "<unknown>";
}

} // anonymous namespace

ManifestFormat detectFormat(const std::string& path) {
    if (endsWith(path, ".gz")) {
        throw utils::ManifestException("Compressed manifests are not supported", path);
    }
    if (endsWith(path, ".jsonl")) {
        return ManifestFormat::JSONL;
    }
    if (endsWith(path, ".json")) {
        return ManifestFormat::JSON;
    }
    throw utils::ManifestException("Unknown manifest extension, expected .jsonl or .json", path);
}

// ManifestReader

std::vector<RecordingSegment> ManifestReader::load(const std::string& path) {
    const ManifestFormat format = detectFormat(path);

    std::ifstream file(path);
    if (!file.is_open()) {
        throw utils::ManifestException("Cannot open manifest", path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        auto segments = parse(buffer.str(), format);
        utils::Logger::info("Loaded " + std::to_string(segments.size()) + " segments from " + path);
        return segments;
    } catch (const utils::ManifestException& e) {
        throw utils::ManifestException(e.what(), path);
    }
}

std::vector<RecordingSegment> ManifestReader::parse(const std::string& content, ManifestFormat format) {
    std::vector<RecordingSegment> segments;

    if (format == ManifestFormat::JSONL) {
        std::istringstream lines(content);
        std::string line;
        size_t line_number = 0;
        while (std::getline(lines, line)) {
            ++line_number;
            if (line.find_first_not_of(" \t\r") == std::string::npos) {
                continue;
            }
            try {
                segments.push_back(parseCut(nlohmann::json::parse(line)));
            } catch (const nlohmann::json::exception& e) {
                throw utils::ManifestException("Line " + std::to_string(line_number) + ": " + e.what());
            } catch (const utils::ManifestException& e) {
                throw utils::ManifestException("Line " + std::to_string(line_number) + ": " + e.what());
            }
        }
        return segments;
    }

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(content);
    } catch (const nlohmann::json::exception& e) {
        throw utils::ManifestException(std::string("Invalid JSON manifest: ") + e.what());
    }

    if (document.is_object()) {
        segments.push_back(parseCut(document));
    } else if (document.is_array()) {
        for (const auto& cut : document) {
            segments.push_back(parseCut(cut));
        }
    } else {
        throw utils::ManifestException("JSON manifest must be an array of cuts or a single cut");
    }
    return segments;
}

RecordingSegment ManifestReader::parseCut(const nlohmann::json& cut) {
    if (!cut.is_object()) {
        throw utils::ManifestException("Cut must be a JSON object");
    }

    RecordingSegment segment;
    segment.id = optionalString(cut, "id");
    if (segment.id.empty()) {
        throw utils::ManifestException("Cut without id");
    }
    segment.start_in_recording = requireNumber(cut, "start", segment.id);
    segment.duration = requireNumber(cut, "duration", segment.id);

    if (cut.contains("supervisions") && !cut.at("supervisions").is_null()) {
        const auto& supervisions = cut.at("supervisions");
        if (!supervisions.is_array()) {
            throw utils::ManifestException("'supervisions' must be an array", segment.id);
        }
        for (const auto& supervision : supervisions) {
            segment.utterances.push_back(parseSupervision(supervision));
        }
    }

    if (cut.contains("custom") && cut.at("custom").is_object()) {
        segment.metadata = cut.at("custom");
    }

    for (const auto& item : cut.items()) {
        const std::string& key = item.key();
        if (key == "id" || key == "start" || key == "duration" || key == "supervisions" || key == "custom") {
            continue;
        }
        segment.attributes[key] = item.value();
    }

    return segment;
}

UtteranceSpan ManifestReader::parseSupervision(const nlohmann::json& supervision) {
    if (!supervision.is_object()) {
        throw utils::ManifestException("Supervision must be a JSON object");
    }

    UtteranceSpan utterance;
    utterance.id = optionalString(supervision, "id");
    if (utterance.id.empty()) {
        throw utils::ManifestException("Supervision without id");
    }
    utterance.speaker_id = optionalString(supervision, "speaker");
    utterance.start = requireNumber(supervision, "start", utterance.id);
    utterance.duration = requireNumber(supervision, "duration", utterance.id);
    utterance.text = optionalString(supervision, "text");

    for (const auto& item : supervision.items()) {
        const std::string& key = item.key();
        if (key == "id" || key == "speaker" || key == "start" || key == "duration" || key == "text") {
            continue;
        }
        if (key == "alignment" && item.value().is_object()) {
            nlohmann::json other_tiers = item.value();
            if (other_tiers.contains("word") && other_tiers.at("word").is_array()) {
                std::vector<Word> words;
                for (const auto& entry : other_tiers.at("word")) {
                    words.push_back(parseAlignmentItem(entry));
                }
                utterance.alignment = std::move(words);
                other_tiers.erase("word");
            }
            if (!other_tiers.empty()) {
                utterance.attributes["alignment"] = other_tiers;
            }
            continue;
        }
        if (key == "alignment" && item.value().is_null()) {
            continue;
        }
        utterance.attributes[key] = item.value();
    }

    return utterance;
}

Word ManifestReader::parseAlignmentItem(const nlohmann::json& item) {
    try {
        if (item.is_array() && item.size() >= 3) {
            std::optional<double> score;
            if (item.size() >= 4 && item.at(3).is_number()) {
                score = item.at(3).get<double>();
            }
            return Word(item.at(0).get<std::string>(), item.at(1).get<double>(), item.at(2).get<double>(), score);
        }
        if (item.is_object()) {
            std::optional<double> score;
            if (item.contains("score") && item.at("score").is_number()) {
                score = item.at("score").get<double>();
            }
            return Word(item.at("symbol").get<std::string>(), item.at("start").get<double>(),
                        item.at("duration").get<double>(), score);
        }
    } catch (const nlohmann::json::exception& e) {
        throw utils::ManifestException(std::string("Malformed alignment item: ") + e.what(), describe(item));
    }
    throw utils::ManifestException("Alignment item must be [symbol, start, duration, score?] or an object");
}

// ManifestWriter

void ManifestWriter::save(const std::vector<RecordingSegment>& segments, const std::string& path) {
    const ManifestFormat format = detectFormat(path);

    std::filesystem::path target(path);
    if (target.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            throw utils::ManifestException("Cannot create output directory: " + ec.message(), path);
        }
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        throw utils::ManifestException("Cannot open manifest for writing", path);
    }

    file << serialize(segments, format);
    file.flush();
    if (!file.good()) {
        throw utils::ManifestException("Failed while writing manifest", path);
    }

    utils::Logger::info("Wrote " + std::to_string(segments.size()) + " segments to " + path);
}

std::string ManifestWriter::serialize(const std::vector<RecordingSegment>& segments, ManifestFormat format) {
    std::ostringstream out;
    if (format == ManifestFormat::JSONL) {
        for (const auto& segment : segments) {
            out << toJson(segment).dump() << '\n';
        }
        return out.str();
    }

    nlohmann::json document = nlohmann::json::array();
    for (const auto& segment : segments) {
        document.push_back(toJson(segment));
    }
    out << document.dump(2) << '\n';
    return out.str();
}

nlohmann::json ManifestWriter::toJson(const RecordingSegment& segment) {
    nlohmann::json cut = segment.attributes.is_object() ? segment.attributes : nlohmann::json::object();
    cut["id"] = segment.id;
    cut["start"] = segment.start_in_recording;
    cut["duration"] = segment.duration;

    nlohmann::json supervisions = nlohmann::json::array();
    for (const auto& utterance : segment.utterances) {
        supervisions.push_back(toJson(utterance));
    }
    cut["supervisions"] = std::move(supervisions);

    if (segment.metadata.is_object() && !segment.metadata.empty()) {
        cut["custom"] = segment.metadata;
    }
    return cut;
}

nlohmann::json ManifestWriter::toJson(const UtteranceSpan& utterance) {
    nlohmann::json supervision = utterance.attributes.is_object() ? utterance.attributes : nlohmann::json::object();
    supervision["id"] = utterance.id;
    supervision["start"] = utterance.start;
    supervision["duration"] = utterance.duration;
    supervision["text"] = utterance.text;
    if (!utterance.speaker_id.empty()) {
        supervision["speaker"] = utterance.speaker_id;
    }

    if (utterance.alignment) {
        nlohmann::json words = nlohmann::json::array();
        for (const auto& word : *utterance.alignment) {
            nlohmann::json entry = nlohmann::json::array({word.symbol, word.start, word.duration});
            if (word.score) {
                entry.push_back(*word.score);
            }
            words.push_back(std::move(entry));
        }
        if (!supervision.contains("alignment") || !supervision["alignment"].is_object()) {
            supervision["alignment"] = nlohmann::json::object();
        }
        supervision["alignment"]["word"] = std::move(words);
    }
    return supervision;
}

} // namespace io
} // namespace overlapseg
