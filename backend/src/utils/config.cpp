#include "utils/config.hpp"
#include "utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace overlapseg {
namespace utils {

SegmenterConfigManager::SegmenterConfigManager()
    : lastModified_(std::chrono::steady_clock::now()) {
}

bool SegmenterConfigManager::loadFromFile(const std::string& configPath) {
    std::lock_guard<std::mutex> lock(configMutex_);

    configFilePath_ = configPath;

    if (!std::filesystem::exists(configPath)) {
        Logger::warn("Configuration file not found: " + configPath + ", using defaults");
        config_ = SegmenterConfig();
        return true;
    }

    std::ifstream file(configPath);
    if (!file.is_open()) {
        Logger::error("Failed to open configuration file: " + configPath);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    file.close();

    std::string jsonStr = buffer.str();
    if (jsonStr.find_first_not_of(" \t\r\n") == std::string::npos) {
        Logger::info("Empty configuration file, using defaults");
        config_ = SegmenterConfig();
        return true;
    }

    SegmenterConfig newConfig;
    if (!parseJsonConfig(jsonStr, newConfig)) {
        Logger::error("Failed to parse configuration file: " + configPath);
        return false;
    }

    auto validationResult = validateConfig(newConfig);
    if (!validationResult.isValid) {
        Logger::error("Invalid configuration loaded from: " + configPath);
        for (const auto& error : validationResult.errors) {
            Logger::error("  " + error);
        }
        return false;
    }

    for (const auto& warning : validationResult.warnings) {
        Logger::warn("  " + warning);
    }

    config_ = newConfig;
    lastModified_ = std::chrono::steady_clock::now();

    Logger::info("Configuration loaded from: " + configPath);
    return true;
}

bool SegmenterConfigManager::saveToFile(const std::string& configPath) const {
    std::lock_guard<std::mutex> lock(configMutex_);

    std::filesystem::path path(configPath);
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            Logger::error("Failed to create directory for " + configPath + ": " + ec.message());
            return false;
        }
    }

    std::ofstream file(configPath);
    if (!file.is_open()) {
        Logger::error("Failed to open configuration file for writing: " + configPath);
        return false;
    }

    file << configToJson(config_) << std::endl;
    return file.good();
}

bool SegmenterConfigManager::loadFromJson(const std::string& jsonStr) {
    std::lock_guard<std::mutex> lock(configMutex_);

    SegmenterConfig newConfig;
    if (!parseJsonConfig(jsonStr, newConfig)) {
        Logger::error("Failed to parse JSON configuration");
        return false;
    }

    auto validationResult = validateConfig(newConfig);
    if (!validationResult.isValid) {
        Logger::error("Invalid JSON configuration");
        for (const auto& error : validationResult.errors) {
            Logger::error("  " + error);
        }
        return false;
    }

    config_ = newConfig;
    lastModified_ = std::chrono::steady_clock::now();
    return true;
}

std::string SegmenterConfigManager::exportToJson() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return configToJson(config_);
}

SegmenterConfig SegmenterConfigManager::getConfig() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_;
}

ConfigValidationResult SegmenterConfigManager::updateConfig(const SegmenterConfig& newConfig) {
    std::lock_guard<std::mutex> lock(configMutex_);

    auto validationResult = validateConfig(newConfig);
    if (!validationResult.isValid) {
        return validationResult;
    }

    config_ = newConfig;
    lastModified_ = std::chrono::steady_clock::now();
    return validationResult;
}

ConfigValidationResult SegmenterConfigManager::validateConfig(const SegmenterConfig& config) const {
    ConfigValidationResult result;

    if (!(config.maxSegmentDuration > 0.0)) {
        result.addError("maxSegmentDuration must be positive");
    } else if (config.maxSegmentDuration < 1.0) {
        result.addWarning("maxSegmentDuration below 1s will drop most multi-word utterances");
    }

    if (config.boundaryEpsilon < 0.0) {
        result.addError("boundaryEpsilon must not be negative");
    } else if (config.maxSegmentDuration > 0.0 && config.boundaryEpsilon >= config.maxSegmentDuration) {
        result.addError("boundaryEpsilon must be smaller than maxSegmentDuration");
    }

    if (config.maxPause < 0.0) {
        result.addError("maxPause must not be negative");
    }

    if (config.numJobs < 1) {
        result.addError("numJobs must be at least 1");
    } else if (config.numJobs > 256) {
        result.addWarning("numJobs is unusually large: " + std::to_string(config.numJobs));
    }

    LogLevel level;
    if (!Logger::parseLevel(config.logLevel, level)) {
        result.addError("Unknown logLevel: " + config.logLevel);
    }

    return result;
}

void SegmenterConfigManager::resetToDefaults() {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_ = SegmenterConfig();
    lastModified_ = std::chrono::steady_clock::now();
}

std::string SegmenterConfigManager::getConfigFilePath() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return configFilePath_;
}

std::chrono::steady_clock::time_point SegmenterConfigManager::getLastModified() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return lastModified_;
}

bool SegmenterConfigManager::parseJsonConfig(const std::string& jsonStr, SegmenterConfig& config) const {
    try {
        nlohmann::json j = nlohmann::json::parse(jsonStr);
        if (!j.is_object()) {
            Logger::error("Configuration must be a JSON object");
            return false;
        }

        config.maxSegmentDuration = j.value("maxSegmentDuration", config.maxSegmentDuration);
        config.boundaryEpsilon = j.value("boundaryEpsilon", config.boundaryEpsilon);
        config.carryOverlaps = j.value("carryOverlaps", config.carryOverlaps);
        config.filterPunctuationAlignments = j.value("filterPunctuationAlignments",
                                                     config.filterPunctuationAlignments);
        config.maxPause = j.value("maxPause", config.maxPause);
        config.numJobs = j.value("numJobs", config.numJobs);
        config.logLevel = j.value("logLevel", config.logLevel);

        return true;
    } catch (const nlohmann::json::exception& e) {
        Logger::error("JSON configuration error: " + std::string(e.what()));
        return false;
    }
}

std::string SegmenterConfigManager::configToJson(const SegmenterConfig& config) const {
    nlohmann::json j = {
        {"maxSegmentDuration", config.maxSegmentDuration},
        {"boundaryEpsilon", config.boundaryEpsilon},
        {"carryOverlaps", config.carryOverlaps},
        {"filterPunctuationAlignments", config.filterPunctuationAlignments},
        {"maxPause", config.maxPause},
        {"numJobs", config.numJobs},
        {"logLevel", config.logLevel}
    };
    return j.dump(2);
}

} // namespace utils
} // namespace overlapseg
