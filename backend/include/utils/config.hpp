#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace overlapseg {
namespace utils {

/**
 * Settings of a segmentation run
 */
struct SegmenterConfig {
    // Splitting
    double maxSegmentDuration = 30.0;
    double boundaryEpsilon = 1e-5;
    bool carryOverlaps = true;
    bool filterPunctuationAlignments = true;

    // Input precondition check
    double maxPause = 2.0;

    // Execution
    int numJobs = 8;
    std::string logLevel = "INFO";
};

/**
 * Configuration validation result
 */
struct ConfigValidationResult {
    bool isValid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void addError(const std::string& error) {
        errors.push_back(error);
        isValid = false;
    }

    void addWarning(const std::string& warning) {
        warnings.push_back(warning);
    }

    bool hasErrors() const { return !errors.empty(); }
    bool hasWarnings() const { return !warnings.empty(); }
};

/**
 * Loads, validates and exports SegmenterConfig as JSON
 */
class SegmenterConfigManager {
public:
    SegmenterConfigManager();
    ~SegmenterConfigManager() = default;

    /**
     * Load configuration from file. A missing file leaves the defaults.
     * @param configPath Path to configuration file
     * @return true if loaded successfully
     */
    bool loadFromFile(const std::string& configPath);

    /**
     * Save configuration to file
     * @param configPath Path to configuration file
     * @return true if saved successfully
     */
    bool saveToFile(const std::string& configPath) const;

    /**
     * Load configuration from JSON string
     * @param jsonStr JSON configuration string
     * @return true if parsed and valid
     */
    bool loadFromJson(const std::string& jsonStr);

    /**
     * Export configuration to JSON string
     */
    std::string exportToJson() const;

    SegmenterConfig getConfig() const;

    /**
     * Replace the configuration if the new one is valid
     * @return Validation result
     */
    ConfigValidationResult updateConfig(const SegmenterConfig& newConfig);

    ConfigValidationResult validateConfig(const SegmenterConfig& config) const;

    void resetToDefaults();

    std::string getConfigFilePath() const;
    std::chrono::steady_clock::time_point getLastModified() const;

private:
    bool parseJsonConfig(const std::string& jsonStr, SegmenterConfig& config) const;
    std::string configToJson(const SegmenterConfig& config) const;

    SegmenterConfig config_;
    std::string configFilePath_;
    std::chrono::steady_clock::time_point lastModified_;

    mutable std::mutex configMutex_;
};

} // namespace utils
} // namespace overlapseg
