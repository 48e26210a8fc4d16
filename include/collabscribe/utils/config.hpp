#pragma once

#include <string>
#include <vector>
#include <mutex>

namespace collabscribe {
namespace utils {

/**
 * Runtime configuration of the transcription core
 */
struct TranscriptionConfig {
    // Interim buffer flushing
    int flushIntervalMs = 1000;
    bool enableFlushTimer = true;
    float interimConfidence = 0.8f;

    // Quality monitoring
    size_t qualityWindowSize = 100;
    float excellentThresholdDb = -20.0f;
    float goodThresholdDb = -30.0f;
    float fairThresholdDb = -40.0f;

    // Speaker matching
    float speakerMatchThreshold = 0.7f;

    std::string defaultLanguage = "en-US";
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
 * Loads, validates and serializes TranscriptionConfig as JSON.
 * A config that fails validation is never applied.
 */
class TranscriptionConfigManager {
public:
    TranscriptionConfigManager() = default;

    /**
     * Load configuration from a JSON file
     * @return true if loaded and applied
     */
    bool loadFromFile(const std::string& configPath);

    /**
     * Load configuration from a JSON string
     * @return true if parsed, validated and applied
     */
    bool loadFromJson(const std::string& jsonStr);

    bool saveToFile(const std::string& configPath) const;

    TranscriptionConfig getConfig() const;
    bool setConfig(const TranscriptionConfig& config);

    std::string toJson() const;

    ConfigValidationResult getLastValidation() const;

    static ConfigValidationResult validate(const TranscriptionConfig& config);

    /**
     * Parse a JSON document on top of the given base config. Keys that are
     * absent keep their base value. Throws ConfigException on malformed JSON
     * or mistyped values.
     */
    static TranscriptionConfig parseJson(const std::string& jsonStr, const TranscriptionConfig& base);
    static std::string configToJson(const TranscriptionConfig& config);

private:
    mutable std::mutex mutex_;
    TranscriptionConfig config_;
    ConfigValidationResult lastValidation_;
};

} // namespace utils
} // namespace collabscribe
