#include "collabscribe/utils/config.hpp"
#include "collabscribe/utils/error_handler.hpp"
#include "collabscribe/utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>

namespace collabscribe {
namespace utils {

namespace {

template <typename T>
void readIfPresent(const nlohmann::json& section, const char* key, T& target) {
    auto it = section.find(key);
    if (it != section.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

} // namespace

bool TranscriptionConfigManager::loadFromFile(const std::string& configPath) {
    std::ifstream file(configPath);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open config file: " + configPath);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string jsonStr = buffer.str();
    if (jsonStr.empty()) {
        LOG_ERROR("Config file is empty: " + configPath);
        return false;
    }

    if (!loadFromJson(jsonStr)) {
        LOG_ERROR("Failed to load config file: " + configPath);
        return false;
    }

    LOG_INFO("Transcription configuration loaded from " + configPath);
    return true;
}

bool TranscriptionConfigManager::loadFromJson(const std::string& jsonStr) {
    TranscriptionConfig parsed;
    try {
        parsed = parseJson(jsonStr, getConfig());
    } catch (const ConfigException& e) {
        ErrorHandler::getInstance().reportError(e, "TranscriptionConfigManager::loadFromJson");
        std::lock_guard<std::mutex> lock(mutex_);
        lastValidation_ = ConfigValidationResult{};
        lastValidation_.addError(e.what());
        return false;
    }
    return setConfig(parsed);
}

bool TranscriptionConfigManager::saveToFile(const std::string& configPath) const {
    std::ofstream file(configPath);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open config file for writing: " + configPath);
        return false;
    }
    file << toJson();
    return file.good();
}

TranscriptionConfig TranscriptionConfigManager::getConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

bool TranscriptionConfigManager::setConfig(const TranscriptionConfig& config) {
    ConfigValidationResult result = validate(config);

    for (const auto& warning : result.warnings) {
        LOG_WARNING("Config warning: " + warning);
    }
    for (const auto& error : result.errors) {
        LOG_ERROR("Config error: " + error);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    lastValidation_ = result;
    if (!result.isValid) {
        return false;
    }
    config_ = config;
    return true;
}

std::string TranscriptionConfigManager::toJson() const {
    return configToJson(getConfig());
}

ConfigValidationResult TranscriptionConfigManager::getLastValidation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastValidation_;
}

ConfigValidationResult TranscriptionConfigManager::validate(const TranscriptionConfig& config) {
    ConfigValidationResult result;

    if (config.flushIntervalMs <= 0) {
        result.addError("flush.intervalMs must be positive");
    } else if (config.flushIntervalMs > 10000) {
        result.addWarning("flush.intervalMs above 10s delays interim text noticeably");
    }

    if (!std::isfinite(config.interimConfidence) ||
        config.interimConfidence < 0.0f || config.interimConfidence > 1.0f) {
        result.addError("flush.interimConfidence must be within [0, 1]");
    }

    if (config.qualityWindowSize == 0) {
        result.addError("quality.windowSize must be at least 1");
    }

    if (!(config.excellentThresholdDb > config.goodThresholdDb &&
          config.goodThresholdDb > config.fairThresholdDb)) {
        result.addError("quality thresholds must be strictly decreasing (excellent > good > fair)");
    }

    if (!std::isfinite(config.speakerMatchThreshold) ||
        config.speakerMatchThreshold < 0.0f || config.speakerMatchThreshold > 1.0f) {
        result.addError("speaker.matchThreshold must be within [0, 1]");
    }

    if (config.defaultLanguage.empty()) {
        result.addWarning("language is empty; segments will carry an empty language tag");
    }

    std::string upper;
    for (char c : config.logLevel) {
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    if (upper != "DEBUG" && upper != "INFO" && upper != "WARN" &&
        upper != "WARNING" && upper != "ERROR") {
        result.addWarning("Unrecognized logLevel '" + config.logLevel + "', using INFO");
    }

    return result;
}

TranscriptionConfig TranscriptionConfigManager::parseJson(const std::string& jsonStr,
                                                          const TranscriptionConfig& base) {
    TranscriptionConfig config = base;
    try {
        nlohmann::json j = nlohmann::json::parse(jsonStr);
        if (!j.is_object()) {
            throw ConfigException("Config root must be a JSON object");
        }

        if (j.contains("flush")) {
            const auto& flush = j["flush"];
            readIfPresent(flush, "intervalMs", config.flushIntervalMs);
            readIfPresent(flush, "enableTimer", config.enableFlushTimer);
            readIfPresent(flush, "interimConfidence", config.interimConfidence);
        }

        if (j.contains("quality")) {
            const auto& quality = j["quality"];
            readIfPresent(quality, "windowSize", config.qualityWindowSize);
            readIfPresent(quality, "excellentThresholdDb", config.excellentThresholdDb);
            readIfPresent(quality, "goodThresholdDb", config.goodThresholdDb);
            readIfPresent(quality, "fairThresholdDb", config.fairThresholdDb);
        }

        if (j.contains("speaker")) {
            readIfPresent(j["speaker"], "matchThreshold", config.speakerMatchThreshold);
        }

        readIfPresent(j, "language", config.defaultLanguage);
        readIfPresent(j, "logLevel", config.logLevel);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigException("Invalid transcription config JSON", e.what());
    }
    return config;
}

std::string TranscriptionConfigManager::configToJson(const TranscriptionConfig& config) {
    nlohmann::ordered_json j;

    j["flush"] = {
        {"intervalMs", config.flushIntervalMs},
        {"enableTimer", config.enableFlushTimer},
        {"interimConfidence", config.interimConfidence}
    };

    j["quality"] = {
        {"windowSize", config.qualityWindowSize},
        {"excellentThresholdDb", config.excellentThresholdDb},
        {"goodThresholdDb", config.goodThresholdDb},
        {"fairThresholdDb", config.fairThresholdDb}
    };

    j["speaker"] = {
        {"matchThreshold", config.speakerMatchThreshold}
    };

    j["language"] = config.defaultLanguage;
    j["logLevel"] = config.logLevel;

    return j.dump(2);
}

} // namespace utils
} // namespace collabscribe
