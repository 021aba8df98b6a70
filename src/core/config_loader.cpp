#include "core/config_loader.h"

#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

constexpr uint32_t kMaxPeriodFrames = 65536;

static std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

DualSourceStrategy parseDualSourceStrategy(const std::string& str) {
    std::string lower = toLower(str);
    if (lower == "independent" || lower == "separate") {
        return DualSourceStrategy::Independent;
    }
    return DualSourceStrategy::Mix;
}

const char* dualSourceStrategyToString(DualSourceStrategy strategy) {
    switch (strategy) {
    case DualSourceStrategy::Independent:
        return "independent";
    case DualSourceStrategy::Mix:
    default:
        return "mix";
    }
}

bool validateSessionConfig(const AppConfig::SessionConfig& cfg, bool verbose) {
    if (cfg.chunkSeconds <= 0.0) {
        LOG_IF(ERROR, verbose, "[Config] session.chunkSeconds must be > 0 (got {})",
               cfg.chunkSeconds);
        return false;
    }
    if (cfg.overlapSeconds < 0.0 || cfg.overlapSeconds >= cfg.chunkSeconds) {
        LOG_IF(ERROR, verbose,
               "[Config] session.overlapSeconds must be in [0, chunkSeconds) (got {} / {})",
               cfg.overlapSeconds, cfg.chunkSeconds);
        return false;
    }
    if (cfg.silenceThreshold < 0.0f) {
        LOG_IF(ERROR, verbose, "[Config] session.silenceThreshold must be >= 0 (got {})",
               cfg.silenceThreshold);
        return false;
    }
    if (cfg.silenceSeconds <= 0.0) {
        LOG_IF(ERROR, verbose, "[Config] session.silenceSeconds must be > 0 (got {})",
               cfg.silenceSeconds);
        return false;
    }
    if (cfg.mixBlockSeconds <= 0.0) {
        LOG_IF(ERROR, verbose, "[Config] session.mixBlockSeconds must be > 0 (got {})",
               cfg.mixBlockSeconds);
        return false;
    }
    if (cfg.maxLagSeconds < 0.0) {
        LOG_IF(ERROR, verbose, "[Config] session.maxLagSeconds must be >= 0 (got {})",
               cfg.maxLagSeconds);
        return false;
    }
    if (cfg.systemWeight < 0.0f || cfg.microphoneWeight < 0.0f) {
        LOG_IF(ERROR, verbose, "[Config] mix weights must be >= 0 (system={}, microphone={})",
               cfg.systemWeight, cfg.microphoneWeight);
        return false;
    }
    return true;
}

bool validateCaptureConfig(const AppConfig::CaptureConfig& cfg, bool verbose) {
    if (cfg.sampleRate < 8000 || cfg.sampleRate > 192000) {
        LOG_IF(ERROR, verbose, "[Config] capture.sampleRate {} out of range [8000, 192000]",
               cfg.sampleRate);
        return false;
    }
    if (cfg.channels == 0 || cfg.channels > 8) {
        LOG_IF(ERROR, verbose, "[Config] capture.channels {} out of range [1, 8]", cfg.channels);
        return false;
    }
    if (cfg.periodFrames == 0 || cfg.periodFrames > kMaxPeriodFrames) {
        LOG_IF(ERROR, verbose, "[Config] capture.periodFrames {} out of range [1, {}]",
               cfg.periodFrames, kMaxPeriodFrames);
        return false;
    }
    std::string fmt = toLower(cfg.format);
    if (fmt != "s16_le" && fmt != "s24_3le" && fmt != "s32_le") {
        LOG_IF(ERROR, verbose, "[Config] Unsupported capture.format '{}'", cfg.format);
        return false;
    }
    if (cfg.maxQueuedSeconds <= 0.0) {
        LOG_IF(ERROR, verbose, "[Config] capture.maxQueuedSeconds must be > 0 (got {})",
               cfg.maxQueuedSeconds);
        return false;
    }
    return true;
}

static void parseSessionSection(const nlohmann::json& s, AppConfig& outConfig, bool verbose) {
    auto& session = outConfig.session;
    try {
        if (s.contains("chunkSeconds") && s["chunkSeconds"].is_number()) {
            session.chunkSeconds = s["chunkSeconds"].get<double>();
        }
        if (s.contains("overlapSeconds") && s["overlapSeconds"].is_number()) {
            session.overlapSeconds = s["overlapSeconds"].get<double>();
        }
        if (s.contains("silenceThreshold") && s["silenceThreshold"].is_number()) {
            session.silenceThreshold = s["silenceThreshold"].get<float>();
        }
        if (s.contains("silenceSeconds") && s["silenceSeconds"].is_number()) {
            session.silenceSeconds = s["silenceSeconds"].get<double>();
        }
        if (s.contains("singleSource") && s["singleSource"].is_string()) {
            std::string value = toLower(s["singleSource"].get<std::string>());
            if (!AudioUtils::parseSourceTag(value, session.singleSource) && verbose) {
                LOG_WARN("Config: Unknown session.singleSource '{}', using microphone", value);
            }
        }
        if (s.contains("dualSource") && s["dualSource"].is_boolean()) {
            session.dualSource = s["dualSource"].get<bool>();
        }
        if (s.contains("dualSourceStrategy") && s["dualSourceStrategy"].is_string()) {
            session.dualSourceStrategy =
                parseDualSourceStrategy(s["dualSourceStrategy"].get<std::string>());
        }
        if (s.contains("mixBlockSeconds") && s["mixBlockSeconds"].is_number()) {
            session.mixBlockSeconds = s["mixBlockSeconds"].get<double>();
        }
        if (s.contains("maxLagSeconds") && s["maxLagSeconds"].is_number()) {
            session.maxLagSeconds = s["maxLagSeconds"].get<double>();
        }
        if (s.contains("systemWeight") && s["systemWeight"].is_number()) {
            session.systemWeight = s["systemWeight"].get<float>();
        }
        if (s.contains("microphoneWeight") && s["microphoneWeight"].is_number()) {
            session.microphoneWeight = s["microphoneWeight"].get<float>();
        }
    } catch (const std::exception& e) {
        if (verbose) {
            LOG_WARN("Config: Invalid session settings, using defaults: {}", e.what());
        }
        session = AppConfig::SessionConfig{};
    }

    if (!validateSessionConfig(session, verbose)) {
        if (verbose) {
            LOG_WARN("Config: session section rejected, using defaults");
        }
        session = AppConfig::SessionConfig{};
    }
}

static void parseCaptureSection(const nlohmann::json& c, AppConfig& outConfig, bool verbose) {
    auto& capture = outConfig.capture;
    try {
        if (c.contains("microphoneDevice") && c["microphoneDevice"].is_string()) {
            capture.microphoneDevice = c["microphoneDevice"].get<std::string>();
        }
        if (c.contains("systemDevice") && c["systemDevice"].is_string()) {
            capture.systemDevice = c["systemDevice"].get<std::string>();
        }
        if (c.contains("sampleRate") && c["sampleRate"].is_number_integer()) {
            capture.sampleRate = c["sampleRate"].get<uint32_t>();
        }
        if (c.contains("channels") && c["channels"].is_number_integer()) {
            capture.channels = static_cast<uint8_t>(std::clamp(c["channels"].get<int>(), 0, 255));
        }
        if (c.contains("format") && c["format"].is_string()) {
            capture.format = c["format"].get<std::string>();
        }
        if (c.contains("periodFrames") && c["periodFrames"].is_number_integer()) {
            // Negative or oversized values become 0 and are rejected below
            const int64_t frames = c["periodFrames"].get<int64_t>();
            capture.periodFrames =
                (frames > 0 && frames <= kMaxPeriodFrames) ? static_cast<uint32_t>(frames) : 0;
        }
        if (c.contains("maxQueuedSeconds") && c["maxQueuedSeconds"].is_number()) {
            capture.maxQueuedSeconds = c["maxQueuedSeconds"].get<double>();
        }
    } catch (const std::exception& e) {
        if (verbose) {
            LOG_WARN("Config: Invalid capture settings, using defaults: {}", e.what());
        }
        capture = AppConfig::CaptureConfig{};
    }

    if (!validateCaptureConfig(capture, verbose)) {
        if (verbose) {
            LOG_WARN("Config: capture section rejected, using defaults");
        }
        capture = AppConfig::CaptureConfig{};
    }
}

bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig, bool verbose) {
    outConfig = AppConfig{};

    std::ifstream file(configPath);
    if (!file.is_open()) {
        if (verbose) {
            std::cout << "Config: " << configPath << " not found, using defaults" << '\n';
        }
        return false;
    }

    try {
        nlohmann::json j;
        file >> j;

        if (j.contains("session") && j["session"].is_object()) {
            parseSessionSection(j["session"], outConfig, verbose);
        }

        if (j.contains("capture") && j["capture"].is_object()) {
            parseCaptureSection(j["capture"], outConfig, verbose);
        }

        if (j.contains("transcription") && j["transcription"].is_object()) {
            const auto& t = j["transcription"];
            if (t.contains("backend") && t["backend"].is_string()) {
                outConfig.transcription.backend = toLower(t["backend"].get<std::string>());
            }
            if (t.contains("modelPath") && t["modelPath"].is_string()) {
                outConfig.transcription.modelPath = t["modelPath"].get<std::string>();
            }
            if (t.contains("language") && t["language"].is_string()) {
                outConfig.transcription.language = t["language"].get<std::string>();
            }
            if (t.contains("threads") && t["threads"].is_number_integer()) {
                outConfig.transcription.threads = std::max(1, t["threads"].get<int>());
            }
        }

        if (j.contains("control") && j["control"].is_object()) {
            const auto& c = j["control"];
            if (c.contains("enabled") && c["enabled"].is_boolean()) {
                outConfig.control.enabled = c["enabled"].get<bool>();
            }
            if (c.contains("endpoint") && c["endpoint"].is_string()) {
                outConfig.control.endpoint = c["endpoint"].get<std::string>();
            }
            if (outConfig.control.endpoint.empty()) {
                outConfig.control.endpoint = ScribeConstants::ZEROMQ_IPC_PATH;
            }
        }

        if (verbose) {
            std::cout << "Config: Loaded from " << std::filesystem::absolute(configPath) << '\n';
        }
        return true;
    } catch (const std::exception& e) {
        if (verbose) {
            LOG_ERROR("Config: Failed to parse {}: {}", configPath.string(), e.what());
        }
        outConfig = AppConfig{};
        return false;
    }
}
