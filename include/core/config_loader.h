#ifndef LIVE_SCRIBE_CONFIG_LOADER_H
#define LIVE_SCRIBE_CONFIG_LOADER_H

#include "audio/audio_format.h"
#include "core/scribe_constants.h"

#include <cstdint>
#include <filesystem>
#include <string>

constexpr const char* DEFAULT_CONFIG_FILE = "config.json";

// How two capture sources are combined into transcripts
enum class DualSourceStrategy {
    Mix,         // Sample-domain blend into one stream (one windower, one transcription queue)
    Independent  // One windower + transcription queue per source, merged by capturedAt on stop
};

struct AppConfig {
    struct SessionConfig {
        double chunkSeconds = ScribeConstants::DEFAULT_CHUNK_SECONDS;
        double overlapSeconds = ScribeConstants::DEFAULT_OVERLAP_SECONDS;
        float silenceThreshold = ScribeConstants::DEFAULT_SILENCE_THRESHOLD;
        double silenceSeconds = ScribeConstants::DEFAULT_SILENCE_SECONDS;

        // Source accepted when dualSource is false
        AudioUtils::AudioSourceTag singleSource = AudioUtils::AudioSourceTag::Microphone;
        bool dualSource = false;
        DualSourceStrategy dualSourceStrategy = DualSourceStrategy::Mix;
        double mixBlockSeconds = ScribeConstants::DEFAULT_MIX_BLOCK_SECONDS;
        double maxLagSeconds = ScribeConstants::DEFAULT_MAX_LAG_SECONDS;
        float systemWeight = ScribeConstants::DEFAULT_SYSTEM_WEIGHT;
        float microphoneWeight = ScribeConstants::DEFAULT_MICROPHONE_WEIGHT;
    } session;

    struct CaptureConfig {
        std::string microphoneDevice = "default";
        std::string systemDevice = "hw:Loopback,1,0";
        uint32_t sampleRate = 48000;
        uint8_t channels = 2;
        std::string format = "S16_LE";  // Supported: S16_LE, S24_3LE, S32_LE
        uint32_t periodFrames = 1024;
        double maxQueuedSeconds = ScribeConstants::DEFAULT_MAX_QUEUED_SECONDS;
    } capture;

    struct TranscriptionConfig {
        std::string backend = "whisper";  // "whisper" or "none"
        std::string modelPath = "models/ggml-base.bin";
        std::string language = "en";
        int threads = 4;
    } transcription;

    struct ControlConfig {
        bool enabled = true;
        std::string endpoint = ScribeConstants::ZEROMQ_IPC_PATH;
    } control;
};

// Convert string to DualSourceStrategy (returns Mix for invalid input)
DualSourceStrategy parseDualSourceStrategy(const std::string& str);

const char* dualSourceStrategyToString(DualSourceStrategy strategy);

// Range checks shared by the loader and by callers that build configs in code.
// Invalid values are logged when verbose.
bool validateSessionConfig(const AppConfig::SessionConfig& cfg, bool verbose = true);
bool validateCaptureConfig(const AppConfig::CaptureConfig& cfg, bool verbose = true);

// Loads configPath into outConfig. outConfig is reset to defaults first; returns false when
// the file is missing or unparsable (outConfig then keeps the defaults).
bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig,
                   bool verbose = true);

#endif  // LIVE_SCRIBE_CONFIG_LOADER_H
