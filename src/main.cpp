#include "capture/alsa_capture_source.h"
#include "capture/wav_file_source.h"
#include "control/control_plane.h"
#include "core/config_loader.h"
#include "logging/logger.h"
#include "session/transcription_session.h"
#include "transcription/transcription_backend.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int) {
    g_running.store(false);
}

// Files are pushed faster than real time, so the capture queue must hold a whole file
constexpr double kFileQueueSeconds = 24.0 * 3600.0;

struct Args {
    std::string configPath = DEFAULT_CONFIG_FILE;
    std::string microphoneFile;
    std::string systemFile;
    std::string modelPath;
    std::string logLevel;
    bool realtime = false;
};

void printUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  --config <path>       Config file (default: " << DEFAULT_CONFIG_FILE << ")\n"
              << "  --file <wav>          Transcribe a recording as the microphone source\n"
              << "  --system-file <wav>   Transcribe a recording as the system audio source\n"
              << "  --realtime            Pace file playback at real-time speed\n"
              << "  --model <path>        Whisper model path (overrides config)\n"
              << "  --log-level <level>   trace, debug, info, warn, error, critical\n"
              << "  --help                Show this help message\n"
              << "\n"
              << "Without --file/--system-file, captures from the configured ALSA devices.\n"
              << "With the control plane enabled, START/STOP arrive over ZeroMQ; otherwise\n"
              << "recording runs until SIGINT.\n";
}

bool parseArgs(int argc, char** argv, Args& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.configPath = argv[++i];
        } else if (arg == "--file" && i + 1 < argc) {
            args.microphoneFile = argv[++i];
        } else if (arg == "--system-file" && i + 1 < argc) {
            args.systemFile = argv[++i];
        } else if (arg == "--model" && i + 1 < argc) {
            args.modelPath = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.logLevel = argv[++i];
        } else if (arg == "--realtime") {
            args.realtime = true;
        } else if (arg == "--help" || arg == "-h") {
            return false;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return false;
        }
    }
    return true;
}

session::TranscriptionSession::BackendFactory makeBackendFactory(
    const AppConfig::TranscriptionConfig& config) {
    return [config](std::optional<AudioUtils::AudioSourceTag> stream) {
        LOG_INFO("Creating {} backend for {} stream", config.backend,
                 stream ? AudioUtils::sourceTagToString(*stream) : "mixed");
        return transcription::createTranscriptionBackend(config);
    };
}

using SourceList = std::vector<std::unique_ptr<capture::AudioSource>>;

bool startSources(SourceList& sources, session::TranscriptionSession& session) {
    for (auto& source : sources) {
        const auto tag = source->tag();
        bool ok = source->start(
            [&session, tag](const float* interleaved, size_t frames,
                            const AudioUtils::AudioFormat& format) {
                session.feed(tag, interleaved, frames, format);
            });
        if (!ok) {
            LOG_ERROR("Failed to start {} source ({})", source->name(),
                      AudioUtils::sourceTagToString(tag));
            for (auto& started : sources) {
                started->stop();
            }
            return false;
        }
    }
    return true;
}

void stopSources(SourceList& sources) {
    for (auto& source : sources) {
        source->stop();
    }
}

void printTranscript(const std::vector<session::TranscriptSegment>& segments,
                     const session::SessionStats& stats) {
    std::cout << "\n========================================\n";
    std::cout << "Transcript (" << segments.size() << " segments)\n";
    std::cout << "========================================\n";
    std::cout << session::timestampedTranscript(segments) << "\n";
    std::cout << "========================================\n";
    std::cout << "Windows: " << stats.windowsEmitted << " emitted, " << stats.windowsTranscribed
              << " transcribed, " << stats.windowsFailed << " failed, " << stats.emptyResults
              << " empty\n";
    if (stats.buffersDropped > 0 || stats.zeroFilledMicrophone > 0 ||
        stats.zeroFilledSystem > 0) {
        std::cout << "Capture: " << stats.buffersDropped << " buffers dropped, "
                  << stats.zeroFilledMicrophone << " mic / " << stats.zeroFilledSystem
                  << " system samples zero-filled\n";
    }
    if (stats.aborted) {
        std::cout << "Session was aborted\n";
    }
}

int runFiles(const Args& args, AppConfig& config) {
    const bool haveMic = !args.microphoneFile.empty();
    const bool haveSystem = !args.systemFile.empty();
    config.session.dualSource = haveMic && haveSystem;
    if (!config.session.dualSource) {
        config.session.singleSource =
            haveMic ? AudioUtils::AudioSourceTag::Microphone : AudioUtils::AudioSourceTag::SystemAudio;
    }

    session::TranscriptionSession session(config.session, makeBackendFactory(config.transcription),
                                          kFileQueueSeconds);
    session.events().subscribe(session::SessionEventDispatcher::SegmentHandler(
        [](const session::TranscriptSegment& segment) {
            LOG_INFO("[{}] {}", session::formatTimestamp(segment.startTime), segment.text);
        }));

    std::vector<std::unique_ptr<capture::WavFileSource>> files;
    if (haveMic) {
        files.push_back(std::make_unique<capture::WavFileSource>(
            AudioUtils::AudioSourceTag::Microphone, args.microphoneFile, config.capture.periodFrames,
            args.realtime));
    }
    if (haveSystem) {
        files.push_back(std::make_unique<capture::WavFileSource>(
            AudioUtils::AudioSourceTag::SystemAudio, args.systemFile, config.capture.periodFrames,
            args.realtime));
    }

    if (!session.start()) {
        LOG_ERROR("Session failed to start");
        return 1;
    }

    SourceList sources;
    std::vector<capture::WavFileSource*> fileHandles;
    for (auto& file : files) {
        fileHandles.push_back(file.get());
        sources.push_back(std::move(file));
    }
    if (!startSources(sources, session)) {
        session.stop();
        return 1;
    }

    for (auto* file : fileHandles) {
        while (g_running.load() && !file->finished() &&
               session.state() == session::SessionState::Recording) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }
    stopSources(sources);

    // An aborted session has already finalized; its segments stay readable
    session.stop();
    printTranscript(session.segments(), session.stats());
    return 0;
}

SourceList buildDeviceSources(const AppConfig& config) {
    SourceList sources;
    std::vector<AudioUtils::AudioSourceTag> tags;
    if (config.session.dualSource) {
        tags = {AudioUtils::AudioSourceTag::Microphone, AudioUtils::AudioSourceTag::SystemAudio};
    } else {
        tags = {config.session.singleSource};
    }
    for (auto tag : tags) {
        sources.push_back(std::make_unique<capture::AlsaCaptureSource>(
            tag, capture::alsaParamsFromConfig(config.capture, tag)));
    }
    return sources;
}

int runDevices(const AppConfig& config) {
    session::TranscriptionSession session(config.session, makeBackendFactory(config.transcription),
                                          config.capture.maxQueuedSeconds);
    session.events().subscribe(session::SessionEventDispatcher::SegmentHandler(
        [](const session::TranscriptSegment& segment) {
            LOG_INFO("[{}] {}", session::formatTimestamp(segment.startTime), segment.text);
        }));
    session.events().subscribe(session::SessionEventDispatcher::StatusHandler(
        [](const session::StatusEvent& event) { LOG_INFO("Status: {}", event.message); }));

    SourceList sources = buildDeviceSources(config);

    if (config.control.enabled) {
        control::ControlPlaneDependencies deps;
        deps.session = &session;
        deps.endpoint = config.control.endpoint;
        deps.startCapture = [&sources, &session]() { return startSources(sources, session); };
        deps.stopCapture = [&sources]() { stopSources(sources); };

        control::ControlPlane controlPlane(std::move(deps));
        if (!controlPlane.start()) {
            LOG_ERROR("Control plane failed to start on {}", config.control.endpoint);
            return 1;
        }
        LOG_INFO("Waiting for START/STOP on {}", config.control.endpoint);
        while (g_running.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        controlPlane.stop();
        if (session.state() == session::SessionState::Recording || session.stats().aborted) {
            stopSources(sources);
            session.stop();
            printTranscript(session.segments(), session.stats());
        }
        return 0;
    }

    if (!session.start()) {
        LOG_ERROR("Session failed to start");
        return 1;
    }
    if (!startSources(sources, session)) {
        session.stop();
        return 1;
    }
    LOG_INFO("Recording; press Ctrl+C to stop");
    while (g_running.load() && session.state() == session::SessionState::Recording) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    stopSources(sources);
    session.stop();
    printTranscript(session.segments(), session.stats());
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    live_scribe::logging::initializeEarly();

    Args args;
    if (!parseArgs(argc, argv, args)) {
        printUsage(argv[0]);
        return 1;
    }

    live_scribe::logging::initializeFromConfig(args.configPath);
    if (!args.logLevel.empty()) {
        live_scribe::logging::setLevel(live_scribe::logging::stringToLevel(args.logLevel));
    }

    AppConfig config;
    loadAppConfig(args.configPath, config);
    if (!args.modelPath.empty()) {
        config.transcription.modelPath = args.modelPath;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    int rc = 0;
    try {
        if (!args.microphoneFile.empty() || !args.systemFile.empty()) {
            rc = runFiles(args, config);
        } else {
            rc = runDevices(config);
        }
    } catch (const std::exception& e) {
        LOG_CRITICAL("Fatal error: {}", e.what());
        rc = 1;
    }

    live_scribe::logging::shutdown();
    return rc;
}
