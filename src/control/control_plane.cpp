#include "control/control_plane.h"

#include "core/error_codes.h"
#include "logging/logger.h"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <utility>

namespace control {
namespace {

int64_t toEpochMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

nlohmann::json stateData(const session::TranscriptionSession& target) {
    return {{"state", session::sessionStateToString(target.state())}};
}

}  // namespace

// Shared with session event handlers, which can outlive the ControlPlane.
// stop() detaches the server.
struct EventSink {
    std::mutex mutex;
    ZmqCommandServer* server = nullptr;

    void send(const nlohmann::json& payload) {
        std::lock_guard<std::mutex> lock(mutex);
        if (server) {
            server->publish(payload);
        }
    }
};

nlohmann::json segmentToJson(const session::TranscriptSegment& segment) {
    nlohmann::json j;
    j["text"] = segment.text;
    j["start"] = segment.startTime;
    j["end"] = segment.endTime;
    j["timestamp"] = session::formatTimestamp(segment.startTime);
    j["captured_at_ms"] = toEpochMillis(segment.capturedAt);
    j["source"] = segment.source ? nlohmann::json(AudioUtils::sourceTagToString(*segment.source))
                                 : nlohmann::json("mixed");
    if (segment.speakerLabel) {
        j["speaker"] = *segment.speakerLabel;
    }
    return j;
}

nlohmann::json segmentsToJson(const std::vector<session::TranscriptSegment>& segments) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& segment : segments) {
        list.push_back(segmentToJson(segment));
    }
    return list;
}

nlohmann::json statsToJson(const session::SessionStats& stats) {
    return {{"buffers_accepted", stats.buffersAccepted},
            {"buffers_dropped", stats.buffersDropped},
            {"samples_processed", stats.samplesProcessed},
            {"windows_emitted", stats.windowsEmitted},
            {"windows_transcribed", stats.windowsTranscribed},
            {"windows_failed", stats.windowsFailed},
            {"empty_results", stats.emptyResults},
            {"zero_filled_microphone", stats.zeroFilledMicrophone},
            {"zero_filled_system", stats.zeroFilledSystem},
            {"aborted", stats.aborted}};
}

nlohmann::json segmentEvent(const session::TranscriptSegment& segment) {
    nlohmann::json j = segmentToJson(segment);
    j["event"] = "segment";
    return j;
}

nlohmann::json statusEvent(const session::StatusEvent& event) {
    return {{"event", "status"},
            {"message", event.message},
            {"state", session::sessionStateToString(event.state)}};
}

ControlPlane::ControlPlane(ControlPlaneDependencies deps)
    : deps_(std::move(deps)), sink_(std::make_shared<EventSink>()) {}

ControlPlane::~ControlPlane() {
    stop();
}

bool ControlPlane::start() {
    zmqServer_ = std::make_unique<ZmqCommandServer>(deps_.endpoint);
    registerHandlers();

    if (!zmqServer_->start()) {
        zmqServer_.reset();
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(sink_->mutex);
        sink_->server = zmqServer_.get();
    }
    subscribeSessionEvents();
    return true;
}

void ControlPlane::stop() {
    {
        std::lock_guard<std::mutex> lock(sink_->mutex);
        sink_->server = nullptr;
    }
    if (zmqServer_) {
        zmqServer_->stop();
        zmqServer_.reset();
    }
}

void ControlPlane::registerHandlers() {
    zmqServer_->registerCommand("PING", [this](const auto& req) { return handlePing(req); });
    zmqServer_->registerCommand("START", [this](const auto& req) { return handleStart(req); });
    zmqServer_->registerCommand("STOP", [this](const auto& req) { return handleStop(req); });
    zmqServer_->registerCommand("STATUS", [this](const auto& req) { return handleStatus(req); });
}

void ControlPlane::subscribeSessionEvents() {
    if (subscribed_ || !deps_.session) {
        return;
    }
    std::shared_ptr<EventSink> sink = sink_;
    deps_.session->events().subscribe(session::SessionEventDispatcher::SegmentHandler(
        [sink](const session::TranscriptSegment& segment) { sink->send(segmentEvent(segment)); }));
    deps_.session->events().subscribe(session::SessionEventDispatcher::StatusHandler(
        [sink](const session::StatusEvent& event) { sink->send(statusEvent(event)); }));
    subscribed_ = true;
}

CommandReply ControlPlane::handlePing(const ZmqRequest& /*request*/) {
    return CommandReply::success("pong");
}

CommandReply ControlPlane::handleStart(const ZmqRequest& /*request*/) {
    if (!deps_.session) {
        return CommandReply::failure(ScribeErrors::ErrorCode::IPC_DAEMON_NOT_RUNNING,
                                     "No session available");
    }
    auto* sessionPtr = deps_.session;
    if (sessionPtr->state() != session::SessionState::Idle) {
        return CommandReply::success("Already recording", stateData(*sessionPtr));
    }

    if (!sessionPtr->start()) {
        return CommandReply::failure(ScribeErrors::ErrorCode::TRANSCRIPTION_BACKEND_UNAVAILABLE,
                                     "Session failed to start");
    }
    if (deps_.startCapture && !deps_.startCapture()) {
        LOG_ERROR("Control: capture failed to start, stopping session");
        sessionPtr->stop();
        return CommandReply::failure(ScribeErrors::ErrorCode::AUDIO_DEVICE_OPEN_FAILED,
                                     "Capture failed to start");
    }

    LOG_INFO("Control: session started");
    return CommandReply::success("Recording", stateData(*sessionPtr));
}

CommandReply ControlPlane::handleStop(const ZmqRequest& /*request*/) {
    if (!deps_.session) {
        return CommandReply::failure(ScribeErrors::ErrorCode::IPC_DAEMON_NOT_RUNNING,
                                     "No session available");
    }
    auto* sessionPtr = deps_.session;
    if (sessionPtr->state() != session::SessionState::Recording) {
        // An aborted session finalized itself; its devices are still open
        if (sessionPtr->stats().aborted && deps_.stopCapture) {
            deps_.stopCapture();
        }
        return CommandReply::success("Not recording", stateData(*sessionPtr));
    }

    if (deps_.stopCapture) {
        deps_.stopCapture();
    }
    std::vector<session::TranscriptSegment> segments = sessionPtr->stop();
    LOG_INFO("Control: session stopped with {} segments", segments.size());

    nlohmann::json data;
    data["state"] = session::sessionStateToString(sessionPtr->state());
    data["segments"] = segmentsToJson(segments);
    data["transcript"] = session::fullTranscript(segments);
    data["timestamped"] = session::timestampedTranscript(segments);
    return CommandReply::success(session::status::kComplete, data);
}

CommandReply ControlPlane::handleStatus(const ZmqRequest& /*request*/) {
    if (!deps_.session) {
        return CommandReply::failure(ScribeErrors::ErrorCode::IPC_DAEMON_NOT_RUNNING,
                                     "No session available");
    }
    const auto* sessionPtr = deps_.session;

    nlohmann::json data;
    data["state"] = session::sessionStateToString(sessionPtr->state());
    data["last_status"] = sessionPtr->lastStatus();
    data["segment_count"] = sessionPtr->segments().size();
    data["stats"] = statsToJson(sessionPtr->stats());
    return CommandReply::success("", data);
}

}  // namespace control
