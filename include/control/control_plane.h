#pragma once

#include "control/zmq_server.h"
#include "session/transcription_session.h"

#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace control {

struct ControlPlaneDependencies {
    session::TranscriptionSession* session = nullptr;
    std::string endpoint = ScribeConstants::ZEROMQ_IPC_PATH;

    // Capture devices are opened on START and closed on STOP, around the session calls.
    std::function<bool()> startCapture;
    std::function<void()> stopCapture;
};

// JSON shapes shared by replies and PUB events
nlohmann::json segmentToJson(const session::TranscriptSegment& segment);
nlohmann::json segmentsToJson(const std::vector<session::TranscriptSegment>& segments);
nlohmann::json statsToJson(const session::SessionStats& stats);
nlohmann::json segmentEvent(const session::TranscriptSegment& segment);
nlohmann::json statusEvent(const session::StatusEvent& event);

struct EventSink;

class ControlPlane {
   public:
    explicit ControlPlane(ControlPlaneDependencies deps);
    ~ControlPlane();

    ControlPlane(const ControlPlane&) = delete;
    ControlPlane& operator=(const ControlPlane&) = delete;

    bool start();
    void stop();

    // Command handlers; the server thread calls these, tests may call them directly.
    CommandReply handlePing(const ZmqRequest& request);
    CommandReply handleStart(const ZmqRequest& request);
    CommandReply handleStop(const ZmqRequest& request);
    CommandReply handleStatus(const ZmqRequest& request);

   private:
    void registerHandlers();
    void subscribeSessionEvents();

    ControlPlaneDependencies deps_;
    std::unique_ptr<ZmqCommandServer> zmqServer_;
    std::shared_ptr<EventSink> sink_;
    bool subscribed_ = false;
};

}  // namespace control
