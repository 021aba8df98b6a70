/**
 * @file test_control_plane.cpp
 * @brief START/STOP/STATUS handlers and PUB event forwarding
 */

#include "control/control_plane.h"
#include "support/fake_backend.h"

#include <atomic>
#include <chrono>
#include <cmath>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <unistd.h>
#include <zmq.hpp>

using control::ControlPlane;
using control::ControlPlaneDependencies;
using control::ZmqCommandServer;
using session::TranscriptionSession;
using AudioUtils::AudioSourceTag;
using json = nlohmann::json;

namespace {

std::vector<float> tone(double seconds) {
    const size_t n = static_cast<size_t>(seconds * 16000);
    std::vector<float> out(n);
    for (size_t i = 0; i < n; ++i) {
        out[i] = 0.5f * static_cast<float>(std::sin(2.0 * 3.14159265358979 * 440.0 * i / 16000));
    }
    return out;
}

std::string make_ipc_endpoint() {
    static std::atomic<int> counter{0};
    std::ostringstream oss;
    oss << "ipc:///tmp/live_scribe_control_test_" << ::getpid() << "_" << counter++ << ".sock";
    return oss.str();
}

class ControlPlaneTest : public ::testing::Test {
   protected:
    void SetUp() override {
        state_ = std::make_shared<test_support::FakeBackendState>();
        auto state = state_;
        session_ = std::make_unique<TranscriptionSession>(
            AppConfig::SessionConfig{}, [state](std::optional<AudioSourceTag>) {
                return std::make_unique<test_support::FakeTranscriptionBackend>(state);
            });
    }

    ControlPlaneDependencies deps() {
        ControlPlaneDependencies d;
        d.session = session_.get();
        d.endpoint = make_ipc_endpoint();
        return d;
    }

    static json call(control::CommandReply (ControlPlane::*handler)(const control::ZmqRequest&),
                     ControlPlane& plane, const std::string& cmd) {
        json req;
        req["cmd"] = cmd;
        auto request = ZmqCommandServer::buildRequest(req.dump());
        return json::parse(ZmqCommandServer::renderReply(request, (plane.*handler)(request)));
    }

    std::shared_ptr<test_support::FakeBackendState> state_;
    std::unique_ptr<TranscriptionSession> session_;
};

}  // namespace

TEST(ControlPlaneJson, SegmentJsonCarriesSourceAndSpeaker) {
    session::TranscriptSegment seg;
    seg.text = "hello";
    seg.startTime = 65.0;
    seg.endTime = 70.0;
    seg.source = AudioSourceTag::SystemAudio;
    seg.speakerLabel = std::string("Alice");

    auto j = control::segmentEvent(seg);
    EXPECT_EQ(j["event"], "segment");
    EXPECT_EQ(j["text"], "hello");
    EXPECT_EQ(j["timestamp"], "01:05");
    EXPECT_EQ(j["source"], "system");
    EXPECT_EQ(j["speaker"], "Alice");

    seg.source.reset();
    seg.speakerLabel.reset();
    auto mixed = control::segmentToJson(seg);
    EXPECT_EQ(mixed["source"], "mixed");
    EXPECT_FALSE(mixed.contains("speaker"));
}

TEST_F(ControlPlaneTest, PingReplies) {
    ControlPlane plane(deps());
    auto resp = call(&ControlPlane::handlePing, plane, "PING");
    EXPECT_EQ(resp["message"], "pong");
}

TEST_F(ControlPlaneTest, StartStopProducesTranscript) {
    ControlPlane plane(deps());

    auto started = call(&ControlPlane::handleStart, plane, "START");
    EXPECT_EQ(started["status"], "ok");
    EXPECT_EQ(started["data"]["state"], "recording");
    EXPECT_EQ(session_->state(), session::SessionState::Recording);

    auto again = call(&ControlPlane::handleStart, plane, "START");
    EXPECT_EQ(again["message"], "Already recording");

    ASSERT_TRUE(session_->feed(AudioSourceTag::Microphone, tone(7.0)));

    auto stopped = call(&ControlPlane::handleStop, plane, "STOP");
    EXPECT_EQ(stopped["status"], "ok");
    EXPECT_EQ(stopped["message"], "Transcription complete");
    EXPECT_EQ(stopped["data"]["state"], "idle");
    ASSERT_EQ(stopped["data"]["segments"].size(), 2u);
    EXPECT_EQ(stopped["data"]["segments"][0]["start"], 0.0);
    EXPECT_EQ(stopped["data"]["segments"][1]["start"], 4.0);
    EXPECT_EQ(stopped["data"]["transcript"], "segment 1 segment 2");
    EXPECT_EQ(stopped["data"]["timestamped"], "[00:00] segment 1\n[00:04] segment 2");

    auto idleStop = call(&ControlPlane::handleStop, plane, "STOP");
    EXPECT_EQ(idleStop["message"], "Not recording");
}

TEST_F(ControlPlaneTest, StatusReportsStateAndStats) {
    ControlPlane plane(deps());
    call(&ControlPlane::handleStart, plane, "START");
    session_->feed(AudioSourceTag::Microphone, tone(1.0));

    auto status = call(&ControlPlane::handleStatus, plane, "STATUS");
    EXPECT_EQ(status["data"]["state"], "recording");
    EXPECT_EQ(status["data"]["last_status"], "Recording");
    EXPECT_EQ(status["data"]["segment_count"], 0);
    EXPECT_TRUE(status["data"]["stats"].contains("buffers_accepted"));

    call(&ControlPlane::handleStop, plane, "STOP");
}

TEST_F(ControlPlaneTest, CaptureFailureStopsSession) {
    auto d = deps();
    bool stopCalled = false;
    d.startCapture = []() { return false; };
    d.stopCapture = [&stopCalled]() { stopCalled = true; };
    ControlPlane plane(d);

    auto resp = call(&ControlPlane::handleStart, plane, "START");
    EXPECT_EQ(resp["status"], "error");
    EXPECT_EQ(resp["error_code"], "AUDIO_DEVICE_OPEN_FAILED");
    EXPECT_EQ(session_->state(), session::SessionState::Idle);
    EXPECT_FALSE(stopCalled);
}

TEST_F(ControlPlaneTest, CaptureHooksWrapSession) {
    auto d = deps();
    int starts = 0;
    int stops = 0;
    d.startCapture = [&starts]() {
        ++starts;
        return true;
    };
    d.stopCapture = [&stops]() { ++stops; };
    ControlPlane plane(d);

    call(&ControlPlane::handleStart, plane, "START");
    call(&ControlPlane::handleStop, plane, "STOP");
    EXPECT_EQ(starts, 1);
    EXPECT_EQ(stops, 1);
}

TEST_F(ControlPlaneTest, StopAfterPipelineAbortClosesCapture) {
    session_->setWindowObserver([](const AudioUtils::AudioWindow&) {
        throw std::runtime_error("out of memory");
    });
    auto d = deps();
    int stops = 0;
    d.startCapture = []() { return true; };
    d.stopCapture = [&stops]() { ++stops; };
    ControlPlane plane(d);

    call(&ControlPlane::handleStart, plane, "START");
    ASSERT_TRUE(session_->feed(AudioSourceTag::Microphone, tone(7.0)));
    ASSERT_TRUE(test_support::waitFor(
        [this]() { return session_->state() == session::SessionState::Idle; }));

    auto status = call(&ControlPlane::handleStatus, plane, "STATUS");
    EXPECT_EQ(status["data"]["last_status"], "Session aborted: out of memory");
    EXPECT_EQ(status["data"]["stats"]["aborted"], true);

    auto stopped = call(&ControlPlane::handleStop, plane, "STOP");
    EXPECT_EQ(stopped["status"], "ok");
    EXPECT_EQ(stopped["message"], "Not recording");
    EXPECT_EQ(stops, 1);
}

TEST(ControlPlaneNoSession, HandlersReportDaemonNotRunning) {
    ControlPlaneDependencies d;
    d.endpoint = make_ipc_endpoint();
    ControlPlane plane(d);

    auto req = ZmqCommandServer::buildRequest(R"({"cmd":"STATUS"})");
    auto resp = json::parse(ZmqCommandServer::renderReply(req, plane.handleStatus(req)));
    EXPECT_EQ(resp["error_code"], "IPC_DAEMON_NOT_RUNNING");

    auto start = plane.handleStart(ZmqCommandServer::buildRequest("START"));
    EXPECT_FALSE(start.ok());
    EXPECT_EQ(start.message, "No session available");
}

TEST_F(ControlPlaneTest, ForwardsSessionEventsOverZeroMq) {
    auto d = deps();
    const std::string endpoint = d.endpoint;
    ControlPlane plane(d);
    ASSERT_TRUE(plane.start());

    zmq::context_t ctx(1);
    zmq::socket_t sub(ctx, zmq::socket_type::sub);
    sub.set(zmq::sockopt::subscribe, "");
    sub.set(zmq::sockopt::rcvtimeo, 500);
    sub.connect(ZmqCommandServer::derivePubEndpoint(endpoint));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    zmq::socket_t req(ctx, zmq::socket_type::req);
    req.set(zmq::sockopt::rcvtimeo, 5000);
    req.connect(endpoint);

    auto roundTrip = [&req](const std::string& cmd) {
        req.send(zmq::buffer(cmd), zmq::send_flags::none);
        zmq::message_t reply;
        auto result = req.recv(reply, zmq::recv_flags::none);
        return result ? std::string(static_cast<char*>(reply.data()), reply.size())
                      : std::string();
    };

    EXPECT_EQ(roundTrip("PING"), "OK:pong");
    EXPECT_EQ(json::parse(roundTrip(R"({"cmd":"START"})"))["status"], "ok");
    ASSERT_TRUE(session_->feed(AudioSourceTag::Microphone, tone(5.0)));
    auto stopped = json::parse(roundTrip(R"({"cmd":"STOP"})"));
    // Full chunk (0, 5) plus the flushed overlap tail (4, 5)
    EXPECT_EQ(stopped["data"]["segments"].size(), 2u);

    std::vector<std::string> segmentTexts;
    bool sawComplete = false;
    zmq::message_t msg;
    while (sub.recv(msg, zmq::recv_flags::none)) {
        auto event = json::parse(std::string(static_cast<char*>(msg.data()), msg.size()));
        if (event["event"] == "segment") {
            segmentTexts.push_back(event["text"].get<std::string>());
        } else if (event["event"] == "status" && event["message"] == "Transcription complete") {
            sawComplete = true;
        }
    }
    ASSERT_EQ(segmentTexts.size(), 2u);
    EXPECT_EQ(segmentTexts[0], "segment 1");
    EXPECT_EQ(segmentTexts[1], "segment 2");
    EXPECT_TRUE(sawComplete);

    plane.stop();
}
