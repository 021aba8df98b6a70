#pragma once

#include "core/error_codes.h"
#include "core/scribe_constants.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <utility>

namespace zmq {
class context_t;
class socket_t;
}  // namespace zmq

namespace control {

struct ZmqRequest {
    std::string raw;
    std::optional<nlohmann::json> json;
    std::string command;
    std::string payload;
    bool isJson = false;
    std::string parseError;
};

// Outcome of a command handler. The server renders it in the request's dialect.
struct CommandReply {
    ScribeErrors::ErrorCode code = ScribeErrors::ErrorCode::OK;
    std::string message;
    nlohmann::json data;

    bool ok() const {
        return code == ScribeErrors::ErrorCode::OK;
    }

    static CommandReply success(std::string message = "", nlohmann::json data = {}) {
        return {ScribeErrors::ErrorCode::OK, std::move(message), std::move(data)};
    }
    static CommandReply failure(ScribeErrors::ErrorCode code, std::string message) {
        return {code, std::move(message), {}};
    }
};

/**
 * @brief Command and event endpoint of the transcription daemon
 *
 * REP socket for commands plus a PUB socket for session events. The PUB
 * endpoint is derived from the REP endpoint: "<ipc path>.pub", or port + 1
 * for tcp.
 *
 * Requests are JSON ({"cmd": "STATUS", ...}) or plain "CMD[:payload]";
 * command names are matched case-insensitively. Replies follow the request:
 *   JSON: {"status":"ok","message","data"} or
 *         {"status":"error","error_code","error_hex","message"}
 *   text: "OK", "OK:<message>", "OK:<data json>" or "ERR:<message>"
 */
class ZmqCommandServer {
   public:
    using Handler = std::function<CommandReply(const ZmqRequest&)>;

    explicit ZmqCommandServer(std::string endpoint = ScribeConstants::ZEROMQ_IPC_PATH,
                              int recvTimeoutMs = 1000);
    ~ZmqCommandServer();

    ZmqCommandServer(const ZmqCommandServer&) = delete;
    ZmqCommandServer& operator=(const ZmqCommandServer&) = delete;

    // Register before start(); the table is read without locking by the server thread.
    void registerCommand(const std::string& command, Handler handler);

    bool start();
    void stop();
    bool isRunning() const {
        return running_.load();
    }
    bool hasBindError() const {
        return bindFailed_.load();
    }
    uint64_t requestsHandled() const {
        return requestsHandled_.load();
    }

    bool publish(const nlohmann::json& event);
    bool publish(const std::string& message);

    const std::string& endpoint() const {
        return endpoint_;
    }
    const std::string& pubEndpoint() const {
        return pubEndpoint_;
    }

    static std::string derivePubEndpoint(const std::string& endpoint);
    static ZmqRequest buildRequest(const std::string& raw);
    static std::string renderReply(const ZmqRequest& request, const CommandReply& reply);

    // Compact dump; invalid UTF-8 in strings is replaced with U+FFFD instead of throwing
    static std::string serialize(const nlohmann::json& value);

   private:
    CommandReply dispatch(const ZmqRequest& request);
    void serverLoop();
    void cleanupSockets();
    void cleanupIpcPath(const std::string& endpoint) const;

    std::string endpoint_;
    std::string pubEndpoint_;
    int recvTimeoutMs_;
    std::unique_ptr<zmq::context_t> context_;
    std::unique_ptr<zmq::socket_t> repSocket_;
    std::unique_ptr<zmq::socket_t> pubSocket_;
    std::thread serverThread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> bindFailed_{false};
    std::atomic<uint64_t> requestsHandled_{0};
    std::map<std::string, Handler> handlers_;
    mutable std::mutex pubMutex_;
};

}  // namespace control
