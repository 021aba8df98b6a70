#include "control/zmq_server.h"

#include "core/error_codes.h"
#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <nlohmann/json.hpp>
#include <utility>
#include <zmq.hpp>

namespace control {
namespace {

constexpr const char* kShutdownToken = "SHUTDOWN";

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.rfind(prefix, 0) == 0;
}

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

}  // namespace

ZmqCommandServer::ZmqCommandServer(std::string endpoint, int recvTimeoutMs)
    : endpoint_(std::move(endpoint)),
      pubEndpoint_(derivePubEndpoint(endpoint_)),
      recvTimeoutMs_(recvTimeoutMs) {}

ZmqCommandServer::~ZmqCommandServer() {
    stop();
}

void ZmqCommandServer::registerCommand(const std::string& command, Handler handler) {
    handlers_[command] = std::move(handler);
}

bool ZmqCommandServer::start() {
    if (running_.load()) {
        return true;
    }

    try {
        context_ = std::make_unique<zmq::context_t>(1);
        repSocket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
        repSocket_->set(zmq::sockopt::rcvtimeo, recvTimeoutMs_);
        repSocket_->set(zmq::sockopt::linger, 0);

        cleanupIpcPath(endpoint_);
        repSocket_->bind(endpoint_);

        {
            std::lock_guard<std::mutex> lock(pubMutex_);
            pubSocket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);
            pubSocket_->set(zmq::sockopt::linger, 0);
            cleanupIpcPath(pubEndpoint_);
            pubSocket_->bind(pubEndpoint_);
        }

        running_.store(true);
        bindFailed_.store(false);
        serverThread_ = std::thread(&ZmqCommandServer::serverLoop, this);

        LOG_INFO("ZeroMQ: Listening on {}", endpoint_);
        LOG_INFO("ZeroMQ: PUB socket on {}", pubEndpoint_);
        return true;
    } catch (const zmq::error_t& e) {
        LOG_ERROR("ZeroMQ: Fatal error - {} ({})", e.what(),
                  ScribeErrors::errorCodeToString(
                      ScribeErrors::ErrorCode::IPC_CONNECTION_FAILED));
        bindFailed_.store(true);
        running_.store(false);
        cleanupSockets();
        return false;
    }
}

void ZmqCommandServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    // Wake the REP loop if it is blocked in recv
    try {
        zmq::context_t tempCtx{1};
        zmq::socket_t tempSocket{tempCtx, zmq::socket_type::req};
        tempSocket.set(zmq::sockopt::linger, 0);
        tempSocket.connect(endpoint_);
        tempSocket.send(zmq::buffer(std::string(kShutdownToken)), zmq::send_flags::dontwait);
    } catch (const zmq::error_t& e) {
        LOG_DEBUG("ZeroMQ: shutdown wake-up failed: {}", e.what());
    }

    if (serverThread_.joinable()) {
        serverThread_.join();
    }

    cleanupSockets();
    cleanupIpcPath(endpoint_);
    cleanupIpcPath(pubEndpoint_);
}

bool ZmqCommandServer::publish(const nlohmann::json& event) {
    return publish(serialize(event));
}

bool ZmqCommandServer::publish(const std::string& message) {
    std::lock_guard<std::mutex> lock(pubMutex_);
    if (!pubSocket_) {
        return false;
    }

    try {
        pubSocket_->send(zmq::buffer(message), zmq::send_flags::dontwait);
        return true;
    } catch (const zmq::error_t& e) {
        LOG_EVERY_N(WARN, 100, "ZeroMQ: PUB send failed: {}", e.what());
        return false;
    }
}

ZmqRequest ZmqCommandServer::buildRequest(const std::string& raw) {
    ZmqRequest request;
    request.raw = raw;

    // C clients often send the terminating NUL; shell clients a trailing newline
    std::string text = raw.substr(0, raw.find('\0'));
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.pop_back();
    }
    if (text.empty()) {
        return request;
    }

    if (text.front() == '{') {
        request.isJson = true;
        try {
            request.json = nlohmann::json::parse(text);
            auto cmd = request.json->find("cmd");
            if (cmd != request.json->end() && cmd->is_string()) {
                request.command = toUpper(cmd->get<std::string>());
            }
        } catch (const nlohmann::json::exception& e) {
            request.parseError = e.what();
        }
        return request;
    }

    const auto colonPos = text.find(':');
    request.command = toUpper(text.substr(0, colonPos));
    if (colonPos != std::string::npos) {
        request.payload = text.substr(colonPos + 1);
    }
    return request;
}

CommandReply ZmqCommandServer::dispatch(const ZmqRequest& request) {
    using ScribeErrors::ErrorCode;

    if (!request.parseError.empty()) {
        LOG_WARN("ZeroMQ: Malformed JSON request ({})", request.parseError);
        return CommandReply::failure(ErrorCode::IPC_PROTOCOL_ERROR,
                                     "JSON parse error: " + request.parseError);
    }

    auto it = handlers_.find(request.command);
    if (it == handlers_.end()) {
        LOG_DEBUG("ZeroMQ: Unknown command '{}'", request.command);
        return CommandReply::failure(
            ErrorCode::IPC_INVALID_COMMAND,
            "Unknown command: " + (request.command.empty() ? std::string("<empty>")
                                                           : request.command));
    }

    LOG_DEBUG("ZeroMQ: {} ({})", request.command, request.isJson ? "json" : "text");
    CommandReply reply;
    try {
        reply = it->second(request);
    } catch (const std::exception& e) {
        LOG_ERROR("ZeroMQ: {} handler threw: {}", request.command, e.what());
        return CommandReply::failure(ErrorCode::IPC_PROTOCOL_ERROR,
                                     std::string("Handler exception: ") + e.what());
    }
    if (!reply.ok()) {
        LOG_WARN("ZeroMQ: {} rejected: {} ({})", request.command, reply.message,
                 ScribeErrors::errorCodeToString(reply.code));
    }
    return reply;
}

std::string ZmqCommandServer::renderReply(const ZmqRequest& request, const CommandReply& reply) {
    const bool hasData = !reply.data.is_null() && !reply.data.empty();

    if (!request.isJson) {
        if (!reply.ok()) {
            return "ERR:" + reply.message;
        }
        if (hasData) {
            return "OK:" + serialize(reply.data);
        }
        return reply.message.empty() ? std::string("OK") : "OK:" + reply.message;
    }

    nlohmann::json resp;
    if (reply.ok()) {
        resp["status"] = "ok";
        if (!reply.message.empty()) {
            resp["message"] = reply.message;
        }
        if (hasData) {
            resp["data"] = reply.data;
        }
    } else {
        resp["status"] = "error";
        resp["error_code"] = ScribeErrors::errorCodeToString(reply.code);
        resp["error_hex"] = ScribeErrors::errorCodeToHex(reply.code);
        resp["message"] = reply.message;
    }
    return serialize(resp);
}

std::string ZmqCommandServer::serialize(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void ZmqCommandServer::serverLoop() {
    while (running_.load()) {
        try {
            zmq::message_t message;
            if (!repSocket_->recv(message, zmq::recv_flags::none)) {
                continue;  // rcvtimeo elapsed; re-check running_
            }

            const std::string raw = message.to_string();
            if (raw == kShutdownToken) {
                repSocket_->send(zmq::str_buffer("OK"), zmq::send_flags::dontwait);
                continue;
            }

            const ZmqRequest request = buildRequest(raw);
            const std::string response = renderReply(request, dispatch(request));
            repSocket_->send(zmq::buffer(response), zmq::send_flags::none);
            requestsHandled_.fetch_add(1);
        } catch (const zmq::error_t& e) {
            if (running_.load()) {
                LOG_ERROR("ZeroMQ: Listener error - {} ({})", e.what(),
                          ScribeErrors::errorCodeToString(
                              ScribeErrors::ErrorCode::IPC_CONNECTION_FAILED));
            }
        }
    }
    LOG_DEBUG("ZeroMQ: Listener exiting after {} request(s)", requestsHandled_.load());
}

void ZmqCommandServer::cleanupSockets() {
    repSocket_.reset();
    {
        std::lock_guard<std::mutex> lock(pubMutex_);
        pubSocket_.reset();
    }
    context_.reset();
}

void ZmqCommandServer::cleanupIpcPath(const std::string& endpoint) const {
    if (!startsWith(endpoint, "ipc://")) {
        return;
    }
    std::string path = endpoint.substr(6);
    if (path.empty()) {
        return;
    }
    std::remove(path.c_str());
}

std::string ZmqCommandServer::derivePubEndpoint(const std::string& endpoint) {
    if (startsWith(endpoint, "tcp://")) {
        auto colonPos = endpoint.rfind(':');
        if (colonPos != std::string::npos && colonPos > 5) {
            try {
                int port = std::stoi(endpoint.substr(colonPos + 1));
                return endpoint.substr(0, colonPos + 1) + std::to_string(port + 1);
            } catch (const std::exception& e) {
                LOG_WARN("ZeroMQ: cannot parse port in {}: {}", endpoint, e.what());
            }
        }
    }

    return endpoint + ScribeConstants::ZEROMQ_PUB_SUFFIX;
}

}  // namespace control
