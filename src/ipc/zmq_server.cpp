#include "ipc/zmq_server.h"

#include "core/error_codes.h"
#include "logging/logger.h"

#include <cstdio>
#include <nlohmann/json.hpp>
#include <zmq.hpp>

namespace camilla_remote::ipc {
namespace {

constexpr const char* kJsonErrorStatus = "error";
constexpr const char* kShutdownMessage = "SHUTDOWN";

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.rfind(prefix, 0) == 0;
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

        pubSocket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);
        pubSocket_->set(zmq::sockopt::linger, 0);
        cleanupIpcPath(pubEndpoint_);
        pubSocket_->bind(pubEndpoint_);

        running_.store(true);
        bindFailed_.store(false);
        serverThread_ = std::thread(&ZmqCommandServer::serverLoop, this);

        LOG_INFO("ZeroMQ: Listening on {}", endpoint_);
        LOG_INFO("ZeroMQ: PUB socket on {}", pubEndpoint_);
        return true;
    } catch (const zmq::error_t& e) {
        LOG_ERROR("ZeroMQ: Fatal error binding {} [{}]: {}", endpoint_,
                  errorCodeToString(ErrorCode::IPC_BIND_FAILED), e.what());
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

    // Wake the server thread out of recv()
    try {
        zmq::context_t tempCtx{1};
        zmq::socket_t tempSocket{tempCtx, zmq::socket_type::req};
        tempSocket.set(zmq::sockopt::linger, 0);
        tempSocket.connect(endpoint_);
        tempSocket.send(zmq::buffer(std::string(kShutdownMessage)), zmq::send_flags::dontwait);
    } catch (const zmq::error_t& e) {
        LOG_DEBUG("ZeroMQ: shutdown wakeup not delivered ({}), waiting for recv timeout",
                  e.what());
    }

    if (serverThread_.joinable()) {
        serverThread_.join();
    }

    cleanupSockets();
    cleanupIpcPath(endpoint_);
    cleanupIpcPath(pubEndpoint_);
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
        LOG_WARN("ZeroMQ: PUB send failed: {}", e.what());
        return false;
    }
}

ZmqRequest ZmqCommandServer::buildRequest(const std::string& raw) {
    ZmqRequest request;
    request.raw = raw;

    if (raw.empty()) {
        return request;
    }

    if (raw.front() == '{') {
        request.isJson = true;
        try {
            request.json = nlohmann::json::parse(raw);
            if (request.json->contains("cmd") && (*request.json)["cmd"].is_string()) {
                request.command = (*request.json)["cmd"].get<std::string>();
            }
        } catch (const nlohmann::json::exception& e) {
            request.parseError = e.what();
        }
        return request;
    }

    auto colonPos = raw.find(':');
    if (colonPos != std::string::npos) {
        request.command = raw.substr(0, colonPos);
        request.payload = raw.substr(colonPos + 1);
    } else {
        request.command = raw;
    }

    auto trimNull = [](std::string& value) {
        auto pos = value.find('\0');
        if (pos != std::string::npos) {
            value.erase(pos);
        }
    };
    trimNull(request.command);
    trimNull(request.payload);

    return request;
}

std::string ZmqCommandServer::dispatchRequest(const ZmqRequest& request) {
    if (!request.parseError.empty()) {
        return buildErrorResponse(request, errorCodeToString(ErrorCode::IPC_PROTOCOL_ERROR),
                                  "JSON parse error: " + request.parseError);
    }

    auto it = handlers_.find(request.command);
    if (it == handlers_.end()) {
        std::string message = request.command.empty() ? "Unknown command" : request.command;
        return buildErrorResponse(request, errorCodeToString(ErrorCode::IPC_INVALID_COMMAND),
                                  "Unknown command: " + message);
    }

    try {
        return it->second(request);
    } catch (const RemoteError& e) {
        return buildErrorResponse(request, errorCodeToString(e.code()), e.what());
    } catch (const std::exception& e) {
        return buildErrorResponse(request, errorCodeToString(ErrorCode::IPC_PROTOCOL_ERROR),
                                  std::string("Handler exception: ") + e.what());
    }
}

std::string ZmqCommandServer::buildErrorResponse(const ZmqRequest& request,
                                                 const std::string& code,
                                                 const std::string& message) {
    if (request.isJson) {
        nlohmann::json resp;
        resp["status"] = kJsonErrorStatus;
        resp["error_code"] = code;
        resp["message"] = message;
        return resp.dump();
    }
    return "ERR:" + message;
}

void ZmqCommandServer::serverLoop() {
    while (running_.load()) {
        try {
            zmq::message_t request;
            auto recvResult = repSocket_->recv(request, zmq::recv_flags::none);

            if (!recvResult) {
                continue;
            }

            std::string raw(static_cast<char*>(request.data()), request.size());
            if (raw == kShutdownMessage) {
                repSocket_->send(zmq::buffer(std::string("OK")), zmq::send_flags::dontwait);
                continue;
            }

            std::string response = dispatchRequest(buildRequest(raw));
            repSocket_->send(zmq::buffer(response), zmq::send_flags::none);
        } catch (const zmq::error_t& e) {
            if (running_.load()) {
                LOG_ERROR("ZeroMQ: Listener error - {}", e.what());
            }
        }
    }
}

void ZmqCommandServer::cleanupSockets() {
    std::lock_guard<std::mutex> lock(pubMutex_);
    try {
        if (repSocket_) {
            repSocket_->close();
        }
        if (pubSocket_) {
            pubSocket_->close();
        }
    } catch (const zmq::error_t& e) {
        LOG_WARN("ZeroMQ: socket close failed: {}", e.what());
    }
    repSocket_.reset();
    pubSocket_.reset();
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
            const std::string portText = endpoint.substr(colonPos + 1);
            if (!portText.empty() &&
                portText.find_first_not_of("0123456789") == std::string::npos) {
                int port = std::stoi(portText);
                return endpoint.substr(0, colonPos + 1) + std::to_string(port + 1);
            }
        }
    }

    return endpoint + RemoteConstants::ZEROMQ_PUB_SUFFIX;
}

}  // namespace camilla_remote::ipc
