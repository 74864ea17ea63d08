#include "control/control_server.h"

#include "core/error_codes.h"
#include "logging/logger.h"

namespace camilla_remote::control {
namespace {

std::string buildOkResponse(const ipc::ZmqRequest& request, const std::string& message = "",
                            const nlohmann::json& data = {}) {
    if (request.isJson) {
        nlohmann::json resp;
        resp["status"] = "ok";
        if (!message.empty()) {
            resp["message"] = message;
        }
        if (!data.is_null() && !data.empty()) {
            resp["data"] = data;
        }
        return resp.dump();
    }

    if (!data.is_null() && !data.empty()) {
        return "OK:" + data.dump();
    }
    if (!message.empty()) {
        return "OK:" + message;
    }
    return "OK";
}

std::string actionNameFrom(const ipc::ZmqRequest& request) {
    if (request.isJson && request.json) {
        const auto& json = *request.json;
        if (json.contains("params") && json["params"].is_object() &&
            json["params"].contains("action") && json["params"]["action"].is_string()) {
            return json["params"]["action"].get<std::string>();
        }
        throw ControlError("ACTION requires params.action", ErrorCode::IPC_INVALID_PARAMS);
    }
    if (request.payload.empty()) {
        throw ControlError("ACTION requires an action name", ErrorCode::IPC_INVALID_PARAMS);
    }
    return request.payload;
}

}  // namespace

ControlServer::ControlServer(std::string endpoint)
    : server_(std::make_unique<ipc::ZmqCommandServer>(std::move(endpoint))) {
    registerHandlers();
}

ControlServer::~ControlServer() {
    stop();
}

void ControlServer::setLiveControl(LiveControl* liveControl) {
    liveControl_ = liveControl;
}

bool ControlServer::start() {
    return server_->start();
}

void ControlServer::stop() {
    server_->stop();
}

std::function<void(const nlohmann::json&)> ControlServer::eventPublisher() {
    return [this](const nlohmann::json& payload) { server_->publish(payload.dump()); };
}

std::string ControlServer::handleRaw(const std::string& raw) {
    return server_->dispatchRequest(ipc::ZmqCommandServer::buildRequest(raw));
}

const std::string& ControlServer::endpoint() const {
    return server_->endpoint();
}

const std::string& ControlServer::pubEndpoint() const {
    return server_->pubEndpoint();
}

void ControlServer::registerHandlers() {
    server_->registerCommand("PING", [this](const auto& req) { return handlePing(req); });
    server_->registerCommand("STATUS", [this](const auto& req) { return handleStatus(req); });
    server_->registerCommand("ACTION", [this](const auto& req) { return handleAction(req); });
}

LiveControl& ControlServer::live() const {
    if (!liveControl_) {
        throw ControlError("Live control is not attached", ErrorCode::CONTROL_NOT_STARTED);
    }
    return *liveControl_;
}

std::string ControlServer::handlePing(const ipc::ZmqRequest& request) {
    return buildOkResponse(request);
}

std::string ControlServer::handleStatus(const ipc::ZmqRequest& request) {
    auto status = live().status();
    nlohmann::json data;
    data["topology"] = status.topology;
    data["source"] = status.source;
    data["volume_db"] = status.volumeDb;
    data["volume"] = LiveControl::formatVolume(status.volumeDb);
    data["muted"] = status.muted;
    return buildOkResponse(request, "", data);
}

std::string ControlServer::handleAction(const ipc::ZmqRequest& request) {
    const std::string name = actionNameFrom(request);
    auto action = controlActionFromString(name);
    if (!action) {
        throw ControlError("Unknown action: " + name, ErrorCode::CONTROL_INVALID_ACTION);
    }

    if (!live().handle(*action)) {
        return ipc::ZmqCommandServer::buildErrorResponse(
            request, errorCodeToString(ErrorCode::CONTROL_ACTION_FAILED),
            std::string("Action failed: ") + controlActionToString(*action));
    }
    return buildOkResponse(request, controlActionToString(*action));
}

}  // namespace camilla_remote::control
