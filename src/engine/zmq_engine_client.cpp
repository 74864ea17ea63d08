#include "engine/zmq_engine_client.h"

#include "core/error_codes.h"
#include "logging/logger.h"
#include "pipeline/pipeline_json.h"

#include <zmq.hpp>

using json = nlohmann::json;

namespace camilla_remote::engine {
namespace {

std::string describeValue(const json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

}  // namespace

namespace JSON {

std::string buildRequest(const std::string& command, const json& argument) {
    json j;
    j[command] = argument;
    return j.dump();
}

EngineReply parseReply(const std::string& command, const std::string& raw) {
    json j;
    try {
        j = json::parse(raw);
    } catch (const json::parse_error& e) {
        throw EngineError("Engine reply to " + command + " is not JSON: " + e.what(),
                          ErrorCode::ENGINE_PROTOCOL_ERROR);
    }

    if (!j.is_object() || !j.contains(command) || !j[command].is_object()) {
        throw EngineError("Engine reply does not answer " + command + ": " + raw,
                          ErrorCode::ENGINE_PROTOCOL_ERROR);
    }
    const json& body = j[command];
    if (!body.contains("result") || !body["result"].is_string()) {
        throw EngineError("Engine reply to " + command + " has no result",
                          ErrorCode::ENGINE_PROTOCOL_ERROR);
    }

    EngineReply reply;
    reply.ok = body["result"].get<std::string>() == "Ok";
    if (body.contains("value")) {
        reply.value = body["value"];
    }
    return reply;
}

}  // namespace JSON

struct ZmqEngineClient::Impl {
    zmq::context_t context{1};
    std::unique_ptr<zmq::socket_t> reqSocket;
    std::string endpoint;
};

ZmqEngineClient::ZmqEngineClient(int timeoutMs)
    : impl_(std::make_unique<Impl>()), timeoutMs_(timeoutMs) {}

ZmqEngineClient::~ZmqEngineClient() {
    disconnect();
}

bool ZmqEngineClient::connect(const std::string& endpoint) {
    std::lock_guard<std::mutex> lock(requestMutex_);
    try {
        impl_->endpoint = endpoint;
        resetSocket();
        connected_.store(true);
        LOG_INFO("Engine client connected to {}", endpoint);
        return true;
    } catch (const zmq::error_t& e) {
        LOG_ERROR("Engine client connect error: {}", e.what());
        return false;
    }
}

void ZmqEngineClient::disconnect() {
    std::lock_guard<std::mutex> lock(requestMutex_);
    if (connected_.exchange(false)) {
        impl_->reqSocket.reset();
    }
}

void ZmqEngineClient::resetSocket() {
    impl_->reqSocket = std::make_unique<zmq::socket_t>(impl_->context, zmq::socket_type::req);
    impl_->reqSocket->set(zmq::sockopt::linger, 0);
    if (timeoutMs_ > 0) {
        impl_->reqSocket->set(zmq::sockopt::rcvtimeo, timeoutMs_);
        impl_->reqSocket->set(zmq::sockopt::sndtimeo, timeoutMs_);
    }
    impl_->reqSocket->connect(impl_->endpoint);
}

EngineReply ZmqEngineClient::sendCommand(const std::string& command, const json& argument) {
    std::lock_guard<std::mutex> lock(requestMutex_);

    if (!connected_.load() || !impl_->reqSocket) {
        throw EngineError("Not connected to engine", ErrorCode::ENGINE_NOT_CONNECTED);
    }

    std::string responseStr;
    try {
        const std::string request = JSON::buildRequest(command, argument);
        auto sent = impl_->reqSocket->send(zmq::buffer(request), zmq::send_flags::none);
        if (!sent) {
            resetSocket();
            throw EngineError("Timeout sending " + command, ErrorCode::ENGINE_TIMEOUT);
        }

        zmq::message_t response;
        auto received = impl_->reqSocket->recv(response, zmq::recv_flags::none);
        if (!received) {
            // A REQ socket cannot send again until it has received; start over
            resetSocket();
            throw EngineError("Timeout waiting for " + command + " reply",
                              ErrorCode::ENGINE_TIMEOUT);
        }
        responseStr.assign(static_cast<const char*>(response.data()), response.size());
    } catch (const zmq::error_t& e) {
        throw EngineError(std::string("ZMQ error: ") + e.what(),
                          ErrorCode::ENGINE_CONNECTION_FAILED);
    }

    LOG_TRACE("Engine {} -> {}", command, responseStr);
    return JSON::parseReply(command, responseStr);
}

json ZmqEngineClient::requireOk(const std::string& command, const json& argument) {
    EngineReply reply = sendCommand(command, argument);
    if (!reply.ok) {
        const std::string detail = describeValue(reply.value);
        throw EngineError(command + " failed: " + detail, ErrorCode::ENGINE_REQUEST_FAILED);
    }
    return reply.value;
}

void ZmqEngineClient::validate(const pipeline::PipelineDescription& description) {
    EngineReply reply = sendCommand(commands::VALIDATE_CONFIG, pipeline_json::dump(description));
    if (!reply.ok) {
        const std::string detail = describeValue(reply.value);
        throw SchemaError("Engine rejected configuration: " + detail,
                          ErrorCode::SCHEMA_REJECTED_BY_ENGINE);
    }
}

void ZmqEngineClient::setLiveConfig(const pipeline::PipelineDescription& description) {
    requireOk(commands::SET_CONFIG_JSON, pipeline_json::dump(description));
}

pipeline::PipelineDescription ZmqEngineClient::getLiveConfig() {
    json value = requireOk(commands::GET_CONFIG_JSON);
    try {
        if (value.is_string()) {
            return pipeline_json::parse(value.get<std::string>());
        }
        return pipeline_json::fromJson(value);
    } catch (const SchemaError& e) {
        throw EngineError(std::string("Engine returned an unreadable configuration: ") + e.what(),
                          ErrorCode::ENGINE_PROTOCOL_ERROR);
    }
}

double ZmqEngineClient::getVolume() {
    json value = requireOk(commands::GET_VOLUME);
    if (!value.is_number()) {
        throw EngineError("GetVolume returned a non-numeric value",
                          ErrorCode::ENGINE_PROTOCOL_ERROR);
    }
    return value.get<double>();
}

void ZmqEngineClient::setVolume(double volumeDb) {
    requireOk(commands::SET_VOLUME, volumeDb);
}

bool ZmqEngineClient::getMute() {
    json value = requireOk(commands::GET_MUTE);
    if (!value.is_boolean()) {
        throw EngineError("GetMute returned a non-boolean value",
                          ErrorCode::ENGINE_PROTOCOL_ERROR);
    }
    return value.get<bool>();
}

void ZmqEngineClient::setMute(bool muted) {
    requireOk(commands::SET_MUTE, muted);
}

void ZmqEngineClient::setConfigName(const std::string& path) {
    requireOk(commands::SET_CONFIG_NAME, path);
}

void ZmqEngineClient::reload() {
    requireOk(commands::RELOAD);
}

}  // namespace camilla_remote::engine
