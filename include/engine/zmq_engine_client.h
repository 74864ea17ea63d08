#ifndef ZMQ_ENGINE_CLIENT_H
#define ZMQ_ENGINE_CLIENT_H

#include "engine/dsp_engine.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

namespace camilla_remote::engine {

// Engine command names
namespace commands {
constexpr const char* VALIDATE_CONFIG = "ValidateConfig";
constexpr const char* SET_CONFIG_JSON = "SetConfigJson";
constexpr const char* GET_CONFIG_JSON = "GetConfigJson";
constexpr const char* GET_VOLUME = "GetVolume";
constexpr const char* SET_VOLUME = "SetVolume";
constexpr const char* GET_MUTE = "GetMute";
constexpr const char* SET_MUTE = "SetMute";
constexpr const char* SET_CONFIG_NAME = "SetConfigName";
constexpr const char* RELOAD = "Reload";
}  // namespace commands

// Decoded reply to one engine command
struct EngineReply {
    bool ok = false;
    nlohmann::json value;  // null when the command returns nothing
};

// Engine command envelope: {"GetVolume": null} -> {"GetVolume": {"result": "Ok", "value": -3.5}}
namespace JSON {
std::string buildRequest(const std::string& command, const nlohmann::json& argument = nullptr);

// Throws EngineError(ENGINE_PROTOCOL_ERROR) when the reply is malformed or
// answers a different command.
EngineReply parseReply(const std::string& command, const std::string& raw);
}  // namespace JSON

// DspEngine over a ZeroMQ REQ socket. All calls are serialized internally.
class ZmqEngineClient : public DspEngine {
   public:
    explicit ZmqEngineClient(int timeoutMs = 5000);
    ~ZmqEngineClient() override;

    ZmqEngineClient(const ZmqEngineClient&) = delete;
    ZmqEngineClient& operator=(const ZmqEngineClient&) = delete;

    // endpoint format: "tcp://127.0.0.1:31234" or "ipc:///tmp/camilladsp.sock"
    bool connect(const std::string& endpoint);
    void disconnect();
    bool isConnected() const {
        return connected_.load();
    }

    void validate(const pipeline::PipelineDescription& description) override;
    void setLiveConfig(const pipeline::PipelineDescription& description) override;
    pipeline::PipelineDescription getLiveConfig() override;
    double getVolume() override;
    void setVolume(double volumeDb) override;
    bool getMute() override;
    void setMute(bool muted) override;
    void setConfigName(const std::string& path) override;
    void reload() override;

   private:
    EngineReply sendCommand(const std::string& command, const nlohmann::json& argument = nullptr);
    nlohmann::json requireOk(const std::string& command, const nlohmann::json& argument = nullptr);
    void resetSocket();

    struct Impl;
    std::unique_ptr<Impl> impl_;
    int timeoutMs_;
    std::atomic<bool> connected_{false};
    std::mutex requestMutex_;
};

}  // namespace camilla_remote::engine

#endif  // ZMQ_ENGINE_CLIENT_H
