#pragma once

#include "control/live_control.h"
#include "ipc/zmq_server.h"

#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace camilla_remote::control {

/**
 * @brief Control surface over ZeroMQ.
 *
 * Commands: ACTION (JSON {"cmd":"ACTION","params":{"action":"volume_up"}} or
 * text "ACTION:volume_up"), STATUS and PING. Requests are served one at a time
 * by the REP loop, so actions apply strictly in arrival order.
 */
class ControlServer {
   public:
    explicit ControlServer(std::string endpoint);
    ~ControlServer();

    ControlServer(const ControlServer&) = delete;
    ControlServer& operator=(const ControlServer&) = delete;

    // Must be called before start()
    void setLiveControl(LiveControl* liveControl);

    bool start();
    void stop();

    // Publishes on the PUB socket; a no-op until start() succeeds
    std::function<void(const nlohmann::json&)> eventPublisher();

    // Decode and serve one raw request without going through the socket
    std::string handleRaw(const std::string& raw);

    const std::string& endpoint() const;
    const std::string& pubEndpoint() const;

   private:
    void registerHandlers();
    LiveControl& live() const;

    std::string handlePing(const ipc::ZmqRequest& request);
    std::string handleStatus(const ipc::ZmqRequest& request);
    std::string handleAction(const ipc::ZmqRequest& request);

    std::unique_ptr<ipc::ZmqCommandServer> server_;
    LiveControl* liveControl_ = nullptr;
};

}  // namespace camilla_remote::control
