#pragma once

#include "core/remote_constants.h"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>

namespace zmq {
class context_t;
class socket_t;
}  // namespace zmq

namespace camilla_remote::ipc {

// One decoded request: JSON {"cmd": ..., "params": ...} or text "CMD:payload"
struct ZmqRequest {
    std::string raw;
    std::optional<nlohmann::json> json;
    std::string command;
    std::string payload;
    bool isJson = false;
    std::string parseError;
};

// REP socket for commands plus a PUB socket for events. Handlers run on the
// single server thread, one request at a time.
class ZmqCommandServer {
   public:
    using Handler = std::function<std::string(const ZmqRequest&)>;

    explicit ZmqCommandServer(std::string endpoint = RemoteConstants::DEFAULT_CONTROL_ENDPOINT,
                              int recvTimeoutMs = 1000);
    ~ZmqCommandServer();

    ZmqCommandServer(const ZmqCommandServer&) = delete;
    ZmqCommandServer& operator=(const ZmqCommandServer&) = delete;

    // Register before start(); handlers are not guarded against concurrent registration
    void registerCommand(const std::string& command, Handler handler);

    bool start();
    void stop();
    bool isRunning() const {
        return running_.load();
    }
    bool hasBindError() const {
        return bindFailed_.load();
    }

    bool publish(const std::string& message);
    const std::string& endpoint() const {
        return endpoint_;
    }
    const std::string& pubEndpoint() const {
        return pubEndpoint_;
    }

    static ZmqRequest buildRequest(const std::string& raw);
    std::string dispatchRequest(const ZmqRequest& request);
    static std::string buildErrorResponse(const ZmqRequest& request, const std::string& code,
                                          const std::string& message);
    static std::string derivePubEndpoint(const std::string& endpoint);

   private:
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
    std::map<std::string, Handler> handlers_;
    mutable std::mutex pubMutex_;
};

}  // namespace camilla_remote::ipc
