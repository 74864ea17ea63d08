#include "control/zmq_display.h"

#include "logging/logger.h"

namespace camilla_remote::control {

ZmqDisplay::ZmqDisplay(Publisher publisher, int blinkIntervalMs)
    : publisher_(std::move(publisher)), blinker_(blinkIntervalMs) {}

ZmqDisplay::~ZmqDisplay() {
    blinker_.stop();
}

void ZmqDisplay::showSelection(const std::string& topologyLabel, const std::string& sourceLabel) {
    nlohmann::json event;
    event["type"] = "selection";
    event["topology"] = topologyLabel;
    event["source"] = sourceLabel;
    publish(event);
}

void ZmqDisplay::showVolume(const std::string& formattedVolume) {
    nlohmann::json event;
    event["type"] = "volume";
    event["value"] = formattedVolume;
    publish(event);
}

void ZmqDisplay::startMuteBlink(std::function<bool()> mutedPoll) {
    blinker_.start(std::move(mutedPoll), [this](bool visible) {
        nlohmann::json event;
        event["type"] = "volume_visible";
        event["visible"] = visible;
        publish(event);
    });
}

void ZmqDisplay::showError(ErrorCode code, const std::string& message) {
    nlohmann::json event;
    event["type"] = "error";
    event["error_code"] = errorCodeToString(code);
    event["category"] = getErrorCategory(code);
    event["message"] = message;
    publish(event);
}

void ZmqDisplay::forwardAction(const std::string& actionName) {
    nlohmann::json event;
    event["type"] = "action";
    event["action"] = actionName;
    publish(event);
}

void ZmqDisplay::stopMuteBlink() {
    blinker_.stop();
}

void ZmqDisplay::publish(const nlohmann::json& event) {
    std::lock_guard<std::mutex> lock(publishMutex_);
    if (!publisher_) {
        LOG_DEBUG("Display: no publisher for {}", event.dump());
        return;
    }
    publisher_(event);
}

}  // namespace camilla_remote::control
