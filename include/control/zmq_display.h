#pragma once

#include "control/display_sink.h"
#include "control/mute_blinker.h"

#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

namespace camilla_remote::control {

/**
 * @brief DisplaySink that publishes display updates as JSON events.
 *
 * Event types: "selection", "volume", "volume_visible", "error", "action".
 * Owns the mute blinker; blink ticks arrive as "volume_visible" events.
 */
class ZmqDisplay : public DisplaySink {
   public:
    using Publisher = std::function<void(const nlohmann::json&)>;

    ZmqDisplay(Publisher publisher, int blinkIntervalMs);
    ~ZmqDisplay() override;

    void showSelection(const std::string& topologyLabel, const std::string& sourceLabel) override;
    void showVolume(const std::string& formattedVolume) override;
    void startMuteBlink(std::function<bool()> mutedPoll) override;
    void showError(ErrorCode code, const std::string& message) override;
    void forwardAction(const std::string& actionName) override;

    void stopMuteBlink();
    bool isBlinking() const {
        return blinker_.isRunning();
    }

   private:
    void publish(const nlohmann::json& event);

    Publisher publisher_;
    std::mutex publishMutex_;
    MuteBlinker blinker_;
};

}  // namespace camilla_remote::control
