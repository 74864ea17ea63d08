#pragma once

#include "core/error_codes.h"

#include <functional>
#include <string>

namespace camilla_remote::control {

/**
 * @brief What the live control state machine tells the user-facing display.
 *
 * Rendering is entirely up to the implementation.
 */
class DisplaySink {
   public:
    virtual ~DisplaySink() = default;

    virtual void showSelection(const std::string& topologyLabel,
                               const std::string& sourceLabel) = 0;

    // Volume already formatted to one decimal place, e.g. "-12.5"
    virtual void showVolume(const std::string& formattedVolume) = 0;

    // Blink the volume readout while mutedPoll() returns true
    virtual void startMuteBlink(std::function<bool()> mutedPoll) = 0;

    virtual void showError(ErrorCode code, const std::string& message) = 0;

    // Actions this daemon does not bind (transport, navigation)
    virtual void forwardAction(const std::string& actionName) = 0;
};

}  // namespace camilla_remote::control
