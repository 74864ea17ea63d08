#pragma once

#include <optional>
#include <string>

namespace camilla_remote::control {

// Every action the control surface can deliver. Decoding happens upstream.
enum class ControlAction {
    VolumeUp,
    VolumeDown,
    MuteToggle,
    TopologyNext,
    TopologyPrev,
    SourceNext,
    SourcePrev,
    BalanceLeft,
    BalanceRight,
    // Not bound to the state machine; forwarded to the display side
    TrackPlay,
    TrackNext,
    TrackPrev,
    TrackStop,
    Menu,
    NavUp,
    NavDown,
    NavSelect,
    NavExit
};

// Canonical snake_case name, e.g. "volume_up"
const char* controlActionToString(ControlAction action);

// Accepts canonical names and the legacy remote aliases ("vol_up", "config_next", ...)
std::optional<ControlAction> controlActionFromString(const std::string& name);

// True when the action changes engine or menu state
bool isBoundAction(ControlAction action);

}  // namespace camilla_remote::control
