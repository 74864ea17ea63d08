#include "control/control_action.h"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace camilla_remote::control {

const char* controlActionToString(ControlAction action) {
    switch (action) {
    case ControlAction::VolumeUp:
        return "volume_up";
    case ControlAction::VolumeDown:
        return "volume_down";
    case ControlAction::MuteToggle:
        return "mute_toggle";
    case ControlAction::TopologyNext:
        return "topology_next";
    case ControlAction::TopologyPrev:
        return "topology_prev";
    case ControlAction::SourceNext:
        return "source_next";
    case ControlAction::SourcePrev:
        return "source_prev";
    case ControlAction::BalanceLeft:
        return "balance_left";
    case ControlAction::BalanceRight:
        return "balance_right";
    case ControlAction::TrackPlay:
        return "track_play";
    case ControlAction::TrackNext:
        return "track_next";
    case ControlAction::TrackPrev:
        return "track_prev";
    case ControlAction::TrackStop:
        return "track_stop";
    case ControlAction::Menu:
        return "menu";
    case ControlAction::NavUp:
        return "nav_up";
    case ControlAction::NavDown:
        return "nav_down";
    case ControlAction::NavSelect:
        return "nav_select";
    case ControlAction::NavExit:
        return "nav_exit";
    }
    return "unknown";
}

std::optional<ControlAction> controlActionFromString(const std::string& name) {
    static const std::unordered_map<std::string, ControlAction> kActions = {
        {"volume_up", ControlAction::VolumeUp},
        {"vol_up", ControlAction::VolumeUp},
        {"volume_down", ControlAction::VolumeDown},
        {"vol_down", ControlAction::VolumeDown},
        {"mute_toggle", ControlAction::MuteToggle},
        {"mute", ControlAction::MuteToggle},
        {"topology_next", ControlAction::TopologyNext},
        {"config_next", ControlAction::TopologyNext},
        {"topology_prev", ControlAction::TopologyPrev},
        {"config_prev", ControlAction::TopologyPrev},
        {"source_next", ControlAction::SourceNext},
        {"source_prev", ControlAction::SourcePrev},
        {"balance_left", ControlAction::BalanceLeft},
        {"nav_left", ControlAction::BalanceLeft},
        {"balance_right", ControlAction::BalanceRight},
        {"nav_right", ControlAction::BalanceRight},
        {"track_play", ControlAction::TrackPlay},
        {"track_next", ControlAction::TrackNext},
        {"track_prev", ControlAction::TrackPrev},
        {"track_stop", ControlAction::TrackStop},
        {"menu", ControlAction::Menu},
        {"nav_up", ControlAction::NavUp},
        {"nav_down", ControlAction::NavDown},
        {"nav_select", ControlAction::NavSelect},
        {"nav_exit", ControlAction::NavExit},
    };

    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
        return c == '-' ? '_' : static_cast<char>(std::tolower(c));
    });
    auto it = kActions.find(key);
    if (it == kActions.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool isBoundAction(ControlAction action) {
    switch (action) {
    case ControlAction::VolumeUp:
    case ControlAction::VolumeDown:
    case ControlAction::MuteToggle:
    case ControlAction::TopologyNext:
    case ControlAction::TopologyPrev:
    case ControlAction::SourceNext:
    case ControlAction::SourcePrev:
    case ControlAction::BalanceLeft:
    case ControlAction::BalanceRight:
        return true;
    case ControlAction::TrackPlay:
    case ControlAction::TrackNext:
    case ControlAction::TrackPrev:
    case ControlAction::TrackStop:
    case ControlAction::Menu:
    case ControlAction::NavUp:
    case ControlAction::NavDown:
    case ControlAction::NavSelect:
    case ControlAction::NavExit:
        return false;
    }
    return false;
}

}  // namespace camilla_remote::control
