#include "control/menu_layout.h"

#include <set>
#include <sstream>

namespace camilla_remote::control {

std::optional<TopologyOption> parseTopologyOption(const std::string& label) {
    std::istringstream iss(label);
    std::string routingToken;
    std::string correctionToken;
    std::string extra;
    iss >> routingToken >> correctionToken >> extra;

    if (routingToken.empty() || !extra.empty()) {
        return std::nullopt;
    }

    auto topology = pipeline::parseTopology(routingToken);
    if (!topology) {
        return std::nullopt;
    }

    TopologyOption option;
    option.label = label;
    option.topology = *topology;
    if (correctionToken.empty()) {
        option.correction = pipeline::CorrectionMode::None;
    } else if (correctionToken == "DRC") {
        option.correction = pipeline::CorrectionMode::RoomCorrection;
    } else {
        return std::nullopt;
    }
    return option;
}

SourceOption sourceOptionFromLabel(const std::string& label) {
    SourceOption option;
    option.label = label;
    option.source =
        (label == "Stream") ? pipeline::InputSource::Streamed : pipeline::InputSource::Direct;
    return option;
}

MenuLayout defaultMenuLayout() {
    MenuLayout menu;
    for (const char* label : {"2.1 DRC", "2.1", "2.0", "Mono"}) {
        menu.topologies.push_back(*parseTopologyOption(label));
    }
    menu.sources.push_back(SourceOption{"Stream", pipeline::InputSource::Streamed});
    menu.sources.push_back(SourceOption{"Phono", pipeline::InputSource::Direct});
    return menu;
}

std::string validateMenuLayout(const MenuLayout& menu) {
    if (menu.topologies.empty()) {
        return "menu has no topology entries";
    }
    if (menu.sources.empty()) {
        return "menu has no source entries";
    }

    std::set<std::string> seen;
    for (const auto& option : menu.topologies) {
        if (!seen.insert(option.label).second) {
            return "duplicate topology label '" + option.label + "'";
        }
    }
    seen.clear();
    for (const auto& option : menu.sources) {
        if (option.label.empty()) {
            return "empty source label";
        }
        if (!seen.insert(option.label).second) {
            return "duplicate source label '" + option.label + "'";
        }
    }
    return "";
}

}  // namespace camilla_remote::control
