#pragma once

#include "pipeline/pipeline_synthesizer.h"

#include <optional>
#include <string>
#include <vector>

namespace camilla_remote::control {

// One selectable topology entry, e.g. "2.1 DRC"
struct TopologyOption {
    std::string label;
    pipeline::Topology topology = pipeline::Topology::Stereo;
    pipeline::CorrectionMode correction = pipeline::CorrectionMode::None;
};

// One selectable input source entry, e.g. "Phono" (direct)
struct SourceOption {
    std::string label;
    pipeline::InputSource source = pipeline::InputSource::Streamed;
};

struct MenuLayout {
    std::vector<TopologyOption> topologies;
    std::vector<SourceOption> sources;
};

// "<topology> [DRC]"; nullopt for an unknown topology or correction token
std::optional<TopologyOption> parseTopologyOption(const std::string& label);

// A bare label: "Stream" is the streamed source, anything else is direct
SourceOption sourceOptionFromLabel(const std::string& label);

MenuLayout defaultMenuLayout();

// Empty string when the layout is usable, otherwise the first problem found
std::string validateMenuLayout(const MenuLayout& menu);

}  // namespace camilla_remote::control
