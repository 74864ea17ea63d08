#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace camilla_remote::pipeline {

using ChannelIndex = std::size_t;

// One contribution from a source channel into a destination channel.
struct MixRule {
    ChannelIndex sourceChannel = 0;
    double gain = 0.0;  // dB
    bool inverted = false;
    bool muted = false;
    std::string extraJson;  // unmodeled engine keys, see pipeline_description.h

    bool operator==(const MixRule& other) const {
        return sourceChannel == other.sourceChannel && gain == other.gain &&
               inverted == other.inverted && muted == other.muted &&
               extraJson == other.extraJson;
    }
};

// Mixing rules for a single destination channel. Source order is kept as built.
struct DestinationMapping {
    ChannelIndex destination = 0;
    bool muted = false;
    std::vector<MixRule> sources;
    std::string extraJson;

    bool operator==(const DestinationMapping& other) const {
        return destination == other.destination && muted == other.muted &&
               sources == other.sources && extraJson == other.extraJson;
    }
};

/**
 * @brief Build per-destination mixing rules.
 *
 * downmix == true: every destination receives every input channel at @p gain.
 * downmix == false: destinations and inputs are zipped 1:1 at 0 dB; the shorter
 * list determines how many mappings are produced.
 */
std::vector<DestinationMapping> buildMapping(const std::vector<ChannelIndex>& destinations,
                                             const std::vector<ChannelIndex>& inputChannels,
                                             bool downmix, double gain = 0.0);

}  // namespace camilla_remote::pipeline
