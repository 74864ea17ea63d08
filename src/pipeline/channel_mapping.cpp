#include "pipeline/channel_mapping.h"

#include <algorithm>

namespace camilla_remote::pipeline {

std::vector<DestinationMapping> buildMapping(const std::vector<ChannelIndex>& destinations,
                                             const std::vector<ChannelIndex>& inputChannels,
                                             bool downmix, double gain) {
    std::vector<DestinationMapping> mapping;

    if (downmix) {
        mapping.reserve(destinations.size());
        for (ChannelIndex dest : destinations) {
            DestinationMapping entry;
            entry.destination = dest;
            entry.sources.reserve(inputChannels.size());
            for (ChannelIndex src : inputChannels) {
                entry.sources.push_back(MixRule{src, gain, false, false});
            }
            mapping.push_back(std::move(entry));
        }
        return mapping;
    }

    const std::size_t count = std::min(destinations.size(), inputChannels.size());
    mapping.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        DestinationMapping entry;
        entry.destination = destinations[i];
        entry.sources.push_back(MixRule{inputChannels[i], 0.0, false, false});
        mapping.push_back(std::move(entry));
    }
    return mapping;
}

}  // namespace camilla_remote::pipeline
