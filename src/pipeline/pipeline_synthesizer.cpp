#include "pipeline/pipeline_synthesizer.h"

#include <algorithm>
#include <cctype>

namespace camilla_remote::pipeline {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Satellite input channels as seen by the mixer
std::vector<ChannelIndex> satelliteInputs(InputSource source) {
    std::vector<ChannelIndex> inputs = {0, 1};
    if (source == InputSource::Direct) {
        for (auto& ch : inputs) {
            ch += DIRECT_INPUT_CHANNEL_OFFSET;
        }
    }
    return inputs;
}

DeviceBlock buildDevices(InputSource source, const HardwareParams& hardware) {
    DeviceBlock devices;
    devices.sampleRate = hardware.sampleRate;

    if (source == InputSource::Direct) {
        devices.capture.device = hardware.playbackDevice;
        devices.capture.channels = hardware.playbackChannels;
    } else {
        devices.capture.device = hardware.loopbackDevice;
        devices.capture.channels = STREAMED_CAPTURE_CHANNELS;
    }
    devices.capture.format = hardware.sampleFormat;

    devices.playback.device = hardware.playbackDevice;
    devices.playback.channels = hardware.playbackChannels;
    devices.playback.format = hardware.sampleFormat;
    return devices;
}

std::string correctionFilterName(std::size_t index) {
    return std::string(filter_names::CORRECTION_PREFIX) + std::to_string(index);
}

const char* balanceFilterName(std::size_t satelliteIndex) {
    return satelliteIndex == 0 ? filter_names::BALANCE_LEFT : filter_names::BALANCE_RIGHT;
}

}  // namespace

std::size_t subwooferCount(Topology topology) {
    switch (topology) {
    case Topology::TwoPointOne:
        return 1;
    case Topology::TwoPointTwo:
        return 2;
    case Topology::Mono:
    case Topology::Stereo:
        return 0;
    }
    return 0;
}

bool hasSubwoofer(Topology topology) {
    return subwooferCount(topology) > 0;
}

std::string mixerNameFor(const SynthesisRequest& request) {
    const std::string source = request.sourceLabel.empty()
                                   ? std::string(inputSourceToString(request.inputSource))
                                   : request.sourceLabel;
    return source + "-" + topologyToString(request.topology);
}

PipelineDescription synthesize(const SynthesisRequest& request, const HardwareParams& hardware) {
    PipelineDescription description;
    description.devices = buildDevices(request.inputSource, hardware);

    const std::vector<ChannelIndex> inputChannels = satelliteInputs(request.inputSource);
    const std::vector<ChannelIndex> destinations = {0, 1};

    // Volume is present in every topology
    description.filters.emplace(filter_names::VOLUME, VolumeFilter{VOLUME_RAMP_TIME_MS});

    std::vector<FilterStep> inputSteps;
    inputSteps.reserve(inputChannels.size());
    for (ChannelIndex ch : inputChannels) {
        inputSteps.push_back(FilterStep{ch, {filter_names::VOLUME}});
    }

    if (request.correction == CorrectionMode::RoomCorrection) {
        for (std::size_t i = 0; i < inputSteps.size(); ++i) {
            const std::string name = correctionFilterName(i);
            description.filters.emplace(name, ConvFilter{hardware.correctionFilterPath, i});
            inputSteps[i].names.push_back(name);
        }
    }

    MixerBlock mixer;
    mixer.channelsIn = description.devices.capture.channels;
    mixer.channelsOut = hardware.playbackChannels;
    if (request.topology == Topology::Mono) {
        mixer.mapping = buildMapping(destinations, inputChannels, true, MONO_DOWNMIX_GAIN_DB);
    } else {
        mixer.mapping = buildMapping(destinations, inputChannels, false);
    }

    std::vector<FilterStep> mainsSteps;
    std::vector<FilterStep> subSteps;

    if (hasSubwoofer(request.topology)) {
        std::vector<ChannelIndex> subDestinations;
        for (ChannelIndex dest : destinations) {
            subDestinations.push_back(dest + SUBWOOFER_CHANNEL_OFFSET);
        }

        std::vector<DestinationMapping> subMapping;
        if (request.topology == Topology::TwoPointOne) {
            // Single subwoofer driven by a mono sum
            subDestinations.resize(1);
            subMapping = buildMapping(subDestinations, inputChannels, true);
        } else {
            subMapping = buildMapping(subDestinations, inputChannels, false);
        }
        mixer.mapping.insert(mixer.mapping.end(), subMapping.begin(), subMapping.end());

        description.filters.emplace(
            filter_names::SUB_LOWPASS,
            BiquadComboFilter{BiquadComboKind::LinkwitzRileyLowpass, hardware.crossoverFrequency,
                              CROSSOVER_ORDER});
        description.filters.emplace(
            filter_names::MAINS_HIGHPASS,
            BiquadComboFilter{BiquadComboKind::LinkwitzRileyHighpass, hardware.crossoverFrequency,
                              CROSSOVER_ORDER});
        description.filters.emplace(filter_names::MAINS_DELAY,
                                    DelayFilter{hardware.mainsDelayMs, "ms", false});

        for (ChannelIndex dest : destinations) {
            mainsSteps.push_back(
                FilterStep{dest, {filter_names::MAINS_HIGHPASS, filter_names::MAINS_DELAY}});
        }
        for (ChannelIndex dest : subDestinations) {
            subSteps.push_back(FilterStep{dest, {filter_names::SUB_LOWPASS}});
        }
    }

    if (hardware.balanceFilters) {
        for (std::size_t i = 0; i < destinations.size(); ++i) {
            const char* name = balanceFilterName(i);
            description.filters.emplace(name, GainFilter{0.0, false});
            if (mainsSteps.size() > i) {
                mainsSteps[i].names.push_back(name);
            } else {
                mainsSteps.push_back(FilterStep{destinations[i], {name}});
            }
        }
    }

    const std::string mixerName = mixerNameFor(request);
    description.mixers.emplace(mixerName, std::move(mixer));

    for (auto& step : inputSteps) {
        description.pipeline.emplace_back(std::move(step));
    }
    description.pipeline.emplace_back(MixerStep{mixerName});
    for (auto& step : mainsSteps) {
        description.pipeline.emplace_back(std::move(step));
    }
    for (auto& step : subSteps) {
        description.pipeline.emplace_back(std::move(step));
    }

    return description;
}

const char* topologyToString(Topology topology) {
    switch (topology) {
    case Topology::Mono:
        return "Mono";
    case Topology::Stereo:
        return "2.0";
    case Topology::TwoPointOne:
        return "2.1";
    case Topology::TwoPointTwo:
        return "2.2";
    }
    return "2.0";
}

std::optional<Topology> parseTopology(const std::string& str) {
    const std::string lower = toLower(str);
    if (lower == "mono") {
        return Topology::Mono;
    }
    if (lower == "2.0" || lower == "stereo") {
        return Topology::Stereo;
    }
    if (lower == "2.1") {
        return Topology::TwoPointOne;
    }
    if (lower == "2.2") {
        return Topology::TwoPointTwo;
    }
    return std::nullopt;
}

const char* inputSourceToString(InputSource source) {
    switch (source) {
    case InputSource::Direct:
        return "Direct";
    case InputSource::Streamed:
        return "Stream";
    }
    return "Stream";
}

std::optional<InputSource> parseInputSourceKind(const std::string& str) {
    const std::string lower = toLower(str);
    if (lower == "streamed" || lower == "stream") {
        return InputSource::Streamed;
    }
    if (lower == "direct") {
        return InputSource::Direct;
    }
    return std::nullopt;
}

const char* correctionModeToString(CorrectionMode mode) {
    switch (mode) {
    case CorrectionMode::RoomCorrection:
        return "DRC";
    case CorrectionMode::None:
        return "";
    }
    return "";
}

}  // namespace camilla_remote::pipeline
