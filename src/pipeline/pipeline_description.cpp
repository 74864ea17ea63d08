#include "pipeline/pipeline_description.h"

#include <sstream>

namespace camilla_remote::pipeline {

bool CaptureDevice::operator==(const CaptureDevice& other) const {
    return type == other.type && channels == other.channels && device == other.device &&
           format == other.format && retryOnError == other.retryOnError &&
           avoidBlockingRead == other.avoidBlockingRead;
}

bool PlaybackDevice::operator==(const PlaybackDevice& other) const {
    return type == other.type && channels == other.channels && device == other.device &&
           format == other.format;
}

bool DeviceBlock::operator==(const DeviceBlock& other) const {
    return sampleRate == other.sampleRate && chunkSize == other.chunkSize &&
           queueLimit == other.queueLimit && silenceThreshold == other.silenceThreshold &&
           silenceTimeout == other.silenceTimeout && targetLevel == other.targetLevel &&
           adjustPeriod == other.adjustPeriod && enableRateAdjust == other.enableRateAdjust &&
           enableResampling == other.enableResampling && resamplerType == other.resamplerType &&
           captureSampleRate == other.captureSampleRate && capture == other.capture &&
           playback == other.playback && extraJson == other.extraJson;
}

bool MixerBlock::operator==(const MixerBlock& other) const {
    return channelsIn == other.channelsIn && channelsOut == other.channelsOut &&
           mapping == other.mapping && extraJson == other.extraJson;
}

bool PipelineDescription::operator==(const PipelineDescription& other) const {
    return devices == other.devices && mixers == other.mixers && filters == other.filters &&
           pipeline == other.pipeline && extraJson == other.extraJson;
}

const char* filterTypeName(const FilterDef& filter) {
    struct Visitor {
        const char* operator()(const VolumeFilter&) const {
            return "Volume";
        }
        const char* operator()(const ConvFilter&) const {
            return "Conv";
        }
        const char* operator()(const BiquadComboFilter&) const {
            return "BiquadCombo";
        }
        const char* operator()(const DelayFilter&) const {
            return "Delay";
        }
        const char* operator()(const GainFilter&) const {
            return "Gain";
        }
        const char* operator()(const OpaqueFilter& f) const {
            return f.type.c_str();
        }
    };
    return std::visit(Visitor{}, filter);
}

const char* biquadComboKindToString(BiquadComboKind kind) {
    switch (kind) {
    case BiquadComboKind::LinkwitzRileyHighpass:
        return "LinkwitzRileyHighpass";
    case BiquadComboKind::LinkwitzRileyLowpass:
        return "LinkwitzRileyLowpass";
    }
    return "LinkwitzRileyLowpass";
}

std::vector<std::string> findConsistencyProblems(const PipelineDescription& description) {
    std::vector<std::string> problems;
    auto report = [&problems](const std::string& message) { problems.push_back(message); };

    const std::size_t captureChannels = description.devices.capture.channels;
    const std::size_t playbackChannels = description.devices.playback.channels;

    for (const auto& [name, mixer] : description.mixers) {
        if (mixer.channelsIn != captureChannels) {
            std::ostringstream oss;
            oss << "mixer '" << name << "' has " << mixer.channelsIn
                << " input channels but capture provides " << captureChannels;
            report(oss.str());
        }
        if (mixer.channelsOut != playbackChannels) {
            std::ostringstream oss;
            oss << "mixer '" << name << "' has " << mixer.channelsOut
                << " output channels but playback expects " << playbackChannels;
            report(oss.str());
        }
        for (const auto& dest : mixer.mapping) {
            if (dest.destination >= mixer.channelsOut) {
                std::ostringstream oss;
                oss << "mixer '" << name << "' destination " << dest.destination
                    << " out of range (" << mixer.channelsOut << " outputs)";
                report(oss.str());
            }
            if (dest.sources.empty() && !dest.muted) {
                std::ostringstream oss;
                oss << "mixer '" << name << "' destination " << dest.destination
                    << " has no sources";
                report(oss.str());
            }
            for (const auto& src : dest.sources) {
                if (src.sourceChannel >= mixer.channelsIn) {
                    std::ostringstream oss;
                    oss << "mixer '" << name << "' source channel " << src.sourceChannel
                        << " out of range (" << mixer.channelsIn << " inputs)";
                    report(oss.str());
                }
            }
        }
    }

    std::size_t stageChannels = captureChannels;
    for (std::size_t index = 0; index < description.pipeline.size(); ++index) {
        const auto& step = description.pipeline[index];
        if (const auto* filterStep = std::get_if<FilterStep>(&step)) {
            if (filterStep->channel >= stageChannels) {
                std::ostringstream oss;
                oss << "step " << index << " references channel " << filterStep->channel
                    << " but the stage has " << stageChannels << " channels";
                report(oss.str());
            }
            for (const auto& name : filterStep->names) {
                if (!description.hasFilter(name)) {
                    std::ostringstream oss;
                    oss << "step " << index << " references undefined filter '" << name << "'";
                    report(oss.str());
                }
            }
        } else {
            const auto& mixerStep = std::get<MixerStep>(step);
            auto it = description.mixers.find(mixerStep.name);
            if (it == description.mixers.end()) {
                std::ostringstream oss;
                oss << "step " << index << " references undefined mixer '" << mixerStep.name
                    << "'";
                report(oss.str());
            } else {
                stageChannels = it->second.channelsOut;
            }
        }
    }

    return problems;
}

}  // namespace camilla_remote::pipeline
