/**
 * @file pipeline_description.h
 * @brief Strongly-typed pipeline description for the DSP engine
 *
 * Mirrors the engine's configuration document: a device block, named mixers,
 * a named filter bank and an ordered list of processing steps. Conversion to
 * and from the engine's JSON document lives in pipeline_json.h only.
 *
 * Every block carries an extraJson member: the keys the engine sent that are
 * not modeled here, as a JSON object text (empty when there are none). They
 * are written back unchanged, so a read-modify-write of the live description
 * only changes what the caller changed.
 */

#pragma once

#include "pipeline/channel_mapping.h"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace camilla_remote::pipeline {

struct CaptureDevice {
    std::string type = "Alsa";
    std::size_t channels = 2;
    std::string device;
    std::string format = "S32LE";
    bool retryOnError = false;
    bool avoidBlockingRead = false;

    bool operator==(const CaptureDevice& other) const;
};

struct PlaybackDevice {
    std::string type = "Alsa";
    std::size_t channels = 2;
    std::string device;
    std::string format = "S32LE";

    bool operator==(const PlaybackDevice& other) const;
};

struct DeviceBlock {
    int sampleRate = 44100;
    int chunkSize = 8192;
    int queueLimit = 4;
    double silenceThreshold = 0.0;
    double silenceTimeout = 0.0;
    int targetLevel = 0;
    double adjustPeriod = 10.0;
    bool enableRateAdjust = true;
    bool enableResampling = false;
    std::string resamplerType = "BalancedAsync";
    int captureSampleRate = 0;
    CaptureDevice capture;
    PlaybackDevice playback;
    std::string extraJson;  // includes unmodeled capture/playback keys

    bool operator==(const DeviceBlock& other) const;
};

struct MixerBlock {
    std::size_t channelsIn = 2;
    std::size_t channelsOut = 2;
    std::vector<DestinationMapping> mapping;
    std::string extraJson;

    bool operator==(const MixerBlock& other) const;
};

// ---- Filter bank entries ----

struct VolumeFilter {
    double rampTimeMs = 200.0;
    std::string extraJson;

    bool operator==(const VolumeFilter& other) const {
        return rampTimeMs == other.rampTimeMs && extraJson == other.extraJson;
    }
};

// Convolution with an impulse response read from a WAV file.
struct ConvFilter {
    std::string filename;
    std::size_t channel = 0;
    std::string extraJson;

    bool operator==(const ConvFilter& other) const {
        return filename == other.filename && channel == other.channel &&
               extraJson == other.extraJson;
    }
};

enum class BiquadComboKind { LinkwitzRileyLowpass, LinkwitzRileyHighpass };

struct BiquadComboFilter {
    BiquadComboKind kind = BiquadComboKind::LinkwitzRileyLowpass;
    double freq = 80.0;
    int order = 8;
    std::string extraJson;

    bool operator==(const BiquadComboFilter& other) const {
        return kind == other.kind && freq == other.freq && order == other.order &&
               extraJson == other.extraJson;
    }
};

struct DelayFilter {
    double delay = 0.0;
    std::string unit = "ms";
    bool subsample = false;
    std::string extraJson;

    bool operator==(const DelayFilter& other) const {
        return delay == other.delay && unit == other.unit && subsample == other.subsample &&
               extraJson == other.extraJson;
    }
};

struct GainFilter {
    double gain = 0.0;  // dB
    bool inverted = false;
    std::string extraJson;

    bool operator==(const GainFilter& other) const {
        return gain == other.gain && inverted == other.inverted && extraJson == other.extraJson;
    }
};

// A filter kind this tool does not model; carried through unchanged.
struct OpaqueFilter {
    std::string type;
    std::string parametersJson;
    std::string extraJson;

    bool operator==(const OpaqueFilter& other) const {
        return type == other.type && parametersJson == other.parametersJson &&
               extraJson == other.extraJson;
    }
};

using FilterDef = std::variant<VolumeFilter, ConvFilter, BiquadComboFilter, DelayFilter,
                               GainFilter, OpaqueFilter>;

// ---- Pipeline steps ----

struct FilterStep {
    ChannelIndex channel = 0;
    std::vector<std::string> names;
    std::string extraJson;

    bool operator==(const FilterStep& other) const {
        return channel == other.channel && names == other.names && extraJson == other.extraJson;
    }
};

struct MixerStep {
    std::string name;
    std::string extraJson;

    bool operator==(const MixerStep& other) const {
        return name == other.name && extraJson == other.extraJson;
    }
};

using PipelineStep = std::variant<FilterStep, MixerStep>;

struct PipelineDescription {
    DeviceBlock devices;
    std::map<std::string, MixerBlock> mixers;
    std::map<std::string, FilterDef> filters;
    std::vector<PipelineStep> pipeline;
    std::string extraJson;  // top-level keys such as "title" or "processors"

    bool operator==(const PipelineDescription& other) const;
    bool operator!=(const PipelineDescription& other) const {
        return !(*this == other);
    }

    bool hasFilter(const std::string& name) const {
        return filters.find(name) != filters.end();
    }

    // Typed access to a filter; nullopt when absent or of another kind.
    template <typename T>
    std::optional<T> filterAs(const std::string& name) const {
        auto it = filters.find(name);
        if (it == filters.end()) {
            return std::nullopt;
        }
        if (const T* typed = std::get_if<T>(&it->second)) {
            return *typed;
        }
        return std::nullopt;
    }
};

const char* filterTypeName(const FilterDef& filter);
const char* biquadComboKindToString(BiquadComboKind kind);

/**
 * @brief Local structural consistency check.
 *
 * Reports every step filter name missing from the bank, every unknown mixer,
 * every channel index outside the channel count of its stage (capture count
 * before the mixer step, mixer output count after it), mixer in/out counts that
 * differ from the capture/playback counts, and non-muted mappings without sources.
 *
 * @return Human-readable problems; empty when the description is consistent
 */
std::vector<std::string> findConsistencyProblems(const PipelineDescription& description);

}  // namespace camilla_remote::pipeline
