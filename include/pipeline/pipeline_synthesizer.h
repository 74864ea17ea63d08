/**
 * @file pipeline_synthesizer.h
 * @brief Builds complete pipeline descriptions from high-level routing choices
 *
 * A pure function of its inputs: the same request always yields the same
 * description and nothing outside the request is consulted.
 */

#pragma once

#include "pipeline/pipeline_description.h"

#include <optional>
#include <string>

namespace camilla_remote::pipeline {

// Speaker layout
enum class Topology { Mono, Stereo, TwoPointOne, TwoPointTwo };

enum class InputSource {
    Streamed,  // Fixed 2-channel loopback capture
    Direct     // Same physical device as playback, channels beyond the playback pair
};

enum class CorrectionMode { None, RoomCorrection };

// Fixed filter names in the generated filter bank
namespace filter_names {
constexpr const char* VOLUME = "volume";
constexpr const char* CORRECTION_PREFIX = "drc_";
constexpr const char* SUB_LOWPASS = "sublowpass";
constexpr const char* MAINS_HIGHPASS = "mainshighpass";
constexpr const char* MAINS_DELAY = "mainsdelay";
constexpr const char* BALANCE_LEFT = "balance0";
constexpr const char* BALANCE_RIGHT = "balance1";
}  // namespace filter_names

constexpr double VOLUME_RAMP_TIME_MS = 200.0;
constexpr int CROSSOVER_ORDER = 8;
constexpr double MONO_DOWNMIX_GAIN_DB = -6.0;
// Direct capture skips the playback passthrough pair
constexpr std::size_t DIRECT_INPUT_CHANNEL_OFFSET = 2;
constexpr std::size_t SUBWOOFER_CHANNEL_OFFSET = 2;
constexpr std::size_t STREAMED_CAPTURE_CHANNELS = 2;

// Hardware and tuning parameters shared by every synthesized description.
struct HardwareParams {
    std::string playbackDevice = "hw:Headphone,0";
    std::size_t playbackChannels = 4;
    int sampleRate = 44100;
    double crossoverFrequency = 80.0;
    double mainsDelayMs = 0.0;
    std::string correctionFilterPath;
    std::string loopbackDevice = "hw:Loopback,1";
    std::string sampleFormat = "S32LE";
    // Provision balance0/balance1 gain filters on the satellite outputs
    bool balanceFilters = false;
};

struct SynthesisRequest {
    Topology topology = Topology::TwoPointOne;
    InputSource inputSource = InputSource::Streamed;
    CorrectionMode correction = CorrectionMode::None;
    // Used in the mixer name; falls back to inputSourceToString() when empty
    std::string sourceLabel;
};

PipelineDescription synthesize(const SynthesisRequest& request, const HardwareParams& hardware);

// Mixer name "{source}-{topology}", e.g. "Stream-2.1"
std::string mixerNameFor(const SynthesisRequest& request);

std::size_t subwooferCount(Topology topology);
bool hasSubwoofer(Topology topology);

// "Mono", "2.0", "2.1", "2.2"
const char* topologyToString(Topology topology);
std::optional<Topology> parseTopology(const std::string& str);

// "Stream", "Direct"
const char* inputSourceToString(InputSource source);
// Accepts "streamed"/"stream" and "direct" (case-insensitive)
std::optional<InputSource> parseInputSourceKind(const std::string& str);

// "", "DRC"
const char* correctionModeToString(CorrectionMode mode);

}  // namespace camilla_remote::pipeline
