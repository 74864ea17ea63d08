/**
 * @file test_pipeline_synthesizer.cpp
 * @brief Unit tests for pipeline description synthesis
 */

#include "pipeline/pipeline_synthesizer.h"

#include <gtest/gtest.h>
#include <variant>

using namespace camilla_remote::pipeline;

namespace {

HardwareParams referenceHardware() {
    HardwareParams hw;
    hw.playbackDevice = "hw:CARD=M4,DEV=0";
    hw.playbackChannels = 4;
    hw.sampleRate = 44100;
    hw.crossoverFrequency = 80.0;
    hw.mainsDelayMs = 9.2;
    hw.correctionFilterPath = "/cfg/filters/drc.wav";
    hw.loopbackDevice = "hw:Loopback,1";
    return hw;
}

SynthesisRequest request(Topology topology, InputSource source,
                         CorrectionMode correction = CorrectionMode::None) {
    SynthesisRequest req;
    req.topology = topology;
    req.inputSource = source;
    req.correction = correction;
    return req;
}

const MixerBlock& onlyMixer(const PipelineDescription& desc) {
    EXPECT_EQ(desc.mixers.size(), 1u);
    return desc.mixers.begin()->second;
}

const FilterStep& filterStepAt(const PipelineDescription& desc, std::size_t index) {
    return std::get<FilterStep>(desc.pipeline.at(index));
}

}  // namespace

// ============================================================
// Reference scenarios
// ============================================================

TEST(PipelineSynthesizerTest, TwoPointOneStreamedWithCorrection) {
    auto desc = synthesize(
        request(Topology::TwoPointOne, InputSource::Streamed, CorrectionMode::RoomCorrection),
        referenceHardware());

    const auto& mixer = onlyMixer(desc);
    ASSERT_EQ(mixer.mapping.size(), 3u);
    EXPECT_EQ(mixer.mapping[2].destination, 2u);
    ASSERT_EQ(mixer.mapping[2].sources.size(), 2u);
    EXPECT_DOUBLE_EQ(mixer.mapping[2].sources[0].gain, 0.0);

    auto drc0 = desc.filterAs<ConvFilter>("drc_0");
    auto drc1 = desc.filterAs<ConvFilter>("drc_1");
    ASSERT_TRUE(drc0.has_value());
    ASSERT_TRUE(drc1.has_value());
    EXPECT_EQ(drc0->channel, 0u);
    EXPECT_EQ(drc1->channel, 1u);
    EXPECT_EQ(drc0->filename, "/cfg/filters/drc.wav");

    auto lowpass = desc.filterAs<BiquadComboFilter>(filter_names::SUB_LOWPASS);
    auto highpass = desc.filterAs<BiquadComboFilter>(filter_names::MAINS_HIGHPASS);
    auto delay = desc.filterAs<DelayFilter>(filter_names::MAINS_DELAY);
    ASSERT_TRUE(lowpass && highpass && delay);
    EXPECT_EQ(lowpass->kind, BiquadComboKind::LinkwitzRileyLowpass);
    EXPECT_EQ(highpass->kind, BiquadComboKind::LinkwitzRileyHighpass);
    EXPECT_DOUBLE_EQ(lowpass->freq, 80.0);
    EXPECT_EQ(lowpass->order, 8);
    EXPECT_DOUBLE_EQ(delay->delay, 9.2);
    EXPECT_EQ(delay->unit, "ms");
    EXPECT_EQ(desc.filters.size(), 6u);

    ASSERT_EQ(desc.pipeline.size(), 6u);
    EXPECT_EQ(filterStepAt(desc, 0).channel, 0u);
    EXPECT_EQ(filterStepAt(desc, 0).names, (std::vector<std::string>{"volume", "drc_0"}));
    EXPECT_EQ(filterStepAt(desc, 1).names, (std::vector<std::string>{"volume", "drc_1"}));
    EXPECT_EQ(std::get<MixerStep>(desc.pipeline[2]).name, "Stream-2.1");
    for (std::size_t i : {3u, 4u}) {
        EXPECT_EQ(filterStepAt(desc, i).names,
                  (std::vector<std::string>{"mainshighpass", "mainsdelay"}));
    }
    EXPECT_EQ(filterStepAt(desc, 3).channel, 0u);
    EXPECT_EQ(filterStepAt(desc, 4).channel, 1u);
    EXPECT_EQ(filterStepAt(desc, 5).channel, 2u);
    EXPECT_EQ(filterStepAt(desc, 5).names, (std::vector<std::string>{"sublowpass"}));

    EXPECT_TRUE(findConsistencyProblems(desc).empty());
}

TEST(PipelineSynthesizerTest, StereoDirectWithoutCorrection) {
    auto desc = synthesize(request(Topology::Stereo, InputSource::Direct), referenceHardware());

    EXPECT_EQ(desc.devices.capture.channels, 4u);
    EXPECT_EQ(desc.devices.capture.device, "hw:CARD=M4,DEV=0");

    const auto& mixer = onlyMixer(desc);
    ASSERT_EQ(mixer.mapping.size(), 2u);
    EXPECT_EQ(mixer.mapping[0].sources.size(), 1u);
    EXPECT_EQ(mixer.mapping[0].sources[0].sourceChannel, 2u);
    EXPECT_EQ(mixer.mapping[1].sources[0].sourceChannel, 3u);
    EXPECT_DOUBLE_EQ(mixer.mapping[0].sources[0].gain, 0.0);
    EXPECT_DOUBLE_EQ(mixer.mapping[1].sources[0].gain, 0.0);

    EXPECT_FALSE(desc.hasFilter(filter_names::SUB_LOWPASS));
    EXPECT_FALSE(desc.hasFilter(filter_names::MAINS_HIGHPASS));
    EXPECT_FALSE(desc.hasFilter(filter_names::MAINS_DELAY));
    EXPECT_FALSE(desc.hasFilter("drc_0"));
    EXPECT_EQ(desc.filters.size(), 1u);

    ASSERT_EQ(desc.pipeline.size(), 3u);
    EXPECT_EQ(filterStepAt(desc, 0).channel, 2u);
    EXPECT_EQ(filterStepAt(desc, 1).channel, 3u);
    EXPECT_EQ(std::get<MixerStep>(desc.pipeline[2]).name, "Direct-2.0");
}

TEST(PipelineSynthesizerTest, StreamedCaptureUsesLoopback) {
    auto desc =
        synthesize(request(Topology::Stereo, InputSource::Streamed), referenceHardware());

    EXPECT_EQ(desc.devices.capture.device, "hw:Loopback,1");
    EXPECT_EQ(desc.devices.capture.channels, 2u);
    EXPECT_EQ(desc.devices.playback.channels, 4u);
    EXPECT_EQ(desc.devices.sampleRate, 44100);
    EXPECT_EQ(onlyMixer(desc).channelsIn, 2u);
    EXPECT_EQ(onlyMixer(desc).channelsOut, 4u);
}

TEST(PipelineSynthesizerTest, MonoDownmixesAtMinusSixDb) {
    auto desc = synthesize(request(Topology::Mono, InputSource::Streamed), referenceHardware());

    const auto& mixer = onlyMixer(desc);
    ASSERT_EQ(mixer.mapping.size(), 2u);
    for (const auto& dest : mixer.mapping) {
        ASSERT_EQ(dest.sources.size(), 2u);
        for (const auto& rule : dest.sources) {
            EXPECT_DOUBLE_EQ(rule.gain, -6.0);
        }
    }
    EXPECT_EQ(desc.pipeline.size(), 3u);
}

TEST(PipelineSynthesizerTest, TwoPointTwoFeedsTwoSubwoofersOneToOne) {
    auto desc =
        synthesize(request(Topology::TwoPointTwo, InputSource::Streamed), referenceHardware());

    const auto& mixer = onlyMixer(desc);
    ASSERT_EQ(mixer.mapping.size(), 4u);
    EXPECT_EQ(mixer.mapping[2].destination, 2u);
    EXPECT_EQ(mixer.mapping[3].destination, 3u);
    ASSERT_EQ(mixer.mapping[2].sources.size(), 1u);
    EXPECT_EQ(mixer.mapping[2].sources[0].sourceChannel, 0u);
    EXPECT_EQ(mixer.mapping[3].sources[0].sourceChannel, 1u);

    // 2 pre-mix + mixer + 2 mains + 2 subs
    ASSERT_EQ(desc.pipeline.size(), 7u);
    EXPECT_EQ(filterStepAt(desc, 5).channel, 2u);
    EXPECT_EQ(filterStepAt(desc, 6).channel, 3u);
}

TEST(PipelineSynthesizerTest, BalanceFiltersFollowMainsFilters) {
    auto hw = referenceHardware();
    hw.balanceFilters = true;
    auto desc = synthesize(request(Topology::TwoPointOne, InputSource::Streamed), hw);

    ASSERT_TRUE(desc.filterAs<GainFilter>(filter_names::BALANCE_LEFT).has_value());
    ASSERT_TRUE(desc.filterAs<GainFilter>(filter_names::BALANCE_RIGHT).has_value());
    EXPECT_DOUBLE_EQ(desc.filterAs<GainFilter>(filter_names::BALANCE_LEFT)->gain, 0.0);
    EXPECT_EQ(filterStepAt(desc, 3).names,
              (std::vector<std::string>{"mainshighpass", "mainsdelay", "balance0"}));
    EXPECT_EQ(filterStepAt(desc, 4).names,
              (std::vector<std::string>{"mainshighpass", "mainsdelay", "balance1"}));
    EXPECT_TRUE(findConsistencyProblems(desc).empty());
}

TEST(PipelineSynthesizerTest, BalanceFiltersWithoutSubwooferGetOwnSteps) {
    auto hw = referenceHardware();
    hw.balanceFilters = true;
    auto desc = synthesize(request(Topology::Stereo, InputSource::Direct), hw);

    ASSERT_EQ(desc.pipeline.size(), 5u);
    EXPECT_EQ(filterStepAt(desc, 3).channel, 0u);
    EXPECT_EQ(filterStepAt(desc, 3).names, (std::vector<std::string>{"balance0"}));
    EXPECT_EQ(filterStepAt(desc, 4).channel, 1u);
    EXPECT_EQ(filterStepAt(desc, 4).names, (std::vector<std::string>{"balance1"}));
}

TEST(PipelineSynthesizerTest, SourceLabelNamesTheMixer) {
    auto req = request(Topology::TwoPointOne, InputSource::Direct, CorrectionMode::RoomCorrection);
    req.sourceLabel = "Phono";
    auto desc = synthesize(req, referenceHardware());

    EXPECT_EQ(mixerNameFor(req), "Phono-2.1");
    EXPECT_EQ(desc.mixers.count("Phono-2.1"), 1u);
}

TEST(PipelineSynthesizerTest, IsDeterministic) {
    auto req = request(Topology::TwoPointTwo, InputSource::Direct, CorrectionMode::RoomCorrection);
    EXPECT_EQ(synthesize(req, referenceHardware()), synthesize(req, referenceHardware()));
}

TEST(PipelineSynthesizerTest, EveryCombinationIsConsistent) {
    for (auto topology : {Topology::Mono, Topology::Stereo, Topology::TwoPointOne,
                          Topology::TwoPointTwo}) {
        for (auto source : {InputSource::Streamed, InputSource::Direct}) {
            for (auto correction : {CorrectionMode::None, CorrectionMode::RoomCorrection}) {
                for (bool balance : {false, true}) {
                    auto hw = referenceHardware();
                    hw.balanceFilters = balance;
                    auto desc = synthesize(request(topology, source, correction), hw);

                    auto problems = findConsistencyProblems(desc);
                    EXPECT_TRUE(problems.empty())
                        << topologyToString(topology) << "/" << inputSourceToString(source)
                        << ": " << (problems.empty() ? "" : problems.front());

                    const auto& mixer = onlyMixer(desc);
                    EXPECT_EQ(mixer.channelsIn, desc.devices.capture.channels);
                    EXPECT_EQ(mixer.channelsOut, desc.devices.playback.channels);
                    EXPECT_EQ(mixer.mapping.size(), 2u + subwooferCount(topology));
                }
            }
        }
    }
}

// ============================================================
// Name conversions
// ============================================================

TEST(PipelineSynthesizerTest, TopologyNamesRoundTrip) {
    for (auto topology : {Topology::Mono, Topology::Stereo, Topology::TwoPointOne,
                          Topology::TwoPointTwo}) {
        auto parsed = parseTopology(topologyToString(topology));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, topology);
    }
    EXPECT_EQ(parseTopology("stereo"), Topology::Stereo);
    EXPECT_FALSE(parseTopology("5.1").has_value());
}

TEST(PipelineSynthesizerTest, InputSourceKinds) {
    EXPECT_EQ(parseInputSourceKind("Streamed"), InputSource::Streamed);
    EXPECT_EQ(parseInputSourceKind("stream"), InputSource::Streamed);
    EXPECT_EQ(parseInputSourceKind("DIRECT"), InputSource::Direct);
    EXPECT_FALSE(parseInputSourceKind("usb").has_value());
    EXPECT_STREQ(correctionModeToString(CorrectionMode::RoomCorrection), "DRC");
    EXPECT_STREQ(correctionModeToString(CorrectionMode::None), "");
}

TEST(PipelineSynthesizerTest, EveryEnumeratorHasItsOwnName) {
    EXPECT_STREQ(topologyToString(Topology::Mono), "Mono");
    EXPECT_STREQ(topologyToString(Topology::Stereo), "2.0");
    EXPECT_STREQ(topologyToString(Topology::TwoPointOne), "2.1");
    EXPECT_STREQ(topologyToString(Topology::TwoPointTwo), "2.2");

    EXPECT_EQ(subwooferCount(Topology::Mono), 0u);
    EXPECT_EQ(subwooferCount(Topology::Stereo), 0u);
    EXPECT_EQ(subwooferCount(Topology::TwoPointOne), 1u);
    EXPECT_EQ(subwooferCount(Topology::TwoPointTwo), 2u);

    EXPECT_STREQ(inputSourceToString(InputSource::Streamed), "Stream");
    EXPECT_STREQ(inputSourceToString(InputSource::Direct), "Direct");

    EXPECT_STREQ(biquadComboKindToString(BiquadComboKind::LinkwitzRileyLowpass),
                 "LinkwitzRileyLowpass");
    EXPECT_STREQ(biquadComboKindToString(BiquadComboKind::LinkwitzRileyHighpass),
                 "LinkwitzRileyHighpass");
}
