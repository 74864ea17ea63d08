/**
 * @file test_pipeline_json.cpp
 * @brief Unit tests for the engine document codec
 */

#include "core/error_codes.h"
#include "pipeline/pipeline_json.h"
#include "pipeline/pipeline_synthesizer.h"

#include <gtest/gtest.h>

using namespace camilla_remote;
using namespace camilla_remote::pipeline;
using nlohmann::json;

namespace {

PipelineDescription sampleDescription() {
    HardwareParams hw;
    hw.correctionFilterPath = "/cfg/filters/drc.wav";
    hw.mainsDelayMs = 9.2;
    hw.balanceFilters = true;
    SynthesisRequest req;
    req.topology = Topology::TwoPointOne;
    req.correction = CorrectionMode::RoomCorrection;
    return synthesize(req, hw);
}

}  // namespace

TEST(PipelineJsonTest, UsesEngineDocumentKeys) {
    json j = pipeline_json::toJson(sampleDescription());

    ASSERT_TRUE(j.contains("devices"));
    EXPECT_EQ(j["devices"]["samplerate"], 44100);
    EXPECT_EQ(j["devices"]["chunksize"], 8192);
    EXPECT_EQ(j["devices"]["queuelimit"], 4);
    EXPECT_EQ(j["devices"]["enable_rate_adjust"], true);
    EXPECT_EQ(j["devices"]["capture"]["type"], "Alsa");
    EXPECT_EQ(j["devices"]["capture"]["channels"], 2);
    EXPECT_EQ(j["devices"]["capture"]["format"], "S32LE");
    EXPECT_EQ(j["devices"]["playback"]["channels"], 4);

    const auto& mixer = j["mixers"]["Stream-2.1"];
    EXPECT_EQ(mixer["channels"]["in"], 2);
    EXPECT_EQ(mixer["channels"]["out"], 4);
    EXPECT_EQ(mixer["mapping"].size(), 3u);
    EXPECT_EQ(mixer["mapping"][0]["dest"], 0);
    EXPECT_EQ(mixer["mapping"][0]["sources"][0]["channel"], 0);
    EXPECT_EQ(mixer["mapping"][0]["sources"][0]["mute"], false);

    EXPECT_EQ(j["filters"]["volume"]["type"], "Volume");
    EXPECT_EQ(j["filters"]["volume"]["parameters"]["ramp_time"], 200.0);
    EXPECT_EQ(j["filters"]["drc_1"]["type"], "Conv");
    EXPECT_EQ(j["filters"]["drc_1"]["parameters"]["type"], "Wav");
    EXPECT_EQ(j["filters"]["drc_1"]["parameters"]["channel"], 1);
    EXPECT_EQ(j["filters"]["sublowpass"]["type"], "BiquadCombo");
    EXPECT_EQ(j["filters"]["sublowpass"]["parameters"]["type"], "LinkwitzRileyLowpass");
    EXPECT_EQ(j["filters"]["sublowpass"]["parameters"]["order"], 8);
    EXPECT_EQ(j["filters"]["mainsdelay"]["parameters"]["unit"], "ms");
    EXPECT_EQ(j["filters"]["balance0"]["type"], "Gain");
    EXPECT_EQ(j["filters"]["balance0"]["parameters"]["gain"], 0.0);

    ASSERT_TRUE(j["pipeline"].is_array());
    EXPECT_EQ(j["pipeline"][0]["type"], "Filter");
    EXPECT_EQ(j["pipeline"][0]["names"], json::array({"volume", "drc_0"}));
    EXPECT_EQ(j["pipeline"][2]["type"], "Mixer");
    EXPECT_EQ(j["pipeline"][2]["name"], "Stream-2.1");
}

TEST(PipelineJsonTest, ParsesWhatItWrites) {
    auto original = sampleDescription();
    auto parsed = pipeline_json::parse(pipeline_json::dump(original, 2));
    EXPECT_EQ(parsed, original);
}

TEST(PipelineJsonTest, UnknownFilterKindsAreCarriedThrough) {
    json j = pipeline_json::toJson(sampleDescription());
    j["filters"]["peq"] = {{"type", "Biquad"},
                           {"parameters", {{"type", "Peaking"}, {"freq", 1000}, {"gain", -3}}}};

    auto parsed = pipeline_json::fromJson(j);
    auto opaque = parsed.filterAs<OpaqueFilter>("peq");
    ASSERT_TRUE(opaque.has_value());
    EXPECT_EQ(opaque->type, "Biquad");

    json back = pipeline_json::toJson(parsed);
    EXPECT_EQ(back["filters"]["peq"], j["filters"]["peq"]);
}

TEST(PipelineJsonTest, MissingDevicesIsSchemaError) {
    json j = pipeline_json::toJson(sampleDescription());
    j.erase("devices");

    try {
        pipeline_json::fromJson(j);
        FAIL() << "expected SchemaError";
    } catch (const SchemaError& e) {
        EXPECT_EQ(e.code(), ErrorCode::SCHEMA_MISSING_FIELD);
    }
}

TEST(PipelineJsonTest, WrongValueTypeIsSchemaError) {
    json j = pipeline_json::toJson(sampleDescription());
    j["devices"]["samplerate"] = "fast";

    EXPECT_THROW(pipeline_json::fromJson(j), SchemaError);
}

TEST(PipelineJsonTest, UnknownStepTypeIsSchemaError) {
    json j = pipeline_json::toJson(sampleDescription());
    j["pipeline"].push_back({{"type", "Processor"}, {"name", "compressor"}});

    EXPECT_THROW(pipeline_json::fromJson(j), SchemaError);
}

TEST(PipelineJsonTest, MalformedTextIsSchemaError) {
    EXPECT_THROW(pipeline_json::parse("{not json"), SchemaError);
    EXPECT_THROW(pipeline_json::parse("[1, 2]"), SchemaError);
}

TEST(PipelineJsonTest, EngineAddedKeysSurviveRoundTrip) {
    json j = pipeline_json::toJson(sampleDescription());
    j["title"] = "Living room";
    j["devices"]["stop_on_rate_change"] = true;
    j["devices"]["capture"]["labels"] = {"L", "R"};
    j["mixers"]["Stream-2.1"]["description"] = "stereo to 2.1";
    j["mixers"]["Stream-2.1"]["mapping"][0]["sources"][0]["scale"] = "dB";
    j["filters"]["balance0"] = {{"type", "Gain"},
                                {"description", "left trim"},
                                {"parameters", {{"gain", -1.5}, {"mute", true}}}};
    j["pipeline"][0]["bypassed"] = true;

    auto parsed = pipeline_json::fromJson(j);
    auto gain = parsed.filterAs<GainFilter>("balance0");
    ASSERT_TRUE(gain.has_value());
    EXPECT_DOUBLE_EQ(gain->gain, -1.5);

    json back = pipeline_json::toJson(parsed);
    EXPECT_EQ(back["title"], "Living room");
    EXPECT_EQ(back["devices"]["stop_on_rate_change"], true);
    EXPECT_EQ(back["devices"]["capture"]["labels"], json({"L", "R"}));
    EXPECT_EQ(back["mixers"]["Stream-2.1"]["description"], "stereo to 2.1");
    EXPECT_EQ(back["mixers"]["Stream-2.1"]["mapping"][0]["sources"][0]["scale"], "dB");
    EXPECT_EQ(back["filters"]["balance0"]["description"], "left trim");
    EXPECT_EQ(back["filters"]["balance0"]["parameters"]["mute"], true);
    EXPECT_EQ(back["filters"]["balance0"]["parameters"]["gain"], -1.5);
    EXPECT_EQ(back["pipeline"][0]["bypassed"], true);
}

TEST(PipelineJsonTest, ModeledValuesWinOverEngineKeys) {
    json j = pipeline_json::toJson(sampleDescription());
    j["filters"]["balance1"] = {{"type", "Gain"},
                                {"parameters", {{"gain", 0.0}, {"mute", false}}}};

    auto parsed = pipeline_json::fromJson(j);
    auto gain = parsed.filterAs<GainFilter>("balance1");
    ASSERT_TRUE(gain.has_value());
    gain->gain = -2.0;
    parsed.filters["balance1"] = *gain;

    json back = pipeline_json::toJson(parsed);
    EXPECT_EQ(back["filters"]["balance1"]["parameters"]["gain"], -2.0);
    EXPECT_EQ(back["filters"]["balance1"]["parameters"]["mute"], false);
}

TEST(PipelineJsonTest, DescriptionWithoutEngineKeysHasNoExtras) {
    auto parsed = pipeline_json::fromJson(pipeline_json::toJson(sampleDescription()));

    EXPECT_TRUE(parsed.extraJson.empty());
    EXPECT_TRUE(parsed.devices.extraJson.empty());
    EXPECT_EQ(parsed, sampleDescription());
}
