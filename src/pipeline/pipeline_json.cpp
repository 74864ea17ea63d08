#include "pipeline/pipeline_json.h"

#include "core/error_codes.h"

#include <utility>

using json = nlohmann::json;

namespace camilla_remote::pipeline_json {

using namespace camilla_remote::pipeline;

namespace {

const json& require(const json& object, const char* key, const std::string& context) {
    if (!object.is_object() || !object.contains(key)) {
        throw SchemaError(context + ": missing '" + key + "'", ErrorCode::SCHEMA_MISSING_FIELD);
    }
    return object.at(key);
}

// Keys of source that modeled does not produce, recursing into objects present in both
json residualOf(const json& source, const json& modeled) {
    json residual = json::object();
    if (!source.is_object() || !modeled.is_object()) {
        return residual;
    }
    for (const auto& [key, value] : source.items()) {
        auto it = modeled.find(key);
        if (it == modeled.end()) {
            residual[key] = value;
        } else if (value.is_object() && it->is_object()) {
            json nested = residualOf(value, *it);
            if (!nested.empty()) {
                residual[key] = std::move(nested);
            }
        }
    }
    return residual;
}

std::string extrasOf(const json& source, const json& modeled) {
    json residual = residualOf(source, modeled);
    return residual.empty() ? std::string() : residual.dump();
}

// Adds keys target lacks; never overwrites a modeled value
void mergeMissing(json& target, const json& extras) {
    for (const auto& [key, value] : extras.items()) {
        auto it = target.find(key);
        if (it == target.end()) {
            target[key] = value;
        } else if (it->is_object() && value.is_object()) {
            mergeMissing(*it, value);
        }
    }
}

void applyExtras(json& target, const std::string& extraJson) {
    if (!extraJson.empty()) {
        mergeMissing(target, json::parse(extraJson));
    }
}

json filterToJson(const FilterDef& filter) {
    struct Visitor {
        json operator()(const VolumeFilter& f) const {
            return {{"type", "Volume"}, {"parameters", {{"ramp_time", f.rampTimeMs}}}};
        }
        json operator()(const ConvFilter& f) const {
            return {{"type", "Conv"},
                    {"parameters",
                     {{"type", "Wav"}, {"filename", f.filename}, {"channel", f.channel}}}};
        }
        json operator()(const BiquadComboFilter& f) const {
            return {{"type", "BiquadCombo"},
                    {"parameters",
                     {{"type", biquadComboKindToString(f.kind)},
                      {"freq", f.freq},
                      {"order", f.order}}}};
        }
        json operator()(const DelayFilter& f) const {
            return {{"type", "Delay"},
                    {"parameters",
                     {{"delay", f.delay}, {"unit", f.unit}, {"subsample", f.subsample}}}};
        }
        json operator()(const GainFilter& f) const {
            return {{"type", "Gain"}, {"parameters", {{"gain", f.gain}, {"inverted", f.inverted}}}};
        }
        json operator()(const OpaqueFilter& f) const {
            json j;
            j["type"] = f.type;
            j["parameters"] = f.parametersJson.empty() ? json::object()
                                                       : json::parse(f.parametersJson);
            return j;
        }
    };
    json j = std::visit(Visitor{}, filter);
    applyExtras(j, std::visit([](const auto& f) { return f.extraJson; }, filter));
    return j;
}

FilterDef typedFilterFromJson(const std::string& name, const json& j) {
    const std::string context = "filter '" + name + "'";
    const std::string type = require(j, "type", context).get<std::string>();
    const json params = j.contains("parameters") ? j.at("parameters") : json::object();

    if (type == "Volume") {
        return VolumeFilter{params.value("ramp_time", VolumeFilter{}.rampTimeMs)};
    }
    if (type == "Conv" && params.value("type", "") == "Wav") {
        return ConvFilter{require(params, "filename", context).get<std::string>(),
                          params.value("channel", static_cast<std::size_t>(0))};
    }
    if (type == "BiquadCombo") {
        const std::string kind = require(params, "type", context).get<std::string>();
        BiquadComboFilter f;
        if (kind == "LinkwitzRileyLowpass") {
            f.kind = BiquadComboKind::LinkwitzRileyLowpass;
        } else if (kind == "LinkwitzRileyHighpass") {
            f.kind = BiquadComboKind::LinkwitzRileyHighpass;
        } else {
            return OpaqueFilter{type, params.dump()};
        }
        f.freq = require(params, "freq", context).get<double>();
        f.order = require(params, "order", context).get<int>();
        return f;
    }
    if (type == "Delay") {
        return DelayFilter{require(params, "delay", context).get<double>(),
                           params.value("unit", std::string("ms")),
                           params.value("subsample", false)};
    }
    if (type == "Gain") {
        return GainFilter{require(params, "gain", context).get<double>(),
                          params.value("inverted", false)};
    }
    return OpaqueFilter{type, params.dump()};
}

FilterDef filterFromJson(const std::string& name, const json& j) {
    FilterDef filter = typedFilterFromJson(name, j);
    const std::string extras = extrasOf(j, filterToJson(filter));
    std::visit([&extras](auto& f) { f.extraJson = extras; }, filter);
    return filter;
}

json ruleToJson(const MixRule& rule) {
    json j = {{"channel", rule.sourceChannel},
              {"gain", rule.gain},
              {"inverted", rule.inverted},
              {"mute", rule.muted}};
    applyExtras(j, rule.extraJson);
    return j;
}

json destinationToJson(const DestinationMapping& dest) {
    json sources = json::array();
    for (const auto& rule : dest.sources) {
        sources.push_back(ruleToJson(rule));
    }
    json j = {{"dest", dest.destination}, {"mute", dest.muted}, {"sources", sources}};
    applyExtras(j, dest.extraJson);
    return j;
}

json mappingToJson(const std::vector<DestinationMapping>& mapping) {
    json list = json::array();
    for (const auto& dest : mapping) {
        list.push_back(destinationToJson(dest));
    }
    return list;
}

std::vector<DestinationMapping> mappingFromJson(const json& list, const std::string& context) {
    if (!list.is_array()) {
        throw SchemaError(context + ": 'mapping' must be a list");
    }
    std::vector<DestinationMapping> mapping;
    for (const auto& entry : list) {
        DestinationMapping dest;
        dest.destination = require(entry, "dest", context).get<std::size_t>();
        dest.muted = entry.value("mute", false);
        const json& sources = require(entry, "sources", context);
        if (!sources.is_array()) {
            throw SchemaError(context + ": 'sources' must be a list");
        }
        for (const auto& src : sources) {
            MixRule rule;
            rule.sourceChannel = require(src, "channel", context).get<std::size_t>();
            rule.gain = src.value("gain", 0.0);
            rule.inverted = src.value("inverted", false);
            rule.muted = src.value("mute", false);
            rule.extraJson = extrasOf(src, ruleToJson(rule));
            dest.sources.push_back(std::move(rule));
        }
        dest.extraJson = extrasOf(entry, destinationToJson(dest));
        mapping.push_back(std::move(dest));
    }
    return mapping;
}

json mixerToJson(const MixerBlock& mixer) {
    json j = {{"channels", {{"in", mixer.channelsIn}, {"out", mixer.channelsOut}}},
              {"mapping", mappingToJson(mixer.mapping)}};
    applyExtras(j, mixer.extraJson);
    return j;
}

json stepToJson(const PipelineStep& step) {
    json j;
    if (const auto* filterStep = std::get_if<FilterStep>(&step)) {
        j = {{"type", "Filter"}, {"channel", filterStep->channel}, {"names", filterStep->names}};
        applyExtras(j, filterStep->extraJson);
    } else {
        const auto& mixerStep = std::get<MixerStep>(step);
        j = {{"type", "Mixer"}, {"name", mixerStep.name}};
        applyExtras(j, mixerStep.extraJson);
    }
    return j;
}

bool isSectionKey(const std::string& key) {
    return key == "devices" || key == "mixers" || key == "filters" || key == "pipeline";
}

json devicesToJson(const DeviceBlock& d) {
    json j;
    j["samplerate"] = d.sampleRate;
    j["chunksize"] = d.chunkSize;
    j["queuelimit"] = d.queueLimit;
    j["silence_threshold"] = d.silenceThreshold;
    j["silence_timeout"] = d.silenceTimeout;
    j["target_level"] = d.targetLevel;
    j["adjust_period"] = d.adjustPeriod;
    j["enable_rate_adjust"] = d.enableRateAdjust;
    j["enable_resampling"] = d.enableResampling;
    j["resampler_type"] = d.resamplerType;
    j["capture_samplerate"] = d.captureSampleRate;
    j["capture"] = {{"type", d.capture.type},
                    {"channels", d.capture.channels},
                    {"device", d.capture.device},
                    {"format", d.capture.format},
                    {"retry_on_error", d.capture.retryOnError},
                    {"avoid_blocking_read", d.capture.avoidBlockingRead}};
    j["playback"] = {{"type", d.playback.type},
                     {"channels", d.playback.channels},
                     {"device", d.playback.device},
                     {"format", d.playback.format}};
    applyExtras(j, d.extraJson);
    return j;
}

DeviceBlock devicesFromJson(const json& j) {
    DeviceBlock d;
    const DeviceBlock defaults;
    d.sampleRate = require(j, "samplerate", "devices").get<int>();
    d.chunkSize = require(j, "chunksize", "devices").get<int>();
    d.queueLimit = j.value("queuelimit", defaults.queueLimit);
    d.silenceThreshold = j.value("silence_threshold", defaults.silenceThreshold);
    d.silenceTimeout = j.value("silence_timeout", defaults.silenceTimeout);
    d.targetLevel = j.value("target_level", defaults.targetLevel);
    d.adjustPeriod = j.value("adjust_period", defaults.adjustPeriod);
    d.enableRateAdjust = j.value("enable_rate_adjust", defaults.enableRateAdjust);
    d.enableResampling = j.value("enable_resampling", defaults.enableResampling);
    d.resamplerType = j.value("resampler_type", defaults.resamplerType);
    d.captureSampleRate = j.value("capture_samplerate", defaults.captureSampleRate);

    const json& capture = require(j, "capture", "devices");
    d.capture.type = capture.value("type", defaults.capture.type);
    d.capture.channels = require(capture, "channels", "devices.capture").get<std::size_t>();
    d.capture.device = require(capture, "device", "devices.capture").get<std::string>();
    d.capture.format = capture.value("format", defaults.capture.format);
    d.capture.retryOnError = capture.value("retry_on_error", defaults.capture.retryOnError);
    d.capture.avoidBlockingRead =
        capture.value("avoid_blocking_read", defaults.capture.avoidBlockingRead);

    const json& playback = require(j, "playback", "devices");
    d.playback.type = playback.value("type", defaults.playback.type);
    d.playback.channels = require(playback, "channels", "devices.playback").get<std::size_t>();
    d.playback.device = require(playback, "device", "devices.playback").get<std::string>();
    d.playback.format = playback.value("format", defaults.playback.format);
    d.extraJson = extrasOf(j, devicesToJson(d));
    return d;
}

}  // namespace

json toJson(const PipelineDescription& description) {
    json j;
    j["devices"] = devicesToJson(description.devices);

    j["mixers"] = json::object();
    for (const auto& [name, mixer] : description.mixers) {
        j["mixers"][name] = mixerToJson(mixer);
    }

    j["filters"] = json::object();
    for (const auto& [name, filter] : description.filters) {
        j["filters"][name] = filterToJson(filter);
    }

    j["pipeline"] = json::array();
    for (const auto& step : description.pipeline) {
        j["pipeline"].push_back(stepToJson(step));
    }

    applyExtras(j, description.extraJson);
    return j;
}

PipelineDescription fromJson(const json& document) {
    if (!document.is_object()) {
        throw SchemaError("pipeline document must be an object");
    }

    try {
        PipelineDescription description;
        description.devices = devicesFromJson(require(document, "devices", "document"));

        if (document.contains("mixers") && document.at("mixers").is_object()) {
            for (const auto& [name, mixerJson] : document.at("mixers").items()) {
                const std::string context = "mixer '" + name + "'";
                const json& channels = require(mixerJson, "channels", context);
                MixerBlock mixer;
                mixer.channelsIn = require(channels, "in", context).get<std::size_t>();
                mixer.channelsOut = require(channels, "out", context).get<std::size_t>();
                mixer.mapping = mappingFromJson(require(mixerJson, "mapping", context), context);
                mixer.extraJson = extrasOf(mixerJson, mixerToJson(mixer));
                description.mixers.emplace(name, std::move(mixer));
            }
        }

        if (document.contains("filters") && document.at("filters").is_object()) {
            for (const auto& [name, filterJson] : document.at("filters").items()) {
                description.filters.emplace(name, filterFromJson(name, filterJson));
            }
        }

        if (document.contains("pipeline") && document.at("pipeline").is_array()) {
            for (const auto& stepJson : document.at("pipeline")) {
                const std::string type =
                    require(stepJson, "type", "pipeline step").get<std::string>();
                if (type == "Filter") {
                    FilterStep step;
                    step.channel = require(stepJson, "channel", "filter step").get<std::size_t>();
                    step.names =
                        require(stepJson, "names", "filter step").get<std::vector<std::string>>();
                    step.extraJson = extrasOf(stepJson, stepToJson(step));
                    description.pipeline.emplace_back(std::move(step));
                } else if (type == "Mixer") {
                    MixerStep step{require(stepJson, "name", "mixer step").get<std::string>()};
                    step.extraJson = extrasOf(stepJson, stepToJson(step));
                    description.pipeline.emplace_back(std::move(step));
                } else {
                    throw SchemaError("unknown pipeline step type '" + type + "'");
                }
            }
        }

        json topLevel = json::object();
        for (const auto& [key, value] : document.items()) {
            if (!isSectionKey(key)) {
                topLevel[key] = value;
            }
        }
        if (!topLevel.empty()) {
            description.extraJson = topLevel.dump();
        }
        return description;
    } catch (const json::exception& e) {
        throw SchemaError(std::string("invalid pipeline document: ") + e.what());
    }
}

std::string dump(const PipelineDescription& description, int indent) {
    return toJson(description).dump(indent);
}

PipelineDescription parse(const std::string& text) {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        throw SchemaError(std::string("pipeline document is not valid JSON: ") + e.what());
    }
    return fromJson(document);
}

}  // namespace camilla_remote::pipeline_json
