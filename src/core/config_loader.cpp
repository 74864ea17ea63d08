#include "core/config_loader.h"

#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace camilla_remote {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string resolveAgainst(const std::string& dir, const std::string& path) {
    std::filesystem::path p(expandHome(path));
    if (p.is_absolute()) {
        return p.string();
    }
    return (std::filesystem::path(dir) / p).string();
}

bool parseMenu(const nlohmann::json& menuJson, control::MenuLayout& menu, bool verbose) {
    if (menuJson.contains("topologies")) {
        const auto& list = menuJson["topologies"];
        if (!list.is_array()) {
            if (verbose) {
                LOG_ERROR("Config: menu.topologies must be a list of labels");
            }
            return false;
        }
        menu.topologies.clear();
        for (const auto& entry : list) {
            const std::string label = entry.get<std::string>();
            auto option = control::parseTopologyOption(label);
            if (!option) {
                if (verbose) {
                    LOG_ERROR("Config: unknown topology label '{}' (expected Mono|2.0|2.1|2.2 "
                              "optionally followed by DRC)",
                              label);
                }
                return false;
            }
            menu.topologies.push_back(*option);
        }
    }

    if (menuJson.contains("sources")) {
        const auto& list = menuJson["sources"];
        if (!list.is_array()) {
            if (verbose) {
                LOG_ERROR("Config: menu.sources must be a list");
            }
            return false;
        }
        menu.sources.clear();
        for (const auto& entry : list) {
            if (entry.is_string()) {
                menu.sources.push_back(control::sourceOptionFromLabel(entry.get<std::string>()));
                continue;
            }
            control::SourceOption option;
            option.label = entry.at("label").get<std::string>();
            const std::string kind = entry.value("kind", "");
            if (kind.empty()) {
                option = control::sourceOptionFromLabel(option.label);
            } else {
                auto parsed = pipeline::parseInputSourceKind(kind);
                if (!parsed) {
                    if (verbose) {
                        LOG_ERROR("Config: source '{}' has unknown kind '{}' (streamed|direct)",
                                  option.label, kind);
                    }
                    return false;
                }
                option.source = *parsed;
            }
            menu.sources.push_back(option);
        }
    }

    const std::string problem = control::validateMenuLayout(menu);
    if (!problem.empty()) {
        if (verbose) {
            LOG_ERROR("Config: invalid menu: {}", problem);
        }
        return false;
    }
    return true;
}

}  // namespace

pipeline::HardwareParams RemoteConfig::defaultHardware() {
    pipeline::HardwareParams hw;
    hw.playbackDevice = RemoteConstants::DEFAULT_PLAYBACK_DEVICE;
    hw.playbackChannels = RemoteConstants::DEFAULT_PLAYBACK_CHANNELS;
    hw.sampleRate = RemoteConstants::DEFAULT_SAMPLE_RATE;
    hw.crossoverFrequency = RemoteConstants::DEFAULT_CROSSOVER_FREQUENCY;
    hw.mainsDelayMs = RemoteConstants::DEFAULT_MAINS_DELAY_MS;
    hw.correctionFilterPath = resolveAgainst(expandHome(RemoteConstants::DEFAULT_CONFIG_DIR),
                                             RemoteConstants::DEFAULT_CORRECTION_FILTER);
    hw.loopbackDevice = RemoteConstants::DEFAULT_LOOPBACK_DEVICE;
    hw.balanceFilters = true;
    return hw;
}

LoadMode parseLoadMode(const std::string& str) {
    if (toLower(str) == "file") {
        return LoadMode::File;
    }
    return LoadMode::Object;
}

const char* loadModeToString(LoadMode mode) {
    switch (mode) {
    case LoadMode::File:
        return "file";
    case LoadMode::Object:
        return "object";
    }
    return "object";
}

std::string expandHome(const std::string& path) {
    if (path.empty() || path.front() != '~') {
        return path;
    }
    if (path.size() > 1 && path[1] != '/') {
        return path;  // ~user is not supported
    }
    const char* home = std::getenv("HOME");
    if (!home) {
        return path;
    }
    return std::string(home) + path.substr(1);
}

bool loadRemoteConfig(const std::filesystem::path& configPath, RemoteConfig& outConfig,
                      bool verbose) {
    outConfig = RemoteConfig{};
    outConfig.configDir = expandHome(outConfig.configDir);

    std::ifstream file(configPath);
    if (!file.is_open()) {
        if (verbose) {
            std::cout << "Config: " << configPath << " not found, using defaults" << '\n';
        }
        return false;
    }

    try {
        nlohmann::json j;
        file >> j;

        if (j.contains("engineEndpoint")) {
            outConfig.engineEndpoint = j["engineEndpoint"].get<std::string>();
        }
        if (j.contains("engineTimeoutMs")) {
            outConfig.engineTimeoutMs = j["engineTimeoutMs"].get<int>();
        }
        if (j.contains("controlEndpoint")) {
            outConfig.controlEndpoint = j["controlEndpoint"].get<std::string>();
        }
        if (j.contains("configDir")) {
            outConfig.configDir = expandHome(j["configDir"].get<std::string>());
        }
        if (j.contains("loadMode") && j["loadMode"].is_string()) {
            std::string modeStr = j["loadMode"].get<std::string>();
            std::string normalized = toLower(modeStr);
            if (normalized != "object" && normalized != "file" && verbose) {
                LOG_WARN("Config: Unsupported loadMode '{}', falling back to 'object'", modeStr);
            }
            outConfig.loadMode = parseLoadMode(modeStr);
        }

        std::string correctionFilter = RemoteConstants::DEFAULT_CORRECTION_FILTER;
        auto& hw = outConfig.hardware;
        if (j.contains("hardware") && j["hardware"].is_object()) {
            const auto& h = j["hardware"];
            if (h.contains("playbackDevice")) {
                hw.playbackDevice = h["playbackDevice"].get<std::string>();
            }
            if (h.contains("playbackChannels")) {
                hw.playbackChannels = h["playbackChannels"].get<std::size_t>();
            }
            if (h.contains("sampleRate")) {
                hw.sampleRate = h["sampleRate"].get<int>();
            }
            if (h.contains("crossoverFrequency")) {
                hw.crossoverFrequency = h["crossoverFrequency"].get<double>();
            }
            if (h.contains("mainsDelayMs")) {
                hw.mainsDelayMs = h["mainsDelayMs"].get<double>();
            }
            if (h.contains("correctionFilter")) {
                correctionFilter = h["correctionFilter"].get<std::string>();
            }
            if (h.contains("loopbackDevice")) {
                hw.loopbackDevice = h["loopbackDevice"].get<std::string>();
            }
            if (h.contains("sampleFormat")) {
                hw.sampleFormat = h["sampleFormat"].get<std::string>();
            }
            if (h.contains("balanceFilters")) {
                hw.balanceFilters = h["balanceFilters"].get<bool>();
            }
        }
        hw.correctionFilterPath = resolveAgainst(outConfig.configDir, correctionFilter);

        // Direct capture reads channels 2 and 3 of the playback device
        if (hw.playbackChannels < 4) {
            if (verbose) {
                LOG_ERROR("Config: hardware.playbackChannels must be at least 4 (got {})",
                          hw.playbackChannels);
            }
            return false;
        }
        if (hw.sampleRate <= 0 || hw.crossoverFrequency <= 0.0 || hw.mainsDelayMs < 0.0) {
            if (verbose) {
                LOG_ERROR("Config: sampleRate and crossoverFrequency must be positive, "
                          "mainsDelayMs non-negative");
            }
            return false;
        }

        if (j.contains("menu") && j["menu"].is_object()) {
            if (!parseMenu(j["menu"], outConfig.menu, verbose)) {
                return false;
            }
        }

        if (j.contains("control") && j["control"].is_object()) {
            const auto& c = j["control"];
            auto& ctl = outConfig.controls;
            if (c.contains("volumeStepDb")) {
                ctl.volumeStepDb = c["volumeStepDb"].get<double>();
            }
            if (c.contains("minVolumeDb")) {
                ctl.minVolumeDb = c["minVolumeDb"].get<double>();
            }
            if (c.contains("maxVolumeDb")) {
                ctl.maxVolumeDb = c["maxVolumeDb"].get<double>();
            }
            if (c.contains("blinkIntervalMs")) {
                ctl.blinkIntervalMs = c["blinkIntervalMs"].get<int>();
            }
            if (ctl.volumeStepDb <= 0.0 || ctl.minVolumeDb >= ctl.maxVolumeDb ||
                ctl.blinkIntervalMs <= 0) {
                if (verbose) {
                    LOG_ERROR("Config: invalid control section (step {}, range [{}, {}], "
                              "blink {}ms)",
                              ctl.volumeStepDb, ctl.minVolumeDb, ctl.maxVolumeDb,
                              ctl.blinkIntervalMs);
                }
                return false;
            }
        }

        if (verbose) {
            LOG_INFO("Config: loaded {} (engine {}, {} topologies x {} sources, load mode {})",
                     configPath.string(), outConfig.engineEndpoint,
                     outConfig.menu.topologies.size(), outConfig.menu.sources.size(),
                     loadModeToString(outConfig.loadMode));
        }
        return true;
    } catch (const nlohmann::json::exception& e) {
        if (verbose) {
            LOG_ERROR("Config: Failed to parse {}: {}", configPath.string(), e.what());
        }
        return false;
    }
}

}  // namespace camilla_remote
