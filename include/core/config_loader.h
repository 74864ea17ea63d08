#ifndef CONFIG_LOADER_H
#define CONFIG_LOADER_H

#include "control/menu_layout.h"
#include "core/remote_constants.h"
#include "pipeline/pipeline_synthesizer.h"

#include <filesystem>
#include <string>

constexpr const char* DEFAULT_CONFIG_FILE = "config.json";

namespace camilla_remote {

// How a selection change reaches the engine
enum class LoadMode {
    Object,  // Push the cataloged description (primary path)
    File     // SetConfigName(<configDir>/<source>-<label>.yml) + Reload
};

struct ControlSettings {
    double volumeStepDb = RemoteConstants::VOLUME_STEP_DB;
    double minVolumeDb = RemoteConstants::MIN_VOLUME_DB;
    double maxVolumeDb = RemoteConstants::MAX_VOLUME_DB;
    int blinkIntervalMs = RemoteConstants::MUTE_BLINK_INTERVAL_MS;
};

struct RemoteConfig {
    std::string engineEndpoint = RemoteConstants::DEFAULT_ENGINE_ENDPOINT;
    int engineTimeoutMs = RemoteConstants::DEFAULT_ENGINE_TIMEOUT_MS;
    std::string controlEndpoint = RemoteConstants::DEFAULT_CONTROL_ENDPOINT;
    std::string configDir = RemoteConstants::DEFAULT_CONFIG_DIR;  // "~" expanded on load
    LoadMode loadMode = LoadMode::Object;

    pipeline::HardwareParams hardware = defaultHardware();
    control::MenuLayout menu = control::defaultMenuLayout();
    ControlSettings controls;

    static pipeline::HardwareParams defaultHardware();
};

// Convert string to LoadMode (returns Object for invalid input)
LoadMode parseLoadMode(const std::string& str);

// Convert LoadMode to string ("object", "file")
const char* loadModeToString(LoadMode mode);

// Replace a leading "~" with $HOME
std::string expandHome(const std::string& path);

/**
 * @brief Load daemon configuration from a JSON file.
 *
 * outConfig is reset to defaults first; keys present in the file override them.
 *
 * @return false when the file is missing, unparsable or describes an unusable menu
 */
bool loadRemoteConfig(const std::filesystem::path& configPath, RemoteConfig& outConfig,
                      bool verbose = true);

}  // namespace camilla_remote

#endif  // CONFIG_LOADER_H
