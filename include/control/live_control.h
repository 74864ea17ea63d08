/**
 * @file live_control.h
 * @brief Live control state machine for the running DSP engine
 *
 * Tracks the selected (topology, source) menu positions and maps control
 * actions onto engine reads and writes. Volume and mute are never cached;
 * every read goes to the engine.
 */

#pragma once

#include "control/configuration_catalog.h"
#include "control/control_action.h"
#include "control/display_sink.h"
#include "core/config_loader.h"
#include "engine/dsp_engine.h"

#include <cstddef>
#include <mutex>
#include <string>

namespace camilla_remote::control {

struct LiveControlDependencies {
    engine::DspEngine* engine = nullptr;
    const ConfigurationCatalog* catalog = nullptr;
    DisplaySink* display = nullptr;
    ControlSettings settings;
    LoadMode loadMode = LoadMode::Object;
    // Directory holding "<source>-<topology>.yml" files for LoadMode::File
    std::string configDir;
};

struct LiveStatus {
    std::string topology;
    std::string source;
    double volumeDb = 0.0;
    bool muted = false;
};

class LiveControl {
   public:
    // @throws InvariantViolation when a dependency is missing
    explicit LiveControl(LiveControlDependencies deps);

    LiveControl(const LiveControl&) = delete;
    LiveControl& operator=(const LiveControl&) = delete;

    /**
     * @brief Push the first menu entry live and publish the initial display state.
     *
     * Starts the mute blink when the engine is already muted.
     * @throws EngineError when the engine cannot be reached
     */
    void start();

    /**
     * @brief Apply one control action.
     *
     * Engine and control failures are reported to the display and leave the menu
     * position unchanged.
     * @return false when the action failed
     */
    bool handle(ControlAction action);

    std::string activeTopology() const;
    std::string activeSource() const;
    bool isStarted() const;

    // Engine mute state, serialized with transitions. Used as the blink poll.
    bool isMuted();

    // @throws EngineError
    LiveStatus status();

    // One decimal place, right-aligned to five columns: "-12.5", "  0.0"
    static std::string formatVolume(double volumeDb);

    // "<source>-<topology label, spaces as '-'>.yml", e.g. "Stream-2.1-DRC.yml"
    static std::string configFileName(const std::string& topologyLabel,
                                      const std::string& sourceLabel);

   private:
    enum class BalanceSide { Left, Right };

    void dispatch(ControlAction action);
    void volumeUp();
    void volumeDown();
    void muteToggle();
    void stepTopology(int step);
    void stepSource(int step);
    void adjustBalance(BalanceSide side);
    void pushSelection(std::size_t topologyIndex, std::size_t sourceIndex);
    void refreshVolume();
    void beginMuteBlink();

    static std::size_t cycle(std::size_t index, int step, std::size_t length);

    LiveControlDependencies deps_;
    mutable std::mutex mutex_;
    std::size_t topologyIndex_ = 0;
    std::size_t sourceIndex_ = 0;
    bool started_ = false;
};

}  // namespace camilla_remote::control
