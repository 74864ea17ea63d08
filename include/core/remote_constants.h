#ifndef REMOTE_CONSTANTS_H
#define REMOTE_CONSTANTS_H

// Defaults shared across daemon components

namespace RemoteConstants {

// Engine connection
constexpr const char* DEFAULT_ENGINE_ENDPOINT = "tcp://127.0.0.1:31234";
constexpr int DEFAULT_ENGINE_TIMEOUT_MS = 5000;

// Control surface (REP for actions, PUB for display events)
constexpr const char* DEFAULT_CONTROL_ENDPOINT = "ipc:///tmp/camilla_remote.sock";
constexpr const char* ZEROMQ_PUB_SUFFIX = ".pub";

// Hardware
constexpr const char* DEFAULT_CONFIG_DIR = "~/my-camilladsp-config";
constexpr const char* DEFAULT_PLAYBACK_DEVICE = "hw:CARD=M4,DEV=0";
constexpr int DEFAULT_PLAYBACK_CHANNELS = 4;
constexpr int DEFAULT_SAMPLE_RATE = 44100;
constexpr double DEFAULT_CROSSOVER_FREQUENCY = 80.0;
constexpr double DEFAULT_MAINS_DELAY_MS = 9.2;
constexpr const char* DEFAULT_CORRECTION_FILTER = "filters/drc.wav";
constexpr const char* DEFAULT_LOOPBACK_DEVICE = "hw:Loopback,1";

// Volume control
constexpr double VOLUME_STEP_DB = 0.5;
constexpr double MIN_VOLUME_DB = -99.5;
constexpr double MAX_VOLUME_DB = 0.0;

// Mute blink period
constexpr int MUTE_BLINK_INTERVAL_MS = 500;

}  // namespace RemoteConstants

#endif  // REMOTE_CONSTANTS_H
