#include "control/live_control.h"

#include "core/error_codes.h"
#include "logging/logger.h"

#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace camilla_remote::control {

LiveControl::LiveControl(LiveControlDependencies deps) : deps_(std::move(deps)) {
    if (!deps_.engine || !deps_.catalog || !deps_.display) {
        throw InvariantViolation("LiveControl requires an engine, a catalog and a display");
    }
    if (deps_.catalog->menu().topologies.empty() || deps_.catalog->menu().sources.empty()) {
        throw InvariantViolation("LiveControl requires a non-empty menu");
    }
}

void LiveControl::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    pushSelection(0, 0);
    refreshVolume();
    started_ = true;
    if (deps_.engine->getMute()) {
        LOG_INFO("LiveControl: engine is muted at startup");
        beginMuteBlink();
    }
}

bool LiveControl::handle(ControlAction action) {
    LOG_DEBUG("LiveControl: action {}", controlActionToString(action));
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        if (!started_) {
            throw ControlError("Control surface is not ready yet", ErrorCode::CONTROL_NOT_STARTED);
        }
        dispatch(action);
        return true;
    } catch (const EngineError& e) {
        LOG_ERROR("LiveControl: {} failed [{}]: {}", controlActionToString(action),
                  errorCodeToString(e.code()), e.what());
        deps_.display->showError(e.code(), e.what());
    } catch (const ControlError& e) {
        LOG_ERROR("LiveControl: {} failed [{}]: {}", controlActionToString(action),
                  errorCodeToString(e.code()), e.what());
        deps_.display->showError(e.code(), e.what());
    }
    return false;
}

void LiveControl::dispatch(ControlAction action) {
    switch (action) {
    case ControlAction::VolumeUp:
        volumeUp();
        break;
    case ControlAction::VolumeDown:
        volumeDown();
        break;
    case ControlAction::MuteToggle:
        muteToggle();
        break;
    case ControlAction::TopologyNext:
        stepTopology(+1);
        break;
    case ControlAction::TopologyPrev:
        stepTopology(-1);
        break;
    case ControlAction::SourceNext:
        stepSource(+1);
        break;
    case ControlAction::SourcePrev:
        stepSource(-1);
        break;
    case ControlAction::BalanceLeft:
        adjustBalance(BalanceSide::Left);
        break;
    case ControlAction::BalanceRight:
        adjustBalance(BalanceSide::Right);
        break;
    case ControlAction::TrackPlay:
    case ControlAction::TrackNext:
    case ControlAction::TrackPrev:
    case ControlAction::TrackStop:
    case ControlAction::Menu:
    case ControlAction::NavUp:
    case ControlAction::NavDown:
    case ControlAction::NavSelect:
    case ControlAction::NavExit:
        deps_.display->forwardAction(controlActionToString(action));
        break;
    }
}

void LiveControl::volumeUp() {
    const double volume = deps_.engine->getVolume();
    const double target = volume + deps_.settings.volumeStepDb;
    if (target <= deps_.settings.maxVolumeDb) {
        deps_.engine->setVolume(target);
        LOG_DEBUG("LiveControl: volume {:.1f} -> {:.1f} dB", volume, target);
    }
    refreshVolume();
}

void LiveControl::volumeDown() {
    const double volume = deps_.engine->getVolume();
    const double target = volume - deps_.settings.volumeStepDb;
    if (target >= deps_.settings.minVolumeDb) {
        deps_.engine->setVolume(target);
        LOG_DEBUG("LiveControl: volume {:.1f} -> {:.1f} dB", volume, target);
    }
    refreshVolume();
}

void LiveControl::muteToggle() {
    const bool muted = deps_.engine->getMute();
    deps_.engine->setMute(!muted);
    LOG_DEBUG("LiveControl: mute {} -> {}", muted, !muted);
    if (deps_.engine->getMute()) {
        beginMuteBlink();
    }
}

void LiveControl::stepTopology(int step) {
    const std::size_t next =
        cycle(topologyIndex_, step, deps_.catalog->menu().topologies.size());
    pushSelection(next, sourceIndex_);
}

void LiveControl::stepSource(int step) {
    const std::size_t next = cycle(sourceIndex_, step, deps_.catalog->menu().sources.size());
    pushSelection(topologyIndex_, next);
}

void LiveControl::adjustBalance(BalanceSide side) {
    using pipeline::GainFilter;
    namespace names = pipeline::filter_names;

    auto live = deps_.engine->getLiveConfig();
    auto left = live.filterAs<GainFilter>(names::BALANCE_LEFT);
    auto right = live.filterAs<GainFilter>(names::BALANCE_RIGHT);
    if (!left || !right) {
        throw ControlError(std::string("Live pipeline has no ") + names::BALANCE_LEFT + "/" +
                               names::BALANCE_RIGHT + " gain filters",
                           ErrorCode::CONTROL_BALANCE_UNAVAILABLE);
    }

    const double step = deps_.settings.volumeStepDb;
    double g0 = left->gain;
    double g1 = right->gain;
    // At most one side is ever attenuated
    if (side == BalanceSide::Left) {
        if (g0 == 0.0) {
            g1 -= step;
        } else {
            g0 += step;
            g1 = 0.0;
        }
    } else {
        if (g1 == 0.0) {
            g0 -= step;
        } else {
            g1 += step;
            g0 = 0.0;
        }
    }

    left->gain = g0;
    right->gain = g1;
    live.filters[names::BALANCE_LEFT] = *left;
    live.filters[names::BALANCE_RIGHT] = *right;
    deps_.engine->setLiveConfig(live);
    LOG_DEBUG("LiveControl: balance {:.1f} / {:.1f} dB", g0, g1);
}

void LiveControl::pushSelection(std::size_t topologyIndex, std::size_t sourceIndex) {
    const auto& menu = deps_.catalog->menu();
    const std::string& topology = menu.topologies.at(topologyIndex).label;
    const std::string& source = menu.sources.at(sourceIndex).label;

    if (deps_.loadMode == LoadMode::File) {
        // Fail before touching the engine if the pair is unknown
        deps_.catalog->lookup(topology, source);
        const auto path = std::filesystem::path(deps_.configDir) /
                          configFileName(topology, source);
        deps_.engine->setConfigName(path.string());
        deps_.engine->reload();
    } else {
        deps_.engine->setLiveConfig(deps_.catalog->lookup(topology, source));
    }

    topologyIndex_ = topologyIndex;
    sourceIndex_ = sourceIndex;
    LOG_DEBUG("LiveControl: selection '{}' / '{}'", topology, source);
    deps_.display->showSelection(topology, source);
}

void LiveControl::refreshVolume() {
    deps_.display->showVolume(formatVolume(deps_.engine->getVolume()));
}

void LiveControl::beginMuteBlink() {
    deps_.display->startMuteBlink([this]() { return isMuted(); });
}

std::string LiveControl::activeTopology() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deps_.catalog->menu().topologies.at(topologyIndex_).label;
}

std::string LiveControl::activeSource() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deps_.catalog->menu().sources.at(sourceIndex_).label;
}

bool LiveControl::isStarted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_;
}

bool LiveControl::isMuted() {
    std::lock_guard<std::mutex> lock(mutex_);
    return deps_.engine->getMute();
}

LiveStatus LiveControl::status() {
    std::lock_guard<std::mutex> lock(mutex_);
    LiveStatus status;
    status.topology = deps_.catalog->menu().topologies.at(topologyIndex_).label;
    status.source = deps_.catalog->menu().sources.at(sourceIndex_).label;
    status.volumeDb = deps_.engine->getVolume();
    status.muted = deps_.engine->getMute();
    return status;
}

std::string LiveControl::formatVolume(double volumeDb) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << std::setw(5) << volumeDb;
    return oss.str();
}

std::string LiveControl::configFileName(const std::string& topologyLabel,
                                        const std::string& sourceLabel) {
    std::string label = topologyLabel;
    std::replace(label.begin(), label.end(), ' ', '-');
    return sourceLabel + "-" + label + ".yml";
}

std::size_t LiveControl::cycle(std::size_t index, int step, std::size_t length) {
    const auto n = static_cast<long long>(length);
    const long long next = (static_cast<long long>(index) + step) % n;
    return static_cast<std::size_t>((next + n) % n);
}

}  // namespace camilla_remote::control
