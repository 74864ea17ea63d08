#include "control/mute_blinker.h"

#include "core/error_codes.h"
#include "logging/logger.h"

#include <chrono>

namespace camilla_remote::control {

MuteBlinker::MuteBlinker(int intervalMs) : intervalMs_(intervalMs) {}

MuteBlinker::~MuteBlinker() {
    stop();
}

void MuteBlinker::start(MutedPoll poll, VisibilityCallback onVisibility) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_.load()) {
            if (!cancelled_) {
                rearmed_ = true;
                pendingPoll_ = std::move(poll);
                pendingVisibility_ = std::move(onVisibility);
            }
            return;
        }
        cancelled_ = false;
        rearmed_ = false;
    }
    // A previous cycle may have ended on its own; reap its thread first
    if (thread_.joinable()) {
        thread_.join();
    }
    running_.store(true);
    thread_ = std::thread(&MuteBlinker::run, this, std::move(poll), std::move(onVisibility));
    LOG_DEBUG("Mute blink started ({}ms)", intervalMs_);
}

void MuteBlinker::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

void MuteBlinker::run(MutedPoll poll, VisibilityCallback onVisibility) {
    bool visible = true;
    while (true) {
        bool cancelled = false;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cancelled = cv_.wait_for(lock, std::chrono::milliseconds(intervalMs_),
                                     [this] { return cancelled_; });
        }

        bool muted = false;
        if (!cancelled) {
            try {
                muted = poll();
            } catch (const EngineError& e) {
                LOG_ERROR("Mute blink: mute poll failed: {}", e.what());
                muted = false;
            }
        }

        if (muted) {
            {
                // Still blinking, so an earlier re-arm request is already satisfied
                std::lock_guard<std::mutex> lock(mutex_);
                rearmed_ = false;
                pendingPoll_ = nullptr;
                pendingVisibility_ = nullptr;
            }
            visible = !visible;
            onVisibility(visible);
            continue;
        }

        onVisibility(true);

        // The exit decision and running_ = false happen under the same lock start() takes
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_ || !rearmed_) {
            rearmed_ = false;
            pendingPoll_ = nullptr;
            pendingVisibility_ = nullptr;
            running_.store(false);
            break;
        }
        rearmed_ = false;
        poll = std::move(pendingPoll_);
        onVisibility = std::move(pendingVisibility_);
        pendingPoll_ = nullptr;
        pendingVisibility_ = nullptr;
        visible = true;
        LOG_DEBUG("Mute blink re-armed");
    }

    LOG_DEBUG("Mute blink stopped");
}

}  // namespace camilla_remote::control
