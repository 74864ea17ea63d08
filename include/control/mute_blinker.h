/**
 * @file mute_blinker.h
 * @brief Cancellable periodic task that blinks the volume readout while muted
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace camilla_remote::control {

class MuteBlinker {
   public:
    // Returns true while the engine is muted
    using MutedPoll = std::function<bool()>;
    // Receives the visibility the readout should have after this period
    using VisibilityCallback = std::function<void(bool visible)>;

    explicit MuteBlinker(int intervalMs);
    ~MuteBlinker();

    MuteBlinker(const MuteBlinker&) = delete;
    MuteBlinker& operator=(const MuteBlinker&) = delete;

    /**
     * @brief Start blinking.
     *
     * Every interval the poll runs once. While it reports muted, visibility
     * toggles; the first unmuted poll restores visibility and ends the task.
     * A poll that throws EngineError is treated as unmuted. While running this
     * only re-arms: a cycle that is about to end starts over with the new poll
     * and callback instead of ending.
     */
    void start(MutedPoll poll, VisibilityCallback onVisibility);

    // Cancel and restore visibility. Safe to call when not running.
    void stop();

    bool isRunning() const {
        return running_.load();
    }
    int intervalMs() const {
        return intervalMs_;
    }

   private:
    void run(MutedPoll poll, VisibilityCallback onVisibility);

    int intervalMs_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    bool cancelled_ = false;
    bool rearmed_ = false;
    MutedPoll pendingPoll_;
    VisibilityCallback pendingVisibility_;
    std::mutex mutex_;
    std::condition_variable cv_;
};

}  // namespace camilla_remote::control
