/**
 * @file test_control_server.cpp
 * @brief Unit tests for the control command handlers and the event display
 */

#include "control/control_server.h"
#include "control/zmq_display.h"
#include "support/fake_engine.h"

#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace camilla_remote;
using namespace camilla_remote::control;
using camilla_remote::testing::FakeEngine;
using nlohmann::json;

namespace {

class EventLog {
   public:
    ZmqDisplay::Publisher publisher() {
        return [this](const json& event) {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(event);
        };
    }

    std::vector<json> ofType(const std::string& type) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<json> out;
        for (const auto& e : events_) {
            if (e["type"] == type) {
                out.push_back(e);
            }
        }
        return out;
    }

   private:
    std::mutex mutex_;
    std::vector<json> events_;
};

}  // namespace

class ControlServerTest : public ::testing::Test {
   protected:
    void SetUp() override {
        pipeline::HardwareParams hw;
        hw.correctionFilterPath = "/cfg/filters/drc.wav";
        hw.balanceFilters = true;
        catalog_ = std::make_unique<ConfigurationCatalog>(
            ConfigurationCatalog::build(defaultMenuLayout(), hw, engine_));
        display_ = std::make_unique<ZmqDisplay>(events_.publisher(), 10);

        LiveControlDependencies deps;
        deps.engine = &engine_;
        deps.catalog = catalog_.get();
        deps.display = display_.get();
        live_ = std::make_unique<LiveControl>(deps);
        live_->start();

        server_ = std::make_unique<ControlServer>("ipc:///tmp/camilla_remote_control_test.sock");
        server_->setLiveControl(live_.get());
    }

    void TearDown() override {
        display_->stopMuteBlink();
    }

    EventLog events_;
    FakeEngine engine_;
    std::unique_ptr<ConfigurationCatalog> catalog_;
    std::unique_ptr<ZmqDisplay> display_;
    std::unique_ptr<LiveControl> live_;
    std::unique_ptr<ControlServer> server_;
};

// ============================================================
// Request handling
// ============================================================

TEST_F(ControlServerTest, PingAnswersInBothFormats) {
    EXPECT_EQ(server_->handleRaw("PING"), "OK");
    auto resp = json::parse(server_->handleRaw(R"({"cmd":"PING"})"));
    EXPECT_EQ(resp["status"], "ok");
}

TEST_F(ControlServerTest, JsonActionIsApplied) {
    engine_.volume = -6.0;
    auto resp =
        json::parse(server_->handleRaw(R"({"cmd":"ACTION","params":{"action":"volume_up"}})"));

    EXPECT_EQ(resp["status"], "ok");
    EXPECT_EQ(resp["message"], "volume_up");
    EXPECT_DOUBLE_EQ(engine_.volume, -5.5);
}

TEST_F(ControlServerTest, TextActionAcceptsAliases) {
    EXPECT_EQ(server_->handleRaw("ACTION:config_next"), "OK:topology_next");
    EXPECT_EQ(live_->activeTopology(), "2.1");
}

TEST_F(ControlServerTest, UnknownActionIsRejected) {
    auto resp =
        json::parse(server_->handleRaw(R"({"cmd":"ACTION","params":{"action":"eject"}})"));
    EXPECT_EQ(resp["status"], "error");
    EXPECT_EQ(resp["error_code"], "CONTROL_INVALID_ACTION");

    EXPECT_EQ(server_->handleRaw("ACTION:eject"), "ERR:Unknown action: eject");
}

TEST_F(ControlServerTest, MissingActionIsInvalidParams) {
    auto resp = json::parse(server_->handleRaw(R"({"cmd":"ACTION"})"));
    EXPECT_EQ(resp["error_code"], "IPC_INVALID_PARAMS");
    EXPECT_EQ(server_->handleRaw("ACTION"), "ERR:ACTION requires an action name");
}

TEST_F(ControlServerTest, FailedActionReportsError) {
    engine_.failOn("setLiveConfig");
    auto resp =
        json::parse(server_->handleRaw(R"({"cmd":"ACTION","params":{"action":"source_next"}})"));

    EXPECT_EQ(resp["status"], "error");
    EXPECT_EQ(resp["error_code"], "CONTROL_ACTION_FAILED");
    EXPECT_EQ(live_->activeSource(), "Stream");

    auto errors = events_.ofType("error");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0]["error_code"], "ENGINE_CONNECTION_FAILED");
    EXPECT_EQ(errors[0]["category"], "engine");
}

TEST_F(ControlServerTest, StatusReportsSelectionAndVolume) {
    engine_.volume = -12.5;
    auto resp = json::parse(server_->handleRaw(R"({"cmd":"STATUS"})"));

    ASSERT_EQ(resp["status"], "ok");
    EXPECT_EQ(resp["data"]["topology"], "2.1 DRC");
    EXPECT_EQ(resp["data"]["source"], "Stream");
    EXPECT_EQ(resp["data"]["volume"], "-12.5");
    EXPECT_EQ(resp["data"]["muted"], false);
}

TEST_F(ControlServerTest, StatusEngineFailureCarriesEngineCode) {
    engine_.failOn("getVolume");
    auto resp = json::parse(server_->handleRaw(R"({"cmd":"STATUS"})"));
    EXPECT_EQ(resp["error_code"], "ENGINE_CONNECTION_FAILED");
}

TEST_F(ControlServerTest, UnknownCommandAndBadJson) {
    auto resp = json::parse(server_->handleRaw(R"({"cmd":"EJECT"})"));
    EXPECT_EQ(resp["error_code"], "IPC_INVALID_COMMAND");

    auto bad = json::parse(server_->handleRaw("{broken"));
    EXPECT_EQ(bad["error_code"], "IPC_PROTOCOL_ERROR");
}

TEST(ControlServerStandaloneTest, ActionWithoutLiveControlIsRejected) {
    ControlServer server("ipc:///tmp/camilla_remote_control_unattached.sock");
    auto resp =
        json::parse(server.handleRaw(R"({"cmd":"ACTION","params":{"action":"mute"}})"));
    EXPECT_EQ(resp["error_code"], "CONTROL_NOT_STARTED");
}

// ============================================================
// Display events
// ============================================================

TEST_F(ControlServerTest, StartupPublishesSelectionAndVolume) {
    auto selections = events_.ofType("selection");
    ASSERT_EQ(selections.size(), 1u);
    EXPECT_EQ(selections[0]["topology"], "2.1 DRC");
    EXPECT_EQ(selections[0]["source"], "Stream");

    auto volumes = events_.ofType("volume");
    ASSERT_EQ(volumes.size(), 1u);
    EXPECT_EQ(volumes[0]["value"], "  0.0");
}

TEST_F(ControlServerTest, UnboundActionIsPublished) {
    EXPECT_EQ(server_->handleRaw("ACTION:track_next"), "OK:track_next");

    auto actions = events_.ofType("action");
    ASSERT_EQ(actions.size(), 1u);
    EXPECT_EQ(actions[0]["action"], "track_next");
}

TEST_F(ControlServerTest, MutePublishesBlinkTicks) {
    EXPECT_EQ(server_->handleRaw("ACTION:mute"), "OK:mute_toggle");
    EXPECT_TRUE(display_->isBlinking());

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (events_.ofType("volume_visible").size() < 2 &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    auto ticks = events_.ofType("volume_visible");
    ASSERT_GE(ticks.size(), 2u);
    EXPECT_EQ(ticks[0]["visible"], false);
    EXPECT_EQ(ticks[1]["visible"], true);

    EXPECT_EQ(server_->handleRaw("ACTION:mute"), "OK:mute_toggle");
    const auto stopDeadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (display_->isBlinking() && std::chrono::steady_clock::now() < stopDeadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_FALSE(display_->isBlinking());
    EXPECT_EQ(events_.ofType("volume_visible").back()["visible"], true);
}
