/**
 * @file test_blink_monitor_system.cpp
 * @brief Frame-level tests for BlinkMonitorSystem and the event log format
 *
 * Runs processFrame() on blank frames with a scripted detector, so no
 * camera, window or model file is involved. The logged fixture writes the
 * event log into a temp directory and reads it back.
 */

#include <gtest/gtest.h>
#include <deque>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include "../include/blink_monitor_system.h"
#include "../include/logger.h"
#include "detection_fixtures.h"

using namespace BlinkMonitor;

namespace {
    TimePoint at(long long ms) {
        return TimePoint{} + std::chrono::milliseconds(ms);
    }
}

/**
 * @brief Returns one scripted batch per estimate() call
 */
class ScriptedLandmarkDetector : public LandmarkDetector {
public:
    std::deque<std::vector<RawDetection>> *script;

    explicit ScriptedLandmarkDetector(std::deque<std::vector<RawDetection>> *frames) : script(frames) {}

    bool initialize() override { return true; }
    bool isInitialized() const override { return true; }

    std::vector<RawDetection> estimate(const cv::Mat &) override {
        if (script->empty()) {
            return {};
        }
        std::vector<RawDetection> next = script->front();
        script->pop_front();
        return next;
    }
};

class BlinkMonitorSystemTest : public ::testing::Test {
protected:
    std::deque<std::vector<RawDetection>> frames;
    std::unique_ptr<BlinkMonitorSystem> system;
    cv::Mat frame;

    void SetUp() override {
        Config config;
        config.show_window = false;
        config.enable_low_rate_alert = false;
        system = std::make_unique<BlinkMonitorSystem>(
            config, std::make_unique<ScriptedLandmarkDetector>(&frames));
        ASSERT_TRUE(system->initialize());
        system->resetSession(at(0));
    }

    bool step(long long ms) {
        frame = cv::Mat::zeros(240, 320, CV_8UC3);
        return system->processFrame(frame, at(ms));
    }
};

TEST_F(BlinkMonitorSystemTest, CountsBlinkAcrossFrames) {
    frames.push_back({Fixtures::makeDetection(true, true)});
    frames.push_back({Fixtures::makeDetection(false, false)});
    frames.push_back({Fixtures::makeDetection(false, false)});
    frames.push_back({Fixtures::makeDetection(true, true)});

    EXPECT_TRUE(step(0));
    EXPECT_TRUE(step(33));
    EXPECT_TRUE(step(66));
    EXPECT_TRUE(step(99));

    BlinkStats stats = system->getBlinkDetector().stats(at(100));
    EXPECT_EQ(stats.total_blinks, 1);
    EXPECT_EQ(stats.left_eye_blinks, 1);
    EXPECT_EQ(stats.right_eye_blinks, 1);
}

TEST_F(BlinkMonitorSystemTest, FrameWithoutFaceLeavesStateAlone) {
    frames.push_back({Fixtures::makeDetection(false, true)});
    frames.push_back({});

    EXPECT_TRUE(step(0));
    EXPECT_FALSE(step(33));

    EXPECT_EQ(system->getBlinkDetector().totalBlinks(), 1);
    EXPECT_FALSE(system->getBlinkDetector().getEyeState().left);
}

TEST_F(BlinkMonitorSystemTest, LargestFaceDrivesTracking) {
    frames.push_back({
        Fixtures::makeDetection(true, true, std::nullopt, 40.0f),
        Fixtures::makeDetection(false, true, std::nullopt, 200.0f),
    });

    EXPECT_TRUE(step(0));

    EXPECT_EQ(system->getBlinkDetector().totalBlinks(), 1);
    EXPECT_FALSE(system->getBlinkDetector().getEyeState().left);
}

TEST_F(BlinkMonitorSystemTest, ResetSessionStartsOver) {
    frames.push_back({Fixtures::makeDetection(false, false)});
    frames.push_back({Fixtures::makeDetection(false, false)});

    step(0);
    system->resetSession(at(500));
    step(600);

    EXPECT_EQ(system->getBlinkDetector().totalBlinks(), 1);
    EXPECT_EQ(system->getBlinkDetector().getHistory().events().front().timestamp, at(600));
}

TEST_F(BlinkMonitorSystemTest, OverlayIsDrawnOnFrame) {
    frames.push_back({Fixtures::makeDetection(true, true)});
    step(0);
    EXPECT_GT(cv::countNonZero(frame.reshape(1)), 0);
}

/**
 * @brief Low-rate alerting and event logging, checked through the JSON-lines log
 */
class LoggedBlinkMonitorTest : public ::testing::Test {
protected:
    std::filesystem::path dir;
    std::deque<std::vector<RawDetection>> frames;
    std::unique_ptr<BlinkMonitorSystem> system;
    cv::Mat frame;

    void SetUp() override {
        dir = std::filesystem::temp_directory_path() /
              (std::string("blink_monitor_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(dir);

        Config config;
        config.show_window = false;
        config.enable_console_logging = false;
        config.enable_file_logging = true;
        config.enable_file_logging_json = true;
        config.save_snapshots = true;
        config.enable_low_rate_alert = true;
        config.low_rate_grace_seconds = 60.0;
        config.log_path = (dir / "logs").string() + "/";
        config.snapshot_path = (dir / "snapshots").string() + "/";
        Logger::getInstance().setupConfig(config);

        system = std::make_unique<BlinkMonitorSystem>(
            config, std::make_unique<ScriptedLandmarkDetector>(&frames));
        ASSERT_TRUE(system->initialize());
        system->resetSession(at(0));
    }

    void TearDown() override {
        Logger::shutdown();
        std::filesystem::remove_all(dir);
    }

    bool step(long long ms) {
        frame = cv::Mat::zeros(240, 320, CV_8UC3);
        return system->processFrame(frame, at(ms));
    }

    void openFrame(long long ms) {
        frames.push_back({Fixtures::makeDetection(true, true)});
        step(ms);
    }

    void closedFrame(long long ms) {
        frames.push_back({Fixtures::makeDetection(false, false)});
        step(ms);
    }

    void emptyFrame(long long ms) {
        frames.push_back({});
        step(ms);
    }

    // Flushes the logger, then returns every logged entry of the given kind
    std::vector<nlohmann::json> loggedEvents(const std::string &kind) {
        Logger::shutdown();

        std::vector<nlohmann::json> matches;
        std::ifstream file(dir / "logs" / "blink_log.jsonl");
        std::string line;
        while (std::getline(file, line)) {
            nlohmann::json entry = nlohmann::json::parse(line);
            if (entry["event"] == kind) {
                matches.push_back(entry);
            }
        }
        return matches;
    }
};

TEST_F(LoggedBlinkMonitorTest, NoAlertDuringGracePeriod) {
    openFrame(1000);
    openFrame(59999);

    EXPECT_FALSE(system->getLastRateStatus().has_value());
    EXPECT_TRUE(loggedEvents("LOW_BLINK_RATE").empty());
}

TEST_F(LoggedBlinkMonitorTest, AlertsOnceWhenRateEntersLow) {
    openFrame(60000);
    openFrame(61000);
    openFrame(62000);

    ASSERT_TRUE(system->getLastRateStatus().has_value());
    EXPECT_EQ(*system->getLastRateStatus(), BlinkRateStatus::LOW);

    std::vector<nlohmann::json> alerts = loggedEvents("LOW_BLINK_RATE");
    ASSERT_EQ(alerts.size(), 1u);
    EXPECT_EQ(alerts[0]["blink_rate"], 0);
    ASSERT_TRUE(alerts[0].contains("image"));
    EXPECT_TRUE(std::filesystem::exists(alerts[0]["image"].get<std::string>()));
}

TEST_F(LoggedBlinkMonitorTest, AlertsAgainAfterLeavingLow) {
    openFrame(60000);

    for (int i = 0; i < 8; ++i) {
        long long t = 61000 + i * 500;
        closedFrame(t);
        openFrame(t + 250);
    }
    ASSERT_TRUE(system->getLastRateStatus().has_value());
    EXPECT_EQ(*system->getLastRateStatus(), BlinkRateStatus::SLIGHTLY_LOW);

    // every blink above is older than a minute by now
    openFrame(125000);
    EXPECT_EQ(*system->getLastRateStatus(), BlinkRateStatus::LOW);

    EXPECT_EQ(loggedEvents("LOW_BLINK_RATE").size(), 2u);
    EXPECT_EQ(loggedEvents("BLINK").size(), 8u);
}

TEST_F(LoggedBlinkMonitorTest, ResetRestartsGracePeriod) {
    openFrame(60000);
    ASSERT_TRUE(system->getLastRateStatus().has_value());

    system->resetSession(at(70000));
    EXPECT_FALSE(system->getLastRateStatus().has_value());

    openFrame(80000);
    EXPECT_FALSE(system->getLastRateStatus().has_value());

    openFrame(130000);
    ASSERT_TRUE(system->getLastRateStatus().has_value());
    EXPECT_EQ(*system->getLastRateStatus(), BlinkRateStatus::LOW);

    EXPECT_EQ(loggedEvents("LOW_BLINK_RATE").size(), 2u);
    EXPECT_EQ(loggedEvents("SESSION_RESET").size(), 2u);
}

TEST_F(LoggedBlinkMonitorTest, FaceLossIsLoggedOncePerLoss) {
    openFrame(0);
    emptyFrame(33);
    emptyFrame(66);
    emptyFrame(99);
    openFrame(132);
    emptyFrame(165);

    std::vector<nlohmann::json> losses = loggedEvents("NO_FACE_DETECTED");
    ASSERT_EQ(losses.size(), 2u);
    EXPECT_EQ(losses[0]["message"], "No face detected");
}
