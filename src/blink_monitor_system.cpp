#include "../include/blink_monitor_system.h"
#include "../include/constants.h"
#include "../include/cv_utils.h"
#include "../include/errors.h"
#include "../include/facial_landmark_detector.h"
#include "../include/logger.h"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <filesystem>

namespace BlinkMonitor
{
    namespace
    {
        const char *WINDOW_NAME = "Blink Monitor";
    }

    BlinkMonitorSystem::BlinkMonitorSystem(const Config &config)
        : BlinkMonitorSystem(config, std::make_unique<FacialLandmarkDetector>(config.model_path))
    {
    }

    BlinkMonitorSystem::BlinkMonitorSystem(const Config &config, std::unique_ptr<LandmarkDetector> detector)
        : config_(config),
          detection_service_(std::make_unique<FaceDetectionService>(std::move(detector), config.thresholds)),
          blink_detector_(std::make_unique<BlinkDetector>(config.thresholds))
    {
    }

    bool BlinkMonitorSystem::initialize()
    {
        return detection_service_->initialize();
    }

    int BlinkMonitorSystem::run()
    {
        cv::VideoCapture cap;

        if (!config_.video_path.empty() && std::filesystem::exists(config_.video_path))
        {
            cap.open(config_.video_path);
        }
        else
        {
            cap.open(config_.camera_index);
        }

        if (!cap.isOpened())
        {
            std::cerr << "Failed to open video source" << std::endl;
            return EXIT_FAILURE;
        }

        std::cout << "Blink Monitor Started" << std::endl;
        std::cout << "Press ESC to exit, 'r' to reset the session" << std::endl;

        resetSession(Clock::now());

        cv::Mat frame;
        int frame_count = 0;
        int processed_frames = 0;
        while (cap.read(frame))
        {
            if (frame.empty())
                break;

            if (++frame_count % config_.frame_skip != 0)
                continue;

            processFrame(frame, Clock::now());
            processed_frames++;

            if (!config_.show_window)
                continue;

            cv::imshow(WINDOW_NAME, frame);
            int key = cv::waitKey(Constants::WAIT_KEY_MS);
            if (key == Constants::ESC_KEY)
                break;
            if (key == Constants::RESET_KEY)
                resetSession(Clock::now());
        }

        BlinkStats stats = blink_detector_->stats();
        std::cout << "Total Processed Frames: " << processed_frames << std::endl;
        std::cout << "Session " << CVUtils::formatSessionTime(stats.session_seconds)
                  << " | Blinks retained: " << stats.total_blinks
                  << " | Last minute: " << stats.blink_rate << std::endl;
        cleanup();
        return EXIT_SUCCESS;
    }

    bool BlinkMonitorSystem::processFrame(cv::Mat &frame, TimePoint now)
    {
        std::vector<FaceGeometry> faces;
        try
        {
            faces = detection_service_->detectFaces(frame);
        }
        catch (const NotInitializedError &e)
        {
            std::cerr << "BlinkMonitorSystem: " << e.what() << std::endl;
            return false;
        }

        if (faces.empty())
        {
            drawNoFaceDetected(frame);
            if (face_was_visible_)
            {
                BlinkStats stats = blink_detector_->stats(now);
                Logger::log(MonitorEvent::NO_FACE_DETECTED, "No face detected", 0.0, 0.0,
                            stats.blink_rate, stats.total_blinks, cv::Mat());
            }
            face_was_visible_ = false;
            return false;
        }
        face_was_visible_ = true;

        const FaceGeometry &face = selectLargestFace(faces);
        BlinkResult result = blink_detector_->observe(face.left_eye_open_probability,
                                                      face.right_eye_open_probability, now);
        BlinkStats stats = blink_detector_->stats(now);

        if (result.any_blink)
        {
            std::string which = (result.left_blink && result.right_blink) ? "both eyes"
                                : result.left_blink                       ? "left eye"
                                                                          : "right eye";
            Logger::log(MonitorEvent::BLINK, "Blink detected (" + which + ")",
                        face.left_eye_open_probability, face.right_eye_open_probability,
                        stats.blink_rate, stats.total_blinks, cv::Mat());
        }

        checkBlinkRate(stats, frame);
        drawVisualization(frame, face, stats);
        return true;
    }

    void BlinkMonitorSystem::resetSession(TimePoint now)
    {
        blink_detector_->reset(now);
        last_alerted_status_.reset();
        Logger::log(MonitorEvent::SESSION_RESET, "Session reset", 0.0, 0.0, 0, 0, cv::Mat());
    }

    void BlinkMonitorSystem::checkBlinkRate(const BlinkStats &stats, const cv::Mat &frame)
    {
        if (!config_.enable_low_rate_alert || stats.session_seconds < config_.low_rate_grace_seconds)
            return;

        BlinkRateStatus status = classifyBlinkRate(stats.blink_rate);
        bool entered_low = status == BlinkRateStatus::LOW && last_alerted_status_ != BlinkRateStatus::LOW;
        last_alerted_status_ = status;

        if (entered_low)
        {
            Logger::log(MonitorEvent::LOW_BLINK_RATE,
                        "Blink rate " + std::to_string(stats.blink_rate) + "/min is below a healthy range",
                        0.0, 0.0, stats.blink_rate, stats.total_blinks, frame);
        }
    }

    const FaceGeometry &BlinkMonitorSystem::selectLargestFace(const std::vector<FaceGeometry> &faces)
    {
        return *std::max_element(faces.begin(), faces.end(),
                                 [](const FaceGeometry &a, const FaceGeometry &b)
                                 {
                                     return std::abs(a.bounds.width * a.bounds.height) <
                                            std::abs(b.bounds.width * b.bounds.height);
                                 });
    }

    void BlinkMonitorSystem::drawNoFaceDetected(cv::Mat &frame)
    {
        cv::putText(frame, "No Face Detected", cv::Point(50, 50),
                    cv::FONT_HERSHEY_SIMPLEX, 1.2, cv::Scalar(0, 0, 255), 2);
    }

    void BlinkMonitorSystem::drawVisualization(cv::Mat &frame, const FaceGeometry &face, const BlinkStats &stats)
    {
        BlinkRateStatus status = classifyBlinkRate(stats.blink_rate);
        cv::Scalar color = CVUtils::getStatusColor(status, config_);

        cv::rectangle(frame, cv::Point(face.bounds.top_left), cv::Point(face.bounds.bottom_right), color, 3);

        cv::putText(frame, rateStatusToString(status) + " (" + std::to_string(stats.blink_rate) + "/min)",
                    cv::Point(50, 50), cv::FONT_HERSHEY_SIMPLEX, 1.2, color, 3);

        if (config_.show_keypoints)
            drawKeypoints(frame, face.landmarks);

        if (config_.show_debug_info)
        {
            cv::putText(frame, "Left open: " + CVUtils::formatDouble(face.left_eye_open_probability),
                        cv::Point(50, 90), cv::FONT_HERSHEY_SIMPLEX, 0.8, cv::Scalar(255, 255, 255), 2);
            cv::putText(frame, "Right open: " + CVUtils::formatDouble(face.right_eye_open_probability),
                        cv::Point(50, 120), cv::FONT_HERSHEY_SIMPLEX, 0.8, cv::Scalar(255, 255, 255), 2);
            cv::putText(frame, "Blinks: " + std::to_string(stats.total_blinks) +
                                   " (L " + std::to_string(stats.left_eye_blinks) +
                                   " / R " + std::to_string(stats.right_eye_blinks) + ")",
                        cv::Point(50, 150), cv::FONT_HERSHEY_SIMPLEX, 0.7, cv::Scalar(255, 255, 0), 2);
            cv::putText(frame, "Session: " + CVUtils::formatSessionTime(stats.session_seconds),
                        cv::Point(50, 180), cv::FONT_HERSHEY_SIMPLEX, 0.7, cv::Scalar(255, 255, 0), 2);

            const Thresholds &thresholds = blink_detector_->getThresholds();
            cv::putText(frame, "Closure Thresh: " + CVUtils::formatDouble(thresholds.eye_closure_threshold),
                        cv::Point(50, frame.rows - 60), cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(200, 200, 200), 1);
            cv::putText(frame, "Ratio Band: " + CVUtils::formatDouble(thresholds.closed_ratio) + "/" +
                                   CVUtils::formatDouble(thresholds.open_ratio),
                        cv::Point(50, frame.rows - 40), cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(200, 200, 200), 1);
        }
    }

    void BlinkMonitorSystem::drawKeypoints(cv::Mat &frame, const FaceLandmarks &landmarks)
    {
        const EyeState &eyes = blink_detector_->getEyeState();
        cv::Scalar open_color(0, 255, 0);
        cv::Scalar closed_color(0, 0, 255);

        cv::circle(frame, landmarks.left_eye, 4, eyes.left ? open_color : closed_color, -1);
        cv::circle(frame, landmarks.right_eye, 4, eyes.right ? open_color : closed_color, -1);
        cv::circle(frame, landmarks.nose_tip, 3, cv::Scalar(255, 0, 0), -1);
        cv::circle(frame, landmarks.mouth_center, 3, cv::Scalar(255, 0, 0), -1);
        cv::circle(frame, landmarks.left_ear_tragion, 3, cv::Scalar(200, 200, 200), -1);
        cv::circle(frame, landmarks.right_ear_tragion, 3, cv::Scalar(200, 200, 200), -1);
    }

    void BlinkMonitorSystem::cleanup()
    {
        if (config_.show_window)
            cv::destroyAllWindows();
        detection_service_->dispose();
        Logger::shutdown();

        size_t events = 0, images = 0, sent = 0, failed = 0;
        Logger::getInstance().getStats(events, images, sent, failed);
        std::cout << "Events logged: " << events << " | Snapshots: " << images
                  << " | Published: " << sent << " | Failed sends: " << failed << std::endl;
        std::cout << "System shutdown complete" << std::endl;
    }
}
