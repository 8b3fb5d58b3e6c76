/**
 * @file test_geometry_extractor.cpp
 * @brief Unit tests for GeometryExtractor
 *
 * Validates:
 * - Bounding box copy and derived width/height
 * - Fixed keypoint index order
 * - Openness clamping and monotonicity
 * - Default detection probability
 * - Malformed detections in a batch
 */

#include <gtest/gtest.h>
#include "../include/geometry_extractor.h"
#include "../include/errors.h"
#include "detection_fixtures.h"

using namespace BlinkMonitor;

class GeometryExtractorTest : public ::testing::Test {
protected:
    Thresholds thresholds;
};

TEST_F(GeometryExtractorTest, BoundsAreCopiedWithDerivedSize) {
    RawDetection detection = Fixtures::makeDetection(true, true);
    detection.top_left = Point(12.5f, 30.0f);
    detection.bottom_right = Point(112.5f, 180.0f);

    FaceGeometry geometry = GeometryExtractor::extract(detection, thresholds);

    EXPECT_FLOAT_EQ(geometry.bounds.top_left.x, 12.5f);
    EXPECT_FLOAT_EQ(geometry.bounds.top_left.y, 30.0f);
    EXPECT_FLOAT_EQ(geometry.bounds.bottom_right.x, 112.5f);
    EXPECT_FLOAT_EQ(geometry.bounds.bottom_right.y, 180.0f);
    EXPECT_FLOAT_EQ(geometry.bounds.width, 100.0f);
    EXPECT_FLOAT_EQ(geometry.bounds.height, 150.0f);
}

TEST_F(GeometryExtractorTest, InvertedCornersGiveNegativeSize) {
    RawDetection detection = Fixtures::makeDetection(true, true);
    detection.top_left = Point(50.0f, 60.0f);
    detection.bottom_right = Point(20.0f, 10.0f);

    FaceGeometry geometry = GeometryExtractor::extract(detection, thresholds);

    EXPECT_FLOAT_EQ(geometry.bounds.width, -30.0f);
    EXPECT_FLOAT_EQ(geometry.bounds.height, -50.0f);
}

TEST_F(GeometryExtractorTest, KeypointsFollowFixedIndexOrder) {
    RawDetection detection;
    for (int i = 0; i < 6; ++i) {
        detection.keypoints.emplace_back(static_cast<float>(i), static_cast<float>(i * 10));
    }

    FaceGeometry geometry = GeometryExtractor::extract(detection, thresholds);

    EXPECT_EQ(geometry.landmarks.right_eye, Point(0.0f, 0.0f));
    EXPECT_EQ(geometry.landmarks.left_eye, Point(1.0f, 10.0f));
    EXPECT_EQ(geometry.landmarks.nose_tip, Point(2.0f, 20.0f));
    EXPECT_EQ(geometry.landmarks.mouth_center, Point(3.0f, 30.0f));
    EXPECT_EQ(geometry.landmarks.right_ear_tragion, Point(4.0f, 40.0f));
    EXPECT_EQ(geometry.landmarks.left_ear_tragion, Point(5.0f, 50.0f));
}

TEST_F(GeometryExtractorTest, ExtraKeypointsAreIgnored) {
    RawDetection detection = Fixtures::makeDetection(true, false);
    detection.keypoints.emplace_back(999.0f, 999.0f);

    FaceGeometry geometry = GeometryExtractor::extract(detection, thresholds);

    EXPECT_GT(geometry.left_eye_open_probability, 0.9);
    EXPECT_DOUBLE_EQ(geometry.right_eye_open_probability, 0.0);
}

TEST_F(GeometryExtractorTest, FewerThanSixKeypointsThrows) {
    RawDetection detection = Fixtures::makeDetection(true, true);
    detection.keypoints.pop_back();

    try {
        GeometryExtractor::extract(detection, thresholds);
        FAIL() << "Expected MalformedDetectionError";
    } catch (const MalformedDetectionError &e) {
        EXPECT_EQ(e.keypointCount(), 5u);
    }
}

TEST_F(GeometryExtractorTest, ProbabilityDefaultsWhenDetectorGivesNone) {
    FaceGeometry without = GeometryExtractor::extract(Fixtures::makeDetection(true, true), thresholds);
    FaceGeometry with = GeometryExtractor::extract(Fixtures::makeDetection(true, true, 0.73f), thresholds);

    EXPECT_FLOAT_EQ(without.probability, 0.9f);
    EXPECT_FLOAT_EQ(with.probability, 0.73f);
}

TEST_F(GeometryExtractorTest, EachEyeUsesItsOwnEar) {
    FaceGeometry geometry = GeometryExtractor::extract(Fixtures::makeDetection(true, false), thresholds);

    // ratio 5 / 10.1 against the 0.3..0.5 band
    EXPECT_NEAR(geometry.left_eye_open_probability, (5.0 / 10.1 - 0.3) / 0.2, 1e-6);
    EXPECT_DOUBLE_EQ(geometry.right_eye_open_probability, 0.0);
}

TEST_F(GeometryExtractorTest, OpennessInterpolatesInsideBand) {
    // eye-to-ear 10, eye-to-nose 4.04 -> ratio 0.4 -> halfway
    double openness = GeometryExtractor::calculateOpenness(
        Point(0.0f, 0.0f), Point(10.0f, 0.0f), Point(0.0f, 4.04f), 0.3, 0.5);

    EXPECT_NEAR(openness, 0.5, 1e-5);
}

TEST_F(GeometryExtractorTest, OpennessIsClampedAtBandEdges) {
    Point eye(0.0f, 0.0f);
    Point ear(10.0f, 0.0f);

    // ratio exactly at closed_ratio and open_ratio
    EXPECT_NEAR(GeometryExtractor::calculateOpenness(eye, ear, Point(0.0f, 3.03f), 0.3, 0.5), 0.0, 1e-5);
    EXPECT_NEAR(GeometryExtractor::calculateOpenness(eye, ear, Point(0.0f, 5.05f), 0.3, 0.5), 1.0, 1e-5);

    EXPECT_DOUBLE_EQ(GeometryExtractor::calculateOpenness(eye, ear, Point(0.0f, 1.0f), 0.3, 0.5), 0.0);
    EXPECT_DOUBLE_EQ(GeometryExtractor::calculateOpenness(eye, ear, Point(0.0f, 30.0f), 0.3, 0.5), 1.0);
}

TEST_F(GeometryExtractorTest, OpennessIsNonDecreasingInRatio) {
    Point eye(0.0f, 0.0f);
    Point ear(10.0f, 0.0f);

    double previous = -1.0;
    for (int step = 0; step <= 100; ++step) {
        float nose_distance = 0.1f * static_cast<float>(step);
        double openness = GeometryExtractor::calculateOpenness(eye, ear, Point(0.0f, nose_distance), 0.3, 0.5);

        EXPECT_GE(openness, previous) << "nose distance " << nose_distance;
        EXPECT_GE(openness, 0.0);
        EXPECT_LE(openness, 1.0);
        previous = openness;
    }
}

TEST_F(GeometryExtractorTest, CoincidentPointsDoNotDivideByZero) {
    Point same(7.0f, 7.0f);
    double openness = GeometryExtractor::calculateOpenness(same, same, same, 0.3, 0.5);
    EXPECT_DOUBLE_EQ(openness, 0.0);
}

TEST_F(GeometryExtractorTest, CustomBandChangesMapping) {
    Thresholds wide;
    wide.closed_ratio = 0.0;
    wide.open_ratio = 1.0;

    FaceGeometry geometry = GeometryExtractor::extract(Fixtures::makeDetection(true, true), wide);

    EXPECT_NEAR(geometry.left_eye_open_probability, 5.0 / 10.1, 1e-6);
}

TEST_F(GeometryExtractorTest, BatchSkipsMalformedDetections) {
    RawDetection malformed = Fixtures::makeDetection(true, true);
    malformed.keypoints.resize(3);

    std::vector<RawDetection> batch = {
        Fixtures::makeDetection(true, true, 0.8f),
        malformed,
        Fixtures::makeDetection(false, false, 0.6f),
    };

    std::vector<FaceGeometry> faces = GeometryExtractor::extractGeometry(batch, thresholds);

    ASSERT_EQ(faces.size(), 2u);
    EXPECT_FLOAT_EQ(faces[0].probability, 0.8f);
    EXPECT_FLOAT_EQ(faces[1].probability, 0.6f);
    EXPECT_DOUBLE_EQ(faces[1].left_eye_open_probability, 0.0);
}

TEST_F(GeometryExtractorTest, EmptyBatchGivesEmptyResult) {
    EXPECT_TRUE(GeometryExtractor::extractGeometry({}, thresholds).empty());
}
