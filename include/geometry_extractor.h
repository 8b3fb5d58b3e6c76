#ifndef GEOMETRY_EXTRACTOR_H
#define GEOMETRY_EXTRACTOR_H

#include <vector>
#include "face_types.h"
#include "config.h"

namespace BlinkMonitor
{
    namespace GeometryExtractor
    {
        // Eye-to-nose over eye-to-ear distance, mapped linearly onto [0, 1]
        // between closed_ratio and open_ratio and clamped.
        double calculateOpenness(const Point &eye_point, const Point &ear_point, const Point &nose_tip,
                                 double closed_ratio, double open_ratio);

        // Throws MalformedDetectionError when fewer than six keypoints are present
        FaceGeometry extract(const RawDetection &detection, const Thresholds &thresholds);

        // Malformed detections are reported on stderr and left out of the result
        std::vector<FaceGeometry> extractGeometry(const std::vector<RawDetection> &detections,
                                                  const Thresholds &thresholds);
    }
}

#endif // GEOMETRY_EXTRACTOR_H
