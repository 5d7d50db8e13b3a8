#pragma once

#include <ptrac/pose/keypoint_detector.hpp>
#include <ptrac/camera/ray_projector.hpp>
#include <ptrac/model/skeleton.hpp>

#include <opencv2/core/core.hpp>

// Lifts 2D keypoint detections to 3D joints using a depth image.
//
// The depth image is CV_32FC1 in meters. NaN marks pixels without data and
// zero marks pixels the sensor reported as invalid. For each detection the
// padded region is sampled and the median of its finite values is used as the
// distance along the ray through the region center. Regions containing invalid
// (zero) samples get their depth imputed from the mean depth of the other
// resolved joints of the same group.
class JointLocalizer {
public:
    struct Parameters {
        float prob_thresh_ ; // detections with lower probability are discarded
        int padding_ ;       // margin in pixels added on each side of the detection region

        Parameters(): prob_thresh_(0.2), padding_(2) {}
    };

    JointLocalizer(const Parameters &params = {}): params_(params) {}

    // rgb_size is the resolution the detections refer to. If regions is not
    // null it receives a depth sized image holding the sampled regions.
    Joints localize(const Detections &detections, const cv::Mat &depth, const cv::Size &rgb_size,
                    const RayProjector &proj, cv::Mat *regions = nullptr) const ;

    // detection region padded and mapped into depth image coordinates
    cv::Rect depthRegion(const cv::Rect &roi, const cv::Size &rgb_size, const cv::Size &depth_size) const ;

    const Parameters &params() const { return params_ ; }

private:

    Parameters params_ ;
};

// median of the finite values in the region, false if there are none
bool regionMedianDepth(const cv::Mat &region, float &median) ;
