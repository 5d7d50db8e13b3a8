#pragma once

#include <ptrac/pose/joint_localizer.hpp>
#include <ptrac/pose/keypoint_detector.hpp>
#include <ptrac/pose/gesture_classifier.hpp>
#include <ptrac/model/skeleton.hpp>
#include <ptrac/model/person.hpp>

#include <string>

// Runs the full single frame pipeline: localize detections, group them into
// skeletons, prune implausible links and classify gestures.
class PersonEstimator {
public:
    struct Parameters {
        JointLocalizer::Parameters localizer_ ;
        GestureClassifier::Parameters gesture_ ;
        float link_thresh_ ; // maximum length (meters) of a skeleton link

        Parameters(): link_thresh_(0.5) {}
    };

    struct FrameResult {
        Persons persons_ ;
        std::vector<Skeleton> skeletons_ ; // filtered skeletons, one per detection group
        cv::Mat regions_ ;                 // sampled depth regions, if requested
    };

    PersonEstimator(const Parameters &params = {}):
        params_(params), localizer_(params.localizer_), classifier_(params.gesture_) {}

    FrameResult estimate(const Detections &detections, const cv::Mat &depth, const cv::Size &rgb_size,
                         const RayProjector &proj, bool keep_regions = false) const ;

    // Detects keypoints on the color image and estimates persons from them. A failed
    // detection drops the frame: res is left empty and the reason is returned in err.
    bool process(KeyPointDetector &detector, const cv::Mat &rgb, const cv::Mat &depth, const RayProjector &proj,
                 FrameResult &res, std::string &err, bool keep_regions = false) const ;

    const Parameters &params() const { return params_ ; }

private:

    Parameters params_ ;
    JointLocalizer localizer_ ;
    GestureClassifier classifier_ ;
};
