#pragma once

#include <opencv2/core/core.hpp>

#include <stdexcept>
#include <string>
#include <vector>

// A labeled keypoint region returned by the detector. All detections sharing
// a group id belong to the same candidate person.
struct Detection {
    int group_id_ = 0 ;
    std::string label_ ;
    float probability_ = 0.f ;
    cv::Rect roi_ ;
};

using Detections = std::vector<Detection> ;

class KeyPointDetector {
public:
    virtual ~KeyPointDetector() = default ;

    virtual void init() = 0 ;
    virtual Detections findKeyPoints(const cv::Mat &img) = 0 ;
};

class KeyPointDetectorException: public std::runtime_error {
public:
    KeyPointDetectorException(const std::string &what): std::runtime_error(what) {}
};
