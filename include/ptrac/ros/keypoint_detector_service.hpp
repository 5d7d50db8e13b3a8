#pragma once

#include <ptrac/pose/keypoint_detector.hpp>

#include "rclcpp/rclcpp.hpp"
#include "pointing_tracker/srv/detect_key_points.hpp"

#include <string>

// Keypoint detector backed by a remote DetectKeyPoints service. A call that
// fails or does not complete within the timeout raises KeyPointDetectorException.
class KeyPointDetectorService: public KeyPointDetector {
public:
    struct Parameters {
        std::string service_ = "detect_keypoints" ;
        double timeout_ = 5.0 ; // seconds
    };

    KeyPointDetectorService(rclcpp::Node *node, const Parameters &params = {}) ;

    void init() override ;
    Detections findKeyPoints(const cv::Mat &img) override ;

private:
    using Service = pointing_tracker::srv::DetectKeyPoints ;

    rclcpp::Node *node_ ;
    Parameters params_ ;
    rclcpp::CallbackGroup::SharedPtr cb_group_ ;
    rclcpp::Client<Service>::SharedPtr client_ ;
};
