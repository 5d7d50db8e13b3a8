#pragma once

#include <ptrac/pose/person_estimator.hpp>

#include <cvx/misc/variant.hpp>

#include <string>

using Config = cvx::Variant ;

// Intrinsics of the color camera, used when no camera info stream is available.
struct CameraConfig {
    float fx_ = 525.f, fy_ = 525.f, cx_ = 319.5f, cy_ = 239.5f ;
    cv::Size size_ = cv::Size(640, 480) ;
};

struct TrackerConfig {
    PersonEstimator::Parameters estimator_ ;
    CameraConfig camera_ ;
};

// Missing keys keep their defaults. Returns false on an unknown heuristic name.
bool parsePersonEstimatorParameters(const Config &json, PersonEstimator::Parameters &params) ;

bool parseCameraConfig(const Config &json, CameraConfig &cam) ;

// reads a JSON file with optional "camera" and "estimator" sections
bool loadTrackerConfig(const std::string &path, TrackerConfig &cfg) ;
