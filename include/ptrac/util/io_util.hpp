#pragma once

#include <ptrac/pose/keypoint_detector.hpp>
#include <ptrac/model/person.hpp>

#include <opencv2/core/core.hpp>

#include <iosfwd>
#include <string>

// Detections stored as
// { "rgb_size": [w, h], "detections": [ { "group": 0, "label": "Neck", "probability": 0.9, "roi": [x, y, w, h] }, ... ] }
// rgb_size is optional and left empty when absent. Throws std::runtime_error on malformed input.
Detections loadDetections(std::istream &strm, cv::Size &rgb_size) ;
Detections loadDetections(const std::string &path, cv::Size &rgb_size) ;

// Depth image as CV_32FC1 in meters. 16 bit images are assumed to be in millimeters.
cv::Mat loadDepthImage(const std::string &path) ;

void printPersons(std::ostream &strm, const Persons &persons) ;
