#pragma once

// ROS headers
#include "rclcpp/rclcpp.hpp"
#include "sensor_msgs/image_encodings.hpp"
#include "sensor_msgs/msg/camera_info.hpp"
#include "sensor_msgs/msg/image.hpp"
#include "cv_bridge/cv_bridge.h"
#include "message_filters/synchronizer.h"
#include "message_filters/sync_policies/approximate_time.h"
#include "message_filters/sync_policies/exact_time.h"
#include "message_filters/subscriber.h"
#include "visualization_msgs/msg/marker_array.hpp"
#include "pointing_tracker/msg/persons.hpp"

#include <ptrac/pose/keypoint_detector.hpp>
#include <ptrac/pose/person_estimator.hpp>

#include <opencv2/core/core.hpp>

#include <memory>
#include <vector>

class PointingTracker: public rclcpp::Node
{
private:
    using Image = sensor_msgs::msg::Image ;
    using CameraInfo = sensor_msgs::msg::CameraInfo ;

    message_filters::Subscriber<Image> rgb_sub_ ;
    message_filters::Subscriber<Image> depth_sub_ ;
    message_filters::Subscriber<CameraInfo> info_sub_ ;

    rclcpp::Publisher<pointing_tracker::msg::Persons>::SharedPtr publisher_;
    rclcpp::Publisher<visualization_msgs::msg::MarkerArray>::SharedPtr marker_publisher_;
    rclcpp::Publisher<Image>::SharedPtr regions_publisher_;

    using SyncPolicy = message_filters::sync_policies::ApproximateTime<Image, Image, CameraInfo> ;
    using ExactSyncPolicy = message_filters::sync_policies::ExactTime<Image, Image, CameraInfo> ;
    using Synchronizer = message_filters::Synchronizer<SyncPolicy> ;
    using ExactSynchronizer = message_filters::Synchronizer<ExactSyncPolicy> ;
    std::unique_ptr<Synchronizer> sync_ ;
    std::unique_ptr<ExactSynchronizer> exact_sync_ ;

    std::unique_ptr<KeyPointDetector> detector_ ;
    std::unique_ptr<PersonEstimator> estimator_ ;

    size_t frame_number_ = 0;
    bool publish_regions_ = false ;

    PersonEstimator::Parameters estimatorParameters() ;

    inline void subscribe();
    void frameCallback(const Image::ConstSharedPtr colorMsg, const Image::ConstSharedPtr depthMsg,
                       const CameraInfo::ConstSharedPtr infoMsg) ;

    // depth image converted to CV_32FC1 meters, empty on failure
    cv::Mat depthImage(const Image::ConstSharedPtr depthMsg) ;

    pointing_tracker::msg::Persons makePersonsMsg(const std_msgs::msg::Header &header, const Persons &persons) ;
    visualization_msgs::msg::MarkerArray makeVizMarker(const std_msgs::msg::Header &header, const PersonEstimator::FrameResult &res);

public:

    PointingTracker();
    ~PointingTracker() = default;

};
