#include <ptrac/ros/keypoint_detector_service.hpp>

#include "cv_bridge/cv_bridge.h"
#include "sensor_msgs/image_encodings.hpp"

#include <chrono>

using namespace std ;

KeyPointDetectorService::KeyPointDetectorService(rclcpp::Node *node, const Parameters &params):
    node_(node), params_(params) {
}

void KeyPointDetectorService::init() {
    // responses are handled on their own group so that a frame callback can block on them
    cb_group_ = node_->create_callback_group(rclcpp::CallbackGroupType::MutuallyExclusive) ;
    client_ = node_->create_client<Service>(params_.service_, rmw_qos_profile_services_default, cb_group_) ;

    if ( !client_->wait_for_service(std::chrono::duration<double>(params_.timeout_)) )
        RCLCPP_WARN(node_->get_logger(), "keypoint detection service %s not available yet", params_.service_.c_str()) ;
}

Detections KeyPointDetectorService::findKeyPoints(const cv::Mat &img) {
    if ( !client_ )
        throw KeyPointDetectorException("detector not initialized") ;

    if ( !client_->service_is_ready() )
        throw KeyPointDetectorException("service " + params_.service_ + " is not available") ;

    Detections detections ;

    try {
        auto request = std::make_shared<Service::Request>() ;
        cv_bridge::CvImage(std_msgs::msg::Header(), sensor_msgs::image_encodings::BGR8, img).toImageMsg(request->image) ;

        auto future = client_->async_send_request(request) ;

        if ( future.wait_for(std::chrono::duration<double>(params_.timeout_)) != std::future_status::ready ) {
            client_->remove_pending_request(future) ;
            throw KeyPointDetectorException("service " + params_.service_ + " timed out") ;
        }

        auto response = future.get() ;

        for( const auto &d: response->detections ) {
            Detection det ;
            det.group_id_ = d.group_id ;
            det.label_ = d.label ;
            det.probability_ = d.probability ;
            det.roi_ = cv::Rect(d.roi.x_offset, d.roi.y_offset, d.roi.width, d.roi.height) ;
            detections.emplace_back(std::move(det)) ;
        }
    } catch ( KeyPointDetectorException & ) {
        throw ;
    } catch ( std::exception &e ) {
        throw KeyPointDetectorException("service " + params_.service_ + ": " + e.what()) ;
    }

    return detections ;
}
