#include <ptrac/ros/pointing_tracker.hpp>
#include <ptrac/ros/keypoint_detector_service.hpp>
#include <ptrac/camera/ray_projector.hpp>

#include "tf2_eigen/tf2_eigen.hpp"

using std::placeholders::_1, std::placeholders::_2, std::placeholders::_3;

using namespace Eigen ;
using namespace std ;

PointingTracker::PointingTracker()
    : rclcpp::Node("pointing_tracker") {

    declare_parameter("rgb", "/camera/color/image_raw");
    declare_parameter("depth", "/camera/aligned_depth_to_color/image_raw") ;
    declare_parameter("info", "/camera/color/camera_info") ;
    declare_parameter("detector_service", "detect_keypoints") ;
    declare_parameter("detector_timeout", 5.0) ;
    declare_parameter("exact_sync", false) ;
    declare_parameter("queue_size", 10) ;
    declare_parameter("publish_regions", false) ;

    declare_parameter("prob_thresh", 0.2) ;
    declare_parameter("roi_padding", 2) ;
    declare_parameter("link_thresh", 0.5) ;
    declare_parameter("heuristic", "shoulder") ;
    declare_parameter("arm_norm_thresh", 0.5) ;
    declare_parameter("neck_norm_thresh", 0.7) ;

    KeyPointDetectorService::Parameters dparams ;
    dparams.service_ = get_parameter("detector_service").as_string() ;
    dparams.timeout_ = get_parameter("detector_timeout").as_double() ;

    detector_.reset(new KeyPointDetectorService(this, dparams)) ;
    detector_->init() ;

    estimator_.reset(new PersonEstimator(estimatorParameters())) ;

    publish_regions_ = get_parameter("publish_regions").as_bool() ;

    subscribe();
}

PersonEstimator::Parameters PointingTracker::estimatorParameters() {
    PersonEstimator::Parameters params ;

    params.localizer_.prob_thresh_ = get_parameter("prob_thresh").as_double() ;
    params.localizer_.padding_ = get_parameter("roi_padding").as_int() ;
    params.link_thresh_ = get_parameter("link_thresh").as_double() ;
    params.gesture_.arm_norm_thresh_ = get_parameter("arm_norm_thresh").as_double() ;
    params.gesture_.neck_norm_thresh_ = get_parameter("neck_norm_thresh").as_double() ;

    const std::string heuristic = get_parameter("heuristic").as_string() ;
    if ( !parseWaveHeuristic(heuristic, params.gesture_.heuristic_) )
        RCLCPP_WARN(get_logger(), "unknown wave heuristic '%s', using 'shoulder'", heuristic.c_str()) ;

    return params ;
}

inline void PointingTracker::subscribe() {
    const std::string rgb_topic = get_parameter("rgb").as_string();
    const std::string caminfo_topic = get_parameter("info").as_string();
    const std::string depth_topic = get_parameter("depth").as_string();
    const int queue_size = get_parameter("queue_size").as_int() ;

    rgb_sub_.subscribe(this, rgb_topic) ;
    depth_sub_.subscribe(this, depth_topic) ;
    info_sub_.subscribe(this, caminfo_topic) ;

    if ( get_parameter("exact_sync").as_bool() ) {
        exact_sync_.reset(new ExactSynchronizer( ExactSyncPolicy(queue_size), rgb_sub_, depth_sub_, info_sub_ ));
        exact_sync_->registerCallback(std::bind(&PointingTracker::frameCallback, this, _1, _2, _3));
    } else {
        sync_.reset(new Synchronizer( SyncPolicy(queue_size), rgb_sub_, depth_sub_, info_sub_ ));
        sync_->registerCallback(std::bind(&PointingTracker::frameCallback, this, _1, _2, _3));
    }

    publisher_ = create_publisher<pointing_tracker::msg::Persons>("persons", 10);

    marker_publisher_ = create_publisher<visualization_msgs::msg::MarkerArray>("skeleton", 10);

    if ( publish_regions_ )
        regions_publisher_ = create_publisher<Image>("depth_regions", 1);

    RCLCPP_INFO(get_logger(), "waiting for frames on %s, %s", rgb_topic.c_str(), depth_topic.c_str()) ;
}

cv::Mat PointingTracker::depthImage(const Image::ConstSharedPtr depthMsg) {
    try
    {
        if ( depthMsg->encoding == sensor_msgs::image_encodings::TYPE_32FC1 )
            return cv_bridge::toCvCopy(depthMsg, sensor_msgs::image_encodings::TYPE_32FC1)->image ;

        if ( depthMsg->encoding == sensor_msgs::image_encodings::TYPE_16UC1 || depthMsg->encoding == sensor_msgs::image_encodings::MONO16 ) {
            // millimeters, zero stays as the invalid marker
            auto depthPtr = cv_bridge::toCvShare(depthMsg, sensor_msgs::image_encodings::TYPE_16UC1) ;
            cv::Mat depth ;
            depthPtr->image.convertTo(depth, CV_32FC1, 0.001) ;
            return depth ;
        }

        RCLCPP_ERROR_THROTTLE(get_logger(), *this->get_clock(), 10000, "unsupported depth encoding %s", depthMsg->encoding.c_str()) ;
    }
    catch (cv_bridge::Exception& e)
    {
        // display the error at most once per 10 seconds
        RCLCPP_ERROR_THROTTLE(get_logger(), *this->get_clock(), 10000, "cv_bridge exception %s at line number %d on function %s in file %s", e.what(), __LINE__,
                              __FUNCTION__, __FILE__);
    }

    return cv::Mat() ;
}

void PointingTracker::frameCallback(const Image::ConstSharedPtr colorMsg, const Image::ConstSharedPtr depthMsg,
                                    const CameraInfo::ConstSharedPtr infoMsg) {
    cv::Mat rgb ;

    try
    {
        rgb = cv_bridge::toCvCopy(colorMsg, sensor_msgs::image_encodings::BGR8)->image;
        frame_number_ ++ ;
    }
    catch (cv_bridge::Exception& e)
    {
        RCLCPP_ERROR_THROTTLE(get_logger(), *this->get_clock(), 10000, "cv_bridge exception %s at line number %d on function %s in file %s", e.what(), __LINE__,
                              __FUNCTION__, __FILE__);
        return ;
    }

    cv::Mat depth = depthImage(depthMsg) ;
    if ( depth.empty() ) return ;

    PinholeRayProjector proj(infoMsg->k.at(0), infoMsg->k.at(4), infoMsg->k.at(2), infoMsg->k.at(5), cv::Size(infoMsg->width, infoMsg->height)) ;

    // rays are cast from depth pixels
    if ( infoMsg->width != 0 && depth.cols != static_cast<int>(infoMsg->width) )
        proj = proj.scaled(depth.cols / float(infoMsg->width)) ;

    PersonEstimator::FrameResult res ;
    string err ;

    if ( !estimator_->process(*detector_, rgb, depth, proj, res, err, publish_regions_) ) {
        RCLCPP_ERROR_THROTTLE(get_logger(), *this->get_clock(), 10000, "keypoint detection failed, dropping frame %zu: %s", frame_number_, err.c_str()) ;
        return ;
    }

    RCLCPP_DEBUG(get_logger(), "frame %zu: %zu skeletons, %zu persons", frame_number_, res.skeletons_.size(), res.persons_.size()) ;

    publisher_->publish(makePersonsMsg(depthMsg->header, res.persons_)) ;
    marker_publisher_->publish(makeVizMarker(depthMsg->header, res)) ;

    if ( publish_regions_ && !res.regions_.empty() )
        regions_publisher_->publish(*cv_bridge::CvImage(depthMsg->header, sensor_msgs::image_encodings::TYPE_32FC1, res.regions_).toImageMsg()) ;
}

static geometry_msgs::msg::Point toPointMsg(const Vector3f &v) {
    return tf2::toMsg(Vector3d(v.cast<double>())) ;
}

pointing_tracker::msg::Persons PointingTracker::makePersonsMsg(const std_msgs::msg::Header &header, const Persons &persons) {
    pointing_tracker::msg::Persons msg ;
    msg.header = header ;

    for( const auto &p: persons ) {
        pointing_tracker::msg::Person person ;
        person.position = toPointMsg(p.position_) ;
        person.tags.assign(p.tags_.begin(), p.tags_.end()) ;

        if ( p.pointing_pose_ ) {
            person.is_pointing = true ;
            person.pointing_pose.position = toPointMsg(p.pointing_pose_->position_) ;
            person.pointing_pose.orientation = tf2::toMsg(p.pointing_pose_->orientation_.cast<double>()) ;
        }

        msg.persons.emplace_back(person) ;
    }

    return msg ;
}

visualization_msgs::msg::MarkerArray PointingTracker::makeVizMarker(const std_msgs::msg::Header &header, const PersonEstimator::FrameResult &res) {
    visualization_msgs::msg::MarkerArray markers ;

    // clear markers of the previous frame
    visualization_msgs::msg::Marker clear ;
    clear.header = header ;
    clear.action = visualization_msgs::msg::Marker::DELETEALL ;
    markers.markers.push_back(clear) ;

    int id = 0 ;
    for( const auto &sk: res.skeletons_ ) {

        visualization_msgs::msg::Marker joints ;
        joints.header = header ;
        joints.ns = "ns_joints" ;
        joints.id = id++ ;
        joints.type = visualization_msgs::msg::Marker::SPHERE_LIST ;
        joints.action = visualization_msgs::msg::Marker::ADD ;
        joints.pose.orientation.w = 1.0 ;
        joints.scale.x = joints.scale.y = joints.scale.z = 0.03 ;
        joints.color.r = 1.0f ;
        joints.color.a = 1.0 ;

        for( const auto &jp: sk.joints() ) {
            if ( jp.second.point_ )
                joints.points.push_back(toPointMsg(*jp.second.point_)) ;
        }

        if ( !joints.points.empty() )
            markers.markers.push_back(joints) ;

        for( const auto &seg: sk.linkSegments() ) {
            const auto &v1 = seg.first ;
            const auto &v2 = seg.second ;

            visualization_msgs::msg::Marker marker ;
            marker.header = header ;
            marker.ns = "ns_skeleton" ;
            marker.id = id++ ;

            float len = (v1 - v2).norm() ;
            Vector3d a{ 0, 0, 1 };
            Vector3d d = (v2 - v1).normalized().cast<double>() ;

            // rotate cylinder to align with bone axis
            Quaterniond q = Quaterniond::FromTwoVectors(a, d) ;

            Vector3f t = 0.5f*(v1 + v2) ;

            marker.type = visualization_msgs::msg::Marker::CYLINDER ;
            marker.action = visualization_msgs::msg::Marker::ADD;
            marker.pose.position = toPointMsg(t) ;
            marker.pose.orientation = tf2::toMsg(q) ;

            marker.scale.x = 0.01 ;
            marker.scale.y = 0.01 ;
            marker.scale.z = len ;

            marker.color.r = 0.0f;
            marker.color.g = 1.0f;
            marker.color.b = 0.0f;
            marker.color.a = 1.0;

            markers.markers.push_back(marker) ;
        }
    }

    for( const auto &p: res.persons_ ) {
        if ( !p.pointing_pose_ ) continue ;

        visualization_msgs::msg::Marker arrow ;
        arrow.header = header ;
        arrow.ns = "ns_pointing" ;
        arrow.id = id++ ;
        arrow.type = visualization_msgs::msg::Marker::ARROW ;
        arrow.action = visualization_msgs::msg::Marker::ADD ;
        arrow.pose.position = toPointMsg(p.pointing_pose_->position_) ;
        arrow.pose.orientation = tf2::toMsg(p.pointing_pose_->orientation_.cast<double>()) ;

        // arrow points along the frame x axis
        arrow.scale.x = 0.5 ;
        arrow.scale.y = 0.02 ;
        arrow.scale.z = 0.02 ;

        arrow.color.b = 1.0f ;
        arrow.color.a = 1.0 ;

        markers.markers.push_back(arrow) ;
    }

    return markers ;
}

int main(int argc, char *argv[]) {
    rclcpp::init(argc, argv);

    // detector responses are served by a second thread while a frame is processed
    rclcpp::executors::MultiThreadedExecutor executor(rclcpp::ExecutorOptions(), 2) ;
    auto node = std::make_shared<PointingTracker>() ;
    executor.add_node(node) ;
    executor.spin() ;

    rclcpp::shutdown();
}
