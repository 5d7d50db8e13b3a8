#include <ptrac/pose/joint_localizer.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

using namespace Eigen ;
using namespace std ;

bool regionMedianDepth(const cv::Mat &region, float &median) {
    vector<float> values ;
    values.reserve(region.total()) ;

    cv::Mat_<float> region_(region) ;
    for( int i=0 ; i<region.rows ; i++ )
        for( int j=0 ; j<region.cols ; j++ ) {
            float val = region_[i][j] ;
            if ( std::isfinite(val) ) values.push_back(val) ;
        }

    if ( values.empty() ) return false ;

    size_t n = values.size() ;
    auto mid = values.begin() + n/2 ;
    std::nth_element(values.begin(), mid, values.end()) ;

    if ( n % 2 == 1 )
        median = *mid ;
    else {
        float upper = *mid ;
        float lower = *std::max_element(values.begin(), mid) ;
        median = 0.5f * ( lower + upper ) ;
    }

    return true ;
}

cv::Rect JointLocalizer::depthRegion(const cv::Rect &roi, const cv::Size &rgb_size, const cv::Size &depth_size) const {
    const int pad = params_.padding_ ;
    cv::Rect box(roi.x - pad, roi.y - pad, roi.width + 2*pad, roi.height + 2*pad) ;

    if ( rgb_size == depth_size ) return box ;

    float ratio = depth_size.width / float(rgb_size.width) ;

    return cv::Rect(std::lround(box.x * ratio), std::lround(box.y * ratio),
                    std::lround(box.width * ratio), std::lround(box.height * ratio)) ;
}

namespace {

enum class RegionStatus { Invalid, Pending, Resolved } ;

// classify a depth region: no finite sample, contains sensor zeros, or usable
RegionStatus classifyRegion(const cv::Mat &region) {
    bool has_finite = false, has_zero = false ;

    cv::Mat_<float> region_(region) ;
    for( int i=0 ; i<region.rows ; i++ )
        for( int j=0 ; j<region.cols ; j++ ) {
            float val = region_[i][j] ;
            if ( !std::isfinite(val) ) continue ;
            has_finite = true ;
            if ( val == 0.0f ) has_zero = true ;
        }

    if ( !has_finite ) return RegionStatus::Invalid ;
    else if ( has_zero ) return RegionStatus::Pending ;
    else return RegionStatus::Resolved ;
}

}

Joints JointLocalizer::localize(const Detections &detections, const cv::Mat &depth, const cv::Size &rgb_size,
                                const RayProjector &proj, cv::Mat *regions) const {
    Joints joints ;
    vector<cv::Point2f> centers ; // pixel center of each joint, used for imputation

    const cv::Rect bounds(0, 0, depth.cols, depth.rows) ;

    if ( regions )
        *regions = cv::Mat(depth.size(), CV_32FC1, cv::Scalar(std::numeric_limits<float>::quiet_NaN())) ;

    for( const auto &det: detections ) {
        if ( det.probability_ < params_.prob_thresh_ ) continue ;

        cv::Rect box = depthRegion(det.roi_, rgb_size, depth.size()) ;

        if ( box.area() <= 0 || ( box & bounds ) != box ) continue ;

        cv::Mat region = depth(box) ;

        RegionStatus status = classifyRegion(region) ;
        if ( status == RegionStatus::Invalid ) continue ;

        if ( regions )
            region.copyTo((*regions)(box)) ;

        cv::Point2f center(box.x + box.width/2.0f, box.y + box.height/2.0f) ;

        Joint joint ;
        joint.group_id_ = det.group_id_ ;
        joint.name_ = det.label_ ;
        joint.probability_ = det.probability_ ;

        float z ;
        if ( status == RegionStatus::Resolved && regionMedianDepth(region, z) )
            joint.point_ = proj.projectPixelToRay(center.x, center.y) * z ;

        joints.emplace_back(std::move(joint)) ;
        centers.emplace_back(center) ;
    }

    // impute depth of pending joints from resolved joints of the same group

    vector<size_t> imputed ;
    vector<float> imputed_depth ;

    for( size_t i=0 ; i<joints.size() ; i++ ) {
        if ( joints[i].point_ ) continue ;

        float sum = 0.f ;
        size_t count = 0 ;
        for( size_t k=0 ; k<joints.size() ; k++ ) {
            if ( k == i || joints[k].group_id_ != joints[i].group_id_ || !joints[k].point_ ) continue ;
            sum += joints[k].point_->z() ;
            ++count ;
        }

        if ( count == 0 ) continue ;

        imputed.push_back(i) ;
        imputed_depth.push_back(sum/count) ;
    }

    for( size_t i=0 ; i<imputed.size() ; i++ ) {
        size_t idx = imputed[i] ;
        const cv::Point2f &c = centers[idx] ;
        joints[idx].point_ = proj.projectPixelToRay(c.x, c.y) * imputed_depth[i] ;
    }

    return joints ;
}
