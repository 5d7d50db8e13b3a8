#include <ptrac/pose/person_estimator.hpp>

using namespace std ;

PersonEstimator::FrameResult PersonEstimator::estimate(const Detections &detections, const cv::Mat &depth, const cv::Size &rgb_size,
                                                       const RayProjector &proj, bool keep_regions) const {
    FrameResult res ;

    Joints joints = localizer_.localize(detections, depth, rgb_size, proj, keep_regions ? &res.regions_ : nullptr) ;

    for( const auto &sk: Skeleton::group(joints) ) {
        Skeleton filtered = sk.filtered(params_.link_thresh_) ;

        auto person = classifier_.classify(filtered) ;
        if ( person )
            res.persons_.emplace_back(std::move(*person)) ;

        res.skeletons_.emplace_back(std::move(filtered)) ;
    }

    return res ;
}

bool PersonEstimator::process(KeyPointDetector &detector, const cv::Mat &rgb, const cv::Mat &depth, const RayProjector &proj,
                              FrameResult &res, string &err, bool keep_regions) const {
    res = FrameResult() ;

    Detections detections ;

    try {
        detections = detector.findKeyPoints(rgb) ;
    } catch ( KeyPointDetectorException &e ) {
        err = e.what() ;
        return false ;
    }

    res = estimate(detections, depth, rgb.size(), proj, keep_regions) ;
    return true ;
}
