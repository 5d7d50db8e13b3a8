#include <ptrac/pose/person_estimator.hpp>

#include <gtest/gtest.h>

using namespace Eigen ;

namespace {

const cv::Size image_size(100, 100) ;

Detection makeDetection(int group, const std::string &label, const cv::Point &center, float prob = 0.9f) {
    Detection det ;
    det.group_id_ = group ;
    det.label_ = label ;
    det.probability_ = prob ;
    det.roi_ = cv::Rect(center.x - 2, center.y - 2, 4, 4) ;
    return det ;
}

// returns a fixed set of detections, or fails when asked to
class FixedDetector: public KeyPointDetector {
public:
    FixedDetector(const Detections &dets): detections_(dets) {}

    void init() override {}

    Detections findKeyPoints(const cv::Mat &) override {
        if ( fail_ ) throw KeyPointDetectorException("detector unavailable") ;
        return detections_ ;
    }

    Detections detections_ ;
    bool fail_ = false ;
};

}

TEST(PersonEstimator, DefaultParameters) {
    PersonEstimator::Parameters params ;
    EXPECT_FLOAT_EQ(params.link_thresh_, 0.5f) ;
    EXPECT_FLOAT_EQ(params.localizer_.prob_thresh_, 0.2f) ;
    EXPECT_EQ(params.gesture_.heuristic_, WaveHeuristic::Shoulder) ;
    EXPECT_FLOAT_EQ(params.gesture_.arm_norm_thresh_, 0.5f) ;
    EXPECT_FLOAT_EQ(params.gesture_.neck_norm_thresh_, 0.7f) ;
}

TEST(PersonEstimator, SingleFrame) {
    PinholeRayProjector proj(500.f, 500.f, 50.f, 50.f, image_size) ;

    cv::Mat depth(image_size, CV_32FC1, cv::Scalar(2.f)) ;
    // neck of the second person far behind its shoulder
    depth(cv::Rect(46, 66, 8, 8)).setTo(4.f) ;

    Detections dets = {
        makeDetection(0, "Neck", {50, 40}),
        makeDetection(0, "LShoulder", {60, 40}),
        makeDetection(0, "LElbow", {75, 40}),
        makeDetection(0, "LWrist", {90, 40}),
        makeDetection(1, "Neck", {50, 70}),
        makeDetection(1, "LShoulder", {60, 70}),
        makeDetection(2, "Neck", {20, 20}, 0.1f)
    } ;

    PersonEstimator estimator ;
    auto res = estimator.estimate(dets, depth, image_size, proj, true) ;

    ASSERT_EQ(res.skeletons_.size(), 2u) ;
    EXPECT_EQ(res.skeletons_[0].groupId(), 0) ;
    EXPECT_EQ(res.skeletons_[0].size(), 4u) ;
    EXPECT_EQ(res.skeletons_[1].groupId(), 1) ;
    EXPECT_TRUE(res.skeletons_[1].empty()) ;

    ASSERT_EQ(res.persons_.size(), 1u) ;
    const Person &p = res.persons_[0] ;
    EXPECT_TRUE(p.position_.isApprox(proj.projectPixelToRay(50, 40) * 2.f, 1e-5)) ;
    EXPECT_TRUE(p.isPointing()) ;
    ASSERT_TRUE(p.pointing_pose_.has_value()) ;
    EXPECT_TRUE(p.pointing_pose_->position_.isApprox(proj.projectPixelToRay(90, 40) * 2.f, 1e-5)) ;

    Vector3f dir = p.pointing_pose_->orientation_ * Vector3f::UnitX() ;
    EXPECT_GT(dir.x(), 0.99f) ;

    EXPECT_FALSE(res.regions_.empty()) ;
}

TEST(PersonEstimator, EmptyFrame) {
    PinholeRayProjector proj(500.f, 500.f, 50.f, 50.f, image_size) ;
    cv::Mat depth(image_size, CV_32FC1, cv::Scalar(2.f)) ;

    PersonEstimator estimator ;
    auto res = estimator.estimate({}, depth, image_size, proj) ;
    EXPECT_TRUE(res.persons_.empty()) ;
    EXPECT_TRUE(res.skeletons_.empty()) ;
    EXPECT_TRUE(res.regions_.empty()) ;
}

TEST(PersonEstimator, FailedDetectionDropsFrame) {
    PinholeRayProjector proj(500.f, 500.f, 50.f, 50.f, image_size) ;
    cv::Mat rgb(image_size, CV_8UC3, cv::Scalar(0, 0, 0)) ;
    cv::Mat depth(image_size, CV_32FC1, cv::Scalar(2.f)) ;

    FixedDetector detector({ makeDetection(0, "Neck", {50, 40}),
                             makeDetection(0, "LShoulder", {60, 40}) }) ;
    detector.fail_ = true ;

    PersonEstimator estimator ;
    PersonEstimator::FrameResult res ;
    res.persons_.emplace_back() ;
    std::string err ;

    bool ok = true ;
    EXPECT_NO_THROW(ok = estimator.process(detector, rgb, depth, proj, res, err, true)) ;
    EXPECT_FALSE(ok) ;
    EXPECT_EQ(err, "detector unavailable") ;
    EXPECT_TRUE(res.persons_.empty()) ;
    EXPECT_TRUE(res.skeletons_.empty()) ;
    EXPECT_TRUE(res.regions_.empty()) ;

    // the next frame is processed normally
    detector.fail_ = false ;
    ASSERT_TRUE(estimator.process(detector, rgb, depth, proj, res, err, true)) ;
    ASSERT_EQ(res.skeletons_.size(), 1u) ;
    EXPECT_EQ(res.skeletons_[0].size(), 2u) ;
    ASSERT_EQ(res.persons_.size(), 1u) ;
    EXPECT_TRUE(res.persons_[0].position_.isApprox(proj.projectPixelToRay(50, 40) * 2.f, 1e-5)) ;
    EXPECT_FALSE(res.regions_.empty()) ;
}
