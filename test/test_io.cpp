#include <ptrac/util/config.hpp>
#include <ptrac/util/io_util.hpp>

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>

TEST(IO, LoadDetections) {
    std::istringstream strm(R"({
        "rgb_size": [640, 480],
        "detections": [
            { "group": 1, "label": "Neck", "probability": 0.75, "roi": [10, 20, 30, 40] },
            { "group": 2, "label": "LWrist", "probability": 0.5, "roi": [1, 2, 3, 4] }
        ]
    })") ;

    cv::Size rgb_size ;
    Detections dets = loadDetections(strm, rgb_size) ;

    EXPECT_EQ(rgb_size, cv::Size(640, 480)) ;
    ASSERT_EQ(dets.size(), 2u) ;
    EXPECT_EQ(dets[0].group_id_, 1) ;
    EXPECT_EQ(dets[0].label_, "Neck") ;
    EXPECT_FLOAT_EQ(dets[0].probability_, 0.75f) ;
    EXPECT_EQ(dets[0].roi_, cv::Rect(10, 20, 30, 40)) ;
    EXPECT_EQ(dets[1].label_, "LWrist") ;
}

TEST(IO, LoadDetectionsRejectsUnknownAttributes) {
    std::istringstream strm(R"({ "detections": [ { "group": 1, "score": 0.5 } ] })") ;
    cv::Size rgb_size ;
    EXPECT_THROW(loadDetections(strm, rgb_size), std::runtime_error) ;
}

TEST(IO, MissingFilesThrow) {
    cv::Size rgb_size ;
    EXPECT_THROW(loadDetections("/nonexistent/detections.json", rgb_size), std::runtime_error) ;
    EXPECT_THROW(loadDepthImage("/nonexistent/depth.png"), std::runtime_error) ;
}

TEST(IO, PrintPersons) {
    Person p ;
    p.position_ = Eigen::Vector3f(0, 0, 2) ;
    p.tags_ = { "LWave", "is_pointing" } ;
    p.pointing_pose_ = Pose{ Eigen::Vector3f(0.5f, 0, 2), Eigen::Quaternionf::Identity() } ;

    std::ostringstream strm ;
    printPersons(strm, { p }) ;

    EXPECT_NE(strm.str().find("1 person(s)"), std::string::npos) ;
    EXPECT_NE(strm.str().find("is_pointing"), std::string::npos) ;
    EXPECT_NE(strm.str().find("pointing"), std::string::npos) ;
}

TEST(Config, EstimatorParameters) {
    std::istringstream strm(R"({ "prob_thresh": 0.3, "link_thresh": 0.6, "heuristic": "head", "roi_padding": 3, "unused": 1 })") ;
    Config json = Config::fromJSON(strm) ;

    PersonEstimator::Parameters params ;
    ASSERT_TRUE(parsePersonEstimatorParameters(json, params)) ;

    EXPECT_FLOAT_EQ(params.localizer_.prob_thresh_, 0.3f) ;
    EXPECT_EQ(params.localizer_.padding_, 3) ;
    EXPECT_FLOAT_EQ(params.link_thresh_, 0.6f) ;
    EXPECT_EQ(params.gesture_.heuristic_, WaveHeuristic::Head) ;
    EXPECT_FLOAT_EQ(params.gesture_.arm_norm_thresh_, 0.5f) ;
    EXPECT_FLOAT_EQ(params.gesture_.neck_norm_thresh_, 0.7f) ;
}

TEST(Config, RejectsUnknownHeuristic) {
    std::istringstream strm(R"({ "heuristic": "knee" })") ;
    Config json = Config::fromJSON(strm) ;

    PersonEstimator::Parameters params ;
    EXPECT_FALSE(parsePersonEstimatorParameters(json, params)) ;
}

TEST(Config, LoadTrackerConfig) {
    const std::string path = ::testing::TempDir() + "ptrac_config.json" ;
    {
        std::ofstream strm(path) ;
        strm << R"({ "camera": { "fx": 600, "fy": 610, "cx": 320, "cy": 240, "size": [640, 480] },
                     "estimator": { "arm_norm_thresh": 0.4, "neck_norm_thresh": 0.8 } })" ;
    }

    TrackerConfig cfg ;
    ASSERT_TRUE(loadTrackerConfig(path, cfg)) ;
    EXPECT_FLOAT_EQ(cfg.camera_.fx_, 600.f) ;
    EXPECT_FLOAT_EQ(cfg.camera_.fy_, 610.f) ;
    EXPECT_EQ(cfg.camera_.size_, cv::Size(640, 480)) ;
    EXPECT_FLOAT_EQ(cfg.estimator_.gesture_.arm_norm_thresh_, 0.4f) ;
    EXPECT_FLOAT_EQ(cfg.estimator_.gesture_.neck_norm_thresh_, 0.8f) ;
    EXPECT_FLOAT_EQ(cfg.estimator_.link_thresh_, 0.5f) ;

    TrackerConfig missing ;
    EXPECT_FALSE(loadTrackerConfig("/nonexistent/config.json", missing)) ;
}
