#include <ptrac/pose/person_estimator.hpp>
#include <ptrac/camera/ray_projector.hpp>
#include <ptrac/util/config.hpp>
#include <ptrac/util/io_util.hpp>

#include <iostream>

using namespace std ;

int main(int argc, char *argv[]) {

    if ( argc < 3 ) {
        cerr << "usage: " << argv[0] << " <depth.png> <detections.json> [config.json]" << endl ;
        return 1 ;
    }

    TrackerConfig cfg ;
    if ( argc > 3 && !loadTrackerConfig(argv[3], cfg) ) {
        cerr << "invalid configuration file: " << argv[3] << endl ;
        return 1 ;
    }

    try {
        cv::Mat depth = loadDepthImage(argv[1]) ;

        cv::Size rgb_size ;
        Detections detections = loadDetections(argv[2], rgb_size) ;
        if ( rgb_size.area() == 0 ) rgb_size = depth.size() ;

        const CameraConfig &cc = cfg.camera_ ;
        PinholeRayProjector proj(cc.fx_, cc.fy_, cc.cx_, cc.cy_, cc.size_) ;

        // rays are cast from depth pixels
        if ( cc.size_.width != depth.cols )
            proj = proj.scaled(depth.cols / float(cc.size_.width)) ;

        PersonEstimator estimator(cfg.estimator_) ;
        auto res = estimator.estimate(detections, depth, rgb_size, proj) ;

        cout << detections.size() << " detection(s), " << res.skeletons_.size() << " skeleton(s)" << endl ;
        printPersons(cout, res.persons_) ;
    }
    catch ( std::runtime_error &e ) {
        cerr << e.what() << endl ;
        return 1 ;
    }

    return 0 ;
}
