#include <ptrac/util/config.hpp>

#include <cmath>
#include <fstream>
#include <iostream>

using namespace std ;

static void readFloat(const Config &json, const char *key, float &val) {
    auto v = json[key] ;
    if ( v ) val = v.toFloat() ;
}

bool parsePersonEstimatorParameters(const Config &json, PersonEstimator::Parameters &params) {
    readFloat(json, "prob_thresh", params.localizer_.prob_thresh_) ;
    readFloat(json, "link_thresh", params.link_thresh_) ;
    readFloat(json, "arm_norm_thresh", params.gesture_.arm_norm_thresh_) ;
    readFloat(json, "neck_norm_thresh", params.gesture_.neck_norm_thresh_) ;

    auto padding = json["roi_padding"] ;
    if ( padding ) {
        float p = padding.toFloat() ;
        if ( p < 0 ) return false ;
        params.localizer_.padding_ = std::lround(p) ;
    }

    auto heuristic = json["heuristic"] ;
    if ( heuristic && !parseWaveHeuristic(heuristic.toString(), params.gesture_.heuristic_) )
        return false ;

    return true ;
}

bool parseCameraConfig(const Config &json, CameraConfig &cam) {
    readFloat(json, "fx", cam.fx_) ;
    readFloat(json, "fy", cam.fy_) ;
    readFloat(json, "cx", cam.cx_) ;
    readFloat(json, "cy", cam.cy_) ;

    auto sz = json["size"] ;
    if ( sz ) {
        cam.size_.width = sz[0].toFloat() ;
        cam.size_.height = sz[1].toFloat() ;
    }

    return cam.fx_ > 0 && cam.fy_ > 0 && cam.size_.area() > 0 ;
}

bool loadTrackerConfig(const string &path, TrackerConfig &cfg) {
    ifstream strm(path) ;
    if ( !strm ) return false ;

    try {
        Config json = Config::fromJSON(strm) ;
        if ( !json ) return false ;

        auto camera = json["camera"] ;
        if ( camera && !parseCameraConfig(camera, cfg.camera_) ) return false ;

        auto estimator = json["estimator"] ;
        if ( estimator && !parsePersonEstimatorParameters(estimator, cfg.estimator_) ) return false ;

        return true ;

    } catch ( std::runtime_error &e ) {
        cerr << e.what() << endl ;
        return false ;
    }
}
