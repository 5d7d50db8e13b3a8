#include <ptrac/camera/ray_projector.hpp>

#include <cmath>

using namespace Eigen ;

PinholeRayProjector::PinholeRayProjector(float fx, float fy, float cx, float cy, const cv::Size &sz):
    cam_(fx, fy, cx, cy, sz) {
}

Vector3f PinholeRayProjector::projectPixelToRay(float u, float v) const {
    Vector3f ray = cam_.backProject(u, v, 1.0f) ;
    return ray.normalized() ;
}

PinholeRayProjector PinholeRayProjector::scaled(float ratio) const {
    cv::Size sz(std::round(cam_.sz().width * ratio), std::round(cam_.sz().height * ratio)) ;
    return PinholeRayProjector(cam_.fx() * ratio, cam_.fy() * ratio, cam_.cx() * ratio, cam_.cy() * ratio, sz) ;
}
