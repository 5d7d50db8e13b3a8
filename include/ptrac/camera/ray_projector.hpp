#pragma once

#include <Eigen/Core>
#include <cvx/camera/camera.hpp>

// maps a pixel to a unit ray in the camera optical frame
class RayProjector {
public:
    virtual ~RayProjector() = default ;

    virtual Eigen::Vector3f projectPixelToRay(float u, float v) const = 0 ;
};

class PinholeRayProjector: public RayProjector {
public:
    PinholeRayProjector(const cvx::PinholeCamera &cam): cam_(cam) {}
    PinholeRayProjector(float fx, float fy, float cx, float cy, const cv::Size &sz) ;

    Eigen::Vector3f projectPixelToRay(float u, float v) const override ;

    const cvx::PinholeCamera &camera() const { return cam_ ; }

    // intrinsics scaled by the given ratio, e.g. to cast rays from depth pixels
    // when the depth image resolution differs from the color one
    PinholeRayProjector scaled(float ratio) const ;

private:
    cvx::PinholeCamera cam_ ;
};
