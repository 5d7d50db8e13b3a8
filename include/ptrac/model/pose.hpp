#pragma once

#include <Eigen/Geometry>

// oriented 3D frame, x axis along the pointing direction
struct Pose {
    Eigen::Vector3f position_ ;
    Eigen::Quaternionf orientation_ ;
};
