#pragma once

#include <ptrac/model/skeleton.hpp>
#include <ptrac/model/person.hpp>

#include <Eigen/Geometry>

#include <optional>
#include <set>
#include <string>

// reference joint the wrist is compared against when detecting a raised hand
enum class WaveHeuristic { Shoulder, Head } ;

bool parseWaveHeuristic(const std::string &name, WaveHeuristic &h) ;

// Right handed frame whose x axis is the given direction. The y axis is the
// component of the world z axis orthogonal to x.
struct ArmFrame {
    Eigen::Vector3f origin_ ;
    Eigen::Matrix3f rotation_ ;

    static ArmFrame fromVector(const Eigen::Vector3f &origin, const Eigen::Vector3f &dir) ;
};

// Per side result of the pointing heuristic.
struct ArmEstimate {
    bool valid_ = false ;
    float arm_neck_norm_ = 0.f ; // |neck x upper arm|, 1 when the arm is orthogonal to the body axis
    ArmFrame frame_ ;
};

class GestureClassifier {
public:
    struct Parameters {
        WaveHeuristic heuristic_ ;
        float arm_norm_thresh_ ;  // maximum bend |lower arm x upper arm| of a pointing arm
        float neck_norm_thresh_ ; // minimum |neck x upper arm| of a pointing arm

        Parameters(): heuristic_(WaveHeuristic::Shoulder), arm_norm_thresh_(0.5), neck_norm_thresh_(0.7) {}
    };

    GestureClassifier(const Parameters &params = {}): params_(params) {}

    // "LWave" / "RWave" for every side whose wrist is above the reference joint
    std::set<std::string> waveTags(const Skeleton &sk) const ;

    // side is "L" or "R"
    ArmEstimate estimateArm(const Skeleton &sk, const std::string &side) const ;

    std::optional<Pose> pointingPose(const Skeleton &sk) const ;

    // person record of a filtered skeleton, empty if the skeleton has no neck
    std::optional<Person> classify(const Skeleton &sk) const ;

    const Parameters &params() const { return params_ ; }

    // fixed body axis used in place of the neck to nose direction (y down)
    static const Eigen::Vector3f neck_vector ;

private:

    Parameters params_ ;
};
