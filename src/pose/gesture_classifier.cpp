#include <ptrac/pose/gesture_classifier.hpp>

using namespace Eigen ;
using namespace std ;

static const vector<string> s_sides = { "L", "R" } ;

const Vector3f GestureClassifier::neck_vector(0, 1, 0) ;

bool parseWaveHeuristic(const string &name, WaveHeuristic &h) {
    if ( name == "shoulder" ) h = WaveHeuristic::Shoulder ;
    else if ( name == "head" ) h = WaveHeuristic::Head ;
    else return false ;
    return true ;
}

ArmFrame ArmFrame::fromVector(const Vector3f &origin, const Vector3f &dir) {
    Vector3f x = dir.normalized() ;
    Vector3f y = x.cross(Vector3f::UnitZ().cross(x)) ;

    // direction along the world z axis, any orthogonal axis will do
    if ( y.norm() < 1.0e-6f )
        y = x.unitOrthogonal() ;
    else
        y.normalize() ;

    Vector3f z = x.cross(y) ;

    ArmFrame f ;
    f.origin_ = origin ;
    f.rotation_.col(0) = x ;
    f.rotation_.col(1) = y ;
    f.rotation_.col(2) = z ;
    return f ;
}

set<string> GestureClassifier::waveTags(const Skeleton &sk) const {
    set<string> tags ;

    for( const auto &side: s_sides ) {
        string ref_name = ( params_.heuristic_ == WaveHeuristic::Shoulder ) ? side + "Shoulder" : "Head" ;

        auto ref = sk.position(ref_name) ;
        auto wrist = sk.position(side + "Wrist") ;
        auto elbow = sk.position(side + "Elbow") ;

        if ( !ref || !wrist || !elbow ) continue ;

        // y axis points down
        if ( wrist->y() < ref->y() )
            tags.insert(side + "Wave") ;
    }

    return tags ;
}

ArmEstimate GestureClassifier::estimateArm(const Skeleton &sk, const string &side) const {
    ArmEstimate res ;

    auto shoulder = sk.position(side + "Shoulder") ;
    auto elbow = sk.position(side + "Elbow") ;
    auto wrist = sk.position(side + "Wrist") ;

    if ( !shoulder || !elbow ) return res ;

    // coincident joints define no direction
    if ( ( *elbow - *shoulder ).norm() < 1.0e-6f ) return res ;

    Vector3f upper_arm = ( *elbow - *shoulder ).normalized() ;

    res.valid_ = true ;
    res.frame_ = ArmFrame::fromVector(*elbow, upper_arm) ;
    res.arm_neck_norm_ = neck_vector.cross(upper_arm).norm() ;

    if ( wrist ) {
        Vector3f lower_arm = ( *wrist - *elbow ).normalized() ;
        float arm_bend_norm = lower_arm.cross(upper_arm).norm() ;

        if ( arm_bend_norm > params_.arm_norm_thresh_ || ( *wrist - *shoulder ).norm() < 1.0e-6f )
            res.valid_ = false ;
        else
            res.frame_ = ArmFrame::fromVector(*wrist, *wrist - *shoulder) ;
    }

    if ( res.arm_neck_norm_ < params_.neck_norm_thresh_ )
        res.valid_ = false ;

    return res ;
}

optional<Pose> GestureClassifier::pointingPose(const Skeleton &sk) const {
    ArmEstimate left = estimateArm(sk, "L") ;
    ArmEstimate right = estimateArm(sk, "R") ;

    const ArmEstimate *selected = nullptr ;

    if ( left.valid_ && right.valid_ )
        selected = ( right.arm_neck_norm_ > left.arm_neck_norm_ ) ? &right : &left ;
    else if ( left.valid_ )
        selected = &left ;
    else if ( right.valid_ )
        selected = &right ;
    else
        return nullopt ;

    Pose pose ;
    pose.position_ = selected->frame_.origin_ ;
    pose.orientation_ = Quaternionf(selected->frame_.rotation_).normalized() ;
    return pose ;
}

optional<Person> GestureClassifier::classify(const Skeleton &sk) const {
    auto neck = sk.position("Neck") ;
    if ( !neck ) return nullopt ;

    Person person ;
    person.position_ = *neck ;
    person.tags_ = waveTags(sk) ;
    person.pointing_pose_ = pointingPose(sk) ;

    if ( person.pointing_pose_ )
        person.tags_.insert("is_pointing") ;

    return person ;
}
