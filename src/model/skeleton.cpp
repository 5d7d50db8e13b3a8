#include <ptrac/model/skeleton.hpp>

#include <set>

using namespace Eigen ;
using namespace std ;

static const vector<Link> s_links = {
    // head
    { "Nose", "Neck" },
    { "REar", "REye" },
    { "REye", "Nose" },
    { "LEar", "LEye" },
    { "LEye", "Nose" },
    // body
    { "RShoulder", "Neck" },
    { "LShoulder", "Neck" },
    { "RShoulder", "RElbow" },
    { "LShoulder", "LElbow" },
    { "RElbow", "RWrist" },
    { "LElbow", "LWrist" },
    // legs
    { "RHip", "Neck" },
    { "LHip", "Neck" },
    { "RKnee", "RHip" },
    { "LKnee", "LHip" },
    { "RAnkle", "RKnee" },
    { "LAnkle", "LKnee" }
};

const vector<Link> &Skeleton::topology() {
    return s_links ;
}

void Skeleton::addJoint(const Joint &j) {
    auto it = joints_.find(j.name_) ;
    if ( it == joints_.end() )
        joints_.emplace(j.name_, j) ;
    else if ( j.probability_ > it->second.probability_ )
        it->second = j ;
}

const Joint *Skeleton::findJoint(const string &name) const {
    auto it = joints_.find(name) ;
    if ( it == joints_.end() ) return nullptr ;
    return &it->second ;
}

optional<Vector3f> Skeleton::position(const string &name) const {
    const Joint *j = findJoint(name) ;
    if ( j == nullptr ) return nullopt ;
    return j->point_ ;
}

Skeleton Skeleton::filtered(float thresh) const {
    set<string> rejected ;

    for( const auto &link: s_links ) {
        auto p1 = position(link.first) ;
        auto p2 = position(link.second) ;
        if ( !p1 || !p2 ) continue ;

        if ( (*p1 - *p2).norm() > thresh ) {
            rejected.insert(link.first) ;
            rejected.insert(link.second) ;
        }
    }

    Skeleton res(group_id_) ;
    for( const auto &jp: joints_ ) {
        if ( rejected.count(jp.first) == 0 )
            res.joints_.emplace(jp) ;
    }

    return res ;
}

vector<LinkSegment> Skeleton::linkSegments() const {
    vector<LinkSegment> segments ;

    for( const auto &link: s_links ) {
        auto p1 = position(link.first) ;
        auto p2 = position(link.second) ;
        if ( p1 && p2 )
            segments.emplace_back(*p1, *p2) ;
    }

    return segments ;
}

vector<Skeleton> Skeleton::group(const Joints &joints) {
    vector<Skeleton> skeletons ;
    map<int, size_t> group_index ;

    for( const auto &j: joints ) {
        auto it = group_index.find(j.group_id_) ;
        if ( it == group_index.end() ) {
            it = group_index.emplace(j.group_id_, skeletons.size()).first ;
            skeletons.emplace_back(j.group_id_) ;
        }
        skeletons[it->second].addJoint(j) ;
    }

    return skeletons ;
}
