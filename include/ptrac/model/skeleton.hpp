#pragma once

#include <Eigen/Core>

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// A named keypoint lifted to 3D. The point is empty when no depth could be
// resolved for it, neither directly nor by imputation.
struct Joint {
    int group_id_ = 0 ;
    std::string name_ ;
    float probability_ = 0.f ;
    std::optional<Eigen::Vector3f> point_ ;
};

using Joints = std::vector<Joint> ;

using Link = std::pair<std::string, std::string> ;
using LinkSegment = std::pair<Eigen::Vector3f, Eigen::Vector3f> ;

// Joints of one candidate person, keyed by joint name.
class Skeleton {
public:
    Skeleton() = default ;
    Skeleton(int group_id): group_id_(group_id) {}

    // adds a joint; if one with the same name exists the most probable one is kept
    void addJoint(const Joint &j) ;

    int groupId() const { return group_id_ ; }
    const std::map<std::string, Joint> &joints() const { return joints_ ; }

    bool empty() const { return joints_.empty() ; }
    size_t size() const { return joints_.size() ; }

    bool hasJoint(const std::string &name) const { return joints_.count(name) != 0 ; }
    const Joint *findJoint(const std::string &name) const ;

    // 3D position of a joint, empty if the joint is missing or unresolved
    std::optional<Eigen::Vector3f> position(const std::string &name) const ;

    // removes joints connected by a link longer than thresh; both endpoints of
    // such a link are dropped, in a single pass over the topology
    Skeleton filtered(float thresh) const ;

    // point pairs of every topology link whose endpoints are both resolved
    std::vector<LinkSegment> linkSegments() const ;

    // fixed anatomical adjacency shared by all skeletons
    static const std::vector<Link> &topology() ;

    // partition joints by group id, groups ordered by first appearance
    static std::vector<Skeleton> group(const Joints &joints) ;

private:
    int group_id_ = 0 ;
    std::map<std::string, Joint> joints_ ;
};
