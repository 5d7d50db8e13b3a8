#pragma once

#include <ptrac/model/pose.hpp>

#include <optional>
#include <set>
#include <string>
#include <vector>

struct Person {
    Eigen::Vector3f position_ ;              // position of the neck joint
    std::set<std::string> tags_ ;            // "LWave", "RWave", "is_pointing"
    std::optional<Pose> pointing_pose_ ;     // set only when tagged "is_pointing"

    bool isPointing() const { return tags_.count("is_pointing") != 0 ; }
};

using Persons = std::vector<Person> ;
