#include <ptrac/util/io_util.hpp>

#include <cvx/misc/json_reader.hpp>
#include <opencv2/imgcodecs.hpp>

#include <fstream>

using namespace std ;
using namespace cvx ;

static Detection parseDetection(JSONReader &json) {
    Detection det ;

    json.beginObject() ;
    while ( json.hasNext() ) {
        string key = json.nextName() ;
        if ( key == "group" )
            det.group_id_ = json.nextInt() ;
        else if ( key == "label" )
            det.label_ = json.nextString() ;
        else if ( key == "probability" )
            det.probability_ = json.nextDouble() ;
        else if ( key == "roi" ) {
            json.beginArray() ;
            det.roi_.x = json.nextInt() ;
            det.roi_.y = json.nextInt() ;
            det.roi_.width = json.nextInt() ;
            det.roi_.height = json.nextInt() ;
            json.endArray() ;
        } else
            throw std::runtime_error("unexpected detection attribute: " + key) ;
    }
    json.endObject() ;

    return det ;
}

Detections loadDetections(istream &strm, cv::Size &rgb_size) {
    Detections detections ;
    rgb_size = cv::Size() ;

    JSONReader json(strm) ;

    json.beginObject() ;
    while ( json.hasNext() ) {
        string key = json.nextName() ;
        if ( key == "rgb_size" ) {
            json.beginArray() ;
            rgb_size.width = json.nextInt() ;
            rgb_size.height = json.nextInt() ;
            json.endArray() ;
        } else if ( key == "detections" ) {
            json.beginArray() ;
            while ( json.hasNext() )
                detections.emplace_back(parseDetection(json)) ;
            json.endArray() ;
        } else
            throw std::runtime_error("unexpected key: " + key) ;
    }
    json.endObject() ;

    return detections ;
}

Detections loadDetections(const string &path, cv::Size &rgb_size) {
    ifstream strm(path) ;
    if ( !strm )
        throw std::runtime_error("cannot open detections file: " + path) ;

    return loadDetections(strm, rgb_size) ;
}

cv::Mat loadDepthImage(const string &path) {
    cv::Mat im = cv::imread(path, -1) ;
    if ( im.empty() )
        throw std::runtime_error("cannot read depth image: " + path) ;

    if ( im.type() == CV_32FC1 ) return im ;

    if ( im.type() != CV_16UC1 )
        throw std::runtime_error("unsupported depth image format: " + path) ;

    cv::Mat depth ;
    im.convertTo(depth, CV_32FC1, 0.001) ;
    return depth ;
}

void printPersons(ostream &strm, const Persons &persons) {
    strm << persons.size() << " person(s)" << endl ;

    for( size_t i=0 ; i<persons.size() ; i++ ) {
        const Person &p = persons[i] ;
        strm << "person " << i << ": position " << p.position_.adjoint() ;

        strm << " tags [" ;
        for( const auto &tag: p.tags_ ) strm << ' ' << tag ;
        strm << " ]" ;

        if ( p.pointing_pose_ ) {
            const Pose &pose = *p.pointing_pose_ ;
            strm << " pointing " << pose.position_.adjoint() << " q " << pose.orientation_.coeffs().adjoint() ;
        }
        strm << endl ;
    }
}
