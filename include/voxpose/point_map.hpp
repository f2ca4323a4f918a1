#ifndef VOXPOSE_POINT_MAP_HPP
#define VOXPOSE_POINT_MAP_HPP

#include "voxpose/types.hpp"

#include <Eigen/Dense>
#include <opencv2/core.hpp>

namespace voxpose::geometry {

struct CameraIntrinsics {
    float fx = 0.0f;
    float fy = 0.0f;
    float cx = 0.0f;
    float cy = 0.0f;
};

// Valid (feature, point) rows of one view.
struct ViewSamples {
    FeatureMatrix values;
    PointMatrix points;
};

// Organised CV_32FC3 point map in the camera frame. Depth is CV_32FC1 in metres,
// or CV_16UC1 scaled by depth_scale. Pixels without depth become NaN.
cv::Mat pointcloud_from_depth(const cv::Mat& depth, const CameraIntrinsics& intrinsics, float depth_scale = 1.0f);

// Applies a transform to every valid pixel of a CV_32FC3 point map.
cv::Mat transform_point_map(const cv::Mat& point_map, const Eigen::Matrix4f& transform);

// Rows of an H x W, CV_32FC(C) feature map whose point has no NaN component.
ViewSamples extract_valid_samples(const cv::Mat& feature_map, const cv::Mat& point_map);

PointMatrix valid_point_rows(const PointMatrix& points);

} // namespace voxpose::geometry

#endif // VOXPOSE_POINT_MAP_HPP
