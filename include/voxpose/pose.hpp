#ifndef VOXPOSE_POSE_HPP
#define VOXPOSE_POSE_HPP

#include "voxpose/pose_regressor.hpp"
#include "voxpose/types.hpp"

#include <Eigen/Dense>

namespace voxpose {

// Normalises the quaternion and resolves the translation residual:
// translation = centroid + residual * pitch.
Pose decode_pose(const Eigen::Vector4f& raw_quaternion,
                 const Eigen::Vector3f& translation_residual,
                 const Eigen::Vector3f& centroid,
                 float pitch);

// Picks the row of class_id from a multi-class head output and decodes it.
Pose decode_pose(const RegressorOutput& output, int class_id, const Eigen::Vector3f& centroid, float pitch);

} // namespace voxpose

#endif // VOXPOSE_POSE_HPP
