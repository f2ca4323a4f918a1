#ifndef VOXPOSE_TRANSFORM_HPP
#define VOXPOSE_TRANSFORM_HPP

#include "voxpose/types.hpp"

#include <Eigen/Dense>
#include <vector>

namespace voxpose::transform {

// Rotation matrix of a (w, x, y, z) quaternion. The input is normalised first.
// Throws InvalidQuaternionError for non-finite or near-zero quaternions.
Eigen::Matrix3f quaternion_to_matrix(const Eigen::Vector4f& quaternion);

// (w, x, y, z) quaternion of a rotation matrix, with w >= 0.
Eigen::Vector4f matrix_to_quaternion(const Eigen::Matrix3f& rotation);

Eigen::Matrix4f compose_transform(const Eigen::Matrix3f& rotation, const Eigen::Vector3f& translation);

Eigen::Matrix4f pose_to_transform(const Pose& pose);

// Rigid inverse [R^T, -R^T t; 0 0 0 1].
// Throws InvalidTransformError if T is not a proper rigid transform.
Eigen::Matrix4f invert_transform(const Eigen::Matrix4f& transform);

bool is_rigid_transform(const Eigen::Matrix4f& transform, float tolerance = 1e-4f);

// NaN rows are copied through untransformed.
PointMatrix transform_points(const PointMatrix& points, const Eigen::Matrix4f& transform);

// One point set through several transforms.
std::vector<PointMatrix> transform_points(const PointMatrix& points,
                                          const std::vector<Eigen::Matrix4f>& transforms);

// Pairwise: points[k] through transforms[k].
std::vector<PointMatrix> transform_points(const std::vector<PointMatrix>& points,
                                          const std::vector<Eigen::Matrix4f>& transforms);

} // namespace voxpose::transform

#endif // VOXPOSE_TRANSFORM_HPP
