#ifndef VOXPOSE_TYPES_HPP
#define VOXPOSE_TYPES_HPP

#include <Eigen/Dense>

namespace voxpose {

// M x 3 world coordinates, one point per row. NaN rows are invalid samples.
using PointMatrix = Eigen::Matrix<float, Eigen::Dynamic, 3, Eigen::RowMajor>;

// M x C features, row-aligned with a PointMatrix.
using FeatureMatrix = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Quaternions are always (w, x, y, z).
struct Pose {
    Eigen::Vector4f quaternion = Eigen::Vector4f(1.0f, 0.0f, 0.0f, 0.0f);
    Eigen::Vector3f translation = Eigen::Vector3f::Zero();
};

} // namespace voxpose

#endif // VOXPOSE_TYPES_HPP
