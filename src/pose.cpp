#include "voxpose/pose.hpp"
#include "voxpose/errors.hpp"

#include <stdexcept>
#include <string>

namespace voxpose {

Pose decode_pose(const Eigen::Vector4f& raw_quaternion,
                 const Eigen::Vector3f& translation_residual,
                 const Eigen::Vector3f& centroid,
                 float pitch) {
    if (!raw_quaternion.allFinite()) {
        throw InvalidQuaternionError("Predicted quaternion cannot be normalised");
    }
    const float norm = raw_quaternion.stableNorm();
    if (norm < 1e-8f) {
        throw InvalidQuaternionError("Predicted quaternion cannot be normalised");
    }
    Pose pose;
    pose.quaternion = raw_quaternion / norm;
    pose.translation = centroid + translation_residual * pitch;
    return pose;
}

Pose decode_pose(const RegressorOutput& output, int class_id, const Eigen::Vector3f& centroid, float pitch) {
    const Eigen::Index row = class_id - 1;
    if (row < 0 || row >= output.quaternions.rows() || row >= output.translations.rows()) {
        throw std::out_of_range("Class id " + std::to_string(class_id) + " has no regressor output row");
    }
    return decode_pose(output.quaternions.row(row).transpose(), output.translations.row(row).transpose(), centroid,
                       pitch);
}

} // namespace voxpose
