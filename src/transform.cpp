#include "voxpose/transform.hpp"
#include "voxpose/errors.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>

namespace voxpose::transform {

namespace {

constexpr float kMinQuaternionNorm = 1e-8f;

bool row_is_valid(const PointMatrix& points, Eigen::Index row) {
    return !std::isnan(points(row, 0)) && !std::isnan(points(row, 1)) && !std::isnan(points(row, 2));
}

} // anonymous namespace

Eigen::Matrix3f quaternion_to_matrix(const Eigen::Vector4f& quaternion) {
    if (!quaternion.allFinite()) {
        std::ostringstream msg;
        msg << "Quaternion has non-finite components: " << quaternion.transpose();
        throw InvalidQuaternionError(msg.str());
    }
    const float norm = quaternion.stableNorm();
    if (norm < kMinQuaternionNorm) {
        std::ostringstream msg;
        msg << "Quaternion norm is too small to normalise: " << norm;
        throw InvalidQuaternionError(msg.str());
    }

    const Eigen::Vector4f q = quaternion / norm;
    // Eigen's constructor takes (w, x, y, z) as well.
    const Eigen::Quaternionf eigen_q(q[0], q[1], q[2], q[3]);
    return eigen_q.toRotationMatrix();
}

Eigen::Vector4f matrix_to_quaternion(const Eigen::Matrix3f& rotation) {
    Eigen::Quaternionf q(rotation);
    q.normalize();
    Eigen::Vector4f wxyz(q.w(), q.x(), q.y(), q.z());
    if (wxyz[0] < 0.0f) {
        wxyz = -wxyz;
    }
    return wxyz;
}

Eigen::Matrix4f compose_transform(const Eigen::Matrix3f& rotation, const Eigen::Vector3f& translation) {
    Eigen::Matrix4f transform = Eigen::Matrix4f::Identity();
    transform.block<3, 3>(0, 0) = rotation;
    transform.block<3, 1>(0, 3) = translation;
    return transform;
}

Eigen::Matrix4f pose_to_transform(const Pose& pose) {
    return compose_transform(quaternion_to_matrix(pose.quaternion), pose.translation);
}

bool is_rigid_transform(const Eigen::Matrix4f& transform, float tolerance) {
    if (!transform.allFinite()) {
        return false;
    }
    const Eigen::RowVector4f bottom = transform.row(3);
    if ((bottom - Eigen::RowVector4f(0.0f, 0.0f, 0.0f, 1.0f)).cwiseAbs().maxCoeff() > tolerance) {
        return false;
    }
    const Eigen::Matrix3f rotation = transform.block<3, 3>(0, 0);
    const float orthogonality_error = (rotation.transpose() * rotation - Eigen::Matrix3f::Identity()).norm();
    if (orthogonality_error > tolerance) {
        return false;
    }
    return std::abs(rotation.determinant() - 1.0f) <= tolerance;
}

Eigen::Matrix4f invert_transform(const Eigen::Matrix4f& transform) {
    if (!is_rigid_transform(transform)) {
        std::ostringstream msg;
        msg << "Cannot rigidly invert a non-rigid transform:\n" << transform;
        throw InvalidTransformError(msg.str());
    }
    const Eigen::Matrix3f rotation_t = transform.block<3, 3>(0, 0).transpose();
    const Eigen::Vector3f translation = transform.block<3, 1>(0, 3);
    return compose_transform(rotation_t, -rotation_t * translation);
}

PointMatrix transform_points(const PointMatrix& points, const Eigen::Matrix4f& transform) {
    const Eigen::Matrix3f rotation = transform.block<3, 3>(0, 0);
    const Eigen::Vector3f translation = transform.block<3, 1>(0, 3);

    PointMatrix transformed(points.rows(), 3);
    for (Eigen::Index i = 0; i < points.rows(); ++i) {
        if (!row_is_valid(points, i)) {
            transformed.row(i) = points.row(i);
            continue;
        }
        const Eigen::Vector3f p = points.row(i).transpose();
        transformed.row(i) = (rotation * p + translation).transpose();
    }
    return transformed;
}

std::vector<PointMatrix> transform_points(const PointMatrix& points,
                                          const std::vector<Eigen::Matrix4f>& transforms) {
    std::vector<PointMatrix> result;
    result.reserve(transforms.size());
    for (const auto& transform : transforms) {
        result.push_back(transform_points(points, transform));
    }
    return result;
}

std::vector<PointMatrix> transform_points(const std::vector<PointMatrix>& points,
                                          const std::vector<Eigen::Matrix4f>& transforms) {
    if (points.size() != transforms.size()) {
        throw std::invalid_argument("transform_points: got " + std::to_string(points.size()) +
                                    " point sets but " + std::to_string(transforms.size()) + " transforms");
    }
    std::vector<PointMatrix> result;
    result.reserve(points.size());
    for (size_t k = 0; k < points.size(); ++k) {
        result.push_back(transform_points(points[k], transforms[k]));
    }
    return result;
}

} // namespace voxpose::transform
