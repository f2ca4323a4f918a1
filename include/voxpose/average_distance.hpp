#ifndef VOXPOSE_AVERAGE_DISTANCE_HPP
#define VOXPOSE_AVERAGE_DISTANCE_HPP

#include <open3d/Open3D.h>
#include <Eigen/Dense>

namespace voxpose::metrics {

enum class DistanceNorm { L2, L1 };

struct AverageDistance {
    double add = 0.0;    // point-to-corresponding-point
    double add_s = 0.0;  // point-to-nearest-point
};

// ADD and ADD-S (Euclidean) of the model placed by both transforms.
AverageDistance average_distance(const open3d::geometry::PointCloud& cad,
                                 const Eigen::Matrix4d& transform_true,
                                 const Eigen::Matrix4d& transform_pred);

// ADD (symmetric = false) or ADD-S (symmetric = true) under the given norm.
double average_distance(const open3d::geometry::PointCloud& cad,
                        const Eigen::Matrix4d& transform_true,
                        const Eigen::Matrix4d& transform_pred,
                        bool symmetric,
                        DistanceNorm norm = DistanceNorm::L2);

} // namespace voxpose::metrics

#endif // VOXPOSE_AVERAGE_DISTANCE_HPP
