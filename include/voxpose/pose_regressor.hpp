#ifndef VOXPOSE_POSE_REGRESSOR_HPP
#define VOXPOSE_POSE_REGRESSOR_HPP

#include "voxpose/dense_grid.hpp"

#include <Eigen/Dense>

namespace voxpose {

// Raw head outputs, one row per foreground class (class id c is row c - 1).
struct RegressorOutput {
    Eigen::MatrixX4f quaternions;   // unnormalised (w, x, y, z)
    Eigen::MatrixX3f translations;  // residual from the occupancy centroid, in voxels
};

// Volumetric encoder and pose heads. Implemented outside this library.
class PoseRegressor {
public:
    virtual ~PoseRegressor() = default;

    virtual int num_foreground_classes() const = 0;

    virtual RegressorOutput regress(const FeatureGrid& grid, const OccupancyMask& occupancy) = 0;
};

} // namespace voxpose

#endif // VOXPOSE_POSE_REGRESSOR_HPP
