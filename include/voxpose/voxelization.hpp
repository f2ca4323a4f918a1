#ifndef VOXPOSE_VOXELIZATION_HPP
#define VOXPOSE_VOXELIZATION_HPP

#include "voxpose/dense_grid.hpp"
#include "voxpose/types.hpp"

#include <Eigen/Dense>
#include <optional>

namespace voxpose::voxel {

// Placement of a grid in world space. Cell (x, y, z) spans
// origin + pitch * (x, y, z) to origin + pitch * (x + 1, y + 1, z + 1).
struct VoxelGridSpec {
    Eigen::Vector3f origin = Eigen::Vector3f::Zero();
    float pitch = 1.0f;
    Eigen::Vector3i dimensions = Eigen::Vector3i::Constant(32);
};

struct AverageVoxelization {
    FeatureGrid grid;                 // per-voxel mean feature, (C, X, Y, Z)
    std::optional<CountGrid> counts;  // set only when counts were requested
};

// Scatters each (value, point) row into the grid cell floor((p - origin) / pitch)
// and averages the values per cell. Points outside the grid and rows with a NaN
// coordinate are dropped.
AverageVoxelization average_voxelization_3d(const FeatureMatrix& values,
                                            const PointMatrix& points,
                                            const VoxelGridSpec& grid,
                                            int channels,
                                            bool return_counts = false);

OccupancyMask occupancy_from_counts(const CountGrid& counts);

// In-place logical OR.
void occupancy_union(OccupancyMask& target, const OccupancyMask& other);

// In-place element-wise maximum.
void merge_maximum(FeatureGrid& target, const FeatureGrid& other);

size_t count_occupied(const OccupancyMask& mask);

void validate_grid_spec(const VoxelGridSpec& grid);

} // namespace voxpose::voxel

#endif // VOXPOSE_VOXELIZATION_HPP
