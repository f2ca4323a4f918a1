#ifndef VOXPOSE_CENTROID_HPP
#define VOXPOSE_CENTROID_HPP

#include "voxpose/dense_grid.hpp"
#include "voxpose/voxelization.hpp"

#include <Eigen/Dense>

namespace voxpose::voxel {

// World position of the mean index of the occupied voxels:
// origin + pitch * mean_index. Translation is predicted relative to this point.
// Throws EmptyOccupancyError when nothing is occupied.
Eigen::Vector3f occupancy_centroid(const OccupancyMask& occupancy, const VoxelGridSpec& grid);

} // namespace voxpose::voxel

#endif // VOXPOSE_CENTROID_HPP
