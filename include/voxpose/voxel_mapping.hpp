#ifndef VOXPOSE_VOXEL_MAPPING_HPP
#define VOXPOSE_VOXEL_MAPPING_HPP

#include "voxpose/types.hpp"
#include "voxpose/voxelization.hpp"

namespace voxpose::voxel {

// A model whose bounding-box diagonal spans the whole grid edge.
float pitch_from_bbox_diagonal(float bbox_diagonal, int voxel_dim);

// Cubic grid centred on the axis-aligned bounding box of the valid points.
VoxelGridSpec grid_around_points(const PointMatrix& points, float pitch, int voxel_dim);

// Cubic grid centred on the CAD frame origin.
VoxelGridSpec canonical_grid(float pitch, int voxel_dim);

} // namespace voxpose::voxel

#endif // VOXPOSE_VOXEL_MAPPING_HPP
