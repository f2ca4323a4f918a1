#include "voxpose/voxel_mapping.hpp"
#include "voxpose/point_map.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace voxpose::voxel {

namespace {

void require_voxel_dim(int voxel_dim) {
    if (voxel_dim <= 0) {
        throw std::invalid_argument("voxel_dim must be positive, got " + std::to_string(voxel_dim));
    }
}

} // anonymous namespace

float pitch_from_bbox_diagonal(float bbox_diagonal, int voxel_dim) {
    require_voxel_dim(voxel_dim);
    if (!std::isfinite(bbox_diagonal) || bbox_diagonal <= 0.0f) {
        throw std::invalid_argument("Bounding box diagonal must be positive, got " + std::to_string(bbox_diagonal));
    }
    return bbox_diagonal / static_cast<float>(voxel_dim);
}

VoxelGridSpec grid_around_points(const PointMatrix& points, float pitch, int voxel_dim) {
    require_voxel_dim(voxel_dim);
    const PointMatrix valid = geometry::valid_point_rows(points);
    if (valid.rows() == 0) {
        throw std::invalid_argument("Cannot place a grid around an empty point set");
    }

    const Eigen::Vector3f aabb_min = valid.colwise().minCoeff().transpose();
    const Eigen::Vector3f aabb_max = valid.colwise().maxCoeff().transpose();
    const Eigen::Vector3f aabb_center = aabb_min + (aabb_max - aabb_min) / 2.0f;

    VoxelGridSpec grid;
    grid.pitch = pitch;
    grid.dimensions = Eigen::Vector3i::Constant(voxel_dim);
    grid.origin = aabb_center - Eigen::Vector3f::Constant(pitch * static_cast<float>(voxel_dim) / 2.0f);
    validate_grid_spec(grid);
    return grid;
}

VoxelGridSpec canonical_grid(float pitch, int voxel_dim) {
    require_voxel_dim(voxel_dim);
    VoxelGridSpec grid;
    grid.pitch = pitch;
    grid.dimensions = Eigen::Vector3i::Constant(voxel_dim);
    grid.origin = Eigen::Vector3f::Constant(-static_cast<float>(voxel_dim / 2) * pitch);
    validate_grid_spec(grid);
    return grid;
}

} // namespace voxpose::voxel
