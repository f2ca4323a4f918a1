#include "voxpose/voxelization.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace voxpose::voxel {

namespace {

// Returns false when the point is invalid or falls outside the grid.
bool voxel_index(const Eigen::Vector3f& point, const VoxelGridSpec& grid, Eigen::Vector3i& index) {
    for (int axis = 0; axis < 3; ++axis) {
        const float coord = point[axis];
        if (std::isnan(coord)) {
            return false;
        }
        // bounds checked in float, before the int cast
        const float cell = std::floor((coord - grid.origin[axis]) / grid.pitch);
        if (!(cell >= 0.0f) || cell >= static_cast<float>(grid.dimensions[axis])) {
            return false;
        }
        index[axis] = static_cast<int>(cell);
    }
    return true;
}

} // anonymous namespace

void validate_grid_spec(const VoxelGridSpec& grid) {
    if (!std::isfinite(grid.pitch) || grid.pitch <= 0.0f) {
        throw std::invalid_argument("Voxel pitch must be finite and positive, got " + std::to_string(grid.pitch));
    }
    if (!grid.origin.allFinite()) {
        throw std::invalid_argument("Voxel grid origin must be finite");
    }
    if ((grid.dimensions.array() <= 0).any()) {
        throw std::invalid_argument("Voxel grid dimensions must be positive");
    }
}

AverageVoxelization average_voxelization_3d(const FeatureMatrix& values,
                                            const PointMatrix& points,
                                            const VoxelGridSpec& grid,
                                            int channels,
                                            bool return_counts) {
    validate_grid_spec(grid);
    if (channels <= 0) {
        throw std::invalid_argument("Channel count must be positive, got " + std::to_string(channels));
    }
    if (values.rows() != points.rows()) {
        throw std::invalid_argument("values and points must have the same number of rows (" +
                                    std::to_string(values.rows()) + " vs " + std::to_string(points.rows()) + ")");
    }
    if (values.rows() > 0 && values.cols() != channels) {
        throw std::invalid_argument("values have " + std::to_string(values.cols()) + " columns, expected " +
                                    std::to_string(channels));
    }

    FeatureGrid sums(channels, grid.dimensions, 0.0f);
    CountGrid counts(1, grid.dimensions, 0u);

    Eigen::Vector3i index;
    for (Eigen::Index i = 0; i < points.rows(); ++i) {
        if (!voxel_index(points.row(i).transpose(), grid, index)) {
            continue;
        }
        for (int c = 0; c < channels; ++c) {
            sums.at(c, index.x(), index.y(), index.z()) += values(i, c);
        }
        counts.at(index.x(), index.y(), index.z()) += 1;
    }

    // Normalisation pass: O(X * Y * Z * C).
    const size_t n_voxels = counts.voxel_count();
    auto& data = sums.data();
    for (size_t v = 0; v < n_voxels; ++v) {
        const std::uint32_t count = counts.data()[v];
        if (count == 0) {
            continue;
        }
        const float inv = 1.0f / static_cast<float>(count);
        for (int c = 0; c < channels; ++c) {
            data[static_cast<size_t>(c) * n_voxels + v] *= inv;
        }
    }

    AverageVoxelization result;
    result.grid = std::move(sums);
    if (return_counts) {
        result.counts = std::move(counts);
    }
    return result;
}

OccupancyMask occupancy_from_counts(const CountGrid& counts) {
    OccupancyMask mask(1, counts.dimensions(), 0);
    for (size_t v = 0; v < counts.voxel_count(); ++v) {
        mask.data()[v] = counts.data()[v] > 0 ? 1 : 0;
    }
    return mask;
}

void occupancy_union(OccupancyMask& target, const OccupancyMask& other) {
    if (!target.same_shape(other)) {
        throw std::invalid_argument("occupancy_union: masks differ in shape");
    }
    std::transform(target.data().begin(), target.data().end(), other.data().begin(), target.data().begin(),
                   [](std::uint8_t a, std::uint8_t b) -> std::uint8_t { return (a || b) ? 1 : 0; });
}

void merge_maximum(FeatureGrid& target, const FeatureGrid& other) {
    if (!target.same_shape(other)) {
        throw std::invalid_argument("merge_maximum: grids differ in shape");
    }
    std::transform(target.data().begin(), target.data().end(), other.data().begin(), target.data().begin(),
                   [](float a, float b) { return std::max(a, b); });
}

size_t count_occupied(const OccupancyMask& mask) {
    return static_cast<size_t>(std::count_if(mask.data().begin(), mask.data().end(),
                                             [](std::uint8_t v) { return v != 0; }));
}

} // namespace voxpose::voxel
