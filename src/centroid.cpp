#include "voxpose/centroid.hpp"
#include "voxpose/errors.hpp"

#include <stdexcept>

namespace voxpose::voxel {

Eigen::Vector3f occupancy_centroid(const OccupancyMask& occupancy, const VoxelGridSpec& grid) {
    if (occupancy.dimensions() != grid.dimensions) {
        throw std::invalid_argument("occupancy_centroid: mask and grid spec dimensions differ");
    }

    const Eigen::Vector3i& dims = occupancy.dimensions();
    Eigen::Vector3d index_sum = Eigen::Vector3d::Zero();
    size_t n_occupied = 0;
    for (int x = 0; x < dims.x(); ++x) {
        for (int y = 0; y < dims.y(); ++y) {
            for (int z = 0; z < dims.z(); ++z) {
                if (occupancy.at(x, y, z)) {
                    index_sum += Eigen::Vector3d(x, y, z);
                    ++n_occupied;
                }
            }
        }
    }
    if (n_occupied == 0) {
        throw EmptyOccupancyError("No occupied voxel, centroid is undefined");
    }

    const Eigen::Vector3f mean_index = (index_sum / static_cast<double>(n_occupied)).cast<float>();
    return grid.origin + grid.pitch * mean_index;
}

} // namespace voxpose::voxel
