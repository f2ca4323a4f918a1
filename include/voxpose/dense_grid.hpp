#ifndef VOXPOSE_DENSE_GRID_HPP
#define VOXPOSE_DENSE_GRID_HPP

#include <Eigen/Dense>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace voxpose {

// Dense (C, X, Y, Z) array, z fastest.
template <typename T>
class DenseGrid {
public:
    DenseGrid() = default;

    DenseGrid(int channels, const Eigen::Vector3i& dimensions, T fill = T())
        : channels_(channels), dimensions_(dimensions) {
        if (channels <= 0 || (dimensions.array() <= 0).any()) {
            throw std::invalid_argument("DenseGrid: channels and dimensions must be positive");
        }
        data_.assign(static_cast<size_t>(channels) * voxel_count(), fill);
    }

    int channels() const { return channels_; }
    const Eigen::Vector3i& dimensions() const { return dimensions_; }

    size_t voxel_count() const {
        return static_cast<size_t>(dimensions_.x()) * dimensions_.y() * dimensions_.z();
    }

    size_t flat_index(int c, int x, int y, int z) const {
        return ((static_cast<size_t>(c) * dimensions_.x() + x) * dimensions_.y() + y) * dimensions_.z() + z;
    }

    T& at(int c, int x, int y, int z) { return data_[flat_index(c, x, y, z)]; }
    const T& at(int c, int x, int y, int z) const { return data_[flat_index(c, x, y, z)]; }

    T& at(int x, int y, int z) { return at(0, x, y, z); }
    const T& at(int x, int y, int z) const { return at(0, x, y, z); }

    std::vector<T>& data() { return data_; }
    const std::vector<T>& data() const { return data_; }

    template <typename U>
    bool same_shape(const DenseGrid<U>& other) const {
        return channels_ == other.channels() && dimensions_ == other.dimensions();
    }

    bool operator==(const DenseGrid& other) const { return same_shape(other) && data_ == other.data_; }
    bool operator!=(const DenseGrid& other) const { return !(*this == other); }

private:
    int channels_ = 0;
    Eigen::Vector3i dimensions_ = Eigen::Vector3i::Zero();
    std::vector<T> data_;
};

using FeatureGrid = DenseGrid<float>;
using CountGrid = DenseGrid<std::uint32_t>;
using OccupancyMask = DenseGrid<std::uint8_t>;

} // namespace voxpose

#endif // VOXPOSE_DENSE_GRID_HPP
