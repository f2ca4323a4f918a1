#ifndef VOXPOSE_TEST_UTILS_HPP
#define VOXPOSE_TEST_UTILS_HPP

#include "voxpose/cad_model_repository.hpp"
#include "voxpose/multi_view_fusion.hpp"
#include "voxpose/pose_regressor.hpp"

#include <open3d/Open3D.h>
#include <opencv2/core.hpp>
#include <cmath>
#include <limits>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace test_utils {

inline std::shared_ptr<open3d::geometry::PointCloud> create_dummy_pcd(size_t num_points) {
    auto pcd = std::make_shared<open3d::geometry::PointCloud>();
    for (size_t i = 0; i < num_points; ++i) {
        pcd->points_.emplace_back(static_cast<double>(i), 0.0, 0.0);
    }
    return pcd;
}

// Evenly spaced points on a circle of the given radius in the z = 0 plane.
// Invariant under rotations about z by multiples of 2 pi / num_points.
inline std::shared_ptr<open3d::geometry::PointCloud> create_ring_pcd(size_t num_points, double radius) {
    auto pcd = std::make_shared<open3d::geometry::PointCloud>();
    for (size_t i = 0; i < num_points; ++i) {
        const double angle = 2.0 * M_PI * static_cast<double>(i) / static_cast<double>(num_points);
        pcd->points_.emplace_back(radius * std::cos(angle), radius * std::sin(angle), 0.0);
    }
    return pcd;
}

class FakeModelLookup : public voxpose::cad::ModelLookup {
public:
    void add(int class_id, std::shared_ptr<const open3d::geometry::PointCloud> pcd) {
        models_[class_id] = std::move(pcd);
    }

    voxpose::cad::CadPointCloud get_pcd(int class_id) const override {
        auto it = models_.find(class_id);
        if (it == models_.end()) {
            throw std::out_of_range("no model for class " + std::to_string(class_id));
        }
        return it->second;
    }

    bool has_model(int class_id) const override { return models_.count(class_id) > 0; }

private:
    std::map<int, voxpose::cad::CadPointCloud> models_;
};

// Returns fixed outputs and records how it was called.
class FakeRegressor : public voxpose::PoseRegressor {
public:
    explicit FakeRegressor(int n_fg_class) : n_fg_class_(n_fg_class) {
        output_.quaternions = Eigen::MatrixX4f::Zero(n_fg_class, 4);
        output_.quaternions.col(0).setConstant(2.0f);  // unnormalised identity
        output_.translations = Eigen::MatrixX3f::Zero(n_fg_class, 3);
    }

    int num_foreground_classes() const override { return n_fg_class_; }

    voxpose::RegressorOutput regress(const voxpose::FeatureGrid&, const voxpose::OccupancyMask& occupancy) override {
        occupied_counts.push_back(voxpose::voxel::count_occupied(occupancy));
        return output_;
    }

    voxpose::RegressorOutput& output() { return output_; }

    std::vector<size_t> occupied_counts;

private:
    int n_fg_class_;
    voxpose::RegressorOutput output_;
};

// H x W point map filled with NaN.
inline cv::Mat nan_point_map(int rows, int cols) {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    return cv::Mat(rows, cols, CV_32FC3, cv::Scalar(nan, nan, nan));
}

// 1 x N view holding the given points and scalar features.
inline voxpose::fusion::ViewObservation make_view(int class_id,
                                                  const std::vector<Eigen::Vector3f>& points,
                                                  const std::vector<float>& features,
                                                  const voxpose::voxel::VoxelGridSpec& grid) {
    voxpose::fusion::ViewObservation view;
    view.class_id = class_id;
    view.grid = grid;
    view.point_map = nan_point_map(1, static_cast<int>(points.size()));
    view.feature_map = cv::Mat(1, static_cast<int>(points.size()), CV_32FC1, cv::Scalar(0.0f));
    for (size_t i = 0; i < points.size(); ++i) {
        const int u = static_cast<int>(i);
        view.point_map.at<cv::Vec3f>(0, u) = cv::Vec3f(points[i].x(), points[i].y(), points[i].z());
        view.feature_map.at<float>(0, u) = features[i];
    }
    return view;
}

inline voxpose::voxel::VoxelGridSpec unit_grid(int dim) {
    voxpose::voxel::VoxelGridSpec grid;
    grid.origin = Eigen::Vector3f::Zero();
    grid.pitch = 1.0f;
    grid.dimensions = Eigen::Vector3i::Constant(dim);
    return grid;
}

} // namespace test_utils

#endif // VOXPOSE_TEST_UTILS_HPP
