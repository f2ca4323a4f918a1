#include "voxpose/average_distance.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

namespace voxpose::metrics {

namespace {

double distance(const Eigen::Vector3d& a, const Eigen::Vector3d& b, DistanceNorm norm) {
    return norm == DistanceNorm::L1 ? (a - b).lpNorm<1>() : (a - b).norm();
}

open3d::geometry::PointCloud transformed_copy(const open3d::geometry::PointCloud& cad,
                                              const Eigen::Matrix4d& transform) {
    open3d::geometry::PointCloud copy;
    copy.points_ = cad.points_;
    copy.Transform(transform);
    return copy;
}

void require_points(const open3d::geometry::PointCloud& cad) {
    if (cad.points_.empty()) {
        throw std::invalid_argument("average_distance: CAD point cloud is empty");
    }
}

double asymmetric(const open3d::geometry::PointCloud& pts_true,
                  const open3d::geometry::PointCloud& pts_pred,
                  DistanceNorm norm) {
    double sum = 0.0;
    for (size_t i = 0; i < pts_true.points_.size(); ++i) {
        sum += distance(pts_true.points_[i], pts_pred.points_[i], norm);
    }
    return sum / static_cast<double>(pts_true.points_.size());
}

double symmetric_l2(const open3d::geometry::PointCloud& pts_true, const open3d::geometry::PointCloud& pts_pred) {
    open3d::geometry::KDTreeFlann tree(pts_pred);
    std::vector<int> indices(1);
    std::vector<double> distance2(1);
    double sum = 0.0;
    for (const auto& p : pts_true.points_) {
        if (tree.SearchKNN(p, 1, indices, distance2) < 1) {
            throw std::runtime_error("average_distance: nearest neighbour search returned nothing");
        }
        sum += std::sqrt(distance2[0]);
    }
    return sum / static_cast<double>(pts_true.points_.size());
}

// Exhaustive: a Euclidean KD-tree does not give L1 nearest neighbours.
double symmetric_l1(const open3d::geometry::PointCloud& pts_true, const open3d::geometry::PointCloud& pts_pred) {
    double sum = 0.0;
    for (const auto& p : pts_true.points_) {
        double best = std::numeric_limits<double>::infinity();
        for (const auto& q : pts_pred.points_) {
            best = std::min(best, distance(p, q, DistanceNorm::L1));
        }
        sum += best;
    }
    return sum / static_cast<double>(pts_true.points_.size());
}

} // anonymous namespace

AverageDistance average_distance(const open3d::geometry::PointCloud& cad,
                                 const Eigen::Matrix4d& transform_true,
                                 const Eigen::Matrix4d& transform_pred) {
    require_points(cad);
    const auto pts_true = transformed_copy(cad, transform_true);
    const auto pts_pred = transformed_copy(cad, transform_pred);
    return {asymmetric(pts_true, pts_pred, DistanceNorm::L2), symmetric_l2(pts_true, pts_pred)};
}

double average_distance(const open3d::geometry::PointCloud& cad,
                        const Eigen::Matrix4d& transform_true,
                        const Eigen::Matrix4d& transform_pred,
                        bool symmetric,
                        DistanceNorm norm) {
    require_points(cad);
    const auto pts_true = transformed_copy(cad, transform_true);
    const auto pts_pred = transformed_copy(cad, transform_pred);
    if (!symmetric) {
        return asymmetric(pts_true, pts_pred, norm);
    }
    return norm == DistanceNorm::L1 ? symmetric_l1(pts_true, pts_pred) : symmetric_l2(pts_true, pts_pred);
}

} // namespace voxpose::metrics
