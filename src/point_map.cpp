#include "voxpose/point_map.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace voxpose::geometry {

namespace {

bool is_valid(const cv::Vec3f& p) {
    return !std::isnan(p[0]) && !std::isnan(p[1]) && !std::isnan(p[2]);
}

void require_point_map(const cv::Mat& point_map) {
    if (point_map.type() != CV_32FC3) {
        throw std::invalid_argument("Point map must be CV_32FC3");
    }
}

} // anonymous namespace

cv::Mat pointcloud_from_depth(const cv::Mat& depth, const CameraIntrinsics& intrinsics, float depth_scale) {
    if (depth.type() != CV_32FC1 && depth.type() != CV_16UC1) {
        throw std::invalid_argument("Depth image must be CV_32FC1 or CV_16UC1");
    }
    if (intrinsics.fx == 0.0f || intrinsics.fy == 0.0f) {
        throw std::invalid_argument("Focal lengths must be non-zero");
    }

    const float nan = std::numeric_limits<float>::quiet_NaN();
    cv::Mat point_map(depth.rows, depth.cols, CV_32FC3);

    for (int v = 0; v < depth.rows; ++v) {
        auto* row = point_map.ptr<cv::Vec3f>(v);
        for (int u = 0; u < depth.cols; ++u) {
            float z = depth.type() == CV_32FC1 ? depth.at<float>(v, u)
                                               : static_cast<float>(depth.at<std::uint16_t>(v, u)) * depth_scale;
            if (!std::isfinite(z) || z <= 0.0f) {
                row[u] = cv::Vec3f(nan, nan, nan);
                continue;
            }
            row[u] = cv::Vec3f((static_cast<float>(u) - intrinsics.cx) * z / intrinsics.fx,
                               (static_cast<float>(v) - intrinsics.cy) * z / intrinsics.fy,
                               z);
        }
    }
    return point_map;
}

cv::Mat transform_point_map(const cv::Mat& point_map, const Eigen::Matrix4f& transform) {
    require_point_map(point_map);
    const Eigen::Matrix3f rotation = transform.block<3, 3>(0, 0);
    const Eigen::Vector3f translation = transform.block<3, 1>(0, 3);

    cv::Mat out = point_map.clone();
    for (int v = 0; v < out.rows; ++v) {
        auto* row = out.ptr<cv::Vec3f>(v);
        for (int u = 0; u < out.cols; ++u) {
            if (!is_valid(row[u])) {
                continue;
            }
            const Eigen::Vector3f p = rotation * Eigen::Vector3f(row[u][0], row[u][1], row[u][2]) + translation;
            row[u] = cv::Vec3f(p.x(), p.y(), p.z());
        }
    }
    return out;
}

ViewSamples extract_valid_samples(const cv::Mat& feature_map, const cv::Mat& point_map) {
    require_point_map(point_map);
    if (feature_map.depth() != CV_32F) {
        throw std::invalid_argument("Feature map must hold 32-bit floats");
    }
    if (feature_map.rows != point_map.rows || feature_map.cols != point_map.cols) {
        throw std::invalid_argument("Feature map is " + std::to_string(feature_map.rows) + "x" +
                                    std::to_string(feature_map.cols) + " but point map is " +
                                    std::to_string(point_map.rows) + "x" + std::to_string(point_map.cols));
    }

    const int channels = feature_map.channels();
    std::vector<cv::Point> pixels;
    pixels.reserve(static_cast<size_t>(point_map.rows) * point_map.cols);
    for (int v = 0; v < point_map.rows; ++v) {
        const auto* row = point_map.ptr<cv::Vec3f>(v);
        for (int u = 0; u < point_map.cols; ++u) {
            if (is_valid(row[u])) {
                pixels.emplace_back(u, v);
            }
        }
    }

    ViewSamples samples;
    samples.values.resize(static_cast<Eigen::Index>(pixels.size()), channels);
    samples.points.resize(static_cast<Eigen::Index>(pixels.size()), 3);
    for (size_t k = 0; k < pixels.size(); ++k) {
        const cv::Point& px = pixels[k];
        const auto i = static_cast<Eigen::Index>(k);
        const cv::Vec3f& p = point_map.ptr<cv::Vec3f>(px.y)[px.x];
        samples.points.row(i) << p[0], p[1], p[2];
        const float* f = feature_map.ptr<float>(px.y) + static_cast<size_t>(px.x) * channels;
        for (int c = 0; c < channels; ++c) {
            samples.values(i, c) = f[c];
        }
    }
    return samples;
}

PointMatrix valid_point_rows(const PointMatrix& points) {
    std::vector<Eigen::Index> keep;
    keep.reserve(static_cast<size_t>(points.rows()));
    for (Eigen::Index i = 0; i < points.rows(); ++i) {
        if (!points.row(i).array().isNaN().any()) {
            keep.push_back(i);
        }
    }
    PointMatrix valid(static_cast<Eigen::Index>(keep.size()), 3);
    for (size_t k = 0; k < keep.size(); ++k) {
        valid.row(static_cast<Eigen::Index>(k)) = points.row(keep[k]);
    }
    return valid;
}

} // namespace voxpose::geometry
