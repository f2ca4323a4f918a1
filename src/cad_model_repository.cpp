#include "voxpose/cad_model_repository.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>

namespace fs = std::filesystem;

namespace voxpose::cad {

namespace {

bool is_mesh_file(const std::string& file_path) {
    static const std::set<std::string> mesh_extensions = {".obj", ".stl", ".off", ".gltf", ".glb", ".fbx"};
    std::string ext = fs::path(file_path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    return mesh_extensions.count(ext) > 0;
}

} // anonymous namespace

std::shared_ptr<open3d::geometry::PointCloud> load_cad_pcd(const std::string& file_path, int number_of_points) {
    if (!fs::exists(file_path)) {
        throw std::runtime_error("CAD file not found: " + file_path);
    }

    std::shared_ptr<open3d::geometry::PointCloud> pcd;
    if (is_mesh_file(file_path)) {
        if (number_of_points <= 0) {
            throw std::invalid_argument("number_of_points must be positive to sample " + file_path);
        }
        auto mesh = open3d::io::CreateMeshFromFile(file_path);
        if (!mesh || !mesh->HasTriangles()) {
            throw std::runtime_error("Failed to load mesh: " + file_path);
        }
        pcd = mesh->SamplePointsUniformly(static_cast<size_t>(number_of_points));
    } else {
        pcd = open3d::io::CreatePointCloudFromFile(file_path);
    }

    if (!pcd || pcd->points_.empty()) {
        throw std::runtime_error("CAD point cloud is empty: " + file_path);
    }
    return pcd;
}

CadModelRepository::CadModelRepository(const std::map<int, std::string>& model_paths, int number_of_points) {
    for (const auto& [class_id, path] : model_paths) {
        auto pcd = load_cad_pcd(path, number_of_points);
        std::cout << "[CadModelRepository] Loaded class " << class_id << ": " << pcd->points_.size()
                  << " points from " << path << std::endl;
        models_.emplace(class_id, std::move(pcd));
    }
}

CadPointCloud CadModelRepository::get_pcd(int class_id) const {
    auto it = models_.find(class_id);
    if (it == models_.end()) {
        throw std::out_of_range("No CAD model for class " + std::to_string(class_id));
    }
    return it->second;
}

bool CadModelRepository::has_model(int class_id) const {
    return models_.count(class_id) > 0;
}

double CadModelRepository::bbox_diagonal(int class_id) const {
    return get_pcd(class_id)->GetAxisAlignedBoundingBox().GetExtent().norm();
}

} // namespace voxpose::cad
