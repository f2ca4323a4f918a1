#ifndef VOXPOSE_CAD_MODEL_REPOSITORY_HPP
#define VOXPOSE_CAD_MODEL_REPOSITORY_HPP

#include <open3d/Open3D.h>
#include <map>
#include <memory>
#include <string>

namespace voxpose::cad {

using CadPointCloud = std::shared_ptr<const open3d::geometry::PointCloud>;

// Read-only class_id -> canonical CAD point cloud lookup.
class ModelLookup {
public:
    virtual ~ModelLookup() = default;

    // Throws std::out_of_range for an unknown class.
    virtual CadPointCloud get_pcd(int class_id) const = 0;

    virtual bool has_model(int class_id) const = 0;
};

// Loads every model once at construction. Meshes are sampled uniformly,
// point cloud files are used as they are.
class CadModelRepository : public ModelLookup {
public:
    CadModelRepository(const std::map<int, std::string>& model_paths, int number_of_points);

    CadPointCloud get_pcd(int class_id) const override;
    bool has_model(int class_id) const override;

    // Length of the model's axis-aligned bounding box diagonal.
    double bbox_diagonal(int class_id) const;

    size_t size() const { return models_.size(); }

private:
    std::map<int, CadPointCloud> models_;
};

// Point cloud of one CAD file.
std::shared_ptr<open3d::geometry::PointCloud> load_cad_pcd(const std::string& file_path, int number_of_points);

} // namespace voxpose::cad

#endif // VOXPOSE_CAD_MODEL_REPOSITORY_HPP
