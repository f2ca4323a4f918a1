#include "voxpose/cad_model_repository.hpp"
#include "voxpose/config.hpp"
#include "voxpose/pose_loss.hpp"
#include "voxpose/voxel_mapping.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <vector>

namespace {

Eigen::Vector4f read_quaternion(const nlohmann::json& json) {
    const auto q = json.get<std::vector<float>>();
    if (q.size() != 4) {
        throw std::runtime_error("Quaternion must have 4 components (w, x, y, z)");
    }
    return Eigen::Vector4f(q[0], q[1], q[2], q[3]);
}

Eigen::Vector3f read_translation(const nlohmann::json& json) {
    const auto t = json.get<std::vector<float>>();
    if (t.size() != 3) {
        throw std::runtime_error("Translation must have 3 components");
    }
    return Eigen::Vector3f(t[0], t[1], t[2]);
}

// [{"class_id": 1, "quaternion_true": [...], "translation_true": [...],
//   "quaternion_pred": [...], "translation_pred": [...]}, ...]
std::vector<voxpose::metrics::PosePair> read_poses(const std::string& poses_file) {
    std::ifstream file(poses_file);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open poses file: " + poses_file);
    }
    nlohmann::json json;
    file >> json;

    std::vector<voxpose::metrics::PosePair> pairs;
    for (const auto& entry : json) {
        voxpose::metrics::PosePair pair;
        pair.class_id = entry.at("class_id").get<int>();
        pair.pose_true.quaternion = read_quaternion(entry.at("quaternion_true"));
        pair.pose_true.translation = read_translation(entry.at("translation_true"));
        pair.pose_pred.quaternion = read_quaternion(entry.at("quaternion_pred"));
        pair.pose_pred.translation = read_translation(entry.at("translation_pred"));
        // unnormalised network output is accepted, degenerate quaternions throw when scored
        pairs.push_back(pair);
    }
    return pairs;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: voxpose_eval <config.json> <poses.json>" << std::endl;
        return 1;
    }

    try {
        const auto config = voxpose::config::load_config(argv[1]);
        auto models = std::make_shared<voxpose::cad::CadModelRepository>(config.cad_models, config.cad_points);
        for (const auto& [class_id, path] : config.cad_models) {
            const auto pitch = voxpose::voxel::pitch_from_bbox_diagonal(
                static_cast<float>(models->bbox_diagonal(class_id)), config.voxel_dim);
            std::cout << "[voxpose_eval] class " << class_id << " voxel pitch " << pitch << std::endl;
        }
        const voxpose::metrics::PoseLoss loss(config.loss_mode(), models, config.symmetry_table(), config.loss_norm);

        const auto pairs = read_poses(argv[2]);
        std::cout << "[voxpose_eval] Evaluating " << pairs.size() << " instances with loss "
                  << voxpose::metrics::loss_mode_name(loss.mode()) << std::endl;

        const auto evaluation = loss.evaluate(pairs, false);
        std::cout << std::fixed << std::setprecision(6);
        for (size_t i = 0; i < evaluation.instances.size(); ++i) {
            const auto& m = evaluation.instances[i];
            std::cout << "  [" << i << "] class " << m.class_id << "  add " << m.add << "  add_s " << m.add_s
                      << "  reported (" << (m.symmetric ? "add_s" : "add") << ") " << m.reported() << "\n";
        }
        for (const auto& [key, value] : evaluation.summary) {
            std::cout << "  " << key << ": " << value << "\n";
        }
        std::cout << "  loss: " << loss.loss(pairs) << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[voxpose_eval] Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
