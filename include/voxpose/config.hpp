#ifndef VOXPOSE_CONFIG_HPP
#define VOXPOSE_CONFIG_HPP

#include "voxpose/average_distance.hpp"
#include "voxpose/pose_loss.hpp"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <set>
#include <string>

namespace voxpose::config {

struct Config {
    int voxel_dim = 32;
    std::string loss = "add/add_s";
    double loss_weight = 0.5;  // weight of ADD in "add+add_s"
    metrics::DistanceNorm loss_norm = metrics::DistanceNorm::L2;
    std::uint64_t seed = 0;
    std::set<int> symmetric_class_ids = {1, 13, 16, 19, 20, 21};
    int cad_points = 1000;
    std::map<int, std::string> cad_models;

    metrics::LossMode loss_mode() const { return metrics::parse_loss_mode(loss, loss_weight); }
    metrics::SymmetryTable symmetry_table() const { return metrics::SymmetryTable(symmetric_class_ids); }
};

// Relative CAD model paths are resolved against base_dir.
Config parse_config(const nlohmann::json& json, const std::string& base_dir = "");

Config load_config(const std::string& config_file);

} // namespace voxpose::config

#endif // VOXPOSE_CONFIG_HPP
