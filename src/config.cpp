#include "voxpose/config.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace voxpose::config {

namespace {

metrics::DistanceNorm parse_norm(const std::string& name) {
    if (name == "l2") {
        return metrics::DistanceNorm::L2;
    }
    if (name == "l1") {
        return metrics::DistanceNorm::L1;
    }
    throw std::invalid_argument("loss_norm must be \"l1\" or \"l2\", got \"" + name + "\"");
}

} // anonymous namespace

Config parse_config(const nlohmann::json& json, const std::string& base_dir) {
    Config config;
    config.voxel_dim = json.value("voxel_dim", config.voxel_dim);
    config.loss = json.value("loss", config.loss);
    if (json.contains("loss_scale")) {
        config.loss_weight = json["loss_scale"].value("add+add_s", config.loss_weight);
    }
    if (json.contains("loss_norm")) {
        config.loss_norm = parse_norm(json["loss_norm"].get<std::string>());
    }
    config.seed = json.value("seed", config.seed);
    if (json.contains("symmetric_class_ids")) {
        config.symmetric_class_ids = json["symmetric_class_ids"].get<std::set<int>>();
    }
    config.cad_points = json.value("cad_points", config.cad_points);

    if (json.contains("cad_models")) {
        for (const auto& [key, value] : json["cad_models"].items()) {
            fs::path path = value.get<std::string>();
            if (path.is_relative() && !base_dir.empty()) {
                path = fs::path(base_dir) / path;
            }
            config.cad_models[std::stoi(key)] = path.string();
        }
    }

    if (config.voxel_dim <= 0) {
        throw std::invalid_argument("voxel_dim must be positive");
    }
    if (config.cad_points <= 0) {
        throw std::invalid_argument("cad_points must be positive");
    }
    // throws UnsupportedLossModeError
    config.loss_mode();
    return config;
}

Config load_config(const std::string& config_file) {
    std::ifstream file(config_file);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open configuration file: " + config_file);
    }

    nlohmann::json json;
    file >> json;
    return parse_config(json, fs::path(config_file).parent_path().string());
}

} // namespace voxpose::config
