#include "voxpose/pose_loss.hpp"
#include "voxpose/errors.hpp"
#include "voxpose/transform.hpp"

#include <cstdio>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>

namespace voxpose::metrics {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

Eigen::Matrix4d to_transform(const Pose& pose) {
    return transform::pose_to_transform(pose).cast<double>();
}

std::string class_key(const std::string& metric, int class_id) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%s/%04d", metric.c_str(), class_id);
    return buffer;
}

MetricSummary mean_summary(const std::vector<std::pair<std::string, double>>& entries) {
    std::map<std::string, std::pair<double, size_t>> accum;
    for (const auto& [key, value] : entries) {
        auto& slot = accum[key];
        slot.first += value;
        slot.second += 1;
    }
    MetricSummary summary;
    for (const auto& [key, slot] : accum) {
        summary[key] = slot.first / static_cast<double>(slot.second);
    }
    return summary;
}

} // anonymous namespace

LossMode parse_loss_mode(const std::string& name, double weight) {
    if (name == "add") {
        return AsymmetricLoss{};
    }
    if (name == "add_s") {
        return SymmetricLoss{};
    }
    if (name == "add/add_s") {
        return SymmetryTableLoss{};
    }
    if (name == "add+add_s") {
        if (!(weight >= 0.0 && weight <= 1.0)) {
            throw std::invalid_argument("add+add_s weight must lie in [0, 1], got " + std::to_string(weight));
        }
        return WeightedLoss{weight};
    }
    throw UnsupportedLossModeError("unsupported loss: " + name);
}

std::string loss_mode_name(const LossMode& mode) {
    return std::visit(overloaded{
                          [](const AsymmetricLoss&) -> std::string { return "add"; },
                          [](const SymmetricLoss&) -> std::string { return "add_s"; },
                          [](const SymmetryTableLoss&) -> std::string { return "add/add_s"; },
                          [](const WeightedLoss&) -> std::string { return "add+add_s"; },
                      },
                      mode);
}

PoseLoss::PoseLoss(LossMode mode,
                   std::shared_ptr<const cad::ModelLookup> models,
                   SymmetryTable symmetry,
                   DistanceNorm norm)
    : mode_(std::move(mode)), models_(std::move(models)), symmetry_(std::move(symmetry)), norm_(norm) {
    if (!models_) {
        throw std::invalid_argument("PoseLoss requires a model lookup");
    }
}

Evaluation PoseLoss::evaluate(const std::vector<PosePair>& batch, bool training) const {
    Evaluation evaluation;
    std::vector<std::pair<std::string, double>> entries;
    for (const auto& pair : batch) {
        const auto cad_pcd = models_->get_pcd(pair.class_id);
        const AverageDistance distance =
            average_distance(*cad_pcd, to_transform(pair.pose_true), to_transform(pair.pose_pred));

        InstanceMetrics metrics;
        metrics.class_id = pair.class_id;
        metrics.add = distance.add;
        metrics.add_s = distance.add_s;
        metrics.symmetric = symmetry_.is_symmetric(pair.class_id);
        evaluation.instances.push_back(metrics);

        if (training) {
            entries.emplace_back("add", metrics.add);
            entries.emplace_back("add_s", metrics.add_s);
        } else {
            entries.emplace_back(class_key("add", pair.class_id), metrics.add);
            entries.emplace_back(class_key("add_s", pair.class_id), metrics.add_s);
        }
    }
    evaluation.summary = mean_summary(entries);
    return evaluation;
}

double PoseLoss::instance_loss(const PosePair& pair) const {
    const auto cad_pcd = models_->get_pcd(pair.class_id);
    const Eigen::Matrix4d T_true = to_transform(pair.pose_true);
    const Eigen::Matrix4d T_pred = to_transform(pair.pose_pred);

    return std::visit(overloaded{
                          [&](const AsymmetricLoss&) {
                              return average_distance(*cad_pcd, T_true, T_pred, false, norm_);
                          },
                          [&](const SymmetricLoss&) {
                              return average_distance(*cad_pcd, T_true, T_pred, true, norm_);
                          },
                          [&](const SymmetryTableLoss&) {
                              const bool symmetric = symmetry_.is_symmetric(pair.class_id);
                              return average_distance(*cad_pcd, T_true, T_pred, symmetric, norm_);
                          },
                          [&](const WeightedLoss& weighted) {
                              const double add = average_distance(*cad_pcd, T_true, T_pred, false, norm_);
                              const double add_s = average_distance(*cad_pcd, T_true, T_pred, true, norm_);
                              return weighted.weight * add + (1.0 - weighted.weight) * add_s;
                          },
                      },
                      mode_);
}

double PoseLoss::loss(const std::vector<PosePair>& batch) const {
    if (batch.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (const auto& pair : batch) {
        sum += instance_loss(pair);
    }
    return sum / static_cast<double>(batch.size());
}

} // namespace voxpose::metrics
