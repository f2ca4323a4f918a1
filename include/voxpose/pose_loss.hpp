#ifndef VOXPOSE_POSE_LOSS_HPP
#define VOXPOSE_POSE_LOSS_HPP

#include "voxpose/average_distance.hpp"
#include "voxpose/cad_model_repository.hpp"
#include "voxpose/types.hpp"

#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace voxpose::metrics {

struct AsymmetricLoss {};     // "add"
struct SymmetricLoss {};      // "add_s"
struct SymmetryTableLoss {};  // "add/add_s": ADD-S for symmetric classes, ADD otherwise
struct WeightedLoss {         // "add+add_s": weight * ADD + (1 - weight) * ADD-S
    double weight = 0.5;
};

using LossMode = std::variant<AsymmetricLoss, SymmetricLoss, SymmetryTableLoss, WeightedLoss>;

// Throws UnsupportedLossModeError for unknown names.
LossMode parse_loss_mode(const std::string& name, double weight = 0.5);

std::string loss_mode_name(const LossMode& mode);

// Classes whose shape is invariant under some rotation, where only ADD-S is
// a fair score.
class SymmetryTable {
public:
    SymmetryTable() = default;
    explicit SymmetryTable(std::set<int> symmetric_class_ids) : symmetric_(std::move(symmetric_class_ids)) {}

    bool is_symmetric(int class_id) const { return symmetric_.count(class_id) > 0; }
    const std::set<int>& class_ids() const { return symmetric_; }

private:
    std::set<int> symmetric_;
};

// Ground truth and prediction for one object instance.
struct PosePair {
    int class_id = 0;
    Pose pose_true;
    Pose pose_pred;
};

struct InstanceMetrics {
    int class_id = 0;
    double add = 0.0;
    double add_s = 0.0;
    bool symmetric = false;

    // ADD-S for symmetric classes, ADD otherwise.
    double reported() const { return symmetric ? add_s : add; }
};

using MetricSummary = std::map<std::string, double>;

struct Evaluation {
    std::vector<InstanceMetrics> instances;
    MetricSummary summary;
};

class PoseLoss {
public:
    PoseLoss(LossMode mode,
             std::shared_ptr<const cad::ModelLookup> models,
             SymmetryTable symmetry,
             DistanceNorm norm = DistanceNorm::L2);

    // Per-instance ADD and ADD-S plus their means. Training summaries use the
    // keys "add" and "add_s"; otherwise keys are per class ("add/0001").
    Evaluation evaluate(const std::vector<PosePair>& batch, bool training) const;

    // Mean of the per-instance loss terms, 0 for an empty batch.
    double loss(const std::vector<PosePair>& batch) const;

    double instance_loss(const PosePair& pair) const;

    const LossMode& mode() const { return mode_; }
    const SymmetryTable& symmetry() const { return symmetry_; }
    DistanceNorm norm() const { return norm_; }

private:
    LossMode mode_;
    std::shared_ptr<const cad::ModelLookup> models_;
    SymmetryTable symmetry_;
    DistanceNorm norm_;
};

} // namespace voxpose::metrics

#endif // VOXPOSE_POSE_LOSS_HPP
