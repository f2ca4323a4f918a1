#include "voxpose/pose_estimator.hpp"
#include "voxpose/centroid.hpp"
#include "voxpose/pose.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace voxpose {

namespace {

// Views with class id -1 carry no object instance.
std::vector<fusion::ViewObservation> labelled_views(const std::vector<fusion::ViewObservation>& views) {
    std::vector<fusion::ViewObservation> kept;
    for (const auto& view : views) {
        if (view.class_id != -1) {
            kept.push_back(view);
        }
    }
    return kept;
}

} // anonymous namespace

PoseEstimator::PoseEstimator(std::shared_ptr<PoseRegressor> regressor, std::shared_ptr<const metrics::PoseLoss> loss)
    : regressor_(std::move(regressor)), loss_(std::move(loss)) {
    if (!regressor_ || !loss_) {
        throw std::invalid_argument("PoseEstimator requires a regressor and a loss");
    }
}

std::vector<Pose> PoseEstimator::predict(const std::vector<fusion::ViewObservation>& views,
                                         const fusion::FusionMode& mode) {
    fusion::MultiViewFuser fuser(mode);
    std::vector<Pose> poses;
    poses.reserve(views.size());
    for (size_t i = 0; i < views.size(); ++i) {
        const int class_id = views[i].class_id;
        if (class_id < 1 || class_id > regressor_->num_foreground_classes()) {
            throw std::out_of_range("Class id " + std::to_string(class_id) + " outside the regressor's " +
                                    std::to_string(regressor_->num_foreground_classes()) + " foreground classes");
        }
        const fusion::FusedVolume volume = fuser.fuse(views, i);
        const Eigen::Vector3f centroid = voxel::occupancy_centroid(volume.occupancy, views[i].grid);
        const RegressorOutput output = regressor_->regress(volume.grid, volume.occupancy);
        poses.push_back(decode_pose(output, class_id, centroid, views[i].grid.pitch));
    }
    return poses;
}

std::vector<metrics::PosePair> PoseEstimator::pose_pairs(const std::vector<fusion::ViewObservation>& views,
                                                         const std::vector<Pose>& predictions) const {
    std::vector<metrics::PosePair> pairs;
    pairs.reserve(views.size());
    for (size_t i = 0; i < views.size(); ++i) {
        if (!views[i].pose_true) {
            throw std::invalid_argument("View " + std::to_string(i) + " has no ground-truth pose to score against");
        }
        pairs.push_back({views[i].class_id, *views[i].pose_true, predictions[i]});
    }
    return pairs;
}

StepResult PoseEstimator::step(const std::vector<fusion::ViewObservation>& views, std::uint64_t seed) {
    const std::vector<fusion::ViewObservation> kept = labelled_views(views);

    StepResult result;
    if (kept.empty()) {
        return result;
    }

    const std::vector<Pose> predictions = predict(kept, fusion::FusionMode::training(seed));
    const std::vector<metrics::PosePair> pairs = pose_pairs(kept, predictions);
    result.evaluation = loss_->evaluate(pairs, true);
    result.loss = loss_->loss(pairs);
    return result;
}

metrics::Evaluation PoseEstimator::validate(const std::vector<fusion::ViewObservation>& views) {
    const std::vector<fusion::ViewObservation> kept = labelled_views(views);
    if (kept.empty()) {
        return metrics::Evaluation();
    }
    const std::vector<Pose> predictions = predict(kept, fusion::FusionMode::inference());
    return loss_->evaluate(pose_pairs(kept, predictions), false);
}

} // namespace voxpose
