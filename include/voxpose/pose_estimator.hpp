#ifndef VOXPOSE_POSE_ESTIMATOR_HPP
#define VOXPOSE_POSE_ESTIMATOR_HPP

#include "voxpose/multi_view_fusion.hpp"
#include "voxpose/pose_loss.hpp"
#include "voxpose/pose_regressor.hpp"
#include "voxpose/types.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace voxpose {

struct StepResult {
    double loss = 0.0;
    metrics::Evaluation evaluation;
};

// Per-batch driver: fusion, centroid, regression, decoding and scoring.
class PoseEstimator {
public:
    PoseEstimator(std::shared_ptr<PoseRegressor> regressor, std::shared_ptr<const metrics::PoseLoss> loss);

    // Throws std::out_of_range for a class id outside [1, num_foreground_classes()].
    std::vector<Pose> predict(const std::vector<fusion::ViewObservation>& views, const fusion::FusionMode& mode);

    // Training step. Views with class id -1 are dropped; a batch with nothing
    // left scores 0 with no metrics.
    StepResult step(const std::vector<fusion::ViewObservation>& views, std::uint64_t seed);

    // Inference-mode prediction scored per class, views with class id -1
    // dropped as in step().
    metrics::Evaluation validate(const std::vector<fusion::ViewObservation>& views);

private:
    std::vector<metrics::PosePair> pose_pairs(const std::vector<fusion::ViewObservation>& views,
                                              const std::vector<Pose>& predictions) const;

    std::shared_ptr<PoseRegressor> regressor_;
    std::shared_ptr<const metrics::PoseLoss> loss_;
};

} // namespace voxpose

#endif // VOXPOSE_POSE_ESTIMATOR_HPP
