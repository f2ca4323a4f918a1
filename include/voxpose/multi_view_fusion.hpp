#ifndef VOXPOSE_MULTI_VIEW_FUSION_HPP
#define VOXPOSE_MULTI_VIEW_FUSION_HPP

#include "voxpose/dense_grid.hpp"
#include "voxpose/types.hpp"
#include "voxpose/voxelization.hpp"

#include <opencv2/core.hpp>
#include <cstdint>
#include <optional>
#include <random>
#include <vector>

namespace voxpose::fusion {

// Auxiliary views are only fused in training mode: reprojecting them needs
// ground-truth poses, which inference does not have.
class FusionMode {
public:
    static FusionMode inference() { return FusionMode(false, 0); }
    static FusionMode training(std::uint64_t seed) { return FusionMode(true, seed); }

    bool is_training() const { return training_; }
    std::uint64_t seed() const { return seed_; }

private:
    FusionMode(bool training, std::uint64_t seed) : training_(training), seed_(seed) {}

    bool training_;
    std::uint64_t seed_;
};

// One object instance as seen from one view.
struct ViewObservation {
    int class_id = -1;
    cv::Mat feature_map;             // H x W, CV_32FC(C)
    cv::Mat point_map;               // H x W, CV_32FC3 world coordinates, NaN where unmeasured
    voxel::VoxelGridSpec grid;
    std::optional<Pose> pose_true;   // cad -> world, needed in training mode
};

struct FusedVolume {
    FeatureGrid grid;
    OccupancyMask occupancy;
    std::vector<size_t> auxiliary_views;  // views merged into this volume
};

class MultiViewFuser {
public:
    explicit MultiViewFuser(const FusionMode& mode);

    // Volume of views[index], merged in training mode with a random subset of
    // the other views of the same class.
    FusedVolume fuse(const std::vector<ViewObservation>& views, size_t index);

    std::vector<FusedVolume> fuse_batch(const std::vector<ViewObservation>& views);

    const FusionMode& mode() const { return mode_; }

private:
    // Uniform count in [0, candidates], then that many distinct candidates.
    std::vector<size_t> sample_auxiliary_views(const std::vector<size_t>& candidates);

    FusionMode mode_;
    std::mt19937_64 rng_;
};

// Views that observe the same object as views[index], excluding itself.
std::vector<size_t> auxiliary_candidates(const std::vector<ViewObservation>& views, size_t index);

} // namespace voxpose::fusion

#endif // VOXPOSE_MULTI_VIEW_FUSION_HPP
