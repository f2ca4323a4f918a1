#include "voxpose/multi_view_fusion.hpp"
#include "voxpose/point_map.hpp"
#include "voxpose/transform.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>

namespace voxpose::fusion {

namespace {

const Pose& require_pose(const ViewObservation& view, size_t index) {
    if (!view.pose_true) {
        throw std::invalid_argument("View " + std::to_string(index) +
                                    " has no ground-truth pose, required for training-mode fusion");
    }
    return *view.pose_true;
}

} // anonymous namespace

std::vector<size_t> auxiliary_candidates(const std::vector<ViewObservation>& views, size_t index) {
    std::vector<size_t> candidates;
    for (size_t j = 0; j < views.size(); ++j) {
        if (j != index && views[j].class_id == views[index].class_id) {
            candidates.push_back(j);
        }
    }
    return candidates;
}

MultiViewFuser::MultiViewFuser(const FusionMode& mode) : mode_(mode), rng_(mode.seed()) {}

std::vector<size_t> MultiViewFuser::sample_auxiliary_views(const std::vector<size_t>& candidates) {
    std::uniform_int_distribution<size_t> n_fuse_dist(0, candidates.size());
    const size_t n_fuse = n_fuse_dist(rng_);

    std::vector<size_t> selected;
    selected.reserve(n_fuse);
    std::sample(candidates.begin(), candidates.end(), std::back_inserter(selected), n_fuse, rng_);
    return selected;
}

FusedVolume MultiViewFuser::fuse(const std::vector<ViewObservation>& views, size_t index) {
    if (index >= views.size()) {
        throw std::out_of_range("View index " + std::to_string(index) + " out of range for " +
                                std::to_string(views.size()) + " views");
    }
    const ViewObservation& primary = views[index];
    const int channels = primary.feature_map.channels();

    const geometry::ViewSamples samples = geometry::extract_valid_samples(primary.feature_map, primary.point_map);
    voxel::AverageVoxelization primary_voxels =
        voxel::average_voxelization_3d(samples.values, samples.points, primary.grid, channels, true);

    FusedVolume volume;
    volume.grid = std::move(primary_voxels.grid);
    volume.occupancy = voxel::occupancy_from_counts(*primary_voxels.counts);

    if (!mode_.is_training()) {
        return volume;
    }

    const std::vector<size_t> candidates = auxiliary_candidates(views, index);
    if (candidates.empty()) {
        return volume;
    }
    const Eigen::Matrix4f T_cad2world_i = transform::pose_to_transform(require_pose(primary, index));

    const std::vector<size_t> selected = sample_auxiliary_views(candidates);
    for (size_t j : selected) {
        const ViewObservation& aux = views[j];
        if (aux.feature_map.channels() != channels) {
            throw std::invalid_argument("View " + std::to_string(j) + " has " +
                                        std::to_string(aux.feature_map.channels()) + " feature channels, expected " +
                                        std::to_string(channels));
        }
        const Eigen::Matrix4f T_cad2world_j = transform::pose_to_transform(require_pose(aux, j));

        const geometry::ViewSamples aux_samples = geometry::extract_valid_samples(aux.feature_map, aux.point_map);
        // view j world -> cad -> view i world
        PointMatrix points = transform::transform_points(aux_samples.points, transform::invert_transform(T_cad2world_j));
        points = transform::transform_points(points, T_cad2world_i);

        const voxel::AverageVoxelization aux_voxels =
            voxel::average_voxelization_3d(aux_samples.values, points, primary.grid, channels, true);

        voxel::merge_maximum(volume.grid, aux_voxels.grid);
        voxel::occupancy_union(volume.occupancy, voxel::occupancy_from_counts(*aux_voxels.counts));
        volume.auxiliary_views.push_back(j);
    }
    return volume;
}

std::vector<FusedVolume> MultiViewFuser::fuse_batch(const std::vector<ViewObservation>& views) {
    std::vector<FusedVolume> volumes;
    volumes.reserve(views.size());
    for (size_t i = 0; i < views.size(); ++i) {
        volumes.push_back(fuse(views, i));
    }
    return volumes;
}

} // namespace voxpose::fusion
