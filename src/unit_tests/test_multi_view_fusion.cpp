#include "voxpose/multi_view_fusion.hpp"
#include "voxpose/point_map.hpp"
#include "voxpose/transform.hpp"
#include "test_utils.hpp"
#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <cstdint>

using namespace voxpose;
using fusion::FusionMode;
using fusion::MultiViewFuser;
using fusion::ViewObservation;

namespace {

Pose make_pose(float yaw, const Eigen::Vector3f& translation) {
    Pose pose;
    pose.quaternion = Eigen::Vector4f(std::cos(yaw / 2.0f), 0.0f, 0.0f, std::sin(yaw / 2.0f));
    pose.translation = translation;
    return pose;
}

// View of the given canonical points with the object placed at pose.
ViewObservation observe(int class_id,
                        const Pose& pose,
                        const std::vector<Eigen::Vector3f>& canonical_points,
                        const std::vector<float>& features,
                        const voxel::VoxelGridSpec& grid) {
    const Eigen::Matrix4f T = transform::pose_to_transform(pose);
    std::vector<Eigen::Vector3f> world;
    for (const auto& p : canonical_points) {
        world.push_back(T.block<3, 3>(0, 0) * p + T.block<3, 1>(0, 3));
    }
    ViewObservation view = test_utils::make_view(class_id, world, features, grid);
    view.pose_true = pose;
    return view;
}

} // anonymous namespace

class MultiViewFusionTest : public ::testing::Test {
protected:
    void SetUp() override {
        grid_ = test_utils::unit_grid(4);
        pose_primary_ = make_pose(0.0f, Eigen::Vector3f(1.0f, 1.0f, 1.0f));
        pose_aux_ = make_pose(static_cast<float>(M_PI / 2), Eigen::Vector3f(5.0f, -3.0f, 2.0f));
    }

    voxel::VoxelGridSpec grid_;
    Pose pose_primary_;
    Pose pose_aux_;
};

TEST_F(MultiViewFusionTest, NoAuxiliaryViewEqualsPrimaryVoxelization) {
    const std::vector<ViewObservation> views = {
        observe(3, pose_primary_, {{0.5f, 0.5f, 0.5f}, {1.2f, 0.1f, 0.3f}}, {2.0f, 4.0f}, grid_),
    };
    const auto samples = geometry::extract_valid_samples(views[0].feature_map, views[0].point_map);
    const auto expected = voxel::average_voxelization_3d(samples.values, samples.points, grid_, 1, true);

    MultiViewFuser fuser(FusionMode::training(7));
    const auto volume = fuser.fuse(views, 0);
    EXPECT_TRUE(volume.auxiliary_views.empty());
    EXPECT_TRUE(volume.grid == expected.grid);
    EXPECT_TRUE(volume.occupancy == voxel::occupancy_from_counts(*expected.counts));
}

TEST_F(MultiViewFusionTest, InferenceIgnoresOtherViews) {
    const std::vector<ViewObservation> views = {
        observe(3, pose_primary_, {{0.5f, 0.5f, 0.5f}}, {2.0f}, grid_),
        observe(3, pose_aux_, {{1.5f, 0.5f, 0.5f}}, {9.0f}, grid_),
    };
    MultiViewFuser fuser(FusionMode::inference());
    for (int run = 0; run < 10; ++run) {
        const auto volume = fuser.fuse(views, 0);
        EXPECT_TRUE(volume.auxiliary_views.empty());
        EXPECT_EQ(voxel::count_occupied(volume.occupancy), 1u);
    }
}

TEST_F(MultiViewFusionTest, InferenceNeedsNoGroundTruth) {
    std::vector<ViewObservation> views = {
        test_utils::make_view(3, {{0.5f, 0.5f, 0.5f}}, {1.0f}, grid_),
        test_utils::make_view(3, {{1.5f, 0.5f, 0.5f}}, {1.0f}, grid_),
    };
    MultiViewFuser fuser(FusionMode::inference());
    EXPECT_NO_THROW(fuser.fuse_batch(views));
}

TEST_F(MultiViewFusionTest, AuxiliaryViewIsReprojectedIntoPrimaryFrame) {
    // Primary sees canonical point a, the auxiliary view sees canonical point b
    // from a different pose. After fusion both land where the primary pose puts them.
    const std::vector<ViewObservation> views = {
        observe(3, pose_primary_, {{0.5f, 0.5f, 0.5f}}, {2.0f}, grid_),
        observe(3, pose_aux_, {{1.5f, 0.5f, 0.5f}}, {9.0f}, grid_),
    };

    bool saw_fused = false;
    bool saw_unfused = false;
    for (std::uint64_t seed = 0; seed < 32; ++seed) {
        MultiViewFuser fuser(FusionMode::training(seed));
        const auto volume = fuser.fuse(views, 0);
        EXPECT_FLOAT_EQ(volume.grid.at(0, 1, 1, 1), 2.0f);
        if (volume.auxiliary_views.empty()) {
            saw_unfused = true;
            EXPECT_EQ(voxel::count_occupied(volume.occupancy), 1u);
        } else {
            saw_fused = true;
            ASSERT_EQ(volume.auxiliary_views, std::vector<size_t>{1});
            EXPECT_EQ(voxel::count_occupied(volume.occupancy), 2u);
            EXPECT_EQ(volume.occupancy.at(2, 1, 1), 1);
            EXPECT_FLOAT_EQ(volume.grid.at(0, 2, 1, 1), 9.0f);
        }
    }
    EXPECT_TRUE(saw_fused);
    EXPECT_TRUE(saw_unfused);
}

TEST_F(MultiViewFusionTest, OverlappingVoxelsKeepTheMaximum) {
    const std::vector<ViewObservation> views = {
        observe(3, pose_primary_, {{0.5f, 0.5f, 0.5f}, {1.5f, 1.5f, 0.5f}}, {5.0f, 1.0f}, grid_),
        observe(3, pose_aux_, {{0.5f, 0.5f, 0.5f}, {1.5f, 1.5f, 0.5f}}, {3.0f, 4.0f}, grid_),
    };
    for (std::uint64_t seed = 0; seed < 32; ++seed) {
        MultiViewFuser fuser(FusionMode::training(seed));
        const auto volume = fuser.fuse(views, 0);
        if (volume.auxiliary_views.empty()) {
            continue;
        }
        EXPECT_FLOAT_EQ(volume.grid.at(0, 1, 1, 1), 5.0f);
        EXPECT_FLOAT_EQ(volume.grid.at(0, 2, 2, 1), 4.0f);
        EXPECT_EQ(voxel::count_occupied(volume.occupancy), 2u);
        return;
    }
    FAIL() << "no seed fused the auxiliary view";
}

TEST_F(MultiViewFusionTest, OnlySameClassViewsAreCandidates) {
    const std::vector<ViewObservation> views = {
        observe(3, pose_primary_, {{0.5f, 0.5f, 0.5f}}, {1.0f}, grid_),
        observe(4, pose_aux_, {{1.5f, 0.5f, 0.5f}}, {1.0f}, grid_),
        observe(3, pose_aux_, {{1.5f, 0.5f, 0.5f}}, {1.0f}, grid_),
        observe(3, pose_aux_, {{1.5f, 1.5f, 0.5f}}, {1.0f}, grid_),
    };
    EXPECT_EQ(fusion::auxiliary_candidates(views, 0), (std::vector<size_t>{2, 3}));
    EXPECT_TRUE(fusion::auxiliary_candidates(views, 1).empty());

    for (std::uint64_t seed = 0; seed < 16; ++seed) {
        MultiViewFuser fuser(FusionMode::training(seed));
        for (size_t j : fuser.fuse(views, 0).auxiliary_views) {
            EXPECT_NE(j, 0u);
            EXPECT_NE(j, 1u);
        }
    }
}

TEST_F(MultiViewFusionTest, SeededSelectionIsReproducible) {
    std::vector<ViewObservation> views;
    for (int k = 0; k < 6; ++k) {
        views.push_back(observe(3, make_pose(0.3f * k, Eigen::Vector3f(1.0f, 1.0f, 1.0f)),
                                {{0.5f, 0.5f, 0.5f}}, {static_cast<float>(k)}, grid_));
    }

    MultiViewFuser a(FusionMode::training(1234));
    MultiViewFuser b(FusionMode::training(1234));
    const auto volumes_a = a.fuse_batch(views);
    const auto volumes_b = b.fuse_batch(views);
    ASSERT_EQ(volumes_a.size(), views.size());
    for (size_t i = 0; i < views.size(); ++i) {
        EXPECT_EQ(volumes_a[i].auxiliary_views, volumes_b[i].auxiliary_views);
        EXPECT_TRUE(volumes_a[i].grid == volumes_b[i].grid);
        // selections are distinct
        auto sorted = volumes_a[i].auxiliary_views;
        std::sort(sorted.begin(), sorted.end());
        EXPECT_TRUE(std::adjacent_find(sorted.begin(), sorted.end()) == sorted.end());
    }
}

TEST_F(MultiViewFusionTest, TrainingWithoutGroundTruthThrows) {
    const std::vector<ViewObservation> views = {
        test_utils::make_view(3, {{0.5f, 0.5f, 0.5f}}, {1.0f}, grid_),
        test_utils::make_view(3, {{1.5f, 0.5f, 0.5f}}, {1.0f}, grid_),
    };
    MultiViewFuser fuser(FusionMode::training(0));
    EXPECT_THROW(fuser.fuse(views, 0), std::invalid_argument);
}

TEST_F(MultiViewFusionTest, IndexOutOfRangeThrows) {
    MultiViewFuser fuser(FusionMode::inference());
    EXPECT_THROW(fuser.fuse({}, 0), std::out_of_range);
}
