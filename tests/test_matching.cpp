// SPDX-License-Identifier: AGPL-3.0
// Copyright (c) 2026 detstab contributors

#include <gtest/gtest.h>
#include <detstab/matching/matcher.hpp>
#include <detstab/utils/iou.hpp>

namespace detstab::matching::test {

namespace {

Detection det(const std::string& cls, float conf, float x, float y = 0.5f,
              float w = 0.2f, float h = 0.2f) {
    return Detection(cls, conf, BoundingBox{x, y, w, h});
}

} // namespace

class MatchingTest : public ::testing::Test {
protected:
    TrackRegistry registry_;
    IoUMatcher matcher_{0.3f};
};

TEST_F(MatchingTest, EmptyRegistryLeavesEveryDetectionNew) {
    Detections dets = {det("person", 0.9f, 0.3f), det("person", 0.8f, 0.7f)};

    Assignment result = matcher_.match(dets, registry_);

    ASSERT_EQ(result.track_for_detection.size(), 2u);
    EXPECT_FALSE(result.track_for_detection[0].has_value());
    EXPECT_FALSE(result.track_for_detection[1].has_value());
    EXPECT_TRUE(result.unmatched_tracks.empty());
}

TEST_F(MatchingTest, NoDetectionsLeavesEveryTrackUnmatched) {
    TrackId a = registry_.create(det("person", 0.9f, 0.3f)).id();
    TrackId b = registry_.create(det("car", 0.9f, 0.7f)).id();

    Assignment result = matcher_.match({}, registry_);

    EXPECT_TRUE(result.track_for_detection.empty());
    EXPECT_EQ(result.unmatched_tracks, (std::vector<TrackId>{a, b}));
}

TEST_F(MatchingTest, MatchesByMaximumIoU) {
    TrackId left = registry_.create(det("person", 0.9f, 0.30f)).id();
    TrackId right = registry_.create(det("person", 0.9f, 0.70f)).id();

    Detections dets = {det("person", 0.8f, 0.71f), det("person", 0.7f, 0.29f)};
    Assignment result = matcher_.match(dets, registry_);

    EXPECT_EQ(result.track_for_detection[0], right);
    EXPECT_EQ(result.track_for_detection[1], left);
    EXPECT_TRUE(result.unmatched_tracks.empty());
}

TEST_F(MatchingTest, HigherConfidenceDetectionChoosesFirst) {
    TrackId only = registry_.create(det("person", 0.9f, 0.40f)).id();

    // The low-confidence detection overlaps perfectly, but the
    // high-confidence one is visited first and still clears the threshold
    Detections dets = {det("person", 0.6f, 0.40f), det("person", 0.9f, 0.44f)};
    Assignment result = matcher_.match(dets, registry_);

    EXPECT_FALSE(result.track_for_detection[0].has_value());
    EXPECT_EQ(result.track_for_detection[1], only);
}

TEST_F(MatchingTest, EqualIoUGoesToEarliestTrack) {
    TrackId first = registry_.create(det("person", 0.9f, 0.5f)).id();
    TrackId second = registry_.create(det("person", 0.9f, 0.5f)).id();

    Assignment result = matcher_.match({det("person", 0.8f, 0.5f)}, registry_);

    EXPECT_EQ(result.track_for_detection[0], first);
    EXPECT_EQ(result.unmatched_tracks, (std::vector<TrackId>{second}));
}

TEST_F(MatchingTest, ThresholdIsStrict) {
    Detection track_det = det("person", 0.9f, 0.50f);
    Detection probe = det("person", 0.9f, 0.60f);
    registry_.create(track_det);

    const float overlap = utils::iou(probe.box, track_det.box);
    ASSERT_GT(overlap, 0.0f);

    IoUMatcher at_threshold(overlap);
    EXPECT_FALSE(at_threshold.match({probe}, registry_).track_for_detection[0].has_value());

    IoUMatcher below_threshold(overlap - 1e-3f);
    EXPECT_TRUE(below_threshold.match({probe}, registry_).track_for_detection[0].has_value());
}

TEST_F(MatchingTest, NeverMatchesAcrossClasses) {
    TrackId car = registry_.create(det("car", 0.9f, 0.5f)).id();

    Assignment result = matcher_.match({det("person", 0.9f, 0.5f)}, registry_);

    EXPECT_FALSE(result.track_for_detection[0].has_value());
    EXPECT_EQ(result.unmatched_tracks, (std::vector<TrackId>{car}));
}

TEST_F(MatchingTest, EachTrackAssignedAtMostOnce) {
    TrackId only = registry_.create(det("person", 0.9f, 0.5f)).id();

    Detections dets = {det("person", 0.9f, 0.5f), det("person", 0.8f, 0.5f)};
    Assignment result = matcher_.match(dets, registry_);

    EXPECT_EQ(result.track_for_detection[0], only);
    EXPECT_FALSE(result.track_for_detection[1].has_value());
}

TEST_F(MatchingTest, DistantDetectionStaysNew) {
    registry_.create(det("person", 0.9f, 0.2f));

    Assignment result = matcher_.match({det("person", 0.9f, 0.8f)}, registry_);

    EXPECT_FALSE(result.track_for_detection[0].has_value());
    EXPECT_EQ(result.unmatched_tracks.size(), 1u);
}

TEST_F(MatchingTest, ClassOnlyIgnoresPosition) {
    TrackId first = registry_.create(det("person", 0.9f, 0.2f)).id();
    registry_.create(det("person", 0.9f, 0.8f));

    ClassOnlyMatcher matcher;
    Assignment result = matcher.match({det("person", 0.9f, 0.8f)}, registry_);

    EXPECT_EQ(result.track_for_detection[0], first);
}

TEST_F(MatchingTest, ClassOnlyStillRespectsClass) {
    registry_.create(det("car", 0.9f, 0.5f));

    ClassOnlyMatcher matcher;
    Assignment result = matcher.match({det("person", 0.9f, 0.5f)}, registry_);

    EXPECT_FALSE(result.track_for_detection[0].has_value());
}

TEST_F(MatchingTest, FactoryFollowsConfig) {
    StabilizationConfig config;
    config.iou_threshold = 0.4f;
    auto iou = create_matcher(config);
    EXPECT_EQ(iou->name(), "IoUMatcher");
    EXPECT_FLOAT_EQ(dynamic_cast<IoUMatcher&>(*iou).threshold(), 0.4f);

    config.matching = MatchingStrategy::ClassOnly;
    EXPECT_EQ(create_matcher(config)->name(), "ClassOnlyMatcher");
}

} // namespace detstab::matching::test
