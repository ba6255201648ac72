// SPDX-License-Identifier: AGPL-3.0
// Copyright (c) 2026 detstab contributors

#include <gtest/gtest.h>
#include <detstab/track_registry.hpp>

namespace detstab::test {

class TrackRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        person_ = Detection("person", 0.8f, BoundingBox{0.5f, 0.5f, 0.2f, 0.4f}, 0);
        car_ = Detection("car", 0.7f, BoundingBox{0.2f, 0.7f, 0.3f, 0.2f}, 2);
    }

    TrackRegistry registry_{3};
    Detection person_;
    Detection car_;
};

TEST_F(TrackRegistryTest, CreateAssignsIncreasingIds) {
    TrackId a = registry_.create(person_).id();
    TrackId b = registry_.create(car_).id();
    TrackId c = registry_.create(person_).id();

    EXPECT_EQ(a, 1);
    EXPECT_EQ(b, 2);
    EXPECT_EQ(c, 3);
    EXPECT_EQ(registry_.size(), 3u);
    EXPECT_EQ(registry_.ids(), (std::vector<TrackId>{1, 2, 3}));
}

TEST_F(TrackRegistryTest, NewTrackIsProvisional) {
    const Track& track = registry_.create(person_);

    EXPECT_EQ(track.state(), TrackState::Provisional);
    EXPECT_EQ(track.consecutive_frames(), 1);
    EXPECT_EQ(track.gap_frames(), 0);
    EXPECT_TRUE(track.matched_this_frame());
    EXPECT_EQ(track.class_name(), "person");
    EXPECT_EQ(track.box(), person_.box);
}

TEST_F(TrackRegistryTest, TracksAreBucketedByClass) {
    registry_.create(person_);
    registry_.create(car_);
    registry_.create(person_);

    EXPECT_EQ(registry_.bucket("person").size(), 2u);
    EXPECT_EQ(registry_.bucket("car").size(), 1u);
    EXPECT_TRUE(registry_.bucket("dog").empty());

    auto counts = registry_.counts_by_class();
    EXPECT_EQ(counts["person"], 2);
    EXPECT_EQ(counts["car"], 1);
}

TEST_F(TrackRegistryTest, FindById) {
    TrackId id = registry_.create(car_).id();

    ASSERT_NE(registry_.find(id), nullptr);
    EXPECT_EQ(registry_.find(id)->class_name(), "car");
    EXPECT_EQ(registry_.find(999), nullptr);
}

TEST_F(TrackRegistryTest, RemoveIfDropsTracksAndEmptyBuckets) {
    TrackId person = registry_.create(person_).id();
    registry_.create(car_);

    size_t removed = registry_.remove_if([](const Track& t) { return t.class_name() == "car"; });

    EXPECT_EQ(removed, 1u);
    EXPECT_EQ(registry_.size(), 1u);
    EXPECT_EQ(registry_.buckets().count("car"), 0u);
    EXPECT_NE(registry_.find(person), nullptr);
}

TEST_F(TrackRegistryTest, IdsAreNotReusedAfterClear) {
    registry_.create(person_);
    registry_.create(person_);
    registry_.clear();

    EXPECT_TRUE(registry_.empty());
    EXPECT_EQ(registry_.create(person_).id(), 3);
}

TEST_F(TrackRegistryTest, BeginFrameClearsMatchedFlag) {
    TrackId id = registry_.create(person_).id();
    registry_.begin_frame();

    EXPECT_FALSE(registry_.find(id)->matched_this_frame());
}

TEST_F(TrackRegistryTest, ConfidenceHistoryIsBounded) {
    Track& track = registry_.create(person_);
    for (float conf : {0.6f, 0.7f, 0.9f}) {
        Detection d = person_;
        d.confidence = conf;
        track.update(d);
    }

    ASSERT_EQ(track.confidence_history().size(), 3u);
    EXPECT_FLOAT_EQ(track.confidence_history().front(), 0.6f);
    EXPECT_NEAR(track.avg_confidence(), (0.6f + 0.7f + 0.9f) / 3.0f, 1e-6f);
    EXPECT_EQ(track.consecutive_frames(), 4);
}

TEST_F(TrackRegistryTest, MissKeepsConsecutiveFrames) {
    Track& track = registry_.create(person_);
    track.update(person_);
    track.mark_missed();
    track.mark_missed();

    EXPECT_EQ(track.consecutive_frames(), 2);
    EXPECT_EQ(track.gap_frames(), 2);
    EXPECT_FALSE(track.matched_this_frame());

    track.update(person_);
    EXPECT_EQ(track.consecutive_frames(), 3);
    EXPECT_EQ(track.gap_frames(), 0);
}

TEST_F(TrackRegistryTest, EmittedDetectionCarriesTrackInfo) {
    Track& track = registry_.create(car_);
    Detection out = track.to_detection();

    EXPECT_EQ(out.class_name, "car");
    EXPECT_EQ(out.class_id, 2);
    ASSERT_TRUE(out.stabilization.has_value());
    EXPECT_EQ(out.stabilization->track_id, track.id());
    EXPECT_EQ(out.stabilization->frames_tracked, 1);
    EXPECT_FLOAT_EQ(out.stabilization->avg_confidence, 0.7f);
}

} // namespace detstab::test
