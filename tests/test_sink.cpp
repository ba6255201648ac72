// SPDX-License-Identifier: AGPL-3.0
// Copyright (c) 2026 detstab contributors

#include <gtest/gtest.h>
#include <detstab/sink.hpp>
#include <detstab/stabilizers/temporal_hysteresis.hpp>
#include <vector>

namespace detstab::test {

class StabilizationSinkTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.min_frames = 2;
        stabilizer_ = std::make_unique<stabilizers::TemporalHysteresisStabilizer>(config_);
    }

    FramePredictions frame(int64_t frame_id, SourceId source_id = 0) const {
        FramePredictions f;
        f.source_id = source_id;
        f.frame_id = frame_id;
        f.detections = {Detection("person", 0.8f, BoundingBox{0.5f, 0.5f, 0.2f, 0.4f})};
        return f;
    }

    StabilizationConfig config_;
    std::unique_ptr<stabilizers::TemporalHysteresisStabilizer> stabilizer_;
    std::vector<FramePredictions> received_;
};

TEST_F(StabilizationSinkTest, ForwardsStabilizedFrames) {
    StabilizationSink sink(*stabilizer_, [this](const FramePredictions& f) { received_.push_back(f); });

    sink(frame(10));
    sink(frame(11));

    ASSERT_EQ(received_.size(), 2u);
    EXPECT_EQ(received_[0].frame_id, 10);
    EXPECT_TRUE(received_[0].detections.empty());
    ASSERT_EQ(received_[1].detections.size(), 1u);
    EXPECT_TRUE(received_[1].detections[0].stabilization.has_value());
}

TEST_F(StabilizationSinkTest, AttachesStatsOfTheFrameSource) {
    StabilizationSink sink(*stabilizer_, [this](const FramePredictions& f) { received_.push_back(f); });

    sink(frame(1, 4));

    ASSERT_EQ(received_.size(), 1u);
    EXPECT_EQ(received_[0].source_id, 4);
    ASSERT_TRUE(received_[0].stats.has_value());
    EXPECT_EQ(received_[0].stats->total_detected, 1u);
    EXPECT_EQ(received_[0].stats->active_tracks, 1);
    EXPECT_EQ(stabilizer_->get_stats(0).total_detected, 0u);
}

TEST_F(StabilizationSinkTest, DisabledStabilizerForwardsRawFrames) {
    StabilizationSink sink(*stabilizer_, [this](const FramePredictions& f) { received_.push_back(f); });
    stabilizer_->disable();

    const FramePredictions raw = frame(1);
    sink(raw);

    ASSERT_EQ(received_.size(), 1u);
    EXPECT_EQ(received_[0].detections, raw.detections);
    EXPECT_FALSE(received_[0].stats->enabled);
}

TEST_F(StabilizationSinkTest, RequiresDownstream) {
    EXPECT_THROW(StabilizationSink(*stabilizer_, PredictionSink{}), std::invalid_argument);
}

} // namespace detstab::test
