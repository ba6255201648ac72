// SPDX-License-Identifier: AGPL-3.0
// Copyright (c) 2026 detstab contributors

#include <gtest/gtest.h>
#include <detstab/utils/iou.hpp>
#include <detstab/utils/ops.hpp>

namespace detstab::utils::test {

class IoUTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Center-form boxes
        box1_ = BoundingBox{50, 50, 100, 100};     // corners 0..100
        box2_ = BoundingBox{100, 100, 100, 100};   // corners 50..150
        box3_ = BoundingBox{250, 250, 100, 100};   // corners 200..300
    }

    BoundingBox box1_, box2_, box3_;
};

TEST_F(IoUTest, IdenticalBoxesHaveIoUOne) {
    EXPECT_FLOAT_EQ(iou(box1_, box1_), 1.0f);
}

TEST_F(IoUTest, NonOverlappingBoxesHaveIoUZero) {
    EXPECT_FLOAT_EQ(iou(box1_, box3_), 0.0f);
}

TEST_F(IoUTest, OverlappingBoxesHaveCorrectIoU) {
    // Intersection: 50*50 = 2500
    // Union: 100*100 + 100*100 - 2500 = 17500
    EXPECT_NEAR(iou(box1_, box2_), 2500.0f / 17500.0f, 1e-5f);
}

TEST_F(IoUTest, IoUIsSymmetric) {
    EXPECT_FLOAT_EQ(iou(box1_, box2_), iou(box2_, box1_));
}

TEST_F(IoUTest, ZeroSizeBoxesHaveIoUZero) {
    BoundingBox point{0.5f, 0.5f, 0.0f, 0.0f};
    EXPECT_FLOAT_EQ(iou(point, point), 0.0f);
}

TEST_F(IoUTest, NormalizedCoordinates) {
    BoundingBox a{0.5f, 0.5f, 0.2f, 0.3f};
    BoundingBox b{0.52f, 0.51f, 0.21f, 0.29f};
    EXPECT_GT(iou(a, b), 0.7f);
    EXPECT_LE(iou(a, b), 1.0f);
}

TEST_F(IoUTest, BatchIoUComputation) {
    Eigen::MatrixXf boxes_a = boxes_to_xyxy({box1_, box2_});
    Eigen::MatrixXf boxes_b = boxes_to_xyxy({box1_, box3_});

    Eigen::MatrixXf iou_matrix = iou_batch(boxes_a, boxes_b);

    EXPECT_EQ(iou_matrix.rows(), 2);
    EXPECT_EQ(iou_matrix.cols(), 2);
    EXPECT_FLOAT_EQ(iou_matrix(0, 0), 1.0f);
    EXPECT_FLOAT_EQ(iou_matrix(0, 1), 0.0f);
    EXPECT_NEAR(iou_matrix(1, 0), 2500.0f / 17500.0f, 1e-5f);
}

TEST_F(IoUTest, EmptyBatchReturnsEmptyMatrix) {
    Eigen::MatrixXf empty(0, 4);
    Eigen::MatrixXf result = iou_batch(empty, boxes_to_xyxy({box1_}));

    EXPECT_EQ(result.rows(), 0);
    EXPECT_EQ(result.cols(), 1);
}

TEST_F(IoUTest, CenterCornerConversion) {
    Eigen::Vector4f xyxy = to_xyxy(box2_);
    EXPECT_FLOAT_EQ(xyxy(0), 50.0f);
    EXPECT_FLOAT_EQ(xyxy(1), 50.0f);
    EXPECT_FLOAT_EQ(xyxy(2), 150.0f);
    EXPECT_FLOAT_EQ(xyxy(3), 150.0f);

    EXPECT_EQ(from_xyxy(xyxy), box2_);
}

} // namespace detstab::utils::test
