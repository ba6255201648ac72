// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 detstab contributors

#pragma once

#include <detstab/detection.hpp>
#include <detstab/utils/ops.hpp>
#include <Eigen/Dense>
#include <algorithm>

namespace detstab::utils {

/**
 * Batch IoU computation for axis-aligned bounding boxes
 * Input: bboxes1 (N, 4), bboxes2 (M, 4) as [x1, y1, x2, y2]
 * Output: (N, M) matrix of IoU values
 */
inline Eigen::MatrixXf iou_batch(const Eigen::MatrixXf& bboxes1, const Eigen::MatrixXf& bboxes2) {
    const Eigen::Index N = bboxes1.rows();
    const Eigen::Index M = bboxes2.rows();

    if (N == 0 || M == 0) {
        return Eigen::MatrixXf::Zero(N, M);
    }

    Eigen::MatrixXf iou_matrix(N, M);

    Eigen::VectorXf area1 = (bboxes1.col(2) - bboxes1.col(0)).cwiseProduct(
                            bboxes1.col(3) - bboxes1.col(1));
    Eigen::VectorXf area2 = (bboxes2.col(2) - bboxes2.col(0)).cwiseProduct(
                            bboxes2.col(3) - bboxes2.col(1));

    for (Eigen::Index i = 0; i < N; ++i) {
        for (Eigen::Index j = 0; j < M; ++j) {
            float xx1 = std::max(bboxes1(i, 0), bboxes2(j, 0));
            float yy1 = std::max(bboxes1(i, 1), bboxes2(j, 1));
            float xx2 = std::min(bboxes1(i, 2), bboxes2(j, 2));
            float yy2 = std::min(bboxes1(i, 3), bboxes2(j, 3));

            float w = std::max(0.0f, xx2 - xx1);
            float h = std::max(0.0f, yy2 - yy1);
            float intersection = w * h;

            // Zero-size boxes give a zero union
            float union_area = area1(i) + area2(j) - intersection;
            iou_matrix(i, j) = (union_area > 0.0f) ? (intersection / union_area) : 0.0f;
        }
    }

    return iou_matrix;
}

/**
 * IoU of a single pair of center-form boxes
 */
inline float iou(const BoundingBox& a, const BoundingBox& b) {
    Eigen::MatrixXf m1(1, 4), m2(1, 4);
    m1.row(0) = to_xyxy(a).transpose();
    m2.row(0) = to_xyxy(b).transpose();
    return iou_batch(m1, m2)(0, 0);
}

} // namespace detstab::utils
