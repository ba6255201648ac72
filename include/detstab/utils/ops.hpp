// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 detstab contributors

#pragma once

#include <detstab/detection.hpp>
#include <Eigen/Dense>
#include <vector>

namespace detstab::utils {

/**
 * Convert (xc, yc, w, h) to (x1, y1, x2, y2)
 */
inline Eigen::Vector4f xywh2xyxy(const Eigen::Vector4f& xywh) {
    float xc = xywh(0), yc = xywh(1), w = xywh(2), h = xywh(3);
    float x1 = xc - w * 0.5f;
    float y1 = yc - h * 0.5f;
    float x2 = xc + w * 0.5f;
    float y2 = yc + h * 0.5f;
    return Eigen::Vector4f(x1, y1, x2, y2);
}

/**
 * Convert (x1, y1, x2, y2) to (xc, yc, w, h)
 */
inline Eigen::Vector4f xyxy2xywh(const Eigen::Vector4f& xyxy) {
    float x1 = xyxy(0), y1 = xyxy(1), x2 = xyxy(2), y2 = xyxy(3);
    float w = x2 - x1;
    float h = y2 - y1;
    return Eigen::Vector4f(x1 + w * 0.5f, y1 + h * 0.5f, w, h);
}

inline Eigen::Vector4f to_xyxy(const BoundingBox& box) {
    return xywh2xyxy(Eigen::Vector4f(box.x, box.y, box.width, box.height));
}

inline BoundingBox from_xyxy(const Eigen::Vector4f& xyxy) {
    Eigen::Vector4f xywh = xyxy2xywh(xyxy);
    return BoundingBox{xywh(0), xywh(1), xywh(2), xywh(3)};
}

/**
 * Stack boxes into an (N, 4) corner matrix for batch IoU
 */
inline Eigen::MatrixXf boxes_to_xyxy(const std::vector<BoundingBox>& boxes) {
    Eigen::MatrixXf out(static_cast<Eigen::Index>(boxes.size()), 4);
    for (size_t i = 0; i < boxes.size(); ++i) {
        out.row(static_cast<Eigen::Index>(i)) = to_xyxy(boxes[i]).transpose();
    }
    return out;
}

} // namespace detstab::utils
