// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 detstab contributors

#pragma once

#include <detstab/detection.hpp>
#include <opencv2/core.hpp>

namespace detstab::utils {

/**
 * Stable color for a track ID (BGR)
 */
cv::Scalar id_to_color(int id, float saturation = 0.75f, float value = 0.95f);

/**
 * Convert a center-form box to a pixel rectangle on an image
 * @param normalized Box coordinates are in [0, 1] relative to the image size
 */
cv::Rect2f to_pixel_rect(const BoundingBox& box, const cv::Size& image_size, bool normalized);

/**
 * Draw detections on a copy of img. Stabilized detections are colored by
 * track ID and labelled "class #id conf"; raw ones are drawn in grey.
 */
cv::Mat plot_detections(const cv::Mat& img, const Detections& detections,
                        bool normalized = true, int thickness = 2, float fontscale = 0.5f);

} // namespace detstab::utils
