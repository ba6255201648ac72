// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 detstab contributors

#include <detstab/utils/plot.hpp>
#include <opencv2/imgproc.hpp>
#include <cmath>
#include <functional>
#include <iomanip>
#include <sstream>

namespace detstab::utils {

cv::Scalar id_to_color(int id, float saturation, float value) {
    // Hash-based color generation
    std::hash<int> hasher;
    size_t hash = hasher(id);
    float hue = (hash % 360) / 360.0f;

    // HSV to BGR conversion
    float c = value * saturation;
    float x = c * (1.0f - std::abs(std::fmod(hue * 6.0f, 2.0f) - 1.0f));
    float m = value - c;

    float r, g, b;
    if (hue < 1.0f/6.0f) {
        r = c; g = x; b = 0;
    } else if (hue < 2.0f/6.0f) {
        r = x; g = c; b = 0;
    } else if (hue < 3.0f/6.0f) {
        r = 0; g = c; b = x;
    } else if (hue < 4.0f/6.0f) {
        r = 0; g = x; b = c;
    } else if (hue < 5.0f/6.0f) {
        r = x; g = 0; b = c;
    } else {
        r = c; g = 0; b = x;
    }

    return cv::Scalar((b + m) * 255, (g + m) * 255, (r + m) * 255);
}

cv::Rect2f to_pixel_rect(const BoundingBox& box, const cv::Size& image_size, bool normalized) {
    const float sx = normalized ? static_cast<float>(image_size.width) : 1.0f;
    const float sy = normalized ? static_cast<float>(image_size.height) : 1.0f;

    const float w = box.width * sx;
    const float h = box.height * sy;
    return cv::Rect2f(box.x * sx - w * 0.5f, box.y * sy - h * 0.5f, w, h);
}

cv::Mat plot_detections(const cv::Mat& img, const Detections& detections,
                        bool normalized, int thickness, float fontscale) {
    cv::Mat canvas = img.clone();

    for (const auto& det : detections) {
        const cv::Rect2f rect = to_pixel_rect(det.box, canvas.size(), normalized);

        cv::Scalar color(160, 160, 160);
        std::ostringstream label;
        label << det.class_name;
        if (det.stabilization) {
            color = id_to_color(det.stabilization->track_id);
            label << " #" << det.stabilization->track_id;
        }
        label << " " << std::fixed << std::setprecision(2) << det.confidence;

        cv::rectangle(canvas, cv::Rect(rect), color, thickness);
        cv::putText(canvas, label.str(),
                    cv::Point(static_cast<int>(rect.x), static_cast<int>(rect.y) - 5),
                    cv::FONT_HERSHEY_SIMPLEX, fontscale, color, 1, cv::LINE_AA);
    }

    return canvas;
}

} // namespace detstab::utils
