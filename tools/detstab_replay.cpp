// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 detstab contributors

#include <detstab/detstab.hpp>
#include <detstab/utils/plot.hpp>
#include <opencv2/imgcodecs.hpp>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <iostream>
#include <set>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <config.yaml> <frames.yaml> [output_dir]\n";
        std::cerr << "Example: " << argv[0] << " configs/stabilization.yaml ../assets/person_flicker.yaml ./render\n";
        std::cerr << "frames.yaml: frames: [{source_id: 0, detections: [{class: person, confidence: 0.6,"
                  << " x: 0.5, y: 0.5, width: 0.2, height: 0.4}]}]\n";
        return 1;
    }

    std::string config_path = argv[1];
    std::string frames_path = argv[2];
    std::string output_dir = (argc > 3) ? argv[3] : "";

    std::cout << "detstab - Detection Replay Tool v" << detstab::version() << "\n";
    std::cout << "==========================\n\n";
    std::cout << "Config: " << config_path << "\n";
    std::cout << "Frames: " << frames_path << "\n";
    if (!output_dir.empty()) {
        std::cout << "Render Dir: " << output_dir << "\n";
    }
    std::cout << "\n";

    std::unique_ptr<detstab::BaseStabilizer> stabilizer;
    YAML::Node frames;
    try {
        stabilizer = detstab::create_stabilizer(detstab::load_stabilization_config(config_path));
        frames = YAML::LoadFile(frames_path)["frames"];
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (!frames || !frames.IsSequence()) {
        std::cerr << "Error: " << frames_path << " has no 'frames' sequence\n";
        return 1;
    }

    if (!output_dir.empty()) {
        std::filesystem::create_directories(output_dir);
    }

    std::cout << "Stabilizer: " << stabilizer->name() << "\n";
    std::cout << "Processing " << frames.size() << " frames...\n\n";

    std::set<detstab::SourceId> sources;
    int frame_idx = 0;

    for (const auto& frame : frames) {
        detstab::SourceId source_id = 0;
        try {
            source_id = frame["source_id"] ? frame["source_id"].as<int>() : 0;
        } catch (const YAML::Exception& e) {
            std::cerr << "Error: frame " << frame_idx << " has a malformed source_id: " << e.what() << "\n";
            return 1;
        }
        sources.insert(source_id);

        detstab::Detections raw;
        if (const YAML::Node dets = frame["detections"]) {
            for (const auto& entry : dets) {
                try {
                    raw.push_back(detstab::detection_from_yaml(entry));
                } catch (const detstab::InvalidDetectionError& e) {
                    std::cerr << "  Frame " << frame_idx << ": skipping detection: " << e.what() << "\n";
                }
            }
        }

        detstab::Detections stable = stabilizer->process(raw, source_id);

        std::cout << "Frame " << frame_idx << " (source " << source_id << "): "
                  << raw.size() << " raw -> " << stable.size() << " stable\n";
        for (const auto& det : stable) {
            std::cout << "  " << det.class_name;
            if (det.stabilization) {
                std::cout << " #" << det.stabilization->track_id
                          << " frames=" << det.stabilization->frames_tracked;
            }
            std::cout << " conf=" << det.confidence << "\n";
        }

        if (!output_dir.empty()) {
            cv::Mat canvas(480, 640, CV_8UC3, cv::Scalar(40, 40, 40));
            canvas = detstab::utils::plot_detections(canvas, stable);
            std::filesystem::path out = std::filesystem::path(output_dir) /
                ("frame_" + std::to_string(frame_idx) + ".png");
            if (!cv::imwrite(out.string(), canvas)) {
                std::cerr << "  Error writing " << out << "\n";
            }
        }

        ++frame_idx;
    }

    std::cout << "\nStats:\n";
    for (detstab::SourceId source_id : sources) {
        std::cout << "  " << detstab::stats_to_json(stabilizer->get_stats(source_id), source_id).dump() << "\n";
    }

    return 0;
}
