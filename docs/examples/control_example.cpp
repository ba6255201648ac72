#include <detstab/detstab.hpp>
#include <iostream>

int main() {
    std::cout << "detstab - Stabilization Control Example\n";
    std::cout << "=======================================\n\n";

    detstab::StabilizationConfig config;
    config.min_frames = 3;
    config.max_gap = 2;
    config.appear_confidence = 0.5f;
    config.persist_confidence = 0.3f;

    auto stabilizer = detstab::create_stabilizer(config);

    detstab::control::CommandRegistry commands;
    detstab::control::register_stabilization_commands(commands, *stabilizer);

    // One person flickering around the threshold, one car that stays
    const float person_conf[] = {0.45f, 0.55f, 0.52f, 0.58f, 0.35f, 0.0f, 0.0f, 0.0f, 0.6f, 0.6f};

    std::cout << "Processing 10 frames with synthetic detections...\n\n";

    for (int frame = 0; frame < 10; ++frame) {
        detstab::Detections detections;
        if (person_conf[frame] > 0.0f) {
            detections.emplace_back("person", person_conf[frame],
                                    detstab::BoundingBox{0.3f + frame * 0.005f, 0.5f, 0.1f, 0.3f}, 0);
        }
        detections.emplace_back("car", 0.8f, detstab::BoundingBox{0.7f, 0.6f, 0.2f, 0.15f}, 2);

        // Bypass the filter for two frames, as an operator would
        if (frame == 6 || frame == 7) {
            std::cout << "  toggle -> " << commands.execute(detstab::control::kToggleStabilization).dump() << "\n";
        }

        detstab::Detections stable = stabilizer->process(detections);

        std::cout << "Frame " << frame << ": Detected " << detections.size()
                  << " objects, Emitting " << stable.size() << " objects\n";
        for (const auto& det : stable) {
            std::cout << "  " << det.class_name;
            if (det.stabilization) {
                std::cout << " #" << det.stabilization->track_id
                          << " (avg " << det.stabilization->avg_confidence << ")";
            }
            std::cout << ", Confidence: " << det.confidence << "\n";
        }
    }

    std::cout << "\nStats: "
              << commands.dispatch(R"({"command": "stabilization_stats", "source_id": 0})").dump(2) << "\n";
    return 0;
}
