#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace common {

    // Emitted once by the frame producer when it terminates
    struct GrabRecord {
        double fps = 0.0;               // frames_produced / elapsed_time
        double elapsed_time = 0.0;      // seconds
        double max_stable_fps = 0.0;    // min over iterations of floor(1 / interval)
        uint64_t frames_produced = 0;
        std::vector<double> timestamps; // wall-clock capture time, one per frame
    };

    // Emitted once by every frame sink when it terminates
    struct SaveRecord {
        uint32_t worker_id = 0;
        double fps = 0.0;               // frames_persisted / elapsed_time
        double elapsed_time = 0.0;
        uint64_t frames_persisted = 0;
        std::optional<std::string> error; // set when the sink stopped on a failure
    };

    using TelemetryRecord = std::variant<GrabRecord, SaveRecord>;

    // Screen pipeline telemetry after join. Absent records stay std::nullopt.
    struct ScreenTelemetry {
        std::optional<GrabRecord> grab;
        std::vector<std::optional<SaveRecord>> saves; // indexed by worker_id

        size_t expected_records() const { return saves.size() + 1; }

        size_t received_records() const {
            size_t n = grab ? 1 : 0;
            for (const auto& s : saves) {
                if (s) ++n;
            }
            return n;
        }

        bool complete() const { return received_records() == expected_records(); }

        uint64_t frames_persisted() const {
            uint64_t total = 0;
            for (const auto& s : saves) {
                if (s) total += s->frames_persisted;
            }
            return total;
        }
    };

} // namespace common
