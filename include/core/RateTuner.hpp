#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "common/FrameTypes.hpp"
#include "common/Logger.hpp"
#include "common/Result.hpp"
#include "common/Telemetry.hpp"
#include "interfaces/IFrameEncoder.hpp"
#include "interfaces/IScreenCapture.hpp"

namespace core {

    struct TunerSettings {
        uint32_t max_workers = 4;
        double max_fps = 60.0;
        double min_fps = 10.0;
        uint64_t n_frames = 500;
        std::string output_dir = "./screenshots/temp/";
        common::EncodeParams encode{common::ImageFormat::Png, 6, 90};
        bool print_results = false;
    };

    struct TunerTrial {
        uint32_t workers = 0;
        double target_fps = 0.0;
        double mean_fps = 0.0;
        double max_stable_fps = 0.0;
        bool safe = false;
        std::string reason; // why the trial was unsafe
    };

    struct TuningReport {
        std::vector<TunerTrial> trials;
        std::vector<TunerTrial> safe_configs;   // first safe trial per worker count
        std::optional<TunerTrial> recommendation;
    };

    /**
     * @brief Finds a safe (workers, target fps) pair on this machine.
     *
     * For every worker count, starts at max_fps and records n_frames. A run is
     * unsafe if the achieved rate is below 90% of the target, or if a sink
     * finishes more than one second after the producer. After an unsafe run
     * the target drops to min(round(mean / 10) * 10, target - 10).
     */
    class RateTuner {
    public:
        RateTuner(
            std::shared_ptr<interfaces::IScreenCapture> capture,
            std::shared_ptr<interfaces::IFrameEncoder> encoder,
            TunerSettings settings,
            std::shared_ptr<common::ILogger> logger
        );

        common::Result<TuningReport> run();

        // Verdict on one recording; 'reason' is filled when unsafe
        static bool is_safe(const common::ScreenTelemetry& telemetry, double target_fps, std::string& reason);

        static double next_target(double mean_fps, double target_fps);

        // Highest max_stable_fps, fewer workers on a tie
        static std::optional<TunerTrial> recommend(const std::vector<TunerTrial>& safe_configs);

        static std::string format(const TuningReport& report);

    private:
        common::Result<TunerTrial> run_trial(uint32_t workers, double target_fps);

        std::shared_ptr<interfaces::IScreenCapture> capture_;
        std::shared_ptr<interfaces::IFrameEncoder> encoder_;
        TunerSettings settings_;
        std::shared_ptr<common::ILogger> logger_;
    };

} // namespace core
