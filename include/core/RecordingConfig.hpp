#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include "common/FrameTypes.hpp"
#include "common/Result.hpp"
#include "core/HotkeyStopRecorder.hpp"
#include "core/ScreenRecorder.hpp"

namespace core {

    // Every knob of a recording session, with the command-line defaults
    struct RecordingConfig {
        // Upper bound for start_delay_s and timeout_s (about three years), so
        // that deadlines on steady_clock stay representable
        static constexpr double kMaxDurationSeconds = 1e8;

        // Recorders
        bool record_screen = true;
        bool record_keyboard = true;
        bool record_mouse = true;
        bool record_gamepad = true;

        // Output
        std::string output_root = "./screenshots/";
        bool print_results = true;
        bool verbose = false;

        // Screen pipeline
        uint32_t workers = 2;
        double target_fps = 10.0;
        common::ImageFormat image_format = common::ImageFormat::Png;
        int png_compression = 9;
        int jpeg_quality = 90;
        uint64_t max_frames = 200000;
        size_t queue_size = 100;

        // Stop conditions
        std::string hotkey = "<ctrl>+<shift>+<delete>";
        double start_delay_s = 2.0;
        double timeout_s = 150000.0;

        // Bounded waits
        std::chrono::milliseconds sink_idle_timeout{60000};
        std::chrono::milliseconds telemetry_timeout{60000};
        std::chrono::milliseconds listener_join_timeout{10000};

        // ConfigError naming the first offending field
        common::EmptyResult validate() const;

        common::Result<HotkeySpec> parse_hotkey() const { return HotkeySpec::parse(hotkey); }

        ScreenRecorderSettings screen_settings() const;

        std::chrono::milliseconds start_delay() const;
        std::chrono::milliseconds timeout() const;
    };

    // "png", "jpg" / "jpeg" (case-insensitive)
    common::Result<common::ImageFormat> parse_image_format(const std::string& name);

} // namespace core
