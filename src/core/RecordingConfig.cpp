#include "core/RecordingConfig.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace core {

    namespace {
        common::EmptyResult bad(const std::string& field, const std::string& why) {
            return common::EmptyResult::err(common::ErrorCode::ConfigError, field + ": " + why);
        }

        std::chrono::milliseconds to_ms(double seconds) {
            return std::chrono::milliseconds(static_cast<int64_t>(std::llround(seconds * 1000.0)));
        }
    }

    common::EmptyResult RecordingConfig::validate() const {
        if (!record_screen && !record_keyboard && !record_mouse && !record_gamepad) {
            return bad("recorders", "no recording type enabled, enable at least one");
        }
        if (workers < 1) return bad("workers", "must be 1 or more");
        if (!(target_fps > 0.0) || !std::isfinite(target_fps)) return bad("fps", "must be a positive number");
        if (png_compression < 0 || png_compression > 9) return bad("compression", "must be in [0, 9]");
        if (jpeg_quality < 1 || jpeg_quality > 100) return bad("quality", "must be in [1, 100]");
        if (max_frames < 1) return bad("max-screenshots", "must be 1 or more");
        if (queue_size < 1) return bad("queue-size", "must be 1 or more");
        if (output_root.empty()) return bad("output", "must not be empty");
        if (!(start_delay_s >= 0.0) || !std::isfinite(start_delay_s)) return bad("start-delay", "must be >= 0");
        if (start_delay_s > kMaxDurationSeconds) return bad("start-delay", "must be at most 1e8 seconds");
        if (!(timeout_s > 0.0) || !std::isfinite(timeout_s)) return bad("timeout", "must be positive");
        if (timeout_s > kMaxDurationSeconds) return bad("timeout", "must be at most 1e8 seconds");
        if (sink_idle_timeout.count() <= 0) return bad("sink_idle_timeout", "must be positive");
        if (telemetry_timeout.count() <= 0) return bad("telemetry_timeout", "must be positive");
        if (listener_join_timeout.count() <= 0) return bad("listener_join_timeout", "must be positive");

        auto hk = parse_hotkey();
        if (hk.is_err()) return common::EmptyResult::err(hk.error());
        return common::EmptyResult::success();
    }

    ScreenRecorderSettings RecordingConfig::screen_settings() const {
        ScreenRecorderSettings s;
        s.workers = workers;
        s.target_fps = target_fps;
        s.max_frames = max_frames;
        s.queue_size = queue_size;
        s.encode.format = image_format;
        s.encode.png_compression = png_compression;
        s.encode.jpeg_quality = jpeg_quality;
        s.sink_idle_timeout = sink_idle_timeout;
        s.telemetry_timeout = telemetry_timeout;
        return s;
    }

    std::chrono::milliseconds RecordingConfig::start_delay() const { return to_ms(start_delay_s); }
    std::chrono::milliseconds RecordingConfig::timeout() const { return to_ms(timeout_s); }

    common::Result<common::ImageFormat> parse_image_format(const std::string& name) {
        using R = common::Result<common::ImageFormat>;
        std::string n = name;
        std::transform(n.begin(), n.end(), n.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (n == "png") return R::ok(common::ImageFormat::Png);
        if (n == "jpg" || n == "jpeg") return R::ok(common::ImageFormat::Jpeg);
        return R::err(common::ErrorCode::ConfigError, "format: '" + name + "' is not supported (png, jpg)");
    }

} // namespace core
