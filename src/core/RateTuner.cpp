#include "core/RateTuner.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <sstream>
#include <thread>
#include "core/ScreenRecorder.hpp"

namespace core {

    RateTuner::RateTuner(
        std::shared_ptr<interfaces::IScreenCapture> capture,
        std::shared_ptr<interfaces::IFrameEncoder> encoder,
        TunerSettings settings,
        std::shared_ptr<common::ILogger> logger
    ) : capture_(std::move(capture)),
        encoder_(std::move(encoder)),
        settings_(std::move(settings)),
        logger_(logger ? std::move(logger) : std::make_shared<common::NullLogger>()) {}

    bool RateTuner::is_safe(const common::ScreenTelemetry& telemetry, double target_fps, std::string& reason) {
        if (!telemetry.grab) {
            reason = "no grab record";
            return false;
        }
        const auto& grab = *telemetry.grab;
        if (grab.fps < 0.9 * target_fps) {
            std::ostringstream ss;
            ss << "can't record screen at " << target_fps << ", current FPS: " << grab.fps;
            reason = ss.str();
            return false;
        }
        for (const auto& save : telemetry.saves) {
            if (!save) {
                reason = "missing save record";
                return false;
            }
            if (save->elapsed_time > grab.elapsed_time + 1.0) {
                std::ostringstream ss;
                ss << "save time " << save->elapsed_time << "s is more than 1 second longer than "
                   << "screenshot time " << grab.elapsed_time << "s";
                reason = ss.str();
                return false;
            }
        }
        return true;
    }

    double RateTuner::next_target(double mean_fps, double target_fps) {
        return std::min(std::round(mean_fps / 10.0) * 10.0, target_fps - 10.0);
    }

    std::optional<TunerTrial> RateTuner::recommend(const std::vector<TunerTrial>& safe_configs) {
        std::optional<TunerTrial> best;
        for (const auto& t : safe_configs) {
            if (!best || t.max_stable_fps > best->max_stable_fps) best = t;
        }
        return best;
    }

    common::Result<TunerTrial> RateTuner::run_trial(uint32_t workers, double target_fps) {
        using R = common::Result<TunerTrial>;

        ScreenRecorderSettings rs;
        rs.workers = workers;
        rs.target_fps = target_fps;
        rs.max_frames = settings_.n_frames;
        rs.encode = settings_.encode;

        ScreenRecorder recorder(capture_, encoder_, rs);
        RecorderContext ctx;
        ctx.output_dir = settings_.output_dir;
        ctx.logger = logger_;
        ctx.print_results = settings_.print_results;
        recorder.set_context(ctx);

        auto avail = recorder.check_availability();
        if (avail.is_err()) return R::err(avail.error());
        auto started = recorder.start();
        if (started.is_err()) return R::err(started.error());

        while (!recorder.should_stop()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        recorder.stop();
        RecorderReport report = recorder.join();

        TunerTrial trial;
        trial.workers = workers;
        trial.target_fps = target_fps;
        if (report.screen && report.screen->grab) {
            trial.mean_fps = report.screen->grab->fps;
            trial.max_stable_fps = report.screen->grab->max_stable_fps;
        }
        trial.safe = report.screen && is_safe(*report.screen, target_fps, trial.reason);
        if (!report.screen) trial.reason = "no telemetry";
        return R::ok(trial);
    }

    common::Result<TuningReport> RateTuner::run() {
        using R = common::Result<TuningReport>;

        std::error_code ec;
        std::filesystem::create_directories(settings_.output_dir, ec);
        if (ec) {
            return R::err(common::ErrorCode::StorageError,
                "Cannot create " + settings_.output_dir + ": " + ec.message(), __FILE__);
        }

        TuningReport result;
        for (uint32_t workers = 1; workers <= settings_.max_workers; ++workers) {
            double target = settings_.max_fps;
            while (target >= settings_.min_fps) {
                logger_->info("[RateTuner] Testing " + std::to_string(workers) + " worker(s) and " +
                              std::to_string(static_cast<int>(target)) + " FPS...");
                auto trial = run_trial(workers, target);
                if (trial.is_err()) return R::err(trial.error());

                const TunerTrial& t = trial.unwrap();
                result.trials.push_back(t);
                if (t.safe) {
                    logger_->info("[RateTuner] Safe: mean FPS " + std::to_string(t.mean_fps) +
                                  ", most stable FPS " + std::to_string(t.max_stable_fps));
                    result.safe_configs.push_back(t);
                    break;
                }
                logger_->info("[RateTuner] Unsafe: " + t.reason);
                target = next_target(t.mean_fps, target);
            }
        }
        result.recommendation = recommend(result.safe_configs);
        return R::ok(std::move(result));
    }

    std::string RateTuner::format(const TuningReport& result) {
        std::ostringstream ss;
        ss << std::string(100, '-') << "\n";
        if (!result.recommendation) {
            ss << "No safe configuration found. Try a lower PNG compression or the jpg format.\n";
        } else {
            const auto& r = *result.recommendation;
            ss << "Best config:\n"
               << "Workers: " << r.workers << "\n"
               << "Target FPS: " << r.target_fps << "\n"
               << "Mean FPS: " << r.mean_fps << "\n"
               << "Most stable FPS: " << r.max_stable_fps << "\n";
        }
        ss << std::string(100, '-');
        return ss.str();
    }

} // namespace core
