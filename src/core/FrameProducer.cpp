#include "core/FrameProducer.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <sstream>
#include <thread>

namespace core {

    namespace {
        // Starting ceiling for max_stable_fps before the first interval is seen
        constexpr double kInitialStableFps = 10000.0;

        double wall_clock_seconds() {
            auto now = std::chrono::system_clock::now().time_since_epoch();
            return std::chrono::duration<double>(now).count();
        }
    }

    FrameProducer::FrameProducer(
        std::shared_ptr<interfaces::IScreenCapture> capture,
        std::vector<std::shared_ptr<FrameChannel>> channels,
        ProducerSettings settings,
        common::CancellationToken stop_token,
        std::shared_ptr<common::ILogger> logger
    ) : capture_(std::move(capture)),
        channels_(std::move(channels)),
        settings_(settings),
        stop_token_(std::move(stop_token)),
        logger_(std::move(logger)) {}

    common::GrabRecord FrameProducer::run() {
        using clock = std::chrono::steady_clock;

        common::GrabRecord record;
        const size_t n_channels = channels_.size();
        if (n_channels == 0 || settings_.target_fps <= 0.0) {
            logger_->error("[FrameProducer] Nothing to do: no channel or non-positive target fps");
            return record;
        }
        const std::chrono::duration<double> frame_period(1.0 / settings_.target_fps);
        double max_stable_fps = kInitialStableFps;

        const auto start_time = clock::now();
        auto grab_time = start_time;

        logger_->debug("[FrameProducer] Capturing " + std::to_string(settings_.region.width) + "x" +
                       std::to_string(settings_.region.height) + " at " +
                       std::to_string(settings_.target_fps) + " fps into " +
                       std::to_string(n_channels) + " channel(s)");

        try {
            for (uint64_t i = 0; i < settings_.frame_limit; ++i) {
                if (stop_token_.is_cancellation_requested()) break;

                auto pixels = capture_->capture(settings_.region);
                if (pixels.is_err()) {
                    logger_->error("[FrameProducer] Capture failed: " + pixels.error().message);
                    break;
                }
                const double timestamp = wall_clock_seconds();
                common::FramePtr frame = std::make_unique<const common::Frame>(
                    timestamp, settings_.region, pixels.take());

                // Blocks while the sink is behind; that is the backpressure path.
                const size_t target = static_cast<size_t>(i % n_channels);
                auto status = channels_[target]->push(common::FrameItem(std::move(frame)), stop_token_);
                if (status == FrameChannel::PushStatus::Cancelled) {
                    logger_->debug("[FrameProducer] Stop requested while channel " +
                                   std::to_string(target) + " was full, dropping in-flight frame");
                    break;
                }
                if (status != FrameChannel::PushStatus::Pushed) {
                    logger_->warn("[FrameProducer] Saving worker " + std::to_string(target) +
                                  " no longer accepts frames. Stopping capture.");
                    break;
                }
                record.timestamps.push_back(timestamp);

                auto busy = clock::now() - grab_time;
                if (busy < frame_period) {
                    std::this_thread::sleep_for(frame_period - busy);
                }
                const double interval = std::chrono::duration<double>(clock::now() - grab_time).count();
                if (interval > 0.0) {
                    max_stable_fps = std::min(max_stable_fps, std::floor(1.0 / interval));
                }
                grab_time = clock::now();
            }
        } catch (const std::exception& e) {
            logger_->error(std::string("[FrameProducer] Unexpected failure: ") + e.what());
        }

        logger_->debug("[FrameProducer] Stop screenshotting. Sending termination markers.");
        send_termination_markers();

        const double elapsed = std::chrono::duration<double>(clock::now() - start_time).count();
        record.frames_produced = record.timestamps.size();
        record.elapsed_time = elapsed;
        record.fps = elapsed > 0.0 ? static_cast<double>(record.frames_produced) / elapsed : 0.0;
        record.max_stable_fps = record.frames_produced > 0 ? max_stable_fps : 0.0;

        std::ostringstream ss;
        ss << "[FrameProducer] Finished: " << record.frames_produced << " frames in "
           << elapsed << "s (" << record.fps << " fps)";
        logger_->debug(ss.str());
        return record;
    }

    void FrameProducer::send_termination_markers() {
        for (size_t i = 0; i < channels_.size(); ++i) {
            auto status = channels_[i]->push_final(common::FrameItem(common::TerminationMarker{}));
            if (status == FrameChannel::PushStatus::Abandoned) {
                logger_->debug("[FrameProducer] Worker " + std::to_string(i) +
                               " already gone, no marker needed");
            }
        }
    }

} // namespace core
