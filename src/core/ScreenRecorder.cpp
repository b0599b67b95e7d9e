#include "core/ScreenRecorder.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>
#include "core/BackpressureGuard.hpp"
#include "core/FrameProducer.hpp"
#include "core/FrameSink.hpp"

namespace fs = std::filesystem;

namespace core {

    ScreenRecorder::ScreenRecorder(
        std::shared_ptr<interfaces::IScreenCapture> capture,
        std::shared_ptr<interfaces::IFrameEncoder> encoder,
        ScreenRecorderSettings settings
    ) : Recorder("ScreenRecorder"),
        capture_(std::move(capture)),
        encoder_(std::move(encoder)),
        settings_(settings) {}

    ScreenRecorder::~ScreenRecorder() {
        // Never leave joinable threads behind if the session was torn down early
        if (pipeline_) pipeline_->stop_flag.cancel();
        if (producer_thread_.joinable()) producer_thread_.detach();
        for (auto& t : sink_threads_) {
            if (t.joinable()) t.detach();
        }
    }

    common::EmptyResult ScreenRecorder::do_check_availability() {
        if (!capture_ || !encoder_) {
            return common::EmptyResult::err(common::ErrorCode::DeviceNotFound, "No screen capture backend");
        }
        if (settings_.workers == 0) {
            return common::EmptyResult::err(common::ErrorCode::ConfigError, "workers must be 1 or more");
        }
        if (settings_.target_fps <= 0.0) {
            return common::EmptyResult::err(common::ErrorCode::ConfigError, "target fps must be positive");
        }
        if (settings_.queue_size == 0) {
            return common::EmptyResult::err(common::ErrorCode::ConfigError, "queue size must be 1 or more");
        }
        auto res = capture_->probe();
        if (res.is_err()) {
            return common::EmptyResult::err(res.error().code, "No screen found: " + res.error().message);
        }
        return common::EmptyResult::success();
    }

    common::EmptyResult ScreenRecorder::do_start() {
        common::Region region;
        if (settings_.region) {
            region = *settings_.region;
        } else {
            auto primary = capture_->primary_region();
            if (primary.is_err()) return common::EmptyResult::err(primary.error());
            region = primary.unwrap();
        }

        const uint32_t n = settings_.workers;
        pipeline_ = std::make_shared<Pipeline>();
        pipeline_->capture = capture_;
        pipeline_->encoder = encoder_;
        pipeline_->logger = context().logger;
        pipeline_->telemetry = std::make_unique<TelemetryAggregator>(n);
        for (uint32_t i = 0; i < n; ++i) {
            pipeline_->channels.push_back(std::make_shared<FrameChannel>(settings_.queue_size));
        }

        log().info("[ScreenRecorder] Recording " + std::to_string(region.width) + "x" +
                   std::to_string(region.height) + " at " + std::to_string(settings_.target_fps) +
                   " fps with " + std::to_string(n) + " saving worker(s)");

        const std::string output_dir = context().output_dir;
        const common::EncodeParams encode = settings_.encode;

        try {
            for (uint32_t id = 0; id < n; ++id) {
                auto state = pipeline_;
                const auto idle_timeout = settings_.sink_idle_timeout;
                sink_threads_.emplace_back([state, id, n, output_dir, encode, idle_timeout]() {
                    PersistFn persist = [state, id, n, output_dir, encode](const common::Frame& frame,
                                                                          uint64_t sequence) {
                        const uint64_t index = artifact_index(sequence, n, id);
                        const std::string file = "file_" + std::to_string(index) + "." +
                                                 common::file_extension(encode.format);
                        return state->encoder->persist(frame, (fs::path(output_dir) / file).string(), encode);
                    };
                    FrameSink sink(id, state->channels[id], persist, idle_timeout, state->logger);
                    auto res = state->telemetry->report_save(sink.run());
                    if (res.is_err()) state->logger->error("[ScreenRecorder] " + res.error().message);
                });
            }

            ProducerSettings ps;
            ps.target_fps = settings_.target_fps;
            ps.frame_limit = settings_.max_frames;
            ps.region = region;
            auto state = pipeline_;
            producer_thread_ = std::thread([state, ps]() {
                FrameProducer producer(state->capture, state->channels, ps,
                                       state->stop_flag.get_token(), state->logger);
                auto res = state->telemetry->report_grab(producer.run());
                if (res.is_err()) state->logger->error("[ScreenRecorder] " + res.error().message);
                state->producer_done.store(true);
            });
        } catch (const std::system_error& e) {
            // Threads already running see the flag and their markers below
            pipeline_->stop_flag.cancel();
            for (auto& ch : pipeline_->channels) {
                ch->push_final(common::FrameItem(common::TerminationMarker{}));
            }
            for (auto& t : sink_threads_) {
                if (t.joinable()) t.join();
            }
            sink_threads_.clear();
            return common::EmptyResult::err(common::ErrorCode::Unknown,
                std::string("Cannot spawn pipeline threads: ") + e.what(), __FILE__);
        }

        return common::EmptyResult::success();
    }

    bool ScreenRecorder::do_should_stop() {
        if (!pipeline_) return false;
        auto report = BackpressureGuard::evaluate(pipeline_->channels);
        if (report) {
            if (!backpressure_reported_.exchange(true)) {
                log().warn("[ScreenRecorder] " + BackpressureGuard::describe(*report));
            }
            return true;
        }
        return pipeline_->producer_done.load();
    }

    void ScreenRecorder::do_stop() {
        if (pipeline_ && pipeline_->stop_flag.cancel()) {
            log().debug("[ScreenRecorder] Stop flag set");
        }
    }

    RecorderReport ScreenRecorder::do_join() {
        RecorderReport report;
        common::ScreenTelemetry telemetry =
            pipeline_->telemetry->collect(settings_.telemetry_timeout, log());

        // A worker that reported is past its last blocking call; one that did
        // not is still stuck and gets detached.
        if (producer_thread_.joinable()) {
            if (telemetry.grab) producer_thread_.join();
            else producer_thread_.detach();
        }
        for (size_t i = 0; i < sink_threads_.size(); ++i) {
            if (!sink_threads_[i].joinable()) continue;
            if (telemetry.saves[i]) sink_threads_[i].join();
            else sink_threads_[i].detach();
        }

        if (telemetry.complete()) {
            log().debug("[ScreenRecorder] All " + std::to_string(telemetry.expected_records()) +
                        " records received.");
        } else {
            report.complete = false;
            report.warnings.push_back("missing " +
                std::to_string(telemetry.expected_records() - telemetry.received_records()) +
                " telemetry record(s)");
        }

        for (const auto& save : telemetry.saves) {
            if (save && save->error) {
                report.complete = false;
                report.warnings.push_back("worker " + std::to_string(save->worker_id) + ": " + *save->error);
            }
        }

        if (telemetry.grab) {
            write_timestamps(*telemetry.grab, report);
        }

        if (context().print_results) {
            std::cout << TelemetryAggregator::format(telemetry) << std::endl;
        }

        report.screen = std::move(telemetry);
        return report;
    }

    void ScreenRecorder::write_timestamps(const common::GrabRecord& grab, RecorderReport& report) {
        const std::string path = (fs::path(context().output_dir) / "timestamps.txt").string();
        std::ofstream out(path, std::ios::trunc);
        if (!out) {
            log().error("[ScreenRecorder] Cannot write " + path);
            report.warnings.push_back("cannot write timestamps.txt");
            return;
        }
        char buf[64];
        for (size_t i = 0; i < grab.timestamps.size(); ++i) {
            std::snprintf(buf, sizeof(buf), "%.6f", grab.timestamps[i]);
            out << buf;
            if (i + 1 < grab.timestamps.size()) out << '\n';
        }
        report.artifacts.push_back(path);
    }

} // namespace core
