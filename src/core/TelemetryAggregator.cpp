#include "core/TelemetryAggregator.hpp"
#include <iomanip>
#include <sstream>

namespace core {

    TelemetryAggregator::TelemetryAggregator(uint32_t worker_count)
        : worker_count_(worker_count),
          save_set_(worker_count, false),
          save_promises_(worker_count) {
        grab_future_ = grab_promise_.get_future();
        save_futures_.reserve(worker_count);
        for (auto& p : save_promises_) {
            save_futures_.push_back(p.get_future());
        }
    }

    common::EmptyResult TelemetryAggregator::report_grab(common::GrabRecord record) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (grab_set_) {
            return common::EmptyResult::err(common::ErrorCode::ProtocolViolation,
                "Multiple grab records: only one screen capture loop is expected", __FILE__);
        }
        grab_set_ = true;
        grab_promise_.set_value(std::move(record));
        return common::EmptyResult::success();
    }

    common::EmptyResult TelemetryAggregator::report_save(common::SaveRecord record) {
        std::lock_guard<std::mutex> lock(mutex_);
        const uint32_t id = record.worker_id;
        if (id >= worker_count_) {
            return common::EmptyResult::err(common::ErrorCode::ProtocolViolation,
                "Save record from unknown worker " + std::to_string(id), __FILE__);
        }
        if (save_set_[id]) {
            return common::EmptyResult::err(common::ErrorCode::ProtocolViolation,
                "Multiple save records from worker " + std::to_string(id), __FILE__);
        }
        save_set_[id] = true;
        save_promises_[id].set_value(std::move(record));
        return common::EmptyResult::success();
    }

    common::ScreenTelemetry TelemetryAggregator::collect(std::chrono::milliseconds per_record_timeout,
                                                         common::ILogger& logger) {
        common::ScreenTelemetry telemetry;
        telemetry.saves.resize(worker_count_);
        if (collected_) {
            logger.warn("[Telemetry] Records were already collected");
            return telemetry;
        }
        collected_ = true;

        const size_t expected = telemetry.expected_records();
        size_t received = 0;

        auto warn_timeout = [&]() {
            logger.warn("[Telemetry] Telemetry waiting out after receiving " + std::to_string(received) +
                        "/" + std::to_string(expected) +
                        " records. One saving worker might be still running or have failed.");
        };

        if (grab_future_.wait_for(per_record_timeout) == std::future_status::ready) {
            telemetry.grab = grab_future_.get();
            ++received;
        } else {
            warn_timeout();
        }

        for (uint32_t i = 0; i < worker_count_; ++i) {
            if (save_futures_[i].wait_for(per_record_timeout) == std::future_status::ready) {
                telemetry.saves[i] = save_futures_[i].get();
                ++received;
            } else {
                warn_timeout();
            }
        }

        logger.debug("[Telemetry] " + std::to_string(received) + "/" + std::to_string(expected) +
                     " records received");
        return telemetry;
    }

    common::Result<common::ScreenTelemetry> TelemetryAggregator::merge(
        const std::vector<common::TelemetryRecord>& records, uint32_t worker_count) {
        using R = common::Result<common::ScreenTelemetry>;

        common::ScreenTelemetry telemetry;
        telemetry.saves.resize(worker_count);

        for (const auto& rec : records) {
            if (const auto* grab = std::get_if<common::GrabRecord>(&rec)) {
                if (telemetry.grab) {
                    return R::err(common::ErrorCode::ProtocolViolation,
                        "Multiple grab records: only one screen capture loop is expected", __FILE__);
                }
                telemetry.grab = *grab;
                continue;
            }
            const auto& save = std::get<common::SaveRecord>(rec);
            if (save.worker_id >= worker_count) {
                return R::err(common::ErrorCode::ProtocolViolation,
                    "Save record from unknown worker " + std::to_string(save.worker_id), __FILE__);
            }
            if (telemetry.saves[save.worker_id]) {
                return R::err(common::ErrorCode::ProtocolViolation,
                    "Multiple save records from worker " + std::to_string(save.worker_id), __FILE__);
            }
            telemetry.saves[save.worker_id] = save;
        }
        return R::ok(std::move(telemetry));
    }

    std::string TelemetryAggregator::format(const common::ScreenTelemetry& telemetry) {
        const size_t n = telemetry.saves.size();
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2);
        ss << std::string(100, '-') << "\n";

        ss << "Grab FPS: ";
        if (telemetry.grab) ss << telemetry.grab->fps; else ss << "missing";
        ss << "\n";

        // A sink sees 1/N of the frames: scale so each entry compares with the grab rate
        ss << "Workers saving FPS: [";
        for (size_t i = 0; i < n; ++i) {
            if (i) ss << ", ";
            if (telemetry.saves[i]) ss << telemetry.saves[i]->fps * static_cast<double>(n);
            else ss << "missing";
        }
        ss << "]\n";

        ss << "Grab time: ";
        if (telemetry.grab) ss << telemetry.grab->elapsed_time; else ss << "missing";
        ss << "\n";

        ss << "Workers save time: [";
        for (size_t i = 0; i < n; ++i) {
            if (i) ss << ", ";
            if (telemetry.saves[i]) ss << telemetry.saves[i]->elapsed_time;
            else ss << "missing";
        }
        ss << "]\n";

        if (telemetry.grab) {
            ss << "Frames: " << telemetry.grab->frames_produced << " produced, "
               << telemetry.frames_persisted() << " persisted, max stable FPS "
               << std::setprecision(0) << telemetry.grab->max_stable_fps;
        }
        return ss.str();
    }

} // namespace core
