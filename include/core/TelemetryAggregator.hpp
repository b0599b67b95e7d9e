#pragma once
#include <chrono>
#include <cstdint>
#include <future>
#include <mutex>
#include <string>
#include <vector>
#include "common/Logger.hpp"
#include "common/Result.hpp"
#include "common/Telemetry.hpp"

namespace core {

    /**
     * @brief Collects the N+1 telemetry records of one screen pipeline.
     *
     * The producer and each sink hand in exactly one record from their own
     * thread; collect() waits for them with a bounded wait per record. Slots
     * that never arrive stay empty in the resulting ScreenTelemetry.
     *
     * Lives in shared state so late reports from detached workers are safe.
     */
    class TelemetryAggregator {
    public:
        explicit TelemetryAggregator(uint32_t worker_count);

        TelemetryAggregator(const TelemetryAggregator&) = delete;
        TelemetryAggregator& operator=(const TelemetryAggregator&) = delete;

        // Called once by the producer thread
        common::EmptyResult report_grab(common::GrabRecord record);

        // Called once by each sink thread
        common::EmptyResult report_save(common::SaveRecord record);

        // Waits at most 'per_record_timeout' for each record still missing
        common::ScreenTelemetry collect(std::chrono::milliseconds per_record_timeout,
                                        common::ILogger& logger);

        uint32_t worker_count() const { return worker_count_; }

        /**
         * @brief Assemble telemetry from loose records.
         * Rejects a second Grab record, a duplicated worker id and a worker id
         * out of range: each means more workers than the pipeline started.
         */
        static common::Result<common::ScreenTelemetry> merge(
            const std::vector<common::TelemetryRecord>& records, uint32_t worker_count);

        // Human-readable summary printed after join
        static std::string format(const common::ScreenTelemetry& telemetry);

    private:
        const uint32_t worker_count_;

        mutable std::mutex mutex_;
        bool grab_set_ = false;
        std::vector<bool> save_set_;

        std::promise<common::GrabRecord> grab_promise_;
        std::future<common::GrabRecord> grab_future_;
        std::vector<std::promise<common::SaveRecord>> save_promises_;
        std::vector<std::future<common::SaveRecord>> save_futures_;
        bool collected_ = false;
    };

} // namespace core
