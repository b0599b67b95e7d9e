#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <thread>
#include <vector>
#include "common/Cancellation.hpp"
#include "common/FrameTypes.hpp"
#include "core/BoundedChannel.hpp"
#include "core/Recorder.hpp"
#include "core/TelemetryAggregator.hpp"
#include "interfaces/IFrameEncoder.hpp"
#include "interfaces/IScreenCapture.hpp"

namespace core {

    struct ScreenRecorderSettings {
        uint32_t workers = 2;
        double target_fps = 10.0;
        uint64_t max_frames = 100000;
        size_t queue_size = 100;                 // allowed_n_images_delayed
        common::EncodeParams encode;
        std::optional<common::Region> region;    // primary monitor when unset
        std::chrono::milliseconds sink_idle_timeout{60000};
        std::chrono::milliseconds telemetry_timeout{60000};
    };

    // Screen pipeline: one FrameProducer thread feeding 'workers' FrameSink
    // threads through bounded channels.
    class ScreenRecorder : public Recorder {
    public:
        ScreenRecorder(
            std::shared_ptr<interfaces::IScreenCapture> capture,
            std::shared_ptr<interfaces::IFrameEncoder> encoder,
            ScreenRecorderSettings settings
        );
        ~ScreenRecorder() override;

        const ScreenRecorderSettings& settings() const { return settings_; }

    protected:
        common::EmptyResult do_check_availability() override;
        common::EmptyResult do_start() override;
        bool do_should_stop() override;
        void do_stop() override;
        RecorderReport do_join() override;

    private:
        // Everything the worker threads touch. Reference counted so that a
        // worker detached after a join timeout never outlives its data.
        struct Pipeline {
            std::shared_ptr<interfaces::IScreenCapture> capture;
            std::shared_ptr<interfaces::IFrameEncoder> encoder;
            std::shared_ptr<common::ILogger> logger;
            std::vector<std::shared_ptr<FrameChannel>> channels;
            std::unique_ptr<TelemetryAggregator> telemetry;
            common::CancellationSource stop_flag;
            std::atomic<bool> producer_done{false};
        };

        void write_timestamps(const common::GrabRecord& grab, RecorderReport& report);

        std::shared_ptr<interfaces::IScreenCapture> capture_;
        std::shared_ptr<interfaces::IFrameEncoder> encoder_;
        ScreenRecorderSettings settings_;

        std::shared_ptr<Pipeline> pipeline_;
        std::thread producer_thread_;
        std::vector<std::thread> sink_threads_;
        std::atomic<bool> backpressure_reported_{false};
    };

} // namespace core
