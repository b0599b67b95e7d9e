#pragma once
#include <cstdint>
#include <memory>
#include <vector>
#include "common/Cancellation.hpp"
#include "common/FrameTypes.hpp"
#include "common/Logger.hpp"
#include "common/Telemetry.hpp"
#include "core/BoundedChannel.hpp"
#include "interfaces/IScreenCapture.hpp"

namespace core {

    struct ProducerSettings {
        double target_fps = 10.0;
        uint64_t frame_limit = 100000;
        common::Region region;
    };

    // Capture loop of the screen pipeline.
    //
    // Frame i goes to channels[i % N]. Each iteration sleeps for whatever is
    // left of 1/target_fps since the previous capture, measured on the
    // monotonic clock right before sleeping. Pacing is local to each
    // iteration: there is no resynchronization to the start epoch.
    class FrameProducer {
    public:
        FrameProducer(
            std::shared_ptr<interfaces::IScreenCapture> capture,
            std::vector<std::shared_ptr<FrameChannel>> channels,
            ProducerSettings settings,
            common::CancellationToken stop_token,
            std::shared_ptr<common::ILogger> logger
        );

        // Runs until the stop flag is set, frame_limit is reached or capture
        // fails. Always ends by delivering one termination marker per channel.
        common::GrabRecord run();

    private:
        void send_termination_markers();

        std::shared_ptr<interfaces::IScreenCapture> capture_;
        std::vector<std::shared_ptr<FrameChannel>> channels_;
        ProducerSettings settings_;
        common::CancellationToken stop_token_;
        std::shared_ptr<common::ILogger> logger_;
    };

} // namespace core
