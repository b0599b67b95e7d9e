#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include "common/FrameTypes.hpp"
#include "common/Logger.hpp"
#include "common/Result.hpp"
#include "common/Telemetry.hpp"
#include "core/BoundedChannel.hpp"

namespace core {

    // Global artifact index of the 'sequence'-th frame persisted by sink
    // 'worker_id' out of 'worker_count'. With round-robin fan-out this is the
    // frame's original capture index, and it is unique per (sequence, worker).
    constexpr uint64_t artifact_index(uint64_t sequence, uint32_t worker_count, uint32_t worker_id) {
        return sequence * worker_count + worker_id;
    }

    // Persists one frame; 'sequence' counts frames handled by this sink (0, 1, ...)
    using PersistFn = std::function<common::EmptyResult(const common::Frame& frame, uint64_t sequence)>;

    class FrameSink {
    public:
        FrameSink(
            uint32_t worker_id,
            std::shared_ptr<FrameChannel> channel,
            PersistFn persist,
            std::chrono::milliseconds idle_timeout,
            std::shared_ptr<common::ILogger> logger
        );

        // Drains the channel until the termination marker. Stops early, and
        // abandons the channel, on idle timeout or persist failure.
        common::SaveRecord run();

    private:
        uint32_t worker_id_;
        std::shared_ptr<FrameChannel> channel_;
        PersistFn persist_;
        std::chrono::milliseconds idle_timeout_;
        std::shared_ptr<common::ILogger> logger_;
    };

} // namespace core
