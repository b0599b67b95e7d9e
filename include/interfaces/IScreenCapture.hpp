#pragma once
#include <cstdint>
#include <vector>
#include "common/Result.hpp"
#include "common/FrameTypes.hpp"

namespace interfaces {

    class IScreenCapture {
    public:
        virtual ~IScreenCapture() = default;

        // Availability Contract:
        // Cheap check that a display can be reached. Called once by the
        // session before start; an error keeps the screen recorder out.
        virtual common::EmptyResult probe() = 0;

        // Geometry of the primary monitor, used when no region is configured.
        virtual common::Result<common::Region> primary_region() = 0;

        // Capture Contract:
        // 1. Blocking Call: returns one RGB24 buffer (width * height * 3 bytes)
        //    for the requested region.
        // 2. Thread Affinity: only ever called from the producer thread once
        //    recording has started. Implementations may lazily open their
        //    display connection on first call.
        // 3. An error is fatal for the producer; it stops and sends markers.
        virtual common::Result<std::vector<uint8_t>> capture(const common::Region& region) = 0;
    };

} // namespace interfaces
