#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/BoundedChannel.hpp"

namespace core {

    struct BackpressureReport {
        uint32_t worker_id = 0;
        size_t depth = 0;
        size_t capacity = 0;
    };

    // Detects a saturated sink channel. A channel that already carries its
    // termination marker is ignored: the producer is done with it.
    class BackpressureGuard {
    public:
        static std::optional<BackpressureReport> evaluate(
            const std::vector<std::shared_ptr<FrameChannel>>& channels);

        static std::string describe(const BackpressureReport& report);
    };

} // namespace core
