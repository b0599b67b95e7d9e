#include "core/BackpressureGuard.hpp"
#include <sstream>

namespace core {

    std::optional<BackpressureReport> BackpressureGuard::evaluate(
        const std::vector<std::shared_ptr<FrameChannel>>& channels) {
        for (size_t i = 0; i < channels.size(); ++i) {
            const auto& ch = channels[i];
            if (!ch || ch->closed() || ch->abandoned()) continue;
            if (ch->full()) {
                BackpressureReport report;
                report.worker_id = static_cast<uint32_t>(i);
                report.depth = ch->size();
                report.capacity = ch->capacity();
                return report;
            }
        }
        return std::nullopt;
    }

    std::string BackpressureGuard::describe(const BackpressureReport& report) {
        std::ostringstream ss;
        ss << "Out of memory: stopping recording because the number of images accumulated in the saving "
           << "queues exceeds allowed_n_images_delayed=" << report.capacity
           << ". Consider increasing the number of workers or decreasing the target FPS.";
        return ss.str();
    }

} // namespace core
