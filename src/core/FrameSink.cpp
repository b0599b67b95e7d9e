#include "core/FrameSink.hpp"
#include <sstream>

namespace core {

    FrameSink::FrameSink(
        uint32_t worker_id,
        std::shared_ptr<FrameChannel> channel,
        PersistFn persist,
        std::chrono::milliseconds idle_timeout,
        std::shared_ptr<common::ILogger> logger
    ) : worker_id_(worker_id),
        channel_(std::move(channel)),
        persist_(std::move(persist)),
        idle_timeout_(idle_timeout),
        logger_(std::move(logger)) {}

    common::SaveRecord FrameSink::run() {
        using clock = std::chrono::steady_clock;
        const std::string tag = "[FrameSink " + std::to_string(worker_id_) + "] ";

        common::SaveRecord record;
        record.worker_id = worker_id_;
        uint64_t sequence = 0;
        const auto start_time = clock::now();

        while (true) {
            auto item = channel_->pop_for(idle_timeout_);
            if (!item) {
                logger_->warn(tag + "Saving worker " + std::to_string(worker_id_) +
                              " queue is empty. Did the producer stop?");
                record.error = "no frame or termination marker within idle timeout";
                channel_->abandon();
                break;
            }
            if (std::holds_alternative<common::TerminationMarker>(*item)) {
                break;
            }

            common::FramePtr frame = std::move(std::get<common::FramePtr>(*item));
            common::EmptyResult res = common::EmptyResult::success();
            try {
                res = persist_(*frame, sequence);
            } catch (const std::exception& e) {
                res = common::EmptyResult::err(common::ErrorCode::EncoderError, e.what());
            }
            if (res.is_err()) {
                logger_->error(tag + "Persist failed for sequence " + std::to_string(sequence) +
                               ": " + res.error().message);
                record.error = res.error().message;
                channel_->abandon();
                break;
            }
            ++sequence;
            // 'frame' is released here, after persistence
        }

        const double elapsed = std::chrono::duration<double>(clock::now() - start_time).count();
        record.frames_persisted = sequence;
        record.elapsed_time = elapsed;
        record.fps = elapsed > 0.0 ? static_cast<double>(sequence) / elapsed : 0.0;

        std::ostringstream ss;
        ss << tag << "Finished: " << sequence << " frames in " << elapsed << "s";
        logger_->debug(ss.str());
        return record;
    }

} // namespace core
