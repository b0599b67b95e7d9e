#pragma once
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "common/Logger.hpp"
#include "common/Result.hpp"
#include "common/Telemetry.hpp"

namespace core {

    enum class RecorderState {
        Created,
        Started,
        StopRequested,
        Stopped,
        Joined
    };

    const char* to_string(RecorderState state);

    // Assigned once by the SessionManager, before start()
    struct RecorderContext {
        std::string output_dir;
        std::shared_ptr<common::ILogger> logger;
        bool print_results = true;
        bool verbose = false;
    };

    struct RecorderReport {
        std::string name;
        bool complete = true;               // every worker reported and stopped in time
        std::optional<common::ScreenTelemetry> screen;
        size_t events_logged = 0;
        std::vector<std::string> artifacts; // files written to the session directory
        std::vector<std::string> warnings;
    };

    /**
     * @brief Uniform lifecycle shared by every recorder of a session.
     *
     * Created -> Started -> StopRequested -> Stopped -> Joined.
     * The public methods enforce the state machine and delegate the actual
     * work to the do_* hooks. Calling start() twice, start() after stop(), or
     * join() before stop() throws std::logic_error.
     */
    class Recorder {
    public:
        explicit Recorder(std::string name);
        virtual ~Recorder() = default;

        Recorder(const Recorder&) = delete;
        Recorder& operator=(const Recorder&) = delete;

        void set_context(RecorderContext context);

        // Probe the underlying device; an error keeps the recorder out of the session
        common::EmptyResult check_availability();

        common::EmptyResult start();

        // Cheap poll: true when this recorder wants the whole session to stop
        bool should_stop();

        // Idempotent, never blocks
        void stop();

        // Bounded wait for the workers; requires stop() first
        RecorderReport join();

        RecorderState state() const;
        const std::string& name() const { return name_; }

    protected:
        virtual common::EmptyResult do_check_availability() = 0;
        virtual common::EmptyResult do_start() = 0;
        virtual bool do_should_stop() = 0;
        virtual void do_stop() = 0;
        virtual RecorderReport do_join() = 0;

        const RecorderContext& context() const { return context_; }
        common::ILogger& log() const { return *context_.logger; }

    private:
        const std::string name_;
        RecorderContext context_;

        mutable std::mutex state_mutex_;
        RecorderState state_ = RecorderState::Created;
        bool running_ = false; // do_start() succeeded, so do_stop()/do_join() are meaningful
    };

} // namespace core
