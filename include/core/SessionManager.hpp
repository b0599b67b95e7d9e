#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "common/Cancellation.hpp"
#include "common/Logger.hpp"
#include "common/Result.hpp"
#include "core/Recorder.hpp"

namespace core {

    enum class SessionState {
        Created,
        Running,
        Stopping,
        Stopped,
        Joined
    };

    struct SessionReport {
        std::string output_dir;
        std::string stop_reason;                 // recorder name, "timeout" or "interrupted"
        std::vector<RecorderReport> recorders;   // one per started recorder, in start order
        std::vector<std::string> completed;
        std::vector<std::string> partial;
        std::vector<std::string> skipped;
        size_t missing_telemetry_records = 0;
    };

    /**
     * @brief Runs a set of recorders as one recording session.
     *
     * Owns the recorders and the session output directory. Recorders that are
     * unavailable are dropped at start(); the rest are started, polled, stopped
     * and joined together.
     */
    class SessionManager {
        // Only create() can name this, so only create() can construct
        struct CreateKey {
            explicit CreateKey() = default;
        };

    public:
        static constexpr std::chrono::milliseconds kPollInterval{100};

        // Creates '<output_root>/YYYY-MM-DD_HH-MM-SS[_k]' and hands every
        // recorder its context
        static common::Result<std::unique_ptr<SessionManager>> create(
            std::vector<std::unique_ptr<Recorder>> recorders,
            const std::string& output_root,
            std::shared_ptr<common::ILogger> logger,
            bool print_results = true,
            bool verbose = false
        );

        SessionManager(
            CreateKey,
            std::vector<std::unique_ptr<Recorder>> recorders,
            std::string output_dir,
            std::shared_ptr<common::ILogger> logger
        );
        ~SessionManager();

        SessionManager(const SessionManager&) = delete;
        SessionManager& operator=(const SessionManager&) = delete;

        // ConfigError when no recorder is usable
        common::EmptyResult start();

        // No-op after the first call
        void stop();

        // Requires stop(); throws std::logic_error otherwise
        SessionReport join();

        // start_delay, start, poll until a recorder asks to stop, the timeout
        // elapses or interrupt() is called, then stop + join
        common::Result<SessionReport> run_until_stop(
            std::chrono::milliseconds start_delay,
            std::chrono::milliseconds timeout
        );

        // Async-signal-safe request to end run_until_stop()
        void interrupt() { interrupt_.cancel(); }

        const std::string& output_dir() const { return output_dir_; }
        SessionState state() const;
        size_t active_count() const { return active_.size(); }
        const std::vector<std::string>& skipped() const { return skipped_; }

    private:
        // Name of the first recorder asking to stop, empty if none
        std::string poll_stop_request();

        std::vector<std::unique_ptr<Recorder>> recorders_;
        std::vector<Recorder*> active_;
        std::vector<std::string> skipped_;
        std::string output_dir_;
        std::string stop_reason_;
        std::shared_ptr<common::ILogger> logger_;

        mutable std::mutex state_mutex_;
        SessionState state_ = SessionState::Created;
        std::atomic<bool> stop_called_{false};
        common::CancellationSource interrupt_;
    };

    // '<root>/<YYYY-MM-DD_HH-MM-SS>' or, if that exists, the first free '_k' suffix
    common::Result<std::string> create_session_directory(const std::string& output_root);

} // namespace core
