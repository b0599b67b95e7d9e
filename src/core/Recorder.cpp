#include "core/Recorder.hpp"
#include <stdexcept>

namespace core {

    const char* to_string(RecorderState state) {
        switch (state) {
            case RecorderState::Created: return "Created";
            case RecorderState::Started: return "Started";
            case RecorderState::StopRequested: return "StopRequested";
            case RecorderState::Stopped: return "Stopped";
            case RecorderState::Joined: return "Joined";
        }
        return "Unknown";
    }

    Recorder::Recorder(std::string name) : name_(std::move(name)) {
        context_.logger = std::make_shared<common::NullLogger>();
    }

    void Recorder::set_context(RecorderContext context) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != RecorderState::Created) {
            throw std::logic_error("Recorder " + name_ + ": context assigned after start");
        }
        if (!context.logger) {
            context.logger = std::make_shared<common::NullLogger>();
        }
        context_ = std::move(context);
    }

    common::EmptyResult Recorder::check_availability() {
        return do_check_availability();
    }

    common::EmptyResult Recorder::start() {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (state_ != RecorderState::Created) {
                throw std::logic_error("Recorder " + name_ + ": start() called in state " + to_string(state_));
            }
            state_ = RecorderState::Started;
        }

        auto res = do_start();

        std::lock_guard<std::mutex> lock(state_mutex_);
        if (res.is_err()) {
            // Nothing runs: the recorder goes straight to Stopped
            state_ = RecorderState::Stopped;
            return res;
        }
        running_ = true;
        return res;
    }

    bool Recorder::should_stop() {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (!running_ || state_ == RecorderState::Joined) return false;
        }
        const bool stop_wanted = do_should_stop();
        if (stop_wanted) {
            log().debug("[" + name_ + "] called for stop");
        }
        return stop_wanted;
    }

    void Recorder::stop() {
        bool call_hook = false;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (state_ == RecorderState::Created) {
                state_ = RecorderState::Stopped;
                return;
            }
            if (state_ != RecorderState::Started) return;
            state_ = RecorderState::StopRequested;
            call_hook = running_;
        }

        if (call_hook) {
            do_stop();
            log().debug("[" + name_ + "] stop flag set");
        }

        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = RecorderState::Stopped;
    }

    RecorderReport Recorder::join() {
        bool was_running = false;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (state_ != RecorderState::Stopped) {
                throw std::logic_error("Recorder " + name_ + ": join() called in state " +
                                       to_string(state_) + ", call stop() first");
            }
            state_ = RecorderState::Joined;
            was_running = running_;
        }

        if (!was_running) {
            RecorderReport report;
            report.name = name_;
            report.complete = false;
            report.warnings.push_back("recorder was never started");
            return report;
        }

        RecorderReport report = do_join();
        report.name = name_;
        log().debug("[" + name_ + "] recording finished");
        return report;
    }

    RecorderState Recorder::state() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return state_;
    }

} // namespace core
