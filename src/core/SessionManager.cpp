#include "core/SessionManager.hpp"
#include <algorithm>
#include <ctime>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace core {

    common::Result<std::string> create_session_directory(const std::string& output_root) {
        using R = common::Result<std::string>;

        std::error_code ec;
        fs::create_directories(output_root, ec);
        if (ec) {
            return R::err(common::ErrorCode::StorageError,
                "Cannot create output root " + output_root + ": " + ec.message(), __FILE__);
        }

        std::time_t now = std::time(nullptr);
        std::tm tm_buf{};
        localtime_r(&now, &tm_buf);
        char stamp[32];
        std::strftime(stamp, sizeof(stamp), "%Y-%m-%d_%H-%M-%S", &tm_buf);

        for (int suffix = 0; suffix < 1000; ++suffix) {
            std::string name = stamp;
            if (suffix > 0) name += "_" + std::to_string(suffix);
            fs::path candidate = fs::path(output_root) / name;
            if (fs::create_directory(candidate, ec)) {
                return R::ok(candidate.string());
            }
            if (ec) {
                return R::err(common::ErrorCode::StorageError,
                    "Cannot create " + candidate.string() + ": " + ec.message(), __FILE__);
            }
        }
        return R::err(common::ErrorCode::StorageError,
            "No free session directory name under " + output_root, __FILE__);
    }

    common::Result<std::unique_ptr<SessionManager>> SessionManager::create(
        std::vector<std::unique_ptr<Recorder>> recorders,
        const std::string& output_root,
        std::shared_ptr<common::ILogger> logger,
        bool print_results,
        bool verbose
    ) {
        using R = common::Result<std::unique_ptr<SessionManager>>;
        if (!logger) logger = std::make_shared<common::NullLogger>();

        auto dir = create_session_directory(output_root);
        if (dir.is_err()) return R::err(dir.error());

        for (auto& r : recorders) {
            if (!r) {
                return R::err(common::ErrorCode::ConfigError, "Null recorder in session", __FILE__);
            }
            RecorderContext ctx;
            ctx.output_dir = dir.unwrap();
            ctx.logger = logger;
            ctx.print_results = print_results;
            ctx.verbose = verbose;
            r->set_context(std::move(ctx));
        }

        logger->info("[Session] Output directory: " + dir.unwrap());
        return R::ok(std::make_unique<SessionManager>(
            CreateKey{}, std::move(recorders), dir.unwrap(), std::move(logger)));
    }

    SessionManager::SessionManager(
        CreateKey,
        std::vector<std::unique_ptr<Recorder>> recorders,
        std::string output_dir,
        std::shared_ptr<common::ILogger> logger
    ) : recorders_(std::move(recorders)),
        output_dir_(std::move(output_dir)),
        logger_(std::move(logger)) {}

    SessionManager::~SessionManager() {
        if (state() == SessionState::Running) {
            stop();
        }
    }

    common::EmptyResult SessionManager::start() {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (state_ != SessionState::Created) {
                throw std::logic_error("SessionManager::start() called twice");
            }
        }

        std::vector<Recorder*> available;
        for (auto& r : recorders_) {
            auto res = r->check_availability();
            if (res.is_err()) {
                logger_->warn("[Session] Recorder " + r->name() + " is not available (" +
                              common::to_string(res.error().code) + "): " +
                              res.error().message + ". This recorder will not be used.");
                skipped_.push_back(r->name());
                continue;
            }
            available.push_back(r.get());
        }

        for (Recorder* r : available) {
            auto res = r->start();
            if (res.is_err()) {
                logger_->warn("[Session] Recorder " + r->name() + " failed to start (" +
                              common::to_string(res.error().code) + "): " +
                              res.error().message + ". This recorder will not be used.");
                skipped_.push_back(r->name());
                continue;
            }
            active_.push_back(r);
        }

        if (active_.empty()) {
            std::lock_guard<std::mutex> lock(state_mutex_);
            state_ = SessionState::Stopped;
            stop_called_.store(true);
            return common::EmptyResult::err(common::ErrorCode::ConfigError,
                "No recorder available, nothing to record", __FILE__);
        }

        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = SessionState::Running;
        logger_->info("[Session] Recording started with " + std::to_string(active_.size()) + " recorder(s)");
        return common::EmptyResult::success();
    }

    void SessionManager::stop() {
        if (stop_called_.exchange(true)) return;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            state_ = SessionState::Stopping;
        }
        for (Recorder* r : active_) {
            r->stop();
        }
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            state_ = SessionState::Stopped;
        }
        logger_->info("[Session] Stopping recording.");
    }

    SessionReport SessionManager::join() {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (state_ != SessionState::Stopped) {
                throw std::logic_error("SessionManager::join() requires stop() first");
            }
            state_ = SessionState::Joined;
        }

        logger_->info("[Session] Waiting for recording to stop.");
        SessionReport report;
        report.output_dir = output_dir_;
        report.stop_reason = stop_reason_;
        report.skipped = skipped_;

        for (Recorder* r : active_) {
            const auto t0 = std::chrono::steady_clock::now();
            RecorderReport rr = r->join();
            const double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
            logger_->debug("[Session] " + rr.name + " joined in " + std::to_string(secs) + "s");

            if (rr.screen) {
                report.missing_telemetry_records +=
                    rr.screen->expected_records() - rr.screen->received_records();
            }
            for (const auto& w : rr.warnings) {
                logger_->warn("[Session] " + rr.name + ": " + w);
            }
            (rr.complete ? report.completed : report.partial).push_back(rr.name);
            report.recorders.push_back(std::move(rr));
        }

        logger_->info("[Session] Recording finished.");
        return report;
    }

    std::string SessionManager::poll_stop_request() {
        for (Recorder* r : active_) {
            if (r->should_stop()) return r->name();
        }
        return {};
    }

    common::Result<SessionReport> SessionManager::run_until_stop(
        std::chrono::milliseconds start_delay,
        std::chrono::milliseconds timeout
    ) {
        using R = common::Result<SessionReport>;
        using clock = std::chrono::steady_clock;

        const auto delay_end = clock::now() + start_delay;
        while (clock::now() < delay_end && !interrupt_.is_cancelled()) {
            std::this_thread::sleep_for(std::min<clock::duration>(kPollInterval, delay_end - clock::now()));
        }
        if (interrupt_.is_cancelled()) {
            return R::err(common::ErrorCode::Cancelled, "Interrupted before recording started", __FILE__);
        }

        const auto start_time = clock::now();
        auto res = start();
        if (res.is_err()) return R::err(res.error());

        while (true) {
            if (clock::now() - start_time >= timeout) {
                logger_->info("[Session] Timeout reached.");
                stop_reason_ = "timeout";
                break;
            }
            std::this_thread::sleep_for(kPollInterval);
            if (interrupt_.is_cancelled()) {
                logger_->info("[Session] Interrupted.");
                stop_reason_ = "interrupted";
                break;
            }
            std::string who = poll_stop_request();
            if (!who.empty()) {
                logger_->info("[Session] " + who + " requested stop.");
                stop_reason_ = who;
                break;
            }
        }

        stop();
        return R::ok(join());
    }

    SessionState SessionManager::state() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return state_;
    }

} // namespace core
