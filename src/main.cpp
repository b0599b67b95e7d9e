#include "core/HotkeyStopRecorder.hpp"
#include "core/InputRecorders.hpp"
#include "core/RateTuner.hpp"
#include "core/RecordingConfig.hpp"
#include "core/ScreenRecorder.hpp"
#include "core/SessionManager.hpp"
#include "common/Logger.hpp"
#include "interfaces/IPlatformFactory.hpp"

#ifdef PLATFORM_LINUX
    #include "platform/linux/LinuxPlatformFactory.hpp"
#endif

#include <getopt.h>
#include <signal.h>

#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

    // Set while run_until_stop() is in progress; read by the SIGINT handler
    core::SessionManager* g_session = nullptr;

    void signal_handler(int) {
        if (g_session) g_session->interrupt();
    }

    enum LongOption {
        OPT_NO_SCREEN = 256,
        OPT_NO_KEYBOARD,
        OPT_NO_MOUSE,
        OPT_NO_GAMEPAD,
        OPT_NO_PRINT_RESULTS,
        OPT_WORKERS,
        OPT_FPS,
        OPT_FORMAT,
        OPT_COMPRESSION,
        OPT_QUALITY,
        OPT_MAX_SCREENSHOTS,
        OPT_QUEUE_SIZE,
        OPT_HOTKEY,
        OPT_START_DELAY,
        OPT_TIMEOUT,
        OPT_TUNE
    };

    void print_usage(const char* prog) {
        std::cout << "Usage: " << prog << " [options]\n"
                  << "\n"
                  << "Records the screen, keyboard, mouse and gamepad into a new session\n"
                  << "directory until the stop hotkey, the timeout or Ctrl+C.\n"
                  << "\n"
                  << "Recorders:\n"
                  << "  --no-screen              Do not record the screen\n"
                  << "  --no-keyboard            Do not record the keyboard\n"
                  << "  --no-mouse               Do not record the mouse\n"
                  << "  --no-gamepad             Do not record the gamepad\n"
                  << "\n"
                  << "Output:\n"
                  << "  -o, --output DIR         Root of the session directories (default: ./screenshots/)\n"
                  << "  --no-print-results       Do not print the screen recording statistics\n"
                  << "  -v, --verbose            Debug logging\n"
                  << "\n"
                  << "Screen:\n"
                  << "  --workers N              Saving workers (default: 2, alias --n-processes)\n"
                  << "  --fps F                  Target frames per second (default: 10)\n"
                  << "  --format png|jpg         Image format (default: png)\n"
                  << "  --compression N          PNG compression 0-9 (default: 9)\n"
                  << "  --quality N              JPEG quality 1-100 (default: 90)\n"
                  << "  --max-screenshots N      Stop after N frames (default: 200000)\n"
                  << "  --queue-size N           Frames allowed to wait per worker (default: 100)\n"
                  << "\n"
                  << "Stop conditions:\n"
                  << "  --hotkey KEYS            Stop hotkey (default: <ctrl>+<shift>+<delete>)\n"
                  << "  --start-delay S          Seconds before recording starts (default: 2)\n"
                  << "  --timeout S              Maximum recording seconds (default: 150000)\n"
                  << "\n"
                  << "  --tune                   Search for a safe --workers / --fps pair and exit\n"
                  << "  -h, --help               Show this help\n";
    }

    bool parse_double(const char* option, const char* text, double& out) {
        errno = 0;
        char* end = nullptr;
        const double v = std::strtod(text, &end);
        if (errno != 0 || end == text || *end != '\0') {
            std::cerr << "Error: invalid value for --" << option << ": '" << text << "'" << std::endl;
            return false;
        }
        out = v;
        return true;
    }

    bool parse_long(const char* option, const char* text, long long& out) {
        errno = 0;
        char* end = nullptr;
        const long long v = std::strtoll(text, &end, 10);
        if (errno != 0 || end == text || *end != '\0') {
            std::cerr << "Error: invalid value for --" << option << ": '" << text << "'" << std::endl;
            return false;
        }
        out = v;
        return true;
    }

    void print_report(const core::SessionReport& report, common::ILogger& logger) {
        auto join = [](const std::vector<std::string>& names) {
            std::string s;
            for (const auto& n : names) s += (s.empty() ? "" : ", ") + n;
            return s.empty() ? std::string("-") : s;
        };
        logger.info("[Main] Session saved to " + report.output_dir);
        logger.info("[Main] Stopped by: " + report.stop_reason);
        logger.info("[Main] Completed: " + join(report.completed));
        if (!report.partial.empty()) logger.warn("[Main] Partial: " + join(report.partial));
        if (!report.skipped.empty()) logger.info("[Main] Skipped: " + join(report.skipped));
        if (report.missing_telemetry_records > 0) {
            logger.warn("[Main] Missing telemetry records: " + std::to_string(report.missing_telemetry_records));
        }
    }

} // namespace

int main(int argc, char** argv) {
    core::RecordingConfig config;
    bool tune = false;

    static struct option long_options[] = {
        {"no-screen",        no_argument,       0, OPT_NO_SCREEN},
        {"no-keyboard",      no_argument,       0, OPT_NO_KEYBOARD},
        {"no-mouse",         no_argument,       0, OPT_NO_MOUSE},
        {"no-gamepad",       no_argument,       0, OPT_NO_GAMEPAD},
        {"output",           required_argument, 0, 'o'},
        {"no-print-results", no_argument,       0, OPT_NO_PRINT_RESULTS},
        {"verbose",          no_argument,       0, 'v'},
        {"workers",          required_argument, 0, OPT_WORKERS},
        {"n-processes",      required_argument, 0, OPT_WORKERS},
        {"fps",              required_argument, 0, OPT_FPS},
        {"format",           required_argument, 0, OPT_FORMAT},
        {"compression",      required_argument, 0, OPT_COMPRESSION},
        {"quality",          required_argument, 0, OPT_QUALITY},
        {"max-screenshots",  required_argument, 0, OPT_MAX_SCREENSHOTS},
        {"queue-size",       required_argument, 0, OPT_QUEUE_SIZE},
        {"hotkey",           required_argument, 0, OPT_HOTKEY},
        {"start-delay",      required_argument, 0, OPT_START_DELAY},
        {"timeout",          required_argument, 0, OPT_TIMEOUT},
        {"tune",             no_argument,       0, OPT_TUNE},
        {"help",             no_argument,       0, 'h'},
        {0,                  0,                 0,  0 }
    };

    int option_index = 0;
    int c;
    long long n = 0;
    while ((c = getopt_long(argc, argv, "o:vh", long_options, &option_index)) != -1) {
        switch (c) {
            case OPT_NO_SCREEN: config.record_screen = false; break;
            case OPT_NO_KEYBOARD: config.record_keyboard = false; break;
            case OPT_NO_MOUSE: config.record_mouse = false; break;
            case OPT_NO_GAMEPAD: config.record_gamepad = false; break;
            case 'o': config.output_root = optarg; break;
            case OPT_NO_PRINT_RESULTS: config.print_results = false; break;
            case 'v': config.verbose = true; break;
            case OPT_WORKERS:
                if (!parse_long("workers", optarg, n)) return 1;
                if (n < 1) {
                    std::cerr << "Error: --workers must be 1 or more" << std::endl;
                    return 1;
                }
                config.workers = static_cast<uint32_t>(n);
                break;
            case OPT_FPS:
                if (!parse_double("fps", optarg, config.target_fps)) return 1;
                break;
            case OPT_FORMAT: {
                auto format = core::parse_image_format(optarg);
                if (format.is_err()) {
                    std::cerr << "Error: " << format.error().message << std::endl;
                    return 1;
                }
                config.image_format = format.unwrap();
                break;
            }
            case OPT_COMPRESSION:
                if (!parse_long("compression", optarg, n)) return 1;
                config.png_compression = static_cast<int>(n);
                break;
            case OPT_QUALITY:
                if (!parse_long("quality", optarg, n)) return 1;
                config.jpeg_quality = static_cast<int>(n);
                break;
            case OPT_MAX_SCREENSHOTS:
                if (!parse_long("max-screenshots", optarg, n)) return 1;
                if (n < 1) {
                    std::cerr << "Error: --max-screenshots must be 1 or more" << std::endl;
                    return 1;
                }
                config.max_frames = static_cast<uint64_t>(n);
                break;
            case OPT_QUEUE_SIZE:
                if (!parse_long("queue-size", optarg, n)) return 1;
                if (n < 1) {
                    std::cerr << "Error: --queue-size must be 1 or more" << std::endl;
                    return 1;
                }
                config.queue_size = static_cast<size_t>(n);
                break;
            case OPT_HOTKEY: config.hotkey = optarg; break;
            case OPT_START_DELAY:
                if (!parse_double("start-delay", optarg, config.start_delay_s)) return 1;
                break;
            case OPT_TIMEOUT:
                if (!parse_double("timeout", optarg, config.timeout_s)) return 1;
                break;
            case OPT_TUNE: tune = true; break;
            case 'h':
                print_usage(argv[0]);
                return 0;
            default:
                print_usage(argv[0]);
                return 1;
        }
    }
    if (optind < argc) {
        std::cerr << "Error: unexpected argument '" << argv[optind] << "'" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    auto valid = config.validate();
    if (valid.is_err()) {
        std::cerr << "Error: " << valid.error().message << std::endl;
        return 1;
    }

    auto logger = std::make_shared<common::ConsoleLogger>(config.verbose);

    std::unique_ptr<interfaces::IPlatformFactory> factory;
#ifdef PLATFORM_LINUX
    factory = std::make_unique<platform::linux_platform::LinuxPlatformFactory>();
#else
    std::cerr << "[Main] No recording backend for this platform" << std::endl;
    return 1;
#endif
    factory->initialize();
    logger->info(std::string("[Main] Platform: ") + factory->platform_name());

    if (tune) {
        core::TunerSettings ts;
        ts.max_workers = config.workers;
        ts.max_fps = config.target_fps;
        ts.output_dir = config.output_root + "/temp/";
        ts.encode = config.screen_settings().encode;
        ts.print_results = config.print_results;
        core::RateTuner tuner(factory->create_screen_capture(), factory->create_frame_encoder(), ts, logger);
        auto res = tuner.run();
        factory->shutdown();
        if (res.is_err()) {
            logger->error("[Main] Tuning failed: " + res.error().message);
            return 1;
        }
        std::cout << core::RateTuner::format(res.unwrap()) << std::endl;
        return res.unwrap().recommendation ? 0 : 1;
    }

    std::vector<std::unique_ptr<core::Recorder>> recorders;
    if (config.record_screen) {
        recorders.push_back(std::make_unique<core::ScreenRecorder>(
            factory->create_screen_capture(), factory->create_frame_encoder(), config.screen_settings()));
    }
    if (config.record_keyboard) {
        recorders.push_back(std::make_unique<core::KeyboardRecorder>(
            factory->create_keyboard_device(), config.listener_join_timeout));
    }
    if (config.record_mouse) {
        recorders.push_back(std::make_unique<core::MouseRecorder>(
            factory->create_pointer_device(), config.listener_join_timeout));
    }
    if (config.record_gamepad) {
        recorders.push_back(std::make_unique<core::GamepadRecorder>(
            factory->create_gamepad_device(), config.listener_join_timeout));
    }
    // Always on: the stop hotkey has its own keyboard listener
    recorders.push_back(std::make_unique<core::HotkeyStopRecorder>(
        factory->create_keyboard_device(), config.parse_hotkey().unwrap(), config.listener_join_timeout));

    auto created = core::SessionManager::create(
        std::move(recorders), config.output_root, logger, config.print_results, config.verbose);
    if (created.is_err()) {
        logger->error("[Main] " + created.error().message);
        return 1;
    }
    std::unique_ptr<core::SessionManager> session = created.take();

    g_session = session.get();
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    logger->info("[Main] Recording into " + session->output_dir() + ". Press " + config.hotkey + " to stop.");
    auto result = session->run_until_stop(config.start_delay(), config.timeout());

    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);
    g_session = nullptr;
    factory->shutdown();

    if (result.is_err()) {
        if (result.error().code == common::ErrorCode::Cancelled) {
            logger->info("[Main] " + result.error().message);
            return 0;
        }
        logger->error("[Main] " + result.error().message);
        return 1;
    }
    print_report(result.unwrap(), *logger);
    return 0;
}
