#pragma once
#include <variant>
#include <string>
#include <stdexcept>
#include <utility>

namespace common {

    struct Ok {};

    enum class ErrorCode {
        Success = 0,
        Cancelled,          // Clean stop (Expected)
        DeviceNotFound,     // No display / keyboard / controller
        PermissionDenied,   // /dev/input not readable, X server refused
        CaptureError,       // Screen grab failed
        EncoderError,       // Image file could not be written
        StorageError,       // Output directory / log file problems
        Timeout,
        ProtocolViolation,  // Worker waited past its bound without a marker
        ConfigError,        // Invalid knob or no usable recorder
        Unknown
    };

    inline const char* to_string(ErrorCode code) {
        switch (code) {
            case ErrorCode::Success: return "Success";
            case ErrorCode::Cancelled: return "Cancelled";
            case ErrorCode::DeviceNotFound: return "DeviceNotFound";
            case ErrorCode::PermissionDenied: return "PermissionDenied";
            case ErrorCode::CaptureError: return "CaptureError";
            case ErrorCode::EncoderError: return "EncoderError";
            case ErrorCode::StorageError: return "StorageError";
            case ErrorCode::Timeout: return "Timeout";
            case ErrorCode::ProtocolViolation: return "ProtocolViolation";
            case ErrorCode::ConfigError: return "ConfigError";
            case ErrorCode::Unknown: return "Unknown";
        }
        return "Unknown";
    }

    struct AppError {
        ErrorCode code;
        std::string message;
        std::string location; // __FILE__:__LINE__
    };

    template <typename T = Ok>
    class Result {
        std::variant<T, AppError> value;

    public:
        // Constructors
        Result(T v) : value(std::move(v)) {}
        Result(AppError e) : value(std::move(e)) {}

        // Static Builders
        static Result<T> ok(T v) { return Result(std::move(v)); }

        static Result<T> err(ErrorCode code, const std::string& msg, const std::string& loc = "") {
            return Result(AppError{code, msg, loc});
        }

        // Re-wrap an error coming from a Result of another type
        static Result<T> err(const AppError& e) { return Result(e); }

        // Checkers
        bool is_ok() const { return std::holds_alternative<T>(value); }
        bool is_err() const { return std::holds_alternative<AppError>(value); }

        // Unwrappers
        const T& unwrap() const {
            if (is_err()) {
                const auto& e = std::get<AppError>(value);
                throw std::runtime_error("Result::unwrap failed: " + e.message);
            }
            return std::get<T>(value);
        }

        // Move the value out (for large payloads such as pixel buffers)
        T take() {
            if (is_err()) {
                const auto& e = std::get<AppError>(value);
                throw std::runtime_error("Result::take failed: " + e.message);
            }
            return std::move(std::get<T>(value));
        }

        const AppError& error() const {
            if (is_ok()) {
                throw std::logic_error("Result::error called on success value");
            }
            return std::get<AppError>(value);
        }

        // For void-like results (Result<Ok>)
        static Result<Ok> success() { return Result<Ok>(Ok{}); }
    };

    using EmptyResult = Result<Ok>;

} // namespace common
