#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "common/Result.hpp"
#include "core/Recorder.hpp"
#include "interfaces/IInputDevice.hpp"

namespace core {

    // Maps a device key name ("ctrl_l", "shift_r", "delete", "a") to the
    // name used in hotkey strings ("ctrl", "shift", "delete", "a").
    std::string canonical_key_name(const std::string& device_key);

    /**
     * @brief Key combination such as "<ctrl>+<shift>+<delete>".
     *
     * Tokens are joined by '+'. A token is either a named key in angle
     * brackets or a single character.
     */
    class HotkeySpec {
    public:
        static common::Result<HotkeySpec> parse(const std::string& text);

        // True when every key of the combination is in 'held' (canonical names)
        bool satisfied_by(const std::set<std::string>& held) const;

        const std::vector<std::string>& keys() const { return keys_; }
        const std::string& text() const { return text_; }

    private:
        std::string text_;
        std::vector<std::string> keys_;
    };

    // Out-of-band stop trigger: should_stop() turns true once the hotkey is
    // held down. Writes nothing to the session directory.
    class HotkeyStopRecorder : public Recorder {
    public:
        HotkeyStopRecorder(
            std::unique_ptr<interfaces::IInputDevice> keyboard,
            HotkeySpec hotkey,
            std::chrono::milliseconds listener_join_timeout = std::chrono::seconds(10)
        );
        ~HotkeyStopRecorder() override;

        bool triggered() const { return state_->triggered.load(); }

    protected:
        common::EmptyResult do_check_availability() override;
        common::EmptyResult do_start() override;
        bool do_should_stop() override;
        void do_stop() override;
        RecorderReport do_join() override;

    private:
        struct State {
            HotkeySpec hotkey;
            std::mutex mutex;
            std::set<std::string> held; // raw device names
            std::atomic<bool> triggered{false};

            void on_event(const interfaces::InputEvent& e);
        };

        std::unique_ptr<interfaces::IInputDevice> keyboard_;
        std::chrono::milliseconds listener_join_timeout_;
        std::shared_ptr<State> state_;
    };

} // namespace core
