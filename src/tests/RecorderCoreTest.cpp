// ============================================================================
// Recorder Core Test Program
// ============================================================================
// Exercises the recording pipeline and the session lifecycle against mock
// capture, encoder and input devices:
// - BoundedChannel (capacity, marker slot, abandon, cancellation)
// - FrameProducer / FrameSink (fan-out, markers, naming, failures)
// - BackpressureGuard, TelemetryAggregator
// - ScreenRecorder, input recorders, HotkeyStopRecorder
// - SessionManager (availability, timeout, stalled sink), RecordingConfig
// - RateTuner
//
// Run with: ./RecorderCoreTest
// Output: Console log with PASS/FAIL for each test
// ============================================================================

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "TestHarness.hpp"

#include "common/Cancellation.hpp"
#include "common/FrameTypes.hpp"
#include "core/BackpressureGuard.hpp"
#include "core/BoundedChannel.hpp"
#include "core/EventLog.hpp"
#include "core/FrameProducer.hpp"
#include "core/FrameSink.hpp"
#include "core/HotkeyStopRecorder.hpp"
#include "core/InputRecorders.hpp"
#include "core/RateTuner.hpp"
#include "core/RecordingConfig.hpp"
#include "core/ScreenRecorder.hpp"
#include "core/SessionManager.hpp"
#include "core/TelemetryAggregator.hpp"

#include "testing/CapturingLogger.hpp"
#include "testing/MockFrameEncoder.hpp"
#include "testing/MockInputDevice.hpp"
#include "testing/MockScreenCapture.hpp"

using namespace std::chrono_literals;
using test_harness::log_test;
using test_harness::section;
using test_harness::TempDir;
using Clock = std::chrono::steady_clock;

namespace fs = std::filesystem;

// ============================================================================
// Helpers
// ============================================================================

static std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static bool wait_until(const std::function<bool()>& pred, std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    while (Clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

static common::FrameItem make_frame(double ts = 0.0) {
    std::vector<uint8_t> px(4 * 2 * 3, 0x7F);
    return common::FrameItem(std::make_unique<const common::Frame>(ts, common::Region{0, 0, 4, 2}, std::move(px)));
}

static interfaces::InputEvent key_event(interfaces::InputEventType type, const std::string& key, double ts) {
    interfaces::InputEvent e;
    e.timestamp = ts;
    e.type = type;
    e.key = key;
    return e;
}

static core::RecorderContext context_for(const std::string& dir, std::shared_ptr<common::ILogger> logger) {
    core::RecorderContext ctx;
    ctx.output_dir = dir;
    ctx.logger = std::move(logger);
    ctx.print_results = false;
    return ctx;
}

// Start, wait for the recorder to ask for a stop (bounded), stop, join
static core::RecorderReport run_recorder(core::Recorder& recorder, std::chrono::milliseconds limit) {
    wait_until([&]() { return recorder.should_stop(); }, limit);
    recorder.stop();
    return recorder.join();
}

// ============================================================================
// Test: BoundedChannel
// ============================================================================

void test_bounded_channel() {
    section("BoundedChannel");
    common::CancellationSource never;

    // Capacity and full()
    {
        core::FrameChannel ch(2);
        bool ok = ch.push(make_frame(), never.get_token()) == core::FrameChannel::PushStatus::Pushed;
        ok &= !ch.full();
        ok &= ch.push(make_frame(), never.get_token()) == core::FrameChannel::PushStatus::Pushed;
        ok &= ch.full() && ch.size() == 2 && ch.capacity() == 2;
        log_test("BoundedChannel::full at capacity", ok);
    }

    // The marker never blocks, even on a full channel, and is the last item
    {
        core::FrameChannel ch(1);
        ch.push(make_frame(), never.get_token());
        auto start = Clock::now();
        auto st = ch.push_final(common::FrameItem(common::TerminationMarker{}));
        double ms = test_harness::elapsed_ms(start);
        bool ok = st == core::FrameChannel::PushStatus::Pushed && ch.closed() && ms < 50.0;
        ok &= ch.push(make_frame(), never.get_token()) == core::FrameChannel::PushStatus::Closed;

        auto first = ch.pop_for(10ms);
        auto second = ch.pop_for(10ms);
        auto third = ch.pop_for(10ms);
        ok &= first && std::holds_alternative<common::FramePtr>(*first);
        ok &= second && std::holds_alternative<common::TerminationMarker>(*second);
        ok &= !third;
        log_test("BoundedChannel::push_final uses reserved slot", ok, "", ms);
    }

    // A push blocked on a full channel gives up when the stop flag is set
    {
        core::FrameChannel ch(1);
        common::CancellationSource stop;
        ch.push(make_frame(), stop.get_token());
        std::thread canceller([&stop]() {
            std::this_thread::sleep_for(50ms);
            stop.cancel();
        });
        auto start = Clock::now();
        auto st = ch.push(make_frame(), stop.get_token());
        double ms = test_harness::elapsed_ms(start);
        canceller.join();
        log_test("BoundedChannel::push cancelled while full",
                 st == core::FrameChannel::PushStatus::Cancelled && ch.size() == 1, "", ms);
    }

    // Abandon wakes a blocked producer and drops pending frames
    {
        core::FrameChannel ch(1);
        ch.push(make_frame(), never.get_token());
        std::atomic<int> status{-1};
        std::thread producer([&]() {
            status = static_cast<int>(ch.push(make_frame(), never.get_token()));
        });
        std::this_thread::sleep_for(30ms);
        ch.abandon();
        producer.join();
        bool ok = status == static_cast<int>(core::FrameChannel::PushStatus::Abandoned);
        ok &= ch.size() == 0 && ch.abandoned();
        ok &= ch.push_final(common::FrameItem(common::TerminationMarker{})) ==
              core::FrameChannel::PushStatus::Abandoned;
        log_test("BoundedChannel::abandon releases producer", ok);
    }

    // Idle pop times out
    {
        core::FrameChannel ch(4);
        auto start = Clock::now();
        auto item = ch.pop_for(50ms);
        double ms = test_harness::elapsed_ms(start);
        log_test("BoundedChannel::pop_for timeout", !item && ms >= 45.0, "", ms);
    }
}

// ============================================================================
// Test: artifact naming
// ============================================================================

void test_artifact_index() {
    section("artifact_index");

    bool injective = true;
    bool contiguous = true;
    for (uint32_t n = 1; n <= 6; ++n) {
        std::set<uint64_t> seen;
        const uint64_t per_sink = 50;
        for (uint32_t id = 0; id < n; ++id) {
            for (uint64_t seq = 0; seq < per_sink; ++seq) {
                if (!seen.insert(core::artifact_index(seq, n, id)).second) injective = false;
            }
        }
        // Balanced round-robin covers exactly 0 .. per_sink*n - 1
        contiguous &= seen.size() == per_sink * n && *seen.rbegin() == per_sink * n - 1;
    }
    log_test("artifact_index injective over (sequence, worker)", injective);
    log_test("artifact_index recovers capture order", contiguous);

    bool examples = core::artifact_index(0, 2, 0) == 0 && core::artifact_index(9, 2, 0) == 18 &&
                    core::artifact_index(0, 2, 1) == 1 && core::artifact_index(9, 2, 1) == 19;
    log_test("artifact_index(seq*N + id) examples", examples);
}

// ============================================================================
// Test: FrameProducer + FrameSink
// ============================================================================

struct PipelineRun {
    common::GrabRecord grab;
    std::vector<common::SaveRecord> saves;
    std::vector<std::vector<uint64_t>> persisted_indices; // per sink
    std::vector<std::shared_ptr<core::FrameChannel>> channels;
};

// Runs one producer against n sinks that "persist" by recording the artifact index
static PipelineRun run_pipeline(std::shared_ptr<testing::MockScreenCapture> capture, uint32_t n,
                                double fps, uint64_t limit, common::CancellationSource& stop,
                                std::shared_ptr<common::ILogger> logger,
                                std::function<common::EmptyResult(uint32_t, uint64_t)> persist_hook = nullptr) {
    PipelineRun run;
    run.saves.resize(n);
    run.persisted_indices.resize(n);
    for (uint32_t i = 0; i < n; ++i) run.channels.push_back(std::make_shared<core::FrameChannel>(100));

    std::vector<std::thread> sinks;
    for (uint32_t id = 0; id < n; ++id) {
        sinks.emplace_back([&, id]() {
            core::PersistFn fn = [&, id](const common::Frame&, uint64_t seq) {
                if (persist_hook) {
                    auto res = persist_hook(id, seq);
                    if (res.is_err()) return res;
                }
                run.persisted_indices[id].push_back(core::artifact_index(seq, n, id));
                return common::EmptyResult::success();
            };
            core::FrameSink sink(id, run.channels[id], fn, 2000ms, logger);
            run.saves[id] = sink.run();
        });
    }

    core::ProducerSettings ps;
    ps.target_fps = fps;
    ps.frame_limit = limit;
    ps.region = common::Region{0, 0, 8, 6};
    core::FrameProducer producer(capture, run.channels, ps, stop.get_token(), logger);
    run.grab = producer.run();

    for (auto& t : sinks) t.join();
    return run;
}

void test_producer_and_sinks() {
    section("FrameProducer / FrameSink");
    auto logger = std::make_shared<testing::CapturingLogger>();

    // One marker per sink, nothing lost, for several fan-out widths
    for (uint32_t n = 1; n <= 4; ++n) {
        auto capture = std::make_shared<testing::MockScreenCapture>(8, 6);
        common::CancellationSource stop;
        auto start = Clock::now();
        PipelineRun run = run_pipeline(capture, n, 200.0, 25, stop, logger);
        double ms = test_harness::elapsed_ms(start);

        bool ok = run.grab.frames_produced == 25 && run.grab.timestamps.size() == 25;
        uint64_t persisted = 0;
        for (uint32_t id = 0; id < n; ++id) {
            ok &= !run.saves[id].error.has_value();       // stopped on its marker
            ok &= run.saves[id].worker_id == id;
            ok &= run.channels[id]->closed();             // marker delivered
            ok &= run.channels[id]->size() == 0;          // nothing after the marker
            persisted += run.saves[id].frames_persisted;
        }
        ok &= persisted == run.grab.frames_produced;

        std::set<uint64_t> all;
        for (const auto& v : run.persisted_indices) all.insert(v.begin(), v.end());
        ok &= all.size() == 25 && *all.rbegin() == 24;

        log_test("Pipeline N=" + std::to_string(n) + ": markers, no loss, unique names", ok,
                 std::to_string(persisted) + "/" + std::to_string(run.grab.frames_produced) + " frames", ms);
    }

    // Timestamps increase and the stable ceiling respects the target
    {
        auto capture = std::make_shared<testing::MockScreenCapture>(8, 6);
        common::CancellationSource stop;
        PipelineRun run = run_pipeline(capture, 2, 100.0, 10, stop, logger);
        bool ordered = std::is_sorted(run.grab.timestamps.begin(), run.grab.timestamps.end());
        bool ceiling = run.grab.max_stable_fps > 0.0 && run.grab.max_stable_fps <= 100.0;
        std::ostringstream d;
        d << "max_stable_fps=" << run.grab.max_stable_fps << " fps=" << run.grab.fps;
        log_test("FrameProducer timestamps ordered, max_stable_fps <= target", ordered && ceiling, d.str());
    }

    // Stop flag set before the first capture: no frame, markers still sent
    {
        auto capture = std::make_shared<testing::MockScreenCapture>(8, 6);
        common::CancellationSource stop;
        stop.cancel();
        PipelineRun run = run_pipeline(capture, 3, 10.0, 100, stop, logger);
        bool ok = run.grab.frames_produced == 0 && run.grab.max_stable_fps == 0.0;
        for (const auto& s : run.saves) ok &= s.frames_persisted == 0 && !s.error;
        for (const auto& ch : run.channels) ok &= ch->closed();
        log_test("FrameProducer stop before start sends markers", ok);
    }

    // Capture failure ends the producer only, with markers
    {
        auto capture = std::make_shared<testing::MockScreenCapture>(8, 6);
        capture->fail_after = 5;
        common::CancellationSource stop;
        PipelineRun run = run_pipeline(capture, 2, 200.0, 100, stop, logger);
        bool ok = run.grab.frames_produced == 5;
        ok &= run.saves[0].frames_persisted + run.saves[1].frames_persisted == 5;
        ok &= !run.saves[0].error && !run.saves[1].error;
        ok &= logger->contains("ERROR", "Capture failed");
        log_test("FrameProducer capture failure is fatal to producer only", ok);
    }

    // Persist failure stops that sink; the producer notices and stops too
    {
        auto capture = std::make_shared<testing::MockScreenCapture>(8, 6);
        common::CancellationSource stop;
        auto hook = [](uint32_t id, uint64_t seq) {
            if (id == 1 && seq == 2) {
                return common::EmptyResult::err(common::ErrorCode::StorageError, "disk full");
            }
            return common::EmptyResult::success();
        };
        auto start = Clock::now();
        PipelineRun run = run_pipeline(capture, 2, 200.0, 1000, stop, logger, hook);
        double ms = test_harness::elapsed_ms(start);
        bool ok = run.saves[1].error && *run.saves[1].error == "disk full";
        ok &= run.saves[1].frames_persisted == 2;
        ok &= run.channels[1]->abandoned();
        ok &= !run.saves[0].error;
        ok &= run.grab.frames_produced < 1000;
        ok &= logger->contains("WARNING", "no longer accepts frames");
        log_test("FrameSink persist failure isolates the sink", ok,
                 "producer stopped after " + std::to_string(run.grab.frames_produced) + " frames", ms);
    }

    // Idle timeout: no frame and no marker
    {
        auto ch = std::make_shared<core::FrameChannel>(4);
        core::PersistFn fn = [](const common::Frame&, uint64_t) { return common::EmptyResult::success(); };
        core::FrameSink sink(7, ch, fn, 100ms, logger);
        auto start = Clock::now();
        auto rec = sink.run();
        double ms = test_harness::elapsed_ms(start);
        bool ok = rec.error.has_value() && rec.frames_persisted == 0 && ch->abandoned();
        ok &= logger->contains("WARNING", "Saving worker 7 queue is empty. Did the producer stop?");
        log_test("FrameSink idle timeout is a protocol violation", ok, "", ms);
    }
}

// ============================================================================
// Test: BackpressureGuard
// ============================================================================

void test_backpressure() {
    section("BackpressureGuard");
    common::CancellationSource never;

    // Pure policy: full open channel reported, closed one ignored
    {
        auto a = std::make_shared<core::FrameChannel>(2);
        auto b = std::make_shared<core::FrameChannel>(2);
        std::vector<std::shared_ptr<core::FrameChannel>> chans{a, b};
        bool ok = !core::BackpressureGuard::evaluate(chans);

        b->push(make_frame(), never.get_token());
        b->push(make_frame(), never.get_token());
        auto report = core::BackpressureGuard::evaluate(chans);
        ok &= report && report->worker_id == 1 && report->depth == 2 && report->capacity == 2;

        b->push_final(common::FrameItem(common::TerminationMarker{}));
        ok &= !core::BackpressureGuard::evaluate(chans);

        std::string msg = core::BackpressureGuard::describe(core::BackpressureReport{0, 5, 5});
        ok &= msg.find("allowed_n_images_delayed=5") != std::string::npos;
        log_test("BackpressureGuard::evaluate", ok);
    }

    // Zero persistence throughput: producer blocks at k frames, guard fires once
    {
        TempDir dir;
        auto logger = std::make_shared<testing::CapturingLogger>();
        auto capture = std::make_shared<testing::MockScreenCapture>(8, 6);
        auto encoder = std::make_shared<testing::MockFrameEncoder>();
        encoder->stall();

        core::ScreenRecorderSettings s;
        s.workers = 1;
        s.target_fps = 200.0;
        s.max_frames = 1000;
        s.queue_size = 3;
        core::ScreenRecorder recorder(capture, encoder, s);
        recorder.set_context(context_for(dir.path(), logger));

        auto start = Clock::now();
        bool started = recorder.start().is_ok();
        bool fired = wait_until([&]() { return recorder.should_stop(); }, 3000ms);
        // Polled again: still true, warned only once
        fired &= recorder.should_stop() && recorder.should_stop();
        std::this_thread::sleep_for(100ms);
        // 1 frame inside persist + k queued, the producer is blocked on the next
        const uint64_t captured = capture->captures();

        recorder.stop();
        encoder->release();
        auto report = recorder.join();
        double ms = test_harness::elapsed_ms(start);

        bool ok = started && fired;
        ok &= logger->count("WARNING", "Out of memory") == 1;
        ok &= captured <= 5;
        ok &= report.screen && report.screen->complete();
        ok &= report.screen && report.screen->grab &&
              report.screen->frames_persisted() == report.screen->grab->frames_produced;
        log_test("ScreenRecorder backpressure stop drains enqueued frames", ok,
                 "captured=" + std::to_string(captured), ms);
    }
}

// ============================================================================
// Test: TelemetryAggregator
// ============================================================================

void test_telemetry() {
    section("TelemetryAggregator");

    {
        std::vector<common::TelemetryRecord> recs;
        recs.emplace_back(common::GrabRecord{});
        recs.emplace_back(common::GrabRecord{});
        auto res = core::TelemetryAggregator::merge(recs, 1);
        log_test("merge rejects two grab records",
                 res.is_err() && res.error().code == common::ErrorCode::ProtocolViolation);
    }

    {
        common::SaveRecord s0;
        s0.worker_id = 0;
        s0.frames_persisted = 4;
        std::vector<common::TelemetryRecord> recs{common::GrabRecord{}, s0};
        auto res = core::TelemetryAggregator::merge(recs, 2);
        bool ok = res.is_ok() && !res.unwrap().complete() && res.unwrap().received_records() == 2;
        std::string text = ok ? core::TelemetryAggregator::format(res.unwrap()) : "";
        ok &= text.find("missing") != std::string::npos;
        log_test("merge keeps missing records explicit", ok);
    }

    {
        testing::CapturingLogger logger;
        core::TelemetryAggregator agg(2);
        common::GrabRecord g;
        g.frames_produced = 3;
        common::SaveRecord s;
        s.worker_id = 0;
        bool ok = agg.report_grab(g).is_ok() && agg.report_save(s).is_ok();
        ok &= agg.report_grab(g).is_err();
        common::SaveRecord bad;
        bad.worker_id = 5;
        ok &= agg.report_save(bad).is_err();

        auto start = Clock::now();
        auto t = agg.collect(100ms, logger);
        double ms = test_harness::elapsed_ms(start);
        ok &= t.grab && t.saves[0] && !t.saves[1] && t.received_records() == 2;
        ok &= logger.contains("WARNING", "Telemetry waiting out after receiving 2/3 records");
        ok &= ms < 1000.0;
        log_test("collect bounded wait with partial records", ok, "", ms);
    }
}

// ============================================================================
// Test: ScreenRecorder scenario
// ============================================================================

void test_screen_recorder_scenario() {
    section("ScreenRecorder");
    TempDir dir;
    auto logger = std::make_shared<testing::CapturingLogger>();
    auto capture = std::make_shared<testing::MockScreenCapture>(16, 8);
    auto encoder = std::make_shared<testing::MockFrameEncoder>();
    encoder->write_files = true;

    core::ScreenRecorderSettings s;
    s.workers = 2;
    s.target_fps = 10.0;
    s.max_frames = 20;
    s.queue_size = 100;
    core::ScreenRecorder recorder(capture, encoder, s);
    recorder.set_context(context_for(dir.path(), logger));

    auto start = Clock::now();
    bool ok = recorder.check_availability().is_ok() && recorder.start().is_ok();
    auto report = run_recorder(recorder, 10000ms);
    double ms = test_harness::elapsed_ms(start);

    ok &= report.screen.has_value();
    if (ok) {
        const auto& t = *report.screen;
        ok &= t.grab && t.grab->frames_produced == 20;
        ok &= t.received_records() == 3 && t.complete();
        ok &= t.saves[0] && t.saves[0]->frames_persisted == 10;
        ok &= t.saves[1] && t.saves[1]->frames_persisted == 10;
    }

    std::set<std::string> expected;
    for (int i = 0; i < 20; ++i) expected.insert("file_" + std::to_string(i) + ".png");
    std::set<std::string> on_disk;
    for (const auto& e : fs::directory_iterator(dir.path())) {
        const std::string name = e.path().filename().string();
        if (name.rfind("file_", 0) == 0) on_disk.insert(name);
    }
    ok &= on_disk == expected;

    // 20 lines, %.6f, no trailing newline
    const std::string ts = read_file((fs::path(dir.path()) / "timestamps.txt").string());
    ok &= !ts.empty() && ts.back() != '\n' && std::count(ts.begin(), ts.end(), '\n') == 19;
    ok &= ts.find('.') != std::string::npos && ts.find('.') + 7 == ts.find('\n');

    log_test("ScreenRecorder 20 frames at 10 fps over 2 workers", ok,
             std::to_string(on_disk.size()) + " files", ms);

    // Sink 0 handles the even indices, sink 1 the odd ones, each in order
    {
        std::vector<std::string> paths = encoder->paths();
        std::vector<int> even, odd;
        for (const auto& p : paths) {
            const std::string stem = fs::path(p).stem().string();
            const int idx = std::stoi(stem.substr(5));
            (idx % 2 == 0 ? even : odd).push_back(idx);
        }
        bool parity = paths.size() == 20 && even.size() == 10 && odd.size() == 10;
        parity &= std::is_sorted(even.begin(), even.end()) && std::is_sorted(odd.begin(), odd.end());
        log_test("ScreenRecorder naming follows capture order per sink", parity);
    }
}

// ============================================================================
// Test: Recorder lifecycle
// ============================================================================

void test_lifecycle() {
    section("Recorder lifecycle");
    auto logger = std::make_shared<testing::CapturingLogger>();
    TempDir dir;

    auto control = std::make_shared<testing::MockInputDevice::Control>();
    core::KeyboardRecorder rec(std::make_unique<testing::MockInputDevice>(control));
    rec.set_context(context_for(dir.path(), logger));

    bool threw = false;
    try {
        rec.join();
    } catch (const std::logic_error&) {
        threw = true;
    }
    log_test("join() before stop() throws", threw);

    bool ok = rec.start().is_ok() && rec.state() == core::RecorderState::Started;
    threw = false;
    try {
        rec.start();
    } catch (const std::logic_error&) {
        threw = true;
    }
    log_test("start() twice throws", ok && threw);

    rec.stop();
    auto after_first = rec.state();
    rec.stop();
    ok = after_first == core::RecorderState::Stopped && rec.state() == core::RecorderState::Stopped;
    auto report = rec.join();
    ok &= report.complete && rec.state() == core::RecorderState::Joined;
    log_test("stop() twice is the same as once", ok);

    threw = false;
    try {
        rec.join();
    } catch (const std::logic_error&) {
        threw = true;
    }
    log_test("join() twice throws", threw);
}

// ============================================================================
// Test: input recorders
// ============================================================================

void test_input_recorders() {
    section("Input recorders");
    auto logger = std::make_shared<testing::CapturingLogger>();

    // Keyboard: key events only, written in arrival order
    {
        TempDir dir;
        auto control = std::make_shared<testing::MockInputDevice::Control>();
        core::KeyboardRecorder rec(std::make_unique<testing::MockInputDevice>(control));
        rec.set_context(context_for(dir.path(), logger));
        bool ok = rec.start().is_ok();
        control->emit(key_event(interfaces::InputEventType::Pressed, "a", 1.5));
        control->emit(key_event(interfaces::InputEventType::Released, "a", 1.75));
        interfaces::InputEvent move;
        move.type = interfaces::InputEventType::Move;
        control->emit(move);
        rec.stop();
        auto report = rec.join();

        const std::string json = read_file((fs::path(dir.path()) / "keyboard_logs.json").string());
        const std::string expected =
            "[{\"timestamp\": 1.500000, \"type\": \"pressed\", \"key\": \"a\"}, "
            "{\"timestamp\": 1.750000, \"type\": \"release\", \"key\": \"a\"}]";
        ok &= json == expected && report.events_logged == 2;
        log_test("KeyboardRecorder writes keyboard_logs.json", ok, json);
    }

    // Mouse: move, click, scroll
    {
        TempDir dir;
        auto control = std::make_shared<testing::MockInputDevice::Control>();
        core::MouseRecorder rec(std::make_unique<testing::MockInputDevice>(control));
        rec.set_context(context_for(dir.path(), logger));
        bool ok = rec.start().is_ok();

        interfaces::InputEvent e;
        e.timestamp = 2.0;
        e.type = interfaces::InputEventType::Move;
        e.x = 10;
        e.y = 20;
        control->emit(e);
        e.type = interfaces::InputEventType::Click;
        e.button = "left";
        e.is_pressed = true;
        control->emit(e);
        e.type = interfaces::InputEventType::Scroll;
        e.dx = 0;
        e.dy = -1;
        control->emit(e);
        control->emit(key_event(interfaces::InputEventType::Pressed, "a", 3.0));
        rec.stop();
        auto report = rec.join();

        const std::string json = read_file((fs::path(dir.path()) / "mouse_logs.json").string());
        ok &= report.events_logged == 3;
        ok &= json.find("{\"timestamp\": 2.000000, \"type\": \"move\", \"x\": 10, \"y\": 20}") != std::string::npos;
        ok &= json.find("\"type\": \"click\", \"x\": 10, \"y\": 20, \"button\": \"left\", \"is_pressed\": true}") != std::string::npos;
        ok &= json.find("\"type\": \"scroll\", \"x\": 10, \"y\": 20, \"dx\": 0, \"dy\": -1}") != std::string::npos;
        log_test("MouseRecorder writes mouse_logs.json", ok);
    }

    // Gamepad: buttons and axes
    {
        TempDir dir;
        auto control = std::make_shared<testing::MockInputDevice::Control>();
        core::GamepadRecorder rec(std::make_unique<testing::MockInputDevice>(control));
        rec.set_context(context_for(dir.path(), logger));
        bool ok = rec.start().is_ok();
        control->emit(key_event(interfaces::InputEventType::Pressed, "BTN_SOUTH", 4.0));
        control->emit(key_event(interfaces::InputEventType::Released, "BTN_SOUTH", 4.2));
        interfaces::InputEvent axis;
        axis.timestamp = 4.5;
        axis.type = interfaces::InputEventType::Absolute;
        axis.axis = "ABS_X";
        axis.value = -32768;
        control->emit(axis);
        rec.stop();
        rec.join();

        const std::string json = read_file((fs::path(dir.path()) / "gamepad_logs.json").string());
        ok &= json.find("\"type\": \"pressed\", \"key\": \"BTN_SOUTH\"") != std::string::npos;
        ok &= json.find("{\"timestamp\": 4.200000, \"type\": \"released\", \"key\": \"BTN_SOUTH\"}") != std::string::npos;
        ok &= json.find("{\"timestamp\": 4.500000, \"type\": \"absolute\", \"axis\": \"ABS_X\", \"value\": -32768}") != std::string::npos;
        log_test("GamepadRecorder writes gamepad_logs.json", ok);
    }

    // JSON escaping of key names
    {
        auto e = key_event(interfaces::InputEventType::Pressed, "\"", 0.0);
        bool ok = core::keyboard_event_json(e).find("\"key\": \"\\\"\"") != std::string::npos;
        ok &= core::escape_json("a\\b\n") == "a\\\\b\\n";
        log_test("escape_json", ok);
    }

    // A listener that dies on its own asks for a stop
    {
        TempDir dir;
        auto control = std::make_shared<testing::MockInputDevice::Control>();
        core::MouseRecorder rec(std::make_unique<testing::MockInputDevice>(control));
        rec.set_context(context_for(dir.path(), logger));
        rec.start();
        bool before = rec.should_stop();
        control->die();
        bool after = rec.should_stop();
        rec.stop();
        rec.join();
        log_test("Input recorder should_stop when listener dies", !before && after);
    }

    // A listener that ignores the stop request: bounded join with a warning
    {
        TempDir dir;
        auto control = std::make_shared<testing::MockInputDevice::Control>();
        control->ignore_stop = true;
        core::KeyboardRecorder rec(std::make_unique<testing::MockInputDevice>(control), 100ms);
        rec.set_context(context_for(dir.path(), logger));
        rec.start();
        rec.stop();
        auto start = Clock::now();
        auto report = rec.join();
        double ms = test_harness::elapsed_ms(start);
        bool ok = !report.complete && ms < 1000.0;
        ok &= logger->contains("WARNING", "Keyboard listener did not stop.");
        ok &= fs::exists(fs::path(dir.path()) / "keyboard_logs.json");
        control->die();
        log_test("Input recorder join bounded when listener hangs", ok, "", ms);
    }
}

// ============================================================================
// Test: hotkey
// ============================================================================

void test_hotkey() {
    section("Hotkey");

    {
        auto hotkey = core::HotkeySpec::parse("<ctrl>+<shift>+<delete>");
        bool ok = hotkey.is_ok() && hotkey.unwrap().keys() == std::vector<std::string>{"ctrl", "shift", "delete"};
        ok &= core::HotkeySpec::parse("<ctrl>+a").is_ok();
        ok &= core::HotkeySpec::parse("<super>+<F5>").is_ok();
        log_test("HotkeySpec::parse valid", ok);
    }
    {
        bool ok = core::HotkeySpec::parse("").is_err();
        ok &= core::HotkeySpec::parse("<ctrl>+").is_err();
        ok &= core::HotkeySpec::parse("<ctrl>++a").is_err();
        ok &= core::HotkeySpec::parse("<nope>").is_err();
        ok &= core::HotkeySpec::parse("ctrl+a").is_err();
        ok &= core::HotkeySpec::parse("a+a").is_err();
        log_test("HotkeySpec::parse invalid", ok);
    }
    {
        bool ok = core::canonical_key_name("ctrl_l") == "ctrl";
        ok &= core::canonical_key_name("ctrl_r") == "ctrl";
        ok &= core::canonical_key_name("shift") == "shift";
        ok &= core::canonical_key_name("shift_r") == "shift";
        ok &= core::canonical_key_name("alt_gr") == "alt";
        ok &= core::canonical_key_name("cmd_r") == "cmd";
        ok &= core::canonical_key_name("delete") == "delete";
        ok &= core::canonical_key_name("page_up") == "page_up";
        ok &= core::canonical_key_name("caps_lock") == "caps_lock";
        ok &= core::canonical_key_name("a") == "a";
        ok &= core::canonical_key_name("A") == "a";
        log_test("canonical_key_name", ok);
    }

    {
        TempDir dir;
        auto logger = std::make_shared<testing::CapturingLogger>();
        auto control = std::make_shared<testing::MockInputDevice::Control>();
        core::HotkeyStopRecorder rec(std::make_unique<testing::MockInputDevice>(control),
                                     core::HotkeySpec::parse("<ctrl>+<shift>+<delete>").unwrap());
        rec.set_context(context_for(dir.path(), logger));
        bool ok = rec.start().is_ok();

        using T = interfaces::InputEventType;
        control->emit(key_event(T::Pressed, "ctrl_l", 1.0));
        control->emit(key_event(T::Pressed, "delete", 1.1));
        ok &= !rec.should_stop();
        control->emit(key_event(T::Released, "delete", 1.2));
        control->emit(key_event(T::Pressed, "shift_r", 1.3));
        ok &= !rec.should_stop();
        control->emit(key_event(T::Pressed, "delete", 1.4));
        ok &= rec.should_stop() && rec.triggered();

        rec.stop();
        auto report = rec.join();
        ok &= report.complete && report.artifacts.empty();
        log_test("HotkeyStopRecorder fires when all keys are held", ok);
    }
}

// ============================================================================
// Test: SessionManager
// ============================================================================

void test_session() {
    section("SessionManager");

    // Session directory never reused
    {
        TempDir root;
        auto a = core::create_session_directory(root.path());
        auto b = core::create_session_directory(root.path());
        bool ok = a.is_ok() && b.is_ok() && a.unwrap() != b.unwrap();
        ok &= ok && fs::is_directory(a.unwrap()) && fs::is_directory(b.unwrap());
        log_test("create_session_directory unique names", ok,
                 ok ? fs::path(b.unwrap()).filename().string() : "");
    }

    // Unavailable recorder: never started, absent from the report
    {
        TempDir root;
        auto logger = std::make_shared<testing::CapturingLogger>();
        auto capture = std::make_shared<testing::MockScreenCapture>();
        capture->available = false;
        auto encoder = std::make_shared<testing::MockFrameEncoder>();
        auto gamepad = std::make_shared<testing::MockInputDevice::Control>();
        gamepad->available = false;
        auto keyboard = std::make_shared<testing::MockInputDevice::Control>();

        std::vector<std::unique_ptr<core::Recorder>> recs;
        recs.push_back(std::make_unique<core::ScreenRecorder>(capture, encoder, core::ScreenRecorderSettings{}));
        recs.push_back(std::make_unique<core::GamepadRecorder>(std::make_unique<testing::MockInputDevice>(gamepad)));
        recs.push_back(std::make_unique<core::KeyboardRecorder>(std::make_unique<testing::MockInputDevice>(keyboard)));
        auto session = core::SessionManager::create(std::move(recs), root.path(), logger, false);
        bool ok = session.is_ok();
        if (ok) {
            auto& sm = *session.unwrap();
            ok &= sm.start().is_ok();
            ok &= sm.active_count() == 1 && sm.skipped().size() == 2;
            ok &= capture->captures() == 0 && gamepad->start_calls == 0 && keyboard->start_calls == 1;
            sm.stop();
            sm.stop();
            auto report = sm.join();
            ok &= report.recorders.size() == 1 && report.recorders[0].name == "Keyboard";
            ok &= !report.recorders[0].screen;
            ok &= report.skipped == std::vector<std::string>{"ScreenRecorder", "Gamepad"};
            ok &= logger->contains("WARNING", "Recorder ScreenRecorder is not available (DeviceNotFound): No screen found");
            ok &= logger->contains("WARNING", "Recorder Gamepad is not available (DeviceNotFound)");
        }
        log_test("Unavailable recorders are skipped", ok);
    }

    // Nothing usable is fatal
    {
        TempDir root;
        auto control = std::make_shared<testing::MockInputDevice::Control>();
        control->available = false;
        std::vector<std::unique_ptr<core::Recorder>> recs;
        recs.push_back(std::make_unique<core::MouseRecorder>(std::make_unique<testing::MockInputDevice>(control)));
        auto session = core::SessionManager::create(std::move(recs), root.path(),
                                                    std::make_shared<common::NullLogger>(), false);
        bool ok = session.is_ok();
        if (ok) {
            auto res = session.unwrap()->run_until_stop(0ms, 1000ms);
            ok &= res.is_err() && res.error().code == common::ErrorCode::ConfigError;
        }
        log_test("No available recorder -> ConfigError", ok);
    }

    // join() before stop()
    {
        TempDir root;
        auto control = std::make_shared<testing::MockInputDevice::Control>();
        std::vector<std::unique_ptr<core::Recorder>> recs;
        recs.push_back(std::make_unique<core::KeyboardRecorder>(std::make_unique<testing::MockInputDevice>(control)));
        auto session = core::SessionManager::create(std::move(recs), root.path(),
                                                    std::make_shared<common::NullLogger>(), false);
        bool threw = false;
        if (session.is_ok()) {
            auto& sm = *session.unwrap();
            sm.start();
            try {
                sm.join();
            } catch (const std::logic_error&) {
                threw = true;
            }
            sm.stop();
            sm.join();
        }
        log_test("SessionManager::join before stop throws", threw);
    }

    // Timeout with a stalled sink: bounded stop + join, partial telemetry
    {
        TempDir root;
        auto logger = std::make_shared<testing::CapturingLogger>();
        auto capture = std::make_shared<testing::MockScreenCapture>(8, 6);
        auto encoder = std::make_shared<testing::MockFrameEncoder>();
        encoder->stall();

        core::ScreenRecorderSettings s;
        s.workers = 2;
        s.target_fps = 20.0;
        s.max_frames = 100000;
        s.queue_size = 100;
        s.telemetry_timeout = 300ms;
        std::vector<std::unique_ptr<core::Recorder>> recs;
        recs.push_back(std::make_unique<core::ScreenRecorder>(capture, encoder, s));
        auto session = core::SessionManager::create(std::move(recs), root.path(), logger, false);

        bool ok = session.is_ok();
        double ms = 0;
        if (ok) {
            auto start = Clock::now();
            auto res = session.unwrap()->run_until_stop(0ms, 500ms);
            ms = test_harness::elapsed_ms(start);
            ok &= res.is_ok();
            if (res.is_ok()) {
                const auto& report = res.unwrap();
                ok &= report.stop_reason == "timeout";
                ok &= report.partial == std::vector<std::string>{"ScreenRecorder"};
                ok &= report.missing_telemetry_records == 2;   // both sinks stuck in persist
                ok &= report.recorders[0].screen && report.recorders[0].screen->grab.has_value();
            }
            ok &= ms >= 450.0 && ms < 2500.0;
            ok &= logger->contains("WARNING", "Telemetry waiting out");
        }
        encoder->release();
        // Let the detached sinks drain before the directory goes away
        std::this_thread::sleep_for(300ms);
        log_test("run_until_stop(0.5s) bounded with stalled sinks", ok, "", ms);
    }

    // Hotkey stops the whole session
    {
        TempDir root;
        auto logger = std::make_shared<testing::CapturingLogger>();
        auto hotkey_dev = std::make_shared<testing::MockInputDevice::Control>();
        auto keyboard = std::make_shared<testing::MockInputDevice::Control>();
        std::vector<std::unique_ptr<core::Recorder>> recs;
        recs.push_back(std::make_unique<core::HotkeyStopRecorder>(
            std::make_unique<testing::MockInputDevice>(hotkey_dev),
            core::HotkeySpec::parse("<ctrl>+q").unwrap()));
        recs.push_back(std::make_unique<core::KeyboardRecorder>(std::make_unique<testing::MockInputDevice>(keyboard)));
        auto session = core::SessionManager::create(std::move(recs), root.path(), logger, false);

        bool ok = session.is_ok();
        double ms = 0;
        if (ok) {
            std::thread typist([hotkey_dev]() {
                std::this_thread::sleep_for(300ms);
                hotkey_dev->emit(key_event(interfaces::InputEventType::Pressed, "ctrl_r", 1.0));
                hotkey_dev->emit(key_event(interfaces::InputEventType::Pressed, "q", 1.1));
            });
            auto start = Clock::now();
            auto res = session.unwrap()->run_until_stop(0ms, 10000ms);
            ms = test_harness::elapsed_ms(start);
            typist.join();
            ok &= res.is_ok() && res.unwrap().stop_reason == "HotkeyStop";
            ok &= res.is_ok() && res.unwrap().completed.size() == 2;
            ok &= ms < 3000.0;
        }
        log_test("HotkeyStopRecorder ends run_until_stop", ok, "", ms);
    }
}

// ============================================================================
// Test: RecordingConfig
// ============================================================================

void test_config() {
    section("RecordingConfig");

    core::RecordingConfig cfg;
    bool ok = cfg.validate().is_ok();
    ok &= cfg.workers == 2 && cfg.target_fps == 10.0 && cfg.png_compression == 9 &&
          cfg.max_frames == 200000 && cfg.queue_size == 100 && cfg.start_delay().count() == 2000;
    log_test("RecordingConfig defaults validate", ok);

    auto expect_error = [](core::RecordingConfig c, const std::string& field) {
        auto res = c.validate();
        return res.is_err() && res.error().code == common::ErrorCode::ConfigError &&
               res.error().message.find(field) != std::string::npos;
    };
    core::RecordingConfig c1; c1.workers = 0;
    core::RecordingConfig c2; c2.png_compression = 10;
    core::RecordingConfig c3; c3.hotkey = "<ctrl>+<bogus>";
    core::RecordingConfig c4; c4.record_screen = c4.record_keyboard = c4.record_mouse = c4.record_gamepad = false;
    core::RecordingConfig c5; c5.target_fps = 0.0;
    ok = expect_error(c1, "workers") && expect_error(c2, "compression") && expect_error(c3, "hotkey") &&
         expect_error(c4, "recorders") && expect_error(c5, "fps");
    log_test("RecordingConfig::validate names the offending field", ok);

    // Durations large enough to overflow the millisecond / steady_clock math
    core::RecordingConfig t1; t1.timeout_s = 1e10;
    core::RecordingConfig t2; t2.start_delay_s = 1e16;
    core::RecordingConfig t3; t3.timeout_s = core::RecordingConfig::kMaxDurationSeconds;
    ok = expect_error(t1, "timeout") && expect_error(t2, "start-delay") && t3.validate().is_ok();
    ok &= t3.timeout().count() == 100000000000LL;
    log_test("RecordingConfig::validate caps timeout and start-delay", ok);

    ok = core::parse_image_format("PNG").is_ok() && core::parse_image_format("jpeg").is_ok();
    ok &= core::parse_image_format("webp").is_err();
    auto settings = cfg.screen_settings();
    ok &= settings.workers == 2 && settings.encode.png_compression == 9 && settings.queue_size == 100;
    log_test("parse_image_format / screen_settings", ok);
}

// ============================================================================
// Test: RateTuner
// ============================================================================

void test_rate_tuner() {
    section("RateTuner");

    bool ok = core::RateTuner::next_target(35.0, 60.0) == 40.0;
    ok &= core::RateTuner::next_target(58.0, 60.0) == 50.0;
    ok &= core::RateTuner::next_target(12.0, 20.0) == 10.0;
    log_test("RateTuner::next_target", ok);

    {
        common::ScreenTelemetry t;
        common::GrabRecord g;
        g.fps = 28.0;
        g.elapsed_time = 5.0;
        t.grab = g;
        common::SaveRecord s;
        s.elapsed_time = 5.5;
        t.saves.push_back(s);
        std::string why;
        bool safe = core::RateTuner::is_safe(t, 30.0, why);
        t.saves[0]->elapsed_time = 6.5;
        bool slow_sink = !core::RateTuner::is_safe(t, 30.0, why) && why.find("save time") != std::string::npos;
        t.saves[0]->elapsed_time = 5.0;
        bool slow_grab = !core::RateTuner::is_safe(t, 40.0, why) && why.find("current FPS") != std::string::npos;
        log_test("RateTuner::is_safe", safe && slow_sink && slow_grab);
    }

    {
        std::vector<core::TunerTrial> safe(3);
        safe[0].workers = 1; safe[0].max_stable_fps = 20;
        safe[1].workers = 2; safe[1].max_stable_fps = 45;
        safe[2].workers = 3; safe[2].max_stable_fps = 45;
        auto best = core::RateTuner::recommend(safe);
        log_test("RateTuner::recommend highest stable fps", best && best->workers == 2 &&
                 !core::RateTuner::recommend({}));
    }

    {
        TempDir dir;
        core::TunerSettings ts;
        ts.max_workers = 2;
        ts.max_fps = 20.0;
        ts.n_frames = 6;
        ts.output_dir = (fs::path(dir.path()) / "temp").string();
        core::RateTuner tuner(std::make_shared<testing::MockScreenCapture>(8, 6),
                              std::make_shared<testing::MockFrameEncoder>(), ts,
                              std::make_shared<common::NullLogger>());
        auto start = Clock::now();
        auto res = tuner.run();
        double ms = test_harness::elapsed_ms(start);
        bool run_ok = res.is_ok();
        if (run_ok) {
            const auto& r = res.unwrap();
            run_ok &= !r.trials.empty();
            run_ok &= r.recommendation.has_value() == !r.safe_configs.empty();
            run_ok &= r.safe_configs.size() <= 2;
            run_ok &= !core::RateTuner::format(r).empty();
        }
        log_test("RateTuner::run against mock capture", run_ok, "", ms);
    }
}

int main() {
    std::cout << "Recorder Core Test Suite" << std::endl;
    std::cout << "========================" << std::endl;

    test_bounded_channel();
    test_artifact_index();
    test_producer_and_sinks();
    test_backpressure();
    test_telemetry();
    test_screen_recorder_scenario();
    test_lifecycle();
    test_input_recorders();
    test_hotkey();
    test_session();
    test_config();
    test_rate_tuner();

    return test_harness::print_summary();
}
