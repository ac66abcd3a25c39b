#include "apps/meter/MeterTask.hpp"
#include "lcd_test_utils.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;

static int g_failures = 0;

static void check(const std::string& name, bool ok) {
    std::cout << "  " << name << ": " << (ok ? "OK" : "FAIL") << "\n";
    if (!ok) ++g_failures;
}

// Time only moves when the loop sleeps (or the test says so).
class FakeClock : public Rtos::Clock {
public:
    uint64_t now_us = 1'000'000;
    std::vector<uint32_t> sleeps;

    uint64_t monoUs() override { return now_us; }
    int64_t  wallMs() override { return 1'700'000'000'000 + static_cast<int64_t>(now_us / 1000); }
    void     sleepMs(uint32_t ms) override {
        sleeps.push_back(ms);
        now_us += static_cast<uint64_t>(ms) * 1000;
    }

    uint64_t sleptMs() const {
        uint64_t t = 0;
        for (auto s : sleeps) t += s;
        return t;
    }
};

// Serves one rendered display; can be told to fail.
class FakeSource : public platform::IFrameSource {
public:
    cv::Mat  img;
    bool     fail = false;
    uint32_t acquired = 0;

    bool Start() override { return true; }
    void Stop() override {}

    bool Acquire(msg::ImageFrame& out) override {
        if (fail) return false;
        out = lcdtest::frameOf(img, acquired++);
        return true;
    }

    const char* LastError() const override { return "FAKE_FAIL"; }
};

class NoThermal : public platform::IThermalSource {
public:
    void read(std::vector<msg::ThermalReading>& out) override { out.clear(); }
};

// Stops the task after N logged cycles.
class StopAfter : public meter::CycleTap {
public:
    StopAfter(meter::MeterTask& t, int n) : task(t), left(n) {}

    void onCycle(const msg::ImageFrame& frame, const cv::Mat& binary,
                 const msg::LcdState&, const msg::LogRecord& rec) override {
        ++calls;
        binary_ok = binary_ok && binary.cols == static_cast<int>(frame.width);
        last_value = rec.result.value;
        if (--left == 0) task.RequestStop();
    }

    meter::MeterTask& task;
    int    left;
    int    calls = 0;
    bool   binary_ok = true;
    double last_value = -1.0;
};

static size_t countLines(const std::string& path) {
    std::ifstream f(path);
    size_t n = 0;
    for (std::string l; std::getline(f, l);) ++n;
    return n;
}

int main() {
    using namespace meter;

    std::cout << "=== meter_task_test ===\n";

    const fs::path dir = fs::temp_directory_path() /
                         ("meter_task_test_" + std::to_string(::getpid()));
    fs::remove_all(dir);
    fs::create_directories(dir);

    MeterTaskConfig cfg{};

    msg::LcdState shown = lcdtest::displayOf("12345");
    shown.dots[static_cast<std::size_t>(msg::DotId::P01)] = true;
    shown.modes[static_cast<std::size_t>(msg::ModeId::WATT)] = true;

    FakeSource source;
    source.img = lcdtest::render(cfg.decoder.LAYOUT, shown);

    NoThermal thermal;
    TelemetryEnricher telemetry(nullptr, &thermal);

    {
        std::cout << "\n[Test 0] first tick logs, early tick idles\n";
        FakeClock clock;
        CsvLogger log;
        const std::string path = (dir / "t0.csv").string();
        check("log open", log.OpenFile(path));

        MeterTask task(cfg, source, log, telemetry, clock);

        const auto r0 = task.Tick();
        std::cout << "  tick 0 -> " << MeterTask::TickResultStr(r0) << "\n";
        check("logged", r0 == MeterTask::TickResult::LOGGED);
        check("value 123.45 w",
              std::fabs(task.lastRecord().result.value - 123.45) < 1e-9 &&
              task.lastRecord().result.mode == "w");
        check("row stamped with cycle start", task.lastRecord().wall_ms == 1'700'000'001'000);

        clock.now_us += 100'000;
        const auto r1 = task.Tick();
        check("0.1 s later -> idle", r1 == MeterTask::TickResult::IDLE);
        check("idle sleep capped at 50 ms", clock.sleeps.size() == 1 && clock.sleeps[0] == 50);

        // Run ticks until the next capture.
        int idles = 0;
        MeterTask::TickResult r = MeterTask::TickResult::IDLE;
        while ((r = task.Tick()) == MeterTask::TickResult::IDLE && idles < 100) ++idles;
        check("second row after the interval", r == MeterTask::TickResult::LOGGED);
        check("  at >= 0.35 s", clock.now_us - 1'000'000 >= 350'000);

        log.Close();
        check("2 rows + header", countLines(path) == 3);
    }

    {
        std::cout << "\n[Test 1] frame failures skip the cycle, then back off\n";
        FakeClock clock;
        CsvLogger log;
        const std::string path = (dir / "t1.csv").string();
        check("log open", log.OpenFile(path));

        MeterTask task(cfg, source, log, telemetry, clock);
        source.fail = true;

        uint64_t slept_before_third = 0;
        int skipped = 0;
        for (int i = 0; i < 40 && skipped < 3; ++i) {
            if (skipped == 2) slept_before_third = clock.sleptMs();
            if (task.Tick() == MeterTask::TickResult::SKIPPED) ++skipped;
        }
        check("3 skipped cycles", skipped == 3 && task.cyclesSkipped() == 3);
        check("no rows", task.cyclesLogged() == 0 && log.rowsWritten() == 0);
        check("status FRAME_FAIL", task.lastStatus() == MeterTask::Status::FRAME_FAIL);
        check("backoff on the third failure",
              clock.sleptMs() - slept_before_third >= cfg.frame_fail_backoff_ms);

        source.fail = false;
        MeterTask::TickResult r = MeterTask::TickResult::IDLE;
        for (int i = 0; i < 100 && (r = task.Tick()) == MeterTask::TickResult::IDLE; ++i) {}
        check("recovers", r == MeterTask::TickResult::LOGGED);
        check("failure streak reset", task.consecutiveFrameFailures() == 0);
        check("recovery noted on the row",
              task.lastRecord().error == "recovered after 3 failed frame(s): FAKE_FAIL");

        for (int i = 0; i < 100 && (r = task.Tick()) == MeterTask::TickResult::IDLE; ++i) {}
        check("next row has no note", r == MeterTask::TickResult::LOGGED && task.lastRecord().error.empty());
        log.Close();

        std::ifstream f(path);
        std::string header, row;
        std::getline(f, header);
        std::getline(f, row);
        check("note in error column",
              row.size() > 0 && row.find("recovered after 3 failed frame(s): FAKE_FAIL") != std::string::npos);
    }

    {
        std::cout << "\n[Test 2] log failure is fatal\n";
        FakeClock clock;
        CsvLogger log;   // never opened
        MeterTask task(cfg, source, log, telemetry, clock);

        const auto r = task.Tick();
        check("FATAL", r == MeterTask::TickResult::FATAL);
        check("status LOG_FAIL", task.lastStatus() == MeterTask::Status::LOG_FAIL);
        check("Run() returns false", !task.Run());
    }

    {
        std::cout << "\n[Test 3] Run() until stop requested\n";
        FakeClock clock;
        CsvLogger log;
        const std::string path = (dir / "t3.csv").string();
        check("log open", log.OpenFile(path));

        MeterTask task(cfg, source, log, telemetry, clock);
        StopAfter tap(task, 3);
        task.setTap(&tap);

        check("Run() returns true", task.Run());
        check("3 rows", task.cyclesLogged() == 3 && tap.calls == 3);
        check("tap saw binary", tap.binary_ok);
        check("tap saw value", std::fabs(tap.last_value - 123.45) < 1e-9);
        check("~0.7 s of loop time", clock.now_us - 1'000'000 >= 700'000);

        log.Close();
        check("3 rows + header on disk", countLines(path) == 4);
    }

    fs::remove_all(dir);

    if (g_failures) {
        std::cout << "\nmeter_task_test: FAIL (" << g_failures << ")\n";
        return 1;
    }
    std::cout << "\nmeter_task_test: PASS\n";
    return 0;
}
