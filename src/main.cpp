// power_ocr_meter: camera -> 7-segment decode -> CSV, one row per cycle.
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <linux/videodev2.h>

#include "os/rtos.hpp"

#include "apps/meter/CsvLogger.hpp"
#include "apps/meter/MeterConfig.hpp"
#include "apps/meter/MeterTask.hpp"
#include "apps/meter/TelemetryEnricher.hpp"

#include "platform/linux/FileFrameSource.hpp"
#include "platform/linux/LinuxThermalSource.hpp"
#include "platform/linux/Lp4wCliTelemetry.hpp"
#include "platform/linux/SysfsPowerTelemetry.hpp"
#include "platform/linux/V4L2Camera.hpp"

#include "preview/Preview.hpp"

namespace {

// Touched from the signal handler.
std::atomic<meter::MeterTask*> g_task{nullptr};
static_assert(std::atomic<meter::MeterTask*>::is_always_lock_free,
              "signal handler needs a lock-free task pointer");

void on_signal(int) {
    meter::MeterTask* task = g_task.load();
    if (task) task->RequestStop();
}

void print_usage(const char* prog) {
    std::cerr
        << "Usage:\n"
        << "  " << prog << " [options]\n\n"
        << "Options:\n"
        << "  --interval S          seconds between captures (default 0.35)\n"
        << "  --resolution WxH      camera frame size (default 800x600)\n"
        << "  --log-dir DIR         CSV output directory (default logs)\n"
        << "  --device PATH         V4L2 device (default /dev/video0)\n"
        << "  --pixfmt grey|yuyv    camera pixel format (default grey)\n"
        << "  --replay PATH         read frames from an image or directory instead\n"
        << "  --no-preview          headless, no window\n"
        << "  --telemetry cli|sysfs|none   power telemetry backend (default cli)\n"
        << "  --apply-policy        push the power policy to the LiFePO4wered board\n"
        << "  --persist-policy      also write it to board flash\n"
        << "  --bin-thresh N        binarization threshold 1..255 (default 160)\n"
        << "  --on-thresh N         black pixels for a lit box (default 100)\n";
}

bool parse_args(int argc, char** argv, meter::MeterConfig& out) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];

        auto need_value = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << name << "\n";
                return nullptr;
            }
            return argv[++i];
        };

        if (a == "--interval") {
            const char* v = need_value("--interval");
            if (!v) return false;
            out.task.scheduler.interval_s = meter::ParseDoubleArg(v);
        } else if (a == "--resolution") {
            const char* v = need_value("--resolution");
            if (!v) return false;
            if (!meter::ParseResolution(v, out.width, out.height)) {
                std::cerr << "Bad --resolution (want WxH): " << v << "\n";
                return false;
            }
        } else if (a == "--log-dir") {
            const char* v = need_value("--log-dir");
            if (!v) return false;
            out.log_dir = v;
        } else if (a == "--device") {
            const char* v = need_value("--device");
            if (!v) return false;
            out.device = v;
        } else if (a == "--pixfmt") {
            const char* v = need_value("--pixfmt");
            if (!v) return false;
            const std::string p = v;
            if (p == "grey")      out.pixfmt = meter::FramePixFmt::GREY;
            else if (p == "yuyv") out.pixfmt = meter::FramePixFmt::YUYV;
            else { std::cerr << "Bad --pixfmt: " << p << "\n"; return false; }
        } else if (a == "--replay") {
            const char* v = need_value("--replay");
            if (!v) return false;
            out.replay = v;
        } else if (a == "--no-preview") {
            out.preview = false;
        } else if (a == "--telemetry") {
            const char* v = need_value("--telemetry");
            if (!v) return false;
            const std::string t = v;
            if (t == "cli")        out.telemetry = meter::TelemetryBackend::CLI;
            else if (t == "sysfs") out.telemetry = meter::TelemetryBackend::SYSFS;
            else if (t == "none")  out.telemetry = meter::TelemetryBackend::NONE;
            else { std::cerr << "Bad --telemetry: " << t << "\n"; return false; }
        } else if (a == "--apply-policy") {
            out.apply_policy = true;
        } else if (a == "--persist-policy") {
            out.apply_policy = true;
            out.policy.persist = true;
        } else if (a == "--bin-thresh") {
            const char* v = need_value("--bin-thresh");
            if (!v) return false;
            const int t = meter::ParseIntArg(v);
            if (t < 1 || t > 255) { std::cerr << "--bin-thresh must be 1..255\n"; return false; }
            out.task.decoder.BIN_THRESH = static_cast<uint8_t>(t);
        } else if (a == "--on-thresh") {
            const char* v = need_value("--on-thresh");
            if (!v) return false;
            out.task.decoder.ON_THRESHOLD = meter::ParseIntArg(v);
        } else if (a == "--help" || a == "-h") {
            return false;
        } else {
            std::cerr << "Unknown arg: " << a << "\n";
            return false;
        }
    }
    return true;
}

} // anonymous namespace

int main(int argc, char** argv) {
    meter::MeterConfig cfg{};

    bool args_ok = false;
    try {
        args_ok = parse_args(argc, argv, cfg);
    } catch (const std::exception& e) {
        // non-number or trailing characters
        std::cerr << "Bad numeric argument: " << e.what() << "\n";
    }
    if (!args_ok) {
        print_usage(argv[0]);
        return 2;
    }

    std::string why;
    if (!cfg.task.decoder.LAYOUT.validate(cfg.width, cfg.height, why)) {
        std::cerr << "[MAIN] ERROR: display layout does not fit "
                  << cfg.width << "x" << cfg.height << ": " << why << "\n";
        return 2;
    }

    // ---- Frame source ----
    std::unique_ptr<platform::IFrameSource> source;
    if (!cfg.replay.empty()) {
        platform::FileFrameSourceConfig fc{};
        fc.path   = cfg.replay;
        fc.width  = cfg.width;
        fc.height = cfg.height;
        source = std::make_unique<platform::FileFrameSource>(fc);
    } else {
        platform::V4L2CameraConfig vc{};
        vc.dev         = cfg.device;
        vc.width       = cfg.width;
        vc.height      = cfg.height;
        vc.v4l2_pixfmt = (cfg.pixfmt == meter::FramePixFmt::YUYV) ? V4L2_PIX_FMT_YUYV
                                                                   : V4L2_PIX_FMT_GREY;
        source = std::make_unique<platform::V4L2Camera>(vc);
    }

    if (!source->Start()) {
        std::cerr << "[MAIN] ERROR: frame source start failed: " << source->LastError() << "\n";
        return 1;
    }

    // ---- Telemetry ----
    std::unique_ptr<platform::IPowerTelemetry> power;
    if (cfg.telemetry == meter::TelemetryBackend::CLI) {
        auto cli = std::make_unique<platform::Lp4wCliTelemetry>();
        if (cfg.apply_policy && !cli->applyPolicy(cfg.policy)) {
            std::cout << "[MAIN] WARN power policy not applied (" << cli->lastFailedVar() << ")\n";
        }
        power = std::move(cli);
    } else if (cfg.telemetry == meter::TelemetryBackend::SYSFS) {
        power = std::make_unique<platform::SysfsPowerTelemetry>();
    }
    if (cfg.apply_policy && cfg.telemetry != meter::TelemetryBackend::CLI) {
        std::cout << "[MAIN] WARN --apply-policy needs --telemetry cli, ignored\n";
    }

    std::unique_ptr<platform::IThermalSource> thermal;
    if (cfg.telemetry != meter::TelemetryBackend::NONE) {
        thermal = std::make_unique<platform::LinuxThermalSource>();
    }

    meter::TelemetryEnricher enricher(power.get(), thermal.get());

    // ---- Log ----
    meter::CsvLogger log;
    if (!log.Open(cfg.log_dir, Rtos::WallMs())) {
        source->Stop();
        return 1;
    }

    // ---- Session ----
    Rtos::SystemClock clock;
    meter::MeterTask task(cfg.task, *source, log, enricher, clock);

    std::unique_ptr<preview::PreviewWindow> window;
    if (cfg.preview) {
        window = std::make_unique<preview::PreviewWindow>(task, cfg.task.decoder.LAYOUT);
        task.setTap(window.get());
    }

    g_task.store(&task);
    std::signal(SIGINT,  on_signal);
    std::signal(SIGTERM, on_signal);

    std::cout << "[MAIN] " << cfg.width << "x" << cfg.height
              << " source=" << (cfg.replay.empty() ? cfg.device : cfg.replay)
              << " telemetry=" << meter::TelemetryBackendStr(cfg.telemetry)
              << " log=" << log.path() << "\n";

    const bool ok = task.Run();

    g_task.store(nullptr);
    window.reset();
    log.Close();
    source->Stop();

    std::cout << "[MAIN] exit " << (ok ? "clean" : "on error") << "\n";
    return ok ? 0 : 1;
}
