#include "apps/meter/TelemetryEnricher.hpp"
#include "os/rtos.hpp"
#include "platform/linux/HostIo.hpp"
#include "platform/linux/LinuxThermalSource.hpp"
#include "platform/linux/Lp4wCliTelemetry.hpp"
#include "platform/linux/SysfsPowerTelemetry.hpp"

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

static void writeFile(const fs::path& p, const std::string& text) {
    fs::create_directories(p.parent_path());
    std::ofstream f(p, std::ios::trunc);
    f << text << "\n";
}

// Power backend with one field that always fails.
class FlakyPower : public platform::IPowerTelemetry {
public:
    platform::PowerField broken = platform::PowerField::VIN;
    int reads = 0;

    const char* name() const override { return "flaky"; }

    bool read(platform::PowerField field, int32_t& out_milli) override {
        ++reads;
        if (field == broken) return false;
        out_milli = 1000 + static_cast<int32_t>(field);
        return true;
    }
};

class FixedThermal : public platform::IThermalSource {
public:
    std::vector<msg::ThermalReading> readings;
    void read(std::vector<msg::ThermalReading>& out) override { out = readings; }
};

int main() {
    using namespace meter;

    std::cout << "=== meter_telemetry_test ===\n";

    const fs::path root = fs::temp_directory_path() /
                          ("meter_telemetry_test_" + std::to_string(::getpid()));
    fs::remove_all(root);

    {
        std::cout << "\n[Test 0] text helpers\n";
        int64_t v = 0;
        check("last int", platform::ParseLastInt("VBAT = 3312\n", v) && v == 3312);
        check("negative", platform::ParseLastInt("iout: -45", v) && v == -45);
        check("no digits", !platform::ParseLastInt("n/a", v));

        float c = 0.0f;
        check("first float", platform::ParseFirstFloat("temp=41.8'C", c) && std::fabs(c - 41.8f) < 1e-4f);
        check("shell quote", platform::ShellQuote("a b'c") == "'a b'\\''c'");
    }

    {
        std::cout << "\n[Test 1] sysfs power_supply backend\n";
        const fs::path ps = root / "power_supply";
        writeFile(ps / "BAT0" / "type", "Battery");
        writeFile(ps / "BAT0" / "voltage_now", "3312000");
        writeFile(ps / "BAT0" / "current_now", "-410000");
        writeFile(ps / "ac" / "type", "Mains");
        writeFile(ps / "ac" / "voltage_now", "5020000");

        platform::SysfsPowerConfig cfg;
        cfg.root = ps.string();
        platform::SysfsPowerTelemetry sysfs(cfg);

        check("battery found", sysfs.batteryName() == "BAT0");
        check("input found",   sysfs.inputName() == "ac");

        int32_t v = 0;
        check("vbat 3312 mV", sysfs.read(platform::PowerField::VBAT, v) && v == 3312);
        check("vin 5020 mV",  sysfs.read(platform::PowerField::VIN, v)  && v == 5020);
        check("iout -410 mA", sysfs.read(platform::PowerField::IOUT, v) && v == -410);

        fs::remove(ps / "ac" / "voltage_now");
        check("vin gone -> fails", !sysfs.read(platform::PowerField::VIN, v));
        check("vbat unaffected", sysfs.read(platform::PowerField::VBAT, v) && v == 3312);

        writeFile(ps / "BAT0" / "voltage_now", "garbage");
        check("non-numeric -> fails", !sysfs.read(platform::PowerField::VBAT, v));

        platform::SysfsPowerConfig none;
        none.root = (root / "nothing_here").string();
        platform::SysfsPowerTelemetry empty(none);
        check("no supplies -> fails", !empty.read(platform::PowerField::VBAT, v));
    }

    {
        std::cout << "\n[Test 2] lifepo4wered-cli backend (fake tool)\n";
        const fs::path cli  = root / "bin" / "fake lp4w";
        const fs::path setlog = root / "set.log";
        writeFile(cli,
            "#!/bin/sh\n"
            "if [ \"$1\" = get ]; then\n"
            "  case \"$2\" in\n"
            "    vbat) echo 3305 ;;\n"
            "    vin)  echo 'VIN = 5011' ;;\n"
            "    *) exit 1 ;;\n"
            "  esac\n"
            "  exit 0\n"
            "fi\n"
            "if [ \"$1\" = set ]; then\n"
            "  [ \"$2\" = VIN_THRESHOLD ] && [ \"$3\" = 9999 ] && exit 3\n"
            "  echo \"$2 $3\" >> '" + setlog.string() + "'\n"
            "  exit 0\n"
            "fi\n"
            "exit 2");
        fs::permissions(cli, fs::perms::owner_all);

        platform::Lp4wCliConfig cfg;
        cfg.cli = cli.string();
        platform::Lp4wCliTelemetry lp(cfg);

        int32_t v = 0;
        check("vbat", lp.read(platform::PowerField::VBAT, v) && v == 3305);
        check("vin (labelled output)", lp.read(platform::PowerField::VIN, v) && v == 5011);
        check("iout fails", !lp.read(platform::PowerField::IOUT, v));
        check("  failed var named", lp.lastFailedVar() == "iout");

        platform::PowerPolicy policy;
        policy.persist = true;
        check("apply policy", lp.applyPolicy(policy));

        std::ifstream f(setlog);
        std::vector<std::string> lines;
        for (std::string l; std::getline(f, l);) lines.push_back(l);
        check("4 set calls", lines.size() == 4);
        check("order + values",
              lines.size() == 4 && lines[0] == "AUTO_BOOT 3" && lines[1] == "AUTO_SHDN_TIME 3" &&
              lines[2] == "VIN_THRESHOLD 4500" && lines[3] == "CFG_WRITE 0x46");

        policy.vin_threshold = 9999;
        check("refused set fails", !lp.applyPolicy(policy));
        check("  failed var named", lp.lastFailedVar() == "VIN_THRESHOLD");

        platform::Lp4wCliConfig missing;
        missing.cli = (root / "bin" / "not-installed").string();
        platform::Lp4wCliTelemetry gone(missing);
        check("missing tool -> fails", !gone.read(platform::PowerField::VBAT, v));
    }

    {
        std::cout << "\n[Test 3] thermal zones\n";
        writeFile(root / "thermal" / "thermal_zone0" / "type", "cpu-thermal");
        writeFile(root / "thermal" / "thermal_zone0" / "temp", "47200");
        writeFile(root / "thermal" / "cooling_device0" / "type", "pwm-fan");
        writeFile(root / "hwmon" / "hwmon0" / "name", "cpu_thermal");
        writeFile(root / "hwmon" / "hwmon0" / "temp1_input", "47000");
        writeFile(root / "hwmon" / "hwmon3" / "name", "rp1_adc");
        writeFile(root / "hwmon" / "hwmon3" / "temp1_input", "39500");

        platform::LinuxThermalConfig cfg;
        cfg.thermal_root = (root / "thermal").string();
        cfg.hwmon_root   = (root / "hwmon").string();
        cfg.pmic_cmd     = "echo \"temp=41.8'C\"";
        platform::LinuxThermalSource thermal(cfg);

        std::vector<msg::ThermalReading> t;
        thermal.read(t);
        check("3 readings", t.size() == 3);
        check("soc 47.2",  t.size() > 0 && t[0].name == "soc"  && std::fabs(t[0].celsius - 47.2f) < 1e-3f);
        check("rp1 39.5",  t.size() > 1 && t[1].name == "rp1"  && std::fabs(t[1].celsius - 39.5f) < 1e-3f);
        check("pmic 41.8", t.size() > 2 && t[2].name == "pmic" && std::fabs(t[2].celsius - 41.8f) < 1e-3f);

        platform::LinuxThermalConfig bare;
        bare.thermal_root = (root / "none").string();
        bare.hwmon_root   = (root / "none").string();
        bare.pmic_cmd     = "false";
        platform::LinuxThermalSource nothing(bare);
        nothing.read(t);
        check("missing zones are just absent", t.empty());
    }

    {
        std::cout << "\n[Test 4] enricher isolates failing fields\n";
        FlakyPower power;
        FixedThermal thermal;
        thermal.readings = {{"soc", 50.0f}, {"pmic", 40.5f}, {"gpu", 1.0f}};

        TelemetryEnricher enricher(&power, &thermal);
        msg::TelemetrySample s;
        enricher.enrich(s);

        check("vbat ok", s.vbat_valid && s.vbat_mV == 1000);
        check("vin invalid", !s.vin_valid);
        check("iout ok", s.iout_valid && s.iout_mA == 1002);
        check("soc ok", s.soc_valid && s.soc_C == 50.0f);
        check("rp1 absent", !s.rp1_valid);
        check("pmic ok", s.pmic_valid && s.pmic_C == 40.5f);

        power.broken = platform::PowerField::IOUT;
        enricher.enrich(s);
        check("vin recovered", s.vin_valid && s.vin_mV == 1001);
        check("iout now invalid", !s.iout_valid);
        check("3 reads per cycle", power.reads == 6);

        TelemetryEnricher off(nullptr, nullptr);
        s.vbat_valid = true;
        off.enrich(s);
        check("disabled -> all invalid",
              !s.vbat_valid && !s.vin_valid && !s.iout_valid &&
              !s.soc_valid && !s.rp1_valid && !s.pmic_valid);
    }

    {
        std::cout << "\n[Test 5] command deadline\n";
        std::string out;
        check("ok", platform::RunCommand("echo hi", out) == platform::RunStatus::OK && out == "hi");
        check("non-zero exit", platform::RunCommand("echo partial; exit 4", out) ==
                               platform::RunStatus::EXIT_FAIL && out == "partial");

        uint64_t t0 = Rtos::MonoUs();
        const platform::RunStatus st = platform::RunCommand("sleep 3; echo late", out, 200);
        uint64_t ms = (Rtos::MonoUs() - t0) / 1000u;
        std::cout << "  sleeping command returned after " << ms << " ms\n";
        check("hung command -> TIMEOUT", st == platform::RunStatus::TIMEOUT);
        check("  within bound", ms < 1000);
        check("  no late output", out.empty());

        // Closes stdout early but keeps running.
        t0 = Rtos::MonoUs();
        check("silent hang -> TIMEOUT",
              platform::RunCommand("exec >/dev/null; sleep 3", out, 200) == platform::RunStatus::TIMEOUT);
        ms = (Rtos::MonoUs() - t0) / 1000u;
        check("  within bound", ms < 1000);
    }

    {
        std::cout << "\n[Test 6] hung telemetry tools do not stall a cycle\n";
        const fs::path cli = root / "bin" / "stuck lp4w";
        writeFile(cli, "#!/bin/sh\nsleep 3\necho 3300\n");
        fs::permissions(cli, fs::perms::owner_all);

        platform::Lp4wCliConfig pcfg;
        pcfg.cli = cli.string();
        pcfg.timeout_ms = 200;
        pcfg.holdoff_ms = 60000;
        platform::Lp4wCliTelemetry power(pcfg);

        platform::LinuxThermalConfig tcfg;
        tcfg.thermal_root = (root / "none").string();
        tcfg.hwmon_root   = (root / "none").string();
        tcfg.pmic_cmd     = "sleep 3; echo \"temp=41.8'C\"";
        tcfg.pmic_timeout_ms = 200;
        tcfg.pmic_holdoff_ms = 60000;
        platform::LinuxThermalSource thermal(tcfg);

        TelemetryEnricher enricher(&power, &thermal);
        msg::TelemetrySample s;

        uint64_t t0 = Rtos::MonoUs();
        enricher.enrich(s);
        uint64_t ms = (Rtos::MonoUs() - t0) / 1000u;
        std::cout << "  first cycle took " << ms << " ms\n";
        check("first cycle bounded", ms < 1500);
        check("power fields invalid", !s.vbat_valid && !s.vin_valid && !s.iout_valid);
        check("pmic invalid", !s.pmic_valid);
        check("timeout reported", power.lastRunStatus() == platform::RunStatus::TIMEOUT);

        t0 = Rtos::MonoUs();
        enricher.enrich(s);
        ms = (Rtos::MonoUs() - t0) / 1000u;
        std::cout << "  held-off cycle took " << ms << " ms\n";
        check("held-off cycle does not run the tools", ms < 100);
        check("  fields still invalid", !s.vbat_valid && !s.pmic_valid);
    }

    fs::remove_all(root);

    if (g_failures) {
        std::cout << "\nmeter_telemetry_test: FAIL (" << g_failures << ")\n";
        return 1;
    }
    std::cout << "\nmeter_telemetry_test: PASS\n";
    return 0;
}
