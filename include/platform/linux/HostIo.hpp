#pragma once
#include <cstdint>
#include <string>

namespace platform {

static constexpr uint32_t RUN_TIMEOUT_MS_DEFAULT = 1000;

enum class RunStatus : uint8_t {
    OK = 0,
    SPAWN_FAIL,   // pipe/fork failed
    TIMEOUT,      // still running at the deadline; process group killed
    EXIT_FAIL,    // exited non-zero or died on a signal
};

const char* RunStatusStr(RunStatus s);

// Run `/bin/sh -c cmd` and capture its stdout (stderr is left alone).
// Never waits longer than timeout_ms: on expiry the command's whole process
// group is killed and TIMEOUT is returned with whatever output arrived.
RunStatus RunCommand(const std::string& cmd, std::string& out,
                     uint32_t timeout_ms = RUN_TIMEOUT_MS_DEFAULT);

// Read a small text file (sysfs attribute) with trailing whitespace trimmed.
bool ReadTextFile(const std::string& path, std::string& out);

// Read a sysfs attribute holding one decimal integer.
bool ReadIntFile(const std::string& path, int64_t& out);

// Last signed decimal integer in 's' ("VBAT = 3312" -> 3312).
bool ParseLastInt(const std::string& s, int64_t& out);

// First decimal number in 's' ("temp=47.2'C" -> 47.2).
bool ParseFirstFloat(const std::string& s, float& out);

// Quote for /bin/sh so paths with spaces survive RunCommand().
std::string ShellQuote(const std::string& s);

} // namespace platform
