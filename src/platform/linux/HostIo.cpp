#include "platform/linux/HostIo.hpp"

#include "os/rtos.hpp"

#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <fcntl.h>
#include <fstream>
#include <poll.h>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace {

void trimRight(std::string& s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
}

void killGroup(pid_t pid) {
    if (::kill(-pid, SIGKILL) != 0) ::kill(pid, SIGKILL);
}

} // anonymous namespace

namespace platform {

const char* RunStatusStr(RunStatus s) {
    switch (s) {
        case RunStatus::OK:         return "OK";
        case RunStatus::SPAWN_FAIL: return "SPAWN_FAIL";
        case RunStatus::TIMEOUT:    return "TIMEOUT";
        case RunStatus::EXIT_FAIL:  return "EXIT_FAIL";
        default:                    return "UNKNOWN";
    }
}

RunStatus RunCommand(const std::string& cmd, std::string& out, uint32_t timeout_ms) {
    out.clear();

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) return RunStatus::SPAWN_FAIL;

    const char* c_cmd = cmd.c_str();
    const pid_t pid = ::fork();
    if (pid < 0) {
        ::close(fds[0]);
        ::close(fds[1]);
        return RunStatus::SPAWN_FAIL;
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::dup2(fds[1], STDOUT_FILENO);
        ::execl("/bin/sh", "sh", "-c", c_cmd, static_cast<char*>(nullptr));
        ::_exit(127);
    }

    // Also set from the parent so kill(-pid) works even if the child has not run yet.
    ::setpgid(pid, pid);
    ::close(fds[1]);

    const uint64_t deadline_us = Rtos::MonoUs() + static_cast<uint64_t>(timeout_ms) * 1000u;
    bool timed_out = false;

    // ---- Read stdout until EOF or the deadline ----
    char buf[256];
    for (;;) {
        const uint64_t now_us = Rtos::MonoUs();
        if (now_us >= deadline_us) {
            timed_out = true;
            break;
        }

        pollfd pfd{};
        pfd.fd = fds[0];
        pfd.events = POLLIN;
        const int wait_ms = static_cast<int>((deadline_us - now_us + 999u) / 1000u);

        const int r = ::poll(&pfd, 1, wait_ms);
        if (r < 0 && errno == EINTR) continue;
        if (r < 0) break;
        if (r == 0) continue;

        const ssize_t n = ::read(fds[0], buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break; // EOF
    }
    ::close(fds[0]);

    // ---- Reap, still bounded by the same deadline ----
    int wstatus = 0;
    for (;;) {
        if (timed_out) killGroup(pid);

        const pid_t w = ::waitpid(pid, &wstatus, timed_out ? 0 : WNOHANG);
        if (w == pid) break;
        if (w < 0 && errno == EINTR) continue;
        if (w < 0) {
            trimRight(out);
            return timed_out ? RunStatus::TIMEOUT : RunStatus::EXIT_FAIL;
        }

        // Closed stdout but still running.
        if (Rtos::MonoUs() >= deadline_us) timed_out = true;
        else Rtos::SleepMs(5);
    }

    trimRight(out);
    if (timed_out) return RunStatus::TIMEOUT;
    if (WIFEXITED(wstatus) && WEXITSTATUS(wstatus) == 0) return RunStatus::OK;
    return RunStatus::EXIT_FAIL;
}

bool ReadTextFile(const std::string& path, std::string& out) {
    std::ifstream f(path);
    if (!f) return false;

    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) return false;

    out = ss.str();
    trimRight(out);
    return true;
}

bool ReadIntFile(const std::string& path, int64_t& out) {
    std::string text;
    if (!ReadTextFile(path, text) || text.empty()) return false;

    char* end = nullptr;
    const long long v = std::strtoll(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0') return false;

    out = static_cast<int64_t>(v);
    return true;
}

bool ParseLastInt(const std::string& s, int64_t& out) {
    // Walk back to the last digit run, then pick up an optional sign.
    size_t end = s.size();
    while (end > 0 && !std::isdigit(static_cast<unsigned char>(s[end - 1]))) --end;
    if (end == 0) return false;

    size_t begin = end;
    while (begin > 0 && std::isdigit(static_cast<unsigned char>(s[begin - 1]))) --begin;
    if (begin > 0 && s[begin - 1] == '-') --begin;

    out = static_cast<int64_t>(std::strtoll(s.substr(begin, end - begin).c_str(), nullptr, 10));
    return true;
}

bool ParseFirstFloat(const std::string& s, float& out) {
    for (size_t i = 0; i < s.size(); ++i) {
        const bool digit = std::isdigit(static_cast<unsigned char>(s[i])) != 0;
        const bool signed_digit = s[i] == '-' && i + 1 < s.size()
                                  && std::isdigit(static_cast<unsigned char>(s[i + 1]));
        if (!digit && !signed_digit) continue;

        char* end = nullptr;
        const float v = std::strtof(s.c_str() + i, &end);
        if (end == s.c_str() + i) return false;
        out = v;
        return true;
    }
    return false;
}

std::string ShellQuote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

} // namespace platform
