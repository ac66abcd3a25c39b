#include "apps/meter/CsvLogger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace {

bool toLocalTm(int64_t wall_ms, std::tm& out) {
    const std::time_t secs = static_cast<std::time_t>(wall_ms / 1000);
    return ::localtime_r(&secs, &out) != nullptr;
}

void appendInt(std::string& row, bool valid, int32_t v) {
    if (valid) row += std::to_string(v);
}

void appendTemp(std::string& row, bool valid, float c) {
    if (!valid) return;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", static_cast<double>(c));
    row += buf;
}

} // anonymous namespace

namespace meter {

CsvLogger::~CsvLogger() {
    Close();
}

bool CsvLogger::Open(const std::string& dir, int64_t wall_ms) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        m_errno = ec.value();
        m_status = Status::MKDIR_FAIL;
        std::cout << "[CSV] ERROR: could not create log dir: " << dir
                  << " (" << ec.message() << ")\n";
        return false;
    }

    return OpenFile((fs::path(dir) / fileNameFor(wall_ms)).string());
}

bool CsvLogger::OpenFile(const std::string& path) {
    Close();

    m_status = Status::OK;
    m_errno  = 0;
    m_rows   = 0;
    m_path   = path;

    std::error_code ec;
    const bool fresh = !fs::exists(path, ec) || fs::file_size(path, ec) == 0;

    errno = 0;
    m_file.open(path, std::ios::out | std::ios::app);
    if (!m_file) {
        fail(Status::OPEN_FAIL);
        std::cout << "[CSV] ERROR: could not open CSV: " << path
                  << " errno=" << m_errno << " (" << std::strerror(m_errno) << ")\n";
        return false;
    }

    if (fresh) {
        errno = 0;
        m_file << CSV_HEADER << "\n";
        m_file.flush();
        if (!m_file) {
            fail(Status::HEADER_FAIL);
            std::cout << "[CSV] ERROR: could not write header: " << path << "\n";
            m_file.close();
            return false;
        }
    }

    std::cout << "[CSV] open: " << path << (fresh ? " (new)" : " (append)") << "\n";
    return true;
}

bool CsvLogger::Write(const msg::LogRecord& rec) {
    if (!m_file.is_open()) return fail(Status::NOT_OPEN);

    const std::string row = formatRow(rec);

    // Only what the failing write itself leaves in errno is reported.
    errno = 0;
    m_file << row << "\n";
    m_file.flush();

    if (!m_file) return fail(Status::WRITE_FAIL);

    ++m_rows;
    return true;
}

void CsvLogger::Close() {
    if (m_file.is_open()) {
        m_file.flush();
        m_file.close();
    }
}

// -------------------- formatting --------------------

std::string CsvLogger::formatTimestamp(int64_t wall_ms) {
    std::tm tm{};
    if (!toLocalTm(wall_ms, tm)) return std::string();

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm);

    int64_t ms = wall_ms % 1000;
    if (ms < 0) ms += 1000;

    char out[48];
    std::snprintf(out, sizeof(out), "%s.%03d", date, static_cast<int>(ms));
    return out;
}

std::string CsvLogger::fileNameFor(int64_t wall_ms) {
    std::tm tm{};
    if (!toLocalTm(wall_ms, tm)) return "power_log.csv";

    char name[64];
    std::strftime(name, sizeof(name), "power_log_%Y%m%d_%H%M%S.csv", &tm);
    return name;
}

std::string CsvLogger::escape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) return field;

    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string CsvLogger::formatRow(const msg::LogRecord& rec) {
    const msg::DecodeResult&    r = rec.result;
    const msg::TelemetrySample& t = rec.telemetry;

    std::string row;
    row.reserve(128);

    row += formatTimestamp(rec.wall_ms);
    row += ',';
    row += escape(r.mode);
    row += ',';

    char value[48];
    std::snprintf(value, sizeof(value), "%.4f", r.value);
    row += value;

    row += ','; appendInt(row, t.vbat_valid, t.vbat_mV);
    row += ','; appendInt(row, t.vin_valid,  t.vin_mV);
    row += ','; appendInt(row, t.iout_valid, t.iout_mA);
    row += ','; appendTemp(row, t.soc_valid,  t.soc_C);
    row += ','; appendTemp(row, t.rp1_valid,  t.rp1_C);
    row += ','; appendTemp(row, t.pmic_valid, t.pmic_C);

    std::string error = msg::joinErrors(r.errors);
    if (!rec.error.empty()) {
        if (!error.empty()) error += "; ";
        error += rec.error;
    }
    row += ',';
    row += escape(error);

    return row;
}

// FDIR

bool CsvLogger::fail(Status s) {
    m_status = s;
    m_errno  = (s == Status::NOT_OPEN) ? 0 : errno;
    return false;
}

const char* CsvLogger::StatusStr(CsvLogger::Status s) {
    switch (s) {
        case CsvLogger::Status::OK:          return "OK";
        case CsvLogger::Status::MKDIR_FAIL:  return "MKDIR_FAIL";
        case CsvLogger::Status::OPEN_FAIL:   return "OPEN_FAIL";
        case CsvLogger::Status::HEADER_FAIL: return "HEADER_FAIL";
        case CsvLogger::Status::WRITE_FAIL:  return "WRITE_FAIL";
        case CsvLogger::Status::NOT_OPEN:    return "NOT_OPEN";
        default:                             return "UNKNOWN";
    }
}

} // namespace meter
