#pragma once
#include <cstdint>
#include <fstream>
#include <string>

#include "msg/MeterReading.hpp"

namespace meter {

// Column schema, in order. Written once when the file is created.
static constexpr const char* CSV_HEADER =
    "timestamp,mode,value,vbat_mV,vin_mV,iout_mA,soc_C,rp1_C,pmic_C,error";

// ---------------------------------------------------------------------------
// CsvLogger: append-only record sink, one row per completed cycle.
// Every row is flushed before Write() returns; rows are never rewritten.
// ---------------------------------------------------------------------------
class CsvLogger {
public:
    CsvLogger() = default;
    ~CsvLogger();

    CsvLogger(const CsvLogger&) = delete;
    CsvLogger& operator=(const CsvLogger&) = delete;

    // Create 'dir' if needed and open power_log_YYYYMMDD_HHMMSS.csv in it
    // (local time of 'wall_ms').
    bool Open(const std::string& dir, int64_t wall_ms);

    // Open (append) an explicit file. Header is written only if the file is empty.
    bool OpenFile(const std::string& path);

    // Append + flush one row. False if the sink is not open or the write failed.
    bool Write(const msg::LogRecord& rec);

    void Close();

    bool isOpen() const { return m_file.is_open(); }
    const std::string& path() const { return m_path; }
    uint64_t rowsWritten() const { return m_rows; }

    enum class Status : uint8_t {
        OK = 0,
        MKDIR_FAIL,
        OPEN_FAIL,
        HEADER_FAIL,
        WRITE_FAIL,
        NOT_OPEN,
    };

    static const char* StatusStr(Status s);

    Status lastStatus() const { return m_status; }
    // errno left by the failing stream call; 0 when the stream did not set one.
    int    lastErrno()  const { return m_errno; }

    // ---- Formatting helpers (no I/O) ----

    // "YYYY-MM-DD HH:MM:SS.mmm", local time.
    static std::string formatTimestamp(int64_t wall_ms);

    // "power_log_YYYYMMDD_HHMMSS.csv", local time.
    static std::string fileNameFor(int64_t wall_ms);

    // One CSV line without the trailing newline.
    static std::string formatRow(const msg::LogRecord& rec);

    // RFC 4180 quoting when the field contains ',', '"', CR or LF.
    static std::string escape(const std::string& field);

private:
    std::ofstream m_file;
    std::string   m_path;
    uint64_t      m_rows = 0;

    // FDIR
    Status m_status = Status::OK;
    int    m_errno  = 0;

    bool fail(Status s);
};

} // namespace meter
