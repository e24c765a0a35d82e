// ===================== File: src/diag_logger.cpp =====================
#include "diag_logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace ipwho {

static std::string now_ts() {
    using namespace std::chrono;
    auto t  = system_clock::now();
    auto tt = system_clock::to_time_t(t);
    auto ms = duration_cast<milliseconds>(t.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&tt, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << ms.count();
    return oss.str();
}

DiagLevel parse_diag_level(const std::string& s) {
    if (s == "debug") return DiagLevel::Debug;
    if (s == "info")  return DiagLevel::Info;
    if (s == "warn")  return DiagLevel::Warn;
    throw std::invalid_argument("bad log level: " + s);
}

const char* diag_level_name(DiagLevel level) {
    switch (level) {
    case DiagLevel::Debug: return "DEBUG";
    case DiagLevel::Info:  return "INFO ";
    case DiagLevel::Warn:  return "WARN ";
    }
    return "?";
}

// An empty path leaves the stream closed; every log call is then a no-op.
DiagLogger::DiagLogger(const std::string& path, DiagLevel min_level)
    : min_level_(min_level) {
    if (!path.empty()) out_.open(path, std::ios::app);
    if (out_.is_open()) out_ << "=== ipwho diag start " << now_ts() << " ===\n";
}

DiagLogger::~DiagLogger() {
    if (out_.is_open()) out_ << "=== ipwho diag end " << now_ts() << " ===\n";
}

void DiagLogger::log(DiagLevel level, const std::string& line) {
    if (!enabled(level)) return;
    out_ << now_ts() << " | " << diag_level_name(level) << " | " << line << '\n';
    out_.flush();
}

} // namespace ipwho
