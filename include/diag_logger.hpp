// ===================== File: include/diag_logger.hpp =====================
#pragma once
#include <fstream>
#include <string>

namespace ipwho {

enum class DiagLevel { Debug = 0, Info = 1, Warn = 2 };

// Throws std::invalid_argument for anything but debug|info|warn.
DiagLevel parse_diag_level(const std::string& s);
const char* diag_level_name(DiagLevel level);

class DiagLogger {
public:
    explicit DiagLogger(const std::string& path, DiagLevel min_level = DiagLevel::Info);
    ~DiagLogger();

    DiagLogger(const DiagLogger&) = delete;
    DiagLogger& operator=(const DiagLogger&) = delete;

    bool ok() const { return out_.is_open(); }
    bool enabled(DiagLevel level) const { return ok() && level >= min_level_; }

    void log(DiagLevel level, const std::string& line);
    void debug(const std::string& line) { log(DiagLevel::Debug, line); }
    void info(const std::string& line) { log(DiagLevel::Info, line); }
    void warn(const std::string& line) { log(DiagLevel::Warn, line); }

private:
    std::ofstream out_;
    DiagLevel min_level_;
};

} // namespace ipwho
