#include "logger.h"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace {

struct LogSettings {
    std::string error_log_path;
    bool daemon_mode = false;
};

LogSettings& settings() {
    static LogSettings s;
    return s;
}

void appendLogFile(const std::string& path, const std::string& line) {
    if (path.empty()) return;
    try {
        fs::path parent = fs::path(path).parent_path();
        if (!parent.empty()) fs::create_directories(parent);
        std::ofstream f(path, std::ios::app);
        f << line << "\n";
    } catch (const std::exception&) {
        // best-effort logging to file; the console copy is already written
    }
}

std::string formatLine(const char* level, const std::string& message) {
    return "[" + isoTimestampNow() + "] [" + level + "] " + message;
}

} // namespace

void initLogging(const std::string& error_log_path, bool daemon_mode) {
    settings().error_log_path = error_log_path;
    settings().daemon_mode = daemon_mode;
}

std::string isoTimestampNow() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

// In daemon mode the supervisor has already pointed stdout at the operational
// log and stderr at the error log, so nothing is appended twice.
void logInfo(const std::string& message) {
    std::cout << formatLine("INFO", message) << std::endl;
}

void logWarn(const std::string& message) {
    std::cout << formatLine("WARN", message) << std::endl;
}

void logError(const std::string& message) {
    std::string line = formatLine("ERROR", message);
    std::cerr << line << std::endl;
    if (!settings().daemon_mode) {
        appendLogFile(settings().error_log_path, line);
    }
}
