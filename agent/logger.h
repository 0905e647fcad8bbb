#pragma once

#include <string>

// Process-wide logging. Info goes to stdout, errors to stderr; errors are also
// appended to the error log file unless the worker's stderr already is that file.
void initLogging(const std::string& error_log_path, bool daemon_mode);

void logInfo(const std::string& message);
void logWarn(const std::string& message);
void logError(const std::string& message);

// UTC ISO-8601 with milliseconds, e.g. 2025-01-31T12:00:00.123Z
std::string isoTimestampNow();
