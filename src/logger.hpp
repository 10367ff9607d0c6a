#pragma once

#include <cstdint>
#include <string>
#include <string_view>

enum class LogLevel { INFO, ERROR };
void Log(LogLevel level, std::string_view component, std::string_view message);

// Seconds since the epoch, negative values included, as YYYY-mm-ddTHH:MM:SSZ.
std::string FormatIsoUtc(int64_t timestamp_sec);
void RotateLogsIfNeeded(const std::string& path, uint64_t max_bytes, uint64_t max_files);
