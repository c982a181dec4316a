#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace unfence::log {

void init(const std::string& app_name);
void init(const std::string& app_name, const std::filesystem::path& log_path);
void shutdown();

// Console echo is on by default; the log file always receives every line.
void set_console_echo(bool enabled);

void info(std::string_view msg);
void warn(std::string_view msg);
void error(std::string_view msg);

std::vector<std::string> recent(size_t max_entries = 200);

} // namespace unfence::log
