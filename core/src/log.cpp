#include "unfence/log.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace unfence::log {

namespace {
std::mutex g_log_mutex;
std::ofstream g_log_file;
std::deque<std::string> g_ring;
constexpr size_t kRingMax = 200;
std::string g_app_name = "unfence";
bool g_console_echo = true;

std::string timestamp_now() {
  using namespace std::chrono;
  const auto now = system_clock::now();
  const auto tt = system_clock::to_time_t(now);
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &tt);
#else
  localtime_r(&tt, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

void log_line(const char* level, std::string_view msg) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const std::string line = "[" + timestamp_now() + "][" + level + "] " + std::string(msg);
  if (g_console_echo) {
    std::cout << line << "\n";
  }
  if (g_log_file.is_open()) {
    g_log_file << line << "\n";
    g_log_file.flush();
  }
  g_ring.push_back(line);
  if (g_ring.size() > kRingMax) {
    g_ring.pop_front();
  }
}
} // namespace

void init(const std::string& app_name) {
  {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_app_name = app_name;
    if (g_log_file.is_open()) {
      g_log_file.close();
    }
  }
  log_line("INFO", g_app_name + ": log init (console only)");
}

void init(const std::string& app_name, const std::filesystem::path& log_path) {
  bool opened = false;
  {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_app_name = app_name;
    if (g_log_file.is_open()) {
      g_log_file.close();
    }
    if (log_path.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(log_path.parent_path(), ec);
    }
    g_log_file.open(log_path, std::ios::out | std::ios::app);
    opened = g_log_file.is_open();
  }
  log_line("INFO", g_app_name + ": log init");
  if (!opened) {
    log_line("WARN", std::string("log file unavailable: ") + log_path.string());
  }
#if defined(_WIN32)
  log_line("INFO", "platform: windows");
#elif defined(__linux__)
  log_line("INFO", "platform: linux");
#else
  log_line("INFO", "platform: unknown");
#endif
#ifdef UNFENCE_DEBUG
  log_line("INFO", "build: debug");
#else
  log_line("INFO", "build: release");
#endif
}

void shutdown() {
  log_line("INFO", "log shutdown");
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (g_log_file.is_open()) {
    g_log_file.close();
  }
}

void set_console_echo(bool enabled) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  g_console_echo = enabled;
}

void info(std::string_view msg) {
  log_line("INFO", msg);
}

void warn(std::string_view msg) {
  log_line("WARN", msg);
}

void error(std::string_view msg) {
  log_line("ERROR", msg);
}

std::vector<std::string> recent(size_t max_entries) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const size_t count = std::min(max_entries, g_ring.size());
  return std::vector<std::string>(g_ring.end() - count, g_ring.end());
}

} // namespace unfence::log
