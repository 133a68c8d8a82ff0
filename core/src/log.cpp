#include "trigraph/log.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <string>

namespace trigraph::log {

namespace {

std::mutex g_mtx;
bool g_console = true;
std::FILE *g_file = nullptr;

Level parse_level(const char *text, Level fallback) noexcept {
  if (!text)
    return fallback;
  std::string_view v{text};
  if (v == "trace")
    return Level::trace;
  if (v == "info")
    return Level::info;
  if (v == "warn")
    return Level::warn;
  if (v == "error")
    return Level::error;
  if (v == "off")
    return Level::off;
  return fallback;
}

Level &min_level() noexcept {
  static Level lvl = parse_level(std::getenv("TRIGRAPH_LOG_LEVEL"), Level::warn);
  return lvl;
}

constexpr std::string_view lvl_text(Level lvl) noexcept {
  switch (lvl) {
  case Level::trace:
    return "trace";
  case Level::info:
    return "info";
  case Level::warn:
    return "warn";
  case Level::error:
    return "error";
  case Level::off:
    return "off";
  }
  return "unknown";
}

uint64_t now_ms() noexcept {
  using clock = std::chrono::system_clock;
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          clock::now().time_since_epoch())
          .count());
}

} // namespace

void set_level(Level lvl) noexcept {
  std::lock_guard lock(g_mtx);
  min_level() = lvl;
}

Level get_level() noexcept {
  std::lock_guard lock(g_mtx);
  return min_level();
}

void enable_console(bool on) noexcept {
  std::lock_guard lock(g_mtx);
  g_console = on;
}

bool set_file(const char *path) noexcept {
  std::lock_guard lock(g_mtx);
  if (g_file) {
    std::fclose(g_file);
    g_file = nullptr;
  }
  if (!path)
    return false;
  g_file = std::fopen(path, "a");
  return g_file != nullptr;
}

void close_file() noexcept {
  std::lock_guard lock(g_mtx);
  if (g_file) {
    std::fclose(g_file);
    g_file = nullptr;
  }
}

void write(Level lvl, std::string_view tag, std::string_view msg) {
  std::lock_guard lock(g_mtx);
  Level floor = min_level();
  if (floor == Level::off || lvl < floor || lvl == Level::off)
    return;

  std::string line = "[" + std::to_string(now_ms()) + "] [";
  line += lvl_text(lvl);
  line += "] [";
  line += tag;
  line += "] ";
  line += msg;
  line += '\n';

  if (g_console)
    std::fwrite(line.data(), 1, line.size(), stderr);
  if (g_file) {
    std::fwrite(line.data(), 1, line.size(), g_file);
    std::fflush(g_file);
  }
}

} // namespace trigraph::log
