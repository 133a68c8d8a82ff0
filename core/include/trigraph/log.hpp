#pragma once

/**
 * @file log.hpp
 * @brief Process-global, tagged diagnostic log.
 *
 * Lines go to stderr and, optionally, to an append-mode file:
 *
 *   [1718031234567] [info] [store] opened graph.nodes.graph (3 nodes)
 *
 * The minimum level defaults to `warn` and can be overridden at startup with
 * the TRIGRAPH_LOG_LEVEL environment variable (trace|info|warn|error|off).
 */

#include <cstdint>
#include <string_view>

namespace trigraph::log {

enum class Level : uint32_t {
  trace = 0,
  info = 1,
  warn = 2,
  error = 3,
  off = 4,
};

void set_level(Level min_level) noexcept;
Level get_level() noexcept;

void enable_console(bool on) noexcept;
bool set_file(const char *path) noexcept;
void close_file() noexcept;

void write(Level lvl, std::string_view tag, std::string_view msg);

inline void trace(std::string_view tag, std::string_view msg) {
  write(Level::trace, tag, msg);
}
inline void info(std::string_view tag, std::string_view msg) {
  write(Level::info, tag, msg);
}
inline void warn(std::string_view tag, std::string_view msg) {
  write(Level::warn, tag, msg);
}
inline void error(std::string_view tag, std::string_view msg) {
  write(Level::error, tag, msg);
}

} // namespace trigraph::log
