#pragma once

#include <sstream>
#include <string_view>
#include <utility>

namespace mkdos_fuse::log {

enum class Level { debug = 0, info, warning, error };

void set_level(Level level) noexcept;
bool enabled(Level level) noexcept;

// Writes one line to stderr; lines from concurrent callers never interleave
void write(Level level, std::string_view message);

template<typename... Args>
void print(Level lvl, Args&&... args) {
    if (!enabled(lvl)) return;
    std::ostringstream out;
    (out << ... << std::forward<Args>(args));
    write(lvl, out.str());
}

template<typename... Args>
void debug(Args&&... args) { print(Level::debug, std::forward<Args>(args)...); }

template<typename... Args>
void info(Args&&... args) { print(Level::info, std::forward<Args>(args)...); }

template<typename... Args>
void warn(Args&&... args) { print(Level::warning, std::forward<Args>(args)...); }

template<typename... Args>
void error(Args&&... args) { print(Level::error, std::forward<Args>(args)...); }

} // namespace mkdos_fuse::log
