#include "log.h"

#include <atomic>
#include <iostream>
#include <mutex>

namespace mkdos_fuse::log {

namespace {

std::atomic<Level> g_level{Level::info};
std::mutex g_mutex;

const char* tag(Level level) {
    switch (level) {
    case Level::debug:   return "[debug] ";
    case Level::info:    return "[info] ";
    case Level::warning: return "[warn] ";
    case Level::error:   return "[error] ";
    }
    return "";
}

} // namespace

void set_level(Level level) noexcept {
    g_level.store(level);
}

bool enabled(Level lvl) noexcept {
    return static_cast<int>(lvl) >= static_cast<int>(g_level.load());
}

void write(Level lvl, std::string_view message) {
    std::lock_guard<std::mutex> lock(g_mutex);
    std::cerr << "mkdos-fuse: " << tag(lvl) << message << '\n';
}

} // namespace mkdos_fuse::log
