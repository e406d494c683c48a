#pragma once

#include <clex/result.hpp>
#include <string>

namespace clex::log {

enum Level { Trace, Debug, Info, Warn, Error };

// Threshold defaults to Warn so a clean scan prints nothing on stderr
void set_level(Level lvl);
Level get_level();
bool enabled(Level lvl);

// Accepts the names level_name() produces
Result<Level> parse_level(const std::string& name);
const char* level_name(Level lvl);

// Color is on by default only when stderr is a terminal
void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Sets the threshold for the lifetime of the scope, then restores it
class ScopedLevel {
public:
    explicit ScopedLevel(Level lvl) : saved_(get_level()) { set_level(lvl); }
    ~ScopedLevel() { set_level(saved_); }

    ScopedLevel(const ScopedLevel&) = delete;
    ScopedLevel& operator=(const ScopedLevel&) = delete;

private:
    Level saved_;
};

} // namespace clex::log
