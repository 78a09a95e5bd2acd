#pragma once

#include <tprefix/result.hpp>
#include <string>
#include <cstdio>

namespace tprefix::log {

enum Level { Trace, Debug, Info, Warn, Error };

// Level and color flags are atomic; each message is a single write to
// stderr, so logging from several threads never interleaves within a line.
void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Inverse of level_name(); unknown names are a Config error
Result<Level> parse_level(const std::string& name);

} // namespace tprefix::log
