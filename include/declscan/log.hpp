#pragma once

#include <cstdio>
#include <string>

// Leveled printf-style logging for the file layer and tools. Lines look like
// "warn: message", with the level name coloured when the stream is a TTY.
namespace declscan::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// nullptr restores stderr. Colour is re-detected for the new stream.
void set_stream(std::FILE* stream);

// Overrides TTY detection until the next set_stream()
void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

// Accepts the lowercase names level_name() returns. `out` is left alone on
// failure.
bool parse_level(const std::string& name, Level& out);

} // namespace declscan::log
