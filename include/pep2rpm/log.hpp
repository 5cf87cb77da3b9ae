#pragma once

#include <pep2rpm/result.hpp>
#include <string>
#include <cstdio>

namespace pep2rpm::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// Parse a level name as accepted by --log-level: "trace" .. "error"
Result<Level> parse_level(const std::string& name);

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Messages may be emitted from convert_parallel workers; each line is
// written under a lock so lines never interleave.
void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

} // namespace pep2rpm::log
