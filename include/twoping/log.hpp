/**
 * @file log.hpp
 * @brief Heap-free `key=value` log lines and a pluggable sink.
 *
 * Lines look like the status lines of the command-line tools:
 *
 *     event=drop reason=checksum_mismatch len=128 peer=192.0.2.7:40000
 *
 * A LogLine is built in a fixed-capacity ETL string (overlong lines are clipped)
 * and handed to a LogSink, a plain function pointer so the same core runs with a
 * stderr sink on Linux, a Serial sink on a board, or no sink at all.
 *
 * @code
 * twoping::LogLine("event", "drop").kv("reason", "bad_magic").kv("len", 3u).emit(sink);
 * @endcode
 */
#ifndef TWOPING_LOG_HPP
#define TWOPING_LOG_HPP

#include "etl/string.h"
#include <stdint.h>
#include <stddef.h>

namespace twoping {

static constexpr size_t LOG_LINE_MAX = 192;

using LogStr  = etl::string<LOG_LINE_MAX>;

/// Receives one complete, NUL-terminated line (no trailing newline).
using LogSink = void (*)(const char* line);

class LogLine {
public:
  /// Starts the line with `key=value`.
  LogLine(const char* key, const char* value);

  LogLine& kv(const char* key, const char* value);
  LogLine& kv(const char* key, uint32_t value);

  /// Value as 0x-prefixed uppercase hex, zero-padded to @p digits.
  LogLine& kv_hex(const char* key, uint32_t value, uint8_t digits = 4);

  const LogStr& str() const { return line_; }
  const char*   c_str() const { return line_.c_str(); }

  /// Hand the line to @p sink; no-op when sink is null.
  void emit(LogSink sink) const;

private:
  void append_key(const char* key);

  LogStr line_;
};

} // namespace twoping

#endif // TWOPING_LOG_HPP
