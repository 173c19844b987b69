// -----------------------------------------------------------------------------
// log.cpp: LogLine formatting.
//
// No snprintf: digits are produced by hand so the same code links on boards
// without a printf implementation.
// -----------------------------------------------------------------------------
#include "twoping/log.hpp"

namespace twoping {

LogLine::LogLine(const char* key, const char* value) {
  kv(key, value);
}

void LogLine::append_key(const char* key) {
  if (!line_.empty()) line_ += ' ';
  line_.append(key ? key : "?");
  line_ += '=';
}

LogLine& LogLine::kv(const char* key, const char* value) {
  append_key(key);
  line_.append(value ? value : "");
  return *this;
}

LogLine& LogLine::kv(const char* key, uint32_t value) {
  append_key(key);
  char tmp[10];
  size_t n = 0;
  do {
    tmp[n++] = static_cast<char>('0' + (value % 10));
    value /= 10;
  } while (value != 0 && n < sizeof(tmp));
  while (n > 0) line_ += tmp[--n];
  return *this;
}

LogLine& LogLine::kv_hex(const char* key, uint32_t value, uint8_t digits) {
  static const char* DIGITS = "0123456789ABCDEF";
  append_key(key);
  line_.append("0x");
  if (digits == 0) digits = 1;
  if (digits > 8)  digits = 8;
  for (int shift = (digits - 1) * 4; shift >= 0; shift -= 4) {
    line_ += DIGITS[(value >> shift) & 0x0F];
  }
  return *this;
}

void LogLine::emit(LogSink sink) const {
  if (sink) sink(line_.c_str());
}

} // namespace twoping
