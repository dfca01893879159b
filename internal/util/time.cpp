#include "time.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace mapper::util {

TimePoint Now() {
  return TruncateToMicros(Clock::now());
}

TimePoint TruncateToMicros(TimePoint tp) {
  return FromUnixMicros(ToUnixMicros(tp));
}

int64_t ToUnixMicros(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMicros(int64_t micros) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::microseconds(micros));
}

std::string FormatIso8601(TimePoint tp) {
  const int64_t micros  = ToUnixMicros(tp);
  int64_t       seconds = micros / 1000000;
  int64_t       frac    = micros % 1000000;
  if (frac < 0) {
    frac += 1000000;
    --seconds;
  }

  const std::time_t tt = static_cast<std::time_t>(seconds);
  std::tm           utc{};
  gmtime_r(&tt, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
  if (frac != 0) {
    out << '.' << std::setw(6) << std::setfill('0') << frac;
  }
  out << 'Z';
  return out.str();
}

std::optional<TimePoint> ParseIso8601(const std::string& text) {
  if (text.size() < 19) {
    return std::nullopt;
  }

  std::string head = text.substr(0, 19);
  if (head[10] == ' ') head[10] = 'T';

  std::tm            utc{};
  std::istringstream in(head);
  in >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
  if (in.fail()) {
    return std::nullopt;
  }

  std::size_t pos   = 19;
  int64_t     micro = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    int digits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      if (digits == 6) return std::nullopt;
      micro = micro * 10 + (text[pos] - '0');
      ++digits;
      ++pos;
    }
    if (digits == 0) return std::nullopt;
    for (; digits < 6; ++digits) micro *= 10;
  }
  if (pos < text.size() && text[pos] == 'Z') {
    ++pos;
  }
  if (pos != text.size()) {
    return std::nullopt;
  }

  const std::time_t seconds = timegm(&utc);
  return FromUnixMicros(static_cast<int64_t>(seconds) * 1000000 + micro);
}

} // namespace mapper::util
