//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "utils/clock/time_provider.hpp"

#include <cctype>
#include <cstdint>
#include <ctime>
#include <format>
#include <iomanip>
#include <sstream>
#include <string>

namespace oolong {
namespace {
struct SplitTime {
  std::tm tm{};
  int64_t micros = 0;
};

auto Split(const std::chrono::system_clock::time_point& tp) -> SplitTime {
  using namespace std::chrono;
  auto        us     = duration_cast<microseconds>(tp.time_since_epoch());
  auto        secs   = duration_cast<seconds>(us);
  int64_t     micros = (us - secs).count();
  if (micros < 0) {
    micros += 1'000'000;
    secs -= seconds(1);
  }
  std::time_t t = static_cast<std::time_t>(secs.count());
  SplitTime   out;
  gmtime_r(&t, &out.tm);
  out.micros = micros;
  return out;
}
}  // namespace

// Catalog timestamps carry microseconds, so does every value handed out here
auto TimeProvider::Now() -> std::chrono::system_clock::time_point {
  return std::chrono::floor<std::chrono::microseconds>(std::chrono::system_clock::now());
}

auto TimeProvider::ToSqlTimestamp(const std::chrono::system_clock::time_point& tp)
    -> std::string {
  SplitTime          split = Split(tp);
  std::ostringstream oss;
  oss << std::put_time(&split.tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(6)
      << std::setfill('0') << split.micros;
  return oss.str();
}

auto TimeProvider::ToFileStamp(const std::chrono::system_clock::time_point& tp) -> std::string {
  SplitTime          split = Split(tp);
  std::ostringstream oss;
  oss << std::put_time(&split.tm, "%Y%m%d_%H%M%S") << '_' << std::setw(6) << std::setfill('0')
      << split.micros;
  return oss.str();
}

auto TimeProvider::FromSqlTimestamp(std::string_view value)
    -> std::optional<std::chrono::system_clock::time_point> {
  std::string        text(value);
  std::tm            tm{};
  std::istringstream iss(text);
  iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
  if (iss.fail()) {
    return std::nullopt;
  }

  int64_t micros = 0;
  if (iss.peek() == '.') {
    iss.get();
    int digits = 0;
    while (std::isdigit(iss.peek())) {
      int d = iss.get() - '0';
      if (digits < 6) {
        micros = micros * 10 + d;
      }
      ++digits;
    }
    for (int i = digits; i < 6; ++i) {
      micros *= 10;
    }
  }
  auto secs = std::chrono::system_clock::from_time_t(timegm(&tm));
  return secs + std::chrono::microseconds(micros);
}
}  // namespace oolong
