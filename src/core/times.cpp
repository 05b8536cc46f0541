#include "util/times.h"

#include <format>

using namespace std::chrono;

std::string timeframe_to_str(minutes timeframe) {
  if (timeframe >= D_1 && timeframe % D_1 == minutes{0})
    return std::format("{}d", timeframe / D_1);
  if (timeframe >= hours{1} && timeframe % hours{1} == minutes{0})
    return std::format("{}h", duration_cast<hours>(timeframe).count());
  return std::format("{}m", timeframe.count());
}

std::optional<minutes> parse_timeframe(std::string_view label) {
  for (auto timeframe : timeframes)
    if (timeframe_to_str(timeframe) == label)
      return timeframe;
  return std::nullopt;
}

// UTC, "YYYY-MM-DD HH:MM:SS"
std::string timestamp_to_string(Timestamp ts) {
  sys_time<milliseconds> tp{milliseconds{ts}};
  auto day = floor<days>(tp);
  year_month_day ymd{day};
  hh_mm_ss hms{floor<seconds>(tp - day)};

  return std::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}",
                     static_cast<int>(ymd.year()),
                     static_cast<unsigned>(ymd.month()),
                     static_cast<unsigned>(ymd.day()), hms.hours().count(),
                     hms.minutes().count(), hms.seconds().count());
}
