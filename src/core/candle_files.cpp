#include "core/market_data.h"

#include <spdlog/spdlog.h>
#include <glaze/glaze.hpp>

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

std::string CandleFiles::path(const std::string& symbol,
                              minutes timeframe) const {
  auto name = symbol;
  std::erase_if(name, [](char c) { return c == '/' || c == '-'; });
  return (fs::path{dir} / (name + "_" + timeframe_to_str(timeframe) + ".json"))
      .string();
}

std::vector<Candle> CandleFiles::candles(
    const std::string& symbol,
    minutes timeframe,
    size_t limit,
    const std::optional<TimeRange>& range) {
  auto file = path(symbol, timeframe);
  if (!fs::exists(file)) {
    spdlog::error("[files] {} not found", file);
    return {};
  }

  constexpr auto opts = glz::opts{.error_on_unknown_keys = false};

  std::vector<Candle> candles;
  auto ec = glz::read_file_json<opts>(candles, file, std::string{});
  if (ec) {
    spdlog::error("[files] {} json error: {}", file, glz::format_error(ec));
    return {};
  }

  std::stable_sort(candles.begin(), candles.end(), [](auto& l, auto& r) {
    return l.open_time < r.open_time;
  });

  // keep the first record of a repeated open time
  auto dup = std::unique(candles.begin(), candles.end(), [](auto& l, auto& r) {
    return l.open_time == r.open_time;
  });
  candles.erase(dup, candles.end());

  if (range)
    std::erase_if(candles, [&range](auto& c) {
      return c.open_time < range->start || c.open_time > range->end;
    });

  if (candles.size() > limit)
    candles.erase(candles.begin(), candles.end() - limit);
  return candles;
}
