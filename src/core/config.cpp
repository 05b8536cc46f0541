#include "core/analysis.h"
#include "util/config.h"

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <glaze/glaze.hpp>
#include <iostream>
#include <thread>

namespace fs = std::filesystem;

template <typename T>
T read(const char* path) {
  T t{};

  if (!fs::exists(path)) {
    spdlog::info("[config] {} not found, using defaults", path);
    return t;
  }

  auto ec = glz::read_file_json(t, path, std::string{});
  if (ec)
    spdlog::error("[config] {} error {}", path, glz::format_error(ec));

  if (T::debug) {
    std::ofstream log{"logs/configs.log", std::ios::app};
    std::string buffer;
    auto _ = glz::write<glz::opts{.prettify = true}>(t, buffer);
    log << std::format("\"{}\": {}\n", T::name, buffer);
  }

  return t;
}

void Config::update() {
  fs::remove("logs/configs.log");

  api_config = read<APIConfig>("private/api.json");
  ind_config = read<IndicatorsConfig>("private/indicators.json");
  sr_config = read<SupportResistanceConfig>("private/support_resistance.json");
  pattern_config = read<PatternConfig>("private/patterns.json");
  trend_config = read<TrendConfig>("private/trend.json");
  score_config = read<ScoreConfig>("private/score.json");
}

inline Mode parse_mode(const std::string& mode) {
  if (mode == "comprehensive")
    return Mode::Comprehensive;
  if (mode == "trend")
    return Mode::Trend;
  if (mode == "levels")
    return Mode::Levels;
  if (mode == "technical")
    return Mode::Technical;
  if (mode == "watchlist")
    return Mode::Watchlist;
  throw std::invalid_argument(std::format("invalid mode '{}'", mode));
}

void Config::read_args(int argc, char* argv[]) {
  argparse::ArgumentParser program("sigscope");

  program.add_argument("-d", "--debug")
      .default_value(false)
      .implicit_value(true)
      .help("Enable debug");

  program.add_argument("-s", "--symbol")
      .default_value(symbol)
      .help("Instrument to analyze, e.g. BTCUSDT");

  program.add_argument("-t", "--timeframe")
      .default_value(timeframe_to_str(timeframe))
      .help("Timeframe for the comprehensive analysis: 15m, 1h, 4h or 1d");

  program.add_argument("-m", "--mode")
      .default_value(std::string{"technical"})
      .help("comprehensive, trend, levels, technical or watchlist");

  program.add_argument("-c", "--candles")
      .default_value(std::string{})
      .help("Read candles from <dir>/<SYMBOL>_<tf>.json instead of Binance");

  program.add_argument("-w", "--watchlist")
      .nargs(argparse::nargs_pattern::any)
      .default_value(std::vector<std::string>{})
      .help("Symbols for the watchlist mode");

  program.add_argument("-n", "--notify")
      .default_value(false)
      .implicit_value(true)
      .help("Send alerts to Telegram");

  auto def_nthreads = static_cast<size_t>(std::thread::hardware_concurrency());
  program.add_argument("--nthreads")
      .help("Max number of concurrent threads")
      .default_value(def_nthreads)
      .scan<'d', size_t>();

  try {
    program.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << "\n" << program << "\n";
    std::exit(1);
  }

  debug_en = program.get<bool>("--debug");
  tg_en = program.get<bool>("--notify");

  symbol = program.get<std::string>("--symbol");
  validate_symbol(symbol);
  timeframe = validate_timeframe(program.get<std::string>("--timeframe"));
  mode = parse_mode(program.get<std::string>("--mode"));

  candles_dir = program.get<std::string>("--candles");
  watchlist = program.get<std::vector<std::string>>("--watchlist");
  for (auto& s : watchlist)
    validate_symbol(s);

  n_concurrency = std::max<size_t>(program.get<size_t>("--nthreads"), 1);
}
