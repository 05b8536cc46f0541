#include "core/alerts.h"
#include "core/analyzer.h"
#include "core/market_data.h"
#include "core/serialization.h"
#include "core/telegram.h"
#include "util/config.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace fs = std::filesystem;

inline void init_logging(const Config& config) {
  auto pwd = fs::current_path().generic_string();
  auto log_name = std::format("{}/logs/{:%F_%R}.log", pwd, SysClock::now());
  auto link_name = pwd + "/logs/output.log";

  fs::remove(link_name);
  fs::create_symlink(log_name, link_name);

  auto file_logger = spdlog::basic_logger_mt("file_logger", log_name);
  spdlog::set_default_logger(file_logger);

  auto level = config.debug_en ? spdlog::level::debug : spdlog::level::info;
  spdlog::set_level(level);
  spdlog::flush_on(level);

  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");
}

inline void ensure_directories_exist(const std::vector<std::string>& dirs) {
  for (const auto& dir : dirs) {
    fs::path path{dir};
    if (fs::exists(path))
      continue;
    if (fs::create_directories(path))
      std::cout << "Created: " << dir << '\n';
    else
      std::cerr << "Failed to create: " << dir << '\n';
  }
}

inline std::unique_ptr<CandleProvider> make_provider(const Config& config) {
  if (config.candles_dir != "")
    return std::make_unique<CandleFiles>(config.candles_dir);

  auto binance = std::make_unique<Binance>(config.api_config);
  if (!binance->connect())
    std::cerr << "[binance] could not connect, see logs/output.log\n";
  return binance;
}

inline void run(const Config& config) {
  auto provider = make_provider(config);
  Analyzer analyzer{*provider, config};
  TG tg{config.api_config, config.tg_en};

  auto notify = [&](const auto& analysis) {
    auto alert = make_alert(analysis);
    if (alert.severity < Severity::High)
      return;
    if (tg.send(alert) < 0)
      spdlog::debug("[tg] alert '{}' not sent", alert.title);
  };

  switch (config.mode) {
    case Mode::Comprehensive: {
      auto res = analyzer.comprehensive(config.symbol, config.timeframe);
      notify(res);
      std::cout << to_json(res) << std::endl;
      break;
    }
    case Mode::Trend:
      std::cout << to_json(analyzer.trend(config.symbol)) << std::endl;
      break;
    case Mode::Levels:
      std::cout << to_json(analyzer.levels(config.symbol)) << std::endl;
      break;
    case Mode::Technical: {
      auto res = analyzer.technical(config.symbol);
      notify(res);
      std::cout << to_json(res) << std::endl;
      break;
    }
    case Mode::Watchlist: {
      auto res = analyzer.watchlist(config.watchlist, config.timeframe);
      for (auto& analysis : res)
        notify(analysis);
      std::cout << to_json(res) << std::endl;
      break;
    }
  }
}

int main(int argc, char* argv[]) {
  ensure_directories_exist({"logs", "private"});

  Config config;
  try {
    config.read_args(argc, argv);
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }

  init_logging(config);
  config.update();

  try {
    run(config);
  } catch (const std::invalid_argument& e) {
    spdlog::error("[main] {}", e.what());
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}
