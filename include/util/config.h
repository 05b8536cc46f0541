#pragma once

#include "util/times.h"

#include <string>
#include <vector>

struct IndicatorsConfig {
  static constexpr const char* name = "ind_config";
  static constexpr bool debug = true;

  int sma_short = 20;
  int sma_long = 50;
  int ema_fast = 12;
  int ema_slow = 26;

  int macd_fast = 12;
  int macd_slow = 26;
  int macd_signal = 9;

  int rsi_period = 14;

  int bb_period = 20;
  double bb_std_dev = 2.0;

  int stoch_k = 14;
  int stoch_d = 3;

  int williams_period = 14;
  int momentum_period = 10;

  // avoids a zero division in rsi when a window has no losses
  double rsi_loss_floor = 0.0001;
};

struct SupportResistanceConfig {
  static constexpr const char* name = "sr_config";
  static constexpr bool debug = true;

  size_t n_candles = 200;

  // swing levels
  size_t swing_lookback = 5;
  double side_margin = 0.001;
  double range_vol_mult = 0.5;

  double near_distance = 0.05;
  double mid_distance = 0.10;

  double low_volatility = 0.02;
  double high_volatility = 0.05;

  double base_conf = 50.0;
  double touch_conf = 10.0;

  // volume anomaly levels
  double volume_mult = 2.0;
  double volume_side_margin = 0.005;
  double volume_range = 0.005;
  double volume_conf = 70.0;

  // consolidation
  double merge_tolerance = 0.01;
  double merge_conf_step = 10.0;
  double min_conf = 40.0;

  // activity and position
  size_t active_lookback = 10;
  double break_buffer = 0.01;
  double approach_distance = 2.0;  // percent
  double zone_min_conf = 60.0;

  // touch based pattern levels
  size_t pl_min_candles = 50;
  size_t pl_window = 5;
  double pl_touch_tolerance = 0.005;
  size_t pl_min_touches = 2;
  int pl_max_strength = 10;
  double pl_merge_tolerance = 0.005;
};

struct PatternConfig {
  static constexpr const char* name = "pattern_config";
  static constexpr bool debug = true;

  // box
  double box_min_height = 0.02;
  double box_max_height = 0.15;
  size_t box_min_duration = 20;
  double box_within_ratio = 0.7;
  double box_tolerance = 0.01;
  size_t box_min_touches = 2;
  double box_max_conf = 95.0;

  // breakout
  double breakout_proximity = 0.01;
  size_t breakout_volume_window = 20;
  double breakout_volume_mult = 1.5;
  double breakout_volume_bonus = 20.0;
  double breakout_strength_conf = 5.0;
  double breakout_pct_mult = 1000.0;
  double breakout_pct_cap = 15.0;
  double breakout_min_conf = 60.0;
  double breakout_max_conf = 95.0;

  // trend run
  size_t trend_period = 20;
  size_t trend_min_candles = 5;
  double trend_min_strength = 0.6;

  // double top/bottom and head and shoulders
  bool reversal_en = false;
};

struct TrendConfig {
  static constexpr const char* name = "trend_config";
  static constexpr bool debug = true;

  size_t n_candles = 200;

  int ema_fast = 20;
  int ema_mid = 60;
  int ema_slow = 120;

  size_t slope_window = 10;
  double strong_slope = 0.002;
  double slope = 0.001;
  double strong_extension = 0.05;

  size_t momentum_window = 5;
  size_t consistency_window = 10;
  size_t volatility_window = 20;
  double low_volatility = 0.02;
  double high_volatility = 0.05;

  size_t divergence_window = 20;
  double divergence_price = 0.02;
  double divergence_ema = 0.05;

  double strong_threshold = 2.5;
  double threshold = 1.5;
  double weak_threshold = 0.5;

  double aligned_ratio = 0.75;
  double suggestion_alignment = 80.0;
  double wait_alignment = 50.0;
  double alignment_bonus = 0.2;
};

struct ScoreConfig {
  static constexpr const char* name = "score_config";
  static constexpr bool debug = true;

  size_t n_candles = 100;
  size_t min_candles = 20;

  double signal_threshold = 20.0;
  double max_signal_conf = 95.0;

  double hist_mult = 1000.0;
  double hist_cap = 50.0;

  double band_edge = 0.2;
  double band_bonus = 10.0;
  double width_mult = 500.0;

  double pattern_trend_weight = 20.0;
  double pattern_momentum_weight = 15.0;

  double strong_pattern_conf = 70.0;
  int strong_level_strength = 5;
};

struct APIConfig {
  static constexpr const char* name = "api_config";
  static constexpr bool debug = false;

  std::string binance_url = "https://api.binance.com";
  int timeout_ms = 10000;
  size_t max_calls_min = 600;
  int max_reconnects = 3;  // consecutive failed reconnects before giving up

  std::string tg_token;
  std::string tg_chat_id;
};

enum class Mode {
  Comprehensive,
  Trend,
  Levels,
  Technical,
  Watchlist,
};

struct Config {
  bool debug_en = false;
  bool tg_en = false;

  Mode mode = Mode::Technical;
  std::string symbol = "BTCUSDT";
  minutes timeframe = H_1;
  std::string candles_dir = "";
  std::vector<std::string> watchlist = {};

  size_t n_concurrency = 1;

  APIConfig api_config;
  IndicatorsConfig ind_config;
  SupportResistanceConfig sr_config;
  PatternConfig pattern_config;
  TrendConfig trend_config;
  ScoreConfig score_config;

  Config() = default;
  void read_args(int argc, char* argv[]);
  void update();
};
