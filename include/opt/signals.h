#pragma once

#include "ind/price_series.h"
#include "opt/breakout.h"
#include "opt/range.h"

#include <optional>
#include <string>
#include <vector>

// A key candle with its range and what happened to it within the breakout
// horizon. `is_valid` is false when price stayed inside the range.
struct Signal {
  Timestamp key_candle_time;
  std::string key_candle_date;
  double reference_price;
  double upper_limit;
  double lower_limit;
  double atr_value;

  std::string direction;
  double breakout_percentage;
  bool is_valid;
  std::optional<Timestamp> breakout_time;
  std::optional<double> breakout_price;
  size_t candles_to_breakout;
};

// Joins each breakout back to its range, one signal per breakout.
std::vector<Signal> collect_signals(const PriceSeries& series,
                                    const std::vector<RangeResult>& ranges,
                                    const std::vector<BreakoutResult>& breakouts);
