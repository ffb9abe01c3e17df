#include "opt/signals.h"
#include "core/errors.h"

#include <format>

std::vector<Signal> collect_signals(
    const PriceSeries& series,
    const std::vector<RangeResult>& ranges,
    const std::vector<BreakoutResult>& breakouts) {
  std::vector<Signal> out;

  for (const auto& b : breakouts) {
    if (b.range_idx >= ranges.size())
      throw LineageViolationError{"range_result",
                                  static_cast<std::int64_t>(b.range_idx)};

    const auto& r = ranges[b.range_idx];
    Signal s{
        .key_candle_time = r.timestamp,
        .key_candle_date = timestamp_to_string(r.timestamp),
        .reference_price = r.reference_price,
        .upper_limit = r.upper_limit,
        .lower_limit = r.lower_limit,
        .atr_value = r.atr_value,
        .direction = std::string{to_string(b.direction)},
        .breakout_percentage = b.breakout_percentage,
        .is_valid = b.is_valid,
        .breakout_time = std::nullopt,
        .breakout_price = std::nullopt,
        .candles_to_breakout = b.candles_to_breakout,
    };
    if (b.breakout_idx) {
      s.breakout_time = series.time(*b.breakout_idx);
      s.breakout_price = series.close(*b.breakout_idx);
    }
    out.push_back(std::move(s));
  }
  return out;
}
