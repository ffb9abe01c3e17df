#include "ind/price_series.h"
#include "core/errors.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <format>

PriceSeries::PriceSeries(std::vector<Candle>&& c) : candles{std::move(c)} {
  for (size_t i = 0; i < candles.size(); ++i) {
    const auto& cur = candles[i];

    if (!std::isfinite(cur.open) || !std::isfinite(cur.high) ||
        !std::isfinite(cur.low) || !std::isfinite(cur.close) ||
        !std::isfinite(cur.volume))
      throw DataIntegrityError{
          i, std::format("[data] non-finite value in candle {} ({})", i,
                         cur.time())};

    if (cur.high < cur.low)
      throw DataIntegrityError{
          i, std::format("[data] candle {} ({}) has high {} < low {}", i,
                         cur.time(), cur.high, cur.low)};

    if (i > 0 && cur.timestamp <= candles[i - 1].timestamp)
      throw DataIntegrityError{
          i, std::format("[data] non-monotonic timestamp at candle {}: {} "
                         "after {}",
                         i, cur.timestamp, candles[i - 1].timestamp)};
  }

  if (!candles.empty())
    spdlog::debug("[data] {} candles, {} .. {}", candles.size(),
                  candles.front().time(), candles.back().time());
}

std::optional<size_t> PriceSeries::index_of(Timestamp ts) const {
  auto it = std::lower_bound(
      candles.begin(), candles.end(), ts,
      [](const Candle& c, Timestamp t) { return c.timestamp < t; });
  if (it == candles.end() || it->timestamp != ts)
    return std::nullopt;
  return static_cast<size_t>(it - candles.begin());
}
