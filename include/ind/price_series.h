#pragma once

#include "ind/candle.h"

#include <optional>
#include <vector>

/**
 * @brief Immutable, time-ordered sequence of candles.
 *
 * Construction validates the input: timestamps must be strictly increasing
 * and every candle must have high >= low, otherwise DataIntegrityError is
 * thrown. Once built, the series is only ever read, so it is shared across
 * worker threads by const reference.
 */
class PriceSeries {
  std::vector<Candle> candles;

 public:
  PriceSeries() noexcept = default;
  explicit PriceSeries(std::vector<Candle>&& candles);

  auto size() const { return candles.size(); }
  bool empty() const { return candles.empty(); }

  const Candle& operator[](size_t idx) const { return candles[idx]; }
  auto begin() const { return candles.begin(); }
  auto end() const { return candles.end(); }

  Timestamp time(size_t idx) const { return candles[idx].timestamp; }
  double open(size_t idx) const { return candles[idx].open; }
  double high(size_t idx) const { return candles[idx].high; }
  double low(size_t idx) const { return candles[idx].low; }
  double close(size_t idx) const { return candles[idx].close; }
  double volume(size_t idx) const { return candles[idx].volume; }

  Timestamp first_time() const { return candles.front().timestamp; }
  Timestamp last_time() const { return candles.back().timestamp; }

  // Index of the candle with exactly this timestamp.
  std::optional<size_t> index_of(Timestamp ts) const;
};
