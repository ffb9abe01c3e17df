#pragma once

#include "util/times.h"

#include <string>
#include <vector>

struct Candle {
  Timestamp timestamp = 0;
  double open = 0.0;
  double high = 0.0;
  double low = 0.0;
  double close = 0.0;
  double volume = 0.0;

  double price() const { return close; }
  double range() const { return high - low; }
  double body() const { return close > open ? close - open : open - close; }
  std::string time() const { return timestamp_to_string(timestamp); }
};
