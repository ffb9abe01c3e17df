#include "ind/atr.h"
#include "core/errors.h"

#include <format>
#include <stdexcept>

ATR::ATR(const PriceSeries& series, int period)
    : series{series}, period{period} {
  if (period < 1)
    throw std::invalid_argument(
        std::format("[atr] period must be positive, got {}", period));
}

double mean_true_range(const PriceSeries& series, size_t idx, int period) {
  double total_tr = 0.0;
  for (size_t i = idx + 1 - period; i <= idx; ++i)
    total_tr += true_range(series.close(i - 1), series[i]);
  return total_tr / period;
}

std::optional<double> ATR::at(size_t idx) const {
  if (!defined(idx))
    return std::nullopt;
  return mean_true_range(series, idx, period);
}

double ATR::value(size_t idx) const {
  if (!defined(idx))
    throw InsufficientWindowError{std::format(
        "[atr] period {} undefined at index {} (series of {})", period, idx,
        series.size())};
  return mean_true_range(series, idx, period);
}
