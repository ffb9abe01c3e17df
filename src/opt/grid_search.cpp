#include "opt/grid_search.h"

#include <format>
#include <set>
#include <stdexcept>

double Combination::get(std::string_view name) const {
  for (size_t i = 0; i < names.size(); ++i)
    if (names[i] == name)
      return values[i];
  throw std::out_of_range(std::format("[grid] no axis named '{}'", name));
}

std::map<std::string, double> Combination::to_map() const {
  std::map<std::string, double> out;
  for (size_t i = 0; i < names.size(); ++i)
    out[names[i]] = values[i];
  return out;
}

std::string Combination::to_string() const {
  std::string out = "{";
  for (size_t i = 0; i < names.size(); ++i) {
    if (i > 0)
      out += ", ";
    out += std::format("{}={}", names[i], values[i]);
  }
  return out + "}";
}

GridSpace::GridSpace(std::vector<Axis> a, std::optional<size_t> max)
    : axes{std::move(a)}, max_combinations{max} {
  if (axes.empty())
    throw std::invalid_argument("[grid] at least one axis is required");

  std::set<std::string> seen;
  for (const auto& axis : axes) {
    if (axis.values.empty())
      throw std::invalid_argument(
          std::format("[grid] axis '{}' has no candidates", axis.name));
    if (!seen.insert(axis.name).second)
      throw std::invalid_argument(
          std::format("[grid] duplicate axis '{}'", axis.name));
  }
}

size_t GridSpace::total() const {
  size_t n = 1;
  for (const auto& axis : axes)
    n *= axis.values.size();
  return n;
}

size_t GridSpace::retained() const {
  auto n = total();
  return max_combinations ? std::min(n, *max_combinations) : n;
}

Combination GridSpace::at(size_t index) const {
  if (index >= total())
    throw std::out_of_range(
        std::format("[grid] combination {} out of {}", index, total()));

  Combination c;
  c.index = index;
  c.names.resize(axes.size());
  c.values.resize(axes.size());

  auto rest = index;
  for (size_t k = axes.size(); k-- > 0;) {
    const auto& axis = axes[k];
    c.names[k] = axis.name;
    c.values[k] = axis.values[rest % axis.values.size()];
    rest /= axis.values.size();
  }
  return c;
}

std::vector<Combination> GridSpace::enumerate() const {
  std::vector<Combination> out;
  auto n = retained();
  out.reserve(n);
  for (size_t i = 0; i < n; ++i)
    out.push_back(at(i));
  return out;
}
