#include "core/errors.h"

#include <format>

namespace {

std::string describe(const std::string& stage,
                     const std::vector<CombinationFailure>& failures) {
  auto msg = std::format("[{}] no viable parameters: all {} combinations failed",
                         stage, failures.size());
  if (!failures.empty()) {
    const auto& f = failures.front();
    msg += std::format(" (first: #{} {}: {})", f.index, f.combination, f.cause);
  }
  return msg;
}

}  // namespace

NoViableParametersError::NoViableParametersError(
    std::string stage,
    std::vector<CombinationFailure> failures)
    : std::runtime_error{describe(stage, failures)},
      stage{std::move(stage)},
      failures{std::move(failures)} {}

LineageViolationError::LineageViolationError(std::string table,
                                             std::int64_t missing_id,
                                             const std::string& reason)
    : std::runtime_error{std::format("[store] lineage violation: {} row {} {}",
                                     table, missing_id, reason)},
      table{std::move(table)},
      missing_id{missing_id} {}

OptimizationCancelled::OptimizationCancelled(std::string stage)
    : std::runtime_error{std::format("[{}] optimization cancelled", stage)},
      stage{std::move(stage)} {}

int exit_code(const std::exception& ex) {
  if (dynamic_cast<const DataIntegrityError*>(&ex))
    return 1;
  if (dynamic_cast<const NoViableParametersError*>(&ex))
    return 2;
  if (dynamic_cast<const OptimizationCancelled*>(&ex))
    return 3;
  return 4;
}
