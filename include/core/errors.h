#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// Malformed or out-of-order input. Raised before any stage runs.
struct DataIntegrityError : std::runtime_error {
  size_t index;

  DataIntegrityError(size_t index, const std::string& what)
      : std::runtime_error{what}, index{index} {}
};

// A parameter combination cannot produce a defined value over the series.
struct InsufficientWindowError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct CombinationFailure {
  size_t index;
  std::string combination;
  std::string cause;
};

// Every combination of a stage's sweep failed.
struct NoViableParametersError : std::runtime_error {
  std::string stage;
  std::vector<CombinationFailure> failures;

  NoViableParametersError(std::string stage,
                          std::vector<CombinationFailure> failures);
};

// A row references an upstream row that does not exist, or one that
// belongs to another run.
struct LineageViolationError : std::runtime_error {
  std::string table;
  std::int64_t missing_id;

  LineageViolationError(std::string table,
                        std::int64_t missing_id,
                        const std::string& reason = "does not exist");
};

struct OptimizationCancelled : std::runtime_error {
  std::string stage;

  explicit OptimizationCancelled(std::string stage);
};

// Process exit status for an error that ended a run: 1 data, 2 no viable
// parameters, 3 cancelled, 4 anything else.
int exit_code(const std::exception& ex);
