#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "lineplan/core/id.hpp"

namespace lineplan::core {

enum class PlanError : std::uint8_t {
  kNone = 0,
  kInvalidDemand = 1,
  kMalformedOperation = 2,
  kInvalidSettings = 3,
  kIo = 4,
};

template <typename TValue>
struct PlanResult {
  bool ok = false;
  TValue value{};
  PlanError code = PlanError::kNone;
  std::string error{};
};

template <typename TValue>
PlanResult<TValue> make_plan_error(PlanError code, std::string message) {
  PlanResult<TValue> result;
  result.code = code;
  result.error = std::move(message);
  return result;
}

enum class ValidationSeverity : std::uint8_t {
  kError = 0,
  kWarning = 1,
};

struct ValidationIssue {
  ValidationSeverity severity = ValidationSeverity::kError;
  std::string code{};
  std::string message{};
  EntityId entity_id = kInvalidEntityId;
};

struct ValidationResult {
  std::vector<ValidationIssue> issues;

  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool ok() const { return !has_errors(); }
  [[nodiscard]] bool has_code(const std::string& code) const;
};

}  // namespace lineplan::core
