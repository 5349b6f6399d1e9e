#include "lineplan/core/capacity_planner.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace lineplan::core {

namespace {

constexpr double kMaxMachineCount = static_cast<double>(std::numeric_limits<int>::max());

// A few ULPs of the ratio itself, so only rounding noise on an exact ratio is absorbed.
constexpr double kCountUlps = 4.0;

double ceil_machine_ratio(double smv, double target_output_per_day, double working_minutes_per_day) {
  const double ratio = smv * target_output_per_day / working_minutes_per_day;
  const double tolerance = std::abs(ratio) * kCountUlps * std::numeric_limits<double>::epsilon();
  return std::ceil(ratio - tolerance);
}

} // namespace

double TaktTimeMinutes(double target_output_per_day, double working_minutes_per_day) {
  return working_minutes_per_day / target_output_per_day;
}

int RequiredMachineCount(double smv, double target_output_per_day, double working_minutes_per_day) {
  if (!(smv > 0.0)) {
    return 1;
  }
  const double count = ceil_machine_ratio(smv, target_output_per_day, working_minutes_per_day);
  if (!(count <= kMaxMachineCount)) {
    return std::numeric_limits<int>::max();
  }
  return std::max(1, static_cast<int>(count));
}

PlanResult<bool> CheckDemand(double target_output_per_day, double working_minutes_per_day) {
  if (!std::isfinite(target_output_per_day) || target_output_per_day <= 0.0) {
    return make_plan_error<bool>(PlanError::kInvalidDemand, "target output per day must be > 0");
  }
  if (!std::isfinite(working_minutes_per_day) || working_minutes_per_day <= 0.0) {
    return make_plan_error<bool>(PlanError::kInvalidDemand, "working minutes per day must be > 0");
  }
  PlanResult<bool> result;
  result.ok = true;
  result.value = true;
  return result;
}

PlanResult<bool> CheckOperation(const Operation& operation, std::size_t index) {
  const std::string where = "operation #" + std::to_string(index);
  if (operation.op_no.empty()) {
    return make_plan_error<bool>(PlanError::kMalformedOperation, where + ": op_no is empty");
  }
  if (operation.machine_type.empty()) {
    return make_plan_error<bool>(PlanError::kMalformedOperation,
                                 where + " (" + operation.op_no + "): machine_type is empty");
  }
  if (!std::isfinite(operation.smv) || operation.smv < 0.0) {
    return make_plan_error<bool>(PlanError::kMalformedOperation,
                                 where + " (" + operation.op_no + "): smv must be a finite value >= 0");
  }
  PlanResult<bool> result;
  result.ok = true;
  result.value = true;
  return result;
}

PlanResult<std::vector<BalancedOperation>> PlanCapacity(const std::vector<Operation>& operations,
                                                        double target_output_per_day,
                                                        double working_minutes_per_day) {
  using Result = PlanResult<std::vector<BalancedOperation>>;
  const PlanResult<bool> demand = CheckDemand(target_output_per_day, working_minutes_per_day);
  if (!demand.ok) {
    return make_plan_error<std::vector<BalancedOperation>>(demand.code, demand.error);
  }

  Result result;
  result.value.reserve(operations.size());
  for (std::size_t i = 0; i < operations.size(); ++i) {
    const Operation& operation = operations[i];
    const PlanResult<bool> check = CheckOperation(operation, i);
    if (!check.ok) {
      return make_plan_error<std::vector<BalancedOperation>>(check.code, check.error);
    }
    if (operation.smv > 0.0 &&
        !(ceil_machine_ratio(operation.smv, target_output_per_day, working_minutes_per_day) <= kMaxMachineCount)) {
      return make_plan_error<std::vector<BalancedOperation>>(
          PlanError::kMalformedOperation,
          "operation #" + std::to_string(i) + " (" + operation.op_no + "): required machine count is out of range");
    }
    result.value.push_back(
        {operation, RequiredMachineCount(operation.smv, target_output_per_day, working_minutes_per_day)});
  }
  result.ok = true;
  return result;
}

} // namespace lineplan::core
