#pragma once

#include <cstddef>
#include <vector>

#include "lineplan/core/entities.hpp"
#include "lineplan/core/result.hpp"

namespace lineplan::core {

// Minutes available per unit of output. Callers must check the demand first.
[[nodiscard]] double TaktTimeMinutes(double target_output_per_day, double working_minutes_per_day);

// ceil(smv * target / working), never below one station. Saturates at INT_MAX.
[[nodiscard]] int RequiredMachineCount(double smv, double target_output_per_day, double working_minutes_per_day);

[[nodiscard]] PlanResult<bool> CheckDemand(double target_output_per_day, double working_minutes_per_day);
[[nodiscard]] PlanResult<bool> CheckOperation(const Operation& operation, std::size_t index);

// Line balancing. Output keeps input order, one entry per operation.
// An operation whose machine count does not fit in an int fails as MalformedOperation.
[[nodiscard]] PlanResult<std::vector<BalancedOperation>> PlanCapacity(
    const std::vector<Operation>& operations,
    double target_output_per_day,
    double working_minutes_per_day);

}  // namespace lineplan::core
