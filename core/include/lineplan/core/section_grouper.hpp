#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "lineplan/core/entities.hpp"

namespace lineplan::core {

inline constexpr std::string_view kUnknownSectionLabel = "Unknown";

struct SectionBucket {
  std::string label{};  // first-seen spelling
  std::vector<BalancedOperation> operations{};
};

// Empty or blank labels map to "Unknown"; other labels compare trimmed and case-insensitively.
[[nodiscard]] std::string section_key(std::string_view section_label);

// Buckets in first-seen order; operations keep their input order within a bucket.
[[nodiscard]] std::vector<SectionBucket> GroupSections(const std::vector<BalancedOperation>& balanced);

}  // namespace lineplan::core
