#include "lineplan/core/section_grouper.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "lineplan/core/classification.hpp"

namespace lineplan::core {

std::string section_key(std::string_view section_label) {
  const std::string trimmed = trim_copy(section_label);
  if (trimmed.empty()) {
    return to_lower_ascii(kUnknownSectionLabel);
  }
  return to_lower_ascii(trimmed);
}

std::vector<SectionBucket> GroupSections(const std::vector<BalancedOperation>& balanced) {
  std::vector<SectionBucket> buckets;
  std::unordered_map<std::string, std::size_t> index_by_key;
  for (const BalancedOperation& item : balanced) {
    const std::string key = section_key(item.operation.section);
    auto it = index_by_key.find(key);
    if (it == index_by_key.end()) {
      SectionBucket bucket{};
      const std::string trimmed = trim_copy(item.operation.section);
      bucket.label = trimmed.empty() ? std::string(kUnknownSectionLabel) : trimmed;
      buckets.push_back(std::move(bucket));
      it = index_by_key.emplace(key, buckets.size() - 1).first;
    }
    buckets[it->second].operations.push_back(item);
  }
  return buckets;
}

} // namespace lineplan::core
