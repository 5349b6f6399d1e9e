#pragma once

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace lineplan::core {

using EntityId = std::uint64_t;
constexpr EntityId kInvalidEntityId = 0;

// Hands out layout-local entity ids. One generator lives for one generation call.
class EntityIdGenerator {
 public:
  explicit EntityIdGenerator(EntityId next_id = 1) : next_id_(next_id) {}

  [[nodiscard]] EntityId next() { return next_id_++; }

 private:
  EntityId next_id_ = 1;
};

// "BOARD-000004"
inline std::string make_display_id(std::string_view prefix, EntityId id, int pad_width = 6) {
  std::ostringstream oss;
  oss << prefix << "-" << std::setw(pad_width) << std::setfill('0') << id;
  return oss.str();
}

// "<op_no>-<sequence>-<id>", e.g. "12-0-000031". The trailing id keeps repeated op numbers unique.
inline std::string make_machine_display_id(std::string_view op_no, int sequence_index, EntityId id) {
  std::ostringstream oss;
  oss << op_no << "-" << sequence_index << "-" << std::setw(6) << std::setfill('0') << id;
  return oss.str();
}

}  // namespace lineplan::core
