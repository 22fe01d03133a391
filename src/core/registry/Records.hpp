#pragma once
#include <cstdint>
#include <string>

namespace objreg {

// Opaque participant identifier supplied by the host.
using Address = std::string;

struct ObjectiveRecord {
  std::string description;
  bool        completed = false;
};

struct PriorityRecord {
  std::int64_t urgency = 0;
};

struct DeadlineRecord {
  std::int64_t target_point = 0;   // absolute counter value, frozen at schedule time
  bool         alert_activated = false;
};

// Read-only projection returned by Registry::inspect.
struct ObjectiveStatus {
  bool         present = false;
  std::int64_t description_length = 0;
  bool         completed = false;
};

} // namespace objreg
