#pragma once
#include <optional>

#include "Records.hpp"

namespace objreg {

class Database;

// address -> (target point, alert flag). Like PriorityStore, rows survive the
// objective they were scheduled against.
class DeadlineStore {
public:
  explicit DeadlineStore(Database& db) : db_(db) {}

  std::optional<DeadlineRecord> find(const Address& address) const;
  void upsertDeadline(const Address& address, const DeadlineRecord& r);

private:
  Database& db_;
};

} // namespace objreg
