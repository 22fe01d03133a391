#pragma once
#include <optional>

#include "Records.hpp"

namespace objreg {

class Database;

// address -> urgency. Create-or-overwrite only; rows are never deleted.
class PriorityStore {
public:
  explicit PriorityStore(Database& db) : db_(db) {}

  std::optional<PriorityRecord> find(const Address& address) const;
  void upsertPriority(const Address& address, const PriorityRecord& r);

private:
  Database& db_;
};

} // namespace objreg
