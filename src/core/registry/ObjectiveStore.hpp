#pragma once
#include <optional>
#include <string>

#include "Records.hpp"

namespace objreg {

class Database;

// Primary table: address -> objective. Presence here is the existence
// condition every other operation is gated on.
class ObjectiveStore {
public:
  explicit ObjectiveStore(Database& db) : db_(db) {}

  std::optional<ObjectiveRecord> find(const Address& address) const;
  bool contains(const Address& address) const;

  void insertObjective(const Address& address, const ObjectiveRecord& r);
  void updateObjective(const Address& address, const ObjectiveRecord& r);
  void eraseObjective(const Address& address);

private:
  Database& db_;
};

} // namespace objreg
