#pragma once
#include <cstdint>
#include <mutex>
#include <string>

#include "DeadlineStore.hpp"
#include "ObjectiveStore.hpp"
#include "OpResult.hpp"
#include "PriorityStore.hpp"
#include "Records.hpp"

namespace objreg {

class BlockCounter;
class Database;

// Confirmation strings returned on success.
namespace messages {
  constexpr const char* kInitiated  = "Objective recorded";
  constexpr const char* kModified   = "Objective updated";
  constexpr const char* kTerminated = "Objective removed";
  constexpr const char* kClassified = "Priority assigned";
  constexpr const char* kScheduled  = "Deadline scheduled";
  constexpr const char* kDelegated  = "Objective delegated";
}

// Operation facade over the three keyed stores. Each call checks existence of
// the relevant objective first, then validates input, then writes at most one
// store inside a single transaction. Calls are serialized.
//
// Nothing cascades between stores: terminate leaves priority and deadline rows
// in place, and they are visible again if the address initiates later.
class Registry {
public:
  Registry(Database& db, const BlockCounter& counter);

  OpResult initiate(const Address& caller, const std::string& text);
  OpResult modify(const Address& caller, const std::string& text, bool completed);
  OpResult terminate(const Address& caller);
  ObjectiveStatus inspect(const Address& caller) const;

  OpResult classify(const Address& caller, std::int64_t priority);
  OpResult schedule(const Address& caller, std::int64_t offset);

  // Seeds target's objective. The caller's identity is not checked against
  // target: any caller may seed any address that has no objective.
  OpResult delegate(const Address& caller, const Address& target, const std::string& text);

  const ObjectiveStore& objectives() const { return objectives_; }
  const PriorityStore& priorities() const { return priorities_; }
  const DeadlineStore& deadlines() const { return deadlines_; }
  std::int64_t currentCounter() const;

private:
  OpResult createObjective(const Address& key, const std::string& text, const char* confirmation);

  Database& db_;
  const BlockCounter& counter_;
  ObjectiveStore objectives_;
  PriorityStore priorities_;
  DeadlineStore deadlines_;
  mutable std::mutex mu_;
};

} // namespace objreg
