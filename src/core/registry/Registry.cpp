#include "Registry.hpp"

#include <limits>
#include <optional>
#include <spdlog/spdlog.h>

#include "Database.hpp"
#include "Validation.hpp"
#include "core/chain/BlockCounter.hpp"

namespace objreg {

// -------- helpers --------

static const char* kNoObjective  = "No objective recorded for this address";
static const char* kHasObjective = "An objective already exists for this address";

static std::optional<OpResult> rejectDescription(const std::string& text) {
  if (!isNonEmpty(text)) {
    return OpResult::failure(ErrorKind::InvalidInput, "Description must not be empty");
  }
  if (!isFreeOfNul(text)) {
    return OpResult::failure(ErrorKind::InvalidInput, "Description must not contain NUL characters");
  }
  if (!isWithinLength(text)) {
    return OpResult::failure(ErrorKind::InvalidInput,
                             "Description exceeds " + std::to_string(kMaxDescriptionLength) + " characters");
  }
  return std::nullopt;
}

static OpResult rejected(const char* op, const Address& key, OpResult r) {
  spdlog::debug("{} rejected for {}: {} ({})", op, key, errorKindName(r.error), r.message);
  return r;
}

// -------- Registry --------

Registry::Registry(Database& db, const BlockCounter& counter)
  : db_(db), counter_(counter), objectives_(db), priorities_(db), deadlines_(db) {}

std::int64_t Registry::currentCounter() const {
  return counter_.current();
}

OpResult Registry::createObjective(const Address& key, const std::string& text, const char* confirmation) {
  Transaction tx(db_);
  if (objectives_.contains(key)) {
    return OpResult::failure(ErrorKind::AlreadyExists, kHasObjective);
  }
  if (auto bad = rejectDescription(text)) return *bad;

  objectives_.insertObjective(key, ObjectiveRecord{text, false});
  tx.commit();
  return OpResult::success(confirmation);
}

OpResult Registry::initiate(const Address& caller, const std::string& text) {
  std::lock_guard<std::mutex> lock(mu_);
  OpResult r = createObjective(caller, text, messages::kInitiated);
  if (!r.ok) return rejected("initiate", caller, std::move(r));
  spdlog::debug("initiate {}: {} chars", caller, characterCount(text));
  return r;
}

OpResult Registry::modify(const Address& caller, const std::string& text, bool completed) {
  std::lock_guard<std::mutex> lock(mu_);
  Transaction tx(db_);
  if (!objectives_.contains(caller)) {
    return rejected("modify", caller, OpResult::failure(ErrorKind::NotFound, kNoObjective));
  }
  if (auto bad = rejectDescription(text)) return rejected("modify", caller, *bad);

  objectives_.updateObjective(caller, ObjectiveRecord{text, completed});
  tx.commit();
  spdlog::debug("modify {}: completed={}", caller, completed);
  return OpResult::success(messages::kModified);
}

OpResult Registry::terminate(const Address& caller) {
  std::lock_guard<std::mutex> lock(mu_);
  Transaction tx(db_);
  if (!objectives_.contains(caller)) {
    return rejected("terminate", caller, OpResult::failure(ErrorKind::NotFound, kNoObjective));
  }

  objectives_.eraseObjective(caller);
  tx.commit();
  spdlog::debug("terminate {}", caller);
  return OpResult::success(messages::kTerminated);
}

ObjectiveStatus Registry::inspect(const Address& caller) const {
  std::lock_guard<std::mutex> lock(mu_);
  ObjectiveStatus status;
  if (auto rec = objectives_.find(caller)) {
    status.present = true;
    status.description_length = static_cast<std::int64_t>(characterCount(rec->description));
    status.completed = rec->completed;
  }
  return status;
}

OpResult Registry::classify(const Address& caller, std::int64_t priority) {
  std::lock_guard<std::mutex> lock(mu_);
  Transaction tx(db_);
  if (!objectives_.contains(caller)) {
    return rejected("classify", caller, OpResult::failure(ErrorKind::NotFound, kNoObjective));
  }
  if (!isValidPriority(priority)) {
    return rejected("classify", caller,
                    OpResult::failure(ErrorKind::InvalidInput, "Priority must be between 1 and 3"));
  }

  priorities_.upsertPriority(caller, PriorityRecord{priority});
  tx.commit();
  spdlog::debug("classify {}: urgency={}", caller, priority);
  return OpResult::success(messages::kClassified);
}

OpResult Registry::schedule(const Address& caller, std::int64_t offset) {
  std::lock_guard<std::mutex> lock(mu_);
  Transaction tx(db_);
  if (!objectives_.contains(caller)) {
    return rejected("schedule", caller, OpResult::failure(ErrorKind::NotFound, kNoObjective));
  }
  if (!isValidOffset(offset)) {
    return rejected("schedule", caller,
                    OpResult::failure(ErrorKind::InvalidInput, "Deadline offset must be positive"));
  }

  const std::int64_t now = counter_.current();
  if (offset > std::numeric_limits<std::int64_t>::max() - now) {
    return rejected("schedule", caller,
                    OpResult::failure(ErrorKind::InvalidInput, "Deadline offset is out of range"));
  }

  DeadlineRecord rec;
  rec.target_point = now + offset;
  rec.alert_activated = false;
  deadlines_.upsertDeadline(caller, rec);
  tx.commit();
  spdlog::debug("schedule {}: target={} (counter {} + {})", caller, rec.target_point, now, offset);
  return OpResult::success(messages::kScheduled);
}

OpResult Registry::delegate(const Address& caller, const Address& target, const std::string& text) {
  std::lock_guard<std::mutex> lock(mu_);
  OpResult r = createObjective(target, text, messages::kDelegated);
  if (!r.ok) return rejected("delegate", target, std::move(r));
  spdlog::debug("delegate {} -> {}", caller, target);
  return r;
}

} // namespace objreg
