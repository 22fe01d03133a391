#include "PriorityStore.hpp"
#include "Database.hpp"

namespace objreg {

std::optional<PriorityRecord> PriorityStore::find(const Address& address) const {
  Statement st(db_, "SELECT urgency FROM priorities WHERE address = ?");
  st.bindText(1, address);
  if (!st.step()) return std::nullopt;
  return PriorityRecord{st.columnInt64(0)};
}

void PriorityStore::upsertPriority(const Address& address, const PriorityRecord& r) {
  const char* sql = R"SQL(
    INSERT INTO priorities (address, urgency) VALUES (?,?)
    ON CONFLICT(address) DO UPDATE SET urgency = excluded.urgency
  )SQL";
  Statement st(db_, sql);
  st.bindText(1, address);
  st.bindInt64(2, r.urgency);
  st.step();
}

} // namespace objreg
