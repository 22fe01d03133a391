#include "DeadlineStore.hpp"
#include "Database.hpp"

namespace objreg {

std::optional<DeadlineRecord> DeadlineStore::find(const Address& address) const {
  Statement st(db_, "SELECT target_point, alert_activated FROM deadlines WHERE address = ?");
  st.bindText(1, address);
  if (!st.step()) return std::nullopt;
  DeadlineRecord r;
  r.target_point = st.columnInt64(0);
  r.alert_activated = st.columnInt64(1) != 0;
  return r;
}

void DeadlineStore::upsertDeadline(const Address& address, const DeadlineRecord& r) {
  const char* sql = R"SQL(
    INSERT INTO deadlines (address, target_point, alert_activated) VALUES (?,?,?)
    ON CONFLICT(address) DO UPDATE SET
      target_point    = excluded.target_point,
      alert_activated = excluded.alert_activated
  )SQL";
  Statement st(db_, sql);
  st.bindText(1, address);
  st.bindInt64(2, r.target_point);
  st.bindInt64(3, r.alert_activated ? 1 : 0);
  st.step();
}

} // namespace objreg
