#include "ObjectiveStore.hpp"
#include "Database.hpp"

#include <stdexcept>

namespace objreg {

std::optional<ObjectiveRecord> ObjectiveStore::find(const Address& address) const {
  Statement st(db_, "SELECT description, completed FROM objectives WHERE address = ?");
  st.bindText(1, address);
  if (!st.step()) return std::nullopt;
  ObjectiveRecord r;
  r.description = st.columnText(0);
  r.completed = st.columnInt64(1) != 0;
  return r;
}

bool ObjectiveStore::contains(const Address& address) const {
  Statement st(db_, "SELECT 1 FROM objectives WHERE address = ?");
  st.bindText(1, address);
  return st.step();
}

void ObjectiveStore::insertObjective(const Address& address, const ObjectiveRecord& r) {
  const char* sql = R"SQL(
    INSERT INTO objectives (address, description, completed)
    VALUES (?,?,?)
  )SQL";
  Statement st(db_, sql);
  st.bindText(1, address);
  st.bindText(2, r.description);
  st.bindInt64(3, r.completed ? 1 : 0);
  st.step();
}

void ObjectiveStore::updateObjective(const Address& address, const ObjectiveRecord& r) {
  const char* sql = R"SQL(
    UPDATE objectives SET description = ?, completed = ?
    WHERE address = ?
  )SQL";
  Statement st(db_, sql);
  st.bindText(1, r.description);
  st.bindInt64(2, r.completed ? 1 : 0);
  st.bindText(3, address);
  st.step();
  if (db_.changes() != 1) {
    throw std::runtime_error("updateObjective: no row for " + address);
  }
}

void ObjectiveStore::eraseObjective(const Address& address) {
  Statement st(db_, "DELETE FROM objectives WHERE address = ?");
  st.bindText(1, address);
  st.step();
  if (db_.changes() != 1) {
    throw std::runtime_error("eraseObjective: no row for " + address);
  }
}

} // namespace objreg
