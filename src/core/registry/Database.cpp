#include "Database.hpp"

#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace objreg {

Database::Database(const std::string& dbPath, bool create) : db_(nullptr) {
  int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX;
  if (create) flags |= SQLITE_OPEN_CREATE;
  sqlite3* db = nullptr;
  if (sqlite3_open_v2(dbPath.c_str(), &db, flags, nullptr) != SQLITE_OK) {
    std::string err = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw std::runtime_error("failed to open db " + dbPath + ": " + err);
  }
  db_ = db;
  sqlite3_busy_timeout(db_, 5000);
}

Database::~Database() {
  if (db_ && sqlite3_close(db_) != SQLITE_OK) {
    spdlog::warn("sqlite3_close failed: {}", sqlite3_errmsg(db_));
  }
}

void Database::exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw std::runtime_error("SQLite exec failed: " + msg);
  }
}

int Database::changes() const {
  return sqlite3_changes(db_);
}

// -------- Statement --------

Statement::Statement(Database& db, const char* sql) : db_(db.handle()), st_(nullptr) {
  if (sqlite3_prepare_v2(db_, sql, -1, &st_, nullptr) != SQLITE_OK) {
    std::string err = sqlite3_errmsg(db_);
    sqlite3_finalize(st_);
    throw std::runtime_error("prepare failed: " + err);
  }
}

Statement::~Statement() {
  sqlite3_finalize(st_);
}

void Statement::bindText(int index, const std::string& value) {
  if (sqlite3_bind_text(st_, index, value.c_str(), static_cast<int>(value.size()),
                        SQLITE_TRANSIENT) != SQLITE_OK) {
    throw std::runtime_error("bind failed: " + std::string(sqlite3_errmsg(db_)));
  }
}

void Statement::bindInt64(int index, std::int64_t value) {
  if (sqlite3_bind_int64(st_, index, value) != SQLITE_OK) {
    throw std::runtime_error("bind failed: " + std::string(sqlite3_errmsg(db_)));
  }
}

bool Statement::step() {
  int rc = sqlite3_step(st_);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw std::runtime_error("step failed: " + std::string(sqlite3_errmsg(db_)));
}

std::string Statement::columnText(int col) const {
  const unsigned char* text = sqlite3_column_text(st_, col);
  if (!text) return {};
  return std::string(reinterpret_cast<const char*>(text),
                     static_cast<size_t>(sqlite3_column_bytes(st_, col)));
}

std::int64_t Statement::columnInt64(int col) const {
  return sqlite3_column_int64(st_, col);
}

// -------- Transaction --------

Transaction::Transaction(Database& db) : db_(db), done_(false) {
  db_.exec("BEGIN IMMEDIATE;");
}

Transaction::~Transaction() {
  if (done_) return;
  char* err = nullptr;
  if (sqlite3_exec(db_.handle(), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
    spdlog::error("rollback failed: {}", err ? err : "unknown error");
  }
  sqlite3_free(err);
}

void Transaction::commit() {
  db_.exec("COMMIT;");
  done_ = true;
}

} // namespace objreg
