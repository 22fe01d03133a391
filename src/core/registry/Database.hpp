#pragma once
#include <cstdint>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace objreg {

// Owns one sqlite3 connection. Every store in the registry shares it.
class Database {
public:
  // create=false mirrors the service path: the schema must already exist.
  explicit Database(const std::string& dbPath, bool create = false);
  ~Database();

  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  void exec(const std::string& sql);
  // Rows touched by the most recent INSERT/UPDATE/DELETE on this connection.
  int changes() const;
  sqlite3* handle() const { return db_; }

private:
  sqlite3* db_;
};

class Statement {
public:
  Statement(Database& db, const char* sql);
  ~Statement();

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  void bindText(int index, const std::string& value);
  void bindInt64(int index, std::int64_t value);

  // true while a row is available, false once the statement is done.
  bool step();

  std::string columnText(int col) const;
  std::int64_t columnInt64(int col) const;

private:
  sqlite3* db_;
  sqlite3_stmt* st_;
};

// BEGIN IMMEDIATE on construction, ROLLBACK on destruction unless commit() ran.
class Transaction {
public:
  explicit Transaction(Database& db);
  ~Transaction();

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void commit();

private:
  Database& db_;
  bool done_;
};

} // namespace objreg
