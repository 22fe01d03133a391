// src/core/registry/InitDb.cpp
#include "InitDb.hpp"
#include "Database.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace objreg {

static constexpr int kSchemaVersion = 1;

void applySchema(Database& db, const std::string& schemaPath) {
    std::ifstream in(schemaPath);
    if (!in) throw std::runtime_error("Cannot open schema file: " + schemaPath);
    std::ostringstream buf; buf << in.rdbuf();
    db.exec(buf.str());

    db.exec("PRAGMA user_version=" + std::to_string(kSchemaVersion) + ";");
}

bool initDatabase(const std::string& dbPath, const std::string& schemaPath) {
    auto parent = std::filesystem::path(dbPath).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);

    Database db(dbPath, /*create*/ true);

    // Pragmas: concurrency + durability. No foreign keys: the tables are
    // independent by design.
    db.exec("PRAGMA journal_mode=WAL;");
    db.exec("PRAGMA synchronous=NORMAL;");
    db.exec("PRAGMA busy_timeout=5000;");

    applySchema(db, schemaPath);
    return true;
}

} // namespace objreg
