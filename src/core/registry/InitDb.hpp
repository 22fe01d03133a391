#pragma once
#include <string>

namespace objreg {

class Database;

// Reads schemaPath and executes it on db, then stamps user_version.
void applySchema(Database& db, const std::string& schemaPath);

// Creates the database file if needed, sets the connection pragmas and applies
// the schema. Safe to run on every start.
bool initDatabase(const std::string& dbPath, const std::string& schemaPath);

} // namespace objreg
