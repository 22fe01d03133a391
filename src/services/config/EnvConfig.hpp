#pragma once
#include <cstdint>
#include <string>

namespace objreg {

struct ServiceConfig {
  std::string  dbPath;
  int          port = 8080;
  std::string  apiKey;                 // empty = auth disabled
  std::string  logLevel;
  std::int64_t genesisUnix = 0;
  std::int64_t blockIntervalSeconds = 10;
};

std::string getEnvOr(const char* key, const std::string& defval);

// Reads OBJREG_* variables; unparsable numbers fall back to their defaults.
ServiceConfig loadServiceConfig();

// Look for schema.sql in CWD first (the build copies it there), then fallback.
std::string findSchemaPath();

} // namespace objreg
