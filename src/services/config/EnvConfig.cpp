#include "EnvConfig.hpp"

#include <cstdlib>
#include <filesystem>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace objreg {

std::string getEnvOr(const char* key, const std::string& defval) {
#ifdef _WIN32
  size_t len = 0;
  char* buf = nullptr;
  if (_dupenv_s(&buf, &len, key) == 0 && buf) {
    std::string v(buf);
    free(buf);
    return v;
  }
  return defval;
#else
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
#endif
}

static std::int64_t envInt64Or(const char* key, std::int64_t defval) {
  const std::string raw = getEnvOr(key, "");
  if (raw.empty()) return defval;
  try {
    size_t used = 0;
    const long long v = std::stoll(raw, &used);
    if (used == raw.size()) return v;
    spdlog::warn("{}={} has trailing characters, using {}", key, raw, defval);
  } catch (const std::exception& e) {
    spdlog::warn("{}={} is not an integer ({}), using {}", key, raw, e.what(), defval);
  }
  return defval;
}

static int envPortOr(int defval) {
  const std::int64_t port = envInt64Or("OBJREG_PORT", defval);
  if (port < 1 || port > 65535) {
    spdlog::warn("OBJREG_PORT={} is outside 1..65535, using {}", port, defval);
    return defval;
  }
  return static_cast<int>(port);
}

ServiceConfig loadServiceConfig() {
  ServiceConfig cfg;
  cfg.dbPath   = getEnvOr("OBJREG_DB_PATH", "data/objective-registry.db");
  cfg.port     = envPortOr(8080);
  cfg.apiKey   = getEnvOr("OBJREG_API_KEY", "");
  cfg.logLevel = getEnvOr("OBJREG_LOG_LEVEL", "info");
  cfg.genesisUnix          = envInt64Or("OBJREG_GENESIS_UNIX", 0);
  cfg.blockIntervalSeconds = envInt64Or("OBJREG_BLOCK_INTERVAL_SECONDS", 10);
  return cfg;
}

std::string findSchemaPath() {
  namespace fs = std::filesystem;
  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    fs::path("src/core/registry/schema.sql")
  };
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  throw std::runtime_error("schema.sql not found (looked in CWD and src/core/registry)");
}

} // namespace objreg
