// src/main.cpp
#include <cstdlib>
#include <string>
#include <iostream>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "core/chain/BlockCounter.hpp"
#include "core/registry/Database.hpp"
#include "core/registry/InitDb.hpp"
#include "core/registry/Registry.hpp"
#include "services/api/HttpServer.hpp"
#include "services/config/EnvConfig.hpp"

// ---------- helpers ----------

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init               # create/upgrade SQLite schema\n"
            << "  " << argv0 << " --serve              # start HTTP server (OBJREG_PORT or 8080)\n"
            << "  " << argv0 << " --inspect <address>  # print stored rows for an address\n";
}

static void print_address(const objreg::Registry& registry, const std::string& address) {
  const objreg::ObjectiveStatus s = registry.inspect(address);
  std::cout << "address:            " << address << "\n"
            << "present:            " << (s.present ? "yes" : "no") << "\n"
            << "description_length: " << s.description_length << "\n"
            << "completed:          " << (s.completed ? "yes" : "no") << "\n";

  // Priority/deadline rows may outlive the objective; show them regardless.
  if (auto p = registry.priorities().find(address)) {
    std::cout << "urgency:            " << p->urgency << "\n";
  }
  if (auto d = registry.deadlines().find(address)) {
    std::cout << "target_point:       " << d->target_point << "\n"
              << "alert_activated:    " << (d->alert_activated ? "yes" : "no") << "\n";
  }
  std::cout << "counter:            " << registry.currentCounter() << "\n";
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    const objreg::ServiceConfig cfg = objreg::loadServiceConfig();
    spdlog::set_level(spdlog::level::from_str(cfg.logLevel));

    if (argc > 1 && std::string(argv[1]) == "--init") {
      objreg::initDatabase(cfg.dbPath, objreg::findSchemaPath());
      std::cout << "DB initialized at: " << cfg.dbPath << "\n";
      return 0;
    }

    if (argc > 2 && std::string(argv[1]) == "--inspect") {
      objreg::Database db(cfg.dbPath);
      objreg::WallClockBlockCounter counter(cfg.genesisUnix, cfg.blockIntervalSeconds);
      objreg::Registry registry(db, counter);
      print_address(registry, argv[2]);
      return 0;
    }

    if (argc > 1 && std::string(argv[1]) == "--serve") {
      // Self-heal DB on startup (idempotent)
      objreg::initDatabase(cfg.dbPath, objreg::findSchemaPath());

      // Construct services
      objreg::Database db(cfg.dbPath);
      objreg::WallClockBlockCounter counter(cfg.genesisUnix, cfg.blockIntervalSeconds);
      objreg::Registry registry(db, counter);
      spdlog::info("registry open at {} (block interval {}s, counter {})",
                   cfg.dbPath, cfg.blockIntervalSeconds, counter.current());

      objreg::run_http_server(registry, cfg.port, cfg.apiKey);
      return 0;
    }

    print_usage(argv[0]);
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
