#undef NDEBUG
#include <cassert>
#include <cstdlib>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "core/chain/BlockCounter.hpp"
#include "core/registry/Database.hpp"
#include "core/registry/InitDb.hpp"
#include "core/registry/Registry.hpp"
#include "services/api/RegistryRoutes.hpp"
#include "services/config/EnvConfig.hpp"

using nlohmann::json;

namespace {

struct Fixture {
  objreg::Database db{":memory:", true};
  objreg::ManualBlockCounter counter{1000};
  objreg::Registry registry{db, counter};

  Fixture() { objreg::applySchema(db, OBJREG_SCHEMA_PATH); }
};

void test_objective_routes() {
  Fixture f;
  auto& r = f.registry;

  auto reply = objreg::handleInspect(r, "alice");
  assert(reply.status == 200);
  assert(reply.body["present"] == false);
  assert(reply.body["description_length"] == 0);

  reply = objreg::handleInitiate(r, "alice", R"({"text":"climb a mountain"})");
  assert(reply.status == 200);
  assert(reply.body["ok"] == true);
  assert(reply.body["message"] == objreg::messages::kInitiated);

  reply = objreg::handleInitiate(r, "alice", R"({"text":"again"})");
  assert(reply.status == 409);
  assert(reply.body["error"] == "AlreadyExists");

  reply = objreg::handleInspect(r, "alice");
  assert(reply.body["present"] == true);
  assert(reply.body["description_length"] == 16);
  assert(reply.body["completed"] == false);

  reply = objreg::handleModify(r, "alice", R"({"text":"climb two mountains","completed":true})");
  assert(reply.status == 200);
  assert(objreg::handleInspect(r, "alice").body["completed"] == true);

  reply = objreg::handleModify(r, "alice", R"({"text":"","completed":false})");
  assert(reply.status == 422);
  assert(reply.body["error"] == "InvalidInput");

  reply = objreg::handleModify(r, "bob", R"({"text":"t","completed":false})");
  assert(reply.status == 404);
  assert(reply.body["error"] == "NotFound");

  reply = objreg::handleTerminate(r, "alice");
  assert(reply.status == 200);
  reply = objreg::handleTerminate(r, "alice");
  assert(reply.status == 404);
}

void test_priority_and_deadline_routes() {
  Fixture f;
  auto& r = f.registry;

  auto reply = objreg::handleClassify(r, "carol", R"({"priority":2})");
  assert(reply.status == 404);

  assert(objreg::handleInitiate(r, "carol", R"({"text":"write a book"})").status == 200);

  reply = objreg::handleClassify(r, "carol", R"({"priority":5})");
  assert(reply.status == 422);
  reply = objreg::handleClassify(r, "carol", R"({"priority":2})");
  assert(reply.status == 200);
  assert(r.priorities().find("carol")->urgency == 2);

  reply = objreg::handleSchedule(r, "carol", R"({"offset":0})");
  assert(reply.status == 422);
  reply = objreg::handleSchedule(r, "carol", R"({"offset":25})");
  assert(reply.status == 200);
  assert(r.deadlines().find("carol")->target_point == 1025);
}

void test_delegate_route() {
  Fixture f;
  auto& r = f.registry;

  auto reply = objreg::handleDelegate(r, "dave", R"({"target":"erin","text":"learn chess"})");
  assert(reply.status == 200);
  assert(reply.body["message"] == objreg::messages::kDelegated);
  assert(r.inspect("erin").present);
  assert(!r.inspect("dave").present);

  reply = objreg::handleDelegate(r, "dave", R"({"target":"erin","text":"other"})");
  assert(reply.status == 409);

  reply = objreg::handleDelegate(r, "dave", R"({"target":"","text":"other"})");
  assert(reply.status == 400);
}

void test_malformed_bodies() {
  Fixture f;
  auto& r = f.registry;

  assert(objreg::handleInitiate(r, "x", "not json").status == 400);
  assert(objreg::handleInitiate(r, "x", "[1,2]").status == 400);
  assert(objreg::handleInitiate(r, "x", R"({"text":42})").status == 400);
  assert(!r.inspect("x").present);

  assert(objreg::handleInitiate(r, "x", R"({"text":"ok"})").status == 200);
  assert(objreg::handleModify(r, "x", R"({"text":"ok"})").status == 400);
  assert(objreg::handleModify(r, "x", R"({"text":"ok","completed":"yes"})").status == 400);
  assert(objreg::handleClassify(r, "x", R"({"priority":"2"})").status == 400);
  assert(objreg::handleClassify(r, "x", R"({"priority":2.5})").status == 400);
  assert(objreg::handleSchedule(r, "x", R"({"offset":18446744073709551615})").status == 400);
  assert(objreg::handleDelegate(r, "x", R"({"text":"no target"})").status == 400);

  const auto reply = objreg::handleInitiate(r, "y", "{}");
  assert(reply.body["ok"] == false);
  assert(reply.body["error"] == "BadRequest");
}

void test_request_gate() {
  // No key configured: anything passes, including no key at all.
  assert(!objreg::checkApiKey("", ""));
  assert(!objreg::checkApiKey("whatever", ""));

  assert(!objreg::checkApiKey("secret", "secret"));
  auto denied = objreg::checkApiKey("wrong", "secret");
  assert(denied);
  assert(denied->status == 401);
  assert(denied->body["error"] == "Unauthorized");
  denied = objreg::checkApiKey("", "secret");
  assert(denied);
  assert(denied->status == 401);

  assert(!objreg::checkCaller("alice"));
  denied = objreg::checkCaller("");
  assert(denied);
  assert(denied->status == 401);
  assert(denied->body["message"] == "X-Caller header required");
}

void test_storage_failure_becomes_500() {
  // No schema applied: every statement fails to prepare and throws.
  objreg::Database db(":memory:", true);
  objreg::ManualBlockCounter counter;
  objreg::Registry registry(db, counter);

  auto reply = objreg::guardedReply("POST /objective", [&] {
    return objreg::handleInitiate(registry, "alice", R"({"text":"x"})");
  });
  assert(reply.status == 500);
  assert(reply.body["ok"] == false);
  assert(reply.body["error"] == "Internal");

  reply = objreg::guardedReply("GET /objective", [&] {
    return objreg::handleInspect(registry, "alice");
  });
  assert(reply.status == 500);

  // Business failures pass through untouched.
  Fixture f;
  reply = objreg::guardedReply("DELETE /objective", [&] {
    return objreg::handleTerminate(f.registry, "alice");
  });
  assert(reply.status == 404);
}

void test_nul_text_is_unprocessable() {
  Fixture f;
  const auto reply = objreg::handleInitiate(f.registry, "x", R"({"text":"\u0000x"})");
  assert(reply.status == 422);
  assert(reply.body["error"] == "InvalidInput");
  assert(!f.registry.inspect("x").present);
}

void test_env_config() {
  unsetenv("OBJREG_DB_PATH");
  unsetenv("OBJREG_PORT");
  unsetenv("OBJREG_API_KEY");
  unsetenv("OBJREG_LOG_LEVEL");
  unsetenv("OBJREG_GENESIS_UNIX");
  unsetenv("OBJREG_BLOCK_INTERVAL_SECONDS");

  auto cfg = objreg::loadServiceConfig();
  assert(cfg.dbPath == "data/objective-registry.db");
  assert(cfg.port == 8080);
  assert(cfg.apiKey.empty());
  assert(cfg.logLevel == "info");
  assert(cfg.genesisUnix == 0);
  assert(cfg.blockIntervalSeconds == 10);

  setenv("OBJREG_DB_PATH", "/tmp/objreg.db", 1);
  setenv("OBJREG_PORT", "9191", 1);
  setenv("OBJREG_API_KEY", "secret", 1);
  setenv("OBJREG_GENESIS_UNIX", "1700000000", 1);
  setenv("OBJREG_BLOCK_INTERVAL_SECONDS", "12", 1);
  cfg = objreg::loadServiceConfig();
  assert(cfg.dbPath == "/tmp/objreg.db");
  assert(cfg.port == 9191);
  assert(cfg.apiKey == "secret");
  assert(cfg.genesisUnix == 1700000000);
  assert(cfg.blockIntervalSeconds == 12);

  setenv("OBJREG_PORT", "eighty", 1);
  setenv("OBJREG_BLOCK_INTERVAL_SECONDS", "12s", 1);
  cfg = objreg::loadServiceConfig();
  assert(cfg.port == 8080);
  assert(cfg.blockIntervalSeconds == 10);

  setenv("OBJREG_PORT", "4294975488", 1);
  assert(objreg::loadServiceConfig().port == 8080);
  setenv("OBJREG_PORT", "0", 1);
  assert(objreg::loadServiceConfig().port == 8080);
  setenv("OBJREG_PORT", "65536", 1);
  assert(objreg::loadServiceConfig().port == 8080);
  setenv("OBJREG_PORT", "65535", 1);
  assert(objreg::loadServiceConfig().port == 65535);

  assert(objreg::getEnvOr("OBJREG_SURELY_UNSET", "fallback") == "fallback");
}

}  // namespace

int main() {
  test_objective_routes();
  test_priority_and_deadline_routes();
  test_delegate_route();
  test_malformed_bodies();
  test_request_gate();
  test_storage_failure_becomes_500();
  test_nul_text_is_unprocessable();
  test_env_config();

  std::cout << "objreg_service_tests passed\n";
  return 0;
}
