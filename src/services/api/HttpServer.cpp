#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "RegistryRoutes.hpp"
#include "core/registry/Registry.hpp"

using nlohmann::json;

// -------- helpers --------

static void send_reply(httplib::Response& res, const objreg::ApiReply& reply) {
  res.status = reply.status;
  res.set_content(reply.body.dump(), "application/json");
}

// Applies the API key and X-Caller checks; on rejection the 401 is already sent.
static bool admit(const httplib::Request& req, httplib::Response& res,
                  const std::string& apiKey, std::string& caller) {
  if (auto denied = objreg::checkApiKey(req.get_header_value("X-API-Key"), apiKey)) {
    send_reply(res, *denied);
    return false;
  }
  caller = req.get_header_value("X-Caller");
  if (auto denied = objreg::checkCaller(caller)) {
    send_reply(res, *denied);
    return false;
  }
  return true;
}

// -------- server --------

namespace objreg {

void run_http_server(Registry& registry,
                     int port,
                     const std::string& apiKey) {
  httplib::Server svr;

  // Health check
  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });

  // Current block counter, so clients can reason about deadline offsets.
  svr.Get("/counter", [&](const httplib::Request& req, httplib::Response& res) {
    if (auto denied = checkApiKey(req.get_header_value("X-API-Key"), apiKey)) {
      send_reply(res, *denied);
      return;
    }
    send_reply(res, guardedReply("GET /counter", [&] {
      return ApiReply{200, json{{"counter", registry.currentCounter()}}};
    }));
  });

  // GET /objective -> inspect
  svr.Get("/objective", [&](const httplib::Request& req, httplib::Response& res) {
    std::string caller;
    if (!admit(req, res, apiKey, caller)) return;
    send_reply(res, guardedReply("GET /objective", [&] { return handleInspect(registry, caller); }));
  });

  // POST /objective {"text"} -> initiate
  svr.Post("/objective", [&](const httplib::Request& req, httplib::Response& res) {
    std::string caller;
    if (!admit(req, res, apiKey, caller)) return;
    send_reply(res, guardedReply("POST /objective", [&] { return handleInitiate(registry, caller, req.body); }));
  });

  // PUT /objective {"text","completed"} -> modify
  svr.Put("/objective", [&](const httplib::Request& req, httplib::Response& res) {
    std::string caller;
    if (!admit(req, res, apiKey, caller)) return;
    send_reply(res, guardedReply("PUT /objective", [&] { return handleModify(registry, caller, req.body); }));
  });

  // DELETE /objective -> terminate
  svr.Delete("/objective", [&](const httplib::Request& req, httplib::Response& res) {
    std::string caller;
    if (!admit(req, res, apiKey, caller)) return;
    send_reply(res, guardedReply("DELETE /objective", [&] { return handleTerminate(registry, caller); }));
  });

  // POST /objective/priority {"priority"} -> classify
  svr.Post("/objective/priority", [&](const httplib::Request& req, httplib::Response& res) {
    std::string caller;
    if (!admit(req, res, apiKey, caller)) return;
    send_reply(res, guardedReply("POST /objective/priority", [&] { return handleClassify(registry, caller, req.body); }));
  });

  // POST /objective/deadline {"offset"} -> schedule
  svr.Post("/objective/deadline", [&](const httplib::Request& req, httplib::Response& res) {
    std::string caller;
    if (!admit(req, res, apiKey, caller)) return;
    send_reply(res, guardedReply("POST /objective/deadline", [&] { return handleSchedule(registry, caller, req.body); }));
  });

  // POST /delegations {"target","text"} -> delegate
  svr.Post("/delegations", [&](const httplib::Request& req, httplib::Response& res) {
    std::string caller;
    if (!admit(req, res, apiKey, caller)) return;
    send_reply(res, guardedReply("POST /delegations", [&] { return handleDelegate(registry, caller, req.body); }));
  });

  // Fallback
  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404 && res.body.empty()) res.set_content("not found", "text/plain");
  });

  spdlog::info("HTTP server listening on http://0.0.0.0:{}", port);
  if (!svr.listen("0.0.0.0", port)) {
    spdlog::error("Failed to bind port {}", port);
  }
}

} // namespace objreg
