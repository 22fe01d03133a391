#include "RegistryRoutes.hpp"

#include <cstdint>
#include <limits>
#include <optional>
#include <spdlog/spdlog.h>
#include <exception>

#include "core/registry/Registry.hpp"

using nlohmann::json;

namespace objreg {

// -------- helpers --------

static int statusFor(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NotFound:      return 404;
    case ErrorKind::AlreadyExists: return 409;
    case ErrorKind::InvalidInput:  return 422;
  }
  return 500;
}

static ApiReply toReply(const OpResult& r) {
  if (r.ok) return {200, json{{"ok", true}, {"message", r.message}}};
  return {statusFor(r.error),
          json{{"ok", false}, {"error", errorKindName(r.error)}, {"message", r.message}}};
}

static ApiReply badRequest(const std::string& why) {
  return {400, json{{"ok", false}, {"error", "BadRequest"}, {"message", why}}};
}

// Parses a JSON object body. Returns nullopt and fills `err` otherwise.
static std::optional<json> parseBody(const std::string& body, ApiReply& err) {
  json j = json::parse(body, nullptr, /*allow_exceptions*/ false);
  if (j.is_discarded() || !j.is_object()) {
    err = badRequest("body must be a JSON object");
    return std::nullopt;
  }
  return j;
}

static bool requireString(const json& j, const char* key, std::string& out, ApiReply& err) {
  if (!j.contains(key) || !j[key].is_string()) {
    err = badRequest(std::string("field '") + key + "' must be a string");
    return false;
  }
  out = j[key].get<std::string>();
  return true;
}

static bool requireInt(const json& j, const char* key, std::int64_t& out, ApiReply& err) {
  if (!j.contains(key) || !j[key].is_number_integer()) {
    err = badRequest(std::string("field '") + key + "' must be an integer");
    return false;
  }
  if (j[key].is_number_unsigned() &&
      j[key].get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
    err = badRequest(std::string("field '") + key + "' is out of range");
    return false;
  }
  out = j[key].get<std::int64_t>();
  return true;
}

static bool requireBool(const json& j, const char* key, bool& out, ApiReply& err) {
  if (!j.contains(key) || !j[key].is_boolean()) {
    err = badRequest(std::string("field '") + key + "' must be a boolean");
    return false;
  }
  out = j[key].get<bool>();
  return true;
}

static ApiReply unauthorized(const std::string& why) {
  return {401, json{{"ok", false}, {"error", "Unauthorized"}, {"message", why}}};
}

// -------- gate --------

std::optional<ApiReply> checkApiKey(const std::string& presentedKey, const std::string& apiKey) {
  if (apiKey.empty()) return std::nullopt; // auth disabled
  if (presentedKey == apiKey) return std::nullopt;
  return unauthorized("unauthorized");
}

// The host identifies the invoking principal; every registry route needs it.
std::optional<ApiReply> checkCaller(const std::string& caller) {
  if (!caller.empty()) return std::nullopt;
  return unauthorized("X-Caller header required");
}

ApiReply guardedReply(const char* route, const std::function<ApiReply()>& handler) {
  try {
    return handler();
  } catch (const std::exception& e) {
    spdlog::error("{} failed: {}", route, e.what());
    return {500, json{{"ok", false}, {"error", "Internal"}, {"message", "internal error"}}};
  }
}

// -------- handlers --------

ApiReply handleInspect(const Registry& registry, const std::string& caller) {
  const ObjectiveStatus s = registry.inspect(caller);
  return {200, json{{"present", s.present},
                    {"description_length", s.description_length},
                    {"completed", s.completed}}};
}

ApiReply handleInitiate(Registry& registry, const std::string& caller, const std::string& body) {
  ApiReply err;
  auto j = parseBody(body, err);
  if (!j) return err;
  std::string text;
  if (!requireString(*j, "text", text, err)) return err;
  return toReply(registry.initiate(caller, text));
}

ApiReply handleModify(Registry& registry, const std::string& caller, const std::string& body) {
  ApiReply err;
  auto j = parseBody(body, err);
  if (!j) return err;
  std::string text;
  bool completed = false;
  if (!requireString(*j, "text", text, err)) return err;
  if (!requireBool(*j, "completed", completed, err)) return err;
  return toReply(registry.modify(caller, text, completed));
}

ApiReply handleTerminate(Registry& registry, const std::string& caller) {
  return toReply(registry.terminate(caller));
}

ApiReply handleClassify(Registry& registry, const std::string& caller, const std::string& body) {
  ApiReply err;
  auto j = parseBody(body, err);
  if (!j) return err;
  std::int64_t priority = 0;
  if (!requireInt(*j, "priority", priority, err)) return err;
  return toReply(registry.classify(caller, priority));
}

ApiReply handleSchedule(Registry& registry, const std::string& caller, const std::string& body) {
  ApiReply err;
  auto j = parseBody(body, err);
  if (!j) return err;
  std::int64_t offset = 0;
  if (!requireInt(*j, "offset", offset, err)) return err;
  return toReply(registry.schedule(caller, offset));
}

ApiReply handleDelegate(Registry& registry, const std::string& caller, const std::string& body) {
  ApiReply err;
  auto j = parseBody(body, err);
  if (!j) return err;
  std::string target, text;
  if (!requireString(*j, "target", target, err)) return err;
  if (!requireString(*j, "text", text, err)) return err;
  if (target.empty()) return badRequest("field 'target' must not be empty");
  return toReply(registry.delegate(caller, target, text));
}

} // namespace objreg
