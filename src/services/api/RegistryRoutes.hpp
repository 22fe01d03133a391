#pragma once
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace objreg {

class Registry;

// Status + JSON body, independent of the HTTP library so handlers can be
// exercised without a socket.
struct ApiReply {
  int            status = 200;
  nlohmann::json body;
};

// Request gate. Each returns the 401 reply to send, or nullopt to proceed.
// An empty apiKey disables the key check.
std::optional<ApiReply> checkApiKey(const std::string& presentedKey, const std::string& apiKey);
std::optional<ApiReply> checkCaller(const std::string& caller);

// Runs handler; a thrown host failure is logged and becomes a 500 reply.
ApiReply guardedReply(const char* route, const std::function<ApiReply()>& handler);

ApiReply handleInspect(const Registry& registry, const std::string& caller);
ApiReply handleInitiate(Registry& registry, const std::string& caller, const std::string& body);
ApiReply handleModify(Registry& registry, const std::string& caller, const std::string& body);
ApiReply handleTerminate(Registry& registry, const std::string& caller);
ApiReply handleClassify(Registry& registry, const std::string& caller, const std::string& body);
ApiReply handleSchedule(Registry& registry, const std::string& caller, const std::string& body);
ApiReply handleDelegate(Registry& registry, const std::string& caller, const std::string& body);

} // namespace objreg
