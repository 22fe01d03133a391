#pragma once
#include <string>

namespace objreg {

class Registry;

// Start a blocking HTTP server exposing the registry operations.
// apiKey: if empty, auth is disabled (useful for early integration).
void run_http_server(Registry& registry,
                     int port,
                     const std::string& apiKey);

} // namespace objreg
