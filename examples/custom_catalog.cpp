// Serve the built-in catalog plus one extra tool over stdio.
//
// Tools live in a registry, so adding one needs no change to the
// dispatcher or the transport loop.

#include "leapmcp/catalog.hpp"
#include "leapmcp/exceptions.hpp"
#include "leapmcp/mcp/handler.hpp"
#include "leapmcp/server/stdio_server.hpp"
#include "leapmcp/util/json.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>

int main() {
  using leapmcp::Json;

  leapmcp::Catalog catalog = leapmcp::make_catalog();
  catalog.server_info.name = "leap-mcp-demo";

  catalog.tools.register_tool(leapmcp::tools::Tool{
      "upper",
      "Upper-cases a message",
      Json{{"type", "object"},
           {"properties", Json{{"message", Json{{"type", "string"}}}}},
           {"required", Json::array({"message"})}},
      [](const Json &arguments) -> std::string {
        const Json *message = leapmcp::util::json::find_field(arguments, "message");
        if (!message || !message->is_string())
          throw leapmcp::ValidationError("Missing 'message' argument");
        std::string text = message->get<std::string>();
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return text;
      }});

  leapmcp::Logger logger(std::cerr);
  leapmcp::mcp::Dispatcher dispatcher(catalog, logger);
  leapmcp::server::StdioServer server(dispatcher, logger, std::cin, std::cout);
  try {
    server.run();
  } catch (const leapmcp::TransportError &e) {
    logger.error(e.what());
    return 1;
  }
  return 0;
}
