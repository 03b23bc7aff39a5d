#include "leapmcp/catalog.hpp"
#include "leapmcp/exceptions.hpp"
#include "leapmcp/logging.hpp"
#include "leapmcp/mcp/handler.hpp"
#include "leapmcp/server/stdio_server.hpp"
#include "leapmcp/settings.hpp"

#include <iostream>
#include <string>

int main()
{
    using namespace leapmcp;

    // stdout is the protocol channel; diagnostics go to stderr.
    Settings settings = Settings::from_env();
    Logger logger(std::cerr, settings.level());

    logger.info("Starting MCP server...");

    const Catalog catalog = make_catalog();
    mcp::Dispatcher dispatcher(catalog, logger);
    server::StdioServer server(dispatcher, logger, std::cin, std::cout);

    logger.info("MCP server ready. Waiting for requests...");

    try
    {
        return server.run() ? 0 : 1;
    }
    catch (const TransportError& e)
    {
        logger.error(std::string("Transport error: ") + e.what());
        return 1;
    }
}
