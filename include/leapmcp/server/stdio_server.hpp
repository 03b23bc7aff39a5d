#pragma once
#include "leapmcp/logging.hpp"
#include "leapmcp/mcp/handler.hpp"
#include "leapmcp/types.hpp"

#include <iosfwd>
#include <string>

namespace leapmcp::server
{

/**
 * Line-delimited JSON-RPC transport.
 *
 * Reads one request per line from an input stream and writes one response
 * per line to an output stream, flushing after every message. Requests are
 * handled strictly one at a time in arrival order.
 *
 * Usage:
 *   auto catalog = leapmcp::make_catalog();
 *   leapmcp::Logger logger(std::cerr);
 *   leapmcp::mcp::Dispatcher dispatcher(catalog, logger);
 *   StdioServer server(dispatcher, logger, std::cin, std::cout);
 *   server.run();  // Blocking - runs until EOF
 *
 * Diagnostics go to the logger only; the output stream carries nothing but
 * protocol messages.
 */
class StdioServer
{
  public:
    /**
     * @param dispatcher Routes parsed requests; must outlive the server.
     * @param logger     Diagnostic sink, distinct from `out`.
     * @param in         Request stream.
     * @param out        Response/notification stream.
     */
    StdioServer(const mcp::Dispatcher& dispatcher, const Logger& logger, std::istream& in,
                std::ostream& out);

    /**
     * Process lines until end of input.
     *
     * Blank lines are skipped. A line that is not a request envelope gets a
     * parse-error response; a failing request gets an internal-error
     * response. Neither stops the loop.
     *
     * @return true once end of input is reached
     * @throws leapmcp::TransportError if writing to the output stream fails
     */
    bool run();

    /// Handle a single input line as run() would.
    void handle_line(const std::string& line);

    /// Frame and flush one message on the output stream.
    void write_message(const Json& message);

  private:
    const mcp::Dispatcher& dispatcher_;
    const Logger& logger_;
    std::istream& in_;
    std::ostream& out_;
};

/// `s` without leading and trailing whitespace.
std::string trim(const std::string& s);

} // namespace leapmcp::server
