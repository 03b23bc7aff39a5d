#include "leapmcp/server/stdio_server.hpp"

#include "leapmcp/exceptions.hpp"
#include "leapmcp/jsonrpc.hpp"

#include <istream>
#include <ostream>
#include <string>

namespace leapmcp::server
{

std::string trim(const std::string& s)
{
    static const char* kWhitespace = " \t\r\n\f\v";
    auto first = s.find_first_not_of(kWhitespace);
    if (first == std::string::npos)
        return std::string{};
    auto last = s.find_last_not_of(kWhitespace);
    return s.substr(first, last - first + 1);
}

StdioServer::StdioServer(const mcp::Dispatcher& dispatcher, const Logger& logger,
                         std::istream& in, std::ostream& out)
    : dispatcher_(dispatcher), logger_(logger), in_(in), out_(out)
{
}

void StdioServer::write_message(const Json& message)
{
    // Parser diagnostics may quote invalid UTF-8 from the input line.
    out_ << message.dump(-1, ' ', false, Json::error_handler_t::replace) << '\n';
    out_.flush();
    if (!out_)
        throw TransportError("failed to write to output stream");
}

void StdioServer::handle_line(const std::string& line)
{
    std::string text = trim(line);
    // Skip empty lines
    if (text.empty())
        return;

    jsonrpc::Request request;
    try
    {
        request = jsonrpc::parse_request(text);
    }
    catch (const ParseError& e)
    {
        logger_.warning(std::string("Failed to parse request: ") + e.what());
        write_message(jsonrpc::make_parse_error(e.what()));
        return;
    }

    std::optional<jsonrpc::Response> response;
    try
    {
        response = dispatcher_.dispatch(request,
                                        [this](const Json& notification)
                                        { write_message(notification); });
    }
    catch (const TransportError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        logger_.error(std::string("Error handling request: ") + e.what());
        if (request.is_notification())
            return;
        write_message(jsonrpc::make_internal_error(request.id, e.what()));
        return;
    }

    // Notifications never get an answer.
    if (response && !request.is_notification())
        write_message(*response);
}

bool StdioServer::run()
{
    std::string line;
    while (std::getline(in_, line))
        handle_line(line);

    logger_.info("End of input, shutting down");
    return true;
}

} // namespace leapmcp::server
