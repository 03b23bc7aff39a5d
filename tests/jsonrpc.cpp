#include "leapmcp/exceptions.hpp"
#include "leapmcp/jsonrpc.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace leapmcp;
using namespace leapmcp::jsonrpc;

static bool parse_fails(const std::string& line)
{
    try
    {
        parse_request(line);
    }
    catch (const ParseError&)
    {
        return true;
    }
    return false;
}

int main()
{
    std::cout << "test_parse_request...\n";
    {
        auto r = parse_request(std::string(R"({"jsonrpc":"2.0","id":3,"method":"tools/list","params":{"x":1},"extra":true})"));
        assert(r.jsonrpc == "2.0");
        assert(r.method == "tools/list");
        assert(r.id && *r.id == 3);
        assert(r.params && (*r.params)["x"] == 1);
        assert(!r.is_notification());

        auto n = parse_request(std::string(R"({"jsonrpc":"2.0","method":"initialized"})"));
        assert(n.is_notification());
        assert(!n.params);

        // Present null id is kept; null params are dropped
        auto k = parse_request(std::string(R"({"jsonrpc":"2.0","id":null,"method":"m","params":null})"));
        assert(k.id && k.id->is_null());
        assert(!k.params);

        // The version string is carried, not checked
        auto v = parse_request(std::string(R"({"jsonrpc":"1.0","method":"m"})"));
        assert(v.jsonrpc == "1.0");
    }
    std::cout << "  [PASS]\n";

    std::cout << "test_parse_failures...\n";
    assert(parse_fails("{"));
    assert(parse_fails("nope"));
    assert(parse_fails("42"));
    assert(parse_fails(R"({"method":"m"})"));
    assert(parse_fails(R"({"jsonrpc":2,"method":"m"})"));
    assert(parse_fails(R"({"jsonrpc":"2.0"})"));
    assert(parse_fails(R"({"jsonrpc":"2.0","method":null})"));
    // Lexically valid but out of range for a double
    assert(parse_fails(R"({"jsonrpc":"2.0","id":1,"method":"m","params":{"a":1e400}})"));
    assert(parse_fails(R"({"jsonrpc":"2.0","id":1,"method":"m","params":{"a":-1e400}})"));
    std::cout << "  [PASS]\n";

    std::cout << "test_responses...\n";
    {
        Json ok = make_result(Json(1), Json{{"a", 1}});
        assert(ok.size() == 3);
        assert(ok["jsonrpc"] == "2.0");
        assert(ok["id"] == 1);
        assert(!ok.contains("error"));
        assert(ok.dump() == R"({"jsonrpc":"2.0","id":1,"result":{"a":1}})");

        Json parse = make_parse_error("bad input");
        assert(parse["id"] == "parse_error");
        assert(parse["error"]["code"] == -32700);
        assert(parse["error"]["message"] == "Parse error: bad input");
        assert(!parse.contains("result"));

        Json internal = make_internal_error(Json("abc"), "boom");
        assert(internal["id"] == "abc");
        assert(internal.dump() ==
               R"({"jsonrpc":"2.0","id":"abc","error":{"code":-32603,"message":"Internal error: boom"}})");

        Json missing = make_internal_error(std::nullopt, "boom");
        assert(missing["id"] == "error");

        Json note = make_notification("tools/listChanged");
        assert(note.dump() == R"({"jsonrpc":"2.0","method":"tools/listChanged","params":{}})");
    }
    std::cout << "  [PASS]\n";

    std::cout << "\nAll JSON-RPC tests passed!\n";
    return 0;
}
