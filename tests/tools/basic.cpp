#include "leapmcp/catalog.hpp"
#include "leapmcp/exceptions.hpp"
#include "leapmcp/tools/manager.hpp"
#include "leapmcp/tools/tool.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace leapmcp;
using namespace leapmcp::tools;

static bool throws_validation(const Tool& tool, const Json& args, const std::string& expected)
{
    try
    {
        tool.invoke(args);
    }
    catch (const ValidationError& e)
    {
        return std::string(e.what()) == expected;
    }
    return false;
}

void test_echo()
{
    std::cout << "test_echo...\n";
    auto echo = make_echo_tool();
    assert(echo.name() == "echo");
    assert(echo.invoke(Json{{"message", "hi"}}) == "Echo: hi");
    assert(echo.invoke(Json{{"message", ""}}) == "Echo: ");
    assert(echo.invoke(Json{{"message", "a \"quoted\"\nline"}}) == "Echo: a \"quoted\"\nline");
    std::cout << "  [PASS]\n";
}

void test_echo_missing_message()
{
    std::cout << "test_echo_missing_message...\n";
    auto echo = make_echo_tool();
    assert(throws_validation(echo, Json::object(), "Missing 'message' argument"));
    assert(throws_validation(echo, Json{{"message", 42}}, "Missing 'message' argument"));
    assert(throws_validation(echo, Json{{"message", nullptr}}, "Missing 'message' argument"));
    std::cout << "  [PASS]\n";
}

void test_add_formatting()
{
    std::cout << "test_add_formatting...\n";
    auto add = make_add_tool();
    assert(add.invoke(Json{{"a", 2}, {"b", 3}}) == "2 + 3 = 5");
    assert(add.invoke(Json{{"a", 2.0}, {"b", 3.0}}) == "2 + 3 = 5");
    assert(add.invoke(Json{{"a", 1.5}, {"b", 2.25}}) == "1.5 + 2.25 = 3.75");
    assert(add.invoke(Json{{"a", 0.1}, {"b", 0.2}}) == "0.1 + 0.2 = 0.30000000000000004");
    assert(add.invoke(Json{{"a", -4}, {"b", 1}}) == "-4 + 1 = -3");
    assert(add.invoke(Json{{"a", 1e21}, {"b", 0}}) ==
           "1000000000000000000000 + 0 = 1000000000000000000000");
    std::cout << "  [PASS]\n";
}

void test_add_missing_arguments()
{
    std::cout << "test_add_missing_arguments...\n";
    auto add = make_add_tool();
    assert(throws_validation(add, Json{{"b", 1}}, "Missing 'a' argument"));
    assert(throws_validation(add, Json{{"a", 1}}, "Missing 'b' argument"));
    assert(throws_validation(add, Json{{"a", "1"}, {"b", 2}}, "Missing 'a' argument"));
    assert(throws_validation(add, Json{{"a", 1}, {"b", true}}, "Missing 'b' argument"));
    std::cout << "  [PASS]\n";
}

void test_schemas()
{
    std::cout << "test_schemas...\n";
    auto echo = make_echo_tool();
    assert(echo.input_schema()["type"] == "object");
    assert(echo.input_schema()["required"] == Json::array({"message"}));
    assert(echo.input_schema()["properties"]["message"]["type"] == "string");

    auto add = make_add_tool();
    assert(add.input_schema()["required"] == Json::array({"a", "b"}));
    assert(add.input_schema()["properties"]["b"]["type"] == "number");

    auto d = add.descriptor();
    auto it = d.begin();
    assert(it.key() == "name");
    ++it;
    assert(it.key() == "description");
    ++it;
    assert(it.key() == "inputSchema");
    std::cout << "  [PASS]\n";
}

void test_manager_order_and_lookup()
{
    std::cout << "test_manager_order_and_lookup...\n";
    ToolManager tm;
    tm.register_tool(make_echo_tool());
    tm.register_tool(make_add_tool());
    tm.register_tool(Tool{"upper", "Upper-cases", Json::object(),
                          [](const Json&) { return std::string("X"); }});

    auto names = tm.list_names();
    assert(names.size() == 3);
    assert(names[0] == "echo" && names[1] == "add" && names[2] == "upper");

    // Re-registering keeps the original position
    tm.register_tool(Tool{"echo", "Replaced", Json::object(),
                          [](const Json&) { return std::string("replaced"); }});
    assert(tm.size() == 3);
    assert(tm.list()[0].description() == "Replaced");
    assert(tm.invoke("echo", Json::object()) == "replaced");

    assert(tm.has("add"));
    assert(!tm.has("nonexistent"));
    bool threw = false;
    try
    {
        tm.invoke("nonexistent", Json::object());
    }
    catch (const NotFoundError& e)
    {
        threw = std::string(e.what()) == "Unknown tool: nonexistent";
    }
    assert(threw);
    std::cout << "  [PASS]\n";
}

int main()
{
    std::cout << "=== Tool Tests ===\n\n";
    test_echo();
    test_echo_missing_message();
    test_add_formatting();
    test_add_missing_arguments();
    test_schemas();
    test_manager_order_and_lookup();
    std::cout << "\nAll tool tests passed!\n";
    return 0;
}
