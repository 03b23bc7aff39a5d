/// @file tests/main_header/compile_test.cpp
/// @brief Compile test for main leapmcp.hpp header
///
/// This test verifies that including just <leapmcp.hpp> gives access to
/// every public component.

#include "leapmcp.hpp"

#include <cassert>
#include <iostream>
#include <sstream>

using namespace leapmcp;

int main()
{
    std::cout << "=== Main Header Compile Test ===" << std::endl;

    std::cout << "test_catalog_accessible..." << std::endl;
    {
        const Catalog catalog = make_catalog();
        assert(catalog.tools.size() == 2);
        assert(catalog.resources.list().size() == 1);
        assert(catalog.prompts.list().size() == 1);
        assert(catalog.server_info.name == "leap-mcp");
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_server_accessible..." << std::endl;
    {
        std::istringstream in;
        std::ostringstream out;
        std::ostringstream log;
        Logger logger(log);
        const Catalog catalog = make_catalog();
        mcp::Dispatcher dispatcher(catalog, logger);
        server::StdioServer server(dispatcher, logger, in, out);
        assert(server.run());
        assert(out.str().empty());
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
