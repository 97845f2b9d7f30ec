/// @file tests/main_header/compile_test.cpp
/// @brief Compile test for main mcpgate.hpp header

#include "mcpgate.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace mcpgate;

int main()
{
    std::cout << "=== Main Header Compile Test ===" << std::endl;

    std::cout << "test_core_types_accessible..." << std::endl;
    {
        StdioServerConfig cfg{"server", {"--flag"}, {{"K", "V"}}, std::nullopt};
        Json j = cfg;
        assert(j["type"] == "stdio");
        assert(std::string(JSONRPC_VERSION) == "2.0");
        assert(std::string(VERSION_STRING).size() >= 5);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_pool_accessible..." << std::endl;
    {
        stdio::ProcessPool pool;
        assert(!pool.has("anything"));
        assert(pool.server_ids().empty());
        stdio::ResponseBuffer buffer;
        assert(buffer.pending_count() == 0);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "=== All main header tests passed ===" << std::endl;
    return 0;
}
