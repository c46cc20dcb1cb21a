// Test runner: runs every in-process test suite and reports results.
// The suites need no server process and no network.

#include <iostream>
#include <vector>
#include <string>
#include <functional>
#include <chrono>

// Forward declarations of test functions from other test files.
namespace test_tool_call_parser {
    bool run_all_tests();
}

namespace test_tool_dispatcher {
    bool run_all_tests();
}

namespace test_conversation {
    bool run_all_tests();
}

namespace test_json_rpc {
    bool run_all_tests();
}

namespace test_server_tools {
    bool run_all_tests();
}

namespace test_client_config {
    bool run_all_tests();
}

namespace test_chat_models {
    bool run_all_tests();
}

struct TestSuite {
    std::string name;
    std::function<bool()> runner;
};

int main() {
    std::vector<TestSuite> suites = {
        {"test_tool_call_parser", test_tool_call_parser::run_all_tests},
        {"test_tool_dispatcher", test_tool_dispatcher::run_all_tests},
        {"test_conversation", test_conversation::run_all_tests},
        {"test_json_rpc", test_json_rpc::run_all_tests},
        {"test_server_tools", test_server_tools::run_all_tests},
        {"test_client_config", test_client_config::run_all_tests},
        {"test_chat_models", test_chat_models::run_all_tests},
    };

    int passed_count = 0;
    int failed_count = 0;
    auto total_start_time = std::chrono::steady_clock::now();

    std::cout << "=== mcplink Test Runner ===" << std::endl;
    std::cout << std::endl;

    for (const auto &suite : suites) {
        std::cout << "--- " << suite.name << " ---" << std::endl;
        auto suite_start_time = std::chrono::steady_clock::now();

        bool suite_passed = suite.runner();

        auto suite_elapsed = std::chrono::steady_clock::now() - suite_start_time;
        long suite_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(suite_elapsed).count();

        if (suite_passed) {
            std::cout << "  PASSED (" << suite_milliseconds << " ms)" << std::endl;
            passed_count++;
        } else {
            std::cout << "  FAILED (" << suite_milliseconds << " ms)" << std::endl;
            failed_count++;
        }
        std::cout << std::endl;
    }

    auto total_elapsed = std::chrono::steady_clock::now() - total_start_time;
    long total_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(total_elapsed).count();

    std::cout << "=== Results ===" << std::endl;
    std::cout << "  Passed: " << passed_count << std::endl;
    std::cout << "  Failed: " << failed_count << std::endl;
    std::cout << "  Total time: " << total_milliseconds << " ms" << std::endl;

    return (failed_count == 0) ? 0 : 1;
}
