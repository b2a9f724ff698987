#include "mork_test_harness.hpp"
#include "mork_escape_tests.hpp"
#include "mork_dictionary_tests.hpp"
#include "mork_store_tests.hpp"
#include "mork_resolver_tests.hpp"
#include "mork_builder_tests.hpp"
#include "mork_database_tests.hpp"
#include "mork_integration_tests.hpp"

#include <cstring>
#include <iostream>

namespace mork::tests
{
    std::vector<test_result> results;
    char const * last_error = "";
}

bool first = true;

void run_tests( std::string suite_name, void(*pf_tests)() )
{
    if (!first)
        std::cout << '\n';
    else first = false;

    std::cout << suite_name << '\n';
    std::cout << std::string(suite_name.length(), '=') << '\n';
    pf_tests();
}

int main()
{
    using namespace mork::tests;

    #ifdef MORK_TESTS_ESCAPE__
        run_tests("Escape decoding", run_escape_tests);
    #endif

    #ifdef MORK_TESTS_DICTIONARY__
        run_tests("Dictionaries", run_dictionary_tests);
    #endif

    #ifdef MORK_TESTS_STORE__
        run_tests("Object stores", run_store_tests);
    #endif

    #ifdef MORK_TESTS_RESOLVER__
        run_tests("Reference resolution", run_resolver_tests);
    #endif

    #ifdef MORK_TESTS_BUILDER__
        run_tests("Builder", run_builder_tests);
    #endif

    #ifdef MORK_TESTS_DATABASE__
        run_tests("Database and editor", run_database_tests);
    #endif

    #ifdef MORK_TESTS_INTEGRATION__
        run_tests("Integration", run_integration_tests);
    #endif

    auto failed = std::count_if(results.begin(), results.end(),
        [](test_result const & r) { return !r.passed; });

    std::cout << '\n' << (results.size() - static_cast<size_t>(failed)) << '/' << results.size() << " passed\n";
    return failed == 0 ? 0 : 1;
}
