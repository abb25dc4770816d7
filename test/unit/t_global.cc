#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE global
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "global.h"

using namespace roasted;

struct global_fixture {
  global_scope_t global_scope;

  strings_list args(std::initializer_list<string> items) {
    return strings_list(items);
  }
};

BOOST_FIXTURE_TEST_SUITE(global, global_fixture)

BOOST_AUTO_TEST_CASE(testVersionInfo)
{
  std::ostringstream out;
  global_scope.show_version_info(out);

  BOOST_CHECK(out.str().find("Roasted " + version) == 0);
  BOOST_CHECK(out.str().find("The roasted developers") != string::npos);
  BOOST_CHECK(out.str().find("Wiegley") == string::npos);
}

BOOST_AUTO_TEST_CASE(testReadCommandArguments)
{
  global_scope.read_command_arguments
    (args({"--strict", "--debug", "account", "-v", "a.journal",
           "--trace", "2", "b.journal"}));

  BOOST_CHECK(global_scope.strict);
  BOOST_CHECK(! global_scope.show_help);
  BOOST_CHECK(! global_scope.show_version);
  BOOST_CHECK(global_scope.files == args({"a.journal", "b.journal"}));
}

BOOST_AUTO_TEST_CASE(testBadArguments)
{
  BOOST_CHECK_THROW(global_scope.read_command_arguments(args({"--frob"})),
                    std::invalid_argument);
  BOOST_CHECK_THROW(global_scope.read_command_arguments(args({"--debug"})),
                    std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(testUsageWithoutFiles)
{
  global_scope.read_command_arguments(args({"--strict"}));
  BOOST_CHECK_EQUAL(1, global_scope.execute_command());
}

BOOST_AUTO_TEST_SUITE_END()
