#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE commodity
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "commodity.h"
#include "times.h"

using namespace roasted;

struct commodity_fixture {
  unit_store_t units;

  commodity_fixture() {
    units.declare("USD");
    units.declare("IDR");
    units.declare("EUR");
  }
};

BOOST_FIXTURE_TEST_SUITE(commodity, commodity_fixture)

BOOST_AUTO_TEST_CASE(testDeclare)
{
  BOOST_CHECK_EQUAL(3u, units.size());
  BOOST_CHECK_EQUAL(3u, units.declare("CHF"));

  // Declaring again is harmless and keeps the index
  BOOST_CHECK_EQUAL(0u, units.declare("USD"));
  BOOST_CHECK_EQUAL(4u, units.size());
}

BOOST_AUTO_TEST_CASE(testLookup)
{
  BOOST_CHECK_EQUAL(1u, units.lookup("IDR"));
  BOOST_CHECK(units.find("EUR"));
  BOOST_CHECK(! units.find("GBP"));

  BOOST_CHECK_THROW(units.lookup("GBP"), unit_error);
  BOOST_CHECK_THROW(units.lookup("usd"), unit_error);

  try {
    units.lookup("GBP");
    BOOST_FAIL("an undeclared unit must be rejected");
  }
  catch (const unit_error& err) {
    BOOST_CHECK_EQUAL(string("unit `GBP' has not been declared"),
                      string(err.what()));
  }
}

BOOST_AUTO_TEST_CASE(testUnresolveIndex)
{
  optional<string> code = units.unresolve(std::size_t(2));
  BOOST_REQUIRE(code);
  BOOST_CHECK_EQUAL(string("EUR"), *code);
  BOOST_CHECK(! units.unresolve(std::size_t(10)));
}

BOOST_AUTO_TEST_CASE(testResolveAmount)
{
  parsed_amount_t parsed(50.0, "USD");
  parsed.prices.push_back(parsed_price_t(15000.0, "IDR"));

  amount_t amount = units.resolve(parsed);
  BOOST_CHECK_EQUAL(50.0, amount.nominal);
  BOOST_CHECK_EQUAL(0u, amount.unit);
  BOOST_REQUIRE_EQUAL(1u, amount.prices.size());
  BOOST_CHECK(amount.prices[0] == price_t(15000.0, 1));

  BOOST_CHECK(units.unresolve(amount) == parsed);
  BOOST_CHECK_EQUAL(string("50 USD @ 15000 IDR"), units.format(amount));
}

BOOST_AUTO_TEST_CASE(testResolveUndeclared)
{
  BOOST_CHECK_THROW(units.resolve(parsed_amount_t(1.0, "GBP")), unit_error);

  parsed_amount_t parsed(1.0, "USD");
  parsed.prices.push_back(parsed_price_t(0.8, "GBP"));
  BOOST_CHECK_THROW(units.resolve(parsed), unit_error);

  BOOST_CHECK_THROW(units.unresolve(amount_t(1.0, 9)), unit_error);
}

BOOST_AUTO_TEST_CASE(testPriceHistory)
{
  std::size_t usd = units.lookup("USD");
  std::size_t idr = units.lookup("IDR");
  std::size_t eur = units.lookup("EUR");

  units.add_price(parse_date("2021-01-01"), usd, amount_t(14000.0, idr));
  units.add_price(parse_date("2021-03-01"), usd, amount_t(14500.0, idr));
  units.add_price(parse_date("2021-02-01"), usd, amount_t(0.82, eur));
  units.add_price(parse_date("2021-06-01"), usd, amount_t(15000.0, idr));

  BOOST_CHECK_EQUAL(4u, units.prices_size());

  BOOST_CHECK(! units.find_price(usd, idr, parse_date("2020-12-31")));

  optional<price_point_t> point =
    units.find_price(usd, idr, parse_date("2021-01-01"));
  BOOST_REQUIRE(point);
  BOOST_CHECK_EQUAL(14000.0, point->price.nominal);

  point = units.find_price(usd, idr, parse_date("2021-04-15"));
  BOOST_REQUIRE(point);
  BOOST_CHECK_EQUAL(14500.0, point->price.nominal);
  BOOST_CHECK_EQUAL(parse_date("2021-03-01"), point->when);

  point = units.find_price(usd, eur, parse_date("2021-12-31"));
  BOOST_REQUIRE(point);
  BOOST_CHECK_EQUAL(0.82, point->price.nominal);

  BOOST_CHECK(! units.find_price(idr, usd, parse_date("2021-12-31")));
}

BOOST_AUTO_TEST_CASE(testPriceSameDayLastWins)
{
  std::size_t usd = units.lookup("USD");
  std::size_t idr = units.lookup("IDR");

  units.add_price(parse_date("2021-01-01"), usd, amount_t(14000.0, idr));
  units.add_price(parse_date("2021-01-01"), usd, amount_t(14100.0, idr));

  optional<price_point_t> point =
    units.find_price(usd, idr, parse_date("2021-01-01"));
  BOOST_REQUIRE(point);
  BOOST_CHECK_EQUAL(14100.0, point->price.nominal);
}

BOOST_AUTO_TEST_CASE(testPriceForUnknownUnit)
{
  BOOST_CHECK_THROW(units.add_price(parse_date("2021-01-01"), 7,
                                    amount_t(1.0, 0)), unit_error);
}

BOOST_AUTO_TEST_SUITE_END()
