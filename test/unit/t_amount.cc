#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE amount
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "amount.h"
#include "textual.h"

using namespace roasted;

namespace {
  const std::size_t USD = 0;
  const std::size_t IDR = 1;
  const std::size_t EUR = 2;
}

struct amount_fixture {
  amount_fixture() {}
};

BOOST_FIXTURE_TEST_SUITE(amount, amount_fixture)

BOOST_AUTO_TEST_CASE(testConstructors)
{
  amount_t x0;
  amount_t x1(199.0, USD);
  amount_t x2(50.0, USD, {price_t(15000.0, IDR)});

  BOOST_CHECK(x0.is_zero());
  BOOST_CHECK_EQUAL(199.0, x1.nominal);
  BOOST_CHECK_EQUAL(USD, x1.unit);
  BOOST_CHECK(x1.prices.empty());
  BOOST_CHECK_EQUAL(1u, x2.prices.size());

  amount_t zero = amount_t::zero(IDR);
  BOOST_CHECK(zero.is_zero());
  BOOST_CHECK_EQUAL(IDR, zero.unit);
}

BOOST_AUTO_TEST_CASE(testAdditionSameUnit)
{
  amount_t x1(10.0, USD);
  amount_t x2(5.5, USD);

  BOOST_CHECK_EQUAL(amount_t(15.5, USD), x1 + x2);

  x1 += x2;
  BOOST_CHECK_EQUAL(15.5, x1.nominal);
}

BOOST_AUTO_TEST_CASE(testAdditionWithPrice)
{
  amount_t rupiah(100.0, IDR);
  amount_t dollars(50.0, USD, {price_t(15000.0, IDR)});

  amount_t total = rupiah + dollars;
  BOOST_CHECK_EQUAL(750100.0, total.nominal);
  BOOST_CHECK_EQUAL(IDR, total.unit);
  BOOST_CHECK(total.prices.empty());
}

BOOST_AUTO_TEST_CASE(testAdditionPicksMatchingQuote)
{
  amount_t euros(1.0, EUR);
  amount_t dollars(10.0, USD, {price_t(15000.0, IDR), price_t(0.5, EUR)});

  BOOST_CHECK_EQUAL(amount_t(6.0, EUR), euros + dollars);
}

BOOST_AUTO_TEST_CASE(testAdditionKeepsLeftHandQuotes)
{
  amount_t dollars(10.0, USD, {price_t(15000.0, IDR)});
  amount_t more(5.0, USD);

  amount_t total = dollars + more;
  BOOST_CHECK_EQUAL(15.0, total.nominal);
  BOOST_CHECK_EQUAL(1u, total.prices.size());
  BOOST_CHECK(total.prices.front() == price_t(15000.0, IDR));
}

BOOST_AUTO_TEST_CASE(testAdditionWithoutPrice)
{
  amount_t rupiah(100.0, IDR);
  amount_t dollars(50.0, USD);

  BOOST_CHECK_THROW(rupiah + dollars, amount_error);

  // The quote is only looked for on the right-hand side
  amount_t quoted(100.0, IDR, {price_t(0.00007, USD)});
  BOOST_CHECK_THROW(quoted + dollars, amount_error);
}

BOOST_AUTO_TEST_CASE(testNegation)
{
  amount_t dollars(50.0, USD, {price_t(15000.0, IDR)});
  amount_t negated = - dollars;

  BOOST_CHECK_EQUAL(-50.0, negated.nominal);
  BOOST_CHECK_EQUAL(USD, negated.unit);
  BOOST_CHECK(negated.prices == dollars.prices);
  BOOST_CHECK_EQUAL(dollars, negated.negated());

  negated.in_place_negate();
  BOOST_CHECK_EQUAL(dollars, negated);
}

BOOST_AUTO_TEST_CASE(testSubtraction)
{
  amount_t rupiah(1000000.0, IDR);
  amount_t dollars(50.0, USD, {price_t(15000.0, IDR)});

  BOOST_CHECK_EQUAL(amount_t(250000.0, IDR), rupiah - dollars);
  BOOST_CHECK((dollars - dollars).is_zero());
}

BOOST_AUTO_TEST_CASE(testIsZeroIsExact)
{
  amount_t x(0.1, USD);
  x += amount_t(0.2, USD);
  x -= amount_t(0.3, USD);

  BOOST_CHECK(! x.is_zero());
  BOOST_CHECK(amount_t(-0.0, USD).is_zero());
  BOOST_CHECK_EQUAL(0, amount_t(0.0, USD).sign());
  BOOST_CHECK_EQUAL(-1, amount_t(-3.0, USD).sign());
  BOOST_CHECK_EQUAL(1, amount_t(3.0, USD).sign());
}

BOOST_AUTO_TEST_CASE(testFormatNominal)
{
  BOOST_CHECK_EQUAL(string("1500000"), format_nominal(1500000.0));
  BOOST_CHECK_EQUAL(string("-199"), format_nominal(-199.0));
  BOOST_CHECK_EQUAL(string("0.1"), format_nominal(0.1));
  BOOST_CHECK_EQUAL(string("12.5"), format_nominal(12.5));
}

BOOST_AUTO_TEST_CASE(testParseNominal)
{
  BOOST_CHECK_EQUAL(12.5, parse_nominal("12.5"));
  BOOST_CHECK_EQUAL(-3.0, parse_nominal("-3"));
  BOOST_CHECK_EQUAL(7.0, parse_nominal("+7"));
  BOOST_CHECK_THROW(parse_nominal("seven"), amount_error);
}

BOOST_AUTO_TEST_CASE(testParsedAmount)
{
  parsed_amount_t x1 = parsed_amount_t::parse("1337 USD");
  BOOST_CHECK_EQUAL(1337.0, x1.nominal);
  BOOST_CHECK_EQUAL(string("USD"), x1.unit);
  BOOST_CHECK(x1.prices.empty());

  parsed_amount_t x2 = parsed_amount_t::parse("1337 USD @ 1000 IDR");
  BOOST_CHECK_EQUAL(1u, x2.prices.size());
  BOOST_CHECK_EQUAL(1000.0, x2.prices[0].nominal);
  BOOST_CHECK_EQUAL(string("IDR"), x2.prices[0].unit);

  parsed_amount_t x3 = parsed_amount_t::parse("-12.50 EUR @ 1.1 USD @ 17000 IDR");
  BOOST_CHECK_EQUAL(-12.5, x3.nominal);
  BOOST_CHECK_EQUAL(2u, x3.prices.size());
  BOOST_CHECK_EQUAL(string("USD"), x3.prices[0].unit);
  BOOST_CHECK_EQUAL(string("IDR"), x3.prices[1].unit);

  std::ostringstream out;
  out << x2;
  BOOST_CHECK_EQUAL(string("1337 USD @ 1000 IDR"), out.str());
}

BOOST_AUTO_TEST_CASE(testParsedAmountInvalid)
{
  BOOST_CHECK_THROW(parsed_amount_t::parse("12 usd"), parse_error);
  BOOST_CHECK_THROW(parsed_amount_t::parse("12"), parse_error);
  BOOST_CHECK_THROW(parsed_amount_t::parse("USD 12"), parse_error);
  BOOST_CHECK_THROW(parsed_amount_t::parse("12 USD @"), parse_error);
  BOOST_CHECK_THROW(parsed_amount_t::parse("1.USD"), parse_error);
}

BOOST_AUTO_TEST_SUITE_END()
