#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE statement
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "statement.h"

using namespace roasted;

struct statement_fixture {
  statement_t parse_statement(const std::string& input) {
    return build_statement(parse_rule(node_t::STATEMENT, input));
  }
};

BOOST_FIXTURE_TEST_SUITE(statement, statement_fixture)

BOOST_AUTO_TEST_CASE(testDirectives)
{
  statement_t stmt = parse_statement("option \"operating_currency\" \"USD\"\n");
  const option_statement_t * option = std::get_if<option_statement_t>(&stmt);
  BOOST_REQUIRE(option);
  BOOST_CHECK_EQUAL(string("operating_currency"), option->key);
  BOOST_CHECK_EQUAL(string("USD"), option->value);
  BOOST_CHECK(! statement_date(stmt));

  stmt = parse_statement("include \"accounts/2021.ledger\"");
  const include_statement_t * include = std::get_if<include_statement_t>(&stmt);
  BOOST_REQUIRE(include);
  BOOST_CHECK_EQUAL(string("accounts/2021.ledger"), include->pathname);

  stmt = parse_statement("unit IDR\n");
  const unit_statement_t * unit = std::get_if<unit_statement_t>(&stmt);
  BOOST_REQUIRE(unit);
  BOOST_CHECK_EQUAL(string("IDR"), unit->code);
}

BOOST_AUTO_TEST_CASE(testAccountStatements)
{
  statement_t stmt = parse_statement("2021-10-28 open Assets:Bank:Jawir\n");
  const open_statement_t * open = std::get_if<open_statement_t>(&stmt);
  BOOST_REQUIRE(open);
  BOOST_CHECK_EQUAL(date_t(2021, 10, 28), open->date);
  BOOST_CHECK_EQUAL(account_t::parse("Assets:Bank:Jawir"), open->account);
  BOOST_CHECK_EQUAL(ACCOUNT_ASSETS, open->account.kind);
  BOOST_CHECK_EQUAL(2u, open->account.segments.size());

  stmt = parse_statement("2021-12-31 close Liabilities:CreditCard\n");
  const close_statement_t * close = std::get_if<close_statement_t>(&stmt);
  BOOST_REQUIRE(close);
  BOOST_CHECK_EQUAL(date_t(2021, 12, 31), close->date);
  BOOST_CHECK_EQUAL(string("Liabilities:CreditCard"), close->account.fullname());

  stmt = parse_statement("2021-01-01 pad Assets:Cash Equity:Opening\n");
  const pad_statement_t * pad = std::get_if<pad_statement_t>(&stmt);
  BOOST_REQUIRE(pad);
  BOOST_CHECK_EQUAL(account_t::parse("Assets:Cash"), pad->target);
  BOOST_CHECK_EQUAL(account_t::parse("Equity:Opening"), pad->source);
}

BOOST_AUTO_TEST_CASE(testCustom)
{
  statement_t stmt =
    parse_statement("2021-10-28 custom \"budget\" \"Expenses:Food\" \"500\"\n");
  const custom_statement_t * custom = std::get_if<custom_statement_t>(&stmt);
  BOOST_REQUIRE(custom);
  BOOST_REQUIRE_EQUAL(3u, custom->args.size());
  BOOST_CHECK_EQUAL(string("budget"), custom->args[0]);
  BOOST_CHECK_EQUAL(string("500"), custom->args[2]);
  BOOST_CHECK(statement_date(stmt) == date_t(2021, 10, 28));
}

BOOST_AUTO_TEST_CASE(testBalanceAndPrice)
{
  statement_t stmt =
    parse_statement("2021-11-01 balance Assets:Bank:BCA 1500000 IDR\n");
  const balance_statement_t * balance = std::get_if<balance_statement_t>(&stmt);
  BOOST_REQUIRE(balance);
  BOOST_CHECK(balance->amount == parsed_amount_t(1500000, "IDR"));

  stmt = parse_statement("2021-11-01 price USD 14250.5 IDR\n");
  const price_statement_t * price = std::get_if<price_statement_t>(&stmt);
  BOOST_REQUIRE(price);
  BOOST_CHECK_EQUAL(string("USD"), price->unit);
  BOOST_CHECK(price->price == parsed_amount_t(14250.5, "IDR"));
  BOOST_CHECK(statement_date(stmt) == date_t(2021, 11, 1));
}

BOOST_AUTO_TEST_CASE(testTransaction)
{
  statement_t stmt =
    parse_statement("2021-11-02 ! \"Airline\" \"Flight home\"\n"
                    "    Expenses:Travel      50 USD @ 15000 IDR\n"
                    "    Assets:Bank:BCA\n");
  const xact_statement_t * xact = std::get_if<xact_statement_t>(&stmt);
  BOOST_REQUIRE(xact);

  BOOST_CHECK_EQUAL(date_t(2021, 11, 2), xact->date);
  BOOST_CHECK_EQUAL(XACT_UNSETTLED, xact->header.state);
  BOOST_CHECK(xact->header.payee == string("Airline"));
  BOOST_CHECK_EQUAL(string("Flight home"), xact->header.title);

  BOOST_REQUIRE_EQUAL(2u, xact->exchanges.size());

  const parsed_exchange_t& first(xact->exchanges[0]);
  BOOST_CHECK_EQUAL(account_t::parse("Expenses:Travel"), first.account);
  BOOST_REQUIRE(first.amount);
  BOOST_CHECK_EQUAL(50.0, first.amount->nominal);
  BOOST_CHECK_EQUAL(string("USD"), first.amount->unit);
  BOOST_REQUIRE_EQUAL(1u, first.amount->prices.size());
  BOOST_CHECK(first.amount->prices[0] == parsed_price_t(15000, "IDR"));

  BOOST_CHECK(! xact->exchanges[1].amount);
}

BOOST_AUTO_TEST_CASE(testTransactionStates)
{
  const char * const inputs[] = {
    "2021-01-01 * \"T\"\n  Assets:Cash 1 USD\n",
    "2021-01-01 ! \"T\"\n  Assets:Cash 1 USD\n",
    "2021-01-01 # \"T\"\n  Assets:Cash 1 USD\n"
  };
  const xact_state_t states[] = {
    XACT_SETTLED, XACT_UNSETTLED, XACT_RECURRING
  };

  for (std::size_t i = 0; i < 3; i++) {
    statement_t stmt = parse_statement(inputs[i]);
    const xact_statement_t * xact = std::get_if<xact_statement_t>(&stmt);
    BOOST_REQUIRE(xact);
    BOOST_CHECK_EQUAL(states[i], xact->header.state);
    BOOST_CHECK(! xact->header.payee);
    BOOST_CHECK_EQUAL(string("T"), xact->header.title);
  }
}

BOOST_AUTO_TEST_CASE(testInvalidValues)
{
  // Well-formed by the grammar, but not a calendar date
  BOOST_CHECK_THROW(parse_statement("2021-02-30 open Assets:Cash\n"),
                    date_error);
  BOOST_CHECK_THROW(parse_statement("2021-13-01 open Assets:Cash\n"),
                    date_error);

  // Unknown account kind
  BOOST_CHECK_THROW(parse_statement("2021-01-01 open Savings:Cash\n"),
                    account_error);
  BOOST_CHECK_THROW(parse_statement("2021-01-01 * \"T\"\n"
                                    "    Assets:Cash 1 USD\n"
                                    "    Spending:Food\n"),
                    account_error);
}

BOOST_AUTO_TEST_CASE(testBuildersCheckNodeKinds)
{
  node_t date = parse_rule(node_t::DATE, "2021-01-01");
  BOOST_CHECK_THROW(build_account(date), parse_error);
  BOOST_CHECK_THROW(build_amount(date), parse_error);
  BOOST_CHECK_THROW(build_header(date), parse_error);
  BOOST_CHECK_THROW(build_statement(date), parse_error);

  BOOST_CHECK_EQUAL(date_t(2021, 1, 1), build_date(date));

  node_t amount = parse_rule(node_t::AMOUNT, "-3.25 EUR");
  parsed_amount_t parsed = build_amount(amount);
  BOOST_CHECK_EQUAL(-3.25, parsed.nominal);
  BOOST_CHECK(parsed.prices.empty());
}

BOOST_AUTO_TEST_SUITE_END()
