#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE account
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "account.h"
#include "times.h"

using namespace roasted;

struct account_fixture {
  account_store_t store;

  account_t acct(const string& name) {
    return account_t::parse(name);
  }

  segment_indices_t indices(const string& name, const string& when) {
    return store.resolve(acct(name), parse_date(when)).indices;
  }
};

BOOST_FIXTURE_TEST_SUITE(account, account_fixture)

BOOST_AUTO_TEST_CASE(testParseEachKind)
{
  BOOST_CHECK(account_t(ACCOUNT_ASSETS, {"Bank", "Swiss"}) ==
              acct("Assets:Bank:Swiss"));
  BOOST_CHECK(account_t(ACCOUNT_EXPENSES, {"Dining"}) ==
              acct("Expenses:Dining"));
  BOOST_CHECK(account_t(ACCOUNT_LIABILITIES, {"Bank", "CreditCard"}) ==
              acct("Liabilities:Bank:CreditCard"));
  BOOST_CHECK(account_t(ACCOUNT_INCOME, {"Salary"}) ==
              acct("Income:Salary"));
  BOOST_CHECK(account_t(ACCOUNT_EQUITY, {"Opening-Balance"}) ==
              acct("Equity:Opening-Balance"));
}

BOOST_AUTO_TEST_CASE(testDisplayRoundTrip)
{
  const char * names[] = {
    "Assets:Bank:Swiss",
    "Expenses:Travels:Airplane:Emirates",
    "Liabilities:Bank:CreditCard",
    "Income:Salary",
    "Equity:Opening-Balance"
  };

  for (const char * name : names) {
    account_t account(acct(name));
    std::ostringstream out;
    out << account;
    BOOST_CHECK_EQUAL(string(name), out.str());
    BOOST_CHECK(acct(out.str()) == account);
  }

  BOOST_CHECK_EQUAL(string("Assets:Bank:Swiss"),
                    account_t(ACCOUNT_ASSETS, {"Bank", "Swiss"}).fullname());
}

BOOST_AUTO_TEST_CASE(testParseInvalid)
{
  BOOST_CHECK_THROW(acct("Foo:Bar"), account_error);
  BOOST_CHECK_THROW(acct("assets:Bank"), account_error);
  BOOST_CHECK_THROW(acct("Assets"), account_error);
  BOOST_CHECK_THROW(acct("Assets:"), account_error);
  BOOST_CHECK_THROW(acct("Assets::Bank"), account_error);
  BOOST_CHECK_THROW(acct("Assets:Bank Account"), account_error);
  BOOST_CHECK_THROW(acct("Assets:Bank@Home"), account_error);

  try {
    acct("Foo:Bar");
    BOOST_FAIL("an unknown kind must be rejected");
  }
  catch (const account_error& err) {
    BOOST_CHECK_EQUAL(string("input `Foo:Bar' is not a valid token for Account"),
                      string(err.what()));
  }
}

BOOST_AUTO_TEST_CASE(testSegmentsAreCaseSensitive)
{
  store.open(acct("Assets:Bank"), parse_date("2021-01-01"));
  BOOST_CHECK_THROW(indices("Assets:bank", "2021-01-02"),
                    unopened_account_error);
}

BOOST_AUTO_TEST_CASE(testInternSharedSegments)
{
  date_t when = parse_date("2021-10-28");

  store.open(acct("Assets:Bank:Jawir"), when);
  store.open(acct("Expenses:Dining"), when);
  store.open(acct("Income:Salary"), when);
  store.open(acct("Liabilities:Bank:CreditCard"), when);
  store.open(acct("Equity:Opening-Balance"), when);

  BOOST_CHECK(segment_indices_t({0, 1}) ==
              indices("Assets:Bank:Jawir", "2021-10-28"));
  BOOST_CHECK(segment_indices_t({2}) ==
              indices("Expenses:Dining", "2021-10-28"));
  BOOST_CHECK(segment_indices_t({3}) ==
              indices("Income:Salary", "2021-10-28"));
  BOOST_CHECK(segment_indices_t({0, 4}) ==
              indices("Liabilities:Bank:CreditCard", "2021-10-28"));
  BOOST_CHECK(segment_indices_t({5}) ==
              indices("Equity:Opening-Balance", "2021-10-28"));

  BOOST_CHECK_EQUAL(6u, store.segments_size());
  BOOST_CHECK_EQUAL(5u, store.accounts_size());

  // Opening the same path again interns nothing new
  store.open(acct("Assets:Bank:Jawir"), when);
  BOOST_CHECK_EQUAL(6u, store.segments_size());
  BOOST_CHECK_EQUAL(5u, store.accounts_size());
}

BOOST_AUTO_TEST_CASE(testDeepPath)
{
  store.open(acct("Expenses:Travels:Airplane:Emirates"),
             parse_date("2021-01-01"));
  store.open(acct("Assets:Bank:Suisse"), parse_date("2021-01-01"));

  BOOST_CHECK(segment_indices_t({0, 1, 2}) ==
              indices("Expenses:Travels:Airplane:Emirates", "2021-01-01"));
  BOOST_CHECK(segment_indices_t({3, 4}) ==
              indices("Assets:Bank:Suisse", "2021-01-01"));
}

BOOST_AUTO_TEST_CASE(testTemporalValidity)
{
  store.open(acct("Expenses:Dining"), parse_date("2021-10-28"));

  try {
    indices("Expenses:Dining", "2021-10-25");
    BOOST_FAIL("resolving before the account was opened must fail");
  }
  catch (const unopened_account_error& err) {
    BOOST_CHECK_EQUAL
      (string("account `Expenses:Dining' is not opened at 2021-10-25"),
       string(err.what()));
  }

  BOOST_CHECK_NO_THROW(indices("Expenses:Dining", "2021-10-28"));
  BOOST_CHECK_NO_THROW(indices("Expenses:Dining", "2030-01-01"));
}

BOOST_AUTO_TEST_CASE(testUnknownSegmentIsNotInterned)
{
  store.open(acct("Assets:Bank"), parse_date("2021-01-01"));

  BOOST_CHECK_THROW(indices("Assets:Cash", "2021-01-02"),
                    unopened_account_error);
  BOOST_CHECK_EQUAL(1u, store.segments_size());
  BOOST_CHECK(! store.find_segment("Cash"));
  BOOST_CHECK(! store.lookup(acct("Assets:Cash")));
}

BOOST_AUTO_TEST_CASE(testKnownSegmentsOtherKind)
{
  // Every segment is known, but this path was never opened as Income
  store.open(acct("Assets:Bank"), parse_date("2021-01-01"));
  BOOST_CHECK_THROW(indices("Income:Bank", "2021-01-02"),
                    unopened_account_error);
}

BOOST_AUTO_TEST_CASE(testReopen)
{
  account_t jawir(acct("Assets:Bank:Jawir"));

  store.open(jawir, parse_date("2021-01-01"));
  store.close(jawir, parse_date("2021-01-03"));
  store.open(jawir, parse_date("2021-01-04"));

  BOOST_CHECK_NO_THROW(indices("Assets:Bank:Jawir", "2021-01-01"));
  BOOST_CHECK_NO_THROW(indices("Assets:Bank:Jawir", "2021-01-02"));
  BOOST_CHECK_THROW(indices("Assets:Bank:Jawir", "2021-01-03"),
                    unopened_account_error);
  BOOST_CHECK_NO_THROW(indices("Assets:Bank:Jawir", "2021-01-04"));
  BOOST_CHECK_NO_THROW(indices("Assets:Bank:Jawir", "2022-06-30"));

  const account_activities_t * windows = store.find_activities(jawir);
  BOOST_REQUIRE(windows);
  BOOST_CHECK_EQUAL(2u, windows->size());
  BOOST_CHECK(windows->front().closed_at);
  BOOST_CHECK(! windows->back().closed_at);
}

BOOST_AUTO_TEST_CASE(testReopenOnCloseDate)
{
  account_t cash(acct("Assets:Cash"));

  store.open(cash, parse_date("2021-01-01"));
  store.close(cash, parse_date("2021-01-03"));
  store.open(cash, parse_date("2021-01-03"));

  BOOST_CHECK_NO_THROW(indices("Assets:Cash", "2021-01-03"));
}

BOOST_AUTO_TEST_CASE(testOpenMovesPendingWindow)
{
  account_t cash(acct("Assets:Cash"));

  store.open(cash, parse_date("2021-01-10"));
  store.open(cash, parse_date("2021-01-05"));

  BOOST_CHECK_NO_THROW(indices("Assets:Cash", "2021-01-06"));
  BOOST_CHECK_EQUAL(1u, store.find_activities(cash)->size());

  store.open(cash, parse_date("2021-01-20"));
  BOOST_CHECK_THROW(indices("Assets:Cash", "2021-01-06"),
                    unopened_account_error);
}

BOOST_AUTO_TEST_CASE(testReopenBeforeClose)
{
  account_t cash(acct("Assets:Cash"));

  store.open(cash, parse_date("2021-01-01"));
  store.close(cash, parse_date("2021-01-10"));
  BOOST_CHECK_THROW(store.open(cash, parse_date("2021-01-05")),
                    account_error);
}

BOOST_AUTO_TEST_CASE(testMovedOpeningCannotOverlapClosedWindow)
{
  account_t cash(acct("Assets:Cash"));

  store.open(cash, parse_date("2021-01-01"));
  store.close(cash, parse_date("2021-01-10"));
  store.open(cash, parse_date("2021-01-20"));

  // Moving the pending window back into the closed one is refused
  BOOST_CHECK_THROW(store.open(cash, parse_date("2021-01-05")),
                    account_error);
  BOOST_CHECK_THROW(indices("Assets:Cash", "2021-01-15"),
                    unopened_account_error);

  // Moving it back to the close date itself is fine
  store.open(cash, parse_date("2021-01-10"));
  BOOST_CHECK_NO_THROW(indices("Assets:Cash", "2021-01-15"));

  const account_activities_t * windows = store.find_activities(cash);
  BOOST_REQUIRE(windows);
  BOOST_CHECK_EQUAL(2u, windows->size());
}

BOOST_AUTO_TEST_CASE(testCloseErrors)
{
  account_t cash(acct("Assets:Cash"));

  // Never opened, segments unknown
  BOOST_CHECK_THROW(store.close(cash, parse_date("2021-01-01")), close_error);

  // Segments known through another kind, but no record for this path
  store.open(acct("Expenses:Cash"), parse_date("2021-01-01"));
  BOOST_CHECK_THROW(store.close(cash, parse_date("2021-01-02")), close_error);

  store.open(cash, parse_date("2021-01-05"));

  // Closing before the window opened
  BOOST_CHECK_THROW(store.close(cash, parse_date("2021-01-04")), close_error);

  store.close(cash, parse_date("2021-01-06"));

  // Closing twice
  BOOST_CHECK_THROW(store.close(cash, parse_date("2021-01-07")), close_error);

  // All of them are account errors too
  BOOST_CHECK_THROW(store.close(cash, parse_date("2021-01-07")), account_error);
}

BOOST_AUTO_TEST_CASE(testUnresolve)
{
  account_t card(acct("Liabilities:Bank:CreditCard"));
  date_t    when = parse_date("2021-03-01");

  store.open(acct("Assets:Bank:Jawir"), when);
  store.open(card, when);

  txn_account_t resolved = store.resolve(card, when);
  BOOST_CHECK_EQUAL(ACCOUNT_LIABILITIES, resolved.kind);
  BOOST_CHECK(store.unresolve(resolved) == card);

  BOOST_CHECK_THROW(store.unresolve(txn_account_t(ACCOUNT_ASSETS, {0, 42})),
                    account_error);
}

BOOST_AUTO_TEST_CASE(testActivityContains)
{
  account_activity_t window(parse_date("2021-01-01"));
  BOOST_CHECK(window.contains(parse_date("2021-01-01")));
  BOOST_CHECK(! window.contains(parse_date("2020-12-31")));

  window.closed_at = parse_date("2021-02-01");
  BOOST_CHECK(window.contains(parse_date("2021-01-31")));
  BOOST_CHECK(! window.contains(parse_date("2021-02-01")));
}

BOOST_AUTO_TEST_SUITE_END()
