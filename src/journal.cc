/*
 * Copyright (c) 2025, The roasted developers.  All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are
 * met:
 *
 * - Redistributions of source code must retain the above copyright
 *   notice, this list of conditions and the following disclaimer.
 *
 * - Redistributions in binary form must reproduce the above copyright
 *   notice, this list of conditions and the following disclaimer in the
 *   documentation and/or other materials provided with the distribution.
 *
 * - Neither the name of the roasted project nor the names of its
 *   contributors may be used to endorse or promote products derived from
 *   this software without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
 * "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
 * LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
 * A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
 * OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
 * SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
 * LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
 * DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
 * THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
 * OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#include <system.hh>

#include "journal.h"
#include "context.h"

namespace roasted {

journal_t::journal_t()
{
  TRACE(1, "journal_t constructed");
}

journal_t::~journal_t()
{
  TRACE(1, "journal_t destroyed with " << days.size() << " daybooks");
}

std::size_t journal_t::read(parse_context_stack_t& context)
{
  parse_context_t& current(context.get_current());
  current.journal = this;

  if (! current.pathname.empty())
    sources.push_back(current.pathname);

  return read_textual(context);
}

void journal_t::process(const statement_t& statement)
{
  if (auto stmt = std::get_if<option_statement_t>(&statement)) {
    set_option(stmt->key, stmt->value);
  }
  else if (auto stmt = std::get_if<include_statement_t>(&statement)) {
    throw_(parse_error, _f("Cannot include %1% outside of a journal file")
           % stmt->pathname);
  }
  else if (auto stmt = std::get_if<unit_statement_t>(&statement)) {
    unit_statement(*stmt);
  }
  else if (auto stmt = std::get_if<custom_statement_t>(&statement)) {
    custom_statement(*stmt);
  }
  else if (auto stmt = std::get_if<open_statement_t>(&statement)) {
    open_statement(*stmt);
  }
  else if (auto stmt = std::get_if<close_statement_t>(&statement)) {
    close_statement(*stmt);
  }
  else if (auto stmt = std::get_if<pad_statement_t>(&statement)) {
    pad_statement(*stmt);
  }
  else if (auto stmt = std::get_if<balance_statement_t>(&statement)) {
    balance_statement(*stmt);
  }
  else if (auto stmt = std::get_if<price_statement_t>(&statement)) {
    price_statement(*stmt);
  }
  else if (auto stmt = std::get_if<xact_statement_t>(&statement)) {
    xact_statement(*stmt);
  }
}

void journal_t::unit_statement(const unit_statement_t& stmt)
{
  units.declare(stmt.code);
}

void journal_t::custom_statement(const custom_statement_t& stmt)
{
  DEBUG("journal.process", "custom at " << format_date(stmt.date)
        << " with " << stmt.args.size() << " argument(s)");
  daybook_at(stmt.date).add_custom(stmt.args);
}

void journal_t::open_statement(const open_statement_t& stmt)
{
  accounts.open(stmt.account, stmt.date);
}

void journal_t::close_statement(const close_statement_t& stmt)
{
  accounts.close(stmt.account, stmt.date);
}

void journal_t::pad_statement(const pad_statement_t& stmt)
{
  pad_t pad(accounts.resolve(stmt.target, stmt.date),
            accounts.resolve(stmt.source, stmt.date));

  DEBUG("journal.process", "pad " << stmt.target << " from " << stmt.source
        << " at " << format_date(stmt.date));
  daybook_at(stmt.date).add_pad(pad);
}

void journal_t::balance_statement(const balance_statement_t& stmt)
{
  balance_assertion_t assertion(accounts.resolve(stmt.account, stmt.date),
                                units.resolve(stmt.amount));

  DEBUG("journal.process", "balance of " << stmt.account << " is "
        << stmt.amount << " at " << format_date(stmt.date));
  daybook_at(stmt.date).add_balance_assertion(assertion);
}

void journal_t::price_statement(const price_statement_t& stmt)
{
  units.add_price(stmt.date, units.lookup(stmt.unit),
                  units.resolve(stmt.price));
}

void journal_t::xact_statement(const xact_statement_t& stmt)
{
  xact_t xact(stmt.header);

  for (const parsed_exchange_t& exchange : stmt.exchanges) {
    txn_account_t account = accounts.resolve(exchange.account, stmt.date);
    if (exchange.amount)
      xact.add_exchange(account, units.resolve(*exchange.amount));
    else
      xact.add_exchange(account, none);
  }

  xact.finalize();

  DEBUG("journal.process", "transaction \"" << xact.header.title
        << "\" at " << format_date(stmt.date) << " with "
        << xact.exchanges.size() << " exchange(s)");
  daybook_at(stmt.date).add_xact(xact);
}

void journal_t::set_option(const string& key, const string& value)
{
  DEBUG("journal.options", "option " << key << " = " << value);
  opts[key] = value;
}

optional<string> journal_t::get_option(const string& key) const
{
  options_map::const_iterator i = opts.find(key);
  if (i != opts.end())
    return (*i).second;
  return none;
}

const daybook_t * journal_t::get_at(const date_t& when) const
{
  daybooks_map::const_iterator i = days.find(when);
  if (i != days.end())
    return &(*i).second;
  return NULL;
}

std::size_t journal_t::xacts_size() const
{
  std::size_t count = 0;
  for (const daybooks_map::value_type& pair : days)
    count += pair.second.transactions().size();
  return count;
}

std::vector<xact_issues_t>
journal_t::check(const balance_check_t check) const
{
  std::vector<xact_issues_t> failed;

  for (const daybooks_map::value_type& pair : days) {
    for (const xact_t& xact : pair.second.transactions()) {
      if (optional<balance_issues_t> issues = xact.errors(check))
        failed.push_back(xact_issues_t{pair.first, &xact, *issues});
    }
  }
  return failed;
}

} // namespace roasted
