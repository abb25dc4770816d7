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

#include "xact.h"

namespace roasted {

optional<xact_state_t> find_xact_state(const char flag)
{
  switch (flag) {
  case '*': return XACT_SETTLED;
  case '!': return XACT_UNSETTLED;
  case '#': return XACT_RECURRING;
  default:
    break;
  }
  return none;
}

char xact_state_flag(const xact_state_t state)
{
  switch (state) {
  case XACT_SETTLED:   return '*';
  case XACT_UNSETTLED: return '!';
  case XACT_RECURRING: return '#';
  case XACT_VIRTUAL:   return '~';
  }
  assert(false);
  return '\0';
}

void xact_t::add_exchange(const txn_account_t&      account,
                          const optional<amount_t>& amount)
{
  if (amount)
    exchanges.push_back(exchange_t(account, *amount));
  else
    exchanges.push_back(exchange_t(account, amount_t(), true));
}

optional<std::size_t> xact_t::anchor_unit() const
{
  for (const exchange_t& exchange : exchanges)
    if (! exchange.elided)
      return exchange.amount.unit;
  return none;
}

void xact_t::finalize()
{
  exchange_t * null_exchange = NULL;

  for (exchange_t& exchange : exchanges) {
    if (exchange.elided) {
      if (null_exchange)
        throw_(elision_error,
               _("only one account may have its amount elided"));
      null_exchange = &exchange;
    }
  }

  if (! null_exchange) {
    DEBUG("xact.finalize", "all " << exchanges.size()
          << " amounts are explicit");
    return;
  }

  optional<std::size_t> anchor = anchor_unit();
  if (! anchor)
    throw_(balance_error,
           _("an elided amount needs at least one explicit amount"));

  amount_t total(amount_t::zero(*anchor));
  for (const exchange_t& exchange : exchanges) {
    if (! exchange.elided) {
      total += exchange.amount;
      DEBUG("xact.finalize", "running total = " << total);
    }
  }

  null_exchange->amount = amount_t::zero(*anchor) - total;
  DEBUG("xact.finalize", "elided amount = " << null_exchange->amount);
}

amount_t xact_t::sum() const
{
  optional<std::size_t> anchor = anchor_unit();
  if (! anchor)
    throw_(balance_error, _("transaction has no explicit amount to sum"));

  amount_t total(amount_t::zero(*anchor));
  for (const exchange_t& exchange : exchanges)
    total += exchange.amount;
  return total;
}

amount_t xact_t::total_debited() const
{
  optional<std::size_t> anchor = anchor_unit();
  if (! anchor)
    throw_(balance_error, _("transaction has no explicit amount to sum"));

  amount_t total(amount_t::zero(*anchor));
  for (const exchange_t& exchange : exchanges)
    if (exchange.amount.sign() > 0)
      total += exchange.amount;
  return total;
}

amount_t xact_t::total_credited() const
{
  optional<std::size_t> anchor = anchor_unit();
  if (! anchor)
    throw_(balance_error, _("transaction has no explicit amount to sum"));

  amount_t total(amount_t::zero(*anchor));
  for (const exchange_t& exchange : exchanges)
    if (exchange.amount.sign() < 0)
      total -= exchange.amount;
  return total;
}

optional<balance_issues_t> xact_t::errors(const balance_check_t check) const
{
  balance_issues_t issues;

  if (exchanges.size() <= 1)
    issues.push_back
      (balance_issue_t(balance_issue_t::UNBALANCED,
                       (_f("transaction has %1% exchange(s), "
                           "at least two are needed") %
                        exchanges.size()).str()));

  if (check == CHECK_WITH_SUM && ! exchanges.empty()) {
    try {
      amount_t total = sum();
      if (! total.is_zero())
        issues.push_back
          (balance_issue_t(balance_issue_t::NOT_ZERO_SUM,
                           (_f("transaction does not balance, "
                               "its exchanges sum to %1%") %
                            format_nominal(total.nominal)).str()));
    }
    catch (const std::exception& err) {
      issues.push_back(balance_issue_t(balance_issue_t::OTHER, err.what()));
    }
  }

  if (issues.empty())
    return none;
  return issues;
}

std::ostream& operator<<(std::ostream& out, const balance_issue_t& issue)
{
  switch (issue.kind) {
  case balance_issue_t::UNBALANCED:   out << "Unbalanced: "; break;
  case balance_issue_t::NOT_ZERO_SUM: out << "Not zero sum: "; break;
  case balance_issue_t::OTHER:        out << "Error: "; break;
  }
  out << issue.message;
  return out;
}

} // namespace roasted
