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

#include "statement.h"

namespace roasted {

namespace {
  void expect_kind(const node_t& node, const node_t::kind_t kind)
  {
    if (node.kind != kind)
      throw_(parse_error, _f("Expected %1% at line %2%, found %3%")
             % node_kind_name(kind) % node.line % node_kind_name(node.kind));
  }

  parsed_price_t build_price(const node_t& node)
  {
    expect_kind(node, node_t::AMOUNT);
    return parsed_price_t(parse_nominal(node.child(0).text),
                          node.child(1).text);
  }

  parsed_exchange_t build_exchange(const node_t& node)
  {
    expect_kind(node, node_t::TRX_ENTRY);

    parsed_exchange_t exchange;
    exchange.account = build_account(node.child(0));
    if (node.children.size() > 1)
      exchange.amount = build_amount(node.child(1));
    return exchange;
  }
}

date_t build_date(const node_t& node)
{
  expect_kind(node, node_t::DATE);
  return parse_date(node.text);
}

account_t build_account(const node_t& node)
{
  expect_kind(node, node_t::ACCOUNT);
  return account_t::parse(node.text);
}

parsed_amount_t build_amount(const node_t& node)
{
  if (node.kind == node_t::AMOUNT) {
    return parsed_amount_t(parse_nominal(node.child(0).text),
                           node.child(1).text);
  }

  expect_kind(node, node_t::AMOUNT_WITH_PRICE);

  parsed_amount_t amount(build_amount(node.child(0)));
  for (std::size_t i = 1; i < node.children.size(); i++)
    amount.prices.push_back(build_price(node.children[i]));
  return amount;
}

xact_header_t build_header(const node_t& node)
{
  expect_kind(node, node_t::TRX_HEADER);

  const node_t& state(node.child(0));
  optional<xact_state_t> flag =
    state.text.empty() ? none : find_xact_state(state.text[0]);
  if (! flag)
    throw_(parse_error, _f("Unknown transaction state `%1%'") % state.text);

  xact_header_t header(*flag);
  if (node.children.size() > 2) {
    header.payee = node.child(1).text;
    header.title = node.child(2).text;
  } else {
    header.title = node.child(1).text;
  }
  return header;
}

statement_t build_statement(const node_t& node)
{
  switch (node.kind) {
  case node_t::OPTION:
    return option_statement_t{node.child(0).text, node.child(1).text};

  case node_t::INCLUDE:
    return include_statement_t{node.child(0).text};

  case node_t::UNIT:
    return unit_statement_t{node.child(0).text};

  case node_t::CUSTOM: {
    custom_statement_t custom{build_date(node.child(0)), {}};
    for (std::size_t i = 1; i < node.children.size(); i++)
      custom.args.push_back(node.children[i].text);
    return custom;
  }

  case node_t::OPEN:
    return open_statement_t{build_date(node.child(0)),
                            build_account(node.child(1))};

  case node_t::CLOSE:
    return close_statement_t{build_date(node.child(0)),
                             build_account(node.child(1))};

  case node_t::PAD:
    return pad_statement_t{build_date(node.child(0)),
                           build_account(node.child(1)),
                           build_account(node.child(2))};

  case node_t::BALANCE:
    return balance_statement_t{build_date(node.child(0)),
                               build_account(node.child(1)),
                               build_amount(node.child(2))};

  case node_t::PRICE:
    return price_statement_t{build_date(node.child(0)),
                             node.child(1).text,
                             build_amount(node.child(2))};

  case node_t::TRANSACTION: {
    xact_statement_t xact{build_date(node.child(0)),
                          build_header(node.child(1)), {}};
    for (std::size_t i = 2; i < node.children.size(); i++)
      xact.exchanges.push_back(build_exchange(node.children[i]));
    return xact;
  }

  default:
    break;
  }

  throw_(parse_error, _f("%1% at line %2% is not a statement")
         % node_kind_name(node.kind) % node.line);
  return option_statement_t();
}

optional<date_t> statement_date(const statement_t& statement)
{
  if (auto stmt = std::get_if<custom_statement_t>(&statement))
    return stmt->date;
  if (auto stmt = std::get_if<open_statement_t>(&statement))
    return stmt->date;
  if (auto stmt = std::get_if<close_statement_t>(&statement))
    return stmt->date;
  if (auto stmt = std::get_if<pad_statement_t>(&statement))
    return stmt->date;
  if (auto stmt = std::get_if<balance_statement_t>(&statement))
    return stmt->date;
  if (auto stmt = std::get_if<price_statement_t>(&statement))
    return stmt->date;
  if (auto stmt = std::get_if<xact_statement_t>(&statement))
    return stmt->date;
  return none;
}

} // namespace roasted
