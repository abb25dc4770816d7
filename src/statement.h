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

/**
 * @addtogroup parse
 */

/**
 * @file   statement.h
 * @author The roasted developers
 *
 * @ingroup parse
 *
 * @brief  Typed statements built from grammar nodes
 *
 * Accounts and amounts in a statement are still in their parsed form;
 * they are resolved against the journal's stores when the statement is
 * processed.
 */
#pragma once

#include "textual.h"
#include "account.h"
#include "amount.h"
#include "xact.h"

namespace roasted {

struct option_statement_t
{
  string key;
  string value;
};

struct include_statement_t
{
  string pathname;
};

struct unit_statement_t
{
  string code;
};

struct custom_statement_t
{
  date_t              date;
  std::vector<string> args;
};

struct open_statement_t
{
  date_t    date;
  account_t account;
};

struct close_statement_t
{
  date_t    date;
  account_t account;
};

struct pad_statement_t
{
  date_t    date;
  account_t target;
  account_t source;
};

struct balance_statement_t
{
  date_t          date;
  account_t       account;
  parsed_amount_t amount;
};

struct price_statement_t
{
  date_t          date;
  string          unit;
  parsed_amount_t price;
};

struct parsed_exchange_t
{
  account_t                 account;
  optional<parsed_amount_t> amount;
};

struct xact_statement_t
{
  date_t                         date;
  xact_header_t                  header;
  std::vector<parsed_exchange_t> exchanges;
};

typedef std::variant<option_statement_t,
                     include_statement_t,
                     unit_statement_t,
                     custom_statement_t,
                     open_statement_t,
                     close_statement_t,
                     pad_statement_t,
                     balance_statement_t,
                     price_statement_t,
                     xact_statement_t> statement_t;

/**
 * Convert a statement node, as produced by textual_parser_t, into the
 * matching statement type.  Dates, accounts and nominals are validated
 * here, so date_error, account_error and amount_error may be thrown.
 */
statement_t build_statement(const node_t& node);

date_t          build_date(const node_t& node);
account_t       build_account(const node_t& node);
parsed_amount_t build_amount(const node_t& node);
xact_header_t   build_header(const node_t& node);

optional<date_t> statement_date(const statement_t& statement);

} // namespace roasted
