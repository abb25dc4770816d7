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
 * @addtogroup data
 */

/**
 * @file   journal.h
 * @author The roasted developers
 *
 * @ingroup data
 *
 * @brief  The journal: everything read from one top-level input
 *
 * A journal owns the account and unit stores that every resolved
 * reference points into, and files what each statement produced under
 * the date of that statement.
 */
#pragma once

#include "utils.h"
#include "times.h"
#include "account.h"
#include "commodity.h"
#include "xact.h"
#include "statement.h"

namespace roasted {

class parse_context_stack_t;

struct pad_t
{
  txn_account_t target;
  txn_account_t source;

  pad_t(const txn_account_t& _target, const txn_account_t& _source)
    : target(_target), source(_source) {}
};

/**
 * A claim that `account' holds `amount' on the day it was filed under.
 * Nothing here verifies it against the transactions.
 */
struct balance_assertion_t
{
  txn_account_t account;
  amount_t      amount;

  balance_assertion_t(const txn_account_t& _account, const amount_t& _amount)
    : account(_account), amount(_amount) {}
};

typedef std::vector<string>              custom_args_t;
typedef std::vector<custom_args_t>       customs_list;
typedef std::vector<pad_t>               pads_list;
typedef std::vector<balance_assertion_t> balance_assertions_list;
typedef std::vector<xact_t>              xacts_list;

class daybook_t
{
  customs_list            custom_entries;
  pads_list               pad_entries;
  balance_assertions_list assertion_entries;
  xacts_list              xact_entries;

public:
  const customs_list& custom() const {
    return custom_entries;
  }
  const pads_list& pads() const {
    return pad_entries;
  }
  const balance_assertions_list& balance_assertions() const {
    return assertion_entries;
  }
  const xacts_list& transactions() const {
    return xact_entries;
  }

  void add_custom(const custom_args_t& args) {
    custom_entries.push_back(args);
  }
  void add_pad(const pad_t& pad) {
    pad_entries.push_back(pad);
  }
  void add_balance_assertion(const balance_assertion_t& assertion) {
    assertion_entries.push_back(assertion);
  }
  void add_xact(const xact_t& xact) {
    xact_entries.push_back(xact);
  }

  bool empty() const {
    return (custom_entries.empty() && pad_entries.empty() &&
            assertion_entries.empty() && xact_entries.empty());
  }
};

/**
 * A transaction that failed a balance check, with the date it was
 * filed under.
 */
struct xact_issues_t
{
  date_t           date;
  const xact_t *   xact;
  balance_issues_t issues;
};

class journal_t : public noncopyable
{
public:
  typedef std::map<date_t, daybook_t> daybooks_map;
  typedef std::map<string, string>    options_map;

  account_store_t  accounts;
  unit_store_t     units;
  std::list<path>  sources;

private:
  daybooks_map days;
  options_map  opts;

  daybook_t& daybook_at(const date_t& when) {
    return days[when];
  }

public:
  journal_t();
  ~journal_t();

  /**
   * Read the text on top of `context' into this journal, following any
   * includes it contains.  Returns the number of statements processed.
   * The first failure aborts reading and is re-thrown with its location
   * added to the error context.
   */
  std::size_t read(parse_context_stack_t& context);

  /**
   * Apply one statement.  Include statements cannot be applied this way,
   * they need the file context that read() provides.
   */
  void process(const statement_t& statement);

  void set_option(const string& key, const string& value);
  optional<string> get_option(const string& key) const;
  const options_map& options() const {
    return opts;
  }

  const daybook_t * get_at(const date_t& when) const;
  const daybooks_map& daybooks() const {
    return days;
  }

  txn_account_t resolve_account(const account_t& account,
                                const date_t&    when) const {
    return accounts.resolve(account, when);
  }

  std::size_t xacts_size() const;

  std::vector<xact_issues_t> check(const balance_check_t check) const;

private:
  std::size_t read_textual(parse_context_stack_t& context);

  void custom_statement(const custom_statement_t& stmt);
  void open_statement(const open_statement_t& stmt);
  void close_statement(const close_statement_t& stmt);
  void pad_statement(const pad_statement_t& stmt);
  void balance_statement(const balance_statement_t& stmt);
  void price_statement(const price_statement_t& stmt);
  void unit_statement(const unit_statement_t& stmt);
  void xact_statement(const xact_statement_t& stmt);
};

} // namespace roasted
