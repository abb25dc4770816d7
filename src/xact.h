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
 * @file   xact.h
 * @author The roasted developers
 *
 * @ingroup data
 */
#pragma once

#include "account.h"
#include "amount.h"

namespace roasted {

DECLARE_EXCEPTION(balance_error, std::runtime_error);
DECLARE_EXCEPTION(elision_error, balance_error);

enum xact_state_t {
  XACT_SETTLED,                 // *
  XACT_UNSETTLED,               // !
  XACT_RECURRING,               // #
  XACT_VIRTUAL                  // generated, never written in a journal
};

optional<xact_state_t> find_xact_state(const char flag);
char xact_state_flag(const xact_state_t state);

struct xact_header_t
{
  xact_state_t     state;
  optional<string> payee;
  string           title;

  xact_header_t(const xact_state_t      _state = XACT_SETTLED,
                const optional<string>& _payee = none,
                const string&           _title = "")
    : state(_state), payee(_payee), title(_title) {}
};

/**
 * One leg of a transaction.  `elided' marks the leg whose amount was left
 * out of the source and computed when the transaction was finalized.
 */
struct exchange_t
{
  txn_account_t account;
  amount_t      amount;
  bool          elided;

  exchange_t(const txn_account_t& _account,
             const amount_t&      _amount,
             const bool           _elided = false)
    : account(_account), amount(_amount), elided(_elided) {}
};

typedef std::vector<exchange_t> exchanges_t;

enum balance_check_t {
  CHECK_WITH_SUM,
  CHECK_WITHOUT_SUM
};

struct balance_issue_t
{
  enum kind_t {
    UNBALANCED,
    NOT_ZERO_SUM,
    OTHER
  } kind;

  string message;

  balance_issue_t(const kind_t _kind, const string& _message)
    : kind(_kind), message(_message) {}
};

typedef std::vector<balance_issue_t> balance_issues_t;

class xact_t
{
public:
  xact_header_t header;
  exchanges_t   exchanges;

  explicit xact_t(const xact_header_t& _header = xact_header_t())
    : header(_header) {}

  /**
   * Append a leg.  A leg without an amount is elided, and finalize()
   * computes its amount from the others.
   */
  void add_exchange(const txn_account_t&      account,
                    const optional<amount_t>& amount);

  /**
   * Infer the amount of the elided leg, if there is one, so that the
   * transaction sums to zero in the unit of its first explicit leg.
   * Throws elision_error when more than one leg is elided, balance_error
   * when an elided leg has nothing to balance against, and amount_error
   * when a leg cannot be converted into that unit.
   */
  void finalize();

  /**
   * The unit the transaction is summed in: that of the first leg whose
   * amount was written out.
   */
  optional<std::size_t> anchor_unit() const;

  amount_t sum() const;
  amount_t total_debited() const;
  amount_t total_credited() const;

  optional<balance_issues_t> errors(const balance_check_t check) const;
};

std::ostream& operator<<(std::ostream& out, const balance_issue_t& issue);

} // namespace roasted
