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
 * @file   account.h
 * @author The roasted developers
 *
 * @ingroup data
 *
 * @brief Account paths and the store that tracks when they are open
 *
 * An account is written as a kind followed by one or more path segments,
 * such as "Assets:Bank:Checking".  Inside a journal the segments are
 * interned into a table shared by all five kinds, so that a resolved
 * account (txn_account_t) is just the kind plus a vector of indices.
 *
 * Every account path owns a list of validity windows.  A reference to an
 * account at a given date is only accepted when one of these windows
 * contains that date.
 */
#pragma once

#include "times.h"

namespace roasted {

DECLARE_EXCEPTION(account_error, std::runtime_error);
DECLARE_EXCEPTION(unopened_account_error, account_error);
DECLARE_EXCEPTION(close_error, account_error);

enum account_kind_t {
  ACCOUNT_ASSETS,
  ACCOUNT_EXPENSES,
  ACCOUNT_LIABILITIES,
  ACCOUNT_INCOME,
  ACCOUNT_EQUITY
};

const std::size_t ACCOUNT_KINDS = 5;

const char * account_kind_name(const account_kind_t kind);
optional<account_kind_t> find_account_kind(const string& name);

typedef std::vector<string>      segments_t;
typedef std::vector<std::size_t> segment_indices_t;

/**
 * An account as written in the source, holding its own segment strings.
 */
class account_t : public equality_comparable<account_t>
{
public:
  account_kind_t kind;
  segments_t     segments;

  account_t(const account_kind_t _kind = ACCOUNT_ASSETS,
            const segments_t&    _segments = segments_t())
    : kind(_kind), segments(_segments) {}

  /**
   * Convert the textual form "Kind:Segment:..." into an account.  Throws
   * account_error when the kind is unknown, when there are no segments,
   * or when a segment is empty or holds a forbidden character.
   */
  static account_t parse(const string& str);

  static bool is_segment_char(const char ch) {
    return ! (ch == ':' || ch == ';' || ch == '"' || ch == '@' ||
              std::isspace(static_cast<unsigned char>(ch)));
  }

  string fullname() const;

  bool operator==(const account_t& other) const {
    return kind == other.kind && segments == other.segments;
  }
};

std::ostream& operator<<(std::ostream& out, const account_t& account);

/**
 * An account resolved against an account_store_t.  It is only meaningful
 * together with the store that produced it.
 */
class txn_account_t
  : public equality_comparable<txn_account_t>,
    public less_than_comparable<txn_account_t>
{
public:
  account_kind_t    kind;
  segment_indices_t indices;

  txn_account_t(const account_kind_t     _kind = ACCOUNT_ASSETS,
                const segment_indices_t& _indices = segment_indices_t())
    : kind(_kind), indices(_indices) {}

  bool operator==(const txn_account_t& other) const {
    return kind == other.kind && indices == other.indices;
  }
  bool operator<(const txn_account_t& other) const {
    return (kind < other.kind ||
            (kind == other.kind && indices < other.indices));
  }
};

struct account_activity_t
{
  date_t           opened_at;
  optional<date_t> closed_at;

  explicit account_activity_t(const date_t& _opened_at)
    : opened_at(_opened_at) {}

  bool contains(const date_t& when) const {
    return opened_at <= when && (! closed_at || *closed_at > when);
  }
};

typedef std::vector<account_activity_t> account_activities_t;

class account_store_t : public noncopyable
{
  typedef std::map<segment_indices_t, account_activities_t> activities_map;
  typedef std::map<string, std::size_t>                     segments_map;

  segments_t                                 segments;
  segments_map                               segment_index;
  std::array<activities_map, ACCOUNT_KINDS>  activities;

  std::size_t intern(const string& segment);

  activities_map& activities_for(const account_kind_t kind) {
    return activities[static_cast<std::size_t>(kind)];
  }
  const activities_map& activities_for(const account_kind_t kind) const {
    return activities[static_cast<std::size_t>(kind)];
  }

public:
  account_store_t() {
    TRACE(1, "account_store_t constructed");
  }

  /**
   * Start a validity window for the account at the given date, interning
   * any segment seen for the first time.  When the latest window is still
   * open its opening date is moved instead.  Reopening after a close adds
   * a new window, which may not begin before that close.
   */
  void open(const account_t& account, const date_t& when);

  /**
   * End the latest validity window of the account.  The account must have
   * been opened, must not already be closed, and may not be closed before
   * the date it was opened.
   */
  void close(const account_t& account, const date_t& when);

  txn_account_t resolve(const account_t& account, const date_t& when) const;
  account_t     unresolve(const txn_account_t& account) const;

  optional<segment_indices_t> lookup(const account_t& account) const;
  optional<std::size_t>       find_segment(const string& segment) const;

  const account_activities_t * find_activities(const account_t& account) const;

  std::size_t segments_size() const {
    return segments.size();
  }
  std::size_t accounts_size() const;
};

} // namespace roasted
