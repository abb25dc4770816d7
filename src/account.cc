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

#include "account.h"

namespace roasted {

namespace {
  const char * const kind_names[ACCOUNT_KINDS] = {
    "Assets", "Expenses", "Liabilities", "Income", "Equity"
  };
}

const char * account_kind_name(const account_kind_t kind)
{
  return kind_names[static_cast<std::size_t>(kind)];
}

optional<account_kind_t> find_account_kind(const string& name)
{
  for (std::size_t i = 0; i < ACCOUNT_KINDS; i++)
    if (name == kind_names[i])
      return static_cast<account_kind_t>(i);
  return none;
}

account_t account_t::parse(const string& str)
{
  string::size_type colon = str.find(':');
  if (colon == string::npos)
    throw_(account_error,
           _f("input `%1%' is not a valid token for Account") % str);

  optional<account_kind_t> kind = find_account_kind(str.substr(0, colon));
  if (! kind)
    throw_(account_error,
           _f("input `%1%' is not a valid token for Account") % str);

  account_t account(*kind);

  string::size_type beg = colon + 1;
  while (true) {
    string::size_type end = str.find(':', beg);
    string segment(str, beg, end == string::npos ? string::npos : end - beg);

    if (segment.empty() ||
        std::find_if_not(segment.begin(), segment.end(),
                         account_t::is_segment_char) != segment.end())
      throw_(account_error,
             _f("input `%1%' is not a valid token for Account") % str);

    account.segments.push_back(segment);

    if (end == string::npos)
      break;
    beg = end + 1;
  }
  return account;
}

string account_t::fullname() const
{
  string fullname(account_kind_name(kind));
  for (const string& segment : segments) {
    fullname += ':';
    fullname += segment;
  }
  return fullname;
}

std::ostream& operator<<(std::ostream& out, const account_t& account)
{
  out << account.fullname();
  return out;
}

std::size_t account_store_t::intern(const string& segment)
{
  segments_map::iterator i = segment_index.find(segment);
  if (i != segment_index.end())
    return (*i).second;

  std::size_t index = segments.size();
  segments.push_back(segment);
  segment_index.insert(segments_map::value_type(segment, index));

  DEBUG("account.intern",
        "Interned segment '" << segment << "' as " << index);
  return index;
}

optional<std::size_t>
account_store_t::find_segment(const string& segment) const
{
  segments_map::const_iterator i = segment_index.find(segment);
  if (i != segment_index.end())
    return (*i).second;
  return none;
}

optional<segment_indices_t>
account_store_t::lookup(const account_t& account) const
{
  segment_indices_t indices;
  indices.reserve(account.segments.size());

  for (const string& segment : account.segments) {
    if (optional<std::size_t> index = find_segment(segment))
      indices.push_back(*index);
    else
      return none;
  }
  return indices;
}

const account_activities_t *
account_store_t::find_activities(const account_t& account) const
{
  optional<segment_indices_t> indices = lookup(account);
  if (! indices)
    return NULL;

  const activities_map& by_path(activities_for(account.kind));
  activities_map::const_iterator i = by_path.find(*indices);
  if (i == by_path.end() || (*i).second.empty())
    return NULL;

  return &(*i).second;
}

void account_store_t::open(const account_t& account, const date_t& when)
{
  segment_indices_t indices;
  indices.reserve(account.segments.size());
  for (const string& segment : account.segments)
    indices.push_back(intern(segment));

  account_activities_t& windows(activities_for(account.kind)[indices]);

  const bool pending = ! windows.empty() && ! windows.back().closed_at;

  // A window may not begin before the one preceding it was closed.
  const std::size_t previous = windows.size() - (pending ? 1 : 0);
  if (previous > 0 && when < *windows[previous - 1].closed_at)
    throw_(account_error,
           _f("account `%1%' cannot be reopened at %2%, it was closed at %3%")
           % account % format_date(when)
           % format_date(*windows[previous - 1].closed_at));

  if (pending) {
    DEBUG("account.open", "Moved opening of " << account << " from "
          << format_date(windows.back().opened_at) << " to "
          << format_date(when));
    windows.back().opened_at = when;
  } else {
    windows.push_back(account_activity_t(when));
    DEBUG("account.open", "Opened " << account << " at " << format_date(when)
          << " (window " << windows.size() << ")");
  }
}

void account_store_t::close(const account_t& account, const date_t& when)
{
  optional<segment_indices_t> indices = lookup(account);
  if (! indices)
    throw_(close_error, _f("account `%1%' closed without being opened")
           % account);

  activities_map&          by_path(activities_for(account.kind));
  activities_map::iterator i = by_path.find(*indices);
  if (i == by_path.end() || (*i).second.empty())
    throw_(close_error, _f("account `%1%' closed without being opened")
           % account);

  account_activity_t& latest((*i).second.back());
  if (latest.closed_at)
    throw_(close_error, _f("account `%1%' is already closed at %2%")
           % account % format_date(*latest.closed_at));

  if (when < latest.opened_at)
    throw_(close_error,
           _f("account `%1%' cannot be closed at %2%, it was opened at %3%")
           % account % format_date(when) % format_date(latest.opened_at));

  latest.closed_at = when;
  DEBUG("account.close", "Closed " << account << " at " << format_date(when));
}

txn_account_t account_store_t::resolve(const account_t& account,
                                       const date_t&    when) const
{
  const account_activities_t * windows = find_activities(account);
  if (windows) {
    for (const account_activity_t& window : *windows) {
      if (window.contains(when)) {
        DEBUG("account.resolve",
              "Resolved " << account << " at " << format_date(when));
        return txn_account_t(account.kind, *lookup(account));
      }
    }
  }

  throw_(unopened_account_error, _f("account `%1%' is not opened at %2%")
         % account % format_date(when));
  return txn_account_t();
}

account_t account_store_t::unresolve(const txn_account_t& account) const
{
  account_t result(account.kind);
  for (std::size_t index : account.indices) {
    if (index >= segments.size())
      throw_(account_error,
             _f("segment index %1% is not known to the account store")
             % index);
    result.segments.push_back(segments[index]);
  }
  return result;
}

std::size_t account_store_t::accounts_size() const
{
  std::size_t count = 0;
  for (const activities_map& by_path : activities)
    count += by_path.size();
  return count;
}

} // namespace roasted
