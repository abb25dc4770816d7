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

#include "commodity.h"

namespace roasted {

std::size_t unit_store_t::declare(const string& code)
{
  units_map::iterator i = units.find(code);
  if (i != units.end()) {
    DEBUG("unit.declare", "Unit " << code << " already declared as "
          << (*i).second);
    return (*i).second;
  }

  std::size_t index = codes.size();
  codes.push_back(code);
  units.insert(units_map::value_type(code, index));

  DEBUG("unit.declare", "Declared unit " << code << " as " << index);
  return index;
}

optional<std::size_t> unit_store_t::find(const string& code) const
{
  units_map::const_iterator i = units.find(code);
  if (i != units.end())
    return (*i).second;
  return none;
}

std::size_t unit_store_t::lookup(const string& code) const
{
  if (optional<std::size_t> index = find(code))
    return *index;

  throw_(unit_error, _f("unit `%1%' has not been declared") % code);
  return 0;
}

optional<string> unit_store_t::unresolve(const std::size_t index) const
{
  if (index < codes.size())
    return codes[index];
  return none;
}

amount_t unit_store_t::resolve(const parsed_amount_t& amt) const
{
  amount_t result(amt.nominal, lookup(amt.unit));
  for (const parsed_price_t& price : amt.prices)
    result.prices.push_back(price_t(price.nominal, lookup(price.unit)));
  return result;
}

parsed_amount_t unit_store_t::unresolve(const amount_t& amt) const
{
  optional<string> code = unresolve(amt.unit);
  if (! code)
    throw_(unit_error, _f("unit index %1% is not known") % amt.unit);

  parsed_amount_t result(amt.nominal, *code);
  for (const price_t& price : amt.prices) {
    optional<string> price_code = unresolve(price.unit);
    if (! price_code)
      throw_(unit_error, _f("unit index %1% is not known") % price.unit);
    result.prices.push_back(parsed_price_t(price.nominal, *price_code));
  }
  return result;
}

string unit_store_t::format(const amount_t& amt) const
{
  std::ostringstream out;
  out << unresolve(amt);
  return out.str();
}

void unit_store_t::add_price(const date_t&     when,
                             const std::size_t unit,
                             const amount_t&   price)
{
  optional<string> code = unresolve(unit);
  if (! code)
    throw_(unit_error, _f("unit index %1% is not known") % unit);

  DEBUG("unit.prices", "Price of " << *code << " at "
        << format_date(when) << " is " << format(price));

  prices[unit].insert(price_history_t::value_type(when, price));
}

optional<price_point_t>
unit_store_t::find_price(const std::size_t unit,
                         const std::size_t target,
                         const date_t&     when) const
{
  price_map::const_iterator i = prices.find(unit);
  if (i == prices.end())
    return none;

  const price_history_t& history((*i).second);

  // Walk backwards from the last quote recorded on `when'.
  price_history_t::const_iterator j = history.upper_bound(when);
  while (j != history.begin()) {
    --j;
    if ((*j).second.unit == target)
      return price_point_t((*j).first, (*j).second);
  }
  return none;
}

std::size_t unit_store_t::prices_size() const
{
  std::size_t count = 0;
  for (const price_map::value_type& pair : prices)
    count += pair.second.size();
  return count;
}

} // namespace roasted
