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

#include "amount.h"
#include "statement.h"

namespace roasted {

optional<price_t> amount_t::find_price(const std::size_t target) const
{
  for (const price_t& price : prices)
    if (price.unit == target)
      return price;
  return none;
}

amount_t& amount_t::operator+=(const amount_t& amt)
{
  if (unit == amt.unit) {
    nominal += amt.nominal;
  }
  else if (optional<price_t> price = amt.find_price(unit)) {
    TRACE(2, "amount_t::operator+=: converting " << amt
          << " at " << price->nominal);
    nominal += amt.nominal * price->nominal;
  }
  else {
    throw_(amount_error,
           _f("Cannot add %1% to %2%: no price converts unit %3% into unit %4%")
           % amt % *this % amt.unit % unit);
  }
  return *this;
}

amount_t& amount_t::operator-=(const amount_t& amt)
{
  return *this += amt.negated();
}

std::ostream& operator<<(std::ostream& out, const amount_t& amt)
{
  out << format_nominal(amt.nominal) << " #" << amt.unit;
  for (const price_t& price : amt.prices)
    out << " @ " << format_nominal(price.nominal) << " #" << price.unit;
  return out;
}

string format_nominal(const double nominal)
{
  std::ostringstream out;
  out << std::setprecision(std::numeric_limits<double>::digits10)
      << nominal;
  return out.str();
}

double parse_nominal(const string& str)
{
  try {
    return lexical_cast<double>(str);
  }
  catch (const bad_lexical_cast&) {
    throw_(amount_error, _f("Cannot parse nominal '%1%'") % str);
  }
  return 0.0;
}

parsed_amount_t parsed_amount_t::parse(const string& str)
{
  return build_amount(parse_rule(node_t::AMOUNT_WITH_PRICE, str));
}

std::ostream& operator<<(std::ostream& out, const parsed_amount_t& amt)
{
  out << format_nominal(amt.nominal) << ' ' << amt.unit;
  for (const parsed_price_t& price : amt.prices)
    out << " @ " << format_nominal(price.nominal) << ' ' << price.unit;
  return out;
}

} // namespace roasted
