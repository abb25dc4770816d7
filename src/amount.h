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
 * @addtogroup math
 */

/**
 * @file   amount.h
 * @author The roasted developers
 *
 * @ingroup math
 *
 * @brief  Basic type for handling amounts of a unit: amount_t.
 *
 * An amount is a floating point nominal in one unit, optionally carrying
 * price quotes.  A quote states that one of the amount's unit is worth
 * its nominal in another unit, as observed where the amount was written.
 * Adding amounts of different units is only possible when the right-hand
 * side carries a quote into the unit of the left-hand side.
 *
 * parsed_amount_t is the same value before its unit codes have been
 * resolved by a unit_store_t.
 */
#pragma once

#include "utils.h"

namespace roasted {

DECLARE_EXCEPTION(amount_error, std::runtime_error);

struct price_t : public equality_comparable<price_t>
{
  double      nominal;
  std::size_t unit;

  price_t(const double _nominal = 0.0, const std::size_t _unit = 0)
    : nominal(_nominal), unit(_unit) {}

  bool operator==(const price_t& other) const {
    return nominal == other.nominal && unit == other.unit;
  }
};

typedef std::vector<price_t> prices_t;

/**
 * @class amount_t
 *
 * @brief A nominal value in a resolved unit.
 */
class amount_t
  : public additive<amount_t>,
    public equality_comparable<amount_t>
{
public:
  double      nominal;
  std::size_t unit;
  prices_t    prices;

  amount_t(const double      _nominal = 0.0,
           const std::size_t _unit    = 0,
           const prices_t&   _prices  = prices_t())
    : nominal(_nominal), unit(_unit), prices(_prices) {}

  static amount_t zero(const std::size_t unit) {
    return amount_t(0.0, unit);
  }

  /**
   * Returns the quote converting this amount into `target', if any.
   * The first matching quote wins.
   */
  optional<price_t> find_price(const std::size_t target) const;

  /**
   * Add `amt' to this amount.  The result keeps this amount's unit and
   * quotes.  When the units differ, `amt' must carry a quote into this
   * amount's unit, otherwise amount_error is thrown.
   */
  amount_t& operator+=(const amount_t& amt);
  amount_t& operator-=(const amount_t& amt);

  amount_t negated() const {
    amount_t temp(*this);
    temp.in_place_negate();
    return temp;
  }
  amount_t& in_place_negate() {
    nominal = - nominal;
    return *this;
  }
  amount_t operator-() const {
    return negated();
  }

  bool is_zero() const {
    return nominal == 0.0;
  }
  int sign() const {
    return nominal < 0.0 ? -1 : (nominal > 0.0 ? 1 : 0);
  }

  bool operator==(const amount_t& other) const {
    return (nominal == other.nominal && unit == other.unit &&
            prices == other.prices);
  }
};

std::ostream& operator<<(std::ostream& out, const amount_t& amt);

string format_nominal(const double nominal);
double parse_nominal(const string& str);

struct parsed_price_t
{
  double nominal;
  string unit;

  parsed_price_t(const double _nominal = 0.0, const string& _unit = "")
    : nominal(_nominal), unit(_unit) {}

  bool operator==(const parsed_price_t& other) const {
    return nominal == other.nominal && unit == other.unit;
  }
};

struct parsed_amount_t
{
  double                      nominal;
  string                      unit;
  std::vector<parsed_price_t> prices;

  parsed_amount_t(const double _nominal = 0.0, const string& _unit = "")
    : nominal(_nominal), unit(_unit) {}

  /**
   * Parse "NOMINAL CODE [@ NOMINAL CODE]...".  Throws parse_error when the
   * text is not a complete amount.
   */
  static parsed_amount_t parse(const string& str);

  bool operator==(const parsed_amount_t& other) const {
    return (nominal == other.nominal && unit == other.unit &&
            prices == other.prices);
  }
};

std::ostream& operator<<(std::ostream& out, const parsed_amount_t& amt);

} // namespace roasted
