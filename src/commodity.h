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
 * @file   commodity.h
 * @author The roasted developers
 *
 * @ingroup math
 *
 * @brief  The registry of declared units and their dated prices
 *
 * Units must be declared with a `unit' statement before any amount may
 * refer to them.  Each code is interned to a stable index the first
 * time it is declared.
 */
#pragma once

#include "amount.h"
#include "times.h"

namespace roasted {

DECLARE_EXCEPTION(unit_error, std::runtime_error);

/**
 * A quote recorded by a `price' statement: on `when', one of the quoted
 * unit was worth `price'.
 */
struct price_point_t
{
  date_t   when;
  amount_t price;

  price_point_t(const date_t& _when, const amount_t& _price)
    : when(_when), price(_price) {}
};

class unit_store_t : public noncopyable
{
  typedef std::map<string, std::size_t>           units_map;
  typedef std::multimap<date_t, amount_t>          price_history_t;
  typedef std::map<std::size_t, price_history_t>   price_map;

  std::vector<string> codes;
  units_map           units;
  price_map           prices;

public:
  unit_store_t() {
    TRACE(1, "unit_store_t constructed");
  }

  /**
   * Declare a unit, returning its index.  Declaring a code a second time
   * returns the index it already has.
   */
  std::size_t declare(const string& code);

  optional<std::size_t> find(const string& code) const;

  /**
   * Like find(), but an undeclared code throws unit_error.
   */
  std::size_t lookup(const string& code) const;

  optional<string> unresolve(const std::size_t index) const;

  amount_t        resolve(const parsed_amount_t& amt) const;
  parsed_amount_t unresolve(const amount_t& amt) const;

  /**
   * Render `amt' with unit codes in place of indices.
   */
  string format(const amount_t& amt) const;

  void add_price(const date_t& when, const std::size_t unit,
                 const amount_t& price);

  /**
   * The most recent quote for `unit' in terms of `target' recorded on or
   * before `when'.
   */
  optional<price_point_t> find_price(const std::size_t unit,
                                     const std::size_t target,
                                     const date_t&     when) const;

  std::size_t prices_size() const;

  std::size_t size() const {
    return codes.size();
  }
};

} // namespace roasted
