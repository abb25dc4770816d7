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
 * @file   textual.h
 * @author The roasted developers
 *
 * @ingroup parse
 *
 * @brief  The grammar of journal files
 *
 * textual_parser_t reads journal text into a tree of typed nodes, one
 * per statement.  It knows nothing about accounts or units beyond their
 * spelling; turning a node into a typed statement is the business of
 * build_statement() in statement.h.
 *
 * The grammar is line oriented.  Every statement begins at the start of
 * a line.  The exchange lines of a transaction follow its header and are
 * indented.  Blank lines and lines whose first non-blank character is
 * `;' are ignored, and a `;' comment may also end any line.
 */
#pragma once

#include "utils.h"

namespace roasted {

class parse_error : public std::runtime_error
{
public:
  std::size_t line;
  std::size_t column;

  explicit parse_error(const string&     why,
                       const std::size_t _line   = 0,
                       const std::size_t _column = 0) throw()
    : std::runtime_error(why), line(_line), column(_column) {}
  virtual ~parse_error() throw() {}
};

struct node_t
{
  enum kind_t {
    LEDGER,
    STATEMENT,                  // only used as a rule name

    OPTION,                     // option "key" "value"
    INCLUDE,                    // include "path"
    UNIT,                       // unit CODE

    CUSTOM,                     // DATE custom "arg" ...
    OPEN,                       // DATE open ACCOUNT
    CLOSE,                      // DATE close ACCOUNT
    PAD,                        // DATE pad ACCOUNT ACCOUNT
    BALANCE,                    // DATE balance ACCOUNT AMOUNT
    PRICE,                      // DATE price CODE AMOUNT
    TRANSACTION,                // DATE TRX_HEADER TRX_ENTRY...

    TRX_HEADER,                 // TRX_STATE [QUOTED] QUOTED
    TRX_STATE,
    TRX_ENTRY,                  // ACCOUNT [AMOUNT_WITH_PRICE]

    DATE,
    ACCOUNT,
    AMOUNT,                     // NOMINAL UNIT_CODE
    AMOUNT_WITH_PRICE,          // AMOUNT [AMOUNT...]
    NOMINAL,
    UNIT_CODE,
    QUOTED
  };

  kind_t              kind;
  string              text;
  std::size_t         line;
  std::size_t         column;
  std::vector<node_t> children;

  node_t(const kind_t      _kind,
         const string&     _text   = "",
         const std::size_t _line   = 0,
         const std::size_t _column = 0)
    : kind(_kind), text(_text), line(_line), column(_column) {}

  const node_t& child(const std::size_t index) const;

  bool is_statement() const {
    return kind >= OPTION && kind <= TRANSACTION;
  }
};

const char * node_kind_name(const node_t::kind_t kind);

class textual_parser_t : public noncopyable
{
  const string& text;
  std::size_t   pos;
  std::size_t   linenum;
  std::size_t   line_beg;

public:
  explicit textual_parser_t(const string& _text);

  /**
   * Parse the whole text as `rule'.  Anything left over, other than
   * blanks and comments, is a parse_error.
   */
  node_t parse(const node_t::kind_t rule);

private:
  char peek(const std::size_t offset = 0) const {
    return pos + offset < text.size() ? text[pos + offset] : '\0';
  }
  bool at_end() const {
    return pos >= text.size();
  }
  bool at_eol() const;
  bool at_token_end() const;
  std::size_t column() const {
    return pos - line_beg + 1;
  }

  void error(const string& message) const;

  bool skip_blanks();
  void next_line();
  bool skip_empty_lines();
  void end_of_line();
  void require_blank(const char * what);

  node_t read_entry();
  node_t read_dated_statement();
  node_t read_directive();
  node_t read_transaction(node_t&& date);
  node_t read_exchange();

  node_t read_date();
  node_t read_account();
  node_t read_nominal();
  node_t read_unit_code();
  node_t read_quoted();
  node_t read_amount();
  node_t read_amount_with_price();
  string read_word();
};

/**
 * Convenience wrapper constructing a textual_parser_t for `text'.
 */
node_t parse_rule(const node_t::kind_t rule, const string& text);

/**
 * The text of the given 1-based line of `text', without its newline.
 */
string source_line(const string& text, const std::size_t line);

} // namespace roasted
