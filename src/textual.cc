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

#include "textual.h"
#include "account.h"

namespace roasted {

namespace {
  const char * const node_kind_names[] = {
    "LEDGER", "STATEMENT", "OPTION", "INCLUDE", "UNIT", "CUSTOM", "OPEN",
    "CLOSE", "PAD", "BALANCE", "PRICE", "TRANSACTION", "TRX_HEADER",
    "TRX_STATE", "TRX_ENTRY", "DATE", "ACCOUNT", "AMOUNT",
    "AMOUNT_WITH_PRICE", "NOMINAL", "UNIT_CODE", "QUOTED"
  };

  inline bool is_digit(const char c) {
    return c >= '0' && c <= '9';
  }
  inline bool is_upper(const char c) {
    return c >= 'A' && c <= 'Z';
  }
  inline bool is_alpha(const char c) {
    return (c >= 'a' && c <= 'z') || is_upper(c);
  }
}

const char * node_kind_name(const node_t::kind_t kind)
{
  return node_kind_names[static_cast<std::size_t>(kind)];
}

const node_t& node_t::child(const std::size_t index) const
{
  if (index >= children.size())
    throw_(parse_error, _f("%1% node at line %2% has no child %3%")
           % node_kind_name(kind) % line % index);
  return children[index];
}

textual_parser_t::textual_parser_t(const string& _text)
  : text(_text), pos(0), linenum(1), line_beg(0)
{
  string::const_iterator invalid = utf8::find_invalid(text.begin(),
                                                      text.end());
  if (invalid != text.end()) {
    pos      = static_cast<std::size_t>(invalid - text.begin());
    linenum  = 1 + static_cast<std::size_t>(std::count(text.begin(),
                                                       invalid, '\n'));
    string::size_type nl = pos == 0 ? string::npos : text.rfind('\n', pos - 1);
    line_beg = nl == string::npos ? 0 : nl + 1;
    error(_("invalid UTF-8 sequence"));
  }
}

void textual_parser_t::error(const string& message) const
{
  throw parse_error((_f("%1% (line %2%, column %3%)")
                     % message % linenum % column()).str(),
                    linenum, column());
}

bool textual_parser_t::at_eol() const
{
  return (at_end() || peek() == '\n' ||
          (peek() == '\r' && (peek(1) == '\n' || pos + 1 >= text.size())));
}

bool textual_parser_t::at_token_end() const
{
  return at_eol() || peek() == ' ' || peek() == '\t' || peek() == ';';
}

bool textual_parser_t::skip_blanks()
{
  std::size_t start = pos;
  while (peek() == ' ' || peek() == '\t')
    pos++;
  return pos != start;
}

void textual_parser_t::next_line()
{
  while (! at_end() && peek() != '\n')
    pos++;
  if (! at_end()) {
    pos++;
    linenum++;
    line_beg = pos;
  }
}

bool textual_parser_t::skip_empty_lines()
{
  while (true) {
    std::size_t start = pos;
    skip_blanks();
    if (at_end())
      return false;
    if (at_eol() || peek() == ';') {
      next_line();
      continue;
    }
    pos = start;
    return true;
  }
}

void textual_parser_t::end_of_line()
{
  skip_blanks();
  if (peek() == ';') {
    while (! at_eol())
      pos++;
  }
  if (! at_eol())
    error((_f("unexpected input `%1%'") % peek()).str());
  next_line();
}

void textual_parser_t::require_blank(const char * what)
{
  if (! skip_blanks()) {
    if (at_eol())
      error((_f("unexpected end of line, expected %1%") % what).str());
    else
      error((_f("expected whitespace before %1%") % what).str());
  }
}

string textual_parser_t::read_word()
{
  std::size_t start = pos;
  while (is_alpha(peek()))
    pos++;
  return string(text, start, pos - start);
}

node_t textual_parser_t::read_entry()
{
  if (peek() == ' ' || peek() == '\t') {
    skip_blanks();
    error(_("indented line outside of a transaction"));
  }

  if (is_digit(peek()))
    return read_dated_statement();
  else
    return read_directive();
}

node_t textual_parser_t::read_directive()
{
  std::size_t line = linenum;
  string      word = read_word();

  if (word == "option") {
    node_t node(node_t::OPTION, word, line, 1);
    require_blank("the option name");
    node.children.push_back(read_quoted());
    require_blank("the option value");
    node.children.push_back(read_quoted());
    end_of_line();
    return node;
  }
  else if (word == "include") {
    node_t node(node_t::INCLUDE, word, line, 1);
    require_blank("the included path");
    node.children.push_back(read_quoted());
    end_of_line();
    return node;
  }
  else if (word == "unit") {
    node_t node(node_t::UNIT, word, line, 1);
    require_blank("the unit code");
    node.children.push_back(read_unit_code());
    end_of_line();
    return node;
  }

  if (word.empty())
    error(_("expected a date or a directive"));

  pos -= word.length();
  error((_f("unknown directive `%1%'") % word).str());
  return node_t(node_t::LEDGER);
}

node_t textual_parser_t::read_dated_statement()
{
  std::size_t line = linenum;
  node_t      date = read_date();

  require_blank("the statement");

  char c = peek();
  if (c == '*' || c == '!' || c == '#')
    return read_transaction(std::move(date));

  std::size_t word_pos = pos;
  string      word     = read_word();

  if (word == "custom") {
    node_t node(node_t::CUSTOM, word, line, 1);
    node.children.push_back(std::move(date));
    require_blank("the custom arguments");
    node.children.push_back(read_quoted());
    while (skip_blanks() && peek() == '"')
      node.children.push_back(read_quoted());
    end_of_line();
    return node;
  }
  else if (word == "open" || word == "close") {
    node_t node(word == "open" ? node_t::OPEN : node_t::CLOSE,
                word, line, 1);
    node.children.push_back(std::move(date));
    require_blank("the account");
    node.children.push_back(read_account());
    end_of_line();
    return node;
  }
  else if (word == "pad") {
    node_t node(node_t::PAD, word, line, 1);
    node.children.push_back(std::move(date));
    require_blank("the padded account");
    node.children.push_back(read_account());
    require_blank("the source account");
    node.children.push_back(read_account());
    end_of_line();
    return node;
  }
  else if (word == "balance") {
    node_t node(node_t::BALANCE, word, line, 1);
    node.children.push_back(std::move(date));
    require_blank("the account");
    node.children.push_back(read_account());
    require_blank("the amount");
    node.children.push_back(read_amount());
    end_of_line();
    return node;
  }
  else if (word == "price") {
    node_t node(node_t::PRICE, word, line, 1);
    node.children.push_back(std::move(date));
    require_blank("the unit code");
    node.children.push_back(read_unit_code());
    require_blank("the price");
    node.children.push_back(read_amount());
    end_of_line();
    return node;
  }

  pos = word_pos;
  if (word.empty())
    error(_("expected a statement keyword or a transaction state"));
  error((_f("unknown statement `%1%'") % word).str());
  return node_t(node_t::LEDGER);
}

node_t textual_parser_t::read_transaction(node_t&& date)
{
  const std::size_t header_line = linenum;
  const std::size_t header_beg  = line_beg;

  node_t xact(node_t::TRANSACTION, "", linenum, 1);
  xact.children.push_back(std::move(date));

  node_t header(node_t::TRX_HEADER, "", linenum, column());
  header.children.push_back(node_t(node_t::TRX_STATE, string(1, peek()),
                                   linenum, column()));
  pos++;

  require_blank("the transaction title");
  header.children.push_back(read_quoted());
  if (skip_blanks() && peek() == '"')
    header.children.push_back(read_quoted());
  end_of_line();

  xact.children.push_back(std::move(header));

  while (! at_end() && (peek() == ' ' || peek() == '\t')) {
    skip_blanks();
    if (at_eol())
      break;                    // a blank line ends the exchanges
    if (peek() == ';') {
      next_line();
      continue;
    }
    xact.children.push_back(read_exchange());
  }

  if (xact.children.size() < 3) {
    linenum  = header_line;
    pos      = line_beg = header_beg;
    error(_("transaction has no exchanges"));
  }
  return xact;
}

node_t textual_parser_t::read_exchange()
{
  node_t entry(node_t::TRX_ENTRY, "", linenum, column());
  entry.children.push_back(read_account());

  skip_blanks();
  if (! at_eol() && peek() != ';')
    entry.children.push_back(read_amount_with_price());
  end_of_line();

  return entry;
}

node_t textual_parser_t::read_date()
{
  node_t node(node_t::DATE, "", linenum, column());

  static const char * const shape = "dddd-dd-dd";
  for (std::size_t i = 0; shape[i]; i++) {
    char c = peek(i);
    if (shape[i] == 'd' ? ! is_digit(c) : c != shape[i])
      error(_("expected a date of the form YYYY-MM-DD"));
  }
  node.text = string(text, pos, 10);
  pos += 10;

  if (! at_token_end())
    error(_("expected a date of the form YYYY-MM-DD"));
  return node;
}

node_t textual_parser_t::read_account()
{
  node_t node(node_t::ACCOUNT, "", linenum, column());

  if (! is_alpha(peek()))
    error(_("expected an account"));

  std::size_t start = pos;
  while (! at_end() &&
         (peek() == ':' || account_t::is_segment_char(peek())))
    pos++;

  node.text = string(text, start, pos - start);
  if (node.text.find(':') == string::npos) {
    pos = start;
    error((_f("expected an account, found `%1%'") % node.text).str());
  }
  if (! at_token_end())
    error(_("unexpected character in account"));
  return node;
}

node_t textual_parser_t::read_nominal()
{
  node_t      node(node_t::NOMINAL, "", linenum, column());
  std::size_t start = pos;

  if (peek() == '+' || peek() == '-')
    pos++;
  if (! is_digit(peek()))
    error(_("expected a number"));
  while (is_digit(peek()))
    pos++;
  if (peek() == '.') {
    pos++;
    if (! is_digit(peek()))
      error(_("expected digits after the decimal point"));
    while (is_digit(peek()))
      pos++;
  }

  node.text = string(text, start, pos - start);
  return node;
}

node_t textual_parser_t::read_unit_code()
{
  node_t      node(node_t::UNIT_CODE, "", linenum, column());
  std::size_t start = pos;

  if (! is_upper(peek()))
    error(_("expected a unit code"));
  pos++;

  for (char c = peek();
       is_upper(c) || is_digit(c) || c == '\'' || c == '.' || c == '_' ||
         c == '-';
       c = peek())
    pos++;

  node.text = string(text, start, pos - start);
  return node;
}

node_t textual_parser_t::read_quoted()
{
  node_t node(node_t::QUOTED, "", linenum, column());

  if (peek() != '"')
    error(_("expected a quoted string"));
  pos++;

  while (true) {
    if (at_eol())
      error(_("unterminated string"));

    char c = peek();
    if (c == '"') {
      pos++;
      break;
    }
    else if (c == '\\') {
      pos++;
      switch (peek()) {
      case 'n':  node.text += '\n'; break;
      case 't':  node.text += '\t'; break;
      case '"':  node.text += '"';  break;
      case '\\': node.text += '\\'; break;
      default:
        error(_("unknown escape sequence in string"));
      }
      pos++;
    }
    else {
      node.text += c;
      pos++;
    }
  }
  return node;
}

node_t textual_parser_t::read_amount()
{
  node_t node(node_t::AMOUNT, "", linenum, column());
  std::size_t start = pos;

  node.children.push_back(read_nominal());
  require_blank("the unit code");
  node.children.push_back(read_unit_code());

  node.text = string(text, start, pos - start);
  return node;
}

node_t textual_parser_t::read_amount_with_price()
{
  node_t node(node_t::AMOUNT_WITH_PRICE, "", linenum, column());
  std::size_t start = pos;

  node.children.push_back(read_amount());
  while (true) {
    std::size_t saved = pos;
    skip_blanks();
    if (peek() != '@') {
      pos = saved;
      break;
    }
    pos++;
    skip_blanks();
    node.children.push_back(read_amount());
  }

  node.text = string(text, start, pos - start);
  return node;
}

node_t textual_parser_t::parse(const node_t::kind_t rule)
{
  switch (rule) {
  case node_t::LEDGER: {
    node_t ledger(node_t::LEDGER, "", 1, 1);
    while (skip_empty_lines())
      ledger.children.push_back(read_entry());
    return ledger;
  }

  case node_t::STATEMENT: {
    if (! skip_empty_lines())
      error(_("expected a statement"));
    node_t statement = read_entry();
    if (skip_empty_lines())
      error(_("unexpected input after the statement"));
    return statement;
  }

  case node_t::DATE:
  case node_t::ACCOUNT:
  case node_t::AMOUNT:
  case node_t::AMOUNT_WITH_PRICE:
  case node_t::NOMINAL:
  case node_t::UNIT_CODE:
  case node_t::QUOTED: {
    skip_blanks();

    node_t node(rule);
    switch (rule) {
    case node_t::DATE:              node = read_date(); break;
    case node_t::ACCOUNT:           node = read_account(); break;
    case node_t::AMOUNT:            node = read_amount(); break;
    case node_t::AMOUNT_WITH_PRICE: node = read_amount_with_price(); break;
    case node_t::NOMINAL:           node = read_nominal(); break;
    case node_t::UNIT_CODE:         node = read_unit_code(); break;
    default:                        node = read_quoted(); break;
    }

    while (! at_end() && std::isspace(static_cast<unsigned char>(peek())))
      pos++;
    if (! at_end())
      error((_f("unexpected input after %1%") % node_kind_name(rule)).str());
    return node;
  }

  default:
    break;
  }

  throw_(parse_error, _f("%1% is not a grammar rule") % node_kind_name(rule));
  return node_t(rule);
}

string source_line(const string& text, const std::size_t line)
{
  std::size_t beg = 0;
  for (std::size_t n = 1; n < line; n++) {
    beg = text.find('\n', beg);
    if (beg == string::npos)
      return string();
    beg++;
  }

  std::size_t end = text.find('\n', beg);
  string result(text, beg, end == string::npos ? string::npos : end - beg);
  if (! result.empty() && result[result.length() - 1] == '\r')
    result.erase(result.length() - 1);
  return result;
}

node_t parse_rule(const node_t::kind_t rule, const string& text)
{
  textual_parser_t parser(text);
  return parser.parse(rule);
}

} // namespace roasted
