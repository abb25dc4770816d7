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

#include "journal.h"
#include "context.h"
#include "statement.h"
#include "textual.h"

namespace roasted {

namespace {
  class instance_t : public noncopyable
  {
  public:
    parse_context_stack_t& context_stack;
    parse_context_t&       context;

    instance_t(parse_context_stack_t& _context_stack,
               parse_context_t&       _context)
      : context_stack(_context_stack), context(_context) {}

    string description() const {
      return context.pathname.empty() ? string(_("<input>"))
                                      : context.pathname.string();
    }

    void parse();

    node_t read_statements();
    void   apply_statement(const node_t& node);
    void   include_directive(const include_statement_t& stmt);
  };

  node_t instance_t::read_statements()
  {
    try {
      textual_parser_t parser(*context.text);
      return parser.parse(node_t::LEDGER);
    }
    catch (const parse_error& err) {
      context.linenum = err.line;
      add_error_context(_f("While parsing %1%") % context.location());
      optional<string::size_type> caret;
      if (err.column > 0)
        caret = err.column - 1;
      add_error_context(line_context(source_line(*context.text, err.line),
                                     caret));
      throw;
    }
  }

  void instance_t::parse()
  {
    INFO("Parsing file " << description());

    TRACE_START(instance_parse, 1, "Done parsing file " << description());

    node_t ledger(read_statements());

    for (const node_t& node : ledger.children) {
      context.linenum = node.line;
      try {
        apply_statement(node);
      }
      catch (const std::exception&) {
        add_error_context(_f("While parsing %1%") % context.location());
        add_error_context(line_context(source_line(*context.text,
                                                   node.line)));
        throw;
      }
    }

    TRACE_STOP(instance_parse, 1);

    INFO("Read " << context.count << " statement(s) from " << description());
  }

  void instance_t::apply_statement(const node_t& node)
  {
    statement_t statement(build_statement(node));

    if (auto include = std::get_if<include_statement_t>(&statement))
      include_directive(*include);
    else
      context.journal->process(statement);

    context.count++;
  }

  void instance_t::include_directive(const include_statement_t& stmt)
  {
    DEBUG("textual.include", "include: " << stmt.pathname);

    path parent_path = context.pathname.parent_path();
    if (parent_path.empty())
      parent_path = context.current_directory;
    DEBUG("textual.include", "relative to: " << parent_path);

    context_stack.push(path(stmt.pathname), parent_path);

    parse_context_t& included(context_stack.get_current());
    included.journal = context.journal;
    context.journal->sources.push_back(included.pathname);

    DEBUG("textual.include", "Including: " << included.pathname);

    try {
      instance_t instance(context_stack, included);
      instance.parse();
    }
    catch (const std::exception&) {
      context_stack.pop();
      throw;
    }

    context.count += included.count;
    context_stack.pop();
  }
}

std::size_t journal_t::read_textual(parse_context_stack_t& context_stack)
{
  TRACE_START(parsing_total, 1, "Total time spent parsing text:");
  {
    instance_t instance(context_stack, context_stack.get_current());
    instance.parse();
  }
  TRACE_STOP(parsing_total, 1);

  TRACE_FINISH(instance_parse, 1);
  TRACE_FINISH(parsing_total, 1);

  return context_stack.get_current().count;
}

} // namespace roasted
