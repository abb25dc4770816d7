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
 * @file   context.h
 * @author The roasted developers
 *
 * @ingroup parse
 *
 * @brief  The stack of journal texts being read
 *
 * Every `include' pushes a new parse_context_t, so the stack always
 * holds the chain of files from the top-level input down to the file
 * currently being read.
 */
#pragma once

#include "utils.h"
#include "textual.h"

namespace roasted {

class journal_t;

class parse_context_t
{
public:
  shared_ptr<const string> text;

  path        pathname;
  path        current_directory;
  journal_t * journal;
  std::size_t linenum;
  std::size_t count;

  explicit parse_context_t(shared_ptr<const string> _text,
                           const path& cwd)
    : text(_text), current_directory(cwd), journal(NULL),
      linenum(0), count(0) {}

  string location() const {
    return file_context(pathname.empty() ? path("<input>") : pathname,
                        linenum);
  }
};

/**
 * Resolve `pathname' against `cwd' and read the file it names.  Throws
 * file_error when it is missing, is a directory or cannot be read.
 */
parse_context_t open_for_reading(const path& pathname, const path& cwd);

class parse_context_stack_t
{
  std::list<parse_context_t> parsing_context;

public:
  void push(const string& text,
            const path&   cwd = std::filesystem::current_path()) {
    parsing_context.push_front
      (parse_context_t(std::make_shared<const string>(text), cwd));
  }

  /**
   * Start reading the file at `pathname'.  A file that is already being
   * read further up the stack would include itself forever, so this
   * raises parse_error instead.
   */
  void push(const path& pathname,
            const path& cwd = std::filesystem::current_path());

  void pop() {
    assert(! parsing_context.empty());
    parsing_context.pop_front();
  }

  parse_context_t& get_current() {
    assert(! parsing_context.empty());
    return parsing_context.front();
  }

  bool is_reading(const path& pathname) const;

  std::size_t depth() const {
    return parsing_context.size();
  }
};

} // namespace roasted
