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

#include "context.h"

namespace roasted {

parse_context_t open_for_reading(const path& pathname, const path& cwd)
{
  path filename = resolve_path(pathname);
  if (filename.is_relative())
    filename = cwd / filename;
  filename = filename.lexically_normal();

  std::error_code ec;
  if (! std::filesystem::exists(filename, ec) ||
      std::filesystem::is_directory(filename, ec))
    throw_(file_error, _f("Cannot read journal file %1%") % filename);

  path canonical = std::filesystem::weakly_canonical(filename, ec);
  if (! ec)
    filename = canonical;

  parse_context_t context(std::make_shared<const string>(read_file(filename)),
                          filename.parent_path());
  context.pathname = filename;
  return context;
}

void parse_context_stack_t::push(const path& pathname, const path& cwd)
{
  parse_context_t context(open_for_reading(pathname, cwd));

  if (is_reading(context.pathname))
    throw_(parse_error, _f("File %1% includes itself")
           % context.pathname);

  DEBUG("textual.include", "Pushing context for " << context.pathname
        << " at depth " << depth());
  parsing_context.push_front(context);
}

bool parse_context_stack_t::is_reading(const path& pathname) const
{
  for (const parse_context_t& context : parsing_context)
    if (! context.pathname.empty() && context.pathname == pathname)
      return true;
  return false;
}

} // namespace roasted
