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

#include "session.h"

namespace roasted {

unique_ptr<journal_t> parse(const string& text, unique_ptr<journal_t> journal)
{
  if (! journal)
    journal.reset(new journal_t);

  INFO_START(journal, "Read journal text");

  parse_context_stack_t context;
  context.push(text);
  std::size_t count = journal->read(context);
  context.pop();

  INFO("Processed " << count << " statement(s)");
  INFO_FINISH(journal);

  return journal;
}

unique_ptr<journal_t> parse_file(const path&           pathname,
                                 unique_ptr<journal_t> journal)
{
  if (! journal)
    journal.reset(new journal_t);

  INFO_START(journal, "Read journal file " << pathname);

  parse_context_stack_t context;
  context.push(pathname);
  std::size_t count = journal->read(context);
  context.pop();

  INFO("Processed " << count << " statement(s) from " << pathname);
  INFO_FINISH(journal);

  return journal;
}

} // namespace roasted
