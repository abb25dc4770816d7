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
 * @defgroup cli Command line
 */

/**
 * @file   global.h
 * @author The roasted developers
 *
 * @ingroup cli
 *
 * @brief  Process-level state of the roasted command
 */
#pragma once

#include "session.h"

namespace roasted {

class global_scope_t : public noncopyable
{
public:
  bool         strict;
  bool         show_help;
  bool         show_version;
  strings_list files;

  unique_ptr<journal_t> journal;

  global_scope_t()
    : strict(false), show_help(false), show_version(false) {}

  /**
   * Collect the options and journal files from the command line.  The
   * logging options were already applied by handle_debug_options() and
   * are skipped here.
   */
  void read_command_arguments(const strings_list& args);

  /**
   * Read every journal file into one journal and print a summary.
   * Returns the process exit status.
   */
  int execute_command();

  void report_error(const std::exception& err);

  void show_version_info(std::ostream& out);
  void show_usage(std::ostream& out);
  void report_summary(std::ostream& out);
  std::size_t report_issues(std::ostream& out);
};

void handle_debug_options(int argc, char * argv[]);

} // namespace roasted
