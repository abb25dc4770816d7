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

#include "global.h"

namespace roasted {

void global_scope_t::read_command_arguments(const strings_list& args)
{
  for (strings_list::const_iterator i = args.begin(); i != args.end(); ++i) {
    const string& arg(*i);

    if (arg == "--strict") {
      strict = true;
    }
    else if (arg == "--help" || arg == "-h") {
      show_help = true;
    }
    else if (arg == "--version") {
      show_version = true;
    }
    else if (arg == "--verbose" || arg == "-v") {
      // handled by handle_debug_options
    }
    else if (arg == "--debug" || arg == "--trace") {
      if (++i == args.end())
        throw_(std::invalid_argument,
               _f("Option %1% requires an argument") % arg);
    }
    else if (arg.length() > 1 && arg[0] == '-') {
      throw_(std::invalid_argument, _f("Illegal option %1%") % arg);
    }
    else {
      files.push_back(arg);
    }
  }
}

int global_scope_t::execute_command()
{
  if (show_version) {
    show_version_info(std::cout);
    return 0;
  }
  if (show_help || files.empty()) {
    show_usage(show_help ? std::cout : std::cerr);
    return show_help ? 0 : 1;
  }

  for (const string& file : files)
    journal = parse_file(path(file), std::move(journal));

  std::size_t failed = report_issues(std::cout);
  report_summary(std::cout);

  return strict && failed > 0 ? 1 : 0;
}

void global_scope_t::report_error(const std::exception& err)
{
  std::cout.flush();            // first display anything that was pending

  // Display any pending error context information
  string context = error_context();
  if (! context.empty())
    std::cerr << context << std::endl;

  std::cerr << _("Error: ") << err.what() << std::endl;
}

void global_scope_t::show_version_info(std::ostream& out)
{
  out << "Roasted " << version
      << ", the plain text double-entry journal checker\n\n"
      << "Copyright (c) 2025, The roasted developers.  All rights reserved.\n\n"
      << "This program is made available under the terms of the BSD "
      << "Public License.\n";
}

void global_scope_t::show_usage(std::ostream& out)
{
  out << "Usage: roasted [OPTIONS] FILE...\n\n"
      << "Read each journal FILE into a single journal, report the\n"
      << "transactions that do not balance and summarize the result.\n\n"
      << "  --strict        exit with status 1 if a transaction does not balance\n"
      << "  --verbose, -v   log progress\n"
      << "  --debug CAT     log debug messages for categories matching CAT\n"
      << "  --trace N       log trace messages up to level N\n"
      << "  --version       show version information\n"
      << "  --help, -h      show this help\n";
}

std::size_t global_scope_t::report_issues(std::ostream& out)
{
  std::vector<xact_issues_t> failed = journal->check(CHECK_WITH_SUM);

  for (const xact_issues_t& entry : failed) {
    out << format_date(entry.date) << ' '
        << xact_state_flag(entry.xact->header.state) << ' ';
    if (entry.xact->header.payee)
      out << '"' << *entry.xact->header.payee << "\" ";
    out << '"' << entry.xact->header.title << '"' << std::endl;

    for (const balance_issue_t& issue : entry.issues)
      out << "    " << issue << std::endl;
  }
  return failed.size();
}

void global_scope_t::report_summary(std::ostream& out)
{
  out << _f("%1% days, %2% transactions, %3% accounts, %4% units")
    % journal->daybooks().size()
    % journal->xacts_size()
    % journal->accounts.accounts_size()
    % journal->units.size()
      << std::endl;
}

void handle_debug_options(int argc, char * argv[])
{
  for (int i = 1; i < argc; i++) {
    if (argv[i][0] == '-') {
      if (std::strcmp(argv[i], "--verbose") == 0 ||
          std::strcmp(argv[i], "-v") == 0) {
        _log_level = LOG_INFO;
      }
      else if (i + 1 < argc && std::strcmp(argv[i], "--debug") == 0) {
#if DEBUG_ON
        _log_level    = LOG_DEBUG;
        _log_category = argv[i + 1];
#endif
        i++;
      }
      else if (i + 1 < argc && std::strcmp(argv[i], "--trace") == 0) {
#if TRACING_ON
        _log_level   = LOG_TRACE;
        try {
          _trace_level = boost::lexical_cast<uint16_t>(argv[i + 1]);
        }
        catch (const boost::bad_lexical_cast&) {
          throw std::logic_error(_("Argument to --trace must be an integer"));
        }
#endif
        i++;
      }
    }
  }
}

} // namespace roasted
