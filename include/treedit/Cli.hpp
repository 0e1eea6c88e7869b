/**
 * @file Cli.hpp
 * @brief Command-line front end of treedit
 *
 * Usage:
 *   treedit -f FILE [-s present|absent] [-m] [-n] [-b] [-r] [-j] PATTERN=VALUE...
 *   treedit -f FILE -g PATTERN [-j]
 *
 * With `-s absent`, arguments may be bare patterns.
 */

#ifndef TREEDIT_CLI_HPP
#define TREEDIT_CLI_HPP

#include <ostream>

namespace treedit {

constexpr int kExitOk = 0;      // success, changed or not
constexpr int kExitFailed = 1;  // edit failed, or --get matched nothing
constexpr int kExitUsage = 2;   // bad arguments

/**
 * @brief Run the command line
 *
 * Messages, diffs and query results go to `out`; errors go to `err`.
 *
 * @return Process exit status (kExitOk, kExitFailed or kExitUsage)
 */
int run_cli(int argc, char** argv, std::ostream& out, std::ostream& err);

} // namespace treedit

#endif // TREEDIT_CLI_HPP
