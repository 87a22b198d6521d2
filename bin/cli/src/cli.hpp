#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace Ballot::Cli {

/**
 * Runs one ballot-cli invocation. `args` excludes the program name.
 *
 * On success the command output goes to `out` and 0 is returned. On any
 * failure a single "Error: <context>: <reason>" line goes to `err`, nothing
 * is written to `out`, and 1 is returned. `in` stands in for stdin when a
 * command reads its input there.
 */
int run(const std::vector<std::string>& args, std::istream& in, std::ostream& out, std::ostream& err);

} // namespace Ballot::Cli
