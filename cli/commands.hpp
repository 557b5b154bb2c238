#pragma once

#include <ostream>

namespace stepfrag::cli {

// Runs `stepfrag profile|convert` against the given streams. Returns the
// process exit code: 0 on success, 1 on usage errors or a failed command.
// For `convert` the result line is always the last line written to out.
int Run(int argc, char** argv, std::ostream& out, std::ostream& err);

} // namespace stepfrag::cli
