#pragma once

#include <string>
#include <vector>

namespace stylebind::transform::proc {

struct ProcessResult {
    int exit_code = 1;
    std::string out;
    std::string err;
};

// Runs argv[0] from PATH, feeding `input` on stdin and capturing stdout and
// stderr. Returns false if the process could not be started.
// The caller is expected to ignore SIGPIPE (the CLI does so at startup).
bool run_capture(const std::vector<std::string>& argv, const std::string& input,
                 ProcessResult& result);

} // namespace stylebind::transform::proc
