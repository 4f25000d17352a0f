#pragma once

/**
 * @file subprocess.h
 * @brief fork/exec with stdin feed, captured output and a hard timeout
 */

#include <string>
#include <vector>

namespace holo_oracle {

struct ProcessResult {
    int exit_code = -1;          ///< Exit status, or -1 when killed / not started
    int term_signal = 0;         ///< Signal that ended the child (0 = exited normally)
    bool timed_out = false;
    std::string stdout_data;
    std::string stderr_data;
    std::string error;           ///< Set when the child could not be started

    bool ok() const { return error.empty() && !timed_out && exit_code == 0; }

    /// One-line failure description for logs
    std::string describe() const;
};

/**
 * @brief Run argv[0] (no shell) and wait for it
 *
 * stdin_data is written to the child's stdin, which is then closed. The child
 * is killed with SIGKILL once timeout_ms elapses (0 = no limit). Safe to call
 * from multiple threads.
 */
ProcessResult run_process(const std::vector<std::string>& argv,
                          const std::string& stdin_data,
                          int timeout_ms);

} // namespace holo_oracle
