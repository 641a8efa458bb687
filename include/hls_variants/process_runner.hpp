/**
 * @file process_runner.hpp
 * @brief Blocking execution of an external command with a time limit
 *
 * @details The engine is run without a shell: argv is passed to execvp as-is,
 *          so paths containing spaces or quotes need no escaping. stdout and
 *          stderr are captured together for diagnostics. The child runs in
 *          its own process group so a timeout kills the whole tree.
 */

#ifndef HLS_VARIANTS_PROCESS_RUNNER_HPP
#define HLS_VARIANTS_PROCESS_RUNNER_HPP

#include <functional>
#include <string>
#include <vector>

namespace hls_variants {

/**
 * @struct ProcessResult
 * @brief Outcome of one external command.
 */
struct ProcessResult {
  bool spawned = false;    //< fork() succeeded
  int exit_code = -1;      //< Exit status when the process exited normally
  int term_signal = 0;     //< Signal number when killed by a signal
  bool timed_out = false;  //< Killed after exceeding its time limit
  std::string diagnostics; //< Captured stdout+stderr, verbatim

  bool ok() const {
    return spawned && !timed_out && term_signal == 0 && exit_code == 0;
  }
};

/// Called for each output line (without the newline). Returning true
/// consumes the line: it is left out of ProcessResult::diagnostics.
using LineHandler = std::function<bool(const std::string &line)>;

/**
 * @brief Run a command and wait for it to exit.
 *
 * @param argv Program and arguments; argv[0] is looked up on PATH
 * @param timeout_sec Time limit in seconds (0 = wait forever)
 * @param on_line Optional per-line hook; without it output is kept verbatim
 * @return Result; the child has always been reaped when this returns
 */
ProcessResult run_process(const std::vector<std::string> &argv,
                          int timeout_sec,
                          const LineHandler &on_line = nullptr);

/**
 * @brief Render argv as a single line for logs.
 * @note Arguments containing spaces are quoted. Display only.
 */
std::string format_command(const std::vector<std::string> &argv);

/**
 * @brief One-line description of a failed result ("exit code 1", ...).
 */
std::string describe_failure(const ProcessResult &result);

} // namespace hls_variants

#endif // HLS_VARIANTS_PROCESS_RUNNER_HPP
