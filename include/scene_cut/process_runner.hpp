/**
 * @file process_runner.hpp
 * @brief Child process execution with captured output and a bounded wait
 *
 * @details Runs an external program (no shell) with stdout and stderr
 *          captured on separate pipes. If the deadline passes, the child is
 *          killed with SIGKILL and reaped before returning.
 *
 * @note Linux/POSIX only (fork, execvp, poll, waitpid).
 */

#ifndef SCENE_CUT_PROCESS_RUNNER_HPP
#define SCENE_CUT_PROCESS_RUNNER_HPP

#include <string>
#include <vector>

namespace scene_cut {

/**
 * @struct ProcessResult
 * @brief Outcome of one child process run.
 */
struct ProcessResult {
  bool spawned = false;   //< false if fork/exec failed
  bool timed_out = false; //< killed after the deadline
  int exit_code = -1;     //< valid when exited normally
  int term_signal = 0;    //< non-zero when killed by a signal
  std::string out;        //< captured stdout
  std::string err;        //< captured stderr (or spawn failure reason)

  bool succeeded() const {
    return spawned && !timed_out && term_signal == 0 && exit_code == 0;
  }
};

/**
 * @brief Run a program and wait for it, up to timeout_sec.
 *
 * @param argv Program followed by its arguments; argv[0] is resolved via PATH
 * @param timeout_sec Wall-clock limit (<= 0 = wait indefinitely)
 * @return ProcessResult; never throws for child failures
 */
ProcessResult run_process(const std::vector<std::string> &argv,
                          double timeout_sec);

/**
 * @brief Human-readable summary of a process outcome for logs.
 */
std::string describe(const ProcessResult &result);

} // namespace scene_cut

#endif // SCENE_CUT_PROCESS_RUNNER_HPP
