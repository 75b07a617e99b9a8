/**
 * @file process_runner.hpp
 * @brief External process execution with timeout and cancellation
 *
 * @details run_process() spawns a program from an argument vector (no
 *          shell quoting involved), captures its combined stdout/stderr,
 *          and waits for it while polling:
 *
 *          - the timeout (process gets SIGTERM, then SIGKILL)
 *
 *          - an optional cancellation flag owned by the caller
 *
 * @note Linux/POSIX only (posix_spawn, poll, waitpid).
 */

#ifndef REGION_REDACT_PROCESS_RUNNER_HPP
#define REGION_REDACT_PROCESS_RUNNER_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace region_redact {

/**
 * @struct ProcessResult
 * @brief Outcome of one external process run.
 */
struct ProcessResult {
  int exit_code = -1;        //< Exit status (128 + signal if killed)
  bool spawn_failed = false; //< Program could not be started
  bool timed_out = false;    //< Killed after the timeout elapsed
  bool cancelled = false;    //< Killed because the cancel flag was set
  std::string output;        //< Captured stdout + stderr (truncated)

  bool ok() const {
    return !spawn_failed && !timed_out && !cancelled && exit_code == 0;
  }
};

/**
 * @struct ProcessOptions
 * @brief Limits applied while waiting for the process.
 */
struct ProcessOptions {
  std::chrono::seconds timeout{0};         //< 0 = wait forever
  const std::atomic<bool> *cancel = nullptr; //< Polled while waiting
  size_t max_output = 64 * 1024;           //< Captured bytes kept
  bool search_path = false;                //< Resolve argv[0] through PATH
};

/**
 * @brief Run a program and wait for it.
 * @param argv Program path followed by its arguments (must not be empty)
 * @param options Timeout / cancellation / capture limits
 * @return ProcessResult; never throws for process-level failures
 */
ProcessResult run_process(const std::vector<std::string> &argv,
                          const ProcessOptions &options = {});

/**
 * @brief Render an argument vector as a shell-like string for logging.
 */
std::string format_command(const std::vector<std::string> &argv);

} // namespace region_redact

#endif // REGION_REDACT_PROCESS_RUNNER_HPP
