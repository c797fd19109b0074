#pragma once
#include "board-ident/export.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace boardident {
namespace process {

struct ProcessResult {
  int exit_code{-1};
  std::string output; // stdout and stderr interleaved
  bool timed_out{false};
};

/// Runs an external tool to completion with a hard timeout
class BOARD_IDENT_API CommandRunner {
public:
  virtual ~CommandRunner() = default;

  /// args[0] is the executable. Returns nullopt when the process could not
  /// be started at all.
  virtual std::optional<ProcessResult>
  run(const std::vector<std::string> &args,
      std::chrono::milliseconds timeout) = 0;
};

/// posix_spawn based runner. Output is captured through a pipe; the child is
/// killed with SIGKILL once the timeout expires.
class BOARD_IDENT_API ProcessRunner : public CommandRunner {
public:
  std::optional<ProcessResult> run(const std::vector<std::string> &args,
                                   std::chrono::milliseconds timeout) override;
};

} // namespace process
} // namespace boardident
