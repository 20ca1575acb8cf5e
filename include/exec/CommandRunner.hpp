#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace vipervault::exec {

struct RunOptions {
  std::chrono::milliseconds timeout{std::chrono::seconds(30)}; // <= 0: no limit
  size_t max_output_bytes{4u * 1024u * 1024u};                  // per stream
};

struct CommandResult {
  int exit_code{-1};       // 128+N when killed by signal N, -1 if never started
  std::string out;
  std::string err;
  bool timed_out{false};
  bool truncated{false};
  std::string spawn_error; // non-empty if the command never ran
};

// Run cmd through /bin/sh -c, capturing stdout and stderr separately.
// The child gets its own process group; on timeout the whole group is killed.
[[nodiscard]] auto run_command(const std::string& cmd, const RunOptions& opts = {}) -> CommandResult;

// Text shown to the browser for a finished command.
[[nodiscard]] auto render_command_output(const CommandResult& r, const RunOptions& opts = {}) -> std::string;

} // namespace vipervault::exec
