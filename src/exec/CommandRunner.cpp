#include "exec/CommandRunner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <thread>

namespace vipervault::exec {

namespace {

struct Pipe {
  int rd{-1};
  int wr{-1};
  bool open() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) < 0) return false;
    rd = fds[0];
    wr = fds[1];
    return true;
  }
  void close_rd() { if (rd >= 0) { ::close(rd); rd = -1; } }
  void close_wr() { if (wr >= 0) { ::close(wr); wr = -1; } }
  ~Pipe() { close_rd(); close_wr(); }
};

// Append up to the cap, drain the rest. Returns false on EOF or error.
bool drain_into(int fd, std::string& buf, size_t cap, bool& truncated) {
  char chunk[65536];
  for (;;) {
    ssize_t n = ::read(fd, chunk, sizeof(chunk));
    if (n > 0) {
      size_t room = buf.size() < cap ? cap - buf.size() : 0;
      size_t take = std::min(room, static_cast<size_t>(n));
      buf.append(chunk, take);
      if (take < static_cast<size_t>(n)) truncated = true;
      // Pipes are blocking; return to poll() after one read.
      return true;
    }
    if (n == 0) return false;
    if (errno == EINTR) continue;
    return false;
  }
}

int decode_status(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

} // namespace

CommandResult run_command(const std::string& cmd, const RunOptions& opts) {
  CommandResult r;
  if (cmd.empty()) {
    r.spawn_error = "empty command";
    return r;
  }

  Pipe out_pipe, err_pipe;
  if (!out_pipe.open() || !err_pipe.open()) {
    r.spawn_error = std::string("pipe() failed: ") + std::strerror(errno);
    return r;
  }

  const char* shell_cmd = cmd.c_str();
  pid_t pid = ::fork();
  if (pid < 0) {
    r.spawn_error = std::string("fork() failed: ") + std::strerror(errno);
    std::fprintf(stderr, "vipervault: exec: %s\n", r.spawn_error.c_str());
    return r;
  }

  if (pid == 0) {
    // Child: async-signal-safe calls only.
    ::setpgid(0, 0);
    // Ignored dispositions and the blocked mask survive exec; commands expect defaults.
    ::signal(SIGPIPE, SIG_DFL);
    sigset_t none;
    ::sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) { ::dup2(devnull, STDIN_FILENO); ::close(devnull); }
    ::dup2(out_pipe.wr, STDOUT_FILENO);
    ::dup2(err_pipe.wr, STDERR_FILENO);
    ::execl("/bin/sh", "sh", "-c", shell_cmd, static_cast<char*>(nullptr));
    ::_exit(127);
  }

  ::setpgid(pid, pid); // races with the child's own call; either one wins
  out_pipe.close_wr();
  err_pipe.close_wr();

  using clock = std::chrono::steady_clock;
  const bool bounded = opts.timeout.count() > 0;
  const auto deadline = clock::now() + opts.timeout;

  bool out_open = true, err_open = true;
  while (out_open || err_open) {
    struct pollfd pfds[2];
    nfds_t nfds = 0;
    int out_idx = -1, err_idx = -1;
    if (out_open) { out_idx = static_cast<int>(nfds); pfds[nfds++] = pollfd{.fd = out_pipe.rd, .events = POLLIN, .revents = 0}; }
    if (err_open) { err_idx = static_cast<int>(nfds); pfds[nfds++] = pollfd{.fd = err_pipe.rd, .events = POLLIN, .revents = 0}; }

    int wait_ms = -1;
    if (bounded) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
      if (left <= 0) { r.timed_out = true; break; }
      wait_ms = static_cast<int>(std::min<long long>(left, 1000));
    }

    int rv = ::poll(pfds, nfds, wait_ms);
    if (rv < 0) {
      if (errno == EINTR) continue;
      std::fprintf(stderr, "vipervault: exec: poll() failed: %s\n", std::strerror(errno));
      break;
    }
    if (rv == 0) continue;

    if (out_idx >= 0 && (pfds[out_idx].revents & (POLLIN | POLLHUP | POLLERR)))
      out_open = drain_into(out_pipe.rd, r.out, opts.max_output_bytes, r.truncated);
    if (err_idx >= 0 && (pfds[err_idx].revents & (POLLIN | POLLHUP | POLLERR)))
      err_open = drain_into(err_pipe.rd, r.err, opts.max_output_bytes, r.truncated);
  }

  int status = 0;
  pid_t w = 0;
  // Output may close before the command exits; the deadline still bounds the wait.
  if (!r.timed_out && !out_open && !err_open) {
    for (;;) {
      w = ::waitpid(pid, &status, WNOHANG);
      if (w < 0 && errno == EINTR) continue;
      if (w != 0) break;
      if (bounded && clock::now() >= deadline) { r.timed_out = true; break; }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }

  // A group id is not reused while any member lives; stray background
  // members of the command go with the leader.
  ::kill(-pid, SIGKILL);
  out_pipe.close_rd();
  err_pipe.close_rd();
  if (w != pid) {
    do { w = ::waitpid(pid, &status, 0); } while (w < 0 && errno == EINTR);
  }
  r.exit_code = (w == pid) ? decode_status(status) : -1;

  if (r.timed_out) {
    std::fprintf(stderr, "vipervault: exec: command timed out after %llds: %s\n",
                 static_cast<long long>(std::chrono::duration_cast<std::chrono::seconds>(opts.timeout).count()),
                 cmd.c_str());
  }
  return r;
}

std::string render_command_output(const CommandResult& r, const RunOptions& opts) {
  std::string text;
  if (!r.spawn_error.empty()) {
    text = "Unexpected error: " + r.spawn_error;
  } else if (r.timed_out) {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(opts.timeout).count();
    text = "Error running command: timed out after " + std::to_string(secs) + "s\n" + r.err;
  } else if (r.exit_code != 0) {
    text = "Error running command: " + r.err + "\nReturn code: " + std::to_string(r.exit_code);
  } else {
    text = r.out;
  }
  if (r.truncated) text += "\n[output truncated]";
  return text;
}

} // namespace vipervault::exec
