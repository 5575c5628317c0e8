#include "subprocess.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "internal/util/errors.hpp"

namespace streamlift::util {
namespace {

constexpr size_t kStderrTailBytes = 4096;
constexpr int    kPollIntervalMs  = 200;

void AppendTail(std::string& tail, const char* data, size_t size) {
  tail.append(data, size);
  if (tail.size() > kStderrTailBytes) {
    tail.erase(0, tail.size() - kStderrTailBytes);
  }
}

void EmitLines(std::string& pending, const LineCallback& on_line) {
  size_t start = 0;
  for (size_t i = 0; i < pending.size(); ++i) {
    if (pending[i] == '\n' || pending[i] == '\r') {
      if (i > start && on_line) on_line(pending.substr(start, i - start));
      start = i + 1;
    }
  }
  pending.erase(0, start);
}

int WaitForChild(pid_t pid) {
  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) return -1;
  }
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

/*
  Owns the parent's pipe ends and the child pid. Unless Reap() ran, the
  destructor closes the pipes, kills the child and waits for it, so a
  throwing line callback leaves no fd or zombie behind.
*/
class ChildProcess {
 public:
  ChildProcess(pid_t pid, int out_fd, int err_fd) : pid_(pid), out_fd_(out_fd), err_fd_(err_fd) {
  }

  ~ChildProcess() {
    ClosePipes();
    if (pid_ > 0) {
      kill(pid_, SIGKILL);
      WaitForChild(pid_);
    }
  }

  ChildProcess(const ChildProcess&)            = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  pid_t Pid() const {
    return pid_;
  }
  int OutFd() const {
    return out_fd_;
  }
  int ErrFd() const {
    return err_fd_;
  }

  void ClosePipes() {
    if (out_fd_ >= 0) close(out_fd_);
    if (err_fd_ >= 0) close(err_fd_);
    out_fd_ = err_fd_ = -1;
  }

  // Exit status; the child is no longer owned afterwards.
  int Reap() {
    ClosePipes();
    const int code = WaitForChild(pid_);
    pid_           = -1;
    return code;
  }

 private:
  pid_t pid_;
  int   out_fd_;
  int   err_fd_;
};

} // namespace

ProcessResult RunProcess(const std::vector<std::string>& argv, const LineCallback& on_stderr_line, const CancellationToken& cancel) {
  if (argv.empty()) {
    throw std::invalid_argument("RunProcess requires a program");
  }

  int out_pipe[2];
  int err_pipe[2];
  if (pipe(out_pipe) != 0) {
    throw TransientIoError("pipe failed: " + std::string(std::strerror(errno)));
  }
  if (pipe(err_pipe) != 0) {
    close(out_pipe[0]);
    close(out_pipe[1]);
    throw TransientIoError("pipe failed: " + std::string(std::strerror(errno)));
  }

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& arg : argv) args.push_back(const_cast<char*>(arg.c_str()));
  args.push_back(nullptr);

  pid_t pid = fork();
  if (pid < 0) {
    for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) close(fd);
    throw TransientIoError("fork failed: " + std::string(std::strerror(errno)));
  }

  if (pid == 0) {
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) close(fd);
    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      close(devnull);
    }
    execvp(args[0], args.data());
    _exit(127);
  }

  close(out_pipe[1]);
  close(err_pipe[1]);
  ChildProcess child(pid, out_pipe[0], err_pipe[0]);

  ProcessResult result;
  std::string   pending_line;
  bool          out_open  = true;
  bool          err_open  = true;
  bool          cancelled = false;
  char          buffer[8192];

  while (out_open || err_open) {
    if (cancel.IsCancelled()) {
      kill(child.Pid(), SIGKILL);
      cancelled = true;
      break;
    }

    pollfd fds[2];
    nfds_t count = 0;
    if (out_open) fds[count++] = {child.OutFd(), POLLIN, 0};
    if (err_open) fds[count++] = {child.ErrFd(), POLLIN, 0};

    int ready = poll(fds, count, kPollIntervalMs);
    if (ready < 0) {
      if (errno == EINTR) continue;
      kill(child.Pid(), SIGKILL);
      break;
    }

    for (nfds_t i = 0; i < count; ++i) {
      if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;

      ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
      if (n <= 0) {
        if (fds[i].fd == child.OutFd()) out_open = false;
        else err_open = false;
        continue;
      }

      if (fds[i].fd == child.OutFd()) {
        result.stdout_data.append(buffer, static_cast<size_t>(n));
      } else {
        AppendTail(result.stderr_tail, buffer, static_cast<size_t>(n));
        pending_line.append(buffer, static_cast<size_t>(n));
        EmitLines(pending_line, on_stderr_line);
      }
    }
  }

  if (!pending_line.empty() && on_stderr_line && !cancelled) on_stderr_line(pending_line);

  result.exit_code = child.Reap();

  if (cancelled) {
    throw Cancelled("process " + argv[0] + " killed on cancellation");
  }
  if (result.exit_code == 127) {
    throw TransientIoError("failed to start " + argv[0]);
  }
  return result;
}

} // namespace streamlift::util
