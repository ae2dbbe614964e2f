#include "internal/process/command_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <mutex>

#include "internal/util/errors.hpp"

namespace eryzaa::process {

using eryzaa::util::CommandFailure;

namespace {

class Pipe {
 public:
  Pipe() {
    if (::pipe2(fds_, O_CLOEXEC) != 0) {
      throw CommandFailure(std::string("pipe() failed: ") + std::strerror(errno));
    }
  }

  ~Pipe() {
    CloseRead();
    CloseWrite();
  }

  Pipe(const Pipe&)            = delete;
  Pipe& operator=(const Pipe&) = delete;

  int read_end() const {
    return fds_[0];
  }

  int write_end() const {
    return fds_[1];
  }

  void CloseRead() {
    if (fds_[0] >= 0) ::close(fds_[0]);
    fds_[0] = -1;
  }

  void CloseWrite() {
    if (fds_[1] >= 0) ::close(fds_[1]);
    fds_[1] = -1;
  }

 private:
  int fds_[2] = {-1, -1};
};

// Only async-signal-safe calls between fork and exec.
[[noreturn]] void ExecChild(char* const* args, const Pipe& in, const Pipe& out, const Pipe& err) {
  ::dup2(in.read_end(), STDIN_FILENO);
  ::dup2(out.write_end(), STDOUT_FILENO);
  ::dup2(err.write_end(), STDERR_FILENO);
  ::signal(SIGPIPE, SIG_DFL);

  ::execvp(args[0], args);
  _exit(127);
}

// Feeds stdin and drains stdout/stderr together so neither side can block on
// a full pipe.
void Pump(Pipe& in, Pipe& out, Pipe& err, const std::string& stdin_data, CommandResult& result) {
  std::size_t written = 0;
  if (stdin_data.empty()) in.CloseWrite();

  std::array<char, 4096> buffer;
  while (out.read_end() >= 0 || err.read_end() >= 0) {
    std::array<pollfd, 3> fds{};
    nfds_t                count = 0;

    const bool want_write = in.write_end() >= 0;
    if (want_write) fds[count++] = pollfd{in.write_end(), POLLOUT, 0};
    if (out.read_end() >= 0) fds[count++] = pollfd{out.read_end(), POLLIN, 0};
    if (err.read_end() >= 0) fds[count++] = pollfd{err.read_end(), POLLIN, 0};

    if (::poll(fds.data(), count, -1) < 0) {
      if (errno == EINTR) continue;
      throw CommandFailure(std::string("poll() failed: ") + std::strerror(errno));
    }

    for (nfds_t i = 0; i < count; ++i) {
      if (fds[i].revents == 0) continue;

      if (want_write && fds[i].fd == in.write_end()) {
        const auto n = ::write(in.write_end(), stdin_data.data() + written, stdin_data.size() - written);
        if (n < 0 && errno != EINTR && errno != EAGAIN) {
          in.CloseWrite();
        } else if (n > 0) {
          written += static_cast<std::size_t>(n);
          if (written == stdin_data.size()) in.CloseWrite();
        }
        continue;
      }

      const bool is_out = fds[i].fd == out.read_end();
      const auto n      = ::read(fds[i].fd, buffer.data(), buffer.size());
      if (n > 0) {
        (is_out ? result.stdout_text : result.stderr_text).append(buffer.data(), static_cast<std::size_t>(n));
      } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
        if (is_out) {
          out.CloseRead();
        } else {
          err.CloseRead();
        }
      }
    }
  }
  in.CloseWrite();
}

} // namespace

CommandResult PosixCommandRunner::Run(const std::vector<std::string>& argv, const std::string& stdin_data) {
  if (argv.empty()) {
    throw CommandFailure("empty command line");
  }

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& arg : argv) args.push_back(const_cast<char*>(arg.c_str()));
  args.push_back(nullptr);

  Pipe in;
  Pipe out;
  Pipe err;

  const pid_t pid = ::fork();
  if (pid < 0) {
    throw CommandFailure("fork() failed for " + FormatCommand(argv) + ": " + std::strerror(errno));
  }
  if (pid == 0) {
    ExecChild(args.data(), in, out, err);
  }

  in.CloseRead();
  out.CloseWrite();
  err.CloseWrite();

  // partial writes keep stdout/stderr draining while the child is busy
  ::fcntl(in.write_end(), F_SETFL, ::fcntl(in.write_end(), F_GETFL) | O_NONBLOCK);

  CommandResult result;

  // a child that exits without reading stdin must not kill us with SIGPIPE
  static std::once_flag sigpipe_once;
  std::call_once(sigpipe_once, [] { ::signal(SIGPIPE, SIG_IGN); });

  try {
    Pump(in, out, err, stdin_data, result);
  } catch (const CommandFailure&) {
    ::kill(pid, SIGKILL);
    ::waitpid(pid, nullptr, 0);
    throw;
  }

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw CommandFailure("waitpid() failed for " + FormatCommand(argv) + ": " + std::strerror(errno));
    }
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

std::string FormatCommand(const std::vector<std::string>& argv) {
  std::string out;
  for (const auto& arg : argv) {
    if (!out.empty()) out += ' ';
    out += arg;
  }
  return out;
}

} // namespace eryzaa::process
