#include "platform_process.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>

namespace pbr::platform {

namespace {

void SetErrno(std::error_code& ec, int err) {
  ec = std::error_code(err, std::generic_category());
}

void CloseFd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

bool MakePipe(int fds[2]) {
#if defined(__linux__)
  return ::pipe2(fds, O_CLOEXEC) == 0;
#else
  if (::pipe(fds) != 0) {
    return false;
  }
  for (int i = 0; i < 2; ++i) {
    if (::fcntl(fds[i], F_SETFD, FD_CLOEXEC) != 0) {
      const int saved = errno;
      ::close(fds[0]);
      ::close(fds[1]);
      fds[0] = -1;
      fds[1] = -1;
      errno = saved;
      return false;
    }
  }
  return true;
#endif
}

void ClosePipe(int fds[2]) {
  CloseFd(fds[0]);
  CloseFd(fds[1]);
}

}  // namespace

bool RunProcess(const std::vector<std::string>& argv,
                const std::string& stdin_data,
                ProcessResult& out,
                std::error_code& ec) {
  out = ProcessResult{};
  ec.clear();
  if (argv.empty() || argv[0].empty()) {
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};
  if (!MakePipe(in_pipe) || !MakePipe(out_pipe) || !MakePipe(err_pipe) ||
      !MakePipe(exec_pipe)) {
    SetErrno(ec, errno);
    ClosePipe(in_pipe);
    ClosePipe(out_pipe);
    ClosePipe(err_pipe);
    ClosePipe(exec_pipe);
    return false;
  }

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    args.push_back(const_cast<char*>(arg.c_str()));
  }
  args.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    SetErrno(ec, errno);
    ClosePipe(in_pipe);
    ClosePipe(out_pipe);
    ClosePipe(err_pipe);
    ClosePipe(exec_pipe);
    return false;
  }
  if (pid == 0) {
    ::dup2(in_pipe[0], STDIN_FILENO);
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    ::execvp(args[0], args.data());
    const int err = errno;
    ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
  }

  CloseFd(in_pipe[0]);
  CloseFd(out_pipe[1]);
  CloseFd(err_pipe[1]);
  CloseFd(exec_pipe[1]);

  // The exec pipe is closed by exec on success; a payload means exec failed.
  int exec_errno = 0;
  ssize_t got = 0;
  do {
    got = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (got < 0 && errno == EINTR);
  CloseFd(exec_pipe[0]);
  if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
    CloseFd(in_pipe[1]);
    CloseFd(out_pipe[0]);
    CloseFd(err_pipe[0]);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    SetErrno(ec, exec_errno);
    return false;
  }

  // SIGPIPE would kill us if the child exits before reading its input.
  struct sigaction ignore_pipe {};
  struct sigaction previous_pipe {};
  ignore_pipe.sa_handler = SIG_IGN;
  ::sigaction(SIGPIPE, &ignore_pipe, &previous_pipe);

  std::size_t written = 0;
  if (stdin_data.empty()) {
    CloseFd(in_pipe[1]);
  } else {
    const int fl = ::fcntl(in_pipe[1], F_GETFL);
    if (fl >= 0) {
      ::fcntl(in_pipe[1], F_SETFL, fl | O_NONBLOCK);
    }
  }
  char buf[4096];
  while (in_pipe[1] >= 0 || out_pipe[0] >= 0 || err_pipe[0] >= 0) {
    pollfd fds[3];
    nfds_t count = 0;
    int* owners[3] = {nullptr, nullptr, nullptr};
    if (in_pipe[1] >= 0) {
      fds[count] = pollfd{in_pipe[1], POLLOUT, 0};
      owners[count++] = &in_pipe[1];
    }
    if (out_pipe[0] >= 0) {
      fds[count] = pollfd{out_pipe[0], POLLIN, 0};
      owners[count++] = &out_pipe[0];
    }
    if (err_pipe[0] >= 0) {
      fds[count] = pollfd{err_pipe[0], POLLIN, 0};
      owners[count++] = &err_pipe[0];
    }
    const int ready = ::poll(fds, count, -1);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    for (nfds_t i = 0; i < count; ++i) {
      if (fds[i].revents == 0) {
        continue;
      }
      int& fd = *owners[i];
      if (&fd == &in_pipe[1]) {
        const ssize_t rc = ::write(fd, stdin_data.data() + written,
                                   stdin_data.size() - written);
        if (rc < 0 && (errno == EINTR || errno == EAGAIN)) {
          continue;
        }
        if (rc <= 0) {
          CloseFd(fd);
          continue;
        }
        written += static_cast<std::size_t>(rc);
        if (written >= stdin_data.size()) {
          CloseFd(fd);
        }
        continue;
      }
      const ssize_t rc = ::read(fd, buf, sizeof(buf));
      if (rc < 0 && errno == EINTR) {
        continue;
      }
      if (rc <= 0) {
        CloseFd(fd);
        continue;
      }
      std::string& sink =
          (&fd == &out_pipe[0]) ? out.stdout_data : out.stderr_data;
      sink.append(buf, static_cast<std::size_t>(rc));
    }
  }
  CloseFd(in_pipe[1]);
  CloseFd(out_pipe[0]);
  CloseFd(err_pipe[0]);
  ::sigaction(SIGPIPE, &previous_pipe, nullptr);

  int status = 0;
  pid_t waited = 0;
  do {
    waited = ::waitpid(pid, &status, 0);
  } while (waited < 0 && errno == EINTR);
  if (waited < 0) {
    SetErrno(ec, errno);
    return false;
  }
  if (WIFEXITED(status)) {
    out.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    out.signaled = true;
    out.exit_code = 128 + WTERMSIG(status);
  }
  return true;
}

}  // namespace pbr::platform
