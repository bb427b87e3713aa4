#include "hermit/sandbox/process.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sstream>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace hermit::sandbox {

namespace {

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

/// Reads what is available. Returns false once the write end is closed.
bool read_into_buffer(const int fd, std::string &buffer) {
  std::array<char, 4096> chunk{};
  while (true) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
      buffer.append(chunk.data(), static_cast<std::size_t>(bytes));
      continue;
    }
    if (bytes < 0 && errno == EINTR) {
      continue;
    }
    return bytes < 0 && (errno == EAGAIN || errno == EWOULDBLOCK);
  }
}

void close_fd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

struct Pipe {
  int read_end = -1;
  int write_end = -1;

  ~Pipe() {
    close_fd(read_end);
    close_fd(write_end);
  }

  [[nodiscard]] bool open() {
    int fds[2] = {-1, -1};
    if (pipe2(fds, O_CLOEXEC) != 0) {
      return false;
    }
    read_end = fds[0];
    write_end = fds[1];
    return true;
  }
};

} // namespace

std::optional<std::string> resolve_executable(const std::string &name) {
  if (name.empty()) {
    return std::nullopt;
  }
  if (name.find('/') != std::string::npos) {
    return access(name.c_str(), X_OK) == 0 ? std::optional<std::string>(name) : std::nullopt;
  }
  const char *path_env = std::getenv("PATH");
  std::istringstream dirs(path_env == nullptr ? "/usr/local/bin:/usr/bin:/bin" : path_env);
  std::string dir;
  while (std::getline(dirs, dir, ':')) {
    if (dir.empty()) {
      dir = ".";
    }
    const std::string candidate = dir + "/" + name;
    if (access(candidate.c_str(), X_OK) == 0) {
      return candidate;
    }
  }
  return std::nullopt;
}

common::Result<ProcessResult> PosixProcessRunner::run(const std::vector<std::string> &argv,
                                                      const ProcessOptions &options) {
  if (argv.empty()) {
    return common::Result<ProcessResult>::failure("command is empty");
  }
  const auto executable = resolve_executable(argv.front());
  if (!executable.has_value()) {
    return common::Result<ProcessResult>::failure("executable not found: " + argv.front());
  }

  // Everything the child touches is prepared before fork.
  std::vector<char *> child_argv;
  child_argv.reserve(argv.size() + 1);
  for (const auto &arg : argv) {
    child_argv.push_back(const_cast<char *>(arg.c_str()));
  }
  child_argv.push_back(nullptr);

  std::vector<std::string> env_storage;
  std::vector<char *> child_env;
  if (options.env.has_value()) {
    env_storage.reserve(options.env->size());
    for (const auto &[key, value] : *options.env) {
      env_storage.push_back(key + "=" + value);
    }
    for (auto &entry : env_storage) {
      child_env.push_back(entry.data());
    }
    child_env.push_back(nullptr);
  }
  char **envp = options.env.has_value() ? child_env.data() : environ;
  const std::string exec_error = "exec failed: " + *executable + "\n";

  Pipe in_pipe;
  Pipe out_pipe;
  Pipe err_pipe;
  if (!in_pipe.open() || !out_pipe.open() || !err_pipe.open()) {
    return common::Result<ProcessResult>::failure(std::string("failed to create pipes: ") +
                                                  std::strerror(errno));
  }

  const auto started = std::chrono::steady_clock::now();
  const pid_t pid = fork();
  if (pid < 0) {
    return common::Result<ProcessResult>::failure(std::string("fork failed: ") +
                                                  std::strerror(errno));
  }

  if (pid == 0) {
    (void)setpgid(0, 0);
    (void)dup2(in_pipe.read_end, STDIN_FILENO);
    (void)dup2(out_pipe.write_end, STDOUT_FILENO);
    (void)dup2(err_pipe.write_end, STDERR_FILENO);
    execve(executable->c_str(), child_argv.data(), envp);
    (void)!write(STDERR_FILENO, exec_error.data(), exec_error.size());
    _exit(127);
  }

  close_fd(in_pipe.read_end);
  close_fd(out_pipe.write_end);
  close_fd(err_pipe.write_end);
  set_non_blocking(in_pipe.write_end);
  set_non_blocking(out_pipe.read_end);
  set_non_blocking(err_pipe.read_end);

  std::size_t stdin_offset = 0;
  if (options.stdin_text.empty()) {
    close_fd(in_pipe.write_end);
  }

  ProcessResult result;
  int status = 0;
  bool exited = false;
  while (true) {
    if (in_pipe.write_end >= 0) {
      const ssize_t written = write(in_pipe.write_end, options.stdin_text.data() + stdin_offset,
                                    options.stdin_text.size() - stdin_offset);
      if (written > 0) {
        stdin_offset += static_cast<std::size_t>(written);
      } else if (written < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
        close_fd(in_pipe.write_end);
      }
      if (stdin_offset >= options.stdin_text.size()) {
        close_fd(in_pipe.write_end);
      }
    }
    if (out_pipe.read_end >= 0 && !read_into_buffer(out_pipe.read_end, result.stdout_text)) {
      close_fd(out_pipe.read_end);
    }
    if (err_pipe.read_end >= 0 && !read_into_buffer(err_pipe.read_end, result.stderr_text)) {
      close_fd(err_pipe.read_end);
    }

    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      exited = true;
      break;
    }

    if (std::chrono::steady_clock::now() - started > options.timeout) {
      result.timed_out = true;
      (void)kill(-pid, SIGKILL);
      (void)kill(pid, SIGKILL);
      (void)waitpid(pid, &status, 0);
      break;
    }

    struct pollfd poll_fds[3] = {
        {.fd = out_pipe.read_end, .events = POLLIN, .revents = 0},
        {.fd = err_pipe.read_end, .events = POLLIN, .revents = 0},
        {.fd = in_pipe.write_end, .events = POLLOUT, .revents = 0},
    };
    (void)poll(poll_fds, 3, 50);
  }

  if (out_pipe.read_end >= 0) {
    (void)read_into_buffer(out_pipe.read_end, result.stdout_text);
  }
  if (err_pipe.read_end >= 0) {
    (void)read_into_buffer(err_pipe.read_end, result.stderr_text);
  }

  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  if (result.timed_out) {
    result.exit_code = -1;
  } else if (exited && WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (exited && WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  } else {
    result.exit_code = -1;
  }
  return common::Result<ProcessResult>::success(std::move(result));
}

} // namespace hermit::sandbox
