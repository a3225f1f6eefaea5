#include "docsandbox/render/document_renderer.hpp"

#include "docsandbox/common/fs.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace docsandbox::render {

namespace {

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

void read_into_buffer(const int fd, std::string &buffer) {
  if (fd < 0) {
    return;
  }
  std::array<char, 4096> chunk{};
  while (true) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
      buffer.append(chunk.data(), static_cast<std::size_t>(bytes));
      continue;
    }
    return;
  }
}

void close_pipe(int fds[2]) {
  for (int i = 0; i < 2; ++i) {
    if (fds[i] >= 0) {
      close(fds[i]);
      fds[i] = -1;
    }
  }
}

std::string last_line(const std::string &text) {
  const std::string trimmed = common::trim(text);
  const auto newline = trimmed.find_last_of('\n');
  return newline == std::string::npos ? trimmed : trimmed.substr(newline + 1);
}

} // namespace

CommandRenderer::CommandRenderer(std::string command, std::vector<std::string> args)
    : command_(std::move(command)), args_(std::move(args)) {}

std::vector<std::string> CommandRenderer::build_argv(const std::filesystem::path &output,
                                                     const std::filesystem::path &base_url) const {
  std::vector<std::string> argv;
  argv.reserve(args_.size() + 5);
  argv.push_back(command_);
  argv.insert(argv.end(), args_.begin(), args_.end());
  argv.push_back("--base-url");
  argv.push_back(base_url.string());
  argv.push_back("-");
  argv.push_back(output.string());
  return argv;
}

common::Status CommandRenderer::render(const std::string &markup,
                                       const std::filesystem::path &output,
                                       const std::filesystem::path &base_url) {
  if (common::trim(command_).empty()) {
    return common::Status::error("renderer command is empty", common::ErrorCode::RenderError);
  }
  const auto args = build_argv(output, base_url);
  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (const auto &arg : args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);

  // Close-on-exec: a converter forked for another workspace must not hold this stdin writer.
  int stdin_pipe[2] = {-1, -1};
  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  if (pipe2(stdin_pipe, O_CLOEXEC) != 0 || pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
      pipe2(stderr_pipe, O_CLOEXEC) != 0) {
    close_pipe(stdin_pipe);
    close_pipe(stdout_pipe);
    close_pipe(stderr_pipe);
    return common::Status::error("failed to create pipes for renderer",
                                 common::ErrorCode::RenderError);
  }

  const pid_t pid = fork();
  if (pid < 0) {
    close_pipe(stdin_pipe);
    close_pipe(stdout_pipe);
    close_pipe(stderr_pipe);
    return common::Status::error("failed to fork renderer process", common::ErrorCode::RenderError);
  }

  if (pid == 0) {
    (void)dup2(stdin_pipe[0], STDIN_FILENO);
    (void)dup2(stdout_pipe[1], STDOUT_FILENO);
    (void)dup2(stderr_pipe[1], STDERR_FILENO);
    close_pipe(stdin_pipe);
    close_pipe(stdout_pipe);
    close_pipe(stderr_pipe);
    execvp(argv[0], argv.data());
    _exit(127);
  }

  close(stdin_pipe[0]);
  close(stdout_pipe[1]);
  close(stderr_pipe[1]);
  int input_fd = stdin_pipe[1];
  set_non_blocking(input_fd);
  set_non_blocking(stdout_pipe[0]);
  set_non_blocking(stderr_pipe[0]);

  std::string stdout_text;
  std::string stderr_text;
  std::size_t written = 0;
  int status = 0;
  if (markup.empty()) {
    close(input_fd);
    input_fd = -1;
  }

  while (true) {
    if (input_fd >= 0) {
      const ssize_t bytes = write(input_fd, markup.data() + written, markup.size() - written);
      if (bytes > 0) {
        written += static_cast<std::size_t>(bytes);
      }
      // EPIPE: the renderer stopped reading; its exit status reports why.
      if (written >= markup.size() || (bytes < 0 && errno != EAGAIN && errno != EWOULDBLOCK)) {
        close(input_fd);
        input_fd = -1;
      }
    }

    read_into_buffer(stdout_pipe[0], stdout_text);
    read_into_buffer(stderr_pipe[0], stderr_text);

    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      break;
    }
    if (waited < 0 && errno != EINTR) {
      break;
    }

    struct pollfd poll_fds[3] = {
        {.fd = stdout_pipe[0], .events = POLLIN, .revents = 0},
        {.fd = stderr_pipe[0], .events = POLLIN, .revents = 0},
        {.fd = input_fd, .events = POLLOUT, .revents = 0},
    };
    (void)poll(poll_fds, input_fd >= 0 ? 3 : 2, 50);
  }

  if (input_fd >= 0) {
    close(input_fd);
  }
  read_into_buffer(stdout_pipe[0], stdout_text);
  read_into_buffer(stderr_pipe[0], stderr_text);
  close(stdout_pipe[0]);
  close(stderr_pipe[0]);

  const int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  if (exit_code == 127) {
    return common::Status::error("renderer command not found: " + command_,
                                 common::ErrorCode::RenderError);
  }
  if (exit_code != 0) {
    std::string message = command_ + " exited with status " + std::to_string(exit_code);
    const std::string detail = last_line(stderr_text);
    if (!detail.empty()) {
      message += ": " + detail;
    }
    if (!common::trim(stderr_text).empty()) {
      message += "\n" + common::trim(stderr_text);
    }
    return common::Status::error(message, common::ErrorCode::RenderError);
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(output, ec)) {
    return common::Status::error(command_ + " produced no output at " + output.string(),
                                 common::ErrorCode::RenderError);
  }
  return common::Status::success();
}

} // namespace docsandbox::render
