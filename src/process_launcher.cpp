/**
 * @file process_launcher.cpp
 * @brief Реализация запуска внешних программ
 */

#include "hotlaunch/process_launcher.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <iostream>
#include <unordered_set>

namespace hotlaunch {

namespace fs = std::filesystem;

namespace {

inline constexpr const char *kDefaultPath = "/usr/local/bin:/usr/bin:/bin";

[[nodiscard]] bool is_executable_file(const fs::path &p) {
  std::error_code ec;
  return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
}

/**
 * @brief argv/envp, подготовленные в родителе
 *
 * В дочернем процессе (после fork в многопоточной программе) используются
 * только готовые указатели: никаких аллокаций и iostream.
 */
class ExecArgs {
public:
  explicit ExecArgs(const SpawnSpec &spec) : exe_{spec.executable.string()} {
    argv_storage_.reserve(spec.arguments.size() + 1);
    argv_storage_.push_back(exe_);
    for (const auto &arg : spec.arguments) {
      argv_storage_.push_back(arg);
    }
    for (auto &s : argv_storage_) {
      argv_.push_back(s.data());
    }
    argv_.push_back(nullptr);

    if (!spec.extra_env.empty()) {
      // Дополнительные переменные идут первыми: getenv() берёт первое
      // совпадение, а унаследованные дубли мы отбрасываем.
      std::unordered_set<std::string> keys;
      for (const auto &e : spec.extra_env) {
        keys.insert(e.substr(0, e.find('=')));
        env_storage_.push_back(e);
      }
      for (char **e = ::environ; e != nullptr && *e != nullptr; ++e) {
        std::string_view entry{*e};
        if (!keys.contains(std::string{entry.substr(0, entry.find('='))})) {
          env_storage_.emplace_back(entry);
        }
      }
      for (auto &s : env_storage_) {
        envp_.push_back(s.data());
      }
      envp_.push_back(nullptr);
    }

    if (spec.working_directory) {
      cwd_ = spec.working_directory->string();
    }
  }

  ExecArgs(const ExecArgs &) = delete;
  ExecArgs &operator=(const ExecArgs &) = delete;

  /// Вызывается только в дочернем процессе
  [[noreturn]] void exec(int err_fd) const {
    if (!cwd_.empty()) {
      // Каталог проверен в родителе; если он исчез, запускаемся как есть
      (void)::chdir(cwd_.c_str());
    }

    if (envp_.empty()) {
      ::execv(exe_.c_str(), argv_.data());
    } else {
      ::execve(exe_.c_str(), argv_.data(), envp_.data());
    }

    const int e = errno;
    if (::write(err_fd, &e, sizeof(e)) < 0) {
      // Родитель увидит EOF и код 127
    }
    _exit(127);
  }

private:
  std::string exe_;
  std::vector<std::string> argv_storage_;
  std::vector<char *> argv_;
  std::vector<std::string> env_storage_;
  std::vector<char *> envp_;
  std::string cwd_;
};

/// Закрывает дескриптор, если он открыт
void close_fd(int &fd) noexcept {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

/// Читает errno, записанный дочерним процессом при неудачном exec
[[nodiscard]] std::optional<int> read_exec_errno(int fd) {
  int value = 0;
  while (true) {
    ssize_t n = ::read(fd, &value, sizeof(value));
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n == static_cast<ssize_t>(sizeof(value))) {
      return value;
    }
    return std::nullopt;
  }
}

/// Ждёт процесс, возвращает сырой status
int wait_blocking(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno == EINTR) {
      continue;
    }
    return -1;
  }
  return status;
}

[[nodiscard]] int exit_code_from_status(int status) noexcept {
  if (status >= 0 && WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  return -1;
}

void set_nonblocking(int fd) noexcept {
  const int flags = ::fcntl(fd, F_GETFL);
  if (flags >= 0) {
    (void)::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

/**
 * @brief Блокирует SIGPIPE в текущем потоке на время записи в stdin ребёнка
 *
 * Если ребёнок закрыл stdin раньше времени, write() вернёт EPIPE вместо
 * завершения всего процесса сигналом.
 */
class SigpipeGuard {
public:
  SigpipeGuard() {
    sigemptyset(&set_);
    sigaddset(&set_, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &set_, &old_);
  }

  ~SigpipeGuard() {
    // Сбрасываем SIGPIPE, накопившийся за время записи
    timespec zero{};
    while (sigtimedwait(&set_, nullptr, &zero) > 0) {
    }
    pthread_sigmask(SIG_SETMASK, &old_, nullptr);
  }

  SigpipeGuard(const SigpipeGuard &) = delete;
  SigpipeGuard &operator=(const SigpipeGuard &) = delete;

private:
  sigset_t set_{};
  sigset_t old_{};
};

/**
 * @brief Будит poll() из потока, запросившего остановку
 *
 * stop_callback пишет байт в pipe, читающий конец стоит в наборе poll().
 */
class StopWakeup {
public:
  explicit StopWakeup(std::stop_token stop) {
    if (!stop.stop_possible() ||
        ::pipe2(fds_, O_CLOEXEC | O_NONBLOCK) != 0) {
      fds_[0] = fds_[1] = -1;
      return;
    }
    callback_.emplace(std::move(stop), std::function<void()>{[this] {
                        const char byte = 1;
                        if (::write(fds_[1], &byte, 1) < 0) {
                          // pipe полон: poll() уже разбужен
                        }
                      }});
  }

  ~StopWakeup() {
    callback_.reset();
    close_fd(fds_[0]);
    close_fd(fds_[1]);
  }

  StopWakeup(const StopWakeup &) = delete;
  StopWakeup &operator=(const StopWakeup &) = delete;

  [[nodiscard]] int fd() const noexcept { return fds_[0]; }

private:
  int fds_[2]{-1, -1};
  std::optional<std::stop_callback<std::function<void()>>> callback_;
};

/// Шаг опроса waitpid, когда блокирующее ожидание недопустимо
inline constexpr int kReapIntervalMs = 10;

[[nodiscard]] std::string spawn_error(const SpawnSpec &spec, int e) {
  return "Failed to launch program '" + spec.executable.string() +
         "': " + std::strerror(e);
}

} // namespace

// ===========================================================================
// Разрешение программы
// ===========================================================================

std::optional<fs::path> resolve_executable(std::string_view path_or_name) {
  if (path_or_name.empty()) {
    return std::nullopt;
  }

  if (path_or_name.find('/') != std::string_view::npos) {
    fs::path p{std::string{path_or_name}};
    if (!is_executable_file(p)) {
      return std::nullopt;
    }
    std::error_code ec;
    auto absolute = fs::absolute(p, ec);
    return ec ? p : absolute;
  }

  const char *path_env = std::getenv("PATH");
  std::string_view dirs = (path_env && *path_env) ? path_env : kDefaultPath;

  while (true) {
    const auto colon = dirs.find(':');
    std::string_view dir = dirs.substr(0, colon);
    fs::path candidate = fs::path{dir.empty() ? "." : std::string{dir}} /
                         std::string{path_or_name};
    if (is_executable_file(candidate)) {
      return candidate;
    }
    if (colon == std::string_view::npos) {
      break;
    }
    dirs.remove_prefix(colon + 1);
  }

  return std::nullopt;
}

bool validate_program_path(std::string_view path) {
  return !path.empty() && is_executable_file(fs::path{std::string{path}});
}

std::optional<SpawnSpec> make_spawn_spec(const ProgramConfig &config) {
  auto exe = resolve_executable(config.path);
  if (!exe) {
    return std::nullopt;
  }

  SpawnSpec spec;
  spec.executable = std::move(*exe);
  for (const auto &arg : config.arguments) {
    if (!arg.empty()) {
      spec.arguments.push_back(arg);
    }
  }

  if (config.working_directory && !config.working_directory->empty()) {
    std::error_code ec;
    fs::path dir{*config.working_directory};
    if (fs::is_directory(dir, ec)) {
      spec.working_directory = std::move(dir);
    }
  }

  spec.hidden = config.hidden;
  return spec;
}

// ===========================================================================
// Запуск с перехватом stdout
// ===========================================================================

LaunchOutcome run_and_capture(const SpawnSpec &spec, std::string_view stdin_data,
                              std::optional<std::chrono::milliseconds> timeout,
                              std::stop_token stop) {
  const ExecArgs args{spec};
  LaunchOutcome out;

  int err_pipe[2]{-1, -1};
  int out_pipe[2]{-1, -1};
  int in_pipe[2]{-1, -1};
  const bool feed_stdin = !stdin_data.empty();
  const bool capture = !spec.discard_output;

  auto close_all = [&] {
    for (int *p : {err_pipe, out_pipe, in_pipe}) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
  };

  if (::pipe2(err_pipe, O_CLOEXEC) != 0 ||
      (capture && ::pipe2(out_pipe, O_CLOEXEC) != 0) ||
      (feed_stdin && ::pipe2(in_pipe, O_CLOEXEC) != 0)) {
    const int e = errno;
    close_all();
    return {LaunchResult::SpawnFailed, -1, {}, spawn_error(spec, e)};
  }

  int devnull = ::open("/dev/null", O_RDWR | O_CLOEXEC);

  pid_t pid = ::fork();
  if (pid < 0) {
    const int e = errno;
    close_all();
    close_fd(devnull);
    return {LaunchResult::SpawnFailed, -1, {}, spawn_error(spec, e)};
  }

  if (pid == 0) {
    const int stdin_fd = feed_stdin ? in_pipe[0] : devnull;
    if (stdin_fd >= 0) {
      (void)::dup2(stdin_fd, STDIN_FILENO);
    }
    const int stdout_fd = capture ? out_pipe[1] : devnull;
    if (stdout_fd >= 0) {
      (void)::dup2(stdout_fd, STDOUT_FILENO);
    }
    if (spec.hidden && devnull >= 0) {
      (void)::dup2(devnull, STDERR_FILENO);
    }
    args.exec(err_pipe[1]);
  }

  // Родитель: закрываем концы ребёнка
  close_fd(err_pipe[1]);
  close_fd(out_pipe[1]);
  close_fd(in_pipe[0]);
  close_fd(devnull);

  // Блокирует только до exec() в ребёнке
  if (auto e = read_exec_errno(err_pipe[0])) {
    close_all();
    (void)wait_blocking(pid);
    return {LaunchResult::SpawnFailed, -1, {}, spawn_error(spec, *e)};
  }
  close_fd(err_pipe[0]);

  using clock = std::chrono::steady_clock;
  const auto now = clock::now();
  // Таймаут, не помещающийся в time_point, равносилен бесконечному
  const auto horizon = std::chrono::duration_cast<std::chrono::milliseconds>(
      clock::time_point::max() - now);
  const auto deadline = timeout && *timeout < horizon
                            ? now + *timeout
                            : clock::time_point::max();

  StopWakeup wakeup{stop};

  auto kill_on_timeout = [&] {
    ::kill(pid, SIGKILL);
    (void)wait_blocking(pid);
    close_all();
    out.result = LaunchResult::Timeout;
    out.exit_code = -1;
    out.error = "Process '" + spec.executable.string() +
                "' did not exit within " + std::to_string(timeout->count()) +
                " ms";
    return out;
  };

  // Ребёнок остаётся работать; его подберёт init после нашего выхода
  auto abandon = [&] {
    close_all();
    out.result = LaunchResult::Interrupted;
    out.exit_code = -1;
    out.error = "Stopped waiting for '" + spec.executable.string() + "'";
    return out;
  };

  {
    SigpipeGuard sigpipe_guard;

    int out_fd = out_pipe[0];
    int in_fd = feed_stdin ? in_pipe[1] : -1;
    std::size_t written = 0;
    if (out_fd >= 0) {
      set_nonblocking(out_fd);
    }
    if (in_fd >= 0) {
      set_nonblocking(in_fd);
    }

    char buffer[4096];
    bool out_open = capture;

    while (out_open || in_fd >= 0) {
      int wait_ms = -1;
      if (timeout) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - clock::now());
        if (left.count() <= 0) {
          return kill_on_timeout();
        }
        // poll() принимает int: дальний дедлайн ждём частями
        wait_ms = static_cast<int>(
                      std::min<std::int64_t>(left.count(), 60'000)) +
                  1;
      }

      // Закрытый конец пропускается poll() через отрицательный fd
      pollfd fds[3]{};
      fds[0] = {out_open ? out_fd : -1, POLLIN, 0};
      fds[1] = {in_fd, POLLOUT, 0};
      fds[2] = {wakeup.fd(), POLLIN, 0};

      const int rc = ::poll(fds, 3, wait_ms);
      if (rc < 0) {
        if (errno == EINTR) {
          continue;
        }
        const int e = errno;
        ::kill(pid, SIGKILL);
        (void)wait_blocking(pid);
        close_all();
        return {LaunchResult::SpawnFailed, -1, {}, spawn_error(spec, e)};
      }
      if (stop.stop_requested()) {
        return abandon();
      }
      if (rc == 0) {
        continue;
      }

      if (out_open && fds[0].revents != 0) {
        while (true) {
          ssize_t n = ::read(out_fd, buffer, sizeof(buffer));
          if (n > 0) {
            const auto room = kMaxCapturedOutput - out.output.size();
            const auto got = static_cast<std::size_t>(n);
            if (got > room) {
              out.truncated = true;
            }
            out.output.append(buffer, std::min(room, got));
            continue;
          }
          if (n < 0 && errno == EINTR) {
            continue;
          }
          if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            break;
          }
          // EOF или ошибка чтения
          out_open = false;
          break;
        }
      }

      if (in_fd >= 0 && fds[1].revents != 0) {
        ssize_t n = ::write(in_fd, stdin_data.data() + written,
                            stdin_data.size() - written);
        if (n > 0) {
          written += static_cast<std::size_t>(n);
        }
        const bool again =
            n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR);
        if (written == stdin_data.size() || (n < 0 && !again)) {
          // Всё записано или ребёнок закрыл stdin (EPIPE)
          close_fd(in_pipe[1]);
          in_fd = -1;
        }
      }
    }
  }

  close_all();

  int status = -1;
  if (!timeout && !stop.stop_possible()) {
    status = wait_blocking(pid);
  } else {
    while (true) {
      int st = 0;
      pid_t r = ::waitpid(pid, &st, WNOHANG);
      if (r == pid) {
        status = st;
        break;
      }
      if (r < 0 && errno != EINTR) {
        break;
      }
      if (stop.stop_requested()) {
        return abandon();
      }
      if (clock::now() >= deadline) {
        return kill_on_timeout();
      }
      pollfd wake{wakeup.fd(), POLLIN, 0};
      (void)::poll(&wake, 1, kReapIntervalMs);
    }
  }

  out.result = LaunchResult::Ok;
  out.exit_code = exit_code_from_status(status);
  return out;
}

// ===========================================================================
// PosixProcessLauncher
// ===========================================================================

LaunchOutcome PosixProcessLauncher::launch_detached(const ProgramConfig &config) {
  auto spec = make_spawn_spec(config);
  if (!spec) {
    return {LaunchResult::NotFound, 0, {}, "Program not found: " + config.path};
  }

  const ExecArgs args{*spec};

  int err_pipe[2]{-1, -1};
  if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
    return {LaunchResult::SpawnFailed, 0, {}, spawn_error(*spec, errno)};
  }

  int devnull = spec->hidden ? ::open("/dev/null", O_RDWR | O_CLOEXEC) : -1;

  pid_t pid = ::fork();
  if (pid < 0) {
    const int e = errno;
    close_fd(err_pipe[0]);
    close_fd(err_pipe[1]);
    close_fd(devnull);
    return {LaunchResult::SpawnFailed, 0, {}, spawn_error(*spec, e)};
  }

  if (pid == 0) {
    // Промежуточный процесс: новая сессия, отвязка от нашей группы
    ::close(err_pipe[0]);
    (void)::setsid();

    pid_t pid2 = ::fork();
    if (pid2 < 0) {
      const int e = errno;
      if (::write(err_pipe[1], &e, sizeof(e)) < 0) {
        // Родитель увидит EOF
      }
      _exit(1);
    }
    if (pid2 > 0) {
      _exit(0);
    }

    // Финальный процесс
    if (devnull >= 0) {
      (void)::dup2(devnull, STDIN_FILENO);
      (void)::dup2(devnull, STDOUT_FILENO);
      (void)::dup2(devnull, STDERR_FILENO);
    }
    args.exec(err_pipe[1]);
  }

  close_fd(err_pipe[1]);
  close_fd(devnull);

  // Ждём ТОЛЬКО промежуточный процесс, чтобы не оставлять зомби
  (void)wait_blocking(pid);

  auto exec_errno = read_exec_errno(err_pipe[0]);
  close_fd(err_pipe[0]);

  if (exec_errno) {
    return {LaunchResult::SpawnFailed, 0, {}, spawn_error(*spec, *exec_errno)};
  }
  return {};
}

LaunchOutcome PosixProcessLauncher::launch_and_wait(const ProgramConfig &config,
                                                    std::stop_token stop) {
  auto spec = make_spawn_spec(config);
  if (!spec) {
    return {LaunchResult::NotFound, -1, {}, "Program not found: " + config.path};
  }
  return run_and_capture(*spec, {}, wait_timeout_, std::move(stop));
}

} // namespace hotlaunch
