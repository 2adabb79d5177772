/**
 * @file process_launcher.hpp
 * @brief Запуск внешних программ
 *
 * Два разных контракта, а не один вызов с флагом:
 * - launch_detached: запустить и забыть (double-fork + setsid, без зомби);
 * - launch_and_wait: дочерний процесс с перехваченным stdout, вызывающий
 *   поток блокируется до завершения.
 *
 * argv/envp готовятся в родителе: после fork() в многопоточном процессе
 * нельзя аллоцировать память.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "hotlaunch/post_action.hpp"
#include "hotlaunch/types.hpp"

namespace hotlaunch {

/// Сколько байт stdout сохраняется; остальное вычитывается и отбрасывается
inline constexpr std::size_t kMaxCapturedOutput = 4 * 1024 * 1024;

/// Результат запуска
struct LaunchOutcome {
  LaunchResult result = LaunchResult::Ok;

  /// Код возврата (-1 если процесс убит сигналом). Только для ожидающих
  /// запусков.
  int exit_code = 0;

  /// Перехваченный stdout. Только для ожидающих запусков.
  std::string output;

  std::string error;

  /// stdout превысил kMaxCapturedOutput, хвост отброшен
  bool truncated = false;

  [[nodiscard]] bool ok() const noexcept { return result == LaunchResult::Ok; }
};

/// Полностью разрешённая спецификация запуска
struct SpawnSpec {
  std::filesystem::path executable;
  std::vector<std::string> arguments;
  std::optional<std::filesystem::path> working_directory;

  /// Дополнительные переменные окружения "KEY=VALUE"
  std::vector<std::string> extra_env;

  /// stdio в /dev/null (stdout при перехвате не затрагивается)
  bool hidden = false;

  /// stdout ребёнка в /dev/null вместо перехвата. Нужно для программ,
  /// которые демонизируются и держат унаследованный stdout открытым.
  bool discard_output = false;
};

/**
 * @brief Разрешает программу в путь к исполняемому файлу
 *
 * Токен с '/' должен указывать на существующий исполняемый файл,
 * голое имя ищется в $PATH.
 */
[[nodiscard]] std::optional<std::filesystem::path>
resolve_executable(std::string_view path_or_name);

/// Существует ли путь и исполняемый ли он
[[nodiscard]] bool validate_program_path(std::string_view path);

/**
 * @brief Собирает SpawnSpec из конфигурации программы
 *
 * Пустые аргументы пропускаются, рабочий каталог применяется только если
 * существует и является каталогом.
 * @return nullopt если программа не найдена
 */
[[nodiscard]] std::optional<SpawnSpec> make_spawn_spec(const ProgramConfig &config);

/**
 * @brief Запускает процесс, пишет stdin_data в его stdin и собирает stdout
 *
 * Блокирует вызывающий поток до завершения процесса.
 * @param timeout nullopt = ждать бесконечно; по таймауту процесс убивается
 * @param stop По запросу остановки ожидание бросается (Interrupted), а
 *             процесс продолжает работать
 */
[[nodiscard]] LaunchOutcome
run_and_capture(const SpawnSpec &spec, std::string_view stdin_data,
                std::optional<std::chrono::milliseconds> timeout,
                std::stop_token stop = {});

/**
 * @brief Интерфейс запуска программ (тесты подменяют фейком)
 */
class ProcessLauncher {
public:
  virtual ~ProcessLauncher() = default;

  /// Запустить без ожидания, вернуться сразу
  [[nodiscard]] virtual LaunchOutcome
  launch_detached(const ProgramConfig &config) = 0;

  /// Запустить и дождаться завершения, вернуть код и stdout.
  /// stop прерывает только ожидание, не сам процесс.
  [[nodiscard]] virtual LaunchOutcome
  launch_and_wait(const ProgramConfig &config, std::stop_token stop) = 0;
};

/**
 * @brief Реализация на fork/exec
 */
class PosixProcessLauncher final : public ProcessLauncher {
public:
  /// @param wait_timeout Таймаут launch_and_wait (nullopt = бесконечно)
  explicit PosixProcessLauncher(
      std::optional<std::chrono::milliseconds> wait_timeout = std::nullopt)
      : wait_timeout_{wait_timeout} {}

  [[nodiscard]] LaunchOutcome
  launch_detached(const ProgramConfig &config) override;

  [[nodiscard]] LaunchOutcome
  launch_and_wait(const ProgramConfig &config, std::stop_token stop) override;

private:
  std::optional<std::chrono::milliseconds> wait_timeout_;
};

} // namespace hotlaunch
