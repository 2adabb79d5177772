/**
 * @file trigger_coordinator.hpp
 * @brief Цепочка одного срабатывания: запуск, триггер, пост-действия
 *
 * Машина состояний:
 *
 *   Idle -> Launching -> Waiting  (OnExit)     -> ExecutingActions -> Done
 *                     -> Delaying (AfterDelay) -> ExecutingActions -> Done
 *                     -> Done (нет пост-действий / код возврата != 0)
 *
 * Failed достижимо из любого активного состояния. Каждое конечное
 * состояние пишет в лог ровно одну строку с именем хоткея.
 */

#pragma once

#include <chrono>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <ostream>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "hotlaunch/action_executor.hpp"
#include "hotlaunch/post_action.hpp"
#include "hotlaunch/process_launcher.hpp"

namespace hotlaunch {

enum class ChainState {
  Idle,
  Launching,
  Waiting,
  Delaying,
  ExecutingActions,
  Done,
  Failed
};

[[nodiscard]] constexpr std::string_view to_string(ChainState s) noexcept {
  switch (s) {
  case ChainState::Idle:
    return "idle";
  case ChainState::Launching:
    return "launching";
  case ChainState::Waiting:
    return "waiting";
  case ChainState::Delaying:
    return "delaying";
  case ChainState::ExecutingActions:
    return "executing actions";
  case ChainState::Done:
    return "done";
  case ChainState::Failed:
    return "failed";
  }
  return "unknown";
}

/// Отчёт о выполненной цепочке
struct ChainReport {
  /// Пройденные состояния по порядку (первое всегда Idle)
  std::vector<ChainState> states{ChainState::Idle};

  /// Код возврата (только OnExit)
  std::optional<int> exit_code;

  /// Итог пачки действий, если исполнитель вызывался
  std::optional<ActionOutcome> actions;

  std::string error;

  [[nodiscard]] ChainState final_state() const noexcept {
    return states.back();
  }

  [[nodiscard]] bool ok() const noexcept {
    return final_state() == ChainState::Done;
  }
};

/**
 * @brief Координатор срабатываний
 *
 * Без собственного состояния: один экземпляр обслуживает все параллельные
 * цепочки. run() блокирует вызывающий поток до конечного состояния.
 */
class TriggerCoordinator {
public:
  /**
   * @param launcher Запуск программ
   * @param executor Исполнитель пост-действий
   * @param log Поток для строк о конечных состояниях
   */
  TriggerCoordinator(ProcessLauncher &launcher, const ActionExecutor &executor,
                     std::ostream &log = std::cerr);

  using SleepFunc = std::function<void(std::chrono::milliseconds)>;

  /// Сон для AfterDelay (тесты подменяют)
  void set_sleep_func(SleepFunc func) { sleep_func_ = std::move(func); }

  /// Уведомление рабочего стола (notify-send) при сбое
  void set_notify_on_failure(bool enabled) noexcept {
    notify_on_failure_ = enabled;
  }

  /**
   * @brief Выполняет цепочку срабатывания до конца
   * @param stop Остановка демона: бросает ожидание процесса и паузы,
   *             цепочка завершается в Failed
   */
  ChainReport run(const Trigger &trigger, std::stop_token stop = {}) const;

private:
  ChainReport launch_program(const Trigger &trigger,
                             const ProgramConfig &program,
                             const std::stop_token &stop) const;

  ChainReport run_ai(const Trigger &trigger, const hotkey_action::AiCall &call,
                     const std::stop_token &stop) const;

  /// ExecutingActions -> Done | Failed
  void execute_actions(const Trigger &trigger,
                       std::span<const PostAction> actions,
                       const ExecutionContext &context,
                       ChainReport &report) const;

  void finish(const Trigger &trigger, ChainReport &report) const;

  void fail(const Trigger &trigger, ChainReport &report,
            std::string error) const;

  /// Одна строка лога целиком (цепочки пишут параллельно)
  void log_line(const std::string &line) const;

  void notify_failure(const Trigger &trigger, const std::string &error) const;

  /// @return false если сон прерван остановкой
  bool sleep(std::chrono::milliseconds duration,
             const std::stop_token &stop) const;

  ProcessLauncher &launcher_;
  const ActionExecutor &executor_;
  std::ostream &log_;
  mutable std::mutex log_mutex_;
  SleepFunc sleep_func_;
  bool notify_on_failure_ = false;
};

} // namespace hotlaunch
