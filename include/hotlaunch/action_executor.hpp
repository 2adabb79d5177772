/**
 * @file action_executor.hpp
 * @brief Последовательное выполнение пост-действий
 *
 * Действия выполняются строго по порядку списка, выключенные пропускаются.
 * Первая ошибка прерывает пачку: последующие действия не выполняются.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <string>

#include "hotlaunch/ai_provider.hpp"
#include "hotlaunch/audio_recorder.hpp"
#include "hotlaunch/clipboard_manager.hpp"
#include "hotlaunch/config.hpp"
#include "hotlaunch/input_simulator.hpp"
#include "hotlaunch/post_action.hpp"
#include "hotlaunch/types.hpp"

namespace hotlaunch {

/// Данные срабатывания, доступные действиям
struct ExecutionContext {
  std::string hotkey_name;

  /// stdout программы (только после OnExit с кодом 0)
  std::optional<std::string> process_output;

  /// stdout не поместился в kMaxCapturedOutput
  bool process_output_truncated = false;

  /// Остановка демона: оставшиеся действия не выполняются
  std::stop_token stop;
};

/// Итог выполнения пачки
struct ActionOutcome {
  ActionError error = ActionError::Ok;
  std::string message;

  /// Сколько действий выполнено успешно
  std::size_t executed = 0;

  /// Индекс упавшего действия в исходном списке
  std::optional<std::size_t> failed_index;

  [[nodiscard]] bool ok() const noexcept { return error == ActionError::Ok; }
};

/**
 * @brief Исполнитель пост-действий
 *
 * Не хранит состояния между вызовами execute(): параллельные цепочки могут
 * использовать один экземпляр. Эмулятор ввода создаётся один раз на пачку,
 * до первого действия, если в пачке есть включённая вставка или нажатие.
 */
class ActionExecutor {
public:
  /**
   * @param clipboard Буфер обмена (должен пережить исполнителя)
   * @param audio Источник звука (должен пережить исполнителя)
   */
  ActionExecutor(DelayConfig delays, Catalog catalog,
                 BackendFactory input_backend, ProviderFactory providers,
                 Clipboard &clipboard, AudioSource &audio);

  /// Функция сна для settle и Delay (тесты записывают вызовы)
  using SleepFunc = std::function<void(std::chrono::milliseconds)>;

  void set_sleep_func(SleepFunc func) { sleep_func_ = std::move(func); }

  /// Передаётся каждому создаваемому InputSimulator
  void set_wait_func(InputSimulator::WaitFunc func) {
    wait_func_ = std::move(func);
  }

  /**
   * @brief Выполняет пачку действий
   */
  [[nodiscard]] ActionOutcome execute(std::span<const PostAction> actions,
                                      const ExecutionContext &context) const;

private:
  struct Step {
    ActionError error = ActionError::Ok;
    std::string message;
  };

  /// Состояние одной пачки
  struct Batch {
    const ExecutionContext &context;
    std::unique_ptr<InputSimulator> simulator;
  };

  Step run(const action::PasteClipboard &, Batch &batch) const;
  Step run(const action::SimulateKeystroke &act, Batch &batch) const;
  Step run(const action::Delay &act, Batch &batch) const;
  Step run(const action::CallAi &act, Batch &batch) const;

  /// Эмулятор пачки (создаётся в execute() до первого действия)
  InputSimulator *simulator(Batch &batch, Step &step) const;

  /// @return false если сон прерван остановкой
  bool sleep(std::chrono::milliseconds duration,
             const std::stop_token &stop) const;

  DelayConfig delays_;
  Catalog catalog_;
  BackendFactory input_backend_;
  ProviderFactory providers_;
  Clipboard &clipboard_;
  AudioSource &audio_;
  SleepFunc sleep_func_;
  InputSimulator::WaitFunc wait_func_;
};

} // namespace hotlaunch
