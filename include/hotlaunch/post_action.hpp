/**
 * @file post_action.hpp
 * @brief Модель данных: программа, пост-действия, триггеры
 *
 * Неизменяемые значения, которые собирает слой конфигурации и передаёт
 * в движок на время одного срабатывания хоткея. Варианты действий и
 * триггеров: закрытые std::variant, диспетчеризация через std::visit.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace hotlaunch {

// ===========================================================================
// Запуск программы
// ===========================================================================

/// Конфигурация запуска внешней программы
struct ProgramConfig {
  std::string path;
  std::vector<std::string> arguments;
  std::optional<std::string> working_directory;
  bool hidden = false;
};

// ===========================================================================
// Комбинации клавиш
// ===========================================================================

/// Комбинация для эмуляции. Токены разрешаются при выполнении.
struct Keystroke {
  std::vector<std::string> modifiers;
  std::string key;
};

// ===========================================================================
// Источник входных данных для AI
// ===========================================================================

enum class AudioFormat { Wav, Raw };

namespace input_source {

/// Текст из буфера обмена
struct Clipboard {};

/// Запись с микрофона
struct RecordAudio {
  std::uint64_t max_duration_ms = 5000;
  AudioFormat format = AudioFormat::Wav;
};

/// stdout программы, запущенной в режиме OnExit
struct ProcessOutput {};

} // namespace input_source

using AiInputSource =
    std::variant<input_source::Clipboard, input_source::RecordAudio,
                 input_source::ProcessOutput>;

// ===========================================================================
// Типы пост-действий
// ===========================================================================

namespace action {

/// Ctrl+V (Cmd+V на macOS)
struct PasteClipboard {};

struct SimulateKeystroke {
  Keystroke keystroke;
};

struct Delay {
  std::uint64_t delay_ms = 0;
};

/// Вызов AI, результат записывается в буфер обмена
struct CallAi {
  std::string role_id;
  AiInputSource input_source;
  std::optional<std::string> provider_id;
};

} // namespace action

using PostActionType =
    std::variant<action::PasteClipboard, action::SimulateKeystroke,
                 action::Delay, action::CallAi>;

struct PostAction {
  std::string id;
  PostActionType action_type;
  bool enabled = true;
};

// ===========================================================================
// Триггер пост-действий
// ===========================================================================

namespace trigger {

/// Ждать завершения процесса, продолжать только при коде 0
struct OnExit {};

/// Запустить без ожидания, выждать delay_ms и продолжить безусловно
struct AfterDelay {
  std::uint64_t delay_ms = 0;
};

} // namespace trigger

using PostActionTrigger = std::variant<trigger::OnExit, trigger::AfterDelay>;

struct PostActionsConfig {
  bool enabled = false;
  PostActionTrigger trigger = trigger::OnExit{};
  std::vector<PostAction> actions;
};

/// Пустой или выключенный список эквивалентен отсутствию пост-действий
[[nodiscard]] inline bool has_post_actions(const PostActionsConfig &cfg) {
  return cfg.enabled && !cfg.actions.empty();
}

// ===========================================================================
// Действие хоткея и полезная нагрузка срабатывания
// ===========================================================================

namespace hotkey_action {

struct LaunchProgram {
  ProgramConfig program;
};

struct AiCall {
  std::string role_id;
  AiInputSource input_source;
  std::optional<std::string> provider_id;
};

} // namespace hotkey_action

using HotkeyAction =
    std::variant<hotkey_action::LaunchProgram, hotkey_action::AiCall>;

/// То, что слой хоткеев передаёт движку при каждом нажатии
struct Trigger {
  std::string display_name;
  HotkeyAction action;
  PostActionsConfig post_actions;
};

} // namespace hotlaunch
