/**
 * @file config.hpp
 * @brief Конфигурация hotlaunch
 *
 * Типобезопасная конфигурация с разбором YAML-подобного файла.
 * Все значения имеют разумные дефолты.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "hotlaunch/hotkey_binding.hpp"
#include "hotlaunch/post_action.hpp"
#include "hotlaunch/types.hpp"

namespace hotlaunch {

// ===========================================================================
// Структура конфигурации
// ===========================================================================

/// Настройки задержек эмуляции ввода
struct DelayConfig {
  /// Пауза перед каждым paste/keystroke, чтобы фокус окна успел
  /// стабилизироваться. Синтетический ввод сразу после смены фокуса
  /// часто теряется.
  std::chrono::milliseconds settle{50};

  // Детальные настройки аккорда. Слишком короткое удержание приводит к
  // потере нажатий в медленных приложениях (Electron, Java).
  std::chrono::microseconds key_hold{15000};         // 15ms press -> release
  std::chrono::microseconds modifier_hold{10000};    // 10ms после модификатора
  std::chrono::microseconds modifier_release{5000};  // 5ms после отпускания
};

/// Общие настройки движка
struct EngineSettings {
  DelayConfig delays;

  /// Таймаут ожидания процесса в режиме OnExit. nullopt = ждать бесконечно.
  std::optional<std::chrono::milliseconds> wait_timeout;

  /// Показывать уведомление рабочего стола при сбое цепочки
  bool notify_on_failure = false;
};

/// AI-провайдер: внешняя команда, получающая ввод на stdin
struct ProviderConfig {
  std::string id;
  std::string name;
  std::string command;
  std::string api_key;
  std::string model;
};

enum class OutputFormat { Plain, Markdown };

/// Роль: именованный системный промпт
struct AiRole {
  std::string id;
  std::string name;
  std::string system_prompt;
  OutputFormat output_format = OutputFormat::Plain;
  bool is_builtin = false;
};

/// Конфигурация одного хоткея
struct HotkeyConfig {
  std::string id;
  std::string name;
  HotkeyBinding binding;
  bool enabled = true;
  HotkeyAction action = hotkey_action::LaunchProgram{};
  PostActionsConfig post_actions;
};

/// Полная конфигурация приложения
struct Config {
  EngineSettings settings;
  std::vector<ProviderConfig> providers;
  std::vector<AiRole> roles;
  std::vector<HotkeyConfig> hotkeys;
  std::filesystem::path config_path{std::string{kConfigPath}};
};

// ===========================================================================
// Загрузчик конфигурации
// ===========================================================================

/// Результат загрузки конфигурации из файла.
///
/// В отличие от `load_config()`, это API НЕ делает скрытых фолбэков и
/// позволяет вызывающему коду принять решение.
struct ConfigLoadOutcome {
  Config config;
  ConfigResult result = ConfigResult::Ok;
  std::filesystem::path used_path;
  std::string error;
  std::vector<std::string> warnings;
};

/**
 * @brief Загружает конфигурацию из конкретного файла
 *
 * @param path Абсолютный или относительный путь к конфигу
 * @return ConfigLoadOutcome с кодом результата и сообщением ошибки
 */
[[nodiscard]] ConfigLoadOutcome load_config_checked(std::filesystem::path path);

/**
 * @brief Разбирает конфигурацию из потока
 *
 * Используется load_config_checked() и тестами.
 */
[[nodiscard]] ConfigLoadOutcome parse_config(std::istream &in);

/**
 * @brief Загружает конфигурацию (best-effort)
 *
 * @param path Путь к конфигурационному файлу
 * @return Config с загруженными или дефолтными значениями
 *
 * Если запрошен системный путь и существует пользовательский конфиг,
 * используется пользовательский.
 */
[[nodiscard]] Config load_config(std::string_view path = kConfigPath);

/**
 * @brief Парсит значение задержки в миллисекундах
 * @return Значение или std::nullopt (отрицательные и нечисловые значения)
 */
[[nodiscard]] std::optional<std::chrono::milliseconds>
parse_delay_ms(std::string_view value);

/**
 * @brief Разбирает строку пост-действия ("paste", "keystroke ctrl+s",
 * "delay 500", "ai beautify clipboard gemini")
 */
[[nodiscard]] std::optional<PostActionType>
parse_post_action(std::string_view value);

/**
 * @brief Валидирует конфигурацию
 * @return Пустая строка если всё корректно, иначе описание первой ошибки
 */
[[nodiscard]] std::string validate_config(const Config &config);

/**
 * @brief Строит полезную нагрузку срабатывания для хоткея
 */
[[nodiscard]] Trigger make_trigger(const HotkeyConfig &hotkey);

} // namespace hotlaunch
