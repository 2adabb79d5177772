/**
 * @file types.hpp
 * @brief Базовые типы и коды результатов для hotlaunch
 *
 * Фундаментальные типы, общие для всех модулей движка пост-действий.
 * Ошибки не пробрасываются исключениями: каждая операция возвращает
 * код результата (enum) и, при необходимости, текст ошибки.
 */

#pragma once

#include <linux/input.h>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stop_token>
#include <string_view>

namespace hotlaunch {

// ===========================================================================
// Константы
// ===========================================================================

/// Путь к системному конфигурационному файлу
inline constexpr std::string_view kConfigPath = "/etc/hotlaunch/config.yaml";

/// Путь к пользовательскому конфигу (относительно $HOME)
inline constexpr std::string_view kUserConfigRelPath =
    ".config/hotlaunch/config.yaml";

/// Версия для --version
inline constexpr std::string_view kVersion = "1.0.0";

// ===========================================================================
// Типы для работы с событиями ввода
// ===========================================================================

/// Значение события клавиши
enum class KeyState : std::int32_t { Release = 0, Press = 1, Repeat = 2 };

/// Скан-код клавиши (обёртка над linux/input.h константами)
using ScanCode = std::uint16_t;

/// Логический модификатор (без деления на левый/правый)
enum class ModifierKey { Ctrl, Alt, Shift, Meta };

// ===========================================================================
// Типы результатов операций
// ===========================================================================

/// Результат парсинга конфигурации
enum class ConfigResult { Ok, FileNotFound, ParseError, InvalidValue };

/// Результат операции с буфером обмена
enum class ClipboardResult {
  Ok,
  NoConnection,
  NoSelection,
  ConversionFailed,
  Timeout
};

/// Результат запуска внешней программы
enum class LaunchResult { Ok, NotFound, SpawnFailed, Timeout, Interrupted };

/// Результат эмуляции ввода
enum class SimResult {
  Ok,
  InitFailed,
  UnknownKey,
  UnknownModifier,
  SendFailed
};

/// Результат вызова AI-провайдера
enum class AiResult { Ok, RequestFailed, EmptyResponse };

/// Результат записи звука
enum class AudioResult { Ok, RecorderMissing, CaptureFailed };

/// Ошибка выполнения пост-действия (первая ошибка прерывает цепочку)
enum class ActionError {
  Ok,
  SimulatorInit,
  UnknownKey,
  UnknownModifier,
  InputSendFailed,
  RoleNotFound,
  ProviderNotFound,
  ClipboardRead,
  ClipboardWrite,
  AudioCapture,
  NoProcessOutput,
  AiRequest,
  Interrupted
};

[[nodiscard]] constexpr std::string_view to_string(ConfigResult r) noexcept {
  switch (r) {
  case ConfigResult::Ok:
    return "ok";
  case ConfigResult::FileNotFound:
    return "file not found";
  case ConfigResult::ParseError:
    return "parse error";
  case ConfigResult::InvalidValue:
    return "invalid value";
  }
  return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(ClipboardResult r) noexcept {
  switch (r) {
  case ClipboardResult::Ok:
    return "ok";
  case ClipboardResult::NoConnection:
    return "no X connection";
  case ClipboardResult::NoSelection:
    return "selection is empty";
  case ClipboardResult::ConversionFailed:
    return "conversion failed";
  case ClipboardResult::Timeout:
    return "timeout";
  }
  return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(LaunchResult r) noexcept {
  switch (r) {
  case LaunchResult::Ok:
    return "ok";
  case LaunchResult::NotFound:
    return "program not found";
  case LaunchResult::SpawnFailed:
    return "spawn failed";
  case LaunchResult::Timeout:
    return "timeout";
  case LaunchResult::Interrupted:
    return "wait interrupted";
  }
  return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(SimResult r) noexcept {
  switch (r) {
  case SimResult::Ok:
    return "ok";
  case SimResult::InitFailed:
    return "input backend unavailable";
  case SimResult::UnknownKey:
    return "unknown key";
  case SimResult::UnknownModifier:
    return "unknown modifier";
  case SimResult::SendFailed:
    return "input send failed";
  }
  return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(AiResult r) noexcept {
  switch (r) {
  case AiResult::Ok:
    return "ok";
  case AiResult::RequestFailed:
    return "request failed";
  case AiResult::EmptyResponse:
    return "empty response";
  }
  return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(AudioResult r) noexcept {
  switch (r) {
  case AudioResult::Ok:
    return "ok";
  case AudioResult::RecorderMissing:
    return "recorder not found";
  case AudioResult::CaptureFailed:
    return "capture failed";
  }
  return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(ActionError e) noexcept {
  switch (e) {
  case ActionError::Ok:
    return "ok";
  case ActionError::SimulatorInit:
    return "input simulator init failed";
  case ActionError::UnknownKey:
    return "unknown key";
  case ActionError::UnknownModifier:
    return "unknown modifier";
  case ActionError::InputSendFailed:
    return "input send failed";
  case ActionError::RoleNotFound:
    return "role not found";
  case ActionError::ProviderNotFound:
    return "provider not found";
  case ActionError::ClipboardRead:
    return "clipboard read failed";
  case ActionError::ClipboardWrite:
    return "clipboard write failed";
  case ActionError::AudioCapture:
    return "audio capture failed";
  case ActionError::NoProcessOutput:
    return "no process output";
  case ActionError::AiRequest:
    return "AI request failed";
  case ActionError::Interrupted:
    return "interrupted";
  }
  return "unknown";
}

// ===========================================================================
// Inline утилиты
// ===========================================================================

/// Конвертация миллисекунд из конфига в std::chrono.
/// Значения за пределами milliseconds::max() насыщаются, а не заворачиваются.
[[nodiscard]] constexpr std::chrono::milliseconds
ms(std::uint64_t value) noexcept {
  constexpr auto kMax = std::chrono::milliseconds::max().count();
  if (value > static_cast<std::uint64_t>(kMax)) {
    return std::chrono::milliseconds::max();
  }
  return std::chrono::milliseconds{static_cast<std::int64_t>(value)};
}

/**
 * @brief Сон, который прерывается запросом остановки
 * @return false если stop был запрошен до окончания сна
 */
inline bool sleep_unless_stopped(std::chrono::milliseconds duration,
                                 std::stop_token stop) {
  // wait_for прибавляет интервал к now() в наносекундах: длинный сон
  // режется на куски, чтобы не переполнить time_point
  constexpr std::chrono::milliseconds kSlice = std::chrono::hours{24};

  std::mutex mutex;
  std::condition_variable_any cv;
  std::unique_lock lock{mutex};

  while (duration.count() > 0) {
    const auto slice = std::min(duration, kSlice);
    (void)cv.wait_for(lock, stop, slice, [] { return false; });
    if (stop.stop_requested()) {
      return false;
    }
    duration -= slice;
  }
  return !stop.stop_requested();
}

} // namespace hotlaunch
