/**
 * @file clipboard_manager.hpp
 * @brief Буфер обмена: интерфейс и реализация через X11
 *
 * Чтение идёт напрямую через X11 selections, запись через xsel.
 */

#pragma once

#include <X11/Xlib.h>

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "hotlaunch/types.hpp"

namespace hotlaunch {

/**
 * @brief Текстовый буфер обмена (CLIPBOARD)
 */
class Clipboard {
public:
  virtual ~Clipboard() = default;

  /**
   * @brief Читает текст
   * @return Текст или nullopt при ошибке/таймауте/пустом буфере
   */
  [[nodiscard]] virtual std::optional<std::string> read_text() = 0;

  /// Записывает текст
  virtual ClipboardResult write_text(std::string_view text) = 0;
};

/**
 * @brief Нативный менеджер буфера обмена X11
 *
 * Одно соединение с X сервером на процесс, открывается лениво при первом
 * обращении. Цепочки выполняются параллельно, поэтому доступ к соединению
 * сериализован мьютексом.
 */
class ClipboardManager final : public Clipboard {
public:
  /**
   * @param timeout Таймаут ожидания selection
   */
  explicit ClipboardManager(
      std::chrono::milliseconds timeout = std::chrono::milliseconds{500});

  ~ClipboardManager() override;

  // Запрет копирования (X11 ресурсы)
  ClipboardManager(const ClipboardManager &) = delete;
  ClipboardManager &operator=(const ClipboardManager &) = delete;

  [[nodiscard]] std::optional<std::string> read_text() override;

  ClipboardResult write_text(std::string_view text) override;

private:
  /// Открывает соединение (вызывается под mutex_)
  bool open_locked();

  void close_locked();

  /// Ожидание SelectionNotify. false при таймауте или отказе владельца.
  bool wait_for_selection_notify();

  /// Ожидание следующей порции INCR (PropertyNotify/NewValue)
  bool wait_for_incr_chunk();

  /**
   * @brief Дочитывает свойство в text и удаляет его
   * @return Тип свойства (INCR для инкрементальной передачи)
   */
  Atom take_property(std::string &text);

  /// Инкрементальная передача: порции до пустого свойства
  bool read_incremental(std::string &text);

  std::mutex mutex_;
  std::chrono::milliseconds timeout_;

  Display *display_ = nullptr;
  Window window_ = None;

  // X11 атомы (кэшируются после открытия)
  Atom atom_clipboard_ = None;
  Atom atom_utf8_string_ = None;
  Atom atom_property_ = None;
  Atom atom_incr_ = None;
};

} // namespace hotlaunch
