/**
 * @file hotkey_listener.hpp
 * @brief Глобальные хоткеи X11 (XGrabKey на корневом окне)
 */

#pragma once

#include <X11/Xlib.h>

#include <cstddef>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "hotlaunch/hotkey_binding.hpp"

namespace hotlaunch {

class HotkeyDispatcher;

/// Маска модификаторов X11 для привязки. nullopt при неизвестном модификаторе.
[[nodiscard]] std::optional<unsigned int>
x11_modifier_mask(const HotkeyBinding &binding);

/// Keysym для клавиши привязки ("enter" -> XK_Return). NoSymbol если неизвестна.
[[nodiscard]] KeySym x11_keysym(std::string_view key);

/**
 * @brief Слушатель глобальных хоткеев
 *
 * Все grab() выполняются до start(); после запуска соединение с X
 * принадлежит потоку слушателя. На KeyPress вызывается dispatcher.fire(id).
 */
class HotkeyListener {
public:
  explicit HotkeyListener(HotkeyDispatcher &dispatcher);
  ~HotkeyListener();

  HotkeyListener(const HotkeyListener &) = delete;
  HotkeyListener &operator=(const HotkeyListener &) = delete;

  /**
   * @brief Открывает соединение с X сервером
   * @return false если DISPLAY недоступен
   */
  bool open(std::string &error);

  /**
   * @brief Захватывает сочетание для хоткея
   *
   * Захватываются четыре варианта с NumLock/CapsLock.
   * @return false если клавиша неизвестна или сочетание занято
   */
  bool grab(const std::string &id, const HotkeyBinding &binding,
            std::string &error);

  /// Запускает поток обработки событий
  void start();

  /// Останавливает поток и снимает захваты
  void stop();

  [[nodiscard]] std::size_t grab_count() const noexcept {
    return grabs_.size();
  }

private:
  struct Grab {
    std::string id;
    KeyCode keycode = 0;
    unsigned int modifiers = 0;
    bool held = false;
  };

  void run(std::stop_token st);

  void handle_event(const XEvent &event);

  void ungrab_all();

  HotkeyDispatcher &dispatcher_;
  Display *display_ = nullptr;
  Window root_ = None;
  std::vector<Grab> grabs_;
  std::jthread thread_;
};

} // namespace hotlaunch
