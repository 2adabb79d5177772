/**
 * @file hotkey_listener.cpp
 * @brief Реализация слушателя глобальных хоткеев X11
 */

#include "hotlaunch/hotkey_listener.hpp"

#include "hotlaunch/hotkey_dispatcher.hpp"
#include "hotlaunch/keymap.hpp"

#include <X11/XKBlib.h>
#include <X11/Xproto.h>
#include <X11/Xutil.h>
#include <poll.h>

#include <array>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <iostream>

namespace hotlaunch {

namespace {

struct KeysymNameMapping {
  std::string_view name;
  const char *keysym;
};

/// Имена клавиш конфига (в верхнем регистре) -> имена keysym X11
inline constexpr std::array kKeysymNames = std::to_array<KeysymNameMapping>({
    {"ENTER", "Return"},     {"RETURN", "Return"},     {"TAB", "Tab"},
    {"SPACE", "space"},      {"BACKSPACE", "BackSpace"}, {"DELETE", "Delete"},
    {"ESCAPE", "Escape"},    {"ESC", "Escape"},        {"UP", "Up"},
    {"ARROWUP", "Up"},       {"DOWN", "Down"},         {"ARROWDOWN", "Down"},
    {"LEFT", "Left"},        {"ARROWLEFT", "Left"},    {"RIGHT", "Right"},
    {"ARROWRIGHT", "Right"}, {"HOME", "Home"},         {"END", "End"},
    {"PAGEUP", "Prior"},     {"PAGEDOWN", "Next"},     {"INSERT", "Insert"},
});

/// Игнорируемые при сравнении состояния: CapsLock и NumLock (Mod2)
inline constexpr unsigned int kLockMasks = LockMask | Mod2Mask;

inline constexpr std::array<unsigned int, 4> kLockVariants = {
    0, LockMask, Mod2Mask, LockMask | Mod2Mask};

/// Время ожидания событий между проверками stop_token
inline constexpr int kPollTimeoutMs = 100;

/// BadAccess от XGrabKey приходит асинхронно, флаг проверяется после XSync
std::atomic<bool> g_grab_failed{false};

int x_error_handler(Display *, XErrorEvent *ee) {
  if (ee->request_code == X_GrabKey && ee->error_code == BadAccess) {
    g_grab_failed.store(true);
    return 0;
  }
  std::cerr << "[hotlaunch] X11 error: request_code="
            << static_cast<int>(ee->request_code)
            << " error_code=" << static_cast<int>(ee->error_code) << "\n";
  return 0;
}

} // namespace

std::optional<unsigned int> x11_modifier_mask(const HotkeyBinding &binding) {
  unsigned int mask = 0;
  for (const auto &token : binding.modifiers) {
    auto modifier = resolve_modifier(token);
    if (!modifier) {
      return std::nullopt;
    }
    switch (*modifier) {
    case ModifierKey::Ctrl:
      mask |= ControlMask;
      break;
    case ModifierKey::Alt:
      mask |= Mod1Mask;
      break;
    case ModifierKey::Shift:
      mask |= ShiftMask;
      break;
    case ModifierKey::Meta:
      mask |= Mod4Mask;
      break;
    }
  }
  return mask;
}

KeySym x11_keysym(std::string_view key) {
  if (key.empty()) {
    return NoSymbol;
  }

  // Latin-1 keysym совпадает с кодом символа
  if (key.size() == 1) {
    const auto c = static_cast<unsigned char>(
        std::tolower(static_cast<unsigned char>(key.front())));
    if (c >= 0x20 && c < 0x7f) {
      return static_cast<KeySym>(c);
    }
    return NoSymbol;
  }

  const std::string upper = to_upper_ascii(key);
  for (const auto &mapping : kKeysymNames) {
    if (mapping.name == upper) {
      return XStringToKeysym(mapping.keysym);
    }
  }

  // F1..F24
  if (upper.front() == 'F') {
    return XStringToKeysym(upper.c_str());
  }
  // Прочие имена X11 как есть
  const std::string name{key};
  return XStringToKeysym(name.c_str());
}

HotkeyListener::HotkeyListener(HotkeyDispatcher &dispatcher)
    : dispatcher_{dispatcher} {}

HotkeyListener::~HotkeyListener() {
  stop();
  if (display_) {
    XCloseDisplay(display_);
    display_ = nullptr;
  }
}

bool HotkeyListener::open(std::string &error) {
  if (display_) {
    return true;
  }

  XSetErrorHandler(x_error_handler);

  display_ = XOpenDisplay(nullptr);
  if (!display_) {
    error = "cannot open X display (is DISPLAY set?)";
    return false;
  }

  root_ = DefaultRootWindow(display_);
  XSelectInput(display_, root_, KeyPressMask | KeyReleaseMask);

  // Автоповтор без синтетических KeyRelease: удержание = одно срабатывание
  Bool supported = False;
  XkbSetDetectableAutoRepeat(display_, True, &supported);
  if (!supported) {
    std::cerr << "[hotlaunch] Warning: detectable auto-repeat unsupported\n";
  }
  return true;
}

bool HotkeyListener::grab(const std::string &id, const HotkeyBinding &binding,
                          std::string &error) {
  if (!display_) {
    error = "X display is not open";
    return false;
  }

  auto modifiers = x11_modifier_mask(binding);
  if (!modifiers) {
    error = "unknown modifier in '" + format_binding(binding) + "'";
    return false;
  }

  const KeySym keysym = x11_keysym(binding.key);
  const KeyCode keycode =
      keysym == NoSymbol ? 0 : XKeysymToKeycode(display_, keysym);
  if (keycode == 0) {
    error = "unknown key '" + binding.key + "'";
    return false;
  }

  g_grab_failed.store(false);
  for (const auto variant : kLockVariants) {
    XGrabKey(display_, keycode, *modifiers | variant, root_, True,
             GrabModeAsync, GrabModeAsync);
  }
  XSync(display_, False);

  if (g_grab_failed.load()) {
    for (const auto variant : kLockVariants) {
      XUngrabKey(display_, keycode, *modifiers | variant, root_);
    }
    XSync(display_, False);
    error = "'" + format_binding(binding) +
            "' is already grabbed by another client";
    return false;
  }

  grabs_.push_back(Grab{id, keycode, *modifiers, false});
  return true;
}

void HotkeyListener::start() {
  if (!display_ || thread_.joinable()) {
    return;
  }
  thread_ = std::jthread([this](std::stop_token st) { run(st); });
}

void HotkeyListener::stop() {
  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
  }
  ungrab_all();
}

void HotkeyListener::run(std::stop_token st) {
  pollfd pfd{ConnectionNumber(display_), POLLIN, 0};

  while (!st.stop_requested()) {
    while (XPending(display_) > 0) {
      XEvent event;
      XNextEvent(display_, &event);
      handle_event(event);
    }

    pfd.revents = 0;
    if (::poll(&pfd, 1, kPollTimeoutMs) < 0 && errno != EINTR) {
      std::cerr << "[hotlaunch] X11 connection poll failed\n";
      break;
    }
  }
}

void HotkeyListener::handle_event(const XEvent &event) {
  if (event.type != KeyPress && event.type != KeyRelease) {
    return;
  }

  const auto keycode = static_cast<KeyCode>(event.xkey.keycode);
  const unsigned int state = event.xkey.state & ~kLockMasks;

  for (auto &g : grabs_) {
    if (g.keycode != keycode) {
      continue;
    }

    if (event.type == KeyRelease) {
      g.held = false;
      continue;
    }

    if (g.modifiers == state && !g.held) {
      g.held = true;
      dispatcher_.fire(g.id);
    }
  }
}

void HotkeyListener::ungrab_all() {
  if (!display_ || grabs_.empty()) {
    return;
  }
  for (const auto &g : grabs_) {
    for (const auto variant : kLockVariants) {
      XUngrabKey(display_, g.keycode, g.modifiers | variant, root_);
    }
  }
  XSync(display_, False);
  grabs_.clear();
}

} // namespace hotlaunch
