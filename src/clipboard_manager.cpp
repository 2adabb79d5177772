/**
 * @file clipboard_manager.cpp
 * @brief Реализация X11 менеджера буфера обмена
 */

#include "hotlaunch/clipboard_manager.hpp"

#include "hotlaunch/process_launcher.hpp"

#include <X11/Xatom.h>
#include <X11/Xlib.h>
#include <poll.h>

#include <cerrno>
#include <iostream>

namespace hotlaunch {

namespace {

/// Размер одного чтения свойства (в 32-битных единицах, 256 KiB)
inline constexpr long kPropertyChunk = 64 * 1024;

/// Таймаут xsel: он форкается и сразу возвращает управление
inline constexpr std::chrono::milliseconds kWriteTimeout{2000};

} // namespace

ClipboardManager::ClipboardManager(std::chrono::milliseconds timeout)
    : timeout_{timeout} {}

ClipboardManager::~ClipboardManager() {
  std::lock_guard lock{mutex_};
  close_locked();
}

bool ClipboardManager::open_locked() {
  if (display_) {
    return true;
  }

  display_ = XOpenDisplay(nullptr);
  if (!display_) {
    std::cerr << "[hotlaunch] clipboard: cannot open X display\n";
    return false;
  }

  // Невидимое окно-получатель для XConvertSelection
  const int screen = DefaultScreen(display_);
  window_ = XCreateSimpleWindow(display_, RootWindow(display_, screen), -10,
                                -10, 1, 1, 0, 0, 0);

  // PropertyNotify нужен для INCR
  XSelectInput(display_, window_, PropertyChangeMask);

  Atom atoms[4];
  char *names[] = {const_cast<char *>("CLIPBOARD"),
                   const_cast<char *>("UTF8_STRING"),
                   const_cast<char *>("HOTLAUNCH_SEL"),
                   const_cast<char *>("INCR")};
  XInternAtoms(display_, names, 4, False, atoms);
  atom_clipboard_ = atoms[0];
  atom_utf8_string_ = atoms[1];
  atom_property_ = atoms[2];
  atom_incr_ = atoms[3];

  return true;
}

void ClipboardManager::close_locked() {
  if (!display_) {
    return;
  }
  if (window_ != None) {
    XDestroyWindow(display_, window_);
    window_ = None;
  }
  XCloseDisplay(display_);
  display_ = nullptr;
}

bool ClipboardManager::wait_for_selection_notify() {
  using clock = std::chrono::steady_clock;
  const auto deadline = clock::now() + timeout_;
  pollfd pfd{ConnectionNumber(display_), POLLIN, 0};

  while (true) {
    XEvent event;
    if (XCheckTypedWindowEvent(display_, window_, SelectionNotify, &event)) {
      return event.xselection.property != None;
    }

    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - clock::now());
    if (left.count() <= 0) {
      return false;
    }

    pfd.revents = 0;
    if (::poll(&pfd, 1, static_cast<int>(left.count())) < 0 && errno != EINTR) {
      return false;
    }
  }
}

bool ClipboardManager::wait_for_incr_chunk() {
  using clock = std::chrono::steady_clock;
  const auto deadline = clock::now() + timeout_;
  pollfd pfd{ConnectionNumber(display_), POLLIN, 0};

  while (true) {
    XEvent event;
    while (XCheckTypedWindowEvent(display_, window_, PropertyNotify, &event)) {
      if (event.xproperty.atom == atom_property_ &&
          event.xproperty.state == PropertyNewValue) {
        return true;
      }
    }

    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - clock::now());
    if (left.count() <= 0) {
      return false;
    }

    pfd.revents = 0;
    if (::poll(&pfd, 1, static_cast<int>(left.count())) < 0 && errno != EINTR) {
      return false;
    }
  }
}

Atom ClipboardManager::take_property(std::string &text) {
  Atom first_type = None;
  long offset = 0;
  while (true) {
    Atom type = None;
    int format = 0;
    unsigned long count = 0;
    unsigned long remaining = 0;
    unsigned char *chunk = nullptr;

    const int rc = XGetWindowProperty(
        display_, window_, atom_property_, offset, kPropertyChunk, False,
        AnyPropertyType, &type, &format, &count, &remaining, &chunk);
    if (rc != Success || chunk == nullptr) {
      break;
    }
    if (offset == 0) {
      first_type = type;
    }

    // UTF8_STRING всегда format 8: count в байтах
    if (format == 8) {
      text.append(reinterpret_cast<const char *>(chunk), count);
    }
    XFree(chunk);

    if (format != 8 || remaining == 0 || count == 0) {
      break;
    }
    offset += static_cast<long>(count / 4);
  }

  // Уведомления о записи этого свойства уже не нужны
  XEvent stale;
  while (XCheckTypedWindowEvent(display_, window_, PropertyNotify, &stale)) {
  }

  // Для INCR удаление свойства сигнализирует владельцу слать порции
  XDeleteProperty(display_, window_, atom_property_);
  XFlush(display_);
  return first_type;
}

bool ClipboardManager::read_incremental(std::string &text) {
  while (true) {
    if (!wait_for_incr_chunk()) {
      std::cerr << "[hotlaunch] clipboard: INCR transfer stalled after "
                << text.size() << " bytes\n";
      return false;
    }

    std::string chunk;
    (void)take_property(chunk);
    if (chunk.empty()) {
      return true;
    }
    text += chunk;
  }
}

std::optional<std::string> ClipboardManager::read_text() {
  std::lock_guard lock{mutex_};

  if (!open_locked()) {
    return std::nullopt;
  }

  // Пустой буфер: у CLIPBOARD нет владельца
  if (XGetSelectionOwner(display_, atom_clipboard_) == None) {
    return std::nullopt;
  }

  XConvertSelection(display_, atom_clipboard_, atom_utf8_string_,
                    atom_property_, window_, CurrentTime);
  XFlush(display_);

  if (!wait_for_selection_notify()) {
    std::cerr << "[hotlaunch] clipboard: owner did not answer in "
              << timeout_.count() << " ms\n";
    return std::nullopt;
  }

  // Свойство читается кусками, пока X не вернёт bytes_after == 0.
  // Большой буфер владелец отдаёт по протоколу INCR.
  std::string text;
  if (take_property(text) == atom_incr_) {
    text.clear();
    if (!read_incremental(text)) {
      return std::nullopt;
    }
  }

  if (text.empty()) {
    return std::nullopt;
  }
  return text;
}

ClipboardResult ClipboardManager::write_text(std::string_view text) {
  std::lock_guard lock{mutex_};

  if (!open_locked()) {
    return ClipboardResult::NoConnection;
  }

  // Владелец selection должен отвечать на SelectionRequest после нашего
  // ухода, поэтому владение передаётся xsel: он форкается и держит буфер.
  auto xsel = resolve_executable("xsel");
  if (!xsel) {
    std::cerr << "[hotlaunch] clipboard: xsel not found in PATH\n";
    return ClipboardResult::ConversionFailed;
  }

  SpawnSpec spec;
  spec.executable = std::move(*xsel);
  spec.arguments = {"--clipboard", "--input"};
  spec.hidden = true;
  spec.discard_output = true;

  auto r = run_and_capture(spec, text, kWriteTimeout);
  if (!r.ok()) {
    std::cerr << "[hotlaunch] clipboard: " << r.error << "\n";
    return r.result == LaunchResult::Timeout ? ClipboardResult::Timeout
                                             : ClipboardResult::ConversionFailed;
  }
  if (r.exit_code != 0) {
    std::cerr << "[hotlaunch] clipboard: xsel exited with code " << r.exit_code
              << "\n";
    return ClipboardResult::ConversionFailed;
  }
  return ClipboardResult::Ok;
}

} // namespace hotlaunch
