/**
 * @file input_simulator.cpp
 * @brief Реализация эмулятора клавиатуры
 */

#include "hotlaunch/input_simulator.hpp"

#include "hotlaunch/keymap.hpp"

#include <fcntl.h>
#include <linux/uinput.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <iterator>
#include <thread>
#include <vector>

namespace hotlaunch {

namespace {

inline constexpr const char *kUinputPath = "/dev/uinput";
inline constexpr const char *kDeviceName = "hotlaunch virtual keyboard";

/// Время, за которое X-сервер/libinput подхватывают новое устройство
inline constexpr std::chrono::milliseconds kDeviceSettle{100};

} // namespace

// ===========================================================================
// UinputBackend
// ===========================================================================

UinputBackend::~UinputBackend() {
  if (fd_ >= 0) {
    ::ioctl(fd_, UI_DEV_DESTROY);
    ::close(fd_);
  }
}

bool UinputBackend::open(std::string &error) {
  if (fd_ >= 0) {
    return true;
  }

  fd_ = ::open(kUinputPath, O_WRONLY | O_CLOEXEC);
  if (fd_ < 0) {
    error = std::string{"cannot open "} + kUinputPath + ": " +
            std::strerror(errno);
    return false;
  }

  auto fail = [this, &error](const char *what) {
    error = std::string{"uinput "} + what + " failed: " + std::strerror(errno);
    ::close(fd_);
    fd_ = -1;
    return false;
  };

  if (::ioctl(fd_, UI_SET_EVBIT, EV_KEY) < 0) {
    return fail("UI_SET_EVBIT(EV_KEY)");
  }
  if (::ioctl(fd_, UI_SET_EVBIT, EV_SYN) < 0) {
    return fail("UI_SET_EVBIT(EV_SYN)");
  }

  // Объявляем все клавиши основной клавиатуры, которые можем отправить
  for (int code = KEY_ESC; code <= KEY_F12; ++code) {
    if (::ioctl(fd_, UI_SET_KEYBIT, code) < 0) {
      return fail("UI_SET_KEYBIT");
    }
  }
  for (int code : {KEY_HOME, KEY_UP, KEY_PAGEUP, KEY_LEFT, KEY_RIGHT, KEY_END,
                   KEY_DOWN, KEY_PAGEDOWN, KEY_INSERT, KEY_DELETE,
                   KEY_RIGHTCTRL, KEY_RIGHTALT, KEY_LEFTMETA, KEY_RIGHTMETA}) {
    if (::ioctl(fd_, UI_SET_KEYBIT, code) < 0) {
      return fail("UI_SET_KEYBIT");
    }
  }

  uinput_setup setup{};
  setup.id.bustype = BUS_VIRTUAL;
  setup.id.vendor = 0x1d6b;
  setup.id.product = 0x0104;
  std::strncpy(setup.name, kDeviceName, UINPUT_MAX_NAME_SIZE - 1);

  if (::ioctl(fd_, UI_DEV_SETUP, &setup) < 0) {
    return fail("UI_DEV_SETUP");
  }
  if (::ioctl(fd_, UI_DEV_CREATE) < 0) {
    return fail("UI_DEV_CREATE");
  }

  std::this_thread::sleep_for(kDeviceSettle);
  return true;
}

bool UinputBackend::write_all(const void *data, std::size_t bytes) {
  const std::uint8_t *p = static_cast<const std::uint8_t *>(data);
  std::size_t remaining = bytes;

  while (remaining > 0) {
    ssize_t n = ::write(fd_, p, remaining);
    if (n > 0) {
      p += static_cast<std::size_t>(n);
      remaining -= static_cast<std::size_t>(n);
      continue;
    }

    if (n < 0 && errno == EINTR) {
      continue;
    }

    const int e = errno;
    std::cerr << "[hotlaunch] uinput: write failed (bytes=" << bytes
              << " remaining=" << remaining << ") errno=" << e << " ("
              << std::strerror(e) << ")\n";
    return false;
  }
  return true;
}

bool UinputBackend::send_key(ScanCode code, KeyState state) {
  if (fd_ < 0) {
    return false;
  }

  input_event evs[2]{};

  evs[0].type = EV_KEY;
  evs[0].code = code;
  evs[0].value = static_cast<std::int32_t>(state);

  evs[1].type = EV_SYN;
  evs[1].code = SYN_REPORT;
  evs[1].value = 0;

  return write_all(evs, sizeof(evs));
}

BackendFactory uinput_backend_factory() {
  return [](std::string &error) -> std::unique_ptr<InputBackend> {
    auto backend = std::make_unique<UinputBackend>();
    if (!backend->open(error)) {
      return nullptr;
    }
    return backend;
  };
}

// ===========================================================================
// InputSimulator
// ===========================================================================

std::unique_ptr<InputSimulator>
InputSimulator::create(const BackendFactory &factory, DelayConfig delays,
                       std::string &error) {
  if (!factory) {
    error = "no input backend configured";
    return nullptr;
  }

  auto backend = factory(error);
  if (!backend) {
    if (error.empty()) {
      error = std::string{to_string(SimResult::InitFailed)};
    }
    return nullptr;
  }

  return std::make_unique<InputSimulator>(std::move(backend), delays);
}

InputSimulator::InputSimulator(std::unique_ptr<InputBackend> backend,
                               DelayConfig delays) noexcept
    : backend_{std::move(backend)}, delays_{delays} {}

SimOutcome InputSimulator::paste() {
  const ScanCode modifier = modifier_scancode(kPasteModifier);
  return send_chord(std::span<const ScanCode>{&modifier, 1}, KEY_V);
}

SimOutcome InputSimulator::simulate_keystroke(const Keystroke &keystroke) {
  std::vector<ScanCode> modifiers;
  modifiers.reserve(keystroke.modifiers.size());

  for (const auto &token : keystroke.modifiers) {
    auto modifier = resolve_modifier(token);
    if (!modifier) {
      return {SimResult::UnknownModifier, "Unknown modifier: " + token};
    }
    modifiers.push_back(modifier_scancode(*modifier));
  }

  auto key = resolve_key(keystroke.key);
  if (!key) {
    return {SimResult::UnknownKey, "Unknown key: " + keystroke.key};
  }

  return send_chord(modifiers, *key);
}

SimOutcome InputSimulator::send_chord(std::span<const ScanCode> modifiers,
                                      ScanCode key) {
  std::size_t pressed = 0;

  for (const auto code : modifiers) {
    if (!backend_->send_key(code, KeyState::Press)) {
      release_pressed(modifiers.first(pressed));
      return {SimResult::SendFailed, "Failed to press modifier"};
    }
    ++pressed;
    delay(delays_.modifier_hold);
  }

  if (!backend_->send_key(key, KeyState::Press)) {
    release_pressed(modifiers);
    return {SimResult::SendFailed, "Failed to press key"};
  }
  delay(delays_.key_hold);
  if (!backend_->send_key(key, KeyState::Release)) {
    release_pressed(modifiers);
    return {SimResult::SendFailed, "Failed to release key"};
  }

  for (auto it = modifiers.rbegin(); it != modifiers.rend(); ++it) {
    delay(delays_.modifier_release);
    if (!backend_->send_key(*it, KeyState::Release)) {
      // Оставшиеся модификаторы отпускаем, чтобы не было залипания
      release_pressed(modifiers.first(static_cast<std::size_t>(
          std::distance(it, modifiers.rend()) - 1)));
      return {SimResult::SendFailed, "Failed to release modifier"};
    }
  }

  return {};
}

void InputSimulator::release_pressed(std::span<const ScanCode> pressed) {
  for (auto it = pressed.rbegin(); it != pressed.rend(); ++it) {
    (void)backend_->send_key(*it, KeyState::Release);
  }
}

void InputSimulator::delay(std::chrono::microseconds us) const {
  if (us.count() <= 0) {
    return;
  }

  if (wait_func_) {
    wait_func_(us);
  } else {
    std::this_thread::sleep_for(us);
  }
}

} // namespace hotlaunch
