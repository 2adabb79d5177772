/**
 * @file main.cpp
 * @brief Точка входа hotlaunch
 *
 * Глобальные хоткеи, запускающие программы, с цепочкой пост-действий
 * (вставка, нажатия клавиш, паузы, вызовы AI) после запуска.
 *
 * Запуск: hotlaunch [-c config.yaml]
 */

#include "hotlaunch/action_executor.hpp"
#include "hotlaunch/ai_provider.hpp"
#include "hotlaunch/audio_recorder.hpp"
#include "hotlaunch/clipboard_manager.hpp"
#include "hotlaunch/config.hpp"
#include "hotlaunch/hotkey_dispatcher.hpp"
#include "hotlaunch/hotkey_listener.hpp"
#include "hotlaunch/process_launcher.hpp"
#include "hotlaunch/trigger_coordinator.hpp"

#include <X11/Xlib.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <signal.h>
#include <string>
#include <thread>

namespace {

volatile sig_atomic_t g_running = 1;

void signal_handler(int sig) {
  if (sig == SIGINT || sig == SIGTERM) {
    g_running = 0;
  }
}

void print_version() {
  std::cout << "hotlaunch " << hotlaunch::kVersion << " (C++20)\n"
            << "Глобальные хоткеи с пост-действиями для X11\n";
}

void print_usage(const char *argv0) {
  std::cout << "Использование: " << argv0 << " [опции]\n"
            << "\n"
            << "Опции:\n"
            << "  -c, --config FILE  Конфигурационный файл\n"
            << "  -t, --trigger ID   Выполнить цепочку хоткея один раз и выйти\n"
            << "  -h, --help         Показать эту справку\n"
            << "  -v, --version      Показать версию\n"
            << "\n"
            << "Конфигурация: ~/" << hotlaunch::kUserConfigRelPath << " или "
            << hotlaunch::kConfigPath << "\n";
}

const hotlaunch::HotkeyConfig *find_hotkey(const hotlaunch::Config &config,
                                           std::string_view name) {
  for (const auto &hk : config.hotkeys) {
    if (hk.id == name || hk.name == name) {
      return &hk;
    }
  }
  return nullptr;
}

} // namespace

int main(int argc, char *argv[]) {
  std::optional<std::string> config_path;
  std::optional<std::string> trigger_name;

  // Обработка аргументов командной строки
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    }
    if (arg == "-v" || arg == "--version") {
      print_version();
      return 0;
    }
    if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
      config_path = argv[++i];
      continue;
    }
    if ((arg == "-t" || arg == "--trigger") && i + 1 < argc) {
      trigger_name = argv[++i];
      continue;
    }
    std::cerr << "[hotlaunch] Unknown argument: " << arg << "\n";
    print_usage(argv[0]);
    return 2;
  }

  // Буфер обмена и слушатель работают с X из разных потоков
  XInitThreads();

  // Загрузка конфигурации: явный путь строго, иначе best-effort
  hotlaunch::Config config;
  if (config_path) {
    auto out = hotlaunch::load_config_checked(*config_path);
    if (out.result != hotlaunch::ConfigResult::Ok) {
      std::cerr << "[hotlaunch] Error: " << out.error << " ("
                << hotlaunch::to_string(out.result) << ")\n";
      return 1;
    }
    for (const auto &warning : out.warnings) {
      std::cerr << "[hotlaunch] Warning: " << warning << "\n";
    }
    config = std::move(out.config);
  } else {
    config = hotlaunch::load_config();
  }

  const auto &settings = config.settings;

  hotlaunch::PosixProcessLauncher launcher{settings.wait_timeout};
  hotlaunch::ClipboardManager clipboard;
  hotlaunch::ArecordAudioSource audio;

  hotlaunch::ActionExecutor executor{
      settings.delays,
      hotlaunch::Catalog{config.roles, config.providers},
      hotlaunch::uinput_backend_factory(),
      hotlaunch::command_provider_factory(settings.wait_timeout),
      clipboard,
      audio};

  hotlaunch::TriggerCoordinator coordinator{launcher, executor};
  coordinator.set_notify_on_failure(settings.notify_on_failure);

  // Однократный запуск цепочки
  if (trigger_name) {
    const auto *hk = find_hotkey(config, *trigger_name);
    if (!hk) {
      std::cerr << "[hotlaunch] Error: no hotkey '" << *trigger_name << "'\n";
      return 1;
    }
    auto report = coordinator.run(hotlaunch::make_trigger(*hk));
    return report.ok() ? 0 : 1;
  }

  hotlaunch::HotkeyDispatcher dispatcher{coordinator};
  for (const auto &hk : config.hotkeys) {
    if (hk.enabled) {
      dispatcher.register_hotkey(hk.id, hotlaunch::make_trigger(hk));
    }
  }

  if (dispatcher.registered_ids().empty()) {
    std::cerr << "[hotlaunch] Error: no enabled hotkeys in configuration\n";
    return 1;
  }

  hotlaunch::HotkeyListener listener{dispatcher};
  std::string error;
  if (!listener.open(error)) {
    std::cerr << "[hotlaunch] Error: " << error << "\n";
    return 1;
  }

  for (const auto &hk : config.hotkeys) {
    if (!hk.enabled) {
      continue;
    }
    if (!listener.grab(hk.id, hk.binding, error)) {
      std::cerr << "[hotlaunch] Warning: hotkey '" << hk.id
                << "' not registered: " << error << "\n";
      continue;
    }
    std::cerr << "[hotlaunch] " << hk.name << ": "
              << hotlaunch::format_binding(hk.binding) << "\n";
  }

  if (listener.grab_count() == 0) {
    std::cerr << "[hotlaunch] Error: no hotkeys could be grabbed\n";
    return 1;
  }

  // Установка обработчиков сигналов
  struct sigaction sa{};
  sa.sa_handler = signal_handler;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;

  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);

  listener.start();
  std::cerr << "[hotlaunch] Listening for " << listener.grab_count()
            << " hotkeys\n";

  while (g_running) {
    std::this_thread::sleep_for(std::chrono::milliseconds{100});
  }

  std::cerr << "[hotlaunch] Shutting down\n";
  listener.stop();
  dispatcher.shutdown();
  return 0;
}
