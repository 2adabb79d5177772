/**
 * @file test_support.hpp
 * @brief CHECK и фейки коллабораторов для тестов движка
 */

#pragma once

#include "hotlaunch/action_executor.hpp"
#include "hotlaunch/ai_provider.hpp"
#include "hotlaunch/audio_recorder.hpp"
#include "hotlaunch/clipboard_manager.hpp"
#include "hotlaunch/input_simulator.hpp"
#include "hotlaunch/process_launcher.hpp"

#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace hotlaunch::test {

[[noreturn]] inline void test_fail(const char *expr, const char *file,
                                   int line) {
  std::cerr << "TEST FAIL: " << expr << " (" << file << ":" << line << ")\n";
  std::abort();
}

#define CHECK(expr)                                                            \
  do {                                                                         \
    if (!(expr)) {                                                             \
      ::hotlaunch::test::test_fail(#expr, __FILE__, __LINE__);                 \
    }                                                                          \
  } while (0)

// ===========================================================================
// Ввод
// ===========================================================================

struct KeyEvent {
  ScanCode code = 0;
  KeyState state = KeyState::Release;

  bool operator==(const KeyEvent &) const = default;
};

inline KeyEvent down(ScanCode code) { return {code, KeyState::Press}; }
inline KeyEvent up(ScanCode code) { return {code, KeyState::Release}; }

/// Общий журнал событий всех бэкендов одной фабрики
struct KeyLog {
  std::mutex mutex;
  std::vector<KeyEvent> events;
  std::size_t attempts = 0;
  std::size_t backends_created = 0;

  /// Номер попытки send_key (с нуля), которая вернёт false
  std::size_t fail_at = std::numeric_limits<std::size_t>::max();

  std::vector<KeyEvent> snapshot() {
    std::lock_guard lock{mutex};
    return events;
  }

  /// Сколько раз была нажата клавиша
  std::size_t presses(ScanCode code) {
    std::lock_guard lock{mutex};
    std::size_t n = 0;
    for (const auto &e : events) {
      if (e.code == code && e.state == KeyState::Press) {
        ++n;
      }
    }
    return n;
  }
};

class RecordingBackend final : public InputBackend {
public:
  explicit RecordingBackend(std::shared_ptr<KeyLog> log)
      : log_{std::move(log)} {}

  bool send_key(ScanCode code, KeyState state) override {
    std::lock_guard lock{log_->mutex};
    if (log_->attempts++ == log_->fail_at) {
      return false;
    }
    log_->events.push_back({code, state});
    return true;
  }

private:
  std::shared_ptr<KeyLog> log_;
};

inline BackendFactory recording_factory(std::shared_ptr<KeyLog> log) {
  return [log](std::string &) -> std::unique_ptr<InputBackend> {
    {
      std::lock_guard lock{log->mutex};
      ++log->backends_created;
    }
    return std::make_unique<RecordingBackend>(log);
  };
}

inline BackendFactory failing_factory() {
  return [](std::string &error) -> std::unique_ptr<InputBackend> {
    error = "cannot open /dev/uinput: Permission denied";
    return nullptr;
  };
}

inline void no_wait(std::chrono::microseconds) {}

// ===========================================================================
// Запуск программ
// ===========================================================================

class FakeLauncher final : public ProcessLauncher {
public:
  LaunchOutcome launch_detached(const ProgramConfig &config) override {
    std::lock_guard lock{mutex_};
    detached.push_back(config.path);
    return detached_result;
  }

  LaunchOutcome launch_and_wait(const ProgramConfig &config,
                                std::stop_token) override {
    std::lock_guard lock{mutex_};
    waited.push_back(config.path);
    return wait_result;
  }

  std::vector<std::string> detached;
  std::vector<std::string> waited;
  LaunchOutcome detached_result;
  LaunchOutcome wait_result;

private:
  std::mutex mutex_;
};

// ===========================================================================
// Буфер обмена, звук, AI
// ===========================================================================

class FakeClipboard final : public Clipboard {
public:
  std::optional<std::string> read_text() override {
    std::lock_guard lock{mutex_};
    return content;
  }

  ClipboardResult write_text(std::string_view text) override {
    std::lock_guard lock{mutex_};
    if (write_result != ClipboardResult::Ok) {
      return write_result;
    }
    content = std::string{text};
    writes.emplace_back(text);
    return ClipboardResult::Ok;
  }

  std::optional<std::string> content;
  std::vector<std::string> writes;
  ClipboardResult write_result = ClipboardResult::Ok;

private:
  std::mutex mutex_;
};

class FakeAudio final : public AudioSource {
public:
  AudioOutcome record(std::uint64_t max_duration_ms,
                      AudioFormat format) override {
    recorded_ms.push_back(max_duration_ms);
    if (!available) {
      return {AudioResult::RecorderMissing, {}, {}, "arecord not found"};
    }
    return {AudioResult::Ok, "PCM", mime_type_for(format), {}};
  }

  bool available = true;
  std::vector<std::uint64_t> recorded_ms;
};

/// Что увидел провайдер
struct AiCallRecord {
  std::string provider_id;
  std::string system_prompt;
  std::string input;
  std::string mime_type;
};

struct AiLog {
  std::vector<AiCallRecord> calls;
  AiResult result = AiResult::Ok;
};

/// Отвечает "AI:" + ввод
class FakeAiProvider final : public AiProvider {
public:
  FakeAiProvider(std::string id, std::shared_ptr<AiLog> log)
      : id_{std::move(id)}, log_{std::move(log)} {}

  AiOutcome send_text(std::string_view system_prompt,
                      std::string_view input) override {
    return respond(system_prompt, input, "text/plain");
  }

  AiOutcome send_audio(std::string_view system_prompt, std::string_view audio,
                       std::string_view mime_type) override {
    return respond(system_prompt, audio, mime_type);
  }

private:
  AiOutcome respond(std::string_view prompt, std::string_view input,
                    std::string_view mime) {
    log_->calls.push_back({id_, std::string{prompt}, std::string{input},
                           std::string{mime}});
    if (log_->result != AiResult::Ok) {
      return {log_->result, {}, "provider error"};
    }
    return {AiResult::Ok, "AI:" + std::string{input}, {}};
  }

  std::string id_;
  std::shared_ptr<AiLog> log_;
};

inline ProviderFactory fake_provider_factory(std::shared_ptr<AiLog> log) {
  return [log](const ProviderConfig &cfg) -> std::unique_ptr<AiProvider> {
    return std::make_unique<FakeAiProvider>(cfg.id, log);
  };
}

// ===========================================================================
// Построители
// ===========================================================================

inline PostAction make_action(std::string id, PostActionType type,
                              bool enabled = true) {
  return PostAction{std::move(id), std::move(type), enabled};
}

inline PostActionType keystroke(std::vector<std::string> modifiers,
                                std::string key) {
  return action::SimulateKeystroke{
      Keystroke{std::move(modifiers), std::move(key)}};
}

} // namespace hotlaunch::test
