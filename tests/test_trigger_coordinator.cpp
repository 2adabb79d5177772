#include "hotlaunch/trigger_coordinator.hpp"

#include "test_support.hpp"

#include <linux/input.h>

#include <chrono>
#include <iostream>
#include <sstream>
#include <stop_token>
#include <thread>
#include <vector>

namespace {

using hotlaunch::ChainState;
using hotlaunch::LaunchResult;
using hotlaunch::PostAction;
using hotlaunch::Trigger;
using hotlaunch::TriggerCoordinator;
using hotlaunch::action::PasteClipboard;
using hotlaunch::test::FakeLauncher;
using hotlaunch::test::KeyLog;
using hotlaunch::test::make_action;

using ms = std::chrono::milliseconds;
using Clock = std::chrono::steady_clock;

struct Harness {
  std::shared_ptr<KeyLog> keys = std::make_shared<KeyLog>();
  std::shared_ptr<hotlaunch::test::AiLog> ai =
      std::make_shared<hotlaunch::test::AiLog>();
  hotlaunch::test::FakeClipboard clipboard;
  hotlaunch::test::FakeAudio audio;
  FakeLauncher launcher;
  std::ostringstream log;

  hotlaunch::ActionExecutor executor{
      hotlaunch::DelayConfig{},
      hotlaunch::Catalog{{}, {{"p", "P", "cmd", "", ""}}},
      hotlaunch::test::recording_factory(keys),
      hotlaunch::test::fake_provider_factory(ai),
      clipboard,
      audio};

  Harness() {
    executor.set_wait_func(hotlaunch::test::no_wait);
    executor.set_sleep_func([](ms) {});
  }

  /// Сколько строк лога содержат фрагмент
  std::size_t log_count(std::string_view needle) const {
    std::istringstream in{log.str()};
    std::size_t n = 0;
    for (std::string line; std::getline(in, line);) {
      if (line.find(needle) != std::string::npos) {
        ++n;
      }
    }
    return n;
  }
};

Trigger program_trigger(std::string name, std::string path) {
  Trigger t;
  t.display_name = std::move(name);
  hotlaunch::ProgramConfig program;
  program.path = std::move(path);
  t.action = hotlaunch::hotkey_action::LaunchProgram{std::move(program)};
  return t;
}

/// "Convert": OnExit, затем вставка
Trigger convert_trigger() {
  auto t = program_trigger("Convert", "/opt/convert");
  t.post_actions.enabled = true;
  t.post_actions.trigger = hotlaunch::trigger::OnExit{};
  t.post_actions.actions = {make_action("convert-1", PasteClipboard{})};
  return t;
}

void test_disabled_post_actions_only_launch() {
  Harness h;
  TriggerCoordinator coordinator{h.launcher, h.executor, h.log};

  auto t = convert_trigger();
  t.post_actions.enabled = false;

  auto report = coordinator.run(t);
  CHECK(report.ok());
  const std::vector<ChainState> expected{ChainState::Idle, ChainState::Launching,
                                         ChainState::Done};
  CHECK(report.states == expected);
  CHECK(h.launcher.detached.size() == 1);
  CHECK(h.launcher.waited.empty());
  CHECK(!report.actions.has_value());
  CHECK(h.keys->snapshot().empty());

  // Включённый, но пустой список эквивалентен выключенному
  t.post_actions.enabled = true;
  t.post_actions.actions.clear();
  report = coordinator.run(t);
  CHECK(report.states == expected);
  CHECK(h.launcher.detached.size() == 2);
  CHECK(h.launcher.waited.empty());
}

void test_on_exit_success_pastes_once() {
  Harness h;
  h.launcher.wait_result = {LaunchResult::Ok, 0, "converted", {}};
  TriggerCoordinator coordinator{h.launcher, h.executor, h.log};

  auto report = coordinator.run(convert_trigger());
  CHECK(report.ok());
  const std::vector<ChainState> expected{
      ChainState::Idle, ChainState::Launching, ChainState::Waiting,
      ChainState::ExecutingActions, ChainState::Done};
  CHECK(report.states == expected);
  CHECK(report.exit_code == 0);
  CHECK(report.actions && report.actions->executed == 1);

  CHECK(h.launcher.waited.size() == 1);
  CHECK(h.launcher.detached.empty());
  CHECK(h.keys->presses(KEY_V) == 1);
  CHECK(h.log_count("Convert: completed (1 actions)") == 1);
}

void test_on_exit_nonzero_skips_actions() {
  Harness h;
  h.launcher.wait_result = {LaunchResult::Ok, 2, {}, {}};
  TriggerCoordinator coordinator{h.launcher, h.executor, h.log};

  auto report = coordinator.run(convert_trigger());
  CHECK(report.final_state() == ChainState::Done);
  CHECK(report.exit_code == 2);
  CHECK(!report.actions.has_value());
  CHECK(h.keys->snapshot().empty());
  CHECK(h.log_count("Convert: process exited with code 2, skipping "
                    "post-actions") == 1);
  CHECK(h.log_count("[hotlaunch]") == 1);
}

void test_launch_failure() {
  Harness h;
  h.launcher.wait_result = {LaunchResult::NotFound, 0, {},
                            "Program not found: /opt/convert"};
  TriggerCoordinator coordinator{h.launcher, h.executor, h.log};

  auto report = coordinator.run(convert_trigger());
  const std::vector<ChainState> expected{ChainState::Idle, ChainState::Launching,
                                         ChainState::Failed};
  CHECK(report.states == expected);
  CHECK(!report.actions.has_value());
  CHECK(report.error == "Program not found: /opt/convert");
  CHECK(h.log_count("Convert: failed: Program not found") == 1);
  // Уведомления выключены по умолчанию
  CHECK(h.launcher.detached.empty());
}

void test_wait_timeout_fails_after_waiting() {
  Harness h;
  h.launcher.wait_result = {LaunchResult::Timeout, 0, {}, "timed out"};
  TriggerCoordinator coordinator{h.launcher, h.executor, h.log};

  auto report = coordinator.run(convert_trigger());
  const std::vector<ChainState> expected{ChainState::Idle, ChainState::Launching,
                                         ChainState::Waiting,
                                         ChainState::Failed};
  CHECK(report.states == expected);
  CHECK(h.keys->snapshot().empty());
}

void test_after_delay_does_not_wait_for_exit() {
  Harness h;
  hotlaunch::PosixProcessLauncher launcher;
  TriggerCoordinator coordinator{launcher, h.executor, h.log};

  auto t = program_trigger("Slow", "/bin/sh");
  auto &program =
      std::get<hotlaunch::hotkey_action::LaunchProgram>(t.action).program;
  program.arguments = {"-c", "sleep 5"};
  program.hidden = true;
  t.post_actions.enabled = true;
  t.post_actions.trigger = hotlaunch::trigger::AfterDelay{200};
  t.post_actions.actions = {make_action("slow-1", PasteClipboard{})};

  const auto start = Clock::now();
  auto report = coordinator.run(t);
  const auto elapsed =
      std::chrono::duration_cast<ms>(Clock::now() - start);

  CHECK(report.ok());
  const std::vector<ChainState> expected{
      ChainState::Idle, ChainState::Launching, ChainState::Delaying,
      ChainState::ExecutingActions, ChainState::Done};
  CHECK(report.states == expected);
  CHECK(elapsed >= ms{200});
  CHECK(elapsed < ms{2000});
  CHECK(h.keys->presses(KEY_V) == 1);
}

void test_after_delay_uses_sleep_func() {
  Harness h;
  TriggerCoordinator coordinator{h.launcher, h.executor, h.log};
  std::vector<ms> sleeps;
  coordinator.set_sleep_func([&](ms d) { sleeps.push_back(d); });

  auto t = convert_trigger();
  t.post_actions.trigger = hotlaunch::trigger::AfterDelay{750};

  CHECK(coordinator.run(t).ok());
  CHECK(sleeps == std::vector<ms>{ms{750}});
  CHECK(h.launcher.detached.size() == 1);
  CHECK(h.launcher.waited.empty());
}

void test_after_delay_beyond_int64_saturates() {
  Harness h;
  TriggerCoordinator coordinator{h.launcher, h.executor, h.log};
  std::vector<ms> sleeps;
  coordinator.set_sleep_func([&](ms d) { sleeps.push_back(d); });

  CHECK(hotlaunch::ms(1ULL << 63) == ms::max());
  CHECK(hotlaunch::ms(1500) == ms{1500});

  auto t = convert_trigger();
  t.post_actions.trigger = hotlaunch::trigger::AfterDelay{(1ULL << 63) + 5};

  CHECK(coordinator.run(t).ok());
  CHECK(sleeps == std::vector<ms>{ms::max()});
}

void test_stop_interrupts_after_delay() {
  Harness h;
  TriggerCoordinator coordinator{h.launcher, h.executor, h.log};

  auto t = convert_trigger();
  t.post_actions.trigger = hotlaunch::trigger::AfterDelay{60000};

  std::stop_source source;
  std::jthread stopper{[&source] {
    std::this_thread::sleep_for(ms{100});
    source.request_stop();
  }};

  const auto start = Clock::now();
  auto report = coordinator.run(t, source.get_token());
  const auto elapsed = std::chrono::duration_cast<ms>(Clock::now() - start);

  const std::vector<ChainState> expected{ChainState::Idle, ChainState::Launching,
                                         ChainState::Delaying,
                                         ChainState::Failed};
  CHECK(report.states == expected);
  CHECK(elapsed < ms{2000});
  CHECK(h.keys->snapshot().empty());
  CHECK(h.log_count("Convert: failed: stopped before post-actions") == 1);
}

void test_truncated_output_reaches_executor() {
  Harness h;
  h.launcher.wait_result = {LaunchResult::Ok, 0, "partial", {}, true};
  TriggerCoordinator coordinator{h.launcher, h.executor, h.log};

  auto t = convert_trigger();
  t.post_actions.actions = {make_action(
      "convert-ai",
      hotlaunch::action::CallAi{"beautify",
                                hotlaunch::input_source::ProcessOutput{},
                                std::nullopt})};

  auto report = coordinator.run(t);
  CHECK(report.final_state() == ChainState::Failed);
  CHECK(report.actions &&
        report.actions->error == hotlaunch::ActionError::NoProcessOutput);
  CHECK(h.ai->calls.empty());
}

void test_ai_hotkey_runs_call_then_post_actions() {
  Harness h;
  h.clipboard.content = "guten tag";
  TriggerCoordinator coordinator{h.launcher, h.executor, h.log};

  Trigger t;
  t.display_name = "Translate";
  t.action = hotlaunch::hotkey_action::AiCall{
      "de-en-translate", hotlaunch::input_source::Clipboard{}, std::nullopt};
  t.post_actions.enabled = true;
  t.post_actions.actions = {make_action("translate-1", PasteClipboard{})};

  auto report = coordinator.run(t);
  CHECK(report.ok());
  CHECK(report.actions && report.actions->executed == 2);
  CHECK(h.ai->calls.size() == 1);
  CHECK(h.clipboard.content == "AI:guten tag");
  CHECK(h.keys->presses(KEY_V) == 1);
  CHECK(h.launcher.detached.empty());
  CHECK(h.launcher.waited.empty());
}

void test_action_failure_is_reported() {
  Harness h;
  h.launcher.wait_result = {LaunchResult::Ok, 0, {}, {}};
  TriggerCoordinator coordinator{h.launcher, h.executor, h.log};
  coordinator.set_notify_on_failure(true);

  auto t = convert_trigger();
  t.post_actions.actions.push_back(make_action(
      "convert-2", hotlaunch::test::keystroke({"ctrl"}, "NoSuchKey")));

  auto report = coordinator.run(t);
  CHECK(report.final_state() == ChainState::Failed);
  CHECK(report.actions && report.actions->failed_index == 1u);
  CHECK(report.error.find("convert-2") != std::string::npos);
  CHECK(h.log_count("Convert: failed:") == 1);

  // notify-send запускается без ожидания
  CHECK(h.launcher.detached == std::vector<std::string>{"notify-send"});
}

} // namespace

int main() {
  test_disabled_post_actions_only_launch();
  test_on_exit_success_pastes_once();
  test_on_exit_nonzero_skips_actions();
  test_launch_failure();
  test_wait_timeout_fails_after_waiting();
  test_after_delay_does_not_wait_for_exit();
  test_after_delay_uses_sleep_func();
  test_after_delay_beyond_int64_saturates();
  test_stop_interrupts_after_delay();
  test_truncated_output_reaches_executor();
  test_ai_hotkey_runs_call_then_post_actions();
  test_action_failure_is_reported();

  std::cout << "OK\n";
  return 0;
}
