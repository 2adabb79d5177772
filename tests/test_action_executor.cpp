#include "hotlaunch/action_executor.hpp"

#include "test_support.hpp"

#include <linux/input.h>

#include <iostream>
#include <stop_token>
#include <vector>

namespace {

using hotlaunch::ActionError;
using hotlaunch::ActionExecutor;
using hotlaunch::ExecutionContext;
using hotlaunch::PostAction;
using hotlaunch::action::CallAi;
using hotlaunch::action::Delay;
using hotlaunch::action::PasteClipboard;
using hotlaunch::test::AiLog;
using hotlaunch::test::FakeAudio;
using hotlaunch::test::FakeClipboard;
using hotlaunch::test::KeyLog;
using hotlaunch::test::keystroke;
using hotlaunch::test::make_action;

using ms = std::chrono::milliseconds;

/// Исполнитель с фейками и записью всех пауз
struct Harness {
  std::shared_ptr<KeyLog> keys = std::make_shared<KeyLog>();
  std::shared_ptr<AiLog> ai = std::make_shared<AiLog>();
  FakeClipboard clipboard;
  FakeAudio audio;
  std::vector<ms> sleeps;

  std::vector<hotlaunch::AiRole> roles;
  std::vector<hotlaunch::ProviderConfig> providers{
      {"gemini", "Gemini", "gemini-cli", "key", "model"},
      {"local", "Local", "local-llm", "", ""}};

  hotlaunch::BackendFactory backend = hotlaunch::test::recording_factory(keys);

  ActionExecutor make() {
    ActionExecutor executor{hotlaunch::DelayConfig{},
                            hotlaunch::Catalog{roles, providers},
                            backend,
                            hotlaunch::test::fake_provider_factory(ai),
                            clipboard,
                            audio};
    executor.set_sleep_func([this](ms d) { sleeps.push_back(d); });
    executor.set_wait_func(hotlaunch::test::no_wait);
    return executor;
  }
};

void test_actions_run_in_order_and_disabled_are_skipped() {
  Harness h;
  auto executor = h.make();

  const std::vector<PostAction> actions{
      make_action("a1", keystroke({"ctrl"}, "a")),
      make_action("a2", PasteClipboard{}, false),
      make_action("a3", Delay{100}),
      make_action("a4", PasteClipboard{}),
  };

  auto out = executor.execute(actions, ExecutionContext{"Test", std::nullopt});
  CHECK(out.ok());
  CHECK(out.executed == 3);

  // ctrl+a, затем одна вставка (выключенная пропущена)
  CHECK(h.keys->presses(KEY_A) == 1);
  CHECK(h.keys->presses(KEY_V) == 1);
  const auto events = h.keys->snapshot();
  CHECK(events.size() == 8);
  CHECK(events[1] == hotlaunch::test::down(KEY_A));
  CHECK(events[5] == hotlaunch::test::down(KEY_V));

  // settle перед каждым вводом, Delay как есть
  const std::vector<ms> expected{ms{50}, ms{100}, ms{50}};
  CHECK(h.sleeps == expected);
}

void test_one_simulator_per_batch() {
  Harness h;
  auto executor = h.make();

  const std::vector<PostAction> input{make_action("p1", PasteClipboard{}),
                                      make_action("p2", PasteClipboard{})};
  CHECK(executor.execute(input, {"Test", std::nullopt}).ok());
  CHECK(h.keys->backends_created == 1);

  // Пачка без ввода не трогает бэкенд
  const std::vector<PostAction> delays{make_action("d1", Delay{5})};
  CHECK(executor.execute(delays, {"Test", std::nullopt}).ok());
  CHECK(h.keys->backends_created == 1);
}

void test_abort_on_first_failure() {
  Harness h;
  auto executor = h.make();

  const std::vector<PostAction> actions{
      make_action("first", PasteClipboard{}),
      make_action("bad", keystroke({"ctrl"}, "NoSuchKey")),
      make_action("never", PasteClipboard{}),
  };

  auto out = executor.execute(actions, {"Test", std::nullopt});
  CHECK(out.error == ActionError::UnknownKey);
  CHECK(out.failed_index == 1u);
  CHECK(out.executed == 1);
  CHECK(out.message.find("'bad'") != std::string::npos);
  CHECK(h.keys->presses(KEY_V) == 1);
}

void test_simulator_init_failure() {
  Harness h;
  h.backend = hotlaunch::test::failing_factory();
  auto executor = h.make();

  const std::vector<PostAction> actions{make_action("p", PasteClipboard{})};
  auto out = executor.execute(actions, {"Test", std::nullopt});
  CHECK(out.error == ActionError::SimulatorInit);
  CHECK(out.failed_index == 0u);
  CHECK(out.executed == 0);
}

void test_failed_paste_skips_delay_and_keystroke() {
  Harness h;
  h.keys->fail_at = 0;
  auto executor = h.make();

  const std::vector<PostAction> actions{
      make_action("paste", PasteClipboard{}),
      make_action("wait", Delay{500}),
      make_action("save", keystroke({"ctrl"}, "s")),
  };

  auto out = executor.execute(actions, {"Test", std::nullopt});
  CHECK(out.error == ActionError::InputSendFailed);
  CHECK(out.failed_index == 0u);
  CHECK(out.executed == 0);

  // Только settle перед вставкой, Delay{500} не выполнялся
  CHECK(h.sleeps == std::vector<ms>{ms{50}});
  CHECK(h.keys->presses(KEY_S) == 0);
}

void test_simulator_failure_precedes_ai_call() {
  Harness h;
  h.backend = hotlaunch::test::failing_factory();
  h.clipboard.content = "user text";
  auto executor = h.make();

  const std::vector<PostAction> actions{
      make_action("ai", CallAi{"beautify", hotlaunch::input_source::Clipboard{},
                               std::nullopt}),
      make_action("off", PasteClipboard{}, false),
      make_action("paste", PasteClipboard{}),
  };

  auto out = executor.execute(actions, {"Test", std::nullopt});
  CHECK(out.error == ActionError::SimulatorInit);
  CHECK(out.failed_index == 2u);
  CHECK(out.executed == 0);
  CHECK(out.message.find("'paste'") != std::string::npos);

  // Буфер обмена пользователя не тронут
  CHECK(h.ai->calls.empty());
  CHECK(h.clipboard.writes.empty());
  CHECK(h.clipboard.content == "user text");
}

void test_truncated_process_output_is_rejected() {
  Harness h;
  auto executor = h.make();

  const std::vector<PostAction> actions{make_action(
      "ai", CallAi{"beautify", hotlaunch::input_source::ProcessOutput{},
                   std::nullopt})};

  ExecutionContext ctx;
  ctx.hotkey_name = "Test";
  ctx.process_output = std::string(64, 'x');
  ctx.process_output_truncated = true;

  auto out = executor.execute(actions, ctx);
  CHECK(out.error == ActionError::NoProcessOutput);
  CHECK(out.message.find("exceeds") != std::string::npos);
  CHECK(h.ai->calls.empty());
}

void test_stop_skips_remaining_actions() {
  Harness h;
  auto executor = h.make();

  std::stop_source source;
  source.request_stop();

  ExecutionContext ctx;
  ctx.hotkey_name = "Test";
  ctx.stop = source.get_token();

  const std::vector<PostAction> actions{make_action("d", Delay{10}),
                                        make_action("p", PasteClipboard{})};
  auto out = executor.execute(actions, ctx);
  CHECK(out.error == ActionError::Interrupted);
  CHECK(out.failed_index == 0u);
  CHECK(h.sleeps.empty());
  CHECK(h.keys->presses(KEY_V) == 0);
}

void test_long_delay_is_not_wrapped() {
  Harness h;
  auto executor = h.make();

  const std::vector<PostAction> actions{
      make_action("forever", Delay{(1ULL << 63) + 5})};
  CHECK(executor.execute(actions, {"Test", std::nullopt}).ok());
  CHECK(h.sleeps == std::vector<ms>{ms::max()});
}

void test_ai_clipboard_round_trip() {
  Harness h;
  h.clipboard.content = "hallo welt";
  auto executor = h.make();

  const std::vector<PostAction> actions{
      make_action("ai", CallAi{"beautify", hotlaunch::input_source::Clipboard{},
                               std::nullopt}),
      make_action("paste", PasteClipboard{}),
  };

  auto out = executor.execute(actions, {"Beautify", std::nullopt});
  CHECK(out.ok());
  CHECK(out.executed == 2);

  CHECK(h.ai->calls.size() == 1);
  // Без явного id берётся первый провайдер
  CHECK(h.ai->calls[0].provider_id == "gemini");
  CHECK(h.ai->calls[0].input == "hallo welt");
  CHECK(h.ai->calls[0].system_prompt.find("grammar") != std::string::npos);

  CHECK(h.clipboard.content == "AI:hallo welt");
  CHECK(h.keys->presses(KEY_V) == 1);
}

void test_user_role_overrides_builtin() {
  Harness h;
  h.roles.push_back({"beautify", "Mine", "custom prompt",
                     hotlaunch::OutputFormat::Markdown, false});
  h.clipboard.content = "x";
  auto executor = h.make();

  const std::vector<PostAction> actions{make_action(
      "ai", CallAi{"beautify", hotlaunch::input_source::Clipboard{}, "local"})};
  CHECK(executor.execute(actions, {"Test", std::nullopt}).ok());
  CHECK(h.ai->calls.size() == 1);
  CHECK(h.ai->calls[0].system_prompt == "custom prompt");
  CHECK(h.ai->calls[0].provider_id == "local");
}

void test_process_output_source() {
  Harness h;
  auto executor = h.make();

  const std::vector<PostAction> actions{make_action(
      "ai", CallAi{"ai-response", hotlaunch::input_source::ProcessOutput{},
                   std::nullopt})};

  auto out = executor.execute(actions, {"Test", std::string{"stdout text"}});
  CHECK(out.ok());
  CHECK(h.ai->calls[0].input == "stdout text");

  out = executor.execute(actions, {"Test", std::nullopt});
  CHECK(out.error == ActionError::NoProcessOutput);
}

void test_audio_source() {
  Harness h;
  auto executor = h.make();

  hotlaunch::input_source::RecordAudio record;
  record.max_duration_ms = 3000;
  record.format = hotlaunch::AudioFormat::Raw;
  const std::vector<PostAction> actions{
      make_action("ai", CallAi{"de-transcribe", record, std::nullopt})};

  CHECK(executor.execute(actions, {"Test", std::nullopt}).ok());
  CHECK(h.audio.recorded_ms == std::vector<std::uint64_t>{3000});
  CHECK(h.ai->calls[0].mime_type == "audio/L16;rate=16000");
  CHECK(h.clipboard.content == "AI:PCM");

  h.audio.available = false;
  auto out = executor.execute(actions, {"Test", std::nullopt});
  CHECK(out.error == ActionError::AudioCapture);
}

void test_ai_error_kinds() {
  Harness h;
  auto executor = h.make();
  const ExecutionContext ctx{"Test", std::nullopt};

  std::vector<PostAction> actions{make_action(
      "ai", CallAi{"no-such-role", hotlaunch::input_source::Clipboard{},
                   std::nullopt})};
  CHECK(executor.execute(actions, ctx).error == ActionError::RoleNotFound);

  actions[0].action_type =
      CallAi{"beautify", hotlaunch::input_source::Clipboard{}, "no-such"};
  CHECK(executor.execute(actions, ctx).error == ActionError::ProviderNotFound);

  // Пустой буфер обмена
  actions[0].action_type =
      CallAi{"beautify", hotlaunch::input_source::Clipboard{}, std::nullopt};
  CHECK(executor.execute(actions, ctx).error == ActionError::ClipboardRead);

  h.clipboard.content = "text";
  h.ai->result = hotlaunch::AiResult::RequestFailed;
  CHECK(executor.execute(actions, ctx).error == ActionError::AiRequest);

  h.ai->result = hotlaunch::AiResult::Ok;
  h.clipboard.write_result = hotlaunch::ClipboardResult::NoConnection;
  CHECK(executor.execute(actions, ctx).error == ActionError::ClipboardWrite);

  // Провайдеры не настроены
  Harness empty;
  empty.providers.clear();
  empty.clipboard.content = "text";
  auto bare = empty.make();
  CHECK(bare.execute(actions, ctx).error == ActionError::ProviderNotFound);
}

} // namespace

int main() {
  test_actions_run_in_order_and_disabled_are_skipped();
  test_one_simulator_per_batch();
  test_abort_on_first_failure();
  test_simulator_init_failure();
  test_failed_paste_skips_delay_and_keystroke();
  test_simulator_failure_precedes_ai_call();
  test_truncated_process_output_is_rejected();
  test_stop_skips_remaining_actions();
  test_long_delay_is_not_wrapped();
  test_ai_clipboard_round_trip();
  test_user_role_overrides_builtin();
  test_process_output_source();
  test_audio_source();
  test_ai_error_kinds();

  std::cout << "OK\n";
  return 0;
}
