/**
 * @file action_executor.cpp
 * @brief Реализация исполнителя пост-действий
 */

#include "hotlaunch/action_executor.hpp"

#include "hotlaunch/process_launcher.hpp"

#include <string>
#include <type_traits>
#include <variant>

namespace hotlaunch {

namespace {

ActionError to_action_error(SimResult r) noexcept {
  switch (r) {
  case SimResult::Ok:
    return ActionError::Ok;
  case SimResult::InitFailed:
    return ActionError::SimulatorInit;
  case SimResult::UnknownKey:
    return ActionError::UnknownKey;
  case SimResult::UnknownModifier:
    return ActionError::UnknownModifier;
  case SimResult::SendFailed:
    return ActionError::InputSendFailed;
  }
  return ActionError::InputSendFailed;
}

/// Индекс первого включённого действия, которому нужен эмулятор ввода
std::optional<std::size_t>
first_input_action(std::span<const PostAction> actions) {
  for (std::size_t i = 0; i < actions.size(); ++i) {
    const auto &type = actions[i].action_type;
    if (actions[i].enabled &&
        (std::holds_alternative<action::PasteClipboard>(type) ||
         std::holds_alternative<action::SimulateKeystroke>(type))) {
      return i;
    }
  }
  return std::nullopt;
}

} // namespace

ActionExecutor::ActionExecutor(DelayConfig delays, Catalog catalog,
                               BackendFactory input_backend,
                               ProviderFactory providers, Clipboard &clipboard,
                               AudioSource &audio)
    : delays_{delays}, catalog_{std::move(catalog)},
      input_backend_{std::move(input_backend)},
      providers_{std::move(providers)}, clipboard_{clipboard}, audio_{audio} {}

ActionOutcome ActionExecutor::execute(std::span<const PostAction> actions,
                                      const ExecutionContext &context) const {
  Batch batch{context, nullptr};
  ActionOutcome out;

  // Без устройства ввода пачка не начинается: AI-действие не должно
  // успеть перезаписать буфер обмена перед неизбежным сбоем
  if (auto first = first_input_action(actions)) {
    Step step;
    if (!simulator(batch, step)) {
      out.error = step.error;
      out.message =
          "Action '" + actions[*first].id + "' failed: " + step.message;
      out.failed_index = *first;
      return out;
    }
  }

  for (std::size_t i = 0; i < actions.size(); ++i) {
    const auto &pa = actions[i];
    if (!pa.enabled) {
      continue;
    }

    if (context.stop.stop_requested()) {
      out.error = ActionError::Interrupted;
      out.message = "Action '" + pa.id + "' skipped: shutting down";
      out.failed_index = i;
      return out;
    }

    Step step = std::visit(
        [this, &batch](const auto &act) { return run(act, batch); },
        pa.action_type);

    if (step.error != ActionError::Ok) {
      out.error = step.error;
      out.message = "Action '" + pa.id + "' failed: " + step.message;
      out.failed_index = i;
      return out;
    }
    ++out.executed;
  }

  return out;
}

ActionExecutor::Step ActionExecutor::run(const action::PasteClipboard &,
                                         Batch &batch) const {
  Step step;
  InputSimulator *sim = simulator(batch, step);
  if (!sim) {
    return step;
  }

  if (!sleep(delays_.settle, batch.context.stop)) {
    return {ActionError::Interrupted, "stopped before paste"};
  }
  auto r = sim->paste();
  if (!r.ok()) {
    return {to_action_error(r.result), r.error};
  }
  return step;
}

ActionExecutor::Step ActionExecutor::run(const action::SimulateKeystroke &act,
                                         Batch &batch) const {
  Step step;
  InputSimulator *sim = simulator(batch, step);
  if (!sim) {
    return step;
  }

  if (!sleep(delays_.settle, batch.context.stop)) {
    return {ActionError::Interrupted, "stopped before keystroke"};
  }
  auto r = sim->simulate_keystroke(act.keystroke);
  if (!r.ok()) {
    return {to_action_error(r.result), r.error};
  }
  return step;
}

ActionExecutor::Step ActionExecutor::run(const action::Delay &act,
                                         Batch &batch) const {
  if (!sleep(ms(act.delay_ms), batch.context.stop)) {
    return {ActionError::Interrupted, "stopped during delay"};
  }
  return {};
}

ActionExecutor::Step ActionExecutor::run(const action::CallAi &act,
                                         Batch &batch) const {
  auto role = catalog_.resolve_role(act.role_id);
  if (!role) {
    return {ActionError::RoleNotFound, "Role not found: " + act.role_id};
  }

  auto provider_cfg = catalog_.resolve_provider(act.provider_id);
  if (!provider_cfg) {
    return {ActionError::ProviderNotFound,
            act.provider_id ? "Provider not found: " + *act.provider_id
                            : std::string{"No AI provider configured"}};
  }

  std::unique_ptr<AiProvider> provider;
  if (providers_) {
    provider = providers_(*provider_cfg);
  }
  if (!provider) {
    return {ActionError::ProviderNotFound,
            "Provider unavailable: " + provider_cfg->id};
  }

  // Ввод для модели: текст или звук
  AiOutcome response;
  Step step;

  std::visit(
      [&](const auto &source) {
        using T = std::decay_t<decltype(source)>;

        if constexpr (std::is_same_v<T, input_source::Clipboard>) {
          auto text = clipboard_.read_text();
          if (!text) {
            step = {ActionError::ClipboardRead, "Failed to read clipboard"};
            return;
          }
          response = provider->send_text(role->system_prompt, *text);
        } else if constexpr (std::is_same_v<T, input_source::RecordAudio>) {
          auto audio = audio_.record(source.max_duration_ms, source.format);
          if (!audio.ok()) {
            step = {ActionError::AudioCapture, audio.error};
            return;
          }
          response = provider->send_audio(role->system_prompt, audio.bytes,
                                          audio.mime_type);
        } else {
          const auto &output = batch.context.process_output;
          if (!output) {
            step = {ActionError::NoProcessOutput,
                    "No process output available (requires OnExit trigger)"};
            return;
          }
          if (batch.context.process_output_truncated) {
            step = {ActionError::NoProcessOutput,
                    "Process output exceeds " +
                        std::to_string(kMaxCapturedOutput) + " bytes"};
            return;
          }
          response = provider->send_text(role->system_prompt, *output);
        }
      },
      act.input_source);

  if (step.error != ActionError::Ok) {
    return step;
  }

  if (!response.ok()) {
    return {ActionError::AiRequest, response.error.empty()
                                        ? std::string{to_string(response.result)}
                                        : response.error};
  }

  if (auto r = clipboard_.write_text(response.text); r != ClipboardResult::Ok) {
    return {ActionError::ClipboardWrite,
            "Failed to write clipboard: " + std::string{to_string(r)}};
  }

  return {};
}

InputSimulator *ActionExecutor::simulator(Batch &batch, Step &step) const {
  if (batch.simulator) {
    return batch.simulator.get();
  }

  std::string error;
  batch.simulator = InputSimulator::create(input_backend_, delays_, error);
  if (!batch.simulator) {
    step = {ActionError::SimulatorInit,
            "Failed to initialize input simulator: " + error};
    return nullptr;
  }

  if (wait_func_) {
    batch.simulator->set_wait_func(wait_func_);
  }
  return batch.simulator.get();
}

bool ActionExecutor::sleep(std::chrono::milliseconds duration,
                           const std::stop_token &stop) const {
  if (duration.count() <= 0) {
    return true;
  }

  if (sleep_func_) {
    sleep_func_(duration);
    return !stop.stop_requested();
  }
  return sleep_unless_stopped(duration, stop);
}

} // namespace hotlaunch
