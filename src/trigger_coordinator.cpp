/**
 * @file trigger_coordinator.cpp
 * @brief Реализация координатора срабатываний
 */

#include "hotlaunch/trigger_coordinator.hpp"

#include <string>
#include <type_traits>
#include <variant>

namespace hotlaunch {

TriggerCoordinator::TriggerCoordinator(ProcessLauncher &launcher,
                                       const ActionExecutor &executor,
                                       std::ostream &log)
    : launcher_{launcher}, executor_{executor}, log_{log} {}

ChainReport TriggerCoordinator::run(const Trigger &trigger,
                                    std::stop_token stop) const {
  return std::visit(
      [&](const auto &act) -> ChainReport {
        using T = std::decay_t<decltype(act)>;
        if constexpr (std::is_same_v<T, hotkey_action::LaunchProgram>) {
          return launch_program(trigger, act.program, stop);
        } else {
          return run_ai(trigger, act, stop);
        }
      },
      trigger.action);
}

ChainReport TriggerCoordinator::launch_program(const Trigger &trigger,
                                               const ProgramConfig &program,
                                               const std::stop_token &stop) const {
  ChainReport report;
  report.states.push_back(ChainState::Launching);

  const auto &post = trigger.post_actions;

  // Выключенный или пустой список: только запуск, без ожидания
  if (!has_post_actions(post)) {
    auto launch = launcher_.launch_detached(program);
    if (!launch.ok()) {
      fail(trigger, report, launch.error);
      return report;
    }
    finish(trigger, report);
    return report;
  }

  if (const auto *delay = std::get_if<trigger::AfterDelay>(&post.trigger)) {
    auto launch = launcher_.launch_detached(program);
    if (!launch.ok()) {
      fail(trigger, report, launch.error);
      return report;
    }

    report.states.push_back(ChainState::Delaying);
    if (!sleep(ms(delay->delay_ms), stop)) {
      fail(trigger, report, "stopped before post-actions");
      return report;
    }

    ExecutionContext context{trigger.display_name, std::nullopt, false, stop};
    execute_actions(trigger, post.actions, context, report);
    return report;
  }

  // OnExit
  auto launch = launcher_.launch_and_wait(program, stop);
  if (launch.result == LaunchResult::NotFound ||
      launch.result == LaunchResult::SpawnFailed) {
    fail(trigger, report, launch.error);
    return report;
  }

  report.states.push_back(ChainState::Waiting);
  if (!launch.ok()) {
    fail(trigger, report, launch.error);
    return report;
  }

  report.exit_code = launch.exit_code;
  if (launch.exit_code != 0) {
    report.states.push_back(ChainState::Done);
    log_line("[hotlaunch] " + trigger.display_name +
             ": process exited with code " + std::to_string(launch.exit_code) +
             ", skipping post-actions");
    return report;
  }

  ExecutionContext context{trigger.display_name, std::move(launch.output),
                           launch.truncated, stop};
  execute_actions(trigger, post.actions, context, report);
  return report;
}

ChainReport TriggerCoordinator::run_ai(const Trigger &trigger,
                                       const hotkey_action::AiCall &call,
                                       const std::stop_token &stop) const {
  ChainReport report;
  report.states.push_back(ChainState::Launching);

  // Вызов AI: первый шаг пачки, затем пост-действия без ожидания
  std::vector<PostAction> actions;
  actions.push_back(PostAction{
      trigger.display_name + "-ai",
      action::CallAi{call.role_id, call.input_source, call.provider_id}, true});

  if (trigger.post_actions.enabled) {
    actions.insert(actions.end(), trigger.post_actions.actions.begin(),
                   trigger.post_actions.actions.end());
  }

  ExecutionContext context{trigger.display_name, std::nullopt, false, stop};
  execute_actions(trigger, actions, context, report);
  return report;
}

void TriggerCoordinator::execute_actions(const Trigger &trigger,
                                         std::span<const PostAction> actions,
                                         const ExecutionContext &context,
                                         ChainReport &report) const {
  report.states.push_back(ChainState::ExecutingActions);

  report.actions = executor_.execute(actions, context);
  if (!report.actions->ok()) {
    fail(trigger, report, report.actions->message);
    return;
  }
  finish(trigger, report);
}

void TriggerCoordinator::finish(const Trigger &trigger,
                                ChainReport &report) const {
  report.states.push_back(ChainState::Done);

  std::string line = "[hotlaunch] " + trigger.display_name + ": completed";
  if (report.actions) {
    line += " (" + std::to_string(report.actions->executed) + " actions)";
  }
  log_line(line);
}

void TriggerCoordinator::fail(const Trigger &trigger, ChainReport &report,
                              std::string error) const {
  report.states.push_back(ChainState::Failed);
  report.error = std::move(error);

  log_line("[hotlaunch] " + trigger.display_name + ": failed: " + report.error);
  if (notify_on_failure_) {
    notify_failure(trigger, report.error);
  }
}

void TriggerCoordinator::log_line(const std::string &line) const {
  std::lock_guard lock{log_mutex_};
  log_ << line << '\n';
  log_.flush();
}

void TriggerCoordinator::notify_failure(const Trigger &trigger,
                                        const std::string &error) const {
  ProgramConfig notify;
  notify.path = "notify-send";
  notify.arguments = {"--app-name=hotlaunch", trigger.display_name, error};
  notify.hidden = true;

  auto r = launcher_.launch_detached(notify);
  if (!r.ok()) {
    log_line("[hotlaunch] notify-send: " + r.error);
  }
}

bool TriggerCoordinator::sleep(std::chrono::milliseconds duration,
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
