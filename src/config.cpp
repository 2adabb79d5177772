/**
 * @file config.cpp
 * @brief Реализация загрузчика конфигурации
 *
 * Формат файла (YAML-подобный, отступы не значимы):
 *
 *   settings:
 *     settle_ms: 50
 *     wait_timeout_ms: 30000
 *
 *   hotkey:
 *     id: convert
 *     name: Convert
 *     binding: ctrl+alt+c
 *     program: /usr/bin/convert
 *     argument: in.png
 *     post_actions: true
 *     trigger: after_delay 200
 *     action: paste
 *     action: keystroke ctrl+s
 *     disabled_action: delay 500
 *
 * Блоки provider:, role: и hotkey: повторяются; каждый открывает новую
 * запись.
 */

#include "hotlaunch/config.hpp"

#include "hotlaunch/audio_recorder.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <tuple>
#include <utility>

namespace hotlaunch {

namespace {

/// Удаляет пробелы с начала и конца строки
std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
    sv.remove_suffix(1);
  }
  return sv;
}

/// Снимает парные кавычки вокруг значения
std::string_view unquote(std::string_view sv) {
  if (sv.size() >= 2 && (sv.front() == '"' || sv.front() == '\'') &&
      sv.back() == sv.front()) {
    sv.remove_prefix(1);
    sv.remove_suffix(1);
  }
  return sv;
}

/// Парсит неотрицательное целое число из строки
std::optional<std::uint64_t> parse_uint(std::string_view sv) {
  sv = trim(sv);
  std::uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
  if (!sv.empty() && ec == std::errc{} && ptr == sv.data() + sv.size()) {
    return value;
  }
  return std::nullopt;
}

/// Парсит булево значение из строки
std::optional<bool> parse_bool(std::string_view sv) {
  sv = trim(sv);
  if (sv == "true" || sv == "yes" || sv == "1" || sv == "on") {
    return true;
  }
  if (sv == "false" || sv == "no" || sv == "0" || sv == "off") {
    return false;
  }
  return std::nullopt;
}

/// Отделяет первое слово: "ai beautify clipboard" -> {"ai", "beautify clipboard"}
std::pair<std::string_view, std::string_view> split_word(std::string_view sv) {
  sv = trim(sv);
  auto space = sv.find_first_of(" \t");
  if (space == std::string_view::npos) {
    return {sv, {}};
  }
  return {sv.substr(0, space), trim(sv.substr(space + 1))};
}

/**
 * @brief Источник ввода AI: "clipboard", "process_output",
 * "record [MS] [wav|raw]"
 *
 * @param rest Остаток строки после источника (id провайдера)
 */
std::optional<AiInputSource> parse_input_source(std::string_view text,
                                                std::string_view &rest) {
  auto [word, tail] = split_word(text);
  rest = tail;

  if (word == "clipboard") {
    return input_source::Clipboard{};
  }
  if (word == "process_output") {
    return input_source::ProcessOutput{};
  }
  if (word != "record") {
    return std::nullopt;
  }

  input_source::RecordAudio record;
  auto [next, after] = split_word(rest);
  if (auto duration = parse_uint(next)) {
    if (*duration == 0 || *duration > kMaxRecordDurationMs) {
      return std::nullopt;
    }
    record.max_duration_ms = *duration;
    rest = after;
    std::tie(next, after) = split_word(rest);
  }
  if (next == "wav") {
    record.format = AudioFormat::Wav;
    rest = after;
  } else if (next == "raw") {
    record.format = AudioFormat::Raw;
    rest = after;
  }
  return record;
}

/// "ROLE SOURCE [PROVIDER]"
std::optional<action::CallAi> parse_ai_call(std::string_view text) {
  auto [role, rest] = split_word(text);
  if (role.empty() || rest.empty()) {
    return std::nullopt;
  }

  std::string_view provider;
  auto source = parse_input_source(rest, provider);
  if (!source) {
    return std::nullopt;
  }

  action::CallAi call;
  call.role_id = std::string{role};
  call.input_source = *source;
  if (!provider.empty()) {
    auto [id, extra] = split_word(provider);
    if (!extra.empty()) {
      return std::nullopt;
    }
    call.provider_id = std::string{id};
  }
  return call;
}

std::optional<PostActionTrigger> parse_trigger(std::string_view text) {
  auto [word, rest] = split_word(text);
  if (word == "on_exit" && rest.empty()) {
    return trigger::OnExit{};
  }
  if (word == "after_delay") {
    if (auto delay = parse_uint(rest)) {
      return trigger::AfterDelay{*delay};
    }
  }
  return std::nullopt;
}

std::optional<OutputFormat> parse_output_format(std::string_view text) {
  if (text == "plain") {
    return OutputFormat::Plain;
  }
  if (text == "markdown") {
    return OutputFormat::Markdown;
  }
  return std::nullopt;
}

/// Получает путь к user config (~/.config/hotlaunch/config.yaml)
std::string get_user_config_path() {
  const char *home = std::getenv("HOME");
  if (home) {
    return std::string(home) + "/" + std::string(kUserConfigRelPath);
  }
  return "";
}

enum class Section { None, Settings, Provider, Role, Hotkey };

/// Состояние разбора: текущая секция и счётчик строк для сообщений
class Parser {
public:
  ConfigLoadOutcome run(std::istream &in) {
    std::string line;
    while (std::getline(in, line)) {
      ++line_no_;
      std::string_view sv = trim(line);

      // Пропуск пустых строк и комментариев
      if (sv.empty() || sv.front() == '#') {
        continue;
      }

      if (open_section(sv)) {
        continue;
      }

      auto colon_pos = sv.find(':');
      if (colon_pos == std::string_view::npos) {
        fail(ConfigResult::ParseError, "expected 'key: value'");
        break;
      }

      std::string_view key = trim(sv.substr(0, colon_pos));
      std::string_view value = unquote(trim(sv.substr(colon_pos + 1)));

      if (!apply(key, value)) {
        break;
      }
    }
    return std::move(out_);
  }

private:
  bool open_section(std::string_view sv) {
    if (sv == "settings:") {
      section_ = Section::Settings;
    } else if (sv == "provider:") {
      section_ = Section::Provider;
      out_.config.providers.emplace_back();
    } else if (sv == "role:") {
      section_ = Section::Role;
      out_.config.roles.emplace_back();
    } else if (sv == "hotkey:") {
      section_ = Section::Hotkey;
      out_.config.hotkeys.emplace_back();
    } else {
      return false;
    }
    return true;
  }

  bool apply(std::string_view key, std::string_view value) {
    switch (section_) {
    case Section::Settings:
      return apply_settings(key, value);
    case Section::Provider:
      return apply_provider(out_.config.providers.back(), key, value);
    case Section::Role:
      return apply_role(out_.config.roles.back(), key, value);
    case Section::Hotkey:
      return apply_hotkey(out_.config.hotkeys.back(), key, value);
    case Section::None:
      break;
    }
    return fail(ConfigResult::ParseError,
                "key '" + std::string{key} + "' outside of a section");
  }

  bool apply_settings(std::string_view key, std::string_view value) {
    auto &settings = out_.config.settings;

    if (key == "notify_on_failure") {
      auto val = parse_bool(value);
      if (!val) {
        return invalid(key, value);
      }
      settings.notify_on_failure = *val;
      return true;
    }

    if (key == "wait_timeout_ms") {
      auto val = parse_uint(value);
      if (!val) {
        return invalid(key, value);
      }
      // 0: ждать завершения программы без ограничения
      if (*val == 0) {
        settings.wait_timeout.reset();
      } else {
        settings.wait_timeout = ms(*val);
      }
      return true;
    }

    auto delay = parse_delay_ms(value);
    if (key == "settle_ms") {
      if (!delay) {
        return invalid(key, value);
      }
      settings.delays.settle = *delay;
    } else if (key == "key_hold_ms") {
      if (!delay) {
        return invalid(key, value);
      }
      settings.delays.key_hold = *delay;
    } else if (key == "modifier_hold_ms") {
      if (!delay) {
        return invalid(key, value);
      }
      settings.delays.modifier_hold = *delay;
    } else if (key == "modifier_release_ms") {
      if (!delay) {
        return invalid(key, value);
      }
      settings.delays.modifier_release = *delay;
    } else {
      warn_unknown(key);
    }
    return true;
  }

  bool apply_provider(ProviderConfig &provider, std::string_view key,
                      std::string_view value) {
    if (key == "id") {
      provider.id = value;
    } else if (key == "name") {
      provider.name = value;
    } else if (key == "command") {
      provider.command = value;
    } else if (key == "api_key") {
      provider.api_key = value;
    } else if (key == "model") {
      provider.model = value;
    } else {
      warn_unknown(key);
    }
    return true;
  }

  bool apply_role(AiRole &role, std::string_view key, std::string_view value) {
    if (key == "id") {
      role.id = value;
    } else if (key == "name") {
      role.name = value;
    } else if (key == "system_prompt") {
      role.system_prompt = value;
    } else if (key == "output_format") {
      auto format = parse_output_format(value);
      if (!format) {
        return invalid(key, value);
      }
      role.output_format = *format;
    } else {
      warn_unknown(key);
    }
    return true;
  }

  bool apply_hotkey(HotkeyConfig &hotkey, std::string_view key,
                    std::string_view value) {
    auto *launch = std::get_if<hotkey_action::LaunchProgram>(&hotkey.action);

    if (key == "id") {
      hotkey.id = value;
    } else if (key == "name") {
      hotkey.name = value;
    } else if (key == "binding") {
      auto binding = parse_binding(value);
      if (!binding) {
        return invalid(key, value);
      }
      hotkey.binding = std::move(*binding);
    } else if (key == "enabled") {
      auto val = parse_bool(value);
      if (!val) {
        return invalid(key, value);
      }
      hotkey.enabled = *val;
    } else if (key == "program" || key == "argument" ||
               key == "working_directory" || key == "hidden") {
      if (!launch) {
        return fail(ConfigResult::ParseError,
                    "'" + std::string{key} + "' in an AI hotkey");
      }
      return apply_program(launch->program, key, value);
    } else if (key == "ai") {
      auto call = parse_ai_call(value);
      if (!call) {
        return invalid(key, value);
      }
      if (launch && !launch->program.path.empty()) {
        return fail(ConfigResult::ParseError,
                    "hotkey has both 'program' and 'ai'");
      }
      hotkey.action = hotkey_action::AiCall{std::move(call->role_id),
                                            std::move(call->input_source),
                                            std::move(call->provider_id)};
    } else if (key == "post_actions") {
      auto val = parse_bool(value);
      if (!val) {
        return invalid(key, value);
      }
      hotkey.post_actions.enabled = *val;
    } else if (key == "trigger") {
      auto trig = parse_trigger(value);
      if (!trig) {
        return invalid(key, value);
      }
      hotkey.post_actions.trigger = *trig;
    } else if (key == "action" || key == "disabled_action") {
      auto parsed = parse_post_action(value);
      if (!parsed) {
        return invalid(key, value);
      }
      auto &actions = hotkey.post_actions.actions;
      PostAction pa;
      pa.id = (hotkey.id.empty() ? std::string{"action"} : hotkey.id) + "-" +
              std::to_string(actions.size() + 1);
      pa.action_type = std::move(*parsed);
      pa.enabled = key == "action";
      actions.push_back(std::move(pa));
    } else {
      warn_unknown(key);
    }
    return true;
  }

  bool apply_program(ProgramConfig &program, std::string_view key,
                     std::string_view value) {
    if (key == "program") {
      program.path = value;
    } else if (key == "argument") {
      program.arguments.emplace_back(value);
    } else if (key == "working_directory") {
      if (!value.empty()) {
        program.working_directory = std::string{value};
      }
    } else {
      auto val = parse_bool(value);
      if (!val) {
        return invalid(key, value);
      }
      program.hidden = *val;
    }
    return true;
  }

  bool invalid(std::string_view key, std::string_view value) {
    return fail(ConfigResult::InvalidValue, "invalid value for '" +
                                                std::string{key} + "': '" +
                                                std::string{value} + "'");
  }

  bool fail(ConfigResult result, const std::string &message) {
    out_.result = result;
    out_.error = "line " + std::to_string(line_no_) + ": " + message;
    return false;
  }

  void warn_unknown(std::string_view key) {
    out_.warnings.push_back("line " + std::to_string(line_no_) +
                            ": unknown key '" + std::string{key} + "'");
  }

  ConfigLoadOutcome out_;
  Section section_ = Section::None;
  std::size_t line_no_ = 0;
};

/// Предупреждения о дублях привязок и конфликтах с системными сочетаниями
void collect_binding_warnings(ConfigLoadOutcome &out) {
  const auto &hotkeys = out.config.hotkeys;
  for (std::size_t i = 0; i < hotkeys.size(); ++i) {
    const auto &hk = hotkeys[i];
    if (!hk.enabled) {
      continue;
    }
    if (conflicts_with_system(hk.binding)) {
      out.warnings.push_back("hotkey '" + hk.id + "' (" +
                             format_binding(hk.binding) +
                             ") conflicts with a system shortcut");
    }
    for (std::size_t j = 0; j < i; ++j) {
      if (hotkeys[j].enabled && bindings_match(hotkeys[j].binding, hk.binding)) {
        out.warnings.push_back("hotkey '" + hk.id + "' uses the same binding (" +
                               format_binding(hk.binding) + ") as '" +
                               hotkeys[j].id + "'");
      }
    }
  }
}

} // namespace

std::optional<std::chrono::milliseconds>
parse_delay_ms(std::string_view value) {
  auto val = parse_uint(value);
  if (val && *val > 0) {
    return ms(*val);
  }
  return std::nullopt;
}

std::optional<PostActionType> parse_post_action(std::string_view value) {
  auto [word, rest] = split_word(value);

  if (word == "paste" && rest.empty()) {
    return action::PasteClipboard{};
  }

  if (word == "keystroke") {
    auto binding = parse_binding(rest);
    if (!binding) {
      return std::nullopt;
    }
    return action::SimulateKeystroke{
        Keystroke{std::move(binding->modifiers), std::move(binding->key)}};
  }

  if (word == "delay") {
    if (auto delay = parse_uint(rest)) {
      return action::Delay{*delay};
    }
    return std::nullopt;
  }

  if (word == "ai") {
    if (auto call = parse_ai_call(rest)) {
      return std::move(*call);
    }
  }

  return std::nullopt;
}

std::string validate_config(const Config &config) {
  const auto &d = config.settings.delays;
  if (d.settle.count() <= 0 || d.key_hold.count() <= 0 ||
      d.modifier_hold.count() <= 0 || d.modifier_release.count() <= 0) {
    return "delays must be positive";
  }

  for (const auto &provider : config.providers) {
    if (provider.id.empty()) {
      return "provider without id";
    }
    if (provider.command.empty()) {
      return "provider '" + provider.id + "' has no command";
    }
  }

  for (const auto &role : config.roles) {
    if (role.id.empty()) {
      return "role without id";
    }
  }

  for (std::size_t i = 0; i < config.hotkeys.size(); ++i) {
    const auto &hk = config.hotkeys[i];
    if (hk.id.empty()) {
      return "hotkey #" + std::to_string(i + 1) + " has no id";
    }
    if (hk.name.empty()) {
      return "hotkey '" + hk.id + "' has no name";
    }
    if (hk.binding.key.empty()) {
      return "hotkey '" + hk.id + "' has no binding";
    }
    if (const auto *launch = std::get_if<hotkey_action::LaunchProgram>(&hk.action);
        launch && launch->program.path.empty()) {
      return "hotkey '" + hk.id + "' has no program";
    }
    for (std::size_t j = 0; j < i; ++j) {
      if (config.hotkeys[j].id == hk.id) {
        return "duplicate hotkey id '" + hk.id + "'";
      }
    }
  }

  return {};
}

Trigger make_trigger(const HotkeyConfig &hotkey) {
  Trigger trigger;
  trigger.display_name = hotkey.name.empty() ? hotkey.id : hotkey.name;
  trigger.action = hotkey.action;
  trigger.post_actions = hotkey.post_actions;
  return trigger;
}

ConfigLoadOutcome parse_config(std::istream &in) {
  ConfigLoadOutcome out = Parser{}.run(in);
  if (out.result != ConfigResult::Ok) {
    out.config = Config{};
    return out;
  }

  if (auto error = validate_config(out.config); !error.empty()) {
    out.result = ConfigResult::InvalidValue;
    out.error = std::move(error);
    out.config = Config{};
    return out;
  }

  collect_binding_warnings(out);
  return out;
}

ConfigLoadOutcome load_config_checked(std::filesystem::path path) {
  if (path.empty()) {
    ConfigLoadOutcome out;
    out.result = ConfigResult::FileNotFound;
    out.error = "Empty config path";
    return out;
  }

  std::ifstream file{path};
  if (!file.is_open()) {
    ConfigLoadOutcome out;
    out.used_path = path;
    out.result = ConfigResult::FileNotFound;
    out.error = "Config file not found: " + path.string();
    return out;
  }

  ConfigLoadOutcome out = parse_config(file);
  out.used_path = path;
  if (out.result == ConfigResult::Ok) {
    out.config.config_path = path;
  } else {
    out.error = path.string() + ": " + out.error;
  }
  return out;
}

Config load_config(std::string_view path) {
  // Best-effort логика: если запрошен дефолтный путь, пробуем user-config
  // первым.
  std::filesystem::path effective_path{std::string{path}};

  if (path == kConfigPath) {
    std::string user_path = get_user_config_path();
    if (!user_path.empty()) {
      std::error_code ec;
      bool exists = std::filesystem::exists(user_path, ec);
      if (!ec && exists) {
        effective_path = user_path;
        std::cerr << "[hotlaunch] Using user config: " << user_path << "\n";
      }
    }
  }

  ConfigLoadOutcome out = load_config_checked(effective_path);
  if (out.result != ConfigResult::Ok) {
    // Файл не найден/битый: используем дефолты.
    if (!out.error.empty()) {
      std::cerr << "[hotlaunch] Warning: " << out.error << "\n";
    }
    return Config{};
  }

  for (const auto &warning : out.warnings) {
    std::cerr << "[hotlaunch] Warning: " << warning << "\n";
  }
  return out.config;
}

} // namespace hotlaunch
