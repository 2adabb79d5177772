/**
 * @file ai_provider.cpp
 * @brief Реализация провайдера-команды и каталога ролей
 */

#include "hotlaunch/ai_provider.hpp"

#include "hotlaunch/process_launcher.hpp"

#include <cctype>

namespace hotlaunch {

namespace {

std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
    sv.remove_suffix(1);
  }
  return sv;
}

/// Разбивает командную строку по пробелам (без поддержки кавычек)
std::vector<std::string> split_command(std::string_view command) {
  std::vector<std::string> parts;
  command = trim(command);
  while (!command.empty()) {
    auto end = command.find_first_of(" \t");
    parts.emplace_back(command.substr(0, end));
    if (end == std::string_view::npos) {
      break;
    }
    command = trim(command.substr(end));
  }
  return parts;
}

} // namespace

// ===========================================================================
// CommandAiProvider
// ===========================================================================

CommandAiProvider::CommandAiProvider(
    ProviderConfig config, std::optional<std::chrono::milliseconds> timeout)
    : config_{std::move(config)}, timeout_{timeout} {}

AiOutcome CommandAiProvider::send_text(std::string_view system_prompt,
                                       std::string_view input) {
  return run(system_prompt, input, "text/plain");
}

AiOutcome CommandAiProvider::send_audio(std::string_view system_prompt,
                                        std::string_view audio,
                                        std::string_view mime_type) {
  return run(system_prompt, audio, mime_type);
}

AiOutcome CommandAiProvider::run(std::string_view system_prompt,
                                 std::string_view input,
                                 std::string_view mime_type) {
  auto argv = split_command(config_.command);
  if (argv.empty()) {
    return {AiResult::RequestFailed, {},
            "provider '" + config_.id + "' has no command"};
  }

  auto exe = resolve_executable(argv.front());
  if (!exe) {
    return {AiResult::RequestFailed, {},
            "provider command not found: " + argv.front()};
  }

  SpawnSpec spec;
  spec.executable = std::move(*exe);
  spec.arguments.assign(argv.begin() + 1, argv.end());
  spec.extra_env = {
      "HOTLAUNCH_SYSTEM_PROMPT=" + std::string{system_prompt},
      "HOTLAUNCH_API_KEY=" + config_.api_key,
      "HOTLAUNCH_MODEL=" + config_.model,
      "HOTLAUNCH_INPUT_MIME=" + std::string{mime_type},
  };

  auto launch = run_and_capture(spec, input, timeout_);
  if (!launch.ok()) {
    return {AiResult::RequestFailed, {}, launch.error};
  }
  if (launch.exit_code != 0) {
    return {AiResult::RequestFailed, {},
            "provider '" + config_.id + "' exited with code " +
                std::to_string(launch.exit_code)};
  }

  auto text = trim(launch.output);
  if (text.empty()) {
    return {AiResult::EmptyResponse, {},
            "provider '" + config_.id + "' returned an empty response"};
  }
  return {AiResult::Ok, std::string{text}, {}};
}

ProviderFactory
command_provider_factory(std::optional<std::chrono::milliseconds> timeout) {
  return [timeout](const ProviderConfig &config) -> std::unique_ptr<AiProvider> {
    return std::make_unique<CommandAiProvider>(config, timeout);
  };
}

// ===========================================================================
// Роли
// ===========================================================================

const std::vector<AiRole> &builtin_roles() {
  static const std::vector<AiRole> roles{
      {"de-transcribe", "DE Transcribe",
       "Transcribe the following German audio accurately. Output only the "
       "transcription without any additional commentary.",
       OutputFormat::Plain, true},
      {"de-en-translate", "DE->EN Translate",
       "Translate the following German text to English. Maintain the "
       "original meaning and tone.",
       OutputFormat::Plain, true},
      {"beautify", "Beautify Text",
       "Improve the formatting, grammar, and clarity of this text while "
       "preserving its meaning.",
       OutputFormat::Plain, true},
      {"ai-response", "Format as AI Response",
       "Format this text as a professional, well-structured response "
       "suitable for an AI assistant.",
       OutputFormat::Plain, true},
  };
  return roles;
}

Catalog::Catalog(std::vector<AiRole> roles,
                 std::vector<ProviderConfig> providers)
    : roles_{std::move(roles)}, providers_{std::move(providers)} {}

std::optional<AiRole> Catalog::resolve_role(std::string_view id) const {
  for (const auto &role : roles_) {
    if (role.id == id) {
      return role;
    }
  }
  for (const auto &role : builtin_roles()) {
    if (role.id == id) {
      return role;
    }
  }
  return std::nullopt;
}

std::optional<ProviderConfig>
Catalog::resolve_provider(const std::optional<std::string> &id) const {
  if (!id) {
    if (providers_.empty()) {
      return std::nullopt;
    }
    return providers_.front();
  }
  for (const auto &provider : providers_) {
    if (provider.id == *id) {
      return provider;
    }
  }
  return std::nullopt;
}

} // namespace hotlaunch
