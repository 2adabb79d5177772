/**
 * @file ai_provider.hpp
 * @brief AI-провайдеры, роли и их разрешение
 */

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "hotlaunch/config.hpp"
#include "hotlaunch/types.hpp"

namespace hotlaunch {

/// Ответ провайдера
struct AiOutcome {
  AiResult result = AiResult::Ok;
  std::string text;
  std::string error;

  [[nodiscard]] bool ok() const noexcept { return result == AiResult::Ok; }
};

/**
 * @brief Возможность "вызвать AI"
 */
class AiProvider {
public:
  virtual ~AiProvider() = default;

  [[nodiscard]] virtual AiOutcome send_text(std::string_view system_prompt,
                                            std::string_view input) = 0;

  /**
   * @param audio Байты записи
   * @param mime_type "audio/wav" или "audio/L16;rate=16000"
   */
  [[nodiscard]] virtual AiOutcome send_audio(std::string_view system_prompt,
                                             std::string_view audio,
                                             std::string_view mime_type) = 0;
};

/**
 * @brief Провайдер-команда
 *
 * Запускает provider.command, подаёт ввод на stdin. Системный промпт,
 * ключ, модель и MIME-тип передаются переменными окружения
 * HOTLAUNCH_SYSTEM_PROMPT, HOTLAUNCH_API_KEY, HOTLAUNCH_MODEL,
 * HOTLAUNCH_INPUT_MIME. Ответ: stdout без краевых пробелов.
 */
class CommandAiProvider final : public AiProvider {
public:
  explicit CommandAiProvider(
      ProviderConfig config,
      std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  [[nodiscard]] AiOutcome send_text(std::string_view system_prompt,
                                    std::string_view input) override;

  [[nodiscard]] AiOutcome send_audio(std::string_view system_prompt,
                                     std::string_view audio,
                                     std::string_view mime_type) override;

private:
  AiOutcome run(std::string_view system_prompt, std::string_view input,
                std::string_view mime_type);

  ProviderConfig config_;
  std::optional<std::chrono::milliseconds> timeout_;
};

/// Создание провайдера по конфигурации (тесты подставляют фейк)
using ProviderFactory =
    std::function<std::unique_ptr<AiProvider>(const ProviderConfig &)>;

/// Фабрика по умолчанию: CommandAiProvider
[[nodiscard]] ProviderFactory command_provider_factory(
    std::optional<std::chrono::milliseconds> timeout = std::nullopt);

/// Встроенные роли
[[nodiscard]] const std::vector<AiRole> &builtin_roles();

/**
 * @brief Каталог ролей и провайдеров одной конфигурации
 */
class Catalog {
public:
  Catalog() = default;
  Catalog(std::vector<AiRole> roles, std::vector<ProviderConfig> providers);

  /// Пользовательские роли имеют приоритет над встроенными
  [[nodiscard]] std::optional<AiRole> resolve_role(std::string_view id) const;

  /// Явный id, иначе первый настроенный провайдер
  [[nodiscard]] std::optional<ProviderConfig>
  resolve_provider(const std::optional<std::string> &id) const;

private:
  std::vector<AiRole> roles_;
  std::vector<ProviderConfig> providers_;
};

} // namespace hotlaunch
