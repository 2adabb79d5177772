/**
 * @file hotkey_binding.hpp
 * @brief Привязки глобальных хоткеев и поиск конфликтов
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hotlaunch {

/// Привязка: модификаторы + клавиша, как записано в конфиге
struct HotkeyBinding {
  std::vector<std::string> modifiers;
  std::string key;
};

/**
 * @brief Разбирает строку вида "ctrl+alt+c"
 * @return nullopt для пустой строки или пустой клавиши
 */
[[nodiscard]] std::optional<HotkeyBinding> parse_binding(std::string_view text);

/// "ctrl + alt + c"
[[nodiscard]] std::string format_binding(const HotkeyBinding &binding);

/// Каноническое имя модификатора ("control" -> "ctrl", "super" -> "meta")
[[nodiscard]] std::string normalize_modifier(std::string_view modifier);

/**
 * @brief Эквивалентны ли привязки
 *
 * Клавиша сравнивается без учёта регистра, модификаторы как множества
 * после нормализации алиасов.
 */
[[nodiscard]] bool bindings_match(const HotkeyBinding &a,
                                  const HotkeyBinding &b);

/// Совпадает ли привязка с известным системным сочетанием
[[nodiscard]] bool conflicts_with_system(const HotkeyBinding &binding);

} // namespace hotlaunch
