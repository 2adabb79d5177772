/**
 * @file hotkey_binding.cpp
 * @brief Разбор привязок и детект конфликтов
 */

#include "hotlaunch/hotkey_binding.hpp"

#include "hotlaunch/keymap.hpp"

#include <algorithm>
#include <array>
#include <cctype>

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

/// Известные системные сочетания
inline constexpr std::array kSystemHotkeys = std::to_array<std::string_view>({
    // Windows / Linux desktop
    "ctrl+alt+delete", "alt+tab", "alt+f4", "meta+l", "meta+d", "meta+e",
    "meta+r", "meta+tab", "ctrl+shift+escape", "ctrl+alt+t",
    // macOS
    "meta+q", "meta+w", "meta+shift+3", "meta+shift+4", "meta+shift+5",
    "meta+space", "ctrl+space",
});

std::vector<std::string> sorted_modifiers(const std::vector<std::string> &mods) {
  std::vector<std::string> out;
  out.reserve(mods.size());
  for (const auto &m : mods) {
    auto normalized = normalize_modifier(m);
    if (!normalized.empty()) {
      out.push_back(std::move(normalized));
    }
  }
  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

} // namespace

std::optional<HotkeyBinding> parse_binding(std::string_view text) {
  text = trim(text);
  if (text.empty()) {
    return std::nullopt;
  }

  std::vector<std::string> parts;
  std::size_t start = 0;
  while (start <= text.size()) {
    auto plus = text.find('+', start);
    if (plus == std::string_view::npos) {
      plus = text.size();
    }
    // "ctrl++": клавиша "+" в конце
    if (plus == start && plus + 1 == text.size()) {
      parts.emplace_back("+");
      break;
    }
    parts.emplace_back(trim(text.substr(start, plus - start)));
    start = plus + 1;
  }

  HotkeyBinding binding;
  binding.key = parts.back();
  parts.pop_back();
  if (binding.key.empty()) {
    return std::nullopt;
  }

  for (auto &p : parts) {
    if (!p.empty()) {
      binding.modifiers.push_back(std::move(p));
    }
  }
  return binding;
}

std::string format_binding(const HotkeyBinding &binding) {
  std::string out;
  for (const auto &m : binding.modifiers) {
    out += m;
    out += " + ";
  }
  out += binding.key;
  return out;
}

std::string normalize_modifier(std::string_view modifier) {
  if (auto m = resolve_modifier(modifier)) {
    return std::string{to_string(*m)};
  }
  return to_lower_ascii(modifier);
}

bool bindings_match(const HotkeyBinding &a, const HotkeyBinding &b) {
  if (to_lower_ascii(a.key) != to_lower_ascii(b.key)) {
    return false;
  }
  return sorted_modifiers(a.modifiers) == sorted_modifiers(b.modifiers);
}

bool conflicts_with_system(const HotkeyBinding &binding) {
  for (const auto text : kSystemHotkeys) {
    if (auto sys = parse_binding(text); sys && bindings_match(*sys, binding)) {
      return true;
    }
  }
  return false;
}

} // namespace hotlaunch
