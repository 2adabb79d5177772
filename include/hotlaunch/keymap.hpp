/**
 * @file keymap.hpp
 * @brief Маппинг имён клавиш и символов на скан-коды
 *
 * Constexpr таблицы для разрешения токенов из конфигурации
 * (например "ctrl", "s", "PageDown") в скан-коды linux/input.h.
 */

#pragma once

#include <linux/input.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "hotlaunch/types.hpp"

namespace hotlaunch {

// ===========================================================================
// Маппинг ASCII-символов на скан-коды (US QWERTY, без Shift)
// ===========================================================================

inline constexpr std::array<ScanCode, 128> kCharToScancode = [] {
  std::array<ScanCode, 128> map{};
  // Буквы QWERTY
  map['q'] = KEY_Q;
  map['w'] = KEY_W;
  map['e'] = KEY_E;
  map['r'] = KEY_R;
  map['t'] = KEY_T;
  map['y'] = KEY_Y;
  map['u'] = KEY_U;
  map['i'] = KEY_I;
  map['o'] = KEY_O;
  map['p'] = KEY_P;
  map['a'] = KEY_A;
  map['s'] = KEY_S;
  map['d'] = KEY_D;
  map['f'] = KEY_F;
  map['g'] = KEY_G;
  map['h'] = KEY_H;
  map['j'] = KEY_J;
  map['k'] = KEY_K;
  map['l'] = KEY_L;
  map['z'] = KEY_Z;
  map['x'] = KEY_X;
  map['c'] = KEY_C;
  map['v'] = KEY_V;
  map['b'] = KEY_B;
  map['n'] = KEY_N;
  map['m'] = KEY_M;
  // Цифры основной клавиатуры
  map['1'] = KEY_1;
  map['2'] = KEY_2;
  map['3'] = KEY_3;
  map['4'] = KEY_4;
  map['5'] = KEY_5;
  map['6'] = KEY_6;
  map['7'] = KEY_7;
  map['8'] = KEY_8;
  map['9'] = KEY_9;
  map['0'] = KEY_0;
  // Знаки препинания на нижнем регистре
  map['['] = KEY_LEFTBRACE;
  map[']'] = KEY_RIGHTBRACE;
  map[';'] = KEY_SEMICOLON;
  map['\''] = KEY_APOSTROPHE;
  map['`'] = KEY_GRAVE;
  map['/'] = KEY_SLASH;
  map['-'] = KEY_MINUS;
  map['='] = KEY_EQUAL;
  map['\\'] = KEY_BACKSLASH;
  map[','] = KEY_COMMA;
  map['.'] = KEY_DOT;
  map[' '] = KEY_SPACE;
  return map;
}();

// ===========================================================================
// Именованные клавиши
// ===========================================================================

struct KeyNameMapping {
  std::string_view name;
  ScanCode code;
};

/// Имена в верхнем регистре, поиск регистронезависимый
inline constexpr std::array kKeyNames = std::to_array<KeyNameMapping>({
    {"ENTER", KEY_ENTER},         {"RETURN", KEY_ENTER},
    {"TAB", KEY_TAB},             {"SPACE", KEY_SPACE},
    {"BACKSPACE", KEY_BACKSPACE}, {"DELETE", KEY_DELETE},
    {"ESCAPE", KEY_ESC},          {"ESC", KEY_ESC},
    {"UP", KEY_UP},               {"ARROWUP", KEY_UP},
    {"DOWN", KEY_DOWN},           {"ARROWDOWN", KEY_DOWN},
    {"LEFT", KEY_LEFT},           {"ARROWLEFT", KEY_LEFT},
    {"RIGHT", KEY_RIGHT},         {"ARROWRIGHT", KEY_RIGHT},
    {"HOME", KEY_HOME},           {"END", KEY_END},
    {"PAGEUP", KEY_PAGEUP},       {"PAGEDOWN", KEY_PAGEDOWN},
    {"F1", KEY_F1},               {"F2", KEY_F2},
    {"F3", KEY_F3},               {"F4", KEY_F4},
    {"F5", KEY_F5},               {"F6", KEY_F6},
    {"F7", KEY_F7},               {"F8", KEY_F8},
    {"F9", KEY_F9},               {"F10", KEY_F10},
    {"F11", KEY_F11},             {"F12", KEY_F12},
});

struct ModifierNameMapping {
  std::string_view name;
  ModifierKey modifier;
};

/// Алиасы модификаторов (в нижнем регистре)
inline constexpr std::array kModifierNames = std::to_array<ModifierNameMapping>({
    {"ctrl", ModifierKey::Ctrl},
    {"control", ModifierKey::Ctrl},
    {"alt", ModifierKey::Alt},
    {"shift", ModifierKey::Shift},
    {"meta", ModifierKey::Meta},
    {"cmd", ModifierKey::Meta},
    {"command", ModifierKey::Meta},
    {"win", ModifierKey::Meta},
    {"super", ModifierKey::Meta},
});

/// Модификатор вставки: Cmd на macOS, Ctrl на остальных платформах
#if defined(__APPLE__)
inline constexpr ModifierKey kPasteModifier = ModifierKey::Meta;
#else
inline constexpr ModifierKey kPasteModifier = ModifierKey::Ctrl;
#endif

// ===========================================================================
// Функции разрешения
// ===========================================================================

[[nodiscard]] inline std::string to_lower_ascii(std::string_view sv) {
  std::string out{sv};
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

[[nodiscard]] inline std::string to_upper_ascii(std::string_view sv) {
  std::string out{sv};
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return out;
}

/// Скан-код левой клавиши модификатора
[[nodiscard]] constexpr ScanCode modifier_scancode(ModifierKey m) noexcept {
  switch (m) {
  case ModifierKey::Ctrl:
    return KEY_LEFTCTRL;
  case ModifierKey::Alt:
    return KEY_LEFTALT;
  case ModifierKey::Shift:
    return KEY_LEFTSHIFT;
  case ModifierKey::Meta:
    return KEY_LEFTMETA;
  }
  return KEY_LEFTCTRL;
}

[[nodiscard]] constexpr std::string_view to_string(ModifierKey m) noexcept {
  switch (m) {
  case ModifierKey::Ctrl:
    return "ctrl";
  case ModifierKey::Alt:
    return "alt";
  case ModifierKey::Shift:
    return "shift";
  case ModifierKey::Meta:
    return "meta";
  }
  return "?";
}

/// Разрешает токен модификатора ("Ctrl", "super", ...)
[[nodiscard]] inline std::optional<ModifierKey>
resolve_modifier(std::string_view token) {
  const std::string lowered = to_lower_ascii(token);
  for (const auto &mapping : kModifierNames) {
    if (mapping.name == lowered) {
      return mapping.modifier;
    }
  }
  return std::nullopt;
}

/**
 * @brief Разрешает токен клавиши в скан-код
 *
 * Односимвольный токен приводится к нижнему регистру и ищется в таблице
 * символов, остальные ищутся по таблице имён без учёта регистра.
 */
[[nodiscard]] inline std::optional<ScanCode>
resolve_key(std::string_view token) {
  if (token.size() == 1) {
    const auto c = static_cast<unsigned char>(
        std::tolower(static_cast<unsigned char>(token.front())));
    if (c < kCharToScancode.size() && kCharToScancode[c] != 0) {
      return kCharToScancode[c];
    }
    return std::nullopt;
  }

  const std::string upper = to_upper_ascii(token);
  for (const auto &mapping : kKeyNames) {
    if (mapping.name == upper) {
      return mapping.code;
    }
  }
  return std::nullopt;
}

} // namespace hotlaunch
