/**
 * @file input_simulator.hpp
 * @brief Эмуляция клавиатурного ввода для пост-действий
 *
 * События отправляются через виртуальную клавиатуру uinput, поэтому для ОС
 * они неотличимы от реального ввода. Экземпляр живёт одну пачку
 * пост-действий и закрывает устройство в деструкторе.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <span>
#include <string>

#include "hotlaunch/config.hpp"
#include "hotlaunch/post_action.hpp"
#include "hotlaunch/types.hpp"

namespace hotlaunch {

/**
 * @brief Низкоуровневый приёмник событий клавиатуры
 *
 * Тесты подменяют его фейком, записывающим последовательность событий.
 */
class InputBackend {
public:
  virtual ~InputBackend() = default;

  /**
   * @brief Отправляет событие нажатия/отпускания и SYN
   * @return false если событие не удалось доставить
   */
  [[nodiscard]] virtual bool send_key(ScanCode code, KeyState state) = 0;
};

/**
 * @brief Виртуальная клавиатура через /dev/uinput
 */
class UinputBackend final : public InputBackend {
public:
  UinputBackend() = default;
  ~UinputBackend() override;

  // Запрет копирования (файловый дескриптор устройства)
  UinputBackend(const UinputBackend &) = delete;
  UinputBackend &operator=(const UinputBackend &) = delete;

  /**
   * @brief Создаёт виртуальное устройство
   * @param error Описание ошибки при неудаче
   * @return true если устройство создано
   */
  bool open(std::string &error);

  [[nodiscard]] bool send_key(ScanCode code, KeyState state) override;

private:
  [[nodiscard]] bool write_all(const void *data, std::size_t bytes);

  int fd_ = -1;
};

/// Фабрика бэкенда. Возвращает nullptr и заполняет error при неудаче.
using BackendFactory =
    std::function<std::unique_ptr<InputBackend>(std::string &error)>;

/// Фабрика по умолчанию: UinputBackend
[[nodiscard]] BackendFactory uinput_backend_factory();

/// Результат операции эмуляции
struct SimOutcome {
  SimResult result = SimResult::Ok;
  std::string error;

  [[nodiscard]] bool ok() const noexcept { return result == SimResult::Ok; }
};

/**
 * @brief Эмулятор клавиатуры уровня пост-действий
 */
class InputSimulator {
public:
  /**
   * @brief Захватывает платформенный бэкенд ввода
   * @param factory Фабрика бэкенда
   * @param delays Конфигурация задержек
   * @param error Причина неудачи
   * @return nullptr если бэкенд недоступен (например, headless-сессия)
   */
  [[nodiscard]] static std::unique_ptr<InputSimulator>
  create(const BackendFactory &factory, DelayConfig delays,
         std::string &error);

  InputSimulator(std::unique_ptr<InputBackend> backend,
                 DelayConfig delays) noexcept;

  InputSimulator(const InputSimulator &) = delete;
  InputSimulator &operator=(const InputSimulator &) = delete;

  /// Тип функции ожидания (тесты подставляют no-op)
  using WaitFunc = std::function<void(std::chrono::microseconds)>;

  void set_wait_func(WaitFunc func) noexcept { wait_func_ = std::move(func); }

  /**
   * @brief Вставка: модификатор вставки вниз, клик `v`, модификатор вверх
   */
  SimOutcome paste();

  /**
   * @brief Нажимает комбинацию
   *
   * Модификаторы нажимаются в указанном порядке и отпускаются в обратном.
   * Все токены разрешаются до отправки первого события: для неизвестной
   * клавиши или модификатора не отправляется ничего.
   */
  SimOutcome simulate_keystroke(const Keystroke &keystroke);

private:
  /// Аккорд: модификаторы + одна клавиша
  SimOutcome send_chord(std::span<const ScanCode> modifiers, ScanCode key);

  /// Отпускает уже нажатые модификаторы (LIFO), ошибки игнорируются
  void release_pressed(std::span<const ScanCode> pressed);

  void delay(std::chrono::microseconds us) const;

  std::unique_ptr<InputBackend> backend_;
  DelayConfig delays_;
  WaitFunc wait_func_;
};

} // namespace hotlaunch
