/**
 * @file hotkey_dispatcher.hpp
 * @brief Реестр хоткеев и запуск цепочек в отдельных потоках
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "hotlaunch/post_action.hpp"
#include "hotlaunch/trigger_coordinator.hpp"

namespace hotlaunch {

/**
 * @brief Диспетчер срабатываний
 *
 * fire() не блокирует вызывающий поток (поток слушателя хоткеев): каждое
 * нажатие получает собственный поток с собственной цепочкой. Цепочки одного
 * и того же хоткея могут перекрываться.
 */
class HotkeyDispatcher {
public:
  explicit HotkeyDispatcher(const TriggerCoordinator &coordinator);

  /// Вызывает shutdown()
  ~HotkeyDispatcher();

  HotkeyDispatcher(const HotkeyDispatcher &) = delete;
  HotkeyDispatcher &operator=(const HotkeyDispatcher &) = delete;

  /**
   * @brief Регистрирует (или заменяет) хоткей
   * @return true если id новый
   */
  bool register_hotkey(const std::string &id, Trigger trigger);

  /// @return false если id не зарегистрирован
  bool unregister_hotkey(std::string_view id);

  void clear();

  [[nodiscard]] bool is_registered(std::string_view id) const;

  /// Отсортированный список id
  [[nodiscard]] std::vector<std::string> registered_ids() const;

  /**
   * @brief Запускает цепочку хоткея в новом потоке
   * @return false если id не зарегистрирован
   */
  bool fire(std::string_view id);

  /// Блокирует до завершения всех запущенных цепочек
  void wait_idle();

  /**
   * @brief Останавливает цепочки и дожидается их
   *
   * Ожидание процессов и паузы прерываются, запущенные программы
   * продолжают работать. Цепочки, запущенные после вызова, не затрагиваются.
   */
  void shutdown();

  /// Число цепочек, которые ещё выполняются
  [[nodiscard]] std::size_t active_chains() const;

private:
  struct Chain {
    std::atomic<bool> done{false};
    std::jthread thread;
  };

  /// Собирает завершившиеся потоки (под chains_mutex_)
  void reap_finished_locked();

  const TriggerCoordinator &coordinator_;

  mutable std::shared_mutex registry_mutex_;
  std::map<std::string, std::shared_ptr<const Trigger>, std::less<>> registry_;

  mutable std::mutex chains_mutex_;
  std::list<Chain> chains_;
};

} // namespace hotlaunch
