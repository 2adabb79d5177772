/**
 * @file hotkey_dispatcher.cpp
 * @brief Реализация диспетчера срабатываний
 */

#include "hotlaunch/hotkey_dispatcher.hpp"

#include <iostream>

namespace hotlaunch {

HotkeyDispatcher::HotkeyDispatcher(const TriggerCoordinator &coordinator)
    : coordinator_{coordinator} {}

HotkeyDispatcher::~HotkeyDispatcher() { shutdown(); }

bool HotkeyDispatcher::register_hotkey(const std::string &id, Trigger trigger) {
  auto shared = std::make_shared<const Trigger>(std::move(trigger));

  std::unique_lock lock{registry_mutex_};
  auto [it, inserted] = registry_.insert_or_assign(id, std::move(shared));
  return inserted;
}

bool HotkeyDispatcher::unregister_hotkey(std::string_view id) {
  std::unique_lock lock{registry_mutex_};
  auto it = registry_.find(id);
  if (it == registry_.end()) {
    return false;
  }
  registry_.erase(it);
  return true;
}

void HotkeyDispatcher::clear() {
  std::unique_lock lock{registry_mutex_};
  registry_.clear();
}

bool HotkeyDispatcher::is_registered(std::string_view id) const {
  std::shared_lock lock{registry_mutex_};
  return registry_.find(id) != registry_.end();
}

std::vector<std::string> HotkeyDispatcher::registered_ids() const {
  std::shared_lock lock{registry_mutex_};
  std::vector<std::string> ids;
  ids.reserve(registry_.size());
  for (const auto &[id, trigger] : registry_) {
    ids.push_back(id);
  }
  return ids;
}

bool HotkeyDispatcher::fire(std::string_view id) {
  // Снимок триггера: цепочка не зависит от последующих изменений реестра
  std::shared_ptr<const Trigger> trigger;
  {
    std::shared_lock lock{registry_mutex_};
    auto it = registry_.find(id);
    if (it == registry_.end()) {
      std::cerr << "[hotlaunch] Unknown hotkey: " << id << "\n";
      return false;
    }
    trigger = it->second;
  }

  std::lock_guard lock{chains_mutex_};
  reap_finished_locked();

  auto &chain = chains_.emplace_back();
  chain.thread =
      std::jthread([this, trigger, &done = chain.done](std::stop_token stop) {
        (void)coordinator_.run(*trigger, std::move(stop));
        done.store(true, std::memory_order_release);
      });
  return true;
}

void HotkeyDispatcher::wait_idle() {
  while (true) {
    std::list<Chain> pending;
    {
      std::lock_guard lock{chains_mutex_};
      if (chains_.empty()) {
        return;
      }
      pending.splice(pending.end(), chains_);
    }
    // Деструкторы jthread делают join вне блокировки
    pending.clear();
  }
}

void HotkeyDispatcher::shutdown() {
  {
    std::lock_guard lock{chains_mutex_};
    for (auto &chain : chains_) {
      chain.thread.request_stop();
    }
  }
  wait_idle();
}

std::size_t HotkeyDispatcher::active_chains() const {
  std::lock_guard lock{chains_mutex_};
  std::size_t count = 0;
  for (const auto &chain : chains_) {
    if (!chain.done.load(std::memory_order_acquire)) {
      ++count;
    }
  }
  return count;
}

void HotkeyDispatcher::reap_finished_locked() {
  for (auto it = chains_.begin(); it != chains_.end();) {
    if (it->done.load(std::memory_order_acquire)) {
      it = chains_.erase(it);
    } else {
      ++it;
    }
  }
}

} // namespace hotlaunch
