#pragma once

#include "../logging/Logger.h"
#include <algorithm>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <rxcpp/rx.hpp>
#include <shared_mutex>
#include <utility>
#include <vector>

namespace Feedwise {
namespace Rx {

/**
 * StateSubject<T> - Thread-safe reactive state container (BehaviorSubject pattern)
 *
 * Holds the current value and notifies subscribers on every next(). The
 * preference registry keeps one per profile; UI code subscribes to it to
 * re-render chip lists.
 *
 * - Reads return copies, so a caller never observes a value mid-update
 * - Subscribers are called outside the value lock with the value that was set
 * - New subscribers receive the current value immediately
 * - Deliveries are serialized, so every subscriber sees values in the order
 *   they were set and the initial value never arrives after a newer one
 * - asObservable() bridges into RxCpp for composition
 *
 * Usage:
 *   StateSubject<PreferenceSet> prefs;
 *   auto unsub = prefs.subscribe([](const PreferenceSet& p) { render(p); });
 *   prefs.next(updated);
 *   unsub();
 *
 * The subject must outlive every subscription taken from it.
 */
template <typename T> class StateSubject {
public:
  using Callback = std::function<void(const T &)>;
  using Unsubscriber = std::function<void()>;

  explicit StateSubject(T initialValue = T{}) : value_(std::move(initialValue)) {}

  StateSubject(const StateSubject &) = delete;
  StateSubject &operator=(const StateSubject &) = delete;

  T getValue() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return value_;
  }

  /**
   * Replace the value and notify all subscribers
   */
  void next(T newValue) {
    std::lock_guard<std::recursive_mutex> delivery(deliveryMutex_);

    std::vector<Callback> callbacksCopy;
    T published = newValue;
    {
      std::unique_lock<std::shared_mutex> lock(mutex_);
      value_ = std::move(newValue);
    }
    {
      std::shared_lock<std::shared_mutex> subLock(subscribersMutex_);
      for (const auto &[id, callback] : subscribers_)
        callbacksCopy.push_back(callback);
    }

    for (const auto &callback : callbacksCopy) {
      try {
        callback(published);
      } catch (const std::exception &e) {
        Util::logError("StateSubject", "Subscriber threw exception", e.what());
      }
    }
  }

  /**
   * Subscribe to value changes
   * Callback is invoked immediately with current value, then on each change.
   */
  Unsubscriber subscribe(Callback callback) {
    std::lock_guard<std::recursive_mutex> delivery(deliveryMutex_);

    int subscriptionId;
    {
      std::unique_lock<std::shared_mutex> lock(subscribersMutex_);
      subscriptionId = nextId_++;
      subscribers_.emplace_back(subscriptionId, callback);
    }

    try {
      callback(getValue());
    } catch (const std::exception &e) {
      Util::logError("StateSubject", "Subscriber threw exception", e.what());
    }

    return [this, subscriptionId]() { unsubscribe(subscriptionId); };
  }

  /**
   * Subscribe to a derived value. Only notifies when the selected value changes.
   *
   *   prefs.select<size_t>([](const PreferenceSet& p) { return p.blocked.size(); },
   *                        [](const size_t& count) { updateBadge(count); });
   */
  template <typename Derived>
  Unsubscriber select(std::function<Derived(const T &)> selector, std::function<void(const Derived &)> callback) {
    auto prevValue = std::make_shared<std::optional<Derived>>();
    auto prevMutex = std::make_shared<std::mutex>();

    return subscribe([sel = std::move(selector), cb = std::move(callback), prevValue, prevMutex](const T &state) {
      Derived currentValue = sel(state);
      {
        std::lock_guard<std::mutex> lock(*prevMutex);
        if (prevValue->has_value() && prevValue->value() == currentValue)
          return;
        *prevValue = currentValue;
      }
      cb(currentValue);
    });
  }

  /**
   * Observable that emits the current value, then every change.
   * Disposing the RxCpp subscription removes the underlying callback.
   */
  rxcpp::observable<T> asObservable() {
    return rxcpp::sources::create<T>([this](auto subscriber) {
      auto unsub = subscribe([subscriber](const T &value) {
        if (subscriber.is_subscribed())
          subscriber.on_next(value);
      });
      subscriber.add([unsub]() { unsub(); });
    }).as_dynamic();
  }

  size_t getSubscriberCount() const {
    std::shared_lock<std::shared_mutex> lock(subscribersMutex_);
    return subscribers_.size();
  }

private:
  void unsubscribe(int subscriptionId) {
    std::unique_lock<std::shared_mutex> lock(subscribersMutex_);
    auto it = std::find_if(subscribers_.begin(), subscribers_.end(),
                           [subscriptionId](const auto &pair) { return pair.first == subscriptionId; });
    if (it != subscribers_.end())
      subscribers_.erase(it);
  }

  T value_;
  mutable std::shared_mutex mutex_;

  std::vector<std::pair<int, Callback>> subscribers_;
  int nextId_ = 0;
  mutable std::shared_mutex subscribersMutex_;

  // Held while callbacks run; recursive so a callback may subscribe or publish
  std::recursive_mutex deliveryMutex_;
};

} // namespace Rx
} // namespace Feedwise
