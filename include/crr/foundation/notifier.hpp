#pragma once

/// @file notifier.hpp
/// @brief Thread-safe observer list used for breaker state-change delivery.
///
/// Observers are called in subscription order on the notifying thread.
/// The observer list is copied under a shared lock and invoked after the
/// lock is released, so an observer may subscribe or unsubscribe from
/// inside its own callback.

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <utility>
#include <vector>

namespace crr::foundation {

/// Observer list dispatching @p Args to every subscriber.
///
/// @code
///   Notifier<const StateChangeEvent&> stateChanged;
///   auto sub = stateChanged.subscribe([](const StateChangeEvent& e) { ... });
///   stateChanged.notify(event);
///   stateChanged.unsubscribe(sub);
/// @endcode
template <typename... Args>
class Notifier {
public:
    using Observer = std::function<void(Args...)>;
    using SubscriptionId = uint64_t;

private:
    struct State {
        std::map<SubscriptionId, Observer> observers;
        std::atomic<SubscriptionId> nextId{1};
        mutable std::shared_mutex mutex;
    };

public:
    Notifier() : state_(std::make_shared<State>()) {}

    Notifier(const Notifier&) = delete;
    Notifier& operator=(const Notifier&) = delete;

    /// Register an observer; the id is used to unsubscribe.
    SubscriptionId subscribe(Observer observer) {
        auto id = state_->nextId.fetch_add(1, std::memory_order_relaxed);
        std::unique_lock lock(state_->mutex);
        state_->observers.emplace(id, std::move(observer));
        return id;
    }

    /// Remove an observer. Unknown ids are ignored.
    void unsubscribe(SubscriptionId id) {
        std::unique_lock lock(state_->mutex);
        state_->observers.erase(id);
    }

    /// Deliver @p args to every observer registered at call time.
    void notify(Args... args) const {
        std::vector<Observer> observers;
        {
            std::shared_lock lock(state_->mutex);
            observers.reserve(state_->observers.size());
            for (const auto& [id, observer] : state_->observers) {
                observers.push_back(observer);
            }
        }
        for (const auto& observer : observers) {
            observer(args...);
        }
    }

    [[nodiscard]] std::size_t observerCount() const {
        std::shared_lock lock(state_->mutex);
        return state_->observers.size();
    }

    /// RAII subscription that unsubscribes on destruction.
    ///
    /// Holds only a weak reference to the notifier's observer list, so it
    /// may safely outlive the notifier it came from.
    class Subscription {
    public:
        Subscription() = default;
        ~Subscription() { reset(); }

        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        Subscription(Subscription&& other) noexcept
            : state_(std::move(other.state_)), id_(std::exchange(other.id_, 0)) {}

        Subscription& operator=(Subscription&& other) noexcept {
            if (this != &other) {
                reset();
                state_ = std::move(other.state_);
                id_ = std::exchange(other.id_, 0);
            }
            return *this;
        }

        void reset() {
            if (auto state = state_.lock()) {
                std::unique_lock lock(state->mutex);
                state->observers.erase(id_);
            }
            state_.reset();
            id_ = 0;
        }

        [[nodiscard]] bool active() const { return !state_.expired() && id_ != 0; }

    private:
        friend class Notifier;

        Subscription(std::weak_ptr<State> state, SubscriptionId id)
            : state_(std::move(state)), id_(id) {}

        std::weak_ptr<State> state_;
        SubscriptionId id_ = 0;
    };

    /// Subscribe and tie the subscription's lifetime to the returned handle.
    [[nodiscard]] Subscription scopedSubscribe(Observer observer) {
        auto id = subscribe(std::move(observer));
        return Subscription(state_, id);
    }

private:
    std::shared_ptr<State> state_;
};

} // namespace crr::foundation
