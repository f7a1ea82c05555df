#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace sl {

// Single-threaded publish/subscribe channel for one event type.
// subscribe() returns a move-only handle that unsubscribes on destruction.
template <typename T>
class EventStream {
public:
  using Callback = std::function<void(const T&)>;

private:
  struct Listener {
    std::size_t id{0};
    Callback callback;
  };
  struct State {
    std::vector<Listener> listeners;
    std::size_t nextId{1};
  };

public:
  class Subscription {
  public:
    Subscription() = default;
    Subscription(std::weak_ptr<State> state, std::size_t id)
      : state_(std::move(state)), id_(id) {}
    ~Subscription() { reset(); }

    Subscription(Subscription&& other) noexcept
      : state_(std::move(other.state_)), id_(other.id_) {
      other.id_ = 0;
    }
    Subscription& operator=(Subscription&& other) noexcept {
      if (this != &other) {
        reset();
        state_ = std::move(other.state_);
        id_ = other.id_;
        other.id_ = 0;
      }
      return *this;
    }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    void reset() {
      if (id_ == 0) return;
      if (auto s = state_.lock()) {
        auto& ls = s->listeners;
        for (auto it = ls.begin(); it != ls.end(); ++it) {
          if (it->id == id_) {
            ls.erase(it);
            break;
          }
        }
      }
      state_.reset();
      id_ = 0;
    }

    bool active() const { return id_ != 0 && !state_.expired(); }

  private:
    std::weak_ptr<State> state_;
    std::size_t id_{0};
  };

  EventStream() : state_(std::make_shared<State>()) {}

  EventStream(const EventStream&) = delete;
  EventStream& operator=(const EventStream&) = delete;

  Subscription subscribe(Callback callback) {
    std::size_t id = state_->nextId++;
    state_->listeners.push_back({id, std::move(callback)});
    return Subscription(state_, id);
  }

  // Listeners removed by an earlier callback in the same publish are skipped.
  void publish(const T& event) {
    std::vector<std::size_t> ids;
    ids.reserve(state_->listeners.size());
    for (const auto& l : state_->listeners) ids.push_back(l.id);

    for (std::size_t id : ids) {
      Callback cb;
      for (const auto& l : state_->listeners) {
        if (l.id == id) {
          cb = l.callback;
          break;
        }
      }
      if (cb) cb(event);
    }
  }

  std::size_t listenerCount() const { return state_->listeners.size(); }
  void clear() { state_->listeners.clear(); }

private:
  std::shared_ptr<State> state_;
};

} // namespace sl
