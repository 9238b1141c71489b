#ifndef ASYNC_OUTCOME_HPP
#define ASYNC_OUTCOME_HPP

#include <trantor/net/EventLoop.h>

#include <coroutine>
#include <functional>
#include <optional>
#include <utility>

/**
 * @brief Awaits a callback-style SDK call without blocking the event loop.
 * The start function receives a completion callback, which may be invoked on
 * any thread. The awaiting coroutine resumes on the event loop it suspended
 * on, or on the completing thread when it was not running on a loop.
 */
template <typename Outcome>
class AsyncOutcomeAwaiter {
 public:
  using Complete = std::function<void(Outcome)>;
  using Start = std::function<void(Complete)>;

  explicit AsyncOutcomeAwaiter(Start start) : start_(std::move(start)) {}

  bool await_ready() const noexcept { return false; }

  void await_suspend(std::coroutine_handle<> handle) {
    trantor::EventLoop *loop =
        trantor::EventLoop::getEventLoopOfCurrentThread();
    // The coroutine, and this awaiter with it, may be gone once the
    // completion ran, so the start function must not live in the awaiter
    Start start = std::move(start_);
    start([this, handle, loop](Outcome outcome) {
      outcome_.emplace(std::move(outcome));
      if (loop != nullptr) {
        loop->queueInLoop([handle] { handle.resume(); });
      } else {
        handle.resume();
      }
    });
  }

  Outcome await_resume() { return std::move(*outcome_); }

 private:
  Start start_;
  std::optional<Outcome> outcome_;
};

#endif  // ASYNC_OUTCOME_HPP
