#include "pdt/concurrent/event_loop_thread.hpp"

#include <chrono>

namespace pdt {

namespace {

// Upper bound on how long an idle worker sleeps before re-checking running_.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::~EventLoopThread() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  wake_cv_.notify_all();
  thread_.join();
}

// -----------------------------------------------------------------------------
// run(): worker loop
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    if (std::optional<Event> event = queue_.try_pop()) {
      bus_.publish(*event);
      continue;
    }

    std::unique_lock lock(wake_mutex_);
    wake_cv_.wait_for(lock, kIdleWaitTimeout, [this] {
      return !running_.load() || !queue_.empty();
    });
  }

  // Drain what was pushed before stop().
  while (std::optional<Event> event = queue_.try_pop()) {
    bus_.publish(*event);
  }
}

}  // namespace pdt
