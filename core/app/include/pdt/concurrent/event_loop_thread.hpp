#pragma once

#include "pdt/concurrent/thread_safe_queue.hpp"
#include "pdt/eventbus/event_bus.hpp"
#include "pdt/events/event.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace pdt {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// Responsibility: Owns one worker thread that drains a ThreadSafeQueue<Event>
// and publishes each event on the given EventBus from that thread. Producers
// on other threads call push(); the subscribers for those events therefore
// run serialised on the loop thread.
//
// SchedulerEngine uses one loop as its analysis thread: market data pushed
// from any thread is analysed there, one event at a time.
//
// Thread model: start()/stop() from the owning thread; push() from any
// thread. The bus must outlive the loop.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  explicit EventLoopThread(EventBus& bus) : bus_(bus) {}

  // Joins the worker if still running.
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // Starts the worker. No-op when already running.
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // Wakes and joins the worker. Events still queued are published first, so
  // everything pushed before stop() is processed. Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  void push(Event event) {
    queue_.push(std::move(event));
    wake_cv_.notify_all();
  }

  bool running() const { return running_.load(); }

  std::size_t pending() const { return queue_.size(); }

 private:
  void run();

  EventBus& bus_;
  ThreadSafeQueue<Event> queue_;
  std::atomic<bool> running_{false};

  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;

  std::thread thread_;
};

}  // namespace pdt
