#pragma once

#include "pdt/concurrent/thread_safe_queue.hpp"
#include "pdt/notify/notification.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace pdt {

// -----------------------------------------------------------------------------
// NotificationPublisher: ZeroMQ PUB channel for store notifications
// -----------------------------------------------------------------------------
//
// @brief  Broadcasts every Notification handed to notify() as one JSON
//         message on a PUB socket, so dashboards and API processes observe
//         state changes without polling the database.
//
// @details
// notify() only enqueues. A dedicated worker thread drains the queue,
// serialises with nlohmann::json and sends with dontwait; a slow or absent
// subscriber therefore never stalls the write path. Messages are single
// frames; subscribers filter on the JSON "type" field.
//
// Notifications queued before start() are sent once the socket is bound.
// Messages still queued when stop() runs are flushed before the socket
// closes.
//
// Thread model:
//   start()/stop() from the owning thread (SchedulerEngine). notify() from
//   any thread.
//
// Ownership:
//   Owned by SchedulerEngine via std::unique_ptr. Owns the ZMQ context,
//   socket, queue and worker thread.
// -----------------------------------------------------------------------------
class NotificationPublisher final : public INotificationSink {
 public:
  explicit NotificationPublisher(std::string endpoint = "tcp://127.0.0.1:5557");
  ~NotificationPublisher() override;

  NotificationPublisher(const NotificationPublisher&) = delete;
  NotificationPublisher& operator=(const NotificationPublisher&) = delete;
  NotificationPublisher(NotificationPublisher&&) = delete;
  NotificationPublisher& operator=(NotificationPublisher&&) = delete;

  // Binds the PUB socket and spawns the worker. Idempotent. Throws
  // zmq::error_t if the endpoint cannot be bound.
  void start();

  // Flushes, joins the worker and closes the socket. Idempotent.
  void stop();

  void notify(Notification notification) override;

  std::uint64_t sentCount() const { return sent_.load(); }

  const std::string& endpoint() const { return endpoint_; }

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void send(const Notification& n);

  std::string endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Notification> queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> sent_{0};
};

}  // namespace pdt
