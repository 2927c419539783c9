#include "pdt/network/notification_publisher.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace pdt {

// -----------------------------------------------------------------------------
// Constructor: store the endpoint for deferred socket creation
// -----------------------------------------------------------------------------
NotificationPublisher::NotificationPublisher(std::string endpoint)
    : endpoint_(std::move(endpoint)) {}

NotificationPublisher::~NotificationPublisher() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind PUB socket and spawn worker thread
// -----------------------------------------------------------------------------
void NotificationPublisher::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);
  pub_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->bind(endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[NotificationPublisher] started. PUB=" << endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal, join, close
// -----------------------------------------------------------------------------
void NotificationPublisher::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);

  if (thread_.joinable()) {
    thread_.join();
  }

  pub_socket_.reset();
  context_.reset();

  std::cout << "[NotificationPublisher] stopped. sent=" << sent_.load()
            << "\n";
}

void NotificationPublisher::notify(Notification notification) {
  queue_.push(std::move(notification));
}

// -----------------------------------------------------------------------------
// run(): drain queue onto the PUB socket
// -----------------------------------------------------------------------------
void NotificationPublisher::run() {
  while (running_.load()) {
    if (auto n = queue_.pop_for(std::chrono::milliseconds(kPollTimeoutMs))) {
      send(*n);
    }
  }

  // Final drain before the socket closes.
  while (auto n = queue_.try_pop()) {
    send(*n);
  }
}

void NotificationPublisher::send(const Notification& n) {
  try {
    const std::string payload = n.serialize();
    zmq::message_t msg(payload.data(), payload.size());
    if (pub_socket_->send(msg, zmq::send_flags::dontwait)) {
      sent_.fetch_add(1);
    }
  } catch (const zmq::error_t& e) {
    std::cerr << "[NotificationPublisher] WARNING: dropped '" << n.type
              << "': " << e.what() << "\n";
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[NotificationPublisher] ERROR: cannot serialize '" << n.type
              << "': " << e.what() << "\n";
  }
}

}  // namespace pdt
