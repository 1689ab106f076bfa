#pragma once

#include "rsvp/concurrent/thread_safe_queue.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace rsvp {

// -----------------------------------------------------------------------------
// RequestServer: ZeroMQ ROUTER front end with a worker pool
// -----------------------------------------------------------------------------
//
// @brief  Accepts request frames on a ROUTER socket and runs the handler for
//         each one on a pool of worker threads.
//
// @details
// Sockets and threads:
//
//   clients (REQ / DEALER)
//        |
//        v
//   ROUTER  <endpoint>              \
//   PULL    inproc://rsvp-replies    >  dispatcher thread (zmq::poll)
//        |                          /
//        | Job{envelope, payload}
//        v
//   ThreadSafeQueue<Job>
//        |
//        v
//   worker x N  -> handler(payload) -> PUSH inproc://rsvp-replies
//
// ZeroMQ sockets must not be shared between threads, so only the
// dispatcher touches the ROUTER. Workers send their replies (routing
// envelope plus reply frame) over their own PUSH socket; the dispatcher
// forwards them to the ROUTER. A request blocked on the SQLite lock
// therefore holds one worker, never the dispatcher.
//
// Framing: all frames except the last form the routing envelope (the
// client identity, plus the empty delimiter for REQ clients) and are sent
// back unchanged. The last frame is the request payload.
//
// Lifecycle: start() binds and spawns the threads; stop() (also called by
// the destructor) stops the dispatcher, drains the workers with one
// shutdown job each, joins everything and closes the context. Both are
// idempotent. start() throws zmq::error_t if the endpoint cannot be bound.
//
// Thread model: start()/stop() from the owning thread only. The handler is
//               invoked concurrently from all workers and must be
//               thread-safe (RequestRouter::handle is).
// -----------------------------------------------------------------------------
class RequestServer {
 public:
  using Handler = std::function<std::string(const std::string&)>;

  RequestServer(Handler handler, std::string endpoint,
                std::size_t worker_count);

  ~RequestServer();

  RequestServer(const RequestServer&) = delete;
  RequestServer& operator=(const RequestServer&) = delete;
  RequestServer(RequestServer&&) = delete;
  RequestServer& operator=(RequestServer&&) = delete;

  void start();
  void stop();

  bool isRunning() const { return running_.load(); }
  const std::string& endpoint() const { return endpoint_; }
  std::size_t workerCount() const { return worker_count_; }

 private:
  static constexpr int kPollTimeoutMs = 50;
  static constexpr const char* kReplyEndpoint = "inproc://rsvp-replies";

  struct Job {
    std::vector<zmq::message_t> envelope;
    std::string payload;
    bool shutdown{false};
  };

  void runDispatcher();
  void runWorker();

  void acceptRequest();
  void forwardReply();

  Handler handler_;
  std::string endpoint_;
  std::size_t worker_count_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> router_socket_;
  std::unique_ptr<zmq::socket_t> reply_socket_;

  ThreadSafeQueue<Job> jobs_;
  std::thread dispatcher_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace rsvp
