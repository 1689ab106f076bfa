#include "rsvp/network/request_server.hpp"

#include <zmq_addon.hpp>

#include <chrono>
#include <exception>
#include <iostream>
#include <iterator>
#include <utility>

namespace rsvp {

namespace {

constexpr const char* kInternalErrorReply =
    R"({"status":500,"body":{"error":"internal error"}})";

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: store parameters for deferred socket creation
// -----------------------------------------------------------------------------
RequestServer::RequestServer(Handler handler, std::string endpoint,
                             std::size_t worker_count)
    : handler_(std::move(handler)),
      endpoint_(std::move(endpoint)),
      worker_count_(worker_count == 0 ? 1 : worker_count) {}

RequestServer::~RequestServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind sockets, then spawn workers and the dispatcher
// -----------------------------------------------------------------------------
void RequestServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);

  router_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::router);
  router_socket_->set(zmq::sockopt::linger, 0);
  router_socket_->bind(endpoint_);

  // Bound before any worker connects its PUSH socket.
  reply_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pull);
  reply_socket_->set(zmq::sockopt::linger, 0);
  reply_socket_->bind(kReplyEndpoint);

  running_.store(true);

  workers_.reserve(worker_count_);
  for (std::size_t i = 0; i < worker_count_; ++i) {
    workers_.emplace_back([this] { runWorker(); });
  }
  dispatcher_ = std::thread([this] { runDispatcher(); });

  std::cout << "[RequestServer] started. ROUTER=" << endpoint_
            << " workers=" << worker_count_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): dispatcher first, then one shutdown job per worker
// -----------------------------------------------------------------------------
void RequestServer::stop() {
  if (!running_.load()) {
    return;
  }

  running_.store(false);
  if (dispatcher_.joinable()) {
    dispatcher_.join();
  }

  for (std::size_t i = 0; i < workers_.size(); ++i) {
    Job job;
    job.shutdown = true;
    jobs_.push(std::move(job));
  }
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();

  // Requests still queued behind the shutdown jobs are never answered.
  while (jobs_.try_pop()) {
  }

  router_socket_.reset();
  reply_socket_.reset();
  context_.reset();

  std::cout << "[RequestServer] stopped.\n";
}

// -----------------------------------------------------------------------------
// runDispatcher(): poll ROUTER and the reply PULL socket
// -----------------------------------------------------------------------------
void RequestServer::runDispatcher() {
  zmq::pollitem_t items[] = {
      {router_socket_->handle(), 0, ZMQ_POLLIN, 0},
      {reply_socket_->handle(), 0, ZMQ_POLLIN, 0},
  };

  while (running_.load()) {
    try {
      zmq::poll(items, 2, std::chrono::milliseconds(kPollTimeoutMs));
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      throw;
    }

    if (items[1].revents & ZMQ_POLLIN) {
      forwardReply();
    }
    if (items[0].revents & ZMQ_POLLIN) {
      acceptRequest();
    }
  }
}

// -----------------------------------------------------------------------------
// acceptRequest(): split envelope from payload and queue the job
// -----------------------------------------------------------------------------
void RequestServer::acceptRequest() {
  std::vector<zmq::message_t> frames;
  auto received = zmq::recv_multipart(
      *router_socket_, std::back_inserter(frames), zmq::recv_flags::dontwait);
  if (!received.has_value() || frames.size() < 2) {
    // A ROUTER message always starts with the identity frame; anything
    // shorter carries no payload to answer.
    return;
  }

  Job job;
  job.payload = frames.back().to_string();
  frames.pop_back();
  job.envelope = std::move(frames);
  jobs_.push(std::move(job));
}

void RequestServer::forwardReply() {
  std::vector<zmq::message_t> frames;
  auto received = zmq::recv_multipart(
      *reply_socket_, std::back_inserter(frames), zmq::recv_flags::dontwait);
  if (!received.has_value()) {
    return;
  }
  // ROUTER silently drops replies for peers that have disconnected.
  auto sent =
      zmq::send_multipart(*router_socket_, frames, zmq::send_flags::dontwait);
  if (!sent.has_value()) {
    std::cerr << "[RequestServer] WARNING: reply dropped, client not "
                 "ready to receive.\n";
  }
}

// -----------------------------------------------------------------------------
// runWorker(): handle jobs until a shutdown job arrives
// -----------------------------------------------------------------------------
void RequestServer::runWorker() {
  zmq::socket_t push(*context_, zmq::socket_type::push);
  push.set(zmq::sockopt::linger, 0);
  push.connect(kReplyEndpoint);

  while (true) {
    Job job = jobs_.pop();
    if (job.shutdown) {
      break;
    }

    std::string reply;
    try {
      reply = handler_(job.payload);
    } catch (const std::exception& e) {
      std::cerr << "[RequestServer] handler failed: " << e.what() << "\n";
      reply = kInternalErrorReply;
    }

    std::vector<zmq::message_t> frames = std::move(job.envelope);
    frames.emplace_back(reply.data(), reply.size());
    // Blocking send on inproc PUSH; only fails if the context is closing.
    if (!zmq::send_multipart(push, frames).has_value()) {
      std::cerr << "[RequestServer] WARNING: reply could not be queued.\n";
    }
  }
}

}  // namespace rsvp
