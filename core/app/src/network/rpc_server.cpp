#include "stratexec/network/rpc_server.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cerrno>
#include <iostream>
#include <memory>
#include <utility>

namespace stratexec {

// -----------------------------------------------------------------------------
// Constructor: store parameters for deferred socket creation
// -----------------------------------------------------------------------------
RpcServer::RpcServer(Handler handler, Router router, std::string endpoint,
                     std::size_t worker_count)
    : handler_(std::move(handler)),
      router_(std::move(router)),
      endpoint_(std::move(endpoint)),
      worker_count_(std::max<std::size_t>(1, worker_count)) {}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
RpcServer::~RpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind the ROUTER socket, spawn I/O thread and workers
// -----------------------------------------------------------------------------
void RpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  socket_ = std::make_unique<zmq::socket_t>(*context_,
                                            zmq::socket_type::router);
  socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  socket_->set(zmq::sockopt::linger, 0);
  socket_->bind(endpoint_);

  pool_ = std::make_unique<KeyedWorkerPool>(worker_count_);
  pool_->start();

  running_.store(true);
  io_running_.store(true);

  io_thread_ = std::thread([this] { runIo(); });

  std::cout << "[RpcServer] started. ROUTER=" << endpoint_
            << " workers=" << worker_count_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): drain workers, flush replies, close the socket
// -----------------------------------------------------------------------------
void RpcServer::stop() {
  if (!running_.load()) {
    return;
  }

  // ---  1) No new jobs; queued ones still run, then the workers exit ---------
  pool_->stop();

  // ---  2) Stop the I/O thread (flushes remaining replies) ---------------------
  io_running_.store(false);
  if (io_thread_.joinable()) {
    io_thread_.join();
  }

  // ---  3) Close socket, context and pool ------------------------------------
  pool_.reset();
  socket_.reset();
  context_.reset();
  running_.store(false);

  std::cout << "[RpcServer] stopped.\n";
}

// -----------------------------------------------------------------------------
// runIo(): the only thread that touches the socket
// -----------------------------------------------------------------------------
void RpcServer::runIo() {
  while (io_running_.load()) {
    flushReplies();

    Message request;
    if (!receive(request)) {
      continue;
    }
    dispatch(std::move(request));
  }

  // Final flush: replies produced by the last jobs.
  flushReplies();
}

// -----------------------------------------------------------------------------
// dispatch(): route one request into its lane; the job answers on a worker
// -----------------------------------------------------------------------------
void RpcServer::dispatch(Message request) {
  const std::string key = router_ ? router_(request.payload) : std::string();
  const std::string identity = request.identity;
  const bool delimited = request.delimited;

  auto shared = std::make_shared<Message>(std::move(request));
  bool accepted = pool_->submit(key, [this, shared] {
    std::string payload;
    try {
      payload = handler_(shared->payload);
    } catch (const std::exception& e) {
      std::cerr << "[RpcServer] handler failed: " << e.what() << "\n";
      nlohmann::json reply;
      reply["ok"] = false;
      reply["error"] = {{"code", "INTERNAL"}, {"message", e.what()}};
      payload =
          reply.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    replies_.push(Message{std::move(shared->identity), shared->delimited,
                          std::move(payload)});
  });
  if (!accepted) {
    send(Message{identity, delimited, shutdownReply()});
  }
}

// -----------------------------------------------------------------------------
// receive(): one multipart request
// -----------------------------------------------------------------------------
bool RpcServer::receive(Message& out) {
  std::vector<std::string> frames;
  zmq::message_t frame;
  zmq::recv_result_t result;

  try {
    result = socket_->recv(frame, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return false;
    }
    throw;
  }

  if (!result.has_value()) {
    return false;
  }

  frames.emplace_back(static_cast<const char*>(frame.data()), frame.size());
  while (frame.more()) {
    result = socket_->recv(frame, zmq::recv_flags::none);
    if (!result.has_value()) {
      break;
    }
    frames.emplace_back(static_cast<const char*>(frame.data()), frame.size());
  }

  if (frames.size() < 2) {
    std::cerr << "[RpcServer] WARNING: dropped request without payload.\n";
    return false;
  }

  out.identity = std::move(frames.front());
  out.delimited = frames.size() >= 3 && frames[1].empty();
  out.payload = std::move(frames.back());
  return true;
}

// -----------------------------------------------------------------------------
// send(): identity [+ empty delimiter] + payload
// -----------------------------------------------------------------------------
void RpcServer::send(const Message& reply) {
  zmq::message_t identity(reply.identity.data(), reply.identity.size());
  zmq::message_t payload(reply.payload.data(), reply.payload.size());

  auto sent = socket_->send(identity, zmq::send_flags::sndmore);
  if (sent.has_value() && reply.delimited) {
    zmq::message_t delimiter;
    sent = socket_->send(delimiter, zmq::send_flags::sndmore);
  }
  if (sent.has_value()) {
    sent = socket_->send(payload, zmq::send_flags::none);
  }
  if (!sent.has_value()) {
    std::cerr << "[RpcServer] WARNING: reply could not be sent.\n";
  }
}

void RpcServer::flushReplies() {
  while (auto reply = replies_.try_pop()) {
    send(*reply);
  }
}

std::string RpcServer::shutdownReply() {
  nlohmann::json reply;
  reply["ok"] = false;
  reply["error"] = {{"code", "UNAVAILABLE"},
                    {"message", "server is shutting down"}};
  return reply.dump();
}

}  // namespace stratexec
