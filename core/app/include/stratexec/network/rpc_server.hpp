#pragma once

#include "stratexec/concurrent/keyed_worker_pool.hpp"
#include "stratexec/concurrent/thread_safe_queue.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace stratexec {

// -----------------------------------------------------------------------------
// RpcServer — ZeroMQ ROUTER front end with a worker pool
// -----------------------------------------------------------------------------
//
// @brief  Receives request payloads from any number of clients, runs them
//         on a pool of worker threads, and routes each reply back to the
//         client that sent the request.
//
// @details
// One ROUTER socket, bound to `endpoint`, is owned by the I/O thread. Both
// REQ clients (identity, empty delimiter, payload) and DEALER clients
// (identity, payload) are accepted; the reply mirrors the request framing.
//
//   I/O thread:  recv (ZMQ_RCVTIMEO = kPollTimeoutMs)
//                → router(payload) → KeyedWorkerPool lane
//                drain reply queue → send
//   workers:     lane → handler(payload) → reply queue
//
// The router names the (account, strategy) pair of a request. Requests of
// one pair wait in their lane rather than on a worker, so a backlog on one
// pair never keeps another pair's request from starting. ZeroMQ sockets are
// not thread-safe, so only the I/O thread touches the socket; workers hand
// replies over through the reply queue.
//
// Thread model:
//   Constructed and destroyed on the main thread. start() spawns the I/O
//   thread and `worker_count` workers; stop() drains in-flight work, then
//   joins everything. The handler is called concurrently from workers; the
//   router only from the I/O thread.
//
// Ownership:
//   Owns the ZMQ context, the socket, the worker pool, the reply queue and
//   the I/O thread. Holds copies of the handler and the router.
// -----------------------------------------------------------------------------
class RpcServer {
 public:
  using Handler = std::function<std::string(const std::string&)>;
  // Ordering key of a payload; empty means "no ordering".
  using Router = std::function<std::string(const std::string&)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  handler       Called for each request payload; returns the reply
  //                       payload. Must not throw.
  // @param  router        Maps a payload to its ordering key. Must not
  //                       throw. A null router runs every request
  //                       independently.
  // @param  endpoint      ZMQ endpoint for the ROUTER socket.
  // @param  worker_count  Worker threads (at least 1).
  //
  // @details
  // No sockets are opened and no threads are spawned here.
  // -------------------------------------------------------------------------
  RpcServer(Handler handler, Router router,
            std::string endpoint = "tcp://127.0.0.1:5560",
            std::size_t worker_count = 4);

  // RAII: calls stop().
  ~RpcServer();

  RpcServer(const RpcServer&) = delete;
  RpcServer& operator=(const RpcServer&) = delete;
  RpcServer(RpcServer&&) = delete;
  RpcServer& operator=(RpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  //
  // @brief  Binds the socket and spawns the I/O and worker threads.
  //
  // Idempotent. Throws zmq::error_t if the endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  //
  // @brief  Stops accepting work, lets workers finish what they hold, sends
  //         their replies, then closes the socket.
  //
  // @details
  // 1. Stop the worker pool: it rejects new jobs, so requests arriving from
  //    now on are answered immediately with a shutdown error envelope, and
  //    it runs every job already queued before its workers exit.
  // 2. Stop the I/O thread after it has flushed the reply queue.
  // 3. Close the socket and the context.
  //
  // Idempotent. Call from the owning thread.
  // -------------------------------------------------------------------------
  void stop();

  bool running() const { return running_.load(); }
  const std::string& endpoint() const { return endpoint_; }

 private:
  static constexpr int kPollTimeoutMs = 50;

  struct Message {
    std::string identity;
    bool delimited{false};  // REQ-style empty frame after the identity
    std::string payload;
  };

  void runIo();
  void dispatch(Message request);

  // Receives one request (all frames). Returns false on timeout.
  bool receive(Message& out);
  void send(const Message& reply);
  void flushReplies();

  static std::string shutdownReply();

  Handler handler_;
  Router router_;
  std::string endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> socket_;

  std::unique_ptr<KeyedWorkerPool> pool_;
  std::size_t worker_count_;
  ThreadSafeQueue<Message> replies_;

  std::thread io_thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> io_running_{false};
};

}  // namespace stratexec
