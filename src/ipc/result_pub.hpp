#pragma once
#include <zmq.h>
#include <string>

/**
 * @brief ZeroMQ publisher for run results
 *
 * Publishes the JSON summary of an analysis run as a two-part message
 * (topic, payload) on a PUB socket.
 *
 * Message format:
 * "grid" | {"name": ..., "magnetics": {...}, "estimates": <n>, "grid": {...}}
 */
struct ResultPub {
  void* ctx{nullptr};  ///< ZeroMQ context
  void* pub{nullptr};  ///< ZeroMQ PUB socket
  std::string endpoint;
  bool bound{false};

  /**
   * @brief Constructor - creates and binds publisher socket
   * @param ep Endpoint to bind, e.g. "tcp://127.0.0.1:5557"
   */
  explicit ResultPub(const std::string& ep) : endpoint(ep) {
    ctx = zmq_ctx_new();
    pub = zmq_socket(ctx, ZMQ_PUB);
    bound = zmq_bind(pub, endpoint.c_str()) == 0;
  }

  ResultPub(const ResultPub&) = delete;
  ResultPub& operator=(const ResultPub&) = delete;

  /**
   * @brief Destructor - cleanup ZeroMQ resources
   */
  ~ResultPub() {
    int linger = 0;
    zmq_setsockopt(pub, ZMQ_LINGER, &linger, sizeof(linger));
    zmq_close(pub);
    zmq_ctx_term(ctx);
  }

  bool is_connected() const { return bound; }

  const std::string& get_bind_address() const { return endpoint; }

  /**
   * @brief Send a message under a topic
   * @return true if both parts were queued
   */
  bool send(const std::string& topic, const std::string& payload) {
    if (!bound) return false;
    if (zmq_send(pub, topic.data(), topic.size(), ZMQ_SNDMORE) < 0) return false;
    return zmq_send(pub, payload.data(), payload.size(), 0) >= 0;
  }
};
