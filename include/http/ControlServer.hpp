#pragma once
/** @file  ControlServer.hpp
 *  @brief HTTP/1.1 listener: async accept, one detached worker thread per connection.
 *
 *  © 2025 deskctl contributors — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

// 3rd-party headers
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

// deskctl headers
#include "core/Settings.hpp"

namespace deskctl::core {
  class Logger;
}

namespace deskctl::http {

  class ControlApi;

  /**
 * @class ControlServer
 * @brief Accepts on the caller's io_context; each connection is served
 *        synchronously on its own thread (one request, then close).
 *
 *  * Unbounded worker count: the reconciler's switch lock is what serializes
 *    the expensive path.
 *  * `stop()` closes the acceptor; `waitForSessions()` blocks until the
 *    in-flight workers are done.
 */
  class ControlServer {
  public:
    ControlServer(boost::asio::io_context& io, ControlApi& api, core::ServerSettings settings, core::Logger& log);

    /// Bind + listen; throws std::runtime_error when the address is unusable.
    void listen();
    /// Queue the first async_accept; io_context::run() drives the loop.
    void startAccepting();
    void stop();
    void waitForSessions();

    std::uint16_t port() const; ///< bound port, useful with port 0
    std::size_t activeSessions() const { return active_; }

    static constexpr std::chrono::seconds kReadTimeout{ 30 };

  private:
    void doAccept();
    void spawnSession(boost::asio::ip::tcp::socket socket);
    void serve(boost::asio::ip::tcp::socket& socket);
    void sessionDone();

    boost::asio::io_context& io_;
    boost::asio::ip::tcp::acceptor acceptor_;
    ControlApi& api_;
    core::ServerSettings settings_;
    core::Logger& log_;

    std::atomic<std::size_t> active_{ 0 };
    std::mutex drainMtx_;
    std::condition_variable drained_;
  };

} // namespace deskctl::http
