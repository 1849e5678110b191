/* @file ControlServer.cpp
 * @brief boost::asio acceptor + boost::beast synchronous per-connection workers
 *
 * © 2025 deskctl contributors — MIT-licensed.
 */

// STL headers
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>

// Linux headers
#include <sys/socket.h> // setsockopt, SO_RCVTIMEO
#include <sys/time.h>

// 3rd-party headers
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>

// deskctl headers
#include "core/Logger.hpp"
#include "http/ControlApi.hpp"
#include "http/ControlServer.hpp"
#include "http/JsonCodec.hpp"

#ifndef DESKCTL_VERSION
#define DESKCTL_VERSION "0.0.0"
#endif

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
using tcp = boost::asio::ip::tcp;

using namespace deskctl::http;

namespace {
  constexpr const char* kComponent = "server";
  constexpr const char* kServerName = "deskctl/" DESKCTL_VERSION;

  // blocking read/write on a worker thread must not hang on a silent client
  bool applySocketTimeouts(tcp::socket& socket, std::chrono::seconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count());
    int fd = socket.native_handle();
    return ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0 &&
           ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
  }
} // namespace

ControlServer::ControlServer(asio::io_context& io, ControlApi& api, core::ServerSettings settings,
                             core::Logger& log)
    : io_(io), acceptor_(io), api_(api), settings_(std::move(settings)), log_(log) {}

void ControlServer::listen() {
  boost::system::error_code ec;
  auto address = asio::ip::make_address(settings_.host, ec);
  if (ec)
    throw std::runtime_error("[ControlServer] invalid listen address '" + settings_.host + "': " + ec.message());

  tcp::endpoint endpoint{ address, settings_.port };
  acceptor_.open(endpoint.protocol(), ec);
  if (!ec)
    acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
  if (!ec)
    acceptor_.bind(endpoint, ec);
  if (!ec)
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
  if (ec)
    throw std::runtime_error("[ControlServer] cannot listen on " + settings_.host + ":" +
                             std::to_string(settings_.port) + ": " + ec.message());

  log_.info(kComponent, std::string("listening on ") + settings_.host + ":" + std::to_string(port()));
}

std::uint16_t ControlServer::port() const {
  boost::system::error_code ec;
  auto ep = acceptor_.local_endpoint(ec);
  return ec ? settings_.port : ep.port();
}

void ControlServer::startAccepting() { doAccept(); }

void ControlServer::stop() {
  asio::post(io_, [this] {
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec)
      log_.warn(kComponent, "closing acceptor: " + ec.message());
  });
}

void ControlServer::doAccept() {
  acceptor_.async_accept([this](boost::system::error_code ec, tcp::socket socket) {
    if (ec == asio::error::operation_aborted || !acceptor_.is_open())
      return; // stop() closed us
    if (ec)
      log_.warn(kComponent, "accept failed: " + ec.message());
    else
      spawnSession(std::move(socket));
    doAccept();
  });
}

void ControlServer::spawnSession(tcp::socket socket) {
  ++active_;
  auto owned = std::make_unique<tcp::socket>(std::move(socket));
  try {
    std::thread([this, s = std::move(owned)]() mutable {
      try {
        serve(*s);
      } catch (const std::exception& e) {
        log_.error(kComponent, std::string("session aborted: ") + e.what());
      }
      // the socket deregisters from the io_context, which may die once the count drains
      s.reset();
      sessionDone();
    }).detach();
  } catch (const std::system_error& e) {
    // could not get a thread; the socket closes with the lambda
    log_.error(kComponent, std::string("cannot start worker thread: ") + e.what());
    sessionDone();
  }
}

void ControlServer::sessionDone() {
  std::lock_guard<std::mutex> lock(drainMtx_);
  if (--active_ == 0)
    drained_.notify_all();
}

void ControlServer::waitForSessions() {
  std::unique_lock<std::mutex> lock(drainMtx_);
  drained_.wait(lock, [this] { return active_ == 0; });
}

void ControlServer::serve(tcp::socket& socket) {
  if (!applySocketTimeouts(socket, kReadTimeout))
    log_.warn(kComponent, "cannot set socket timeouts, serving without them");

  beast::flat_buffer buffer;
  bhttp::request<bhttp::string_body> req;
  beast::error_code ec;
  bhttp::read(socket, buffer, req, ec);
  if (ec) {
    if (ec != bhttp::error::end_of_stream)
      log_.debug(kComponent, "read failed: " + ec.message());
    return;
  }

  Reply reply = api_.handle(std::string(req.method_string()), std::string(req.target()));

  bhttp::response<bhttp::string_body> res{ static_cast<bhttp::status>(reply.status), req.version() };
  res.set(bhttp::field::server, kServerName);
  res.set(bhttp::field::content_type, "application/json; charset=utf-8");
  res.set(bhttp::field::cache_control, "no-store, no-cache, must-revalidate, max-age=0");
  res.set(bhttp::field::pragma, "no-cache");
  res.keep_alive(false);
  res.body() = serialize(reply.body);
  res.prepare_payload();

  bhttp::write(socket, res, ec);
  if (ec) {
    // client went away (broken pipe / reset); nothing to report back
    log_.debug(kComponent, "write failed: " + ec.message());
    return;
  }
  socket.shutdown(tcp::socket::shutdown_send, ec);
}
