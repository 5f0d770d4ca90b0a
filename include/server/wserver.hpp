#pragma once
#include <boost/asio.hpp>
#include <atomic>
#include <memory>
#include <unordered_map>
#include <string>
#include "config/ServerConfig.hpp"
#include "const/rest_enums.hpp"
#include "http/RateLimiter.hpp"
#include "http/Request.hpp"
#include "server/endpoint.hpp"

namespace chunkd {

class wServer
{
  boost::asio::io_context io_context_;
  boost::asio::ip::tcp::acceptor acceptor_;
  boost::asio::signal_set signals_;
  boost::asio::thread_pool workers_;
  std::unordered_map<std::string, endpoint> handlers_;
  http::RateLimiter limiter_;
  std::string bind_;
  uint16_t port_;
  size_t max_body_;
  std::atomic<bool> stopping_{false};

  void do_accept();
  void serve_client(boost::asio::ip::tcp::socket& socket);

  // Reads one request; on failure returns false and sets an error status (0 = drop silently)
  bool read_request(boost::asio::ip::tcp::socket& socket, http::Request& req, int& error_status);
  static void parse_body(http::Request& req, const std::string& content_type);
  static void write_response(boost::asio::ip::tcp::socket& socket, const http::Response& resp);

public:
    explicit wServer(const ServerConfig& cfg);
    ~wServer();

    void add_endpoint(const endpoint& ep);

    // Routing, CORS preflight and rate limiting for an already parsed request
    http::Response dispatch(const http::Request& req);

    // Binds and listens; the bound port is available afterwards (port 0 picks one)
    void listen();
    uint16_t port() const { return port_; }

    // Serves until stop() or SIGINT/SIGTERM
    void run();
    void stop();
};

} // namespace chunkd
