#include "server/wserver.hpp"
#include "common/log.hpp"
#include "http/HttpUtils.hpp"
#include "http/MultipartParser.hpp"
#include <array>
#include <chrono>
#include <csignal>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace chunkd {

namespace {

constexpr size_t kMaxHeaderBytes = 64 * 1024;

std::string clock_time() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%H:%M:%S");
    return ss.str();
}

} // namespace

wServer::wServer(const ServerConfig& cfg)
    : acceptor_(io_context_),
      signals_(io_context_, SIGINT, SIGTERM),
      workers_(cfg.serverThreads),
      limiter_(cfg.rateLimitMax, std::chrono::seconds(cfg.rateLimitWindowSeconds)),
      bind_(cfg.bindAddress),
      port_(cfg.port),
      max_body_(cfg.maxBodyBytes) {}

wServer::~wServer()
{
    stop();
    workers_.join();
}

void wServer::add_endpoint(const endpoint& ep)
{
    handlers_.insert_or_assign(ep.get_path(), ep);
}

void wServer::listen()
{
    tcp::endpoint endpoint(asio::ip::make_address(bind_), port_);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    port_ = acceptor_.local_endpoint().port();
}

void wServer::run()
{
    if (!acceptor_.is_open()) listen();
    std::cout << "Server listening on " << bind_ << ":" << port_ << std::endl;

    signals_.async_wait([this](const boost::system::error_code& ec, int signum) {
        if (ec) return;
        std::cout << "\nSignal " << signum << " received, shutting down..." << std::endl;
        stop();
    });

    do_accept();
    io_context_.run();

    // Let in-flight requests finish before returning
    workers_.join();
    std::cout << "Server stopped." << std::endl;
}

void wServer::stop()
{
    if (stopping_.exchange(true)) return;
    asio::post(io_context_, [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
        signals_.cancel(ec);
    });
}

void wServer::do_accept()
{
    acceptor_.async_accept(
        [this](const boost::system::error_code& ec, tcp::socket socket) {
            if (ec) {
                if (ec == asio::error::operation_aborted || stopping_.load()) return;
                logLine(std::cerr, "Accept failed: " + ec.message());
            } else {
                auto client = std::make_shared<tcp::socket>(std::move(socket));
                asio::post(workers_, [this, client]() { serve_client(*client); });
            }
            if (acceptor_.is_open()) do_accept();
        });
}

http::Response wServer::dispatch(const http::Request& req)
{
    if (req.method == HttpRequest::OPTIONS) {
        return http::Response::noContent();
    }

    if (!limiter_.allow(req.remoteAddress)) {
        http::Response resp = http::Response::tooManyRequests();
        auto retry = limiter_.retryAfter(req.remoteAddress, http::RateLimiter::Clock::now());
        resp.headers.emplace_back("Retry-After", std::to_string(retry.count()));
        return resp;
    }

    auto it = handlers_.find(req.path);
    if (it == handlers_.end()) {
        return http::Response::notFound();
    }
    if (it->second.get_rest_type() != req.method) {
        return http::Response::methodNotAllowed();
    }

    try {
        return it->second.get_handler()(req);
    } catch (const std::exception& e) {
        logLine(std::cerr, "Handler for " + req.path + " threw: " + e.what());
        return http::Response::failure(500, "Internal Server Error", e.what(), "io-failure");
    }
}

bool wServer::read_request(tcp::socket& socket, http::Request& req, int& error_status)
{
    error_status = 0;
    boost::system::error_code ec;

    asio::streambuf buf(kMaxHeaderBytes);
    asio::read_until(socket, buf, "\r\n\r\n", ec);
    if (ec) {
        // Oversized header block gets an answer, a dropped connection does not
        if (ec == asio::error::not_found) error_status = 400;
        return false;
    }
    std::istream request_stream(&buf);

    std::string method, target, version;
    request_stream >> method >> target >> version;

    std::string dummy;
    std::getline(request_stream, dummy);

    if (method.empty() || target.empty()) {
        error_status = 400;
        return false;
    }
    http::splitTarget(target, req.path, req.query);
    try {
        req.method = from_string(method);
    } catch (const std::invalid_argument&) {
        error_status = 405;
        return false;
    }

    std::string header_line;
    std::string content_type;
    long long content_length = -1;

    while (std::getline(request_stream, header_line) && header_line != "\r")
    {
        if (!header_line.empty() && header_line.back() == '\r') header_line.pop_back();
        if (header_line.empty()) break;

        auto colon = header_line.find(':');
        if (colon == std::string::npos) continue;

        std::string name = header_line.substr(0, colon);
        std::string value = header_line.substr(colon + 1);
        http::trim(name);
        http::trim(value);
        http::toLower(name);
        req.headers[name] = value;

        if (name == "content-length") {
            if (!http::parseInteger(value, content_length) || content_length < 0) {
                error_status = 400;
                return false;
            }
        } else if (name == "content-type") {
            content_type = value;
        }
    }

    if (content_length < 0) {
        if (req.method == HttpRequest::POST) {
            error_status = 411;
            return false;
        }
        return true;
    }
    if (static_cast<unsigned long long>(content_length) > max_body_) {
        error_status = 413;
        return false;
    }

    std::string body(std::istreambuf_iterator<char>(request_stream), {});
    const size_t expected = static_cast<size_t>(content_length);
    if (body.size() < expected) {
        size_t have = body.size();
        body.resize(expected);
        asio::read(socket, asio::buffer(&body[have], expected - have), ec);
        if (ec) return false;
    } else if (body.size() > expected) {
        body.resize(expected);
    }
    req.rawBody = std::move(body);

    parse_body(req, content_type);
    return true;
}

void wServer::parse_body(http::Request& req, const std::string& content_type)
{
    std::string media_type = content_type.substr(0, content_type.find(';'));
    http::trim(media_type);
    http::toLower(media_type);
    req.mediaType = media_type;

    if (media_type == "multipart/form-data") {
        std::string boundary = http::MultipartParser::extractBoundary(content_type);
        req.parts = http::MultipartParser::parse(req.rawBody, boundary);
        for (const auto& part : req.parts) {
            if (!part.isFile() && !part.name.empty()) {
                req.form[part.name] = part.data;
            }
        }
        // Part data holds its own copy
        req.rawBody.clear();
        req.rawBody.shrink_to_fit();
    } else if (media_type == "application/x-www-form-urlencoded") {
        req.form = http::parseUrlEncoded(req.rawBody);
    }
}

void wServer::write_response(tcp::socket& socket, const http::Response& resp)
{
    std::ostringstream head;
    head << "HTTP/1.1 " << resp.status << " " << http::status_text(resp.status) << "\r\n";
    head << "Content-Length: " << resp.body.size() << "\r\n";
    head << "Content-Type: " << resp.contentType << "\r\n";
    head << "Access-Control-Allow-Origin: *\r\n";
    head << "Access-Control-Allow-Methods: GET, POST, OPTIONS\r\n";
    head << "Access-Control-Allow-Headers: Content-Type\r\n";
    for (const auto& h : resp.headers) {
        head << h.first << ": " << h.second << "\r\n";
    }
    head << "Connection: close\r\n\r\n";
    std::string header_block = head.str();

    std::array<asio::const_buffer, 2> buffers = {
        asio::buffer(header_block),
        asio::buffer(resp.body),
    };
    boost::system::error_code ec;
    asio::write(socket, buffers, ec);
    if (ec) {
        logLine(std::cerr, "Failed to send response: " + ec.message());
    }
    socket.shutdown(tcp::socket::shutdown_both, ec);
    socket.close(ec);
}

void wServer::serve_client(tcp::socket& socket)
{
    auto started = std::chrono::steady_clock::now();

    http::Request req;
    boost::system::error_code ec;
    auto remote = socket.remote_endpoint(ec);
    if (!ec) req.remoteAddress = remote.address().to_string();

    int error_status = 0;
    http::Response resp;
    if (read_request(socket, req, error_status)) {
        resp = dispatch(req);
    } else if (error_status != 0) {
        resp = http::Response::failure(error_status, http::status_text(error_status),
                                       "malformed or oversized request", "invalid-request");
    } else {
        socket.close(ec);
        return;
    }
    write_response(socket, resp);

    auto latency = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started).count();
    std::ostringstream line;
    line << clock_time() << " | " << resp.status << " | " << to_string(req.method) << " | "
         << (req.path.empty() ? "-" : req.path) << " | " << latency << "us";
    logLine(std::cout, line.str());
}

} // namespace chunkd
