#pragma once

#include "network/resp_codec.hpp"

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

namespace shortlink::network {

// ── RespClient ────────────────────────────────────────────────────────────────
//
// Blocking request/response client for a Redis-compatible server, built on
// Boost.Asio coroutines running on a private io_context.
//
//   - execute() sends one command and waits for its reply.  The timeout
//     covers the whole call, including time spent queued behind other
//     callers; on expiry the socket is closed and the next call reconnects.
//   - Connects lazily on first use and after any I/O error.
//   - Thread-safe: commands from concurrent callers are serialised on one
//     connection.
//
// Errors (std::errc):
//   timed_out       – no reply (or no turn on the connection) within the deadline
//   not_connected   – resolve/connect failed
//   io_error        – read/write failed or the peer closed the connection
//   protocol_error  – reply was not valid RESP
// A server-side error reply ("-ERR ...") is NOT an error here: it is returned
// as a RespValue of type Error.

class RespClient {
public:
    RespClient(std::string host,
               uint16_t port,
               std::chrono::milliseconds timeout,
               std::shared_ptr<spdlog::logger> logger = {});

    ~RespClient();

    RespClient(const RespClient&)            = delete;
    RespClient& operator=(const RespClient&) = delete;
    RespClient(RespClient&&)                 = delete;
    RespClient& operator=(RespClient&&)      = delete;

    // Send `args` as one command and wait for the reply.
    [[nodiscard]] std::error_code execute(const std::vector<std::string>& args,
                                          RespValue& reply);

    // Drop the connection (the next execute() reconnects).
    void close();

    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] uint16_t port() const noexcept { return port_; }

private:
    // Connect if needed, write the request, read until one reply parses.
    boost::asio::awaitable<std::error_code> round_trip(std::string request,
                                                       RespValue& reply);

    // Close socket and forget buffered bytes.  Caller holds mutex_.
    void reset_connection();

    std::string                     host_;
    uint16_t                        port_;
    std::chrono::milliseconds       timeout_;
    std::shared_ptr<spdlog::logger> logger_;

    std::timed_mutex                mutex_;
    boost::asio::io_context         ioc_;
    boost::asio::ip::tcp::resolver  resolver_;
    boost::asio::ip::tcp::socket    socket_;
    std::string                     read_buf_;
};

} // namespace shortlink::network
