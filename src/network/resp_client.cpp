#include "network/resp_client.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>

#include <array>
#include <exception>
#include <optional>

namespace shortlink::network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {
constexpr std::size_t kReadChunk = 4096;
} // anonymous namespace

RespClient::RespClient(std::string host,
                       uint16_t port,
                       std::chrono::milliseconds timeout,
                       std::shared_ptr<spdlog::logger> logger)
    : host_(std::move(host)),
      port_(port),
      timeout_(timeout),
      logger_(logger ? std::move(logger) : spdlog::default_logger()),
      ioc_(1),
      resolver_(ioc_),
      socket_(ioc_) {}

RespClient::~RespClient() {
    std::lock_guard lock(mutex_);
    reset_connection();
}

void RespClient::close() {
    std::lock_guard lock(mutex_);
    reset_connection();
}

void RespClient::reset_connection() {
    boost::system::error_code ignored;
    resolver_.cancel();
    socket_.close(ignored);
    read_buf_.clear();
}

// ── round_trip ────────────────────────────────────────────────────────────────

asio::awaitable<std::error_code>
RespClient::round_trip(std::string request, RespValue& reply) {
    boost::system::error_code ec;

    if (!socket_.is_open()) {
        auto endpoints = co_await resolver_.async_resolve(
            host_, std::to_string(port_), asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            logger_->warn("RESP resolve {}:{} failed: {}", host_, port_, ec.message());
            co_return std::make_error_code(std::errc::not_connected);
        }

        co_await asio::async_connect(
            socket_, endpoints, asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            logger_->warn("RESP connect {}:{} failed: {}", host_, port_, ec.message());
            reset_connection();
            co_return std::make_error_code(std::errc::not_connected);
        }

        socket_.set_option(tcp::no_delay(true), ec);
        logger_->debug("RESP connected to {}:{}", host_, port_);
    }

    co_await asio::async_write(
        socket_, asio::buffer(request), asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        logger_->warn("RESP write to {}:{} failed: {}", host_, port_, ec.message());
        reset_connection();
        co_return std::make_error_code(std::errc::io_error);
    }

    std::array<char, kReadChunk> chunk{};
    for (;;) {
        std::size_t consumed = 0;
        const auto status = parse_resp_value(read_buf_, reply, consumed);
        if (status == ParseStatus::Complete) {
            read_buf_.erase(0, consumed);
            co_return std::error_code{};
        }
        if (status == ParseStatus::Invalid) {
            logger_->error("RESP protocol violation from {}:{}", host_, port_);
            reset_connection();
            co_return std::make_error_code(std::errc::protocol_error);
        }

        const std::size_t n = co_await socket_.async_read_some(
            asio::buffer(chunk), asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            logger_->warn("RESP read from {}:{} failed: {}", host_, port_, ec.message());
            reset_connection();
            co_return std::make_error_code(std::errc::io_error);
        }
        read_buf_.append(chunk.data(), n);
    }
}

// ── execute ───────────────────────────────────────────────────────────────────

std::error_code RespClient::execute(const std::vector<std::string>& args,
                                    RespValue& reply) {
    const auto deadline = std::chrono::steady_clock::now() + timeout_;
    std::unique_lock lock(mutex_, std::defer_lock);
    if (!lock.try_lock_until(deadline)) {
        logger_->debug("RESP command {} to {}:{} gave up waiting for the connection",
                       args.empty() ? std::string{} : args.front(), host_, port_);
        return std::make_error_code(std::errc::timed_out);
    }

    std::optional<std::error_code> outcome;
    asio::co_spawn(
        ioc_,
        round_trip(serialize_resp_command(args), reply),
        [this, &outcome](std::exception_ptr ep, std::error_code ec) {
            if (ep) {
                try {
                    std::rethrow_exception(ep);
                } catch (const std::exception& e) {
                    logger_->error("RESP round trip threw: {}", e.what());
                }
                outcome = std::make_error_code(std::errc::io_error);
                return;
            }
            outcome = ec;
        });

    ioc_.restart();
    ioc_.run_until(deadline);

    if (!outcome) {
        logger_->warn("RESP command {} to {}:{} timed out after {}ms",
                      args.empty() ? std::string{} : args.front(),
                      host_, port_, timeout_.count());
        // Abort the in-flight operation and let the coroutine unwind.
        reset_connection();
        ioc_.restart();
        ioc_.run();
        return std::make_error_code(std::errc::timed_out);
    }
    return *outcome;
}

} // namespace shortlink::network
