#include "reconcile/interval_timer.hpp"

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

#include <utility>

namespace shortlink {

SteadyIntervalTimer::SteadyIntervalTimer(boost::asio::any_io_executor executor)
    : timer_{std::move(executor)}
{}

boost::asio::awaitable<bool> SteadyIntervalTimer::wait(std::chrono::milliseconds interval)
{
    if (cancelled_) {
        co_return false;
    }

    timer_.expires_after(interval);
    boost::system::error_code ec;
    co_await timer_.async_wait(
        boost::asio::redirect_error(boost::asio::use_awaitable, ec));

    // A wait that completed normally can still race a cancel() queued behind it.
    co_return !ec && !cancelled_;
}

void SteadyIntervalTimer::cancel()
{
    cancelled_ = true;
    timer_.cancel();
}

} // namespace shortlink
