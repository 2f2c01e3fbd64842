#ifndef VIGIL_TRANSPORT_ASIO_DEADLINE_HPP
#define VIGIL_TRANSPORT_ASIO_DEADLINE_HPP
/**
 * @file AsioDeadline.hpp
 * @brief Run one asynchronous Asio operation to completion or deadline.
 *
 * Used by the HTTP and SMTP clients to get blocking call semantics with a
 * hard overall deadline on a private io_context.
 */

#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>
#include <utility>

namespace vigil {

namespace transport {

using DeadlineClock = std::chrono::steady_clock;

/**
 * @brief Start an operation and pump the io_context until it completes.
 *
 * @param ioc Private io_context (restarted here).
 * @param deadline Absolute time limit.
 * @param initiate Callable taking a completion handler `(error_code, ...)` and starting the op.
 * @param cancel Callable that aborts the op (typically closing the socket).
 * @param ec Completion error, or boost::asio::error::timed_out.
 * @return false if the deadline expired before completion.
 */
template <typename Initiate, typename Cancel>
bool runWithDeadline(boost::asio::io_context& ioc, DeadlineClock::time_point deadline,
                     Initiate&& initiate, Cancel&& cancel, boost::system::error_code& ec) {
  bool done = false;
  boost::system::error_code result{};
  initiate([&done, &result](const boost::system::error_code& e, auto&&...) {
    result = e;
    done = true;
  });

  ioc.restart();
  while (!done) {
    if (ioc.run_one_until(deadline) == 0) {
      break;
    }
  }

  if (!done) {
    cancel();
    ioc.restart();
    while (!done && ioc.run_one() != 0) {
    }
    ec = boost::asio::error::timed_out;
    return false;
  }
  ec = result;
  return true;
}

} // namespace transport

} // namespace vigil

#endif // VIGIL_TRANSPORT_ASIO_DEADLINE_HPP
