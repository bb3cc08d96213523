#include <transport/https_session.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>

namespace devicecheck::transport {

https_session::https_session(std::chrono::seconds timeout)
  : io_context_(std::make_shared<boost::asio::io_context>()), session_(io_context_, timeout)
{}

auto https_session::post(const http_request &request) -> http_response
{
  auto future = boost::asio::co_spawn(*io_context_, session_.async_post(request), boost::asio::use_future);

  io_context_->restart();
  io_context_->run();

  return future.get();
}

}// namespace devicecheck::transport
