#include "test_doubles/loopback_https_server.hpp"
#include <catch2/catch_test_macros.hpp>
#include <core/errors.hpp>
#include <transport/async_https_session.hpp>
#include <transport/https_session.hpp>

#include <boost/asio.hpp>
#include <boost/beast/core/error.hpp>

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <utility>

namespace devicecheck::transport::test {

namespace {

  // Runs the io_context on a background thread; declared after everything the
  // thread touches so it is joined before those are destroyed
  struct io_runner
  {
    std::shared_ptr<boost::asio::io_context> context;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work;
    std::thread thread;

    explicit io_runner(std::shared_ptr<boost::asio::io_context> ctx)
      : context(std::move(ctx)), work(boost::asio::make_work_guard(*context)),
        thread([io = context]() { io->run(); })
    {}

    io_runner(const io_runner &) = delete;
    auto operator=(const io_runner &) -> io_runner & = delete;
    io_runner(io_runner &&) = delete;
    auto operator=(io_runner &&) -> io_runner & = delete;

    ~io_runner()
    {
      work.reset();
      context->stop();
      if (thread.joinable()) { thread.join(); }
    }
  };

  auto make_request(const std::string &port, std::string token) -> http_request
  {
    return http_request{ .host = "localhost",
      .port = port,
      .target = "/v1/validate_device_token",
      .body = R"({"device_token":"dGVzdA=="})",
      .bearer_token = std::move(token) };
  }

  auto post(boost::asio::io_context &io_context, async_https_session &session, http_request request)
    -> std::future<http_response>
  {
    return boost::asio::co_spawn(io_context, session.async_post(std::move(request)), boost::asio::use_future);
  }

  template<typename Predicate> auto wait_for(Predicate predicate) -> bool
  {
    constexpr auto wait_interval = std::chrono::milliseconds(10);
    constexpr int max_wait = 500;
    for (int wait_count = 0; wait_count < max_wait; ++wait_count) {
      if (predicate()) { return true; }
      std::this_thread::sleep_for(wait_interval);
    }
    return predicate();
  }

}// namespace

SCENARIO("Coroutine HTTPS session talks to a TLS server", "[transport][https_session]")
{
  GIVEN("A keep-alive server and a session trusting its certificate")
  {
    auto io_context = std::make_shared<boost::asio::io_context>();
    devicecheck_test::loopback_https_server server(*io_context);
    async_https_session session(io_context);
    session.add_certificate_authority(devicecheck_test::loopback_certificate);
    const io_runner runner{ io_context };

    WHEN("two sequential posts are made")
    {
      const auto first = post(*io_context, session, make_request(server.port(), "first")).get();
      const auto second = post(*io_context, session, make_request(server.port(), "second")).get();

      THEN("both succeed over a single connection")
      {
        CHECK(first.status == 200);
        CHECK(first.body == "Bearer first");
        CHECK(second.body == "Bearer second");
        CHECK(server.accepted_connections() == 1);
      }
    }

    WHEN("two posts interleave after the pool holds one connection")
    {
      [[maybe_unused]] auto warm = post(*io_context, session, make_request(server.port(), "warm")).get();

      auto token_a = post(*io_context, session, make_request(server.port(), "token-A"));
      auto token_b = post(*io_context, session, make_request(server.port(), "token-B"));
      const auto response_a = token_a.get();
      const auto response_b = token_b.get();

      THEN("each call gets its own response over its own connection")
      {
        CHECK(response_a.body == "Bearer token-A");
        CHECK(response_b.body == "Bearer token-B");
        CHECK(server.accepted_connections() == 2);
      }

      THEN("both connections are pooled for later calls")
      {
        auto token_c = post(*io_context, session, make_request(server.port(), "token-C"));
        auto token_d = post(*io_context, session, make_request(server.port(), "token-D"));
        CHECK(token_c.get().body == "Bearer token-C");
        CHECK(token_d.get().body == "Bearer token-D");
        CHECK(server.accepted_connections() == 2);
      }
    }
  }
}

SCENARIO("Coroutine HTTPS session replaces pooled connections the server dropped", "[transport][https_session]")
{
  GIVEN("A server that closes each connection after one response")
  {
    auto io_context = std::make_shared<boost::asio::io_context>();
    devicecheck_test::loopback_https_server server(
      *io_context, devicecheck_test::loopback_https_server::behavior::close_after_response);
    async_https_session session(io_context);
    session.add_certificate_authority(devicecheck_test::loopback_certificate);
    const io_runner runner{ io_context };

    WHEN("a call follows the server closing the pooled connection")
    {
      const auto warm = post(*io_context, session, make_request(server.port(), "warm")).get();
      REQUIRE(wait_for([&server]() { return server.closed_connections() == 1; }));

      const auto next = post(*io_context, session, make_request(server.port(), "next")).get();

      THEN("the call succeeds on a fresh connection")
      {
        CHECK(warm.body == "Bearer warm");
        CHECK(next.status == 200);
        CHECK(next.body == "Bearer next");
        CHECK(server.accepted_connections() == 2);
      }
    }
  }
}

TEST_CASE("Coroutine HTTPS session reports network failures as transport errors", "[transport][https_session]")
{
  auto io_context = std::make_shared<boost::asio::io_context>();
  async_https_session session(io_context, std::chrono::seconds(1));
  session.add_certificate_authority(devicecheck_test::loopback_certificate);

  SECTION("connection refused")
  {
    std::string closed_port;
    {
      boost::asio::ip::tcp::acceptor closed_acceptor(
        *io_context, { boost::asio::ip::make_address("127.0.0.1"), 0 });
      closed_port = std::to_string(closed_acceptor.local_endpoint().port());
    }
    const io_runner runner{ io_context };

    try {
      [[maybe_unused]] auto res = post(*io_context, session, make_request(closed_port, "token")).get();
      FAIL("expected transport_error");
    } catch (const core::transport_error &e) {
      CHECK(e.code() == boost::asio::error::connection_refused);
    }
  }

  SECTION("server never answers")
  {
    devicecheck_test::loopback_https_server server(
      *io_context, devicecheck_test::loopback_https_server::behavior::never_respond);
    const io_runner runner{ io_context };

    try {
      [[maybe_unused]] auto res = post(*io_context, session, make_request(server.port(), "token")).get();
      FAIL("expected transport_error");
    } catch (const core::transport_error &e) {
      CHECK(e.code() == boost::beast::error::timeout);
    }
  }

  SECTION("untrusted certificate")
  {
    devicecheck_test::loopback_https_server server(*io_context);
    async_https_session untrusting(io_context, std::chrono::seconds(1));
    const io_runner runner{ io_context };

    CHECK_THROWS_AS(post(*io_context, untrusting, make_request(server.port(), "token")).get(), core::transport_error);
  }
}

TEST_CASE("Certificate authorities must be valid PEM", "[transport][https_session]")
{
  auto io_context = std::make_shared<boost::asio::io_context>();
  async_https_session session(io_context);

  CHECK_THROWS_AS(session.add_certificate_authority("not a certificate"), core::configuration_error);
}

TEST_CASE("Blocking HTTPS session reuses its connection", "[transport][https_session]")
{
  auto server_context = std::make_shared<boost::asio::io_context>();
  devicecheck_test::loopback_https_server server(*server_context);
  const io_runner runner{ server_context };

  https_session session;
  session.add_certificate_authority(devicecheck_test::loopback_certificate);

  const auto first = session.post(make_request(server.port(), "first"));
  const auto second = session.post(make_request(server.port(), "second"));

  CHECK(first.status == 200);
  CHECK(first.body == "Bearer first");
  CHECK(second.body == "Bearer second");
  CHECK(server.accepted_connections() == 1);
}

}// namespace devicecheck::transport::test
