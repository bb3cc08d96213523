#include <api/response.hpp>
#include <catch2/catch_test_macros.hpp>
#include <core/errors.hpp>

#include <string>
#include <string_view>
#include <variant>

namespace devicecheck::api::test {

SCENARIO("Responses are normalized into status or data results", "[api][response]")
{
  GIVEN("A 200 response with a JSON body carrying bits")
  {
    const std::string body = R"({"bit0":true,"bit1":false,"last_update_time":"2024-01"})";

    WHEN("it is parsed")
    {
      const auto res = parse_response(body, 200);

      THEN("a successful data result exposes the bits")
      {
        REQUIRE(std::holds_alternative<data_result>(res));
        const auto &data = std::get<data_result>(res);
        CHECK(data.ok);
        CHECK(data.status_code == 200);
        CHECK(data.bit0 == true);
        CHECK(data.bit1 == false);
        CHECK(data.last_update_time == "2024-01");
        CHECK(data.payload["bit0"] == true);
      }
    }
  }

  GIVEN("A 200 response with the plain text bit state error")
  {
    WHEN("it is parsed")
    {
      const auto res = parse_response("Bit State Not Found", 200);

      THEN("a failed status result carries the text")
      {
        REQUIRE(std::holds_alternative<status_result>(res));
        const auto &status = std::get<status_result>(res);
        CHECK_FALSE(status.ok);
        CHECK(status.status_code == 200);
        CHECK(status.description == "Bit State Not Found");
      }
    }
  }

  GIVEN("A 200 response with the alternative bit state error")
  {
    THEN("the result is not ok") { CHECK_FALSE(is_ok(parse_response("Failed to find bit state", 200))); }
  }

  GIVEN("A 200 JSON response mentioning the bit state error")
  {
    THEN("the data result is not ok")
    {
      const auto res = parse_response(R"({"error":"Bit State Not Found"})", 200);
      REQUIRE(std::holds_alternative<data_result>(res));
      CHECK_FALSE(is_ok(res));
    }
  }

  GIVEN("A 401 response with an empty body")
  {
    THEN("a failed status result with an empty description is returned")
    {
      const auto res = parse_response("", 401);
      REQUIRE(std::holds_alternative<status_result>(res));
      const auto &status = std::get<status_result>(res);
      CHECK_FALSE(status.ok);
      CHECK(status.status_code == 401);
      CHECK(status.description.empty());
    }
  }

  GIVEN("A 200 response with an empty body")
  {
    THEN("the status result is ok") { CHECK(is_ok(parse_response("", 200))); }
  }

  GIVEN("Bodies that are JSON but not objects")
  {
    THEN("they are treated as text")
    {
      CHECK(std::holds_alternative<status_result>(parse_response("42", 200)));
      CHECK(std::holds_alternative<status_result>(parse_response("[true,false]", 200)));
      CHECK(std::holds_alternative<status_result>(parse_response(R"("quoted")", 200)));
    }
  }

  GIVEN("A JSON object whose bits are not booleans")
  {
    THEN("the bits are left unset")
    {
      const auto res = parse_response(R"({"bit0":"yes","bit1":1})", 200);
      REQUIRE(std::holds_alternative<data_result>(res));
      CHECK_FALSE(std::get<data_result>(res).bit0.has_value());
      CHECK_FALSE(std::get<data_result>(res).bit1.has_value());
    }
  }
}

TEST_CASE("Raise mode turns non-ok results into upstream errors", "[api][response]")
{
  SECTION("plain text failure")
  {
    try {
      [[maybe_unused]] auto res = parse_response("Missing or badly formatted authorization token", 401, true);
      FAIL("expected upstream_error");
    } catch (const core::upstream_error &e) {
      CHECK(e.status_code() == 401);
      CHECK(e.description() == "Missing or badly formatted authorization token");
    }
  }

  SECTION("bit state error with a 200 status")
  {
    CHECK_THROWS_AS(parse_response("Bit State Not Found", 200, true), core::upstream_error);
  }

  SECTION("JSON failure carries the body as received")
  {
    constexpr std::string_view body = R"({"reason": "bad token", "code": 7})";
    try {
      [[maybe_unused]] auto res = parse_response(body, 400, true);
      FAIL("expected upstream_error");
    } catch (const core::upstream_error &e) {
      CHECK(e.status_code() == 400);
      CHECK(e.description() == body);
    }
  }

  SECTION("ok results are returned")
  {
    CHECK_NOTHROW(parse_response(R"({"bit0":true})", 200, true));
    CHECK_NOTHROW(parse_response("", 200, true));
  }
}

TEST_CASE("Result helpers", "[api][response]")
{
  SECTION("status_code over both alternatives")
  {
    CHECK(status_code(parse_response("", 204)) == 204);
    CHECK(status_code(parse_response("{}", 200)) == 200);
  }

  SECTION("to_string of a status result")
  {
    CHECK(to_string(parse_response("", 200)) == "200");
    CHECK(to_string(parse_response("Bit State Not Found", 200)) == "200 Bit State Not Found");
  }

  SECTION("to_string of a data result")
  {
    const auto text = to_string(parse_response(R"({"bit0":true,"bit1":false,"last_update_time":"2024-01"})", 200));
    CHECK(text == R"(200 {"bit0":true,"bit1":false,"last_update_time":"2024-01"} Bits: true false. Last update time: 2024-01)");
  }

  SECTION("to_string marks missing bits")
  {
    CHECK(to_string(parse_response(R"({"bit1":true})", 200)) == R"(200 {"bit1":true} Bits: unset true.)");
  }
}

}// namespace devicecheck::api::test
