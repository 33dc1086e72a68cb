#include <snitch/snitch.hpp>
#include <session/policy.hpp>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/ostream_sink.h>
#include <sstream>
#include <stdexcept>

using namespace tome;

namespace {
std::shared_ptr<spdlog::logger> create_test_logger() {
  auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
  return std::make_shared<spdlog::logger>("test", sink);
}

status_c write_failure() {
  return status_c::fail(error_e::WRITE_CAPABILITY, "store is read-only");
}

status_c store_failure() {
  return status_c::fail(error_e::STORE_FAILURE, "disk full");
}
} // namespace

TEST_CASE("policy reports closed sessions", "[unit][session][policy]") {
    session::policy_c policy(create_test_logger(), false);
    auto status = policy.report_closed("get_collection");
    CHECK(status.is(error_e::SESSION_CLOSED));
    CHECK(status.error().message.find("get_collection") != std::string::npos);

    CHECK(policy.skip("compact", "session is read-only").is_success());
}

TEST_CASE("policy on graceful close", "[unit][session][policy]") {
    SECTION("read-only session swallows write failures") {
        session::policy_c policy(create_test_logger(), true);
        CHECK(policy.resolve_close(status_c::ok()).is_success());
        CHECK(policy.resolve_close(write_failure()).is_success());
        CHECK(policy.resolve_close(store_failure()).is(error_e::STORE_FAILURE));
    }

    SECTION("writable session returns every failure") {
        session::policy_c policy(create_test_logger(), false);
        CHECK(policy.resolve_close(write_failure()).is(error_e::WRITE_CAPABILITY));
        CHECK(policy.resolve_close(store_failure()).is(error_e::STORE_FAILURE));
    }
}

TEST_CASE("policy on forced close", "[unit][session][policy]") {
    SECTION("writable session returns write failures only") {
        session::policy_c policy(create_test_logger(), false);
        CHECK(policy.resolve_abort(write_failure()).is(error_e::WRITE_CAPABILITY));
        CHECK(policy.resolve_abort(store_failure()).is_success());
    }

    SECTION("read-only session swallows everything") {
        session::policy_c policy(create_test_logger(), true);
        CHECK(policy.resolve_abort(write_failure()).is_success());
        CHECK(policy.resolve_abort(store_failure()).is_success());
    }
}

TEST_CASE("policy isolates item failures", "[unit][session][policy]") {
    std::ostringstream output;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(output);
    auto logger = std::make_shared<spdlog::logger>("policy_test", sink);
    session::policy_c policy(logger, false);

    policy.isolate("collection 'a'", status_c::ok());
    policy.isolate("collection 'b'", store_failure());
    policy.isolate("repository 'c'", std::runtime_error("boom"));
    logger->flush();

    const std::string logged = output.str();
    CHECK(logged.find("collection 'a'") == std::string::npos);
    CHECK(logged.find("collection 'b': disk full") != std::string::npos);
    CHECK(logged.find("repository 'c': boom") != std::string::npos);
}

TEST_CASE("error names", "[unit][session][policy]") {
    CHECK(std::string(error_name(error_e::SESSION_CLOSED)) == "session closed");
    CHECK(std::string(error_name(error_e::WRITE_CAPABILITY)) == "write capability");
    CHECK(std::string(error_name(error_e::INVALID_NAME)) == "invalid name");
}
