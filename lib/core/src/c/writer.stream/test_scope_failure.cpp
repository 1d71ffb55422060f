#ifndef DISABLE_CATCH2_TEST

#include <sstream>
#include <stdexcept>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <catch2/matchers/catch_matchers_vector.hpp>

#include "run.hpp"

using namespace cbor_stream;
using Catch::Matchers::Equals;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("ScopeFailure::indefinite terminator") {
    SECTION("body failure still emits break") {
        RecordingEncoder encoder;
        Writer writer(encoder);

        auto body = [&]() {
            auto scope = writer.array();
            scope->write(1);
            throw std::runtime_error("body failed");
        };

        CHECK_THROWS_WITH(body(), "body failed");
        CHECK_THAT(encoder.calls, Equals(std::vector<std::string>{"indefinite(Array)", "encode(1)", "break"}));
    }
    SECTION("callback failure still emits break") {
        RecordingEncoder encoder;
        Writer writer(encoder);

        auto body = [&]() {
            writer.map(Length::indefinite(), [](MapWriter& m) {
                m.write("a", 1);
                throw std::runtime_error("callback failed");
            });
        };

        CHECK_THROWS_WITH(body(), "callback failed");
        CHECK_THAT(encoder.calls, Equals(std::vector<std::string>{"indefinite(Map)", "encode(\"a\")", "encode(1)", "break"}));
    }
    SECTION("every open indefinite scope is terminated innermost first") {
        RecordingEncoder encoder;
        Writer writer(encoder);

        auto body = [&]() {
            auto outer = writer.array();
            auto inner = outer->map();
            inner->write("k", 1);
            throw std::runtime_error("nested failure");
        };

        CHECK_THROWS_WITH(body(), "nested failure");
        CHECK_THAT(encoder.calls, Equals(std::vector<std::string>{
            "indefinite(Array)", "indefinite(Map)", "encode(\"k\")", "encode(1)", "break", "break"
        }));
    }
}

TEST_CASE("ScopeFailure::failure ordering") {
    SECTION("body failure wins over insufficient elements") {
        std::ostringstream log_out;
        auto channel = LogChannel::streamChannel(log_out, "unittest");
        RecordingEncoder encoder;
        Writer writer(encoder, &channel);

        auto body = [&]() {
            auto scope = writer.array(3);
            scope->write(1);
            throw std::runtime_error("body failed");
        };

        CHECK_THROWS_AS(body(), std::runtime_error);

        INFO("suppressed exit failure is logged");
        CHECK_THAT(log_out.str(), ContainsSubstring("log/level: warn"));
        CHECK_THAT(log_out.str(), ContainsSubstring("insufficient elements"));
        CHECK_THAT(encoder.calls, Equals(std::vector<std::string>{"header(Array, 3)", "encode(1)"}));
    }
    SECTION("protocol failure of a nested scope wins over its parents") {
        std::ostringstream log_out;
        auto channel = LogChannel::streamChannel(log_out, "unittest");
        RecordingEncoder encoder;
        Writer writer(encoder, &channel);

        auto body = [&]() {
            auto outer = writer.map(2);
            auto inner = outer->array("xs", 1);
            inner->write(1);
            inner->write(2);
        };

        CHECK_THROWS_MATCHES(body(), WriterProtocolError, isProtocolError(WriterErrorCode::capacity_exceeded));

        INFO("nested scope closed cleanly, parent reported its missing pair");
        CHECK_THAT(log_out.str(), ContainsSubstring("insufficient elements (Map"));
    }
    SECTION("nested writers inherit the log channel") {
        std::ostringstream log_out;
        auto channel = LogChannel::streamChannel(log_out, "unittest");
        RecordingEncoder encoder;
        Writer writer(encoder, &channel);

        auto body = [&]() {
            auto outer = writer.array();
            auto inner = outer->array(2);
            throw std::runtime_error("body failed");
        };

        CHECK_THROWS_AS(body(), std::runtime_error);
        CHECK_THAT(log_out.str(), ContainsSubstring("insufficient elements (Array, length: 2, missing: 2)"));
        CHECK_THAT(encoder.calls, Equals(std::vector<std::string>{"indefinite(Array)", "header(Array, 2)", "break"}));
    }
}

#endif
