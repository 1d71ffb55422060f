#ifndef DISABLE_CATCH2_TEST

#include <sstream>
#include <zmq.h>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "log_channel.hpp"
#include "log_encode_support.hpp"
#include "run.hpp"

using namespace cbor_stream;
using Catch::Matchers::Equals;

TEST_CASE("LogChannel::encode log record") {
    SECTION("warn") {
        auto payload = encodeLogRecord(LogLevel::warn, "", "hi");

        CHECK_THAT(toHex(payload), Equals("a3" "656c6576656c" "647761726e" "626964" "60" "676d657373616765" "626869"));
    }
    SECTION("err with id") {
        auto payload = encodeLogRecord(LogLevel::err, "w1", "");

        CHECK_THAT(toHex(payload), Equals("a3" "656c6576656c" "63657272" "626964" "627731" "676d657373616765" "60"));
    }
}

TEST_CASE("LogChannel::stream output") {
    std::ostringstream out;
    auto channel = LogChannel::streamChannel(out, "json2cbor");

    SECTION("info") {
        channel.info("started");
        CHECK_THAT(out.str(), Equals("log/level: info, message: started, from: json2cbor\n"));
    }
    SECTION("err") {
        channel.err("broken");
        CHECK_THAT(out.str(), Equals("log/level: err, message: broken, from: json2cbor\n"));
    }
    SECTION("clone writes to the same stream") {
        auto other = channel.clone();
        other.debug("cloned");
        CHECK_THAT(out.str(), Equals("log/level: debug, message: cloned, from: json2cbor\n"));
    }
}

static auto receiveFrames(void *socket) -> std::vector<std::string> {
    std::vector<std::string> frames;
    int more = 1;

    while (more) {
        zmq_msg_t msg;
        ::zmq_msg_init(&msg);
        if (::zmq_msg_recv(&msg, socket, 0) < 0) {
            ::zmq_msg_close(&msg);
            break;
        }
        frames.emplace_back(static_cast<const char *>(::zmq_msg_data(&msg)), ::zmq_msg_size(&msg));
        more = ::zmq_msg_more(&msg);
        ::zmq_msg_close(&msg);
    }

    return frames;
}

TEST_CASE("LogChannel::socket output") {
    auto *context = ::zmq_ctx_new();
    auto *pull = ::zmq_socket(context, ZMQ_PULL);
    auto *push = ::zmq_socket(context, ZMQ_PUSH);

    int timeout = 1000;
    REQUIRE(::zmq_setsockopt(pull, ZMQ_RCVTIMEO, &timeout, sizeof(timeout)) == 0);
    REQUIRE(::zmq_bind(pull, "inproc://cbor-stream-log") == 0);
    REQUIRE(::zmq_connect(push, "inproc://cbor-stream-log") == 0);

    std::ostringstream out;
    LogChannel channel(push, "", "unittest", out);

    channel.warn("hi");

    auto frames = receiveFrames(pull);

    ::zmq_close(push);
    ::zmq_close(pull);
    ::zmq_ctx_term(context);

    REQUIRE(frames.size() == 4);
    CHECK_THAT(frames[0], Equals("log"));
    CHECK_THAT(frames[1], Equals("unittest"));
    CHECK_THAT(toHex(std::vector<char>(frames[2].begin(), frames[2].end())), Equals(toHex(encodeLogRecord(LogLevel::warn, "", "hi"))));
    CHECK(frames[3].empty());

    INFO("nothing printed when the record was sent");
    CHECK(out.str().empty());
}

#endif
