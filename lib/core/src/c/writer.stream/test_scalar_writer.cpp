#ifndef DISABLE_CATCH2_TEST

#include <limits>
#include <sstream>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <catch2/matchers/catch_matchers_vector.hpp>

#include "run.hpp"

using namespace cbor_stream;
using Catch::Matchers::Equals;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

static auto writeToHex(const Value& value) -> std::string {
    CborEncoder encoder;
    Writer writer(encoder);

    writer.write(value);

    return toHex(encoder.rawBuffer());
}

TEST_CASE("Writer::scalar") {
    SECTION("unsigned integer") {
        CHECK_THAT(writeToHex(1000000), Equals("1a000f4240"));
        CHECK_THAT(writeToHex(0), Equals("00"));
        CHECK_THAT(writeToHex(23), Equals("17"));
        CHECK_THAT(writeToHex(24), Equals("1818"));
        CHECK_THAT(writeToHex(std::numeric_limits<uint64_t>::max()), Equals("1bffffffffffffffff"));
    }
    SECTION("negative integer") {
        CHECK_THAT(writeToHex(-1), Equals("20"));
        CHECK_THAT(writeToHex(-1000), Equals("3903e7"));
        CHECK_THAT(writeToHex(std::numeric_limits<int64_t>::min()), Equals("3b7fffffffffffffff"));
    }
    SECTION("double") {
        CHECK_THAT(writeToHex(1.0e+300), Equals("fb7e37e43c8800759c"));
    }
    SECTION("float") {
        CHECK_THAT(writeToHex(1.5f), Equals("fa3fc00000"));
        CHECK_THAT(writeToHex(100000.0f), Equals("fa47c35000"));
    }
    SECTION("text string") {
        CHECK_THAT(writeToHex("IETF"), Equals("6449455446"));
        CHECK_THAT(writeToHex(""), Equals("60"));
    }
    SECTION("byte string") {
        CHECK_THAT(writeToHex(Bytes{1, 2, 3, 4}), Equals("4401020304"));
    }
    SECTION("simple values") {
        CHECK_THAT(writeToHex(true), Equals("f5"));
        CHECK_THAT(writeToHex(false), Equals("f4"));
        CHECK_THAT(writeToHex(nullptr), Equals("f6"));
        CHECK_THAT(writeToHex(Undefined{}), Equals("f7"));
        CHECK_THAT(writeToHex(SimpleValue{19}), Equals("f3"));
    }
}

TEST_CASE("Writer::encoder calls") {
    SECTION("one scalar is one encode call without header") {
        RecordingEncoder encoder;
        Writer writer(encoder);

        writer.write(42);

        CHECK_THAT(encoder.calls, Equals(std::vector<std::string>{"encode(42)"}));
    }
    SECTION("repeated top-level items") {
        RecordingEncoder encoder;
        Writer writer(encoder);

        writer.write("a");
        writer.array(1, [](ArrayWriter& a) {
            a.write(1);
        });
        writer.write(nullptr);

        CHECK_THAT(encoder.calls, Equals(std::vector<std::string>{
            "encode(\"a\")", "header(Array, 1)", "encode(1)", "encode(null)"
        }));
    }
    SECTION("top-level items written to an output stream") {
        std::ostringstream out;
        CborEncoder encoder(out);
        Writer writer(encoder);

        writer.write(1);
        writer.write(2);

        auto written = out.str();
        CHECK_THAT(toHex(std::vector<char>(written.begin(), written.end())), Equals("0102"));
        CHECK(encoder.rawBuffer().empty());
    }
}

TEST_CASE("Writer::output stream failure") {
    SECTION("failed stream raises encode error") {
        std::ostringstream out;
        out.setstate(std::ios::badbit);
        CborEncoder encoder(out);
        Writer writer(encoder);

        CHECK_THROWS_AS(writer.write(1), EncodeError);
        CHECK_THROWS_WITH(writer.write("x"), StartsWith("Failed to write"));
    }
    SECTION("indefinite scope unwinding from a failed stream logs the failed break") {
        std::ostringstream out;
        std::ostringstream log_out;
        auto channel = LogChannel::streamChannel(log_out, "unittest");
        CborEncoder encoder(out);
        Writer writer(encoder, &channel);

        auto body = [&]() {
            writer.array(Length::indefinite(), [&](ArrayWriter& a) {
                a.write(1);
                out.setstate(std::ios::badbit);
                a.write(2);
            });
        };

        CHECK_THROWS_AS(body(), EncodeError);

        INFO("element failure wins, break failure is reported");
        CHECK_THAT(log_out.str(), ContainsSubstring("log/level: warn"));
        CHECK_THAT(log_out.str(), ContainsSubstring("Failed to write 1 byte(s)"));

        auto written = out.str();
        CHECK_THAT(toHex(std::vector<char>(written.begin(), written.end())), Equals("9f01"));
    }
}

#endif
