#include "zstdsafe/buffer.hpp"
#include "zstdsafe/buffer_view.hpp"
#include <catch2/catch.hpp>
#include <array>

using namespace std;

TEST_CASE("buffer_view", "[buffer_view]") {
    array<uint8_t, 16> mem = {{ 0 }};

    out_view out(mem.data(), mem.size());

    REQUIRE(out.pos() == 0);
    REQUIRE(out.remaining() == 16);
    REQUIRE(out.cursor() == mem.data());

    out.advance(10);

    CHECK(out.pos() == 10);
    CHECK(out.remaining() == 6);
    CHECK(out.consumed().size() == 10);
    CHECK(out.unconsumed().size() == 6);
    CHECK(out.cursor() == mem.data() + 10);

    /* advancing to exactly capacity is fine */
    out.advance(6);

    CHECK(out.remaining() == 0);
    CHECK(out.pos() == out.capacity());
}

TEST_CASE("buffer_view-overflow", "[buffer_view]") {
    array<uint8_t, 16> mem = {{ 0 }};

    in_view in(mem.data(), mem.size(), 12);

    REQUIRE(in.remaining() == 4);

    /* position unchanged after refused advance */
    CHECK_THROWS_AS(in.advance(5), cursor_overflow);
    CHECK(in.pos() == 12);

    /* initial position past capacity is refused */
    CHECK_THROWS_AS(in_view(mem.data(), mem.size(), 17), cursor_overflow);
}

TEST_CASE("buffer", "[buffer]") {
    buffer<uint8_t> buf(64);

    REQUIRE(buf.empty());
    REQUIRE(buf.buf_z() == 64);
    REQUIRE(buf.avail().size() == 64);

    byte_span a = buf.avail();
    buf.produce(a.prefix(20));

    CHECK(buf.contents().size() == 20);
    CHECK(buf.avail().size() == 44);

    buf.consume(buf.contents().prefix(5));

    CHECK(buf.lo_pos() == 5);
    CHECK(buf.contents().size() == 15);

    /* consuming everything recycles the whole buffer */
    buf.consume(buf.contents());

    CHECK(buf.empty());
    CHECK(buf.lo_pos() == 0);
    CHECK(buf.hi_pos() == 0);
    CHECK(buf.avail().size() == 64);
}

TEST_CASE("buffer-overflow", "[buffer]") {
    buffer<uint8_t> buf(8);

    byte_span a = buf.avail();

    /* not a prefix of available space */
    CHECK_THROWS_AS(buf.produce(a.after(1).prefix(2)), cursor_overflow);
    CHECK(buf.empty());

    buf.produce(a.prefix(4));

    /* more than contents */
    byte_span too_much(buf.contents().lo(), buf.contents().lo() + 5);
    CHECK_THROWS_AS(buf.consume(too_much), cursor_overflow);
    CHECK(buf.contents().size() == 4);
}

TEST_CASE("span-const-conversion", "[span]") {
    array<uint8_t, 4> mem = {{ 1, 2, 3, 4 }};

    byte_span s = byte_span::from_size(mem.data(), mem.size());
    cbyte_span cs = s;

    CHECK(cs.lo() == mem.data());
    CHECK(cs.size() == 4);
    CHECK(cs.after(1).prefix(2).size() == 2);
    CHECK(*cs.after(1).lo() == 2);
}
