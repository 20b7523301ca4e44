#include "zstdsafe/hex.hpp"
#include "zstdsafe/compression.hpp"
#include <catch2/catch.hpp>
#include <sstream>
#include <array>
#include <vector>

using namespace std;

TEST_CASE("hex-byte", "[hex]") {
    stringstream ss;

    ss << ::hex(0x0f, false) << " " << ::hex(0xb5, false) << " " << ::hex('q', true);

    REQUIRE(ss.str() == "0f b5 71(q)");
}

TEST_CASE("hex-frame-magic", "[hex]") {
    /* every zstd frame starts with magic number 0xfd2fb528,  little-endian */
    vector<uint8_t> z = compression::compress(vector<uint8_t>{'a', 'b', 'c'});

    REQUIRE(z.size() >= 4);

    stringstream ss;
    ss << ::hex_view(cbyte_span::from_size(z.data(), 4), false);

    REQUIRE(ss.str() == "[28 b5 2f fd]");
}

TEST_CASE("hex-view-as-text", "[hex]") {
    stringstream ss;

    array<char, 4> v = {{ 'z', 's', '\n', 't' }};

    ss << ::hex_view(v.data(), v.data() + v.size(), true);

    REQUIRE(ss.str() == "[7a(z) 73(s) 0a(?) 74(t)]");
}

TEST_CASE("hex-view-elide", "[hex]") {
    stringstream ss;

    vector<uint8_t> v(10, 0xff);

    ss << ::hex_view(v.data(), v.data() + v.size(), false, 2 /*max_z*/);

    REQUIRE(ss.str() == "[ff ff ..6.. ff ff]");
}
