#include "text.hpp"
#include "zstdstream/zstd_decompress_writer.hpp"
#include "zstdstream/zstd_writer.hpp"
#include "zstdsafe/compression.hpp"
#include "zstdsafe/zstd_error.hpp"
#include "zstdsafe/tostr.hpp"
#include "catch2/catch.hpp"

#include <sstream>
#include <string>
#include <vector>
#include <algorithm>
#include <cstring>

using namespace std;

namespace {
    string
    compress_str(string const & s, compress_parameters const & p = compress_parameters())
    {
        vector<uint8_t> z_v = compression::compress(vector<uint8_t>(s.begin(), s.end()), p);

        return string(z_v.begin(), z_v.end());
    }

    /* feed z to w in chunks of chunk_z bytes */
    void
    write_all(zstd_decompress_writer & w, string const & z, size_t chunk_z)
    {
        for (size_t i = 0; i < z.size(); i += chunk_z)
            w.write(z.data() + i, std::min(chunk_z, z.size() - i));
    }

    /* sink that refuses every byte */
    class rejecting_streambuf : public std::streambuf {
    protected:
        std::streamsize xsputn(char const * /*s*/, std::streamsize /*n*/) override { return 0; }
        int_type overflow(int_type /*ch*/) override { return traits_type::eof(); }
    };
}

TEST_CASE("zstd_decompress_writer-roundtrip", "[zstd_decompress_writer]") {
    string z = compress_str(Text::s_text, compress_parameters().set_checksum(true));

    for (size_t chunk_z : { size_t(1), size_t(7), size_t(256), z.size() }) {
        for (size_t buf_z : { 1, 100, 65536 }) {
            INFO(tostr("chunk_z=", chunk_z, ", buf_z=", buf_z));

            stringbuf sink;
            zstd_decompress_writer w(&sink, decompress_parameters(), buf_z);

            REQUIRE(w.state() == writer_state::idle);
            CHECK(w.sink() == &sink);

            write_all(w, z, chunk_z);

            CHECK(!w.mid_frame());
            CHECK(w.n_frames() == 1);

            w.finish();

            CHECK(w.is_closed());
            CHECK(w.n_in_total() == z.size());
            CHECK(w.n_out_total() == ::strlen(Text::s_text));
            REQUIRE(sink.str() == Text::s_text);
        }
    }
}

TEST_CASE("zstd_decompress_writer-multi-frame", "[zstd_decompress_writer]") {
    string skip_v = "metadata";
    vector<uint8_t> skip_z = compression::skippable_frame(cbyte_span::from_size(reinterpret_cast<uint8_t const *>(skip_v.data()),
                                                                                 skip_v.size()),
                                                          3);

    string z = (compress_str("hello ")
                + string(skip_z.begin(), skip_z.end())
                + compress_str("")
                + compress_str("world"));

    stringbuf sink;
    zstd_decompress_writer w(&sink);

    write_all(w, z, 5);
    w.finish();

    /* skippable frame passed over,  but counted */
    CHECK(w.n_frames() == 4);
    REQUIRE(sink.str() == "hello world");
}

TEST_CASE("zstd_decompress_writer-truncated", "[zstd_decompress_writer]") {
    string z = compress_str(Text::s_text, compress_parameters().set_checksum(true));

    stringbuf sink;
    zstd_decompress_writer w(&sink);

    write_all(w, z.substr(0, z.size() - 1), 64);

    CHECK(w.mid_frame());
    CHECK(w.state() == writer_state::active);

    CHECK_THROWS_AS(w.finish(), truncated_frame);
    CHECK(w.state() == writer_state::failed);
    CHECK_THROWS_AS(w.write("x", 1), closed_error);
}

TEST_CASE("zstd_decompress_writer-corrupt", "[zstd_decompress_writer]") {
    stringbuf sink;
    zstd_decompress_writer w(&sink);

    string junk = "this is plain text,  not a zstd frame";

    CHECK_THROWS_AS(w.write(junk.data(), junk.size()), engine_error);
    CHECK(w.state() == writer_state::failed);
    CHECK_THROWS_AS(w.flush(), closed_error);
}

TEST_CASE("zstd_decompress_writer-sink-error", "[zstd_decompress_writer]") {
    string z = compress_str(Text::s_text);

    rejecting_streambuf sink;
    zstd_decompress_writer w(&sink);

    try {
        w.write(z.data(), z.size());
        FAIL("expected sink_error");
    } catch (sink_error & ex) {
        INFO(tostr("ex.what=", ex.what()));

        CHECK(ex.n_out() == 0);
    }

    CHECK(w.state() == writer_state::failed);
}

TEST_CASE("zstd_decompress_writer-finish", "[zstd_decompress_writer]") {
    stringbuf sink;

    CHECK_THROWS_AS(zstd_decompress_writer(nullptr), invalid_parameter);
    CHECK_THROWS_AS(zstd_decompress_writer(&sink, decompress_parameters(), 0), invalid_parameter);

    zstd_decompress_writer w(&sink);

    /* nothing written:  empty stream is complete */
    w.flush();
    w.finish();

    CHECK(w.is_closed());
    CHECK(w.n_frames() == 0);

    /* second finish is a no-op */
    w.finish();

    CHECK_THROWS_AS(w.write("x", 1), closed_error);
    CHECK(w.state() == writer_state::closed);
}

TEST_CASE("zstd_decompress_writer-from-writer", "[zstd_decompress_writer][zstd_writer]") {
    /* compress by pushing,  decompress by pushing */
    stringbuf sink;
    zstd_decompress_writer dw(&sink);

    stringbuf zbuf;
    zstd_writer w(&zbuf, compress_parameters().set_checksum(true), 512);

    size_t const c_text_z = ::strlen(Text::s_text);

    for (size_t i = 0; i < c_text_z; i += 100) {
        w.write(Text::s_text + i, std::min(size_t(100), c_text_z - i));
        w.flush();

        /* hand over whatever is decodable so far */
        string z = zbuf.str();
        zbuf.str(string());

        dw.write(z.data(), z.size());

        CHECK(dw.n_out_total() == std::min(i + 100, c_text_z));
    }

    w.finish();

    string z = zbuf.str();
    dw.write(z.data(), z.size());
    dw.finish();

    CHECK(dw.n_frames() == 1);
    REQUIRE(sink.str() == Text::s_text);
}
