#include "text.hpp"
#include "zstdstream/zstd_writer.hpp"
#include "zstdstream/zstd_reader.hpp"
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
    vector<uint8_t>
    to_bytes(string const & s)
    {
        return vector<uint8_t>(s.begin(), s.end());
    }

    /* sink that refuses every byte */
    class rejecting_streambuf : public std::streambuf {
    protected:
        std::streamsize xsputn(char const * /*s*/, std::streamsize /*n*/) override { return 0; }
        int_type overflow(int_type /*ch*/) override { return traits_type::eof(); }
    };

    /* sink that accepts bytes,  but cannot sync them */
    class unsyncable_streambuf : public std::stringbuf {
    protected:
        int sync() override { return -1; }
    };
}

TEST_CASE("zstd_writer-hello", "[zstd_writer]") {
    stringbuf sink;

    zstd_writer w(&sink, compress_parameters().set_level(3).set_checksum(true));

    REQUIRE(w.state() == writer_state::idle);
    CHECK(w.parameters().level() == 3);
    CHECK(w.parameters().checksum());
    CHECK(w.sink() == &sink);

    CHECK(w.write("hello world", 11) == 11);
    CHECK(w.state() == writer_state::active);

    w.flush();

    /* everything written so far is decodable,  though frame is still open */
    string flushed = sink.str();

    {
        stringbuf source(flushed, ios::in);
        zstd_reader r(&source);

        char buf[64];
        size_t n = r.read(buf, sizeof(buf));

        CHECK(string(buf, n) == "hello world");
        CHECK(r.state() == reader_state::active);

        /* source ends inside frame */
        CHECK_THROWS_AS(r.read(buf, sizeof(buf)), truncated_frame);
    }

    w.write(" again", 6);
    w.finish();

    CHECK(w.state() == writer_state::closed);
    CHECK(w.is_closed());
    CHECK(w.n_in_total() == 17);
    CHECK(w.n_out_total() == sink.str().size());

    vector<uint8_t> z_v = to_bytes(sink.str());

    /* flushed output is a prefix of final output */
    CHECK(sink.str().compare(0, flushed.size(), flushed) == 0);

    REQUIRE(compression::decompress(z_v) == to_bytes("hello world again"));
}

TEST_CASE("zstd_writer-finish-twice", "[zstd_writer]") {
    stringbuf sink;

    zstd_writer w(&sink);

    w.write(Text::s_text, ::strlen(Text::s_text));
    w.finish();

    size_t z = sink.str().size();

    /* second finish is a no-op */
    w.finish();

    CHECK(w.state() == writer_state::closed);
    CHECK(sink.str().size() == z);

    CHECK_THROWS_AS(w.write("x", 1), closed_error);
    CHECK_THROWS_AS(w.flush(), closed_error);

    /* rejected write leaves writer closed,  not failed */
    CHECK(w.state() == writer_state::closed);

    REQUIRE(compression::decompress(to_bytes(sink.str())) == to_bytes(Text::s_text));
}

TEST_CASE("zstd_writer-empty", "[zstd_writer]") {
    stringbuf sink;

    zstd_writer w(&sink);

    /* flush before any write:  no frame started */
    w.flush();
    CHECK(sink.str().empty());
    CHECK(w.state() == writer_state::idle);

    w.finish();

    /* one empty frame */
    CHECK(!sink.str().empty());
    CHECK(compression::decompress(to_bytes(sink.str())).empty());
}

TEST_CASE("zstd_writer-ctor", "[zstd_writer]") {
    stringbuf sink;

    CHECK_THROWS_AS(zstd_writer(nullptr), invalid_parameter);
    CHECK_THROWS_AS(zstd_writer(&sink, compress_parameters(), 0), invalid_parameter);
}

TEST_CASE("zstd_writer-sink-error", "[zstd_writer]") {
    rejecting_streambuf sink;

    /* small buffer:  compressed output reaches sink during write() */
    zstd_writer w(&sink, compress_parameters(), 16);

    string big(64 * 1024, 'q');
    for (size_t i = 0; i < big.size(); i += 7)
        big[i] = static_cast<char>('a' + (i % 26));

    bool threw = false;
    try {
        w.write(big.data(), big.size());
        w.finish();
    } catch (sink_error & ex) {
        INFO(tostr("ex.what=", ex.what()));

        threw = true;
        CHECK(ex.n_out() == 0);
    }

    CHECK(threw);
    CHECK(w.state() == writer_state::failed);

    /* failed writer refuses everything,  including finish */
    CHECK_THROWS_AS(w.write("x", 1), closed_error);
    CHECK_THROWS_AS(w.flush(), closed_error);
    CHECK_THROWS_AS(w.finish(), closed_error);
}

TEST_CASE("zstd_writer-sync-error", "[zstd_writer]") {
    unsyncable_streambuf sink;

    zstd_writer w(&sink);

    w.write("hello", 5);

    CHECK_THROWS_AS(w.finish(), sink_error);
    CHECK(w.state() == writer_state::failed);
}

TEST_CASE("zstd_writer-sync-error-idle", "[zstd_writer]") {
    unsyncable_streambuf sink;

    zstd_writer w(&sink);

    /* nothing written:  flush only syncs the sink,  and that fails */
    CHECK_THROWS_AS(w.flush(), sink_error);
    CHECK(w.state() == writer_state::failed);

    CHECK_THROWS_AS(w.write("x", 1), closed_error);
    CHECK_THROWS_AS(w.finish(), closed_error);
}

namespace {
    /* write s through a writer with parameters cp,  in chunks of 1000 bytes */
    string
    write_all(string const & s, compress_parameters const & cp)
    {
        stringbuf sink;
        zstd_writer w(&sink, cp);

        for (size_t i = 0; i < s.size(); i += 1000)
            w.write(s.data() + i, std::min(s.size() - i, size_t(1000)));

        w.finish();

        return sink.str();
    }

    string
    read_all(string const & z, decompress_parameters const & dp)
    {
        stringbuf source(z, ios::in);
        zstd_reader r(&source, dp);

        string retval;
        char buf[4096];

        for (size_t n = 0; (n = r.read(buf, sizeof(buf))) > 0;)
            retval.append(buf, n);

        return retval;
    }

    string
    make_text(size_t n)
    {
        string retval;

        while (retval.size() < n)
            retval.append(Text::s_text);

        retval.resize(n);

        return retval;
    }
}

TEST_CASE("zstd_writer-window-log", "[zstd_writer][zstd_reader]") {
    string og = make_text(300000);

    compress_parameters cp;
    cp.set_window_log(28).set_checksum(true);

    string z = write_all(og, cp);

    /* streamed frame has no declared size,  so it keeps the full 2^28 window;
     * decoder refuses it under the default window limit
     */
    CHECK_THROWS_AS(read_all(z, decompress_parameters()), engine_error);

    decompress_parameters dp;
    dp.set_window_log_max(28);

    REQUIRE(read_all(z, dp) == og);
}

TEST_CASE("zstd_writer-workers", "[zstd_writer][zstd_reader]") {
    compress_parameters cp;

    if (!cp.caps().multithread()) {
        CHECK_THROWS_AS(cp.set_workers(2), unsupported_feature);
        return;
    }

    cp.set_workers(2).set_checksum(true);

    /* several worker jobs' worth of input */
    string og = make_text(4 * 1024 * 1024);

    string z = write_all(og, cp);

    REQUIRE(read_all(z, decompress_parameters()) == og);
}

TEST_CASE("zstd_writer-skippable-frame", "[zstd_writer]") {
    stringbuf sink;

    zstd_writer w(&sink);

    /* argument checked before anything is written */
    CHECK_THROWS_AS(w.write_skippable_frame("x", 1, 16), invalid_parameter);
    CHECK(w.state() == writer_state::idle);

    w.write("hello ", 6);
    w.write_skippable_frame("meta", 4, 2);

    /* open frame completed first;  next write starts a new frame */
    CHECK(w.state() == writer_state::idle);
    CHECK(w.n_frames() == 2);

    w.write("world", 5);
    w.finish();

    CHECK(w.n_frames() == 3);

    string z = sink.str();

    /* skippable frames are invisible to decompression */
    REQUIRE(compression::decompress(to_bytes(z)) == to_bytes("hello world"));

    stringbuf source(z, ios::in);
    zstd_reader r(&source);

    char buf[64];
    CHECK(r.read(buf, sizeof(buf)) == 6);
    CHECK(string(buf, 6) == "hello ");

    vector<uint8_t> meta_v;
    CHECK(r.read_skippable_frame(meta_v) == 2);
    CHECK(meta_v == to_bytes("meta"));

    CHECK(r.read(buf, sizeof(buf)) == 5);
    CHECK(string(buf, 5) == "world");
}

TEST_CASE("zstd_writer-skippable-frame-last", "[zstd_writer]") {
    stringbuf sink;

    zstd_writer w(&sink);

    w.write_skippable_frame("only", 4);
    w.finish();

    /* no empty regular frame after a trailing skippable frame */
    CHECK(w.n_frames() == 1);
    CHECK(sink.str().size() == 12);
    CHECK(compression::is_skippable_frame(cbyte_span::from_size(reinterpret_cast<uint8_t const *>(sink.str().data()),
                                                                sink.str().size())));

    CHECK_THROWS_AS(w.write_skippable_frame("x", 1), closed_error);
}

namespace {
    struct TestCase {
        TestCase(uint32_t bufz, uint32_t wz)
            : buf_z_{bufz}, write_chunk_z_{wz} {}

        /* buffer size for zstd_writer */
        uint32_t buf_z_ = 0;
        /* write uncompressed text in chunks of this size */
        uint32_t write_chunk_z_ = 0;
    };

    static vector<TestCase> s_testcase_v = {
        /*       buf_z
         *               write_chunk_z
         */
        TestCase(    1,      1),
        TestCase(    1,    256),
        TestCase(  256,     15),
        TestCase(  256,    129),
        TestCase(65536,    129),
        TestCase(65536,  65536)
    };
}

TEST_CASE("zstd_writer-chunks", "[zstd_writer]") {
    size_t const c_text_z = ::strlen(Text::s_text);

    for (size_t i_tc = 0; i_tc < s_testcase_v.size(); ++i_tc) {
        TestCase const & tc = s_testcase_v[i_tc];

        INFO(tostr("i_tc=", i_tc, ", buf_z=", tc.buf_z_, ", write_chunk_z=", tc.write_chunk_z_));

        stringbuf sink;
        zstd_writer w(&sink, compress_parameters().set_checksum(true), tc.buf_z_);

        for (size_t i = 0; i < c_text_z;) {
            size_t nreq = std::min(static_cast<size_t>(tc.write_chunk_z_), c_text_z - i);

            w.write(Text::s_text + i, nreq);
            i += nreq;

            /* occasional flush mid-frame */
            if (i % 1000 < nreq)
                w.flush();
        }

        w.finish();

        CHECK(w.n_in_total() == c_text_z);
        REQUIRE(compression::decompress(to_bytes(sink.str())) == to_bytes(Text::s_text));
    }
}
