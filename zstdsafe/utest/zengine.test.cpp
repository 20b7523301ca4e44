#include "zstdsafe/compress_zengine.hpp"
#include "zstdsafe/decompress_zengine.hpp"
#include "zstdsafe/buffered_compress_zengine.hpp"
#include "zstdsafe/buffered_decompress_zengine.hpp"
#include "zstdsafe/zsafe.hpp"
#include "zstdsafe/compression.hpp"
#include "zstdsafe/tostr.hpp"
#include <catch2/catch.hpp>
#include <vector>
#include <string>
#include <algorithm>

using namespace std;

namespace {
    /* compressible text:  numbered lines */
    vector<uint8_t>
    make_text(size_t n_line)
    {
        string s;
        for (size_t i = 0; i < n_line; ++i)
            s += tostr("line ", i, ": the quick brown fox jumps over the lazy dog\n");

        return vector<uint8_t>(s.begin(), s.end());
    }
}

TEST_CASE("zsafe-step", "[zsafe]") {
    vector<uint8_t> og_v = make_text(100);
    vector<uint8_t> z_v(compression::compress_bound(og_v.size()));

    compress_zengine czs;

    in_view in(og_v.data(), og_v.size());
    out_view out(z_v.data(), z_v.size());

    REQUIRE(!czs.is_started());

    /* continue: engine may buffer everything */
    step_result r1 = zsafe::step(czs, in, out, directive::e_continue);

    CHECK(czs.is_started());
    CHECK(r1.n_consumed == og_v.size());
    CHECK(in.remaining() == 0);
    CHECK(out.pos() == r1.n_produced);

    step_result r2 = zsafe::step(czs, in, out, directive::e_end);

    CHECK(r2.hint == 0);
    CHECK(r2.n_consumed == 0);
    CHECK(czs.n_in_total() == og_v.size());
    CHECK(czs.n_out_total() == out.pos());

    z_v.resize(out.pos());

    /* now decompress with explicit views */
    vector<uint8_t> og2_v(og_v.size());

    decompress_zengine dzs;

    in_view zin(z_v.data(), z_v.size());
    out_view ucout(og2_v.data(), og2_v.size());

    step_result r3 = zsafe::step(dzs, zin, ucout);

    CHECK(r3.hint == 0);
    CHECK(r3.n_consumed == z_v.size());
    CHECK(r3.n_produced == og_v.size());
    REQUIRE(og2_v == og_v);
}

TEST_CASE("zsafe-short-buffer", "[zsafe]") {
    vector<uint8_t> og_v = make_text(1);
    vector<uint8_t> z_v(16);

    compress_zengine czs;

    in_view in(og_v.data(), og_v.size());
    out_view out(z_v.data(), z_v.size(), z_v.size());

    CHECK_THROWS_AS(zsafe::step(czs, in, out, directive::e_end), short_buffer);
    CHECK(in.pos() == 0);

    decompress_zengine dzs;

    CHECK_THROWS_AS(zsafe::step(dzs, in, out), short_buffer);
}

TEST_CASE("zsafe-decompress-directive", "[zsafe]") {
    vector<uint8_t> z_v = compression::compress(make_text(1));
    vector<uint8_t> og_v(1024);

    decompress_zengine dzs;

    in_view in(z_v.data(), z_v.size());
    out_view out(og_v.data(), og_v.size());

    CHECK_THROWS_AS(zsafe::step(dzs, in, out, directive::e_flush), invalid_parameter);
    CHECK_THROWS_AS(zsafe::step(dzs, in, out, directive::e_end), invalid_parameter);
    CHECK(!dzs.is_started());
}

TEST_CASE("compress_zengine-already-started", "[compress_zengine]") {
    vector<uint8_t> og_v = make_text(10);
    vector<uint8_t> z_v(compression::compress_bound(og_v.size()));

    compress_zengine zs;

    /* before first step: configure is fine */
    zs.configure(compress_parameters().set_level(1));
    CHECK(zs.parameters().level() == 1);

    zs.provide_input(cbyte_span::from_size(og_v.data(), og_v.size()));
    zs.provide_output(byte_span::from_size(z_v.data(), z_v.size()));

    chunk_result r = zs.compress_chunk(directive::e_continue);

    CHECK(r.consumed.lo() == og_v.data());
    CHECK(r.produced.lo() == z_v.data());

    CHECK_THROWS_AS(zs.configure(compress_parameters().set_level(5)), already_started);
    CHECK(zs.parameters().level() == 1);

    /* rebuild abandons partial frame;  engine usable again */
    zs.rebuild(compress_parameters().set_level(5));

    CHECK(!zs.is_started());
    CHECK(zs.n_in_total() == 0);
    CHECK(zs.n_out_total() == 0);
    CHECK(zs.parameters().level() == 5);

    zs.provide_input(cbyte_span::from_size(og_v.data(), og_v.size()));
    zs.provide_output(byte_span::from_size(z_v.data(), z_v.size()));

    uint64_t z_z = 0;
    for (;;) {
        chunk_result r2 = zs.compress_chunk(directive::e_end);
        z_z += r2.produced.size();
        if (r2.hint == 0)
            break;
    }

    z_v.resize(z_z);

    REQUIRE(compression::decompress(z_v) == og_v);
}

TEST_CASE("decompress_zengine-already-started", "[decompress_zengine]") {
    vector<uint8_t> z_v = compression::compress(make_text(10));
    vector<uint8_t> og_v(64);

    decompress_zengine zs;

    zs.provide_input(cbyte_span::from_size(z_v.data(), z_v.size()));
    zs.provide_output(byte_span::from_size(og_v.data(), og_v.size()));
    zs.decompress_chunk();

    CHECK(zs.is_started());
    CHECK_THROWS_AS(zs.configure(decompress_parameters()), already_started);

    zs.rebuild();

    CHECK(!zs.is_started());
    CHECK(zs.input_empty());
}

TEST_CASE("zengine-provide-input", "[base_zengine]") {
    vector<uint8_t> og_v = make_text(2);

    compress_zengine zs;

    cbyte_span all = cbyte_span::from_size(og_v.data(), og_v.size());

    zs.provide_input(all.prefix(10));

    /* replacing unconsumed input with a range starting elsewhere would lose bytes */
    CHECK_THROWS_AS(zs.provide_input(all.after(10)), cursor_overflow);

    /* extending the unconsumed remainder is fine */
    zs.provide_input(all);

    CHECK(zs.have_input());
}

TEST_CASE("decompress_zengine-corrupt", "[decompress_zengine]") {
    string junk = "this is not a zstd frame, not even close";
    vector<uint8_t> z_v(junk.begin(), junk.end());
    vector<uint8_t> og_v(1024);

    decompress_zengine zs;

    zs.provide_input(cbyte_span::from_size(z_v.data(), z_v.size()));
    zs.provide_output(byte_span::from_size(og_v.data(), og_v.size()));

    try {
        zs.decompress_chunk();
        FAIL("expected engine_error");
    } catch (engine_error & ex) {
        INFO(tostr("ex.what=", ex.what()));

        CHECK(ex.code() != 0);
        CHECK(!ex.name().empty());
    }
}

TEST_CASE("compress_zengine-pledged-size", "[compress_zengine]") {
    vector<uint8_t> og_v = make_text(10);

    SECTION("honored") {
        compress_parameters p;
        p.set_pledged_src_size(og_v.size());

        vector<uint8_t> z_v = compression::compress(og_v, p);

        optional<uint64_t> z = compression::frame_content_size(cbyte_span::from_size(z_v.data(), z_v.size()));

        REQUIRE(z);
        CHECK(*z == og_v.size());
    }

    SECTION("broken") {
        compress_parameters p;
        p.set_pledged_src_size(og_v.size() + 1);

        CHECK_THROWS_AS(compression::compress(og_v, p), engine_error);
    }
}

namespace {
    struct TestCase {
        TestCase(uint32_t bufz, uint32_t wz)
            : buf_z_{bufz}, write_chunk_z_{wz} {}

        /* buffer size for buffered engines */
        uint32_t buf_z_ = 0;
        /* give uncompressed text to compressor in chunks of this size */
        uint32_t write_chunk_z_ = 0;
    };

    static vector<TestCase> s_testcase_v = {
        /*       buf_z
         *               write_chunk_z
         */
        TestCase(    1,      1),
        TestCase(   16,     15),
        TestCase(  256,     17),
        TestCase(  256,    256),
        TestCase(65536,    129),
        TestCase(65536,  65536)
    };
}

TEST_CASE("buffered-zengine", "[buffered_compress_zengine][buffered_decompress_zengine]") {
    vector<uint8_t> og_v = make_text(500);

    for (size_t i_tc = 0; i_tc < s_testcase_v.size(); ++i_tc) {
        TestCase const & tc = s_testcase_v[i_tc];

        INFO(tostr("i_tc=", i_tc, ", buf_z=", tc.buf_z_, ", write_chunk_z=", tc.write_chunk_z_));

        // ----------------------------------------------------------------
        // 1 - compress
        // ----------------------------------------------------------------

        vector<uint8_t> z_v;

        {
            buffered_compress_zengine zs(compress_parameters().set_checksum(true), tc.buf_z_);

            size_t i = 0;
            while (i < og_v.size()) {
                size_t n = std::min({ static_cast<size_t>(tc.write_chunk_z_),
                                      og_v.size() - i,
                                      static_cast<size_t>(zs.uc_avail().size()) });

                byte_span uc = zs.uc_avail().prefix(n);
                std::copy(og_v.data() + i, og_v.data() + i + n, uc.lo());
                zs.uc_produce(uc);
                i += n;

                zs.compress_chunk(directive::e_continue);

                z_v.insert(z_v.end(), zs.z_contents().lo(), zs.z_contents().hi());
                zs.z_consume_all();
            }

            for (;;) {
                step_result r = zs.compress_chunk(directive::e_end);

                z_v.insert(z_v.end(), zs.z_contents().lo(), zs.z_contents().hi());
                zs.z_consume_all();

                if (r.hint == 0)
                    break;
            }

            CHECK(zs.n_in_total() == og_v.size());
            CHECK(zs.n_out_total() == z_v.size());
        }

        // ----------------------------------------------------------------
        // 2 - decompress + verify
        // ----------------------------------------------------------------

        {
            buffered_decompress_zengine zs(decompress_parameters(), tc.buf_z_);

            vector<uint8_t> og2_v;
            size_t i = 0;

            while ((i < z_v.size()) || zs.work_pending()) {
                if (!zs.work_pending()) {
                    size_t n = std::min(z_v.size() - i, static_cast<size_t>(zs.z_avail().size()));

                    byte_span zspan = zs.z_avail().prefix(n);
                    std::copy(z_v.data() + i, z_v.data() + i + n, zspan.lo());
                    zs.z_produce(zspan);
                    i += n;
                }

                zs.decompress_chunk();

                og2_v.insert(og2_v.end(), zs.uc_contents().lo(), zs.uc_contents().hi());
                zs.uc_consume_all();
            }

            CHECK(!zs.mid_frame());
            REQUIRE(og2_v == og_v);
        }
    }
}
