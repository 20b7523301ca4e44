#include "text.hpp"
#include "zstdstream/zstdstream.hpp"
#include "zstdsafe/compression.hpp"
#include "zstdsafe/zstd_error.hpp"
#include "catch2/catch.hpp"

#include <fstream>
#include <sstream>
#include <cstring>
#include <cstdio>

using namespace std;

namespace {
    string
    native_contents(zstdstream & zs)
    {
        stringbuf * p = dynamic_cast<stringbuf *>(zs.rdbuf()->native_sbuf());

        REQUIRE(p);

        return p->str();
    }
}

TEST_CASE("zstdstream", "[zstdstream]") {
    /* true to enable some logging,  useful if this unit test should fail */
    constexpr bool c_debug_flag = false;

    constexpr size_t c_buf_z = 64*1024;

    /* length of text to be written */
    size_t const c_text_z = ::strlen(Text::s_text);

    size_t n_uc_out_total = 0;
    string z_text;

    /* compress.. */
    {
        unique_ptr<streambuf> native_sbuf(new stringbuf(ios::out));

        zstdstream zs(c_buf_z,
                      std::move(native_sbuf),
                      ios::out);

#      ifndef NDEBUG
        zs.set_debug_flag(c_debug_flag);
#      endif

        CHECK(zs.is_open());
        CHECK(!zs.is_closed());
        CHECK(zs.rdbuf()->n_uc_out_total() == 0);
        CHECK(zs.rdbuf()->n_z_out_total() == 0);

        zstdstream::off_type p0 = zs.tellp();

        CHECK(p0 == 0);

        zs << Text::s_text << endl;

        zstdstream::off_type p1 = zs.tellp();

        /* +1 for endl */
        CHECK(p1 == static_cast<zstdstream::off_type>(c_text_z + 1));

        n_uc_out_total = (p1 - p0);

        /* reminder:
         * 1. have to use .final_sync() or .close() to get complete compressed output.
         * 2. .close() would also reset byte counters like .n_z_out_total
         */
        zs.final_sync();

        CHECK(zs.good());
        CHECK(zs.is_open());
        CHECK(zs.rdbuf()->n_uc_out_total() == n_uc_out_total);

        z_text = native_contents(zs);

        CHECK(zs.rdbuf()->n_z_out_total() == z_text.size());

        if (c_debug_flag)
            cout << hex_view(z_text.data(), z_text.data() + z_text.size(), false) << endl;

        zs.close(); /*hygiene*/

        CHECK(!zs.is_open());
        CHECK(zs.is_closed());
        CHECK(zs.rdbuf()->n_uc_out_total() == 0);
        CHECK(zs.rdbuf()->n_z_out_total() == 0);
    }

    /* now decompress.. */
    {
        zstdstream zs(64 * 1024,
                      unique_ptr<streambuf>(new stringbuf(z_text, ios::in)),
                      ios::in);

#      ifndef NDEBUG
        zs.set_debug_flag(c_debug_flag);
#      endif

        string ucbuf2(c_buf_z, '\0');

        zs.read(ucbuf2.data(), ucbuf2.size());
        streamsize n_read = zs.gcount();

        CHECK(zs.fail()); /* reached eof before ucbuf2.size();  this sets failbit in .read() */
        CHECK(zs.eof());
        CHECK(!zs.bad());

        CHECK(n_read == static_cast<streamsize>(n_uc_out_total));

        INFO("uncompressed input:");
        INFO(string_view(ucbuf2.data(), n_read));

        REQUIRE(ucbuf2.substr(0, n_read) == string(Text::s_text) + "\n");
    }
}

TEST_CASE("zstdstream-hello", "[zstdstream]") {
    string z_text;

    {
        zstdstream zs(1024,
                      unique_ptr<streambuf>(new stringbuf(ios::out)),
                      ios::out,
                      compress_parameters().set_level(3).set_checksum(true));

        CHECK(zs.rdbuf()->compress_params().level() == 3);
        CHECK(zs.rdbuf()->compress_params().checksum());

        zs << "hello world";
        zs.flush_frame();
        zs << " again";
        zs.final_sync();

        z_text = native_contents(zs);
    }

    vector<uint8_t> z_v(z_text.begin(), z_text.end());
    vector<uint8_t> og_v = compression::decompress(z_v);

    REQUIRE(string(og_v.begin(), og_v.end()) == "hello world again");
}

TEST_CASE("zstdstream-read_until", "[zstdstream]") {
    string z_text;

    {
        zstdstream zs(64,
                      unique_ptr<streambuf>(new stringbuf(ios::out)),
                      ios::out);

        zs << "first line\n" << "\n" << "third line\n" << "no newline";
        zs.final_sync();

        z_text = native_contents(zs);
    }

    zstdstream zs(16,
                  unique_ptr<streambuf>(new stringbuf(z_text, ios::in)),
                  ios::in);

    CHECK(zs.read_until(true, '\n') == "first line\n");
    CHECK(zs.read_until(true, '\n') == "\n");
    /* small block size:  line assembled from several blocks */
    CHECK(zs.read_until(true, '\n', 3) == "third line\n");
    CHECK(zs.read_until(true, '\n') == "no newline");
    CHECK(zs.eof());
    CHECK(zs.read_until(true, '\n') == "");
}

TEST_CASE("zstdstream-read_until-all", "[zstdstream]") {
    string z_text;

    {
        zstdstream zs(64,
                      unique_ptr<streambuf>(new stringbuf(ios::out)),
                      ios::out);

        zs << Text::s_text;
        zs.final_sync();

        z_text = native_contents(zs);
    }

    zstdstream zs(unique_ptr<streambuf>(new stringbuf(z_text, ios::in)), ios::in);

    REQUIRE(zs.read_until(false, '\0', 100) == Text::s_text);
}

TEST_CASE("zstdstream-corrupt", "[zstdstream]") {
    zstdstream zs(1024,
                  unique_ptr<streambuf>(new stringbuf(string("definitely not compressed"), ios::in)),
                  ios::in);

    char buf[64];

    /* istream::read converts the decompression error into badbit */
    zs.read(buf, sizeof(buf));

    CHECK(zs.bad());

    /* read_until reports the error itself */
    zs.clear();
    CHECK_THROWS_AS(zs.read_until(true, '\n'), closed_error);
    CHECK(zs.bad());
}

TEST_CASE("zstdstream-open-failure", "[zstdstream]") {
    zstdstream zs(1024, "no/such/directory/file.zst", ios::in);

    CHECK(zs.fail());
    CHECK(zs.is_closed());
}

namespace {
    struct TestCase {
        TestCase(uint32_t bufz, uint32_t wz, uint32_t rz)
            : buf_z_{bufz}, write_chunk_z_{wz}, read_chunk_z_{rz} {}

        /* buffer size for zstdstreambuf - applies to buffers for:
         * - uncompressed input + output
         * - compressed input + output
         */
        uint32_t buf_z_ = 0;
        /* write uncompressed text in chunks of this size */
        uint32_t write_chunk_z_ = 0;
        /* read uncompresseed text in chunks of this size */
        uint32_t read_chunk_z_ = 0;
    };

    static vector<TestCase> s_testcase_v = {
        /*       buf_z
         *               write_chunk_z
         *                          read_chunk_z
         */
        TestCase(    1,      1,     1),
        TestCase(    1,    256,   256),
        TestCase(  256,     15,    15),
        TestCase(  256,     16,    16),
        TestCase(  256,     17,    17),
        TestCase(  256,    129,   129),
        TestCase(65536,    129,   129),
        TestCase(65536,  65536, 65536)
    };
}

/* use zstdstream + write to file on disk.
 */
TEST_CASE("zstdstream-filebuf", "[zstdstream]") {
    for (size_t i_tc = 0; i_tc < s_testcase_v.size(); ++i_tc) {
        TestCase const & tc = s_testcase_v[i_tc];

        std::string fname = tostr("test", i_tc, ".zst");

        INFO(tostr("i_tc=", i_tc, ", fname=", fname));

        // ----------------------------------------------------------------
        // 1 - compress some text
        // ----------------------------------------------------------------

        {
            zstdstream zs(tc.buf_z_, fname.c_str(), ios::out);

            REQUIRE(zs.is_open());

            /* write from s_text in small chunk sizes */
            size_t const c_write_z = tc.write_chunk_z_;

            for (size_t i=0, n=strlen(Text::s_text); i<n;) {
                size_t nreq = std::min(c_write_z, n-i);

                zs.write(Text::s_text + i, nreq);
                i += nreq;
            }

            CHECK(zs.good());

            zs.close();
        }

        // ----------------------------------------------------------------
        // 2 - uncompress + verify
        // ----------------------------------------------------------------

        /* NOTE:
         * Can also demonstrate successful compression step with for example
         *   $ zstd -dc test0.zst
         */

        {
            INFO(tostr("reading from fname=", fname));

            zstdstream zs(tc.buf_z_, fname.c_str(), ios::in);

            std::string input;
            input.resize(strlen(Text::s_text));

            size_t const c_read_z = tc.read_chunk_z_;
            size_t n_uc = 0;
            size_t i_uc = 0;
            do {
                size_t nreq = std::min(c_read_z, input.size() - n_uc);

                zs.read(input.data() + n_uc, nreq);
                i_uc = zs.gcount();
                n_uc += i_uc;
            } while ((i_uc > 0) && (n_uc < input.size()));

            REQUIRE(n_uc == input.size());
            REQUIRE(input == Text::s_text);

            /* nothing after the frame */
            CHECK(zs.get() == char_traits<char>::eof());
        }

        // ----------------------------------------------------------------
        // 3 - cleanup
        // ----------------------------------------------------------------

        ::remove(fname.c_str());
    }
}

/* use zstdstream + write to file on disk.
 * use the same zstdstream instance for each test + use .open() at the start of each test case
 *
 * For this test ignore TestCase.buf_z
 */
TEST_CASE("zstdstream-filebuf-reopen", "[zstdstream]") {
#  ifndef NDEBUG
    /* true to enable some logging,  useful if this unit test should fail */
    constexpr bool c_debug_flag = false;
#  endif

    zstdstream zs_out(256 /*buf_z*/, ios::out);
    zstdstream zs_in(256 /*buf_z*/, ios::in);

    CHECK(zs_out.is_closed());
    CHECK(zs_in.is_closed());

#  ifndef NDEBUG
    zs_out.set_debug_flag(c_debug_flag);
    zs_in.set_debug_flag(c_debug_flag);
#  endif

    for (size_t i_tc = 0; i_tc < s_testcase_v.size(); ++i_tc) {
        TestCase const & tc = s_testcase_v[i_tc];

        std::string fname = tostr("test-reopen", i_tc, ".zst");

        INFO(tostr("i_tc=", i_tc, ", fname=", fname));

        // ----------------------------------------------------------------
        // 1 - compress some text
        // ----------------------------------------------------------------

        {
            zs_out.open(fname.c_str(), ios::out);

            REQUIRE(zs_out.is_open());

            size_t const c_write_z = tc.write_chunk_z_;

            for (size_t i=0, n=strlen(Text::s_text); i<n;) {
                size_t nreq = std::min(c_write_z, n-i);

                zs_out.write(Text::s_text + i, nreq);
                i += nreq;
            }

            zs_out.close();
        }

        // ----------------------------------------------------------------
        // 2 - uncompress + verify
        // ----------------------------------------------------------------

        {
            zs_in.open(fname.c_str(), ios::in);

            CHECK(zs_in.good()); /* !eofbit && !failbit && !badbit */

            std::string input = zs_in.read_until(false, '\0');

            REQUIRE(input == Text::s_text);

            zs_in.close();
        }

        // ----------------------------------------------------------------
        // 3 - cleanup
        // ----------------------------------------------------------------

        ::remove(fname.c_str());
    }
}
