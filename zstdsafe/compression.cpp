// compression.cpp

/* skippable-frame api */
#define ZSTD_STATIC_LINKING_ONLY

#include "zstdsafe/compression.hpp"
#include "zstdsafe/buffered_compress_zengine.hpp"
#include "zstdsafe/buffered_decompress_zengine.hpp"
#include "zstdsafe/compress_zengine.hpp"
#include "zstdsafe/decompress_zengine.hpp"
#include "zstdsafe/zsafe.hpp"
#include "zstdsafe/tostr.hpp"
#include <zstd.h>
#include <zstd_errors.h>
#include <iostream>
#include <fstream>
#include <cstdio>
#include <stdexcept>
#include <algorithm>
#include <new>

using namespace std;

namespace {
    /* output allocation when nothing better is known */
    constexpr uint64_t c_min_decompress_z = 64UL * 1024UL;

    /* resize output to z bytes;  report allocator failure as allocation_error */
    void
    resize_output(vector<uint8_t> & v, uint64_t z, char const * ctx)
    {
        try {
            v.resize(z);
        } catch (std::bad_alloc &) {
            throw allocation_error(tostr(ctx, ": unable to allocate ", z, " bytes for output"));
        } catch (std::length_error &) {
            throw allocation_error(tostr(ctx, ": output size ", z, " exceeds vector limit"));
        }
    }

    void
    remove_input(string const & in_file)
    {
        if (std::remove(in_file.c_str()) != 0)
            throw std::runtime_error(tostr("unable to remove input file [", in_file, "]"));
    }
}

vector<uint8_t>
compression::compress(vector<uint8_t> const & og_data_v,
                      compress_parameters const & p)
{
    vector<uint8_t> z_data_v(compress_bound(og_data_v.size()));

    compress_zengine zs(p);

    in_view in(og_data_v.data(), og_data_v.size());
    out_view out(z_data_v.data(), z_data_v.size());

    /* with compressBound() space,  one step normally completes the frame;
     * multithreaded engine may need more than one
     */
    for (;;) {
        if (out.remaining() == 0) {
            uint64_t pos = out.pos();

            z_data_v.resize(2 * z_data_v.size());
            out = out_view(z_data_v.data(), z_data_v.size(), pos);
        }

        step_result r = zsafe::step(zs, in, out, directive::e_end);

        if (r.hint == 0)
            break;
    }

    z_data_v.resize(out.pos());

    return z_data_v;
} /*compress*/

vector<uint8_t>
compression::decompress(vector<uint8_t> const & z_data_v,
                        decompress_parameters const & p,
                        uint64_t capacity_hint)
{
    if (z_data_v.empty())
        return vector<uint8_t>();

    uint64_t og_data_z = capacity_hint;

    if (og_data_z == 0) {
        optional<uint64_t> declared_z = frame_content_size(cbyte_span::from_size(z_data_v.data(), z_data_v.size()));

        /* header is untrusted:  never allocate more up front than the input could plausibly expand to.
         * Genuine large frames grow the output below.
         */
        uint64_t guess_z = std::max(c_min_decompress_z, 4 * static_cast<uint64_t>(z_data_v.size()));

        og_data_z = declared_z ? std::min(*declared_z, guess_z) : guess_z;
    }

    /* non-zero: need somewhere for the engine to write,  even for an empty frame */
    vector<uint8_t> og_data_v;
    resize_output(og_data_v, std::max(og_data_z, uint64_t(1)), "compression::decompress");

    decompress_zengine zs(p);

    in_view in(z_data_v.data(), z_data_v.size());
    out_view out(og_data_v.data(), og_data_v.size());

    for (;;) {
        if (out.remaining() == 0) {
            uint64_t pos = out.pos();

            resize_output(og_data_v, 2 * og_data_v.size(), "compression::decompress");
            out = out_view(og_data_v.data(), og_data_v.size(), pos);
        }

        step_result r = zsafe::step(zs, in, out);

        if (r.hint == 0) {
            /* frame complete */
            if (in.remaining() == 0)
                break;
        } else if ((in.remaining() == 0) && (out.remaining() > 0)) {
            /* engine wants more input,  and there isn't any */
            throw truncated_frame(tostr("compression::decompress: input ends mid-frame after ", z_data_v.size(),
                                        " bytes (", out.pos(), " bytes decoded)"));
        }
    }

    og_data_v.resize(out.pos());

    return og_data_v;
} /*decompress*/

uint64_t
compression::compress_bound(uint64_t og_data_z)
{
    return ::ZSTD_compressBound(og_data_z);
}

optional<uint64_t>
compression::frame_content_size(cbyte_span const & z_data)
{
    unsigned long long z = ::ZSTD_getFrameContentSize(z_data.lo(), z_data.size());

    if (z == ZSTD_CONTENTSIZE_UNKNOWN)
        return optional<uint64_t>();

    if (z == ZSTD_CONTENTSIZE_ERROR)
        throw engine_error("compression::frame_content_size: not a zstd frame header",
                           static_cast<size_t>(z), ZSTD_error_prefix_unknown,
                           tostr("frame header unreadable (", z_data.size(), " bytes available)"));

    return z;
}

unsigned
compression::frame_dict_id(cbyte_span const & z_data)
{
    return ::ZSTD_getDictID_fromFrame(z_data.lo(), z_data.size());
}

optional<uint64_t>
compression::frame_compressed_size(cbyte_span const & z_data)
{
    size_t z = ::ZSTD_findFrameCompressedSize(z_data.lo(), z_data.size());

    if (::ZSTD_isError(z)) {
        /* input ends before frame does */
        if (::ZSTD_getErrorCode(z) == ZSTD_error_srcSize_wrong)
            return optional<uint64_t>();

        zsafe::raise(z, "compression::frame_compressed_size: ZSTD_findFrameCompressedSize");
    }

    return z;
}

bool
compression::is_skippable_frame(cbyte_span const & z_data)
{
    if (z_data.size() < ZSTD_SKIPPABLEHEADERSIZE)
        return false;

    return ::ZSTD_isSkippableFrame(z_data.lo(), z_data.size()) != 0;
}

vector<uint8_t>
compression::skippable_frame(cbyte_span const & content, unsigned magic_variant)
{
    if (magic_variant > 15)
        throw invalid_parameter(tostr("compression::skippable_frame: magic variant ", magic_variant,
                                      " outside [0, 15]"));

    if (content.size() > 0xffffffffUL)
        throw invalid_parameter(tostr("compression::skippable_frame: content size ", content.size(),
                                      " exceeds 32-bit frame size field"));

    vector<uint8_t> retval;
    resize_output(retval, content.size() + ZSTD_SKIPPABLEHEADERSIZE, "compression::skippable_frame");

    size_t z = zsafe::check(::ZSTD_writeSkippableFrame(retval.data(), retval.size(),
                                                       content.lo(), content.size(),
                                                       magic_variant),
                            "compression::skippable_frame: ZSTD_writeSkippableFrame");

    retval.resize(z);

    return retval;
}

vector<uint8_t>
compression::read_skippable_frame(cbyte_span const & z_data, unsigned * p_magic_variant)
{
    if (z_data.size() < 4)
        throw truncated_frame(tostr("compression::read_skippable_frame: ", z_data.size(),
                                    " bytes cannot hold a frame magic number"));

    if (!is_skippable_frame(z_data)) {
        if (::ZSTD_isSkippableFrame(z_data.lo(), 4) != 0)
            throw truncated_frame("compression::read_skippable_frame: input ends inside skippable frame header");

        throw invalid_parameter("compression::read_skippable_frame: input does not begin with a skippable frame");
    }

    /* little-endian 32-bit content size follows magic */
    uint8_t const * p = z_data.lo();
    uint64_t content_z = (uint64_t(p[4])
                          | (uint64_t(p[5]) << 8)
                          | (uint64_t(p[6]) << 16)
                          | (uint64_t(p[7]) << 24));

    if (z_data.size() < content_z + ZSTD_SKIPPABLEHEADERSIZE)
        throw truncated_frame(tostr("compression::read_skippable_frame: frame declares ", content_z,
                                    " content bytes,  input has ",
                                    z_data.size() - ZSTD_SKIPPABLEHEADERSIZE));

    vector<uint8_t> retval;
    resize_output(retval, content_z, "compression::read_skippable_frame");

    unsigned magic_variant = 0;

    size_t z = zsafe::check(::ZSTD_readSkippableFrame(retval.data(), retval.size(),
                                                      &magic_variant,
                                                      z_data.lo(), content_z + ZSTD_SKIPPABLEHEADERSIZE),
                            "compression::read_skippable_frame: ZSTD_readSkippableFrame");

    retval.resize(z);

    if (p_magic_variant)
        *p_magic_variant = magic_variant;

    return retval;
}

void
compression::compress_file(std::string const & in_file,
                           std::string const & out_file,
                           compress_parameters const & p,
                           bool keep_flag,
                           bool verbose_flag)
{
    /* check output doesn't exist already */
    if (ifstream(out_file, ios::binary|ios::in))
        throw std::runtime_error(tostr("output file [", out_file, "] already exists"));

    if (verbose_flag)
        cerr << "compression::compress_file: will compress [" << in_file << "]"
             << " -> [" << out_file << "]"
             << " with " << p << endl;

    /* binary mode since need not be text */
    ifstream fs(in_file, ios::in|ios::binary);
    if (!fs)
        throw std::runtime_error(tostr("unable to open input file [", in_file, "]"));

    buffered_compress_zengine zstate(p);

    ofstream zfs(out_file, ios::out|ios::binary);
    if (!zfs)
        throw std::runtime_error(tostr("unable to open output file [", out_file, "]"));

    for (bool done = false; !done;) {
        directive d = directive::e_continue;

        if (fs.eof()) {
            d = directive::e_end;
        } else {
            span<uint8_t> ucspan = zstate.uc_avail();

            fs.read(reinterpret_cast<char *>(ucspan.lo()), ucspan.size());
            if (fs.bad())
                throw std::runtime_error(tostr("compress_file: failed reading [", in_file, "]"));

            zstate.uc_produce(ucspan.prefix(fs.gcount()));
        }

        step_result r = zstate.compress_chunk(d);

        /* write compressed output */
        span<uint8_t> zspan = zstate.z_contents();

        zfs.write(reinterpret_cast<char *>(zspan.lo()), zspan.size());
        if (!zfs.good())
            throw std::runtime_error(tostr("compress_file: failed to write ", zspan.size(), " bytes"
                                           , " to [", out_file, "]"));

        zstate.z_consume(zspan);

        done = (d == directive::e_end) && (r.hint == 0);
    }

    fs.close();
    zfs.close();

    if (verbose_flag)
        cerr << "compression::compress_file: " << zstate.n_in_total() << " -> " << zstate.n_out_total() << " bytes" << endl;

    /* control here only if successfully wrote compressed output */
    if (!keep_flag)
        remove_input(in_file);
} /*compress_file*/

void
compression::decompress_file(std::string const & in_file,
                             std::string const & out_file,
                             decompress_parameters const & p,
                             bool keep_flag,
                             bool verbose_flag)
{
    /* check output doesn't exist already */
    if (ifstream(out_file, ios::binary|ios::in))
        throw std::runtime_error(tostr("output file [", out_file, "] already exists"));

    if (verbose_flag)
        cerr << "compression::decompress_file: will uncompress [" << in_file << "] -> [" << out_file << "]" << endl;

    ifstream fs(in_file, ios::binary);
    if (!fs)
        throw std::runtime_error(tostr("unable to open input file [", in_file, "]"));

    buffered_decompress_zengine zstate(p);

    ofstream ucfs(out_file, ios::out|ios::binary);
    if (!ucfs)
        throw std::runtime_error(tostr("unable to open output file [", out_file, "]"));

    for (;;) {
        if (!zstate.work_pending()) {
            if (fs.eof())
                break;

            span<uint8_t> zspan = zstate.z_avail();

            fs.read(reinterpret_cast<char *>(zspan.lo()), zspan.size());
            if (fs.bad())
                throw std::runtime_error(tostr("decompress_file: failed reading [", in_file, "]"));

            zstate.z_produce(zspan.prefix(fs.gcount()));
        }

        /* uncompress some text */
        zstate.decompress_chunk();

        span<uint8_t> ucspan = zstate.uc_contents();

        ucfs.write(reinterpret_cast<char *>(ucspan.lo()), ucspan.size());
        if (!ucfs.good())
            throw std::runtime_error(tostr("decompress_file: failed to write ", zstate.n_out_total(), " bytes to [", out_file, "]"));

        zstate.uc_consume(ucspan);
    }

    if (zstate.mid_frame())
        throw truncated_frame(tostr("decompress_file: [", in_file, "] ends mid-frame after ",
                                    zstate.n_in_total(), " bytes"));

    fs.close();
    ucfs.close();

    if (verbose_flag)
        cerr << "compression::decompress_file: " << zstate.n_in_total() << " -> " << zstate.n_out_total() << " bytes" << endl;

    if (!keep_flag)
        remove_input(in_file);
} /*decompress_file*/
