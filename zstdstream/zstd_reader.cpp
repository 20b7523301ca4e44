// zstd_reader.cpp

#include "zstdstream/zstd_reader.hpp"
#include "zstdsafe/compression.hpp"
#include "zstdsafe/zstd_error.hpp"
#include "zstdsafe/tostr.hpp"
#include <iostream>
#include <algorithm>
#include <cstring>

using namespace std;

ostream &
operator<< (ostream & os, reader_state x)
{
    switch (x) {
    case reader_state::idle:
        os << "idle";
        break;
    case reader_state::active:
        os << "active";
        break;
    case reader_state::frame_complete:
        os << "frame-complete";
        break;
    case reader_state::finished:
        os << "finished";
        break;
    case reader_state::failed:
        os << "failed";
        break;
    }

    return os;
}

zstd_reader::zstd_reader(std::streambuf * source,
                         decompress_parameters const & p,
                         size_type buf_z,
                         bool allow_multiple_frames)
    : source_{source},
      zs_{p},
      z_in_buf_{buf_z},
      allow_multiple_frames_{allow_multiple_frames}
{
    if (!source_)
        throw invalid_parameter("zstd_reader: expected non-null source");

    if (buf_z == 0)
        throw invalid_parameter("zstd_reader: expected non-zero buffer size");
}

auto
zstd_reader::read(void * into, size_type n) -> size_type
{
    if (state_ == reader_state::failed)
        throw closed_error("zstd_reader::read: reader failed on an earlier operation");

    if (n == 0)
        throw short_buffer("zstd_reader::read: output range has zero capacity");

    if (state_ == reader_state::finished)
        return 0;

    if ((state_ == reader_state::frame_complete) && !allow_multiple_frames_) {
        state_ = reader_state::finished;
        return 0;
    }

    size_type n_in0 = zs_.n_in_total();
    size_type n_produced = 0;

    try {
        zs_.provide_output(byte_span::from_size(reinterpret_cast<uint8_t *>(into), n));

        while (n_produced == 0) {
            if (!zs_.have_input() && !output_pending_flag_) {
                if (this->fill() == 0) {
                    if (state_ == reader_state::active)
                        throw truncated_frame(tostr("zstd_reader::read: source ended inside frame #", n_frames_,
                                                    " after ", zs_.n_in_total(), " compressed bytes"));

                    /* clean end:  at a frame boundary,  or source was empty */
                    state_ = reader_state::finished;
                    break;
                }
            }

            chunk_result r = zs_.decompress_chunk();

            z_in_buf_.consume(z_in_buf_.contents().prefix(r.consumed.size()));
            n_produced += r.produced.size();

            if (r.hint == 0) {
                /* frame decoded and completely delivered */
                if ((state_ != reader_state::frame_complete) || (r.consumed.size() > 0))
                    ++n_frames_;

                state_ = reader_state::frame_complete;
                output_pending_flag_ = false;

                if (!allow_multiple_frames_)
                    break;
            } else {
                if ((r.consumed.size() > 0) || (r.produced.size() > 0))
                    state_ = reader_state::active;

                output_pending_flag_ = zs_.output_empty();
            }
        }
    } catch (zstd_error & ex) {
        ex.set_progress(zs_.n_in_total() - n_in0, n_produced);
        zs_.detach();
        state_ = reader_state::failed;
        throw;
    } catch (std::exception &) {
        zs_.detach();
        state_ = reader_state::failed;
        throw;
    }

    /* don't retain caller memory */
    zs_.provide_output(byte_span());

    if ((n_produced == 0) && (state_ == reader_state::frame_complete)) {
        /* single-frame mode, frame already complete */
        state_ = reader_state::finished;
    }

    return n_produced;
}

namespace {
    /* skippable frame header:  magic number + content size */
    constexpr size_t c_skippable_header_z = 8;
    /* first attempt at locating the end of a regular frame */
    constexpr size_t c_skip_initial_z = 4096;
}

unsigned
zstd_reader::read_skippable_frame(std::vector<uint8_t> & content)
{
    this->require_boundary("read_skippable_frame");

    vector<uint8_t> frame_v;
    unsigned magic_variant = 0;

    try {
        this->collect(frame_v, c_skippable_header_z);

        if (frame_v.size() < c_skippable_header_z)
            throw truncated_frame(tostr("zstd_reader::read_skippable_frame: source exhausted after ",
                                        n_frames_, " frames (", frame_v.size(), " trailing bytes)"));

        if (!compression::is_skippable_frame(cbyte_span::from_size(frame_v.data(), frame_v.size()))) {
            /* leave stream as found */
            this->unread(frame_v, 0);

            throw invalid_parameter(tostr("zstd_reader::read_skippable_frame: frame #", n_frames_,
                                          " is not a skippable frame"));
        }

        size_type content_z = (size_type(frame_v[4])
                               | (size_type(frame_v[5]) << 8)
                               | (size_type(frame_v[6]) << 16)
                               | (size_type(frame_v[7]) << 24));

        this->collect(frame_v, c_skippable_header_z + content_z);

        content = compression::read_skippable_frame(cbyte_span::from_size(frame_v.data(), frame_v.size()),
                                                    &magic_variant);

        this->unread(frame_v, c_skippable_header_z + content.size());
    } catch (invalid_parameter &) {
        throw;
    } catch (std::exception &) {
        state_ = reader_state::failed;
        throw;
    }

    ++n_frames_;
    state_ = reader_state::frame_complete;

    return magic_variant;
}

bool
zstd_reader::skip_frame()
{
    this->require_boundary("skip_frame");

    vector<uint8_t> frame_v;

    try {
        for (size_type want = c_skip_initial_z;; want *= 2) {
            this->collect(frame_v, want);

            if (frame_v.empty()) {
                state_ = reader_state::finished;
                return false;
            }

            optional<uint64_t> z = compression::frame_compressed_size(cbyte_span::from_size(frame_v.data(),
                                                                                            frame_v.size()));

            if (z) {
                this->unread(frame_v, *z);
                break;
            }

            if (frame_v.size() < want)
                throw truncated_frame(tostr("zstd_reader::skip_frame: source ended inside frame #", n_frames_,
                                            " after ", frame_v.size(), " bytes"));
        }
    } catch (std::exception &) {
        state_ = reader_state::failed;
        throw;
    }

    ++n_frames_;
    state_ = reader_state::frame_complete;

    return true;
}

void
zstd_reader::require_boundary(char const * op) const
{
    if (state_ == reader_state::failed)
        throw closed_error(tostr("zstd_reader::", op, ": reader failed on an earlier operation"));

    if ((state_ == reader_state::active) || output_pending_flag_)
        throw already_started(tostr("zstd_reader::", op, ": reader is inside frame #", n_frames_));
}

void
zstd_reader::collect(std::vector<uint8_t> & v, size_type n)
{
    span<uint8_t> pending = z_in_buf_.contents();

    if (!pending.empty()) {
        v.insert(v.end(), pending.lo(), pending.hi());
        z_in_buf_.consume(pending);
        zs_.detach();
    }

    if (!lookahead_.empty()) {
        v.insert(v.end(), lookahead_.begin(), lookahead_.end());
        lookahead_.clear();
    }

    while (v.size() < n) {
        size_type n0 = v.size();
        /* grow with data actually read,  not with a size taken from a frame header */
        size_type step_z = std::min(n - n0, std::max(n0, static_cast<size_type>(c_skip_initial_z)));

        v.resize(n0 + step_z);

        std::streamsize got = source_->sgetn(reinterpret_cast<char *>(v.data() + n0), step_z);

        v.resize(n0 + std::max(got, std::streamsize(0)));

        if (got <= 0)
            break;
    }
}

void
zstd_reader::unread(std::vector<uint8_t> const & v, size_type off)
{
    if (off < v.size())
        lookahead_.insert(lookahead_.begin(), v.begin() + off, v.end());
}

auto
zstd_reader::fill() -> size_type
{
    span<uint8_t> zspan = z_in_buf_.avail();

    if (!lookahead_.empty()) {
        size_type n = std::min(zspan.size(), static_cast<size_type>(lookahead_.size()));

        ::memcpy(zspan.lo(), lookahead_.data(), n);
        lookahead_.erase(lookahead_.begin(), lookahead_.begin() + n);

        z_in_buf_.produce(zspan.prefix(n));
        zs_.provide_input(z_in_buf_.contents());

        return n;
    }

    std::streamsize n = source_->sgetn(reinterpret_cast<char *>(zspan.lo()), zspan.size());

    if (n <= 0)
        return 0;

    z_in_buf_.produce(zspan.prefix(n));
    zs_.provide_input(z_in_buf_.contents());

    return n;
}
