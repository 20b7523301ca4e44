// zstd_writer.cpp

#include "zstdstream/zstd_writer.hpp"
#include "zstdsafe/compression.hpp"
#include "zstdsafe/zstd_error.hpp"
#include "zstdsafe/tostr.hpp"
#include <algorithm>
#include <iostream>
#include <vector>
#include <cstring>

using namespace std;

ostream &
operator<< (ostream & os, writer_state x)
{
    switch (x) {
    case writer_state::idle:
        os << "idle";
        break;
    case writer_state::active:
        os << "active";
        break;
    case writer_state::finishing:
        os << "finishing";
        break;
    case writer_state::closed:
        os << "closed";
        break;
    case writer_state::failed:
        os << "failed";
        break;
    }

    return os;
}

zstd_writer::zstd_writer(std::streambuf * sink,
                         compress_parameters const & p,
                         size_type buf_z)
    : sink_{sink},
      zs_{p, buf_z}
{
    if (!sink_)
        throw invalid_parameter("zstd_writer: expected non-null sink");

    if (buf_z == 0)
        throw invalid_parameter("zstd_writer: expected non-zero buffer size");
}

void
zstd_writer::require_open(char const * op) const
{
    if (state_ == writer_state::failed)
        throw closed_error(tostr("zstd_writer::", op, ": writer failed on an earlier operation"));

    if (state_ == writer_state::closed)
        throw closed_error(tostr("zstd_writer::", op, ": writer is closed"));
}

auto
zstd_writer::write(void const * s, size_type n) -> size_type
{
    this->require_open("write");

    size_type n_in0 = zs_.n_in_total();
    size_type n_out0 = n_out_total_;

    try {
        uint8_t const * p = reinterpret_cast<uint8_t const *>(s);
        size_type n_remaining = n;

        while (n_remaining > 0) {
            span<uint8_t> ucspan = zs_.uc_avail();

            if (ucspan.empty()) {
                /* pending-input buffer full:  compress to make room */
                this->drain(directive::e_continue);
                continue;
            }

            size_type n_copy = std::min(n_remaining, ucspan.size());

            ::memcpy(ucspan.lo(), p, n_copy);
            zs_.uc_produce(ucspan.prefix(n_copy));

            p += n_copy;
            n_remaining -= n_copy;

            if (state_ == writer_state::idle)
                state_ = writer_state::active;
        }

        this->drain(directive::e_continue);
    } catch (zstd_error & ex) {
        ex.set_progress(zs_.n_in_total() - n_in0, n_out_total_ - n_out0);
        state_ = writer_state::failed;
        throw;
    } catch (std::exception &) {
        state_ = writer_state::failed;
        throw;
    }

    return n;
}

void
zstd_writer::flush()
{
    this->require_open("flush");

    if (state_ == writer_state::idle) {
        /* nothing written yet;  leave frame unopened */
        if (sink_->pubsync() != 0) {
            state_ = writer_state::failed;
            throw sink_error("zstd_writer::flush: sink pubsync failed");
        }
        return;
    }

    size_type n_in0 = zs_.n_in_total();
    size_type n_out0 = n_out_total_;

    try {
        this->drain(directive::e_flush);

        if (sink_->pubsync() != 0)
            throw sink_error("zstd_writer::flush: sink pubsync failed");
    } catch (zstd_error & ex) {
        ex.set_progress(zs_.n_in_total() - n_in0, n_out_total_ - n_out0);
        state_ = writer_state::failed;
        throw;
    } catch (std::exception &) {
        state_ = writer_state::failed;
        throw;
    }
}

void
zstd_writer::finish()
{
    if (state_ == writer_state::closed)
        return;

    this->require_open("finish");

    size_type n_in0 = zs_.n_in_total();
    size_type n_out0 = n_out_total_;

    /* skippable frame already ended the stream;  no empty frame after it */
    bool open_frame = (state_ == writer_state::active) || (n_frames_ == 0);

    state_ = writer_state::finishing;

    try {
        if (open_frame) {
            this->drain(directive::e_end);
            ++n_frames_;
        }

        if (sink_->pubsync() != 0)
            throw sink_error("zstd_writer::finish: sink pubsync failed");
    } catch (zstd_error & ex) {
        ex.set_progress(zs_.n_in_total() - n_in0, n_out_total_ - n_out0);
        state_ = writer_state::failed;
        throw;
    } catch (std::exception &) {
        state_ = writer_state::failed;
        throw;
    }

    state_ = writer_state::closed;
}

void
zstd_writer::write_skippable_frame(void const * s, size_type n, unsigned magic_variant)
{
    this->require_open("write_skippable_frame");

    /* builds frame (and checks arguments) before touching writer state */
    std::vector<uint8_t> frame_v
        = compression::skippable_frame(cbyte_span::from_size(reinterpret_cast<uint8_t const *>(s), n),
                                       magic_variant);

    size_type n_in0 = zs_.n_in_total();
    size_type n_out0 = n_out_total_;

    try {
        if (state_ == writer_state::active) {
            this->drain(directive::e_end);
            ++n_frames_;
        }

        this->put(cbyte_span::from_size(frame_v.data(), frame_v.size()));
        ++n_frames_;
    } catch (zstd_error & ex) {
        ex.set_progress(zs_.n_in_total() - n_in0, n_out_total_ - n_out0);
        state_ = writer_state::failed;
        throw;
    } catch (std::exception &) {
        state_ = writer_state::failed;
        throw;
    }

    state_ = writer_state::idle;
}

void
zstd_writer::drain(directive d)
{
    for (;;) {
        step_result r = zs_.compress_chunk(d);

        this->emit();

        bool input_done = zs_.uc_contents().empty();

        if (d == directive::e_continue) {
            if (input_done)
                break;
        } else if (input_done && (r.hint == 0)) {
            /* flush / frame end complete */
            break;
        }
    }
}

void
zstd_writer::emit()
{
    span<uint8_t> zspan = zs_.z_contents();

    if (zspan.empty())
        return;

    this->put(zspan);

    zs_.z_consume(zspan);
}

void
zstd_writer::put(cbyte_span const & bytes)
{
    std::streamsize n_written = sink_->sputn(reinterpret_cast<char const *>(bytes.lo()),
                                             bytes.size());

    if (n_written > 0)
        n_out_total_ += n_written;

    if (n_written < static_cast<std::streamsize>(bytes.size())) {
        throw sink_error(tostr("zstd_writer::put: partial write",
                               " :attempted ", bytes.size(),
                               " :wrote ", n_written));
    }
}
