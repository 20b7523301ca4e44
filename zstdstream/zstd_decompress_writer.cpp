// zstd_decompress_writer.cpp

#include "zstdstream/zstd_decompress_writer.hpp"
#include "zstdsafe/zstd_error.hpp"
#include "zstdsafe/tostr.hpp"

using namespace std;

zstd_decompress_writer::zstd_decompress_writer(std::streambuf * sink,
                                               decompress_parameters const & p,
                                               size_type buf_z)
    : sink_{sink},
      zs_{p},
      uc_out_buf_{buf_z}
{
    if (!sink_)
        throw invalid_parameter("zstd_decompress_writer: expected non-null sink");

    if (buf_z == 0)
        throw invalid_parameter("zstd_decompress_writer: expected non-zero buffer size");
}

void
zstd_decompress_writer::require_open(char const * op) const
{
    if (state_ == writer_state::failed)
        throw closed_error(tostr("zstd_decompress_writer::", op, ": writer failed on an earlier operation"));

    if (state_ == writer_state::closed)
        throw closed_error(tostr("zstd_decompress_writer::", op, ": writer is closed"));
}

auto
zstd_decompress_writer::write(void const * s, size_type n) -> size_type
{
    this->require_open("write");

    size_type n_in0 = zs_.n_in_total();
    size_type n_out0 = n_out_total_;

    try {
        zs_.provide_input(cbyte_span::from_size(reinterpret_cast<uint8_t const *>(s), n));

        for (;;) {
            zs_.provide_output(uc_out_buf_.avail());

            chunk_result r = zs_.decompress_chunk();

            uc_out_buf_.produce(r.produced);

            if (!r.consumed.empty()) {
                mid_frame_flag_ = true;
                state_ = writer_state::active;
            }

            if ((r.hint == 0) && mid_frame_flag_) {
                /* frame decoded and flushed */
                ++n_frames_;
                mid_frame_flag_ = false;
            }

            bool output_full = zs_.output_empty();

            this->emit();

            /* a full output buffer may mean engine holds more decoded content */
            if (!zs_.have_input() && !output_full)
                break;
        }
    } catch (zstd_error & ex) {
        ex.set_progress(zs_.n_in_total() - n_in0, n_out_total_ - n_out0);
        zs_.detach();
        state_ = writer_state::failed;
        throw;
    } catch (std::exception &) {
        zs_.detach();
        state_ = writer_state::failed;
        throw;
    }

    /* don't retain caller memory */
    zs_.detach();

    return n;
}

void
zstd_decompress_writer::flush()
{
    this->require_open("flush");

    if (sink_->pubsync() != 0) {
        state_ = writer_state::failed;
        throw sink_error("zstd_decompress_writer::flush: sink pubsync failed");
    }
}

void
zstd_decompress_writer::finish()
{
    if (state_ == writer_state::closed)
        return;

    this->require_open("finish");

    if (mid_frame_flag_) {
        state_ = writer_state::failed;
        throw truncated_frame(tostr("zstd_decompress_writer::finish: input ended inside frame #", n_frames_,
                                    " after ", zs_.n_in_total(), " compressed bytes"));
    }

    if (sink_->pubsync() != 0) {
        state_ = writer_state::failed;
        throw sink_error("zstd_decompress_writer::finish: sink pubsync failed");
    }

    state_ = writer_state::closed;
}

void
zstd_decompress_writer::emit()
{
    span<uint8_t> ucspan = uc_out_buf_.contents();

    if (ucspan.empty())
        return;

    std::streamsize n_written = sink_->sputn(reinterpret_cast<char const *>(ucspan.lo()),
                                             ucspan.size());

    if (n_written > 0)
        n_out_total_ += n_written;

    if (n_written < static_cast<std::streamsize>(ucspan.size())) {
        throw sink_error(tostr("zstd_decompress_writer::emit: partial write",
                               " :attempted ", ucspan.size(),
                               " :wrote ", n_written));
    }

    uc_out_buf_.consume(ucspan);
}
