// zstd_compress_reader.cpp

#include "zstdstream/zstd_compress_reader.hpp"
#include "zstdsafe/zstd_error.hpp"
#include "zstdsafe/tostr.hpp"

using namespace std;

zstd_compress_reader::zstd_compress_reader(std::streambuf * source,
                                           compress_parameters const & p,
                                           size_type buf_z)
    : source_{source},
      zs_{p},
      uc_in_buf_{buf_z}
{
    if (!source_)
        throw invalid_parameter("zstd_compress_reader: expected non-null source");

    if (buf_z == 0)
        throw invalid_parameter("zstd_compress_reader: expected non-zero buffer size");
}

auto
zstd_compress_reader::read(void * into, size_type n) -> size_type
{
    if (state_ == reader_state::failed)
        throw closed_error("zstd_compress_reader::read: reader failed on an earlier operation");

    if (n == 0)
        throw short_buffer("zstd_compress_reader::read: output range has zero capacity");

    if (state_ == reader_state::finished)
        return 0;

    size_type n_in0 = zs_.n_in_total();
    size_type n_produced = 0;

    try {
        zs_.provide_output(byte_span::from_size(reinterpret_cast<uint8_t *>(into), n));

        while (n_produced == 0) {
            if (!zs_.have_input() && !source_eof_flag_) {
                if (this->fill() == 0)
                    source_eof_flag_ = true;
            }

            chunk_result r = zs_.compress_chunk(source_eof_flag_ ? directive::e_end : directive::e_continue);

            uc_in_buf_.consume(uc_in_buf_.contents().prefix(r.consumed.size()));
            n_produced += r.produced.size();

            state_ = reader_state::active;

            if (source_eof_flag_ && (r.hint == 0)) {
                /* epilogue delivered */
                state_ = reader_state::finished;
                break;
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

    return n_produced;
}

auto
zstd_compress_reader::fill() -> size_type
{
    span<uint8_t> ucspan = uc_in_buf_.avail();

    std::streamsize n = source_->sgetn(reinterpret_cast<char *>(ucspan.lo()), ucspan.size());

    if (n <= 0)
        return 0;

    uc_in_buf_.produce(ucspan.prefix(n));
    zs_.provide_input(uc_in_buf_.contents());

    return n;
}
