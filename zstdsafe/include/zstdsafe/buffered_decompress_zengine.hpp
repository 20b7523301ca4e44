/** @file buffered_decompress_zengine.hpp **/

#pragma once

#include "decompress_zengine.hpp"
#include "buffer.hpp"

/**
   @class buffered_decompress_zengine zstdsafe/buffered_decompress_zengine.hpp

   @brief accept compressed input and decompress it.

   Creates and manages buffer space for compressed input and (decompressed) output.

   Memory allocation occurs only in the constructor.

   Example
   @code
      ifstream zfs("path/to/compressedfile.zst", ios::binary);
      buffered_decompress_zengine zs;
      ofstream ucfs("path/to/uncompressedfile", ios::binary);

      while (!zfs.eof() || zs.work_pending()) {
          if (zs.z_avail().size() && !zfs.eof()) {
              byte_span z_span = zs.z_avail();
              zfs.read(reinterpret_cast<char *>(z_span.lo()), z_span.size());
              zs.z_produce(z_span.prefix(zfs.gcount()));
          }

          zs.decompress_chunk();

          byte_span uc_span = zs.uc_contents();
          ucfs.write(reinterpret_cast<char *>(uc_span.lo()), uc_span.size());
          zs.uc_consume(uc_span);
      }
   @endcode
**/
class buffered_decompress_zengine {
public:
    /** @brief typealias for span of compressed data **/
    using z_span_type = span<std::uint8_t>;
    /** @brief typealias for stream size (in bytes) **/
    using size_type = std::uint64_t;

    /** @brief default buffer size.  Used for both compressed+uncompressed stream (64k) **/
    static constexpr size_type c_default_buf_z = 64UL * 1024UL;

public:
    /** @brief Constructor;  allocate two buffers of size @p buf_z for compressed and uncompressed content.

        @param p        decompression parameters
        @param buf_z    buffer size, allocated separately for {compressed, uncompressed} content.
     */
    explicit buffered_decompress_zengine(decompress_parameters const & p = decompress_parameters(),
                                         size_type buf_z = c_default_buf_z)
        : z_in_buf_{buf_z, sizeof(std::uint8_t)},
          zs_algo_{p},
          uc_out_buf_{buf_z, sizeof(std::uint8_t)}
        {
            zs_algo_.provide_output(uc_out_buf_.avail());
        }
    /** @brief not copyable (since member @c zs_algo_ is not) **/
    buffered_decompress_zengine(buffered_decompress_zengine const & x) = delete;

    decompress_parameters const & parameters() const { return zs_algo_.parameters(); }

    /** @brief number of bytes of compressed input consumed since this engine created **/
    size_type n_in_total() const { return zs_algo_.n_in_total(); }
    /** @brief number of bytes of uncompressed output produced since this engine created **/
    size_type n_out_total() const { return zs_algo_.n_out_total(); }

    /** @brief true iff a frame has been started but not completed **/
    bool mid_frame() const { return mid_frame_flag_; }
    /** @brief true iff engine may make progress without further compressed input:
        either unconsumed compressed input,  or decoded content not yet delivered.
     **/
    bool work_pending() const { return zs_algo_.have_input() || output_pending_flag_; }

    /** @brief space currently available for more compressed input **/
    z_span_type z_avail() const { return z_in_buf_.avail(); }
    /** @brief compressed input not yet consumed **/
    z_span_type z_contents() const { return z_in_buf_.contents(); }
    /** @brief space currently available for more uncompressed output */
    z_span_type uc_avail() const { return uc_out_buf_.avail(); }
    /** @brief uncompressed content currently available for consumption.

        Consume by calling @c .uc_consume() with some non-empty prefix of @c .uc_contents()
    **/
    z_span_type uc_contents() const { return uc_out_buf_.contents(); }

    /** @brief Introduce new compressed input for decompression.

        @param span   Memory range of new compressed input.

        @pre @p span must be a prefix of @ref z_avail()
     **/
    void z_produce(z_span_type const & span) {
        if (span.size()) {
            z_in_buf_.produce(span);
            zs_algo_.provide_input(z_in_buf_.contents());
        }
    }

    /** @brief consume some decompressed output;  consumed buffer space can eventually be reused

        @param span   Memory range of now-consumed uncompressed output.

        @pre @p span must be a prefix of @ref uc_contents()
     **/
    void uc_consume(z_span_type const & span) {
        if (span.size()) {
            uc_out_buf_.consume(span);
        }

        if (uc_out_buf_.empty()) {
            /* can recycle output */
            zs_algo_.provide_output(uc_out_buf_.avail());
        }
    }

    /** @brief consume all buffered uncompressed content **/
    void uc_consume_all() { this->uc_consume(this->uc_contents()); }

    /** @brief attempt some decompression work

        Decompress some input data previously provided via @ref z_produce()

        @return counts of bytes consumed / produced;  hint 0 marks end of a frame.
        No-op (all zero,  hint unchanged from @ref mid_frame) when there is no work pending
    **/
    step_result decompress_chunk();

private:
    /** @brief buffer for compressed input **/
    buffer<std::uint8_t> z_in_buf_;

    /** @brief decompression state (holds @c ZSTD_DCtx) **/
    decompress_zengine zs_algo_;

    /** @brief buffer for decompressed output **/
    buffer<std::uint8_t> uc_out_buf_;

    /** @brief true between first byte of a frame and its completion **/
    bool mid_frame_flag_ = false;
    /** @brief true if last step filled output space;  engine may hold more decoded content **/
    bool output_pending_flag_ = false;
};

