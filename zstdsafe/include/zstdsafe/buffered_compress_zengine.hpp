/** @file buffered_compress_zengine.hpp **/

#pragma once

#include "compress_zengine.hpp"
#include "buffer.hpp"

/**
   @class buffered_compress_zengine zstdsafe/buffered_compress_zengine.hpp

   @brief accept input and compress it.

   Creates and manages buffer space for uncompressed input and compressed output.

   Memory allocation occurs only in the constructor;
   other stateful operations write to buffers established there.

   Example
   @code
      ifstream ucfs("path/to/uncompressedfile", ios::binary);
      buffered_compress_zengine zs(compress_parameters().set_level(3));
      ofstream zfs("path/to/compressedfile.zst", ios::binary);

      for (bool done = false; !done;) {
          directive d = directive::e_continue;

          if (ucfs.eof()) {
              d = directive::e_end;
          } else {
              byte_span uc_span = zs.uc_avail();
              ucfs.read(reinterpret_cast<char *>(uc_span.lo()), uc_span.size());
              zs.uc_produce(uc_span.prefix(ucfs.gcount()));
          }

          step_result r = zs.compress_chunk(d);

          byte_span z_span = zs.z_contents();
          zfs.write(reinterpret_cast<char *>(z_span.lo()), z_span.size());
          zs.z_consume(z_span);

          done = (d == directive::e_end) && (r.hint == 0);
      }
   @endcode
 **/
class buffered_compress_zengine {
public:
    /** @brief typealias for span of (compressed or uncompressed) bytes **/
    using z_span_type = span<std::uint8_t>;
    /** @brief typealias for stream size (will be in bytes) **/
    using size_type = std::uint64_t;

    /** @brief default buffer size (64k) **/
    static constexpr size_type c_default_buf_z = 64UL * 1024UL;

public:
    /** @brief Constructor;  allocate two buffers of size @p buf_z for compressed and uncompressed content.

        @param p        compression parameters
        @param buf_z    Buffer size,  for both compressed and uncompressed content.
     */
    explicit buffered_compress_zengine(compress_parameters const & p = compress_parameters(),
                                       size_type buf_z = c_default_buf_z)
        : uc_in_buf_{buf_z, sizeof(std::uint8_t)},
          zs_algo_{p},
          z_out_buf_{buf_z, sizeof(std::uint8_t)}
        {
            zs_algo_.provide_output(z_out_buf_.avail());
        }
    /** @brief not copyable (since member @c zs_algo_ is not) **/
    buffered_compress_zengine(buffered_compress_zengine const & x) = delete;

    compress_parameters const & parameters() const { return zs_algo_.parameters(); }
    /** @brief true iff engine has begun a frame (so parameters are fixed) **/
    bool is_started() const { return zs_algo_.is_started(); }

    /** @brief number of bytes of uncompressed input (according to @c libzstd) consumed since this engine created **/
    size_type n_in_total() const { return zs_algo_.n_in_total(); }
    /** @brief number of bytes of compressed output (according to @c libzstd) produced since this engine created **/
    size_type n_out_total() const { return zs_algo_.n_out_total(); }

    /** @brief space currently available for more uncompressed input **/
    z_span_type uc_avail() const { return uc_in_buf_.avail(); }
    /** @brief uncompressed content currently buffered for compression (see .uc_produce()) **/
    z_span_type uc_contents() const { return uc_in_buf_.contents(); }
    /** @brief space currently available for more compressed output */
    z_span_type z_avail() const { return z_out_buf_.avail(); }
    /** @brief compressed content currently available for consumption.

        Consume by calling @c .z_consume() with a non-empty prefix of @c .z_contents()
     **/
    z_span_type z_contents() const { return z_out_buf_.contents(); }

    /** @brief Introduce new uncompressed input for compression.

        @param span   Memory range of new uncompressed input.

        @pre @p span must be a prefix of @ref uc_avail()
    **/
    void uc_produce(z_span_type const & span) {
        if (span.size()) {
            uc_in_buf_.produce(span);

            /* whenever we call .compress_chunk(),  we consume from .uc_in_buf,
             * so .uc_in_buf and .zs_algo are kept synchronized
             */
            zs_algo_.provide_input(uc_in_buf_.contents());
        }
    }

    /** @brief consume some compressed output;  consumed buffer space can eventually be reused

        @param span   Memory range of now-consumed compressed output.

        @pre @p span must be a prefix of @ref z_contents()
    **/
    void z_consume(z_span_type const & span) {
        if (span.size()) {
            z_out_buf_.consume(span);
        }

        if (z_out_buf_.empty()) {
            /* can recycle output */
            zs_algo_.provide_output(z_out_buf_.avail());
        }
    }

    /** @brief consume all buffered compressed content **/
    void z_consume_all() { this->z_consume(this->z_contents()); }

    /** @brief attempt some compression work.

        Compress some input data previously provided via @ref uc_produce()

        @param d   directive for this step.
        With @c directive::e_flush or @c directive::e_end,
        repeat (consuming compressed output in between) until returned hint is 0.

        @return counts of bytes consumed from uncompressed buffer / appended to compressed buffer,
        plus engine hint.  No-op (all zero) when there is no input and @p d is @c directive::e_continue

        @throw short_buffer  if compressed buffer is full;  consume compressed output first
    **/
    step_result compress_chunk(directive d);

private:
    /** @brief buffer for uncompressed input **/
    buffer<std::uint8_t> uc_in_buf_;

    /** @brief compression state (holds @c ZSTD_CCtx) */
    compress_zengine zs_algo_;

    /** @brief buffer for compressed output **/
    buffer<std::uint8_t> z_out_buf_;
}; /*buffered_compress_zengine*/

