/** @file zstd_compress_reader.hpp **/

#pragma once

#include "zstd_reader.hpp"
#include "zstdsafe/compress_zengine.hpp"
#include "zstdsafe/buffer.hpp"
#include "zstdsafe/parameters.hpp"
#include <streambuf>
#include <cstdint>

/**
   @class zstd_compress_reader zstdstream/zstd_compress_reader.hpp

   @brief Pull-mode compressor:  pulls uncompressed bytes from a source,
   delivers one compressed frame straight into caller memory.

   Counterpart of @ref zstd_writer for callers that want to read compressed output,
   e.g. to hand it to an api that itself pulls from a stream.

   State machine (uses @ref reader_state;  never reports @c frame_complete):
   @code
     idle --read--> active --(source exhausted,  frame end delivered)--> finished
       \               \
        \---------------\--(any error)--> failed
   @endcode

   An empty source still yields one (empty) frame.

   Not safe for concurrent use.
 **/
class zstd_compress_reader {
public:
    using size_type = std::uint64_t;

    /** @brief default size for uncompressed-input buffer **/
    static constexpr size_type c_default_buf_z = 64UL * 1024UL;

public:
    /**
       @param source  supplies uncompressed bytes.  Not owned;  must outlive this reader.
       @param p       compression parameters
       @param buf_z   size of uncompressed-input buffer
     **/
    explicit zstd_compress_reader(std::streambuf * source,
                                  compress_parameters const & p = compress_parameters(),
                                  size_type buf_z = c_default_buf_z);
    zstd_compress_reader(zstd_compress_reader const & x) = delete;
    zstd_compress_reader & operator= (zstd_compress_reader const & x) = delete;

    reader_state state() const { return state_; }
    compress_parameters const & parameters() const { return zs_.parameters(); }
    std::streambuf * source() const { return source_; }

    /** @brief uncompressed bytes consumed by engine since construction **/
    size_type n_in_total() const { return zs_.n_in_total(); }
    /** @brief compressed bytes delivered since construction **/
    size_type n_out_total() const { return zs_.n_out_total(); }

    /** @brief compress into @c into[0] .. @c into[n-1]

        Blocks (on the source) until at least one compressed byte is available,  or frame is complete.

        @return number of bytes written to @p into;  0 once the frame has been delivered

        @throw short_buffer  if @p n is 0
        @throw closed_error  if reader failed on an earlier call
     **/
    size_type read(void * into, size_type n);

private:
    /** @brief refill uncompressed-input buffer from source.
        @return number of bytes read;  0 at end of source
     **/
    size_type fill();

private:
    /** @brief uncompressed input origin **/
    std::streambuf * source_ = nullptr;
    /** @brief compression engine **/
    compress_zengine zs_;
    /** @brief uncompressed input,  read from @ref source_,  not yet consumed by @ref zs_ **/
    buffer<std::uint8_t> uc_in_buf_;

    /** @brief true once source reported end;  engine then runs with @c directive::e_end **/
    bool source_eof_flag_ = false;
    reader_state state_ = reader_state::idle;
};
