/** @file zstd_decompress_writer.hpp **/

#pragma once

#include "zstd_writer.hpp"
#include "zstdsafe/decompress_zengine.hpp"
#include "zstdsafe/buffer.hpp"
#include "zstdsafe/parameters.hpp"
#include <streambuf>
#include <cstdint>

/**
   @class zstd_decompress_writer zstdstream/zstd_decompress_writer.hpp

   @brief Push-mode decompressor:  accepts compressed bytes,  pushes decompressed bytes to a sink.

   Counterpart of @ref zstd_reader for callers that receive compressed data in pieces
   (e.g. from a network callback).  Any number of concatenated frames;
   skippable frames are passed over.

   State machine (uses @ref writer_state;  never reports @c finishing):
   @code
     idle --write--> active --finish--> closed
       \                \
        \----------------\--(any error)--> failed
   @endcode

   @ref finish inside a frame throws @c truncated_frame.

   Not safe for concurrent use.
 **/
class zstd_decompress_writer {
public:
    using size_type = std::uint64_t;

    /** @brief default size for decompressed-output buffer **/
    static constexpr size_type c_default_buf_z = 64UL * 1024UL;

public:
    /**
       @param sink   receives decompressed output.  Not owned;  must outlive this writer.
       @param p      decompression parameters
       @param buf_z  size of decompressed-output buffer
     **/
    explicit zstd_decompress_writer(std::streambuf * sink,
                                    decompress_parameters const & p = decompress_parameters(),
                                    size_type buf_z = c_default_buf_z);
    zstd_decompress_writer(zstd_decompress_writer const & x) = delete;
    zstd_decompress_writer & operator= (zstd_decompress_writer const & x) = delete;

    writer_state state() const { return state_; }
    bool is_closed() const { return state_ == writer_state::closed; }
    /** @brief true iff the last byte written left a frame incomplete **/
    bool mid_frame() const { return mid_frame_flag_; }
    decompress_parameters const & parameters() const { return zs_.parameters(); }
    std::streambuf * sink() const { return sink_; }

    /** @brief compressed bytes consumed since construction **/
    size_type n_in_total() const { return zs_.n_in_total(); }
    /** @brief decompressed bytes delivered to sink since construction **/
    size_type n_out_total() const { return n_out_total_; }
    /** @brief frames completed so far **/
    size_type n_frames() const { return n_frames_; }

    /** @brief decompress @p n compressed bytes starting at @p s;  all decoded output goes to sink before return

        @return @p n;  all bytes are always accepted

        @throw closed_error       if writer is closed or failed
        @throw checksum_mismatch  if a frame's checksum is wrong
        @throw engine_error       if input is not valid zstd data
        @throw sink_error         if sink refuses output
     **/
    size_type write(void const * s, size_type n);

    /** @brief @c pubsync() the sink

        @throw closed_error  if writer is closed or failed
        @throw sink_error    if sink cannot sync
     **/
    void flush();

    /** @brief check input ended at a frame boundary,  then @c pubsync() the sink.  No-op if already closed.

        @throw truncated_frame  if last frame is incomplete
        @throw closed_error     if writer failed
     **/
    void finish();

private:
    /** @brief throw @c closed_error unless writer can accept @p op **/
    void require_open(char const * op) const;

    /** @brief send all buffered decompressed output to sink **/
    void emit();

private:
    /** @brief decompressed output destination **/
    std::streambuf * sink_ = nullptr;
    /** @brief decompression engine **/
    decompress_zengine zs_;
    /** @brief decompressed output,  not yet given to @ref sink_ **/
    buffer<std::uint8_t> uc_out_buf_;

    writer_state state_ = writer_state::idle;
    bool mid_frame_flag_ = false;

    size_type n_out_total_ = 0;
    size_type n_frames_ = 0;
};
