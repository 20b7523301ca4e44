/** @file zstd_writer.hpp **/

#pragma once

#include "zstdsafe/buffered_compress_zengine.hpp"
#include "zstdsafe/parameters.hpp"
#include "zstdsafe/span.hpp"
#include <streambuf>
#include <iosfwd>
#include <cstdint>

/** @brief lifecycle of a @ref zstd_writer **/
enum class writer_state {
    /** nothing written yet **/
    idle,
    /** at least one byte written;  frame open **/
    active,
    /** inside @c finish() **/
    finishing,
    /** frame complete;  no further output **/
    closed,
    /** an operation threw;  writer can only be destroyed **/
    failed
};

std::ostream & operator<< (std::ostream & os, writer_state x);

/**
   @class zstd_writer zstdstream/zstd_writer.hpp

   @brief Streaming compressor:  accepts uncompressed bytes,  pushes one zstd frame to a sink.

   State machine:
   @code
     idle --write--> active --finish--> finishing --> closed
       \                \                  \
        \----------------\------------------\--(any error)--> failed
   @endcode

   - @ref write copies caller bytes into a fixed-size pending-input buffer,
     and compresses while pending input remains.
     Each compressed chunk goes to the sink as soon as it is produced;
     compressed output buffer is fixed-size and reused.
   - @ref flush makes everything written so far decodable by a reader,
     at some cost in compression ratio.
   - @ref finish completes the frame (including checksum,  if enabled).
     A second @c finish() is a no-op.
   - @ref write_skippable_frame completes any open frame,  then emits a skippable frame;
     a later @ref write opens a new frame.
     @ref finish after a skippable frame (with nothing written since) emits no further frame.

   Destroying a writer without calling @ref finish abandons the frame:
   native context is released,  sink receives no epilogue.

   Not safe for concurrent use.

   Example
   @code
     std::stringbuf sink;
     zstd_writer w(&sink, compress_parameters().set_level(3).set_checksum(true));

     w.write("hello world", 11);
     w.flush();
     w.write(" again", 6);
     w.finish();
   @endcode
 **/
class zstd_writer {
public:
    using size_type = std::uint64_t;

    /** @brief default size for pending-input and compressed-output buffers **/
    static constexpr size_type c_default_buf_z = buffered_compress_zengine::c_default_buf_z;

public:
    /**
       @param sink   receives compressed output.  Not owned;  must outlive this writer.
       @param p      compression parameters
       @param buf_z  size for each of pending-input / compressed-output buffers
     **/
    explicit zstd_writer(std::streambuf * sink,
                         compress_parameters const & p = compress_parameters(),
                         size_type buf_z = c_default_buf_z);
    zstd_writer(zstd_writer const & x) = delete;
    zstd_writer & operator= (zstd_writer const & x) = delete;

    writer_state state() const { return state_; }
    bool is_closed() const { return state_ == writer_state::closed; }
    compress_parameters const & parameters() const { return zs_.parameters(); }
    std::streambuf * sink() const { return sink_; }

    /** @brief uncompressed bytes accepted by engine since construction **/
    size_type n_in_total() const { return zs_.n_in_total(); }
    /** @brief compressed bytes delivered to sink since construction **/
    size_type n_out_total() const { return n_out_total_; }
    /** @brief frames (regular or skippable) completed so far **/
    size_type n_frames() const { return n_frames_; }

    /** @brief compress @p n bytes starting at @p s

        @return @p n;  all bytes are always accepted

        @throw closed_error  if writer is closed or failed
        @throw sink_error    if sink refuses compressed output
     **/
    size_type write(void const * s, size_type n);

    /** @brief emit complete,  independently decodable data for everything written so far;
        then @c pubsync() the sink.

        @throw closed_error  if writer is closed or failed
     **/
    void flush();

    /** @brief complete frame,  then @c pubsync() the sink.  No-op if already closed.

        @throw closed_error  if writer failed
     **/
    void finish();

    /** @brief complete any open frame,  then emit a skippable frame holding @p n bytes from @p s.

        Skippable frames carry application metadata;  decoders pass over them.

        @param magic_variant  low 4 bits of frame magic number,  in [0, 15]

        @throw invalid_parameter  if @p magic_variant > 15 (writer unchanged)
        @throw closed_error       if writer is closed or failed
        @throw sink_error         if sink refuses output
     **/
    void write_skippable_frame(void const * s, size_type n, unsigned magic_variant = 0);

private:
    /** @brief throw @c closed_error unless writer can accept @p op **/
    void require_open(char const * op) const;

    /** @brief compress until pending input is gone,  using directive @p d.
        For flush/end,  continue until engine reports nothing pending.
     **/
    void drain(directive d);

    /** @brief send all buffered compressed output to sink **/
    void emit();

    /** @brief send @p bytes to sink **/
    void put(cbyte_span const & bytes);

private:
    /** @brief compressed output destination **/
    std::streambuf * sink_ = nullptr;
    /** @brief compression engine + its pending-input / compressed-output buffers **/
    buffered_compress_zengine zs_;

    writer_state state_ = writer_state::idle;

    /** @brief compressed bytes given to @ref sink_ **/
    size_type n_out_total_ = 0;
    size_type n_frames_ = 0;
};
