/** @file zstd_reader.hpp **/

#pragma once

#include "zstdsafe/decompress_zengine.hpp"
#include "zstdsafe/buffer.hpp"
#include "zstdsafe/parameters.hpp"
#include <streambuf>
#include <iosfwd>
#include <vector>
#include <cstdint>

/** @brief lifecycle of a @ref zstd_reader **/
enum class reader_state {
    /** nothing decoded yet **/
    idle,
    /** inside a frame **/
    active,
    /** just completed a frame **/
    frame_complete,
    /** source exhausted at a frame boundary (or single frame complete);  @c read() returns 0 **/
    finished,
    /** an operation threw;  reader can only be destroyed **/
    failed
};

std::ostream & operator<< (std::ostream & os, reader_state x);

/**
   @class zstd_reader zstdstream/zstd_reader.hpp

   @brief Streaming decompressor:  pulls compressed bytes from a source,
   delivers decompressed bytes straight into caller memory.

   State machine:
   @code
     idle --read--> active --(frame end)--> frame_complete --(more source)--> active
                                                    \
                                                     \--(source exhausted)--> finished
   @endcode

   Concatenated frames decode as one stream unless constructed with @p allow_multiple_frames false;
   in that case reading stops after the first frame,  and any trailing source bytes are left
   unread by the engine.

   Checksum caveat:  a frame's checksum (if present) is verified when the frame ends.
   On mismatch @ref read throws @c checksum_mismatch,  but bytes of that frame returned by
   earlier @ref read calls have already been delivered;  caller must treat them as untrusted.

   Window limit:  a frame whose window log exceeds the decoder default (27) decodes only if
   @p p carries @c decompress_parameters::set_window_log_max at least that large;
   otherwise @ref read throws @c engine_error ("Frame requires too much memory for decoding").
   Frames written by a @ref zstd_writer with @c set_window_log(28) or more need this.

   Skippable frames are passed over by @ref read (each counts toward @ref n_frames);
   use @ref read_skippable_frame or @ref skip_frame at a frame boundary to handle them explicitly.

   Not safe for concurrent use.
 **/
class zstd_reader {
public:
    using size_type = std::uint64_t;

    /** @brief default size for compressed-input buffer **/
    static constexpr size_type c_default_buf_z = 64UL * 1024UL;

public:
    /**
       @param source  supplies compressed bytes.  Not owned;  must outlive this reader.
       @param p       decompression parameters
       @param buf_z   size of compressed-input buffer
       @param allow_multiple_frames  if false,  stop after first frame
     **/
    explicit zstd_reader(std::streambuf * source,
                         decompress_parameters const & p = decompress_parameters(),
                         size_type buf_z = c_default_buf_z,
                         bool allow_multiple_frames = true);
    zstd_reader(zstd_reader const & x) = delete;
    zstd_reader & operator= (zstd_reader const & x) = delete;

    reader_state state() const { return state_; }
    bool allow_multiple_frames() const { return allow_multiple_frames_; }
    decompress_parameters const & parameters() const { return zs_.parameters(); }
    std::streambuf * source() const { return source_; }

    /** @brief compressed bytes consumed by engine since construction **/
    size_type n_in_total() const { return zs_.n_in_total(); }
    /** @brief decompressed bytes delivered since construction **/
    size_type n_out_total() const { return zs_.n_out_total(); }
    /** @brief number of frames completed so far **/
    size_type n_frames() const { return n_frames_; }

    /** @brief decompress into @c into[0] .. @c into[n-1]

        Blocks (on the source) until at least one byte is available,  or stream ends.

        @return number of bytes written to @p into;  0 at clean end of stream

        @throw short_buffer       if @p n is 0
        @throw truncated_frame    if source ends inside a frame
        @throw checksum_mismatch  if a frame's checksum is wrong
        @throw engine_error       if input is not valid zstd data
        @throw closed_error       if reader failed on an earlier call
     **/
    size_type read(void * into, size_type n);

    /** @brief consume the skippable frame at the current position,  and return its magic variant.

        Only valid at a frame boundary.  If the next frame is not skippable,
        throws @c invalid_parameter and leaves the reader unchanged.

        @param[out] content  receives the frame's content

        @throw already_started    if reader is inside a frame
        @throw invalid_parameter  if next frame is not a skippable frame
        @throw truncated_frame    if source ends before the skippable frame does
        @throw closed_error       if reader failed on an earlier call
     **/
    unsigned read_skippable_frame(std::vector<std::uint8_t> & content);

    /** @brief pass over the next frame (regular or skippable) without decoding it.

        Only valid at a frame boundary.  Regular frame content is not checked.

        @return false if source is exhausted (no frame to skip)

        @throw already_started  if reader is inside a frame
        @throw truncated_frame  if source ends inside the frame
        @throw engine_error     if next bytes are not a valid frame
        @throw closed_error     if reader failed on an earlier call
     **/
    bool skip_frame();

private:
    /** @brief refill compressed-input buffer from lookahead,  or else from source.
        @return number of bytes read;  0 at end of source
     **/
    size_type fill();

    /** @brief throw unless reader is at a frame boundary **/
    void require_boundary(char const * op) const;

    /** @brief append to @p v bytes not yet decoded (pending input,  then lookahead,  then source),
        until @p v holds at least @p n bytes or source is exhausted
     **/
    void collect(std::vector<std::uint8_t> & v, size_type n);

    /** @brief return @c v[off..] to lookahead,  ahead of anything already there **/
    void unread(std::vector<std::uint8_t> const & v, size_type off);

private:
    /** @brief compressed input origin **/
    std::streambuf * source_ = nullptr;
    /** @brief decompression engine **/
    decompress_zengine zs_;
    /** @brief compressed input,  read from @ref source_,  not yet consumed by @ref zs_ **/
    buffer<std::uint8_t> z_in_buf_;
    /** @brief bytes read from @ref source_ but put back by frame-level operations;  consumed before source **/
    std::vector<std::uint8_t> lookahead_;

    bool allow_multiple_frames_ = true;
    reader_state state_ = reader_state::idle;

    /** @brief true if last step filled caller's output;  engine may be holding more decoded content **/
    bool output_pending_flag_ = false;

    size_type n_frames_ = 0;
};
