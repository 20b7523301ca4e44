/** @file base_zengine.hpp **/

#pragma once

#include "buffer_view.hpp"
#include "span.hpp"
#include "zstd_error.hpp"
#include "tostr.hpp"
#include <utility>
#include <cstdint>
#include <iosfwd>

/** @brief which way an engine transforms bytes **/
enum class engine_kind {
    compressor,
    decompressor
};

/** @brief what a compression step should do beyond consuming input.

    Mirrors @c ZSTD_EndDirective.
 **/
enum class directive {
    /** more input will follow;  engine may hold back output to improve ratio **/
    e_continue,
    /** make all input so far decodable;  ends current block **/
    e_flush,
    /** no more input;  complete frame (including checksum, if enabled) **/
    e_end
};

std::ostream & operator<< (std::ostream & os, directive x);

/** @brief outcome of one step,  as reported by @c zsafe::step **/
struct step_result {
    /** @brief bytes consumed from input view **/
    std::uint64_t n_consumed = 0;
    /** @brief bytes produced into output view **/
    std::uint64_t n_produced = 0;
    /** @brief 0: nothing more pending this call (frame complete / flush complete).
        Otherwise: engine has more to do,  either more output to flush (compression)
        or more input expected (decompression);  value is a size hint.
     **/
    std::uint64_t hint = 0;
};

/** @brief outcome of one engine chunk:  same as @ref step_result,  but as memory ranges **/
struct chunk_result {
    /** @brief input consumed by this chunk **/
    cbyte_span consumed;
    /** @brief output produced by this chunk **/
    byte_span produced;
    /** @brief see @ref step_result::hint **/
    std::uint64_t hint = 0;
};

/**
   @class base_zengine zstdsafe/base_zengine.hpp

   @brief state common to compression and decompression engines:
   attached input/output ranges,  byte counters,  started flag.

   Each engine owns exactly one native @c libzstd context,  held by the derived class.
   Engines are not copyable,  and not safe for concurrent use:
   a single engine must be driven by one thread at a time.
   Separate engines share no mutable state.

   This class used by @see compress_zengine @see decompress_zengine.
**/
class base_zengine {
public:
    /** @brief span type for engine output **/
    using span_type = byte_span;
    /** @brief span type for engine input **/
    using cspan_type = cbyte_span;
    using size_type = std::uint64_t;

public:
    /** @brief base_zengine is not copyable **/
    base_zengine(base_zengine const & x) = delete;

    engine_kind kind() const { return kind_; }

    /** @brief true iff no input work remaining **/
    bool input_empty() const { return in_.remaining() == 0; }
    /** @brief true iff engine has input work remaining **/
    bool have_input() const { return in_.remaining() > 0; }
    /** @brief true iff no output space remaining **/
    bool output_empty() const { return out_.remaining() == 0; }

    /** @brief true iff at least one step has been taken since construction / last rebuild.
        Configuration is rejected once started.
     **/
    bool is_started() const { return started_flag_; }

    /** @brief total number of bytes consumed since this engine was created / rebuilt **/
    size_type n_in_total() const { return n_in_total_; }
    /** @brief total number of bytes produced since this engine was created / rebuilt **/
    size_type n_out_total() const { return n_out_total_; }

    /**
       @brief provide a new input memory range.

       Unconsumed input must be carried forward:
       throws unless either current input is empty,  or @p x begins exactly at the current input cursor
       (i.e. @p x extends the unconsumed remainder of the previous input).

       @param x  input range.  Memory must remain valid until consumed (or replaced).
    **/
    void provide_input(cspan_type const & x) {
        if (!this->input_empty() && (x.lo() != in_.cursor()))
            throw cursor_overflow(tostr("base_zengine::provide_input: would discard ", in_.remaining(),
                                        " bytes of unconsumed input"));

        in_ = in_view(x);
    }

    /**
       @brief provide new output memory range.

       Discards any remaining output space in the previous range.

       @param x  output range.  Memory must remain valid until next @c provide_output()
     **/
    void provide_output(span_type const & x) {
        out_ = out_view(x);
    }

    /** @brief forget input and output ranges,  so engine holds no caller memory **/
    void detach() {
        in_ = in_view();
        out_ = out_view();
    }

    /** @brief swap with another base_zengine object **/
    void swap(base_zengine & x) {
        std::swap(kind_, x.kind_);
        std::swap(in_, x.in_);
        std::swap(out_, x.out_);
        std::swap(started_flag_, x.started_flag_);
        std::swap(n_in_total_, x.n_in_total_);
        std::swap(n_out_total_, x.n_out_total_);
    }

protected:
    explicit base_zengine(engine_kind kind) : kind_{kind} {}

    /** @brief move assignment **/
    base_zengine & operator= (base_zengine && x) {
        this->swap(x);
        return *this;
    }

    /** @brief destructor.

        Virtual so that derived engine can release its native context.
    **/
    virtual ~base_zengine() = default;

    /** @brief reset counters + ranges;  derived class resets its native context **/
    void clear_session() {
        this->detach();
        started_flag_ = false;
        n_in_total_ = 0;
        n_out_total_ = 0;
    }

    friend class zsafe;

protected:
    engine_kind kind_;

    /** @brief input range;  position advances as engine consumes **/
    in_view in_;
    /** @brief output range;  position advances as engine produces **/
    out_view out_;

    /** @brief set by first step,  cleared by rebuild **/
    bool started_flag_ = false;

    size_type n_in_total_ = 0;
    size_type n_out_total_ = 0;
};

/** @brief swap two @ref base_zengine instances **/
inline void
swap(base_zengine & x, base_zengine & y) {
    x.swap(y);
}
