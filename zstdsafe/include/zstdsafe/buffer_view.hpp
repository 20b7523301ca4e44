/** @file buffer_view.hpp **/

#pragma once

#include "span.hpp"
#include "zstd_error.hpp"
#include "tostr.hpp"
#include <cstdint>

/**
   @class buffer_view zstdsafe/buffer_view.hpp

   @brief Cursor over a caller-owned memory range:  (pointer, capacity, position).

   Describes either bytes available to read (@ref in_view) or space available to write (@ref out_view).
   Mirrors @c ZSTD_inBuffer / @c ZSTD_outBuffer,  but checks every position update.

   @code
     position
     v
     CCCCCCCCCC.....................
     ^         <--- remaining() --->^
     buf                            buf + capacity
   @endcode

   Invariant: @c pos() <= @c capacity()

   Views are ephemeral:  they do not own memory,  and safety layer never retains them past a call.

   @tparam CharT element type.  @c std::uint8_t const for input,  @c std::uint8_t for output
 **/
template <typename CharT>
class buffer_view {
public:
    using size_type = std::uint64_t;
    using span_type = span<CharT>;

public:
    buffer_view() = default;
    buffer_view(CharT * buf, size_type buf_z, size_type pos = 0)
        : buf_{buf}, buf_z_{buf_z}, pos_{0}
        {
            this->advance(pos);
        }
    /** @brief view over the whole of @p x,  with position at start **/
    explicit buffer_view(span_type const & x) : buffer_view(x.lo(), x.size(), 0) {}

    CharT * buf() const { return buf_; }
    size_type capacity() const { return buf_z_; }
    size_type pos() const { return pos_; }

    /** @brief number of elements between position and capacity **/
    size_type remaining() const { return buf_z_ - pos_; }
    /** @brief address of first not-yet-consumed (or not-yet-written) element **/
    CharT * cursor() const { return buf_ + pos_; }

    /** @brief elements already consumed (input) / produced (output) **/
    span_type consumed() const { return span_type(buf_, buf_ + pos_); }
    /** @brief elements not yet consumed (input) / space not yet written (output) **/
    span_type unconsumed() const { return span_type(buf_ + pos_, buf_ + buf_z_); }

    /** @brief move position forward by @p n elements.
        @throw cursor_overflow if @p n exceeds @ref remaining
     **/
    void advance(size_type n) {
        if (n > this->remaining())
            throw cursor_overflow(tostr("buffer_view::advance: n=", n, " exceeds remaining=", this->remaining()));

        pos_ += n;
    }

private:
    CharT * buf_ = nullptr;
    size_type buf_z_ = 0;
    size_type pos_ = 0;
};

/** @brief cursor over bytes to be consumed by the engine **/
using in_view = buffer_view<std::uint8_t const>;
/** @brief cursor over space for bytes produced by the engine **/
using out_view = buffer_view<std::uint8_t>;
