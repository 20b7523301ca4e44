// buffer.hpp

#pragma once

#include "span.hpp"
#include "zstd_error.hpp"
#include "tostr.hpp"
#include <utility>
#include <cstdint>
#include <cstring>
#include <new>

/*
 *  .buf
 *
 *    +------------------------------------------+
 *    |  |  ...  |  | X|  ... | X|  |    ...  |  |
 *    +------------------------------------------+
 *     ^             ^            ^               ^
 *     0             .lo          .hi             .buf_z
 *
 *
 * buffer does not support wrapped content
 *
 * Example:
 * 1.
 *   buffer<uint8_t> buf(64*1024);
 *   buf.empty() -> true
 *   buf.buf_z() -> 65536
 *   buf.contents() -> empty span
 *   buf.avail() -> span entire buffer memory
 *
 * 2.
 *   buffer<uint8_t> buf;
 *   buf.buf_z() -> 0
 *   buf.avail() -> empty span
 *
 *   buf.alloc(64*1024);
 */
template <typename CharT>
class buffer {
public:
    using span_type = span<CharT>;
    using size_type = std::uint64_t;

public:
    buffer() = default;
    explicit buffer(size_type buf_z, size_type align_z = sizeof(char)) {
        this->alloc(buf_z, align_z);
    }
    buffer(buffer const & x) = delete;
    buffer(buffer && x) { this->swap(x); }
    ~buffer() { this->reset(); }

    CharT * buf() const { return buf_; }
    size_type buf_z() const { return buf_z_; }
    size_type lo_pos() const { return lo_pos_; }
    size_type hi_pos() const { return hi_pos_; }

    span_type contents() const { return span_type(buf_ + lo_pos_, buf_ + hi_pos_); }
    span_type avail() const { return span_type(buf_ + hi_pos_, buf_ + buf_z_); }

    bool empty() const { return lo_pos_ == hi_pos_; }
    bool full() const { return hi_pos_ == buf_z_; }

    /* discard any existing state,  then allocate owned storage for buf_z elements */
    void alloc(size_type buf_z, size_type align_z = sizeof(char)) {
        this->reset();

        if (buf_z) {
            buf_ = static_cast<CharT *>(::operator new[](buf_z * sizeof(CharT), std::align_val_t(align_z)));
            align_z_ = align_z;
            is_owner_ = true;
        }

        buf_z_ = buf_z;
    }

    /* append contents of span to buffer, starting at .hi_pos */
    void produce(span_type const & span) {
        if (span.empty())
            return;

        if ((span.lo() != buf_ + hi_pos_) || (span.size() > buf_z_ - hi_pos_))
            throw cursor_overflow(tostr("buffer::produce: span [", span.size(),
                                        " bytes] is not a prefix of available space [", buf_z_ - hi_pos_, " bytes]"));

        hi_pos_ += span.size();
    }

    /* remove contents of span from buffer, starting at .lo_pos */
    void consume(span_type const & span) {
        if (span.size()) {
            if ((span.lo() != buf_ + lo_pos_) || (span.size() > hi_pos_ - lo_pos_))
                throw cursor_overflow(tostr("buffer::consume: span [", span.size(),
                                            " bytes] is not a prefix of contents [", hi_pos_ - lo_pos_, " bytes]"));

            lo_pos_ += span.size();
        } else {
            /* since .consume() that arrives at empty contents also resets .lo_pos .hi_pos,
             * we don't want to blow up when called with an empty span -- argument
             * may represent some pre-reset location in buffer
             */
        }

        if (lo_pos_ == hi_pos_) {
            lo_pos_ = 0;
            hi_pos_ = 0;
        }
    }

    /* reset buffer pointers */
    void clear2empty(bool zero_buffer_flag) {
        if (buf_ && zero_buffer_flag)
            ::explicit_bzero(buf_, buf_z_ * sizeof(CharT));

        lo_pos_ = 0;
        hi_pos_ = 0;
    }

    void swap(buffer & x) {
        std::swap(is_owner_, x.is_owner_);
        std::swap(buf_, x.buf_);
        std::swap(buf_z_, x.buf_z_);
        std::swap(align_z_, x.align_z_);
        std::swap(lo_pos_, x.lo_pos_);
        std::swap(hi_pos_, x.hi_pos_);
    }

    void reset() {
        if (is_owner_ && buf_)
            ::operator delete[](buf_, std::align_val_t(align_z_));

        is_owner_ = false;
        buf_ = nullptr;
        buf_z_ = 0;
        align_z_ = sizeof(char);
        lo_pos_ = 0;
        hi_pos_ = 0;
    }

    /* move-assignment */
    buffer & operator= (buffer && x) {
        this->reset();
        this->swap(x);

        return *this;
    }

private:
    bool is_owner_ = false;
    CharT * buf_ = nullptr;
    size_type buf_z_ = 0;
    size_type align_z_ = sizeof(char);

    /* buffer locations [.lo_pos .. .hi_pos) are occupied;
     * remainder is available space
     */
    size_type lo_pos_ = 0;
    size_type hi_pos_ = 0;
};

template <typename CharT>
inline void
swap(buffer<CharT> & lhs, buffer<CharT> & rhs) {
    lhs.swap(rhs);
}
