/** @file span.hpp **/

#pragma once

#include <cstdint>
#include <cstddef>
#include <type_traits>

/** @class span zstdsafe/span.hpp
 *
 *  @brief Represents a contiguous memory range,  without ownership.
 *
 *  Used throughout zstdsafe to describe byte ranges handed to / received from @c libzstd.
 *  A @c span<std::uint8_t const> describes input the engine may only read.
 *
 *  @tparam CharT type for elements referred to by this span.
 **/
template <typename CharT>
class span {
public:
    /** @brief typealias for span size (in units of CharT) **/
    using size_type = std::uint64_t;

public:
    /** @brief create empty span **/
    span() = default;
    /** @brief create span for the contiguous memory range [@p lo, @p hi) **/
    span(CharT * lo, CharT * hi) : lo_{lo}, hi_{hi} {}

    /** @brief a mutable span converts to the corresponding read-only span **/
    template <typename OtherT,
              typename = std::enable_if_t<std::is_same_v<std::add_const_t<OtherT>, CharT>
                                          && !std::is_same_v<OtherT, CharT>>>
    span(span<OtherT> const & x) : lo_{x.lo()}, hi_{x.hi()} {}

    /** @brief create span for the @p z elements starting at @p lo **/
    static span from_size(CharT * lo, size_type z) { return span(lo, lo + z); }

    ///@{

    /** @name getters **/

    CharT * lo() const { return lo_; } /*!< get member span::lo_ */
    CharT * hi() const { return hi_; } /*!< get member span::hi_ */

    ///@}

    /** @brief reinterpret as span over @p OtherT,  with identical endpoints.
     *
     *  Used to move between @c char (streambuf api) and @c std::uint8_t (zstd api) views of the same bytes.
     **/
    template <typename OtherT>
    span<OtherT>
    cast() const { return span<OtherT>(reinterpret_cast<OtherT *>(lo_),
                                       reinterpret_cast<OtherT *>(hi_)); }

    /** @brief create span including the first @p z members of this span. **/
    span prefix(size_type z) const { return span(lo_, lo_ + z); }
    /** @brief create span excluding the first @p z members of this span. **/
    span after(size_type z) const { return span(lo_ + z, hi_); }

    /** @brief true iff this span is empty (comprises 0 elements). **/
    bool empty() const { return lo_ == hi_; }
    /** @brief report the number of elements (of type CharT) in this span. **/
    size_type size() const { return hi_ - lo_; }

private:
    ///@{

    /** @brief start of span
        Span comprises memory address between @p lo (inclusive) and @p hi (exclusive)
     **/
    CharT * lo_ = nullptr;
    /** @brief end of span
        Span comprises memory address between @p lo (inclusive) and @p hi (exclusive)
     **/
    CharT * hi_ = nullptr;

    ///@}
};

/** @brief typealias for a writable byte range **/
using byte_span = span<std::uint8_t>;
/** @brief typealias for a read-only byte range **/
using cbyte_span = span<std::uint8_t const>;
