// hex.hpp

#pragma once

#include "span.hpp"
#include <iostream>
#include <cstdint>
#include <cctype>

/* print one byte as two hex digits,  optionally followed by (char) */
struct hex {
    hex(std::uint8_t x, bool w_char = false) : x_{x}, with_char_{w_char} {}

    std::uint8_t x_;
    bool with_char_;
};

/* print a byte range as [hh hh ..],  eliding the middle of long ranges */
struct hex_view {
    /* print at most this many leading + trailing bytes of a range */
    static constexpr std::size_t c_default_max_z = 64;

    hex_view(std::uint8_t const * lo, std::uint8_t const * hi, bool as_text, std::size_t max_z = c_default_max_z)
        : lo_{lo}, hi_{hi}, as_text_{as_text}, max_z_{max_z} {}
    hex_view(char const * lo, char const * hi, bool as_text, std::size_t max_z = c_default_max_z)
        : lo_{reinterpret_cast<std::uint8_t const *>(lo)},
          hi_{reinterpret_cast<std::uint8_t const *>(hi)},
          as_text_{as_text},
          max_z_{max_z} {}
    hex_view(span<std::uint8_t const> const & x, bool as_text, std::size_t max_z = c_default_max_z)
        : hex_view(x.lo(), x.hi(), as_text, max_z) {}

    std::uint8_t const * lo_;
    std::uint8_t const * hi_;
    bool as_text_;
    std::size_t max_z_;
};

inline std::ostream &
operator<< (std::ostream & os, hex const & ins) {
    std::uint8_t lo = ins.x_ & 0xf;
    std::uint8_t hi = ins.x_ >> 4;

    char lo_ch = (lo < 10) ? '0' + lo : 'a' + lo - 10;
    char hi_ch = (hi < 10) ? '0' + hi : 'a' + hi - 10;

    os << hi_ch << lo_ch;

    if (ins.with_char_) {
        os << "(";
        if (std::isprint(ins.x_))
            os << static_cast<char>(ins.x_);
        else
            os << "?";
        os << ")";
    }

    return os;
}

inline std::ostream &
operator<< (std::ostream & os, hex_view const & ins) {
    std::size_t n = ins.hi_ - ins.lo_;

    os << "[";
    std::size_t i = 0;
    for (std::uint8_t const * p = ins.lo_; p < ins.hi_; ++p, ++i) {
        if ((n > 2 * ins.max_z_) && (i == ins.max_z_)) {
            /* skip to last .max_z bytes */
            os << " .." << (n - 2 * ins.max_z_) << "..";
            p = ins.hi_ - ins.max_z_;
            i = n - ins.max_z_;
        }
        if (i > 0)
            os << " ";
        os << hex(*p, ins.as_text_);
    }
    os << "]";
    return os;
}
