/** @file tostr.hpp **/

#pragma once

#include "span.hpp"
#include <sstream>
#include <string>

/** @brief write @p x on @p s
 *  @param s stream on which to print
 *  @param x value to print (as per @c operator<<)
 **/
template <class Stream, typename T>
Stream &
tos(Stream & s, T && x) {
    s << x;
    return s;
}

/** @brief write @p x, then contents of @p rest on @p s
 *  @param s stream on which to print
 *  @param x value to print first (as per @c operator<<)
 *  @param rest remaining values to print (in order from left to right)
 **/
template <class Stream, typename T1, typename... Tn>
Stream &
tos(Stream & s, T1 && x, Tn && ...rest) {
    s << x;
    return tos(s, std::forward<Tn>(rest)...);
}

/**
 * @brief construct string from in-order printed value of arguments
 *
 * @code
 *   tostr("zsafe::step: consumed ", n_in, " bytes")
 * @endcode
 *
 * is shorthand for:
 *
 * @code
 *   {
 *     stringstream s;
 *     s << "zsafe::step: consumed " << n_in << " bytes";
 *     return s.str();
 *   }
 * @endcode
 *
 * Used to assemble exception messages and debug log lines.
 **/
template <typename... Tn>
std::string
tostr(Tn && ...args) {
    std::stringstream ss;
    tos(ss, std::forward<Tn>(args)...);
    return ss.str();
}

/** @brief print span as @c <span lo:0x.. z:N> (addresses only,  not contents;  see @c hex_view for contents) **/
template <typename Stream, typename CharT>
Stream &
operator<< (Stream & os, span<CharT> const & x) {
    os << "<span lo:" << static_cast<void const *>(x.lo()) << " z:" << x.size() << ">";
    return os;
}
