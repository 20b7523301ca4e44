/** @file zsafe.hpp **/

#pragma once

#include "base_zengine.hpp"
#include <string>
#include <cstddef>

class compress_zengine;
class decompress_zengine;

/**
   @class zsafe zstdsafe/zsafe.hpp

   @brief The only place that calls streaming @c libzstd entry points.

   Every native call goes through here,  so that:
   - native result codes are always checked,  and mapped to the @ref zstd_error hierarchy;
   - input/output positions are read back from native buffers and
     applied to engine views via @c buffer_view::advance,  which refuses to overrun capacity;
   - engines are marked started,  and byte counters maintained.

   Used as a namespace.
 **/
class zsafe {
public:
    /** @brief one compression step on @p e,  from @p in into @p out.

        Makes exactly one @c ZSTD_compressStream2 call.
        Both views advance by the number of bytes consumed / produced;
        no reference to either view is kept after return.

        @param e    engine
        @param in   uncompressed input
        @param out  space for compressed output
        @param d    directive for this step

        @return counts,  and hint (0 when flush / frame end is complete)

        @throw short_buffer  if @p out has no remaining space
        @throw engine_error  (or subclass per @ref raise) if native call fails
     **/
    static step_result step(compress_zengine & e, in_view & in, out_view & out, directive d);

    /** @brief one decompression step on @p e,  from @p in into @p out.

        Makes exactly one @c ZSTD_decompressStream call.
        Hint is 0 exactly when a frame has just been completely decoded and flushed.

        @throw invalid_parameter  if @p d is not @c directive::e_continue
        @throw short_buffer       if @p out has no remaining space
        @throw checksum_mismatch  if a frame's content checksum is wrong
        @throw engine_error       on other native failures (e.g. corrupt input)
     **/
    static step_result step(decompress_zengine & e, in_view & in, out_view & out,
                            directive d = directive::e_continue);

    /** @brief one step on @p e using the ranges attached by @c provide_input / @c provide_output **/
    static step_result step(compress_zengine & e, directive d);
    /** @brief one step on @p e using the ranges attached by @c provide_input / @c provide_output **/
    static step_result step(decompress_zengine & e, directive d = directive::e_continue);

    /** @brief throw per @ref raise if @p code is a native error code.  Otherwise return @p code **/
    static std::size_t check(std::size_t code, char const * ctx) {
        if (is_error(code))
            raise(code, ctx);

        return code;
    }

    /** @brief like @ref check,  but a native failure setting a parameter always reports @c invalid_parameter **/
    static void check_parameter(std::size_t code, char const * ctx, char const * param_name, int value);

    /** @brief true iff @p code is a native error code **/
    static bool is_error(std::size_t code);

    /** @brief throw the @ref zstd_error subclass that best describes native error @p code

        - memory allocation failure -> @ref allocation_error
        - checksum failure -> @ref checksum_mismatch
        - parameter rejected / out of bounds -> @ref invalid_parameter
        - anything else -> @ref engine_error
     **/
    [[noreturn]] static void raise(std::size_t code, std::string const & ctx);

private:
    static step_result apply(base_zengine & e, in_view & in, out_view & out,
                             std::size_t in_pos, std::size_t out_pos,
                             std::size_t hint);
};
