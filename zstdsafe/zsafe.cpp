// zsafe.cpp

#include "zstdsafe/zsafe.hpp"
#include "zstdsafe/compress_zengine.hpp"
#include "zstdsafe/decompress_zengine.hpp"
#include "zstdsafe/zstd_error.hpp"
#include "zstdsafe/tostr.hpp"
#include <zstd.h>
#include <zstd_errors.h>
#include <iostream>

using namespace std;

ostream &
operator<< (ostream & os, directive x)
{
    switch (x) {
    case directive::e_continue:
        os << "continue";
        break;
    case directive::e_flush:
        os << "flush";
        break;
    case directive::e_end:
        os << "end";
        break;
    }

    return os;
}

namespace {
    ZSTD_EndDirective
    native_directive(directive d)
    {
        switch (d) {
        case directive::e_continue:
            return ZSTD_e_continue;
        case directive::e_flush:
            return ZSTD_e_flush;
        case directive::e_end:
            return ZSTD_e_end;
        }

        throw invalid_parameter(tostr("zsafe: unexpected directive [", static_cast<int>(d), "]"));
    }
}

bool
zsafe::is_error(size_t code)
{
    return ::ZSTD_isError(code);
}

void
zsafe::raise(size_t code, string const & ctx)
{
    ZSTD_ErrorCode ec = ::ZSTD_getErrorCode(code);
    string name = ::ZSTD_getErrorName(code);

    switch (ec) {
    case ZSTD_error_memory_allocation:
        throw allocation_error(tostr(ctx, ": ", name));
    case ZSTD_error_checksum_wrong:
        throw checksum_mismatch(tostr(ctx, ": ", name));
    case ZSTD_error_parameter_unsupported:
    case ZSTD_error_parameter_outOfBound:
    case ZSTD_error_parameter_combination_unsupported:
        throw invalid_parameter(tostr(ctx, ": ", name));
    default:
        break;
    }

    throw engine_error(ctx, code, static_cast<int>(ec), name);
}

void
zsafe::check_parameter(size_t code, char const * ctx, char const * param_name, int value)
{
    if (is_error(code)) {
        ZSTD_ErrorCode ec = ::ZSTD_getErrorCode(code);

        if (ec == ZSTD_error_memory_allocation)
            raise(code, ctx);

        throw invalid_parameter(tostr(ctx, ": ", param_name, "=", value,
                                      " rejected: ", ::ZSTD_getErrorName(code)));
    }
}

step_result
zsafe::apply(base_zengine & e, in_view & in, out_view & out,
             size_t in_pos, size_t out_pos,
             size_t hint)
{
    step_result retval;

    /* native positions are absolute within each view;
     * buffer_view::advance() refuses anything past capacity
     */
    retval.n_consumed = in_pos - in.pos();
    retval.n_produced = out_pos - out.pos();
    retval.hint = hint;

    in.advance(retval.n_consumed);
    out.advance(retval.n_produced);

    e.n_in_total_ += retval.n_consumed;
    e.n_out_total_ += retval.n_produced;

    return retval;
}

step_result
zsafe::step(compress_zengine & e, in_view & in, out_view & out, directive d)
{
    if (out.remaining() == 0)
        throw short_buffer("zsafe::step(compress): output range has no remaining capacity");

    ZSTD_inBuffer zin = { in.buf(), in.capacity(), in.pos() };
    ZSTD_outBuffer zout = { out.buf(), out.capacity(), out.pos() };

    e.started_flag_ = true;

    size_t rc = ::ZSTD_compressStream2(e.native_.get(), &zout, &zin, native_directive(d));

    if (is_error(rc))
        raise(rc, tostr("zsafe::step(compress): ZSTD_compressStream2 [", d, "]"));

    return apply(e, in, out, zin.pos, zout.pos, rc);
}

step_result
zsafe::step(decompress_zengine & e, in_view & in, out_view & out, directive d)
{
    if (d != directive::e_continue)
        throw invalid_parameter(tostr("zsafe::step(decompress): directive [", d, "] applies only to compression"));

    if (out.remaining() == 0)
        throw short_buffer("zsafe::step(decompress): output range has no remaining capacity");

    ZSTD_inBuffer zin = { in.buf(), in.capacity(), in.pos() };
    ZSTD_outBuffer zout = { out.buf(), out.capacity(), out.pos() };

    e.started_flag_ = true;

    size_t rc = ::ZSTD_decompressStream(e.native_.get(), &zout, &zin);

    if (is_error(rc))
        raise(rc, "zsafe::step(decompress): ZSTD_decompressStream");

    return apply(e, in, out, zin.pos, zout.pos, rc);
}

step_result
zsafe::step(compress_zengine & e, directive d)
{
    return step(e, e.in_, e.out_, d);
}

step_result
zsafe::step(decompress_zengine & e, directive d)
{
    return step(e, e.in_, e.out_, d);
}
