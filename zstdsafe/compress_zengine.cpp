// compress_zengine.cpp

#include "zstdsafe/compress_zengine.hpp"
#include "zstdsafe/zsafe.hpp"
#include "zstdsafe/zstd_error.hpp"
#include "zstdsafe/tostr.hpp"

using namespace std;

compress_zengine::compress_zengine(compress_parameters const & p)
    : base_zengine(engine_kind::compressor),
      params_{p},
      native_{::ZSTD_createCCtx()}
{
    if (!native_)
        throw allocation_error("compress_zengine: ZSTD_createCCtx failed");

    this->apply_parameters();
}

compress_zengine::compress_zengine(compress_zengine && x)
    : base_zengine(engine_kind::compressor),
      params_{x.params_}
{
    this->swap(x);
}

void
compress_zengine::configure(compress_parameters const & p)
{
    if (this->is_started())
        throw already_started("compress_zengine::configure: engine has already started a frame;"
                              " use rebuild() to change parameters");

    params_ = p;

    zsafe::check(::ZSTD_CCtx_reset(native_.get(), ZSTD_reset_session_and_parameters),
                 "compress_zengine::configure: ZSTD_CCtx_reset");

    this->apply_parameters();
}

void
compress_zengine::rebuild()
{
    zsafe::check(::ZSTD_CCtx_reset(native_.get(), ZSTD_reset_session_and_parameters),
                 "compress_zengine::rebuild: ZSTD_CCtx_reset");

    this->clear_session();
    this->apply_parameters();
}

void
compress_zengine::rebuild(compress_parameters const & p)
{
    params_ = p;
    this->rebuild();
}

chunk_result
compress_zengine::compress_chunk(directive d)
{
    /* U = uncompressed data
     * Z = compressed   data
     *
     * input:  UUUUUUUUUUUUUUUUUUUUUUUUUUU       output:  ZZZZZZZZZZZZZ......................
     *         ^        ^                                 ^            ^
     *         uc_pre   uc_post                           z_pre        z_post
     *
     *         < retval   >                               <  retval    >
     *         < .consumed>                               <  .produced >
     */
    uint8_t const * uc_pre = in_.cursor();
    uint8_t * z_pre = out_.cursor();

    step_result r = zsafe::step(*this, d);

    return chunk_result{ cbyte_span(uc_pre, uc_pre + r.n_consumed),
                         byte_span(z_pre, z_pre + r.n_produced),
                         r.hint };
}

void
compress_zengine::apply_parameters()
{
    ZSTD_CCtx * cctx = native_.get();

    zsafe::check_parameter(::ZSTD_CCtx_setParameter(cctx, ZSTD_c_compressionLevel, params_.level()),
                           "compress_zengine", "level", params_.level());

    if (params_.window_log() != 0) {
        zsafe::check_parameter(::ZSTD_CCtx_setParameter(cctx, ZSTD_c_windowLog, params_.window_log()),
                               "compress_zengine", "window-log", params_.window_log());
    }

    zsafe::check_parameter(::ZSTD_CCtx_setParameter(cctx, ZSTD_c_checksumFlag, params_.checksum() ? 1 : 0),
                           "compress_zengine", "checksum", params_.checksum());

    zsafe::check_parameter(::ZSTD_CCtx_setParameter(cctx, ZSTD_c_contentSizeFlag, params_.content_size_flag() ? 1 : 0),
                           "compress_zengine", "content-size-flag", params_.content_size_flag());

    if (params_.workers() > 0) {
        /* only reachable with multithreaded libzstd;  compress_parameters::set_workers() checks */
        zsafe::check_parameter(::ZSTD_CCtx_setParameter(cctx, ZSTD_c_nbWorkers, params_.workers()),
                               "compress_zengine", "workers", params_.workers());
    }

    if (params_.pledged_src_size()) {
        zsafe::check(::ZSTD_CCtx_setPledgedSrcSize(cctx, *params_.pledged_src_size()),
                     "compress_zengine: ZSTD_CCtx_setPledgedSrcSize");
    }

    if (params_.dict_ref()) {
        zsafe::check(::ZSTD_CCtx_refCDict(cctx, params_.dict_ref()->native()),
                     "compress_zengine: ZSTD_CCtx_refCDict");
    } else if (!params_.dict().empty()) {
        zsafe::check(::ZSTD_CCtx_loadDictionary(cctx, params_.dict().data(), params_.dict().size()),
                     "compress_zengine: ZSTD_CCtx_loadDictionary");
    }
}
