// decompress_zengine.cpp

#include "zstdsafe/decompress_zengine.hpp"
#include "zstdsafe/zsafe.hpp"
#include "zstdsafe/zstd_error.hpp"

using namespace std;

decompress_zengine::decompress_zengine(decompress_parameters const & p)
    : base_zengine(engine_kind::decompressor),
      params_{p},
      native_{::ZSTD_createDCtx()}
{
    if (!native_)
        throw allocation_error("decompress_zengine: ZSTD_createDCtx failed");

    this->apply_parameters();
}

decompress_zengine::decompress_zengine(decompress_zengine && x)
    : base_zengine(engine_kind::decompressor),
      params_{x.params_}
{
    this->swap(x);
}

void
decompress_zengine::configure(decompress_parameters const & p)
{
    if (this->is_started())
        throw already_started("decompress_zengine::configure: engine has already started;"
                              " use rebuild() to change parameters");

    params_ = p;

    zsafe::check(::ZSTD_DCtx_reset(native_.get(), ZSTD_reset_session_and_parameters),
                 "decompress_zengine::configure: ZSTD_DCtx_reset");

    this->apply_parameters();
}

void
decompress_zengine::rebuild()
{
    zsafe::check(::ZSTD_DCtx_reset(native_.get(), ZSTD_reset_session_and_parameters),
                 "decompress_zengine::rebuild: ZSTD_DCtx_reset");

    this->clear_session();
    this->apply_parameters();
}

void
decompress_zengine::rebuild(decompress_parameters const & p)
{
    params_ = p;
    this->rebuild();
}

chunk_result
decompress_zengine::decompress_chunk()
{
    uint8_t const * z_pre = in_.cursor();
    uint8_t * uc_pre = out_.cursor();

    step_result r = zsafe::step(*this);

    return chunk_result{ cbyte_span(z_pre, z_pre + r.n_consumed),
                         byte_span(uc_pre, uc_pre + r.n_produced),
                         r.hint };
}

void
decompress_zengine::apply_parameters()
{
    ZSTD_DCtx * dctx = native_.get();

    if (params_.window_log_max() != 0) {
        zsafe::check_parameter(::ZSTD_DCtx_setParameter(dctx, ZSTD_d_windowLogMax, params_.window_log_max()),
                               "decompress_zengine", "window-log-max", params_.window_log_max());
    }

    if (params_.dict_ref()) {
        zsafe::check(::ZSTD_DCtx_refDDict(dctx, params_.dict_ref()->native()),
                     "decompress_zengine: ZSTD_DCtx_refDDict");
    } else if (!params_.dict().empty()) {
        zsafe::check(::ZSTD_DCtx_loadDictionary(dctx, params_.dict().data(), params_.dict().size()),
                     "decompress_zengine: ZSTD_DCtx_loadDictionary");
    }
}
