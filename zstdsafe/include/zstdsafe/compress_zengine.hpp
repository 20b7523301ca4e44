/** @file compress_zengine.hpp **/

#pragma once

#include "base_zengine.hpp"
#include "parameters.hpp"
#include <zstd.h>
#include <memory>

/**
   @class compress_zengine zstdsafe/compress_zengine.hpp

   @brief accept uncompressed input and compress it into zstd frames.

   Customer is responsible for supplying buffer space for
   compressed and uncompressed data.

   @see buffered_compress_zengine for implementation that creates and manages i/o buffers.

   Example
   @code
   #include "zstdsafe/compress_zengine.hpp"

   buffer<uint8_t> uc_buf(4096);
   buffer<uint8_t> z_buf(4096);

   // store some to-be-compressed data in uc_buf
   uc_buf.produce(...);

   compress_zengine zs(compress_parameters().set_level(3));
   zs.provide_input(uc_buf.contents());
   zs.provide_output(z_buf.avail());

   for (;;) {
       chunk_result r = zs.compress_chunk(directive::e_end);

       z_buf.produce(r.produced);
       // do something with z_buf.contents(),  then
       z_buf.consume(z_buf.contents());
       zs.provide_output(z_buf.avail());

       if (r.hint == 0)
           break;
   }
   @endcode
**/
class compress_zengine : public base_zengine {
public:
    /** @brief create compression engine configured from @p p

        @throw allocation_error  if native context cannot be created
        @throw invalid_parameter if native layer rejects a parameter in @p p
     **/
    explicit compress_zengine(compress_parameters const & p = compress_parameters());
    /** @brief compress_zengine is not copyable **/
    compress_zengine(compress_zengine const & x) = delete;
    compress_zengine(compress_zengine && x);
    /** @brief destructor;  calls @c ZSTD_freeCCtx() **/
    virtual ~compress_zengine() = default;

    /** @brief parameters in effect for this engine **/
    compress_parameters const & parameters() const { return params_; }

    /** @brief replace parameters before first step.

        @throw already_started  if engine has taken a step since construction / rebuild
     **/
    void configure(compress_parameters const & p);

    /** @brief abandon any partial frame,  restore nominal state with the same parameters.

        Calls @c ZSTD_CCtx_reset(), then reapplies parameters.
        Clears started flag and byte counters.
     **/
    void rebuild();
    /** @brief abandon any partial frame,  restore nominal state with new parameters @p p **/
    void rebuild(compress_parameters const & p);

    /** @brief compress some input.

        @param d  @c directive::e_continue while more input will follow;
        @c directive::e_flush to make everything so far decodable by a reader;
        @c directive::e_end to complete the frame.
        Caller must repeat a flush / end step,  with fresh output space,  until hint is 0.

        @return chunk_result with:
        @c .consumed = span for uncompressed bytes consumed
        @c .produced = span for compressed bytes produced
        @c .hint     = 0 when flush / end is complete

        @pre output space attached by @c provide_output(),  with at least one byte available
     **/
    chunk_result compress_chunk(directive d);

    /** @brief swap with another compress_zengine object **/
    void swap(compress_zengine & x) {
        base_zengine::swap(x);
        std::swap(params_, x.params_);
        std::swap(native_, x.native_);
    }

    /** @brief move assignment **/
    compress_zengine & operator= (compress_zengine && x) {
        this->swap(x);
        return *this;
    }

private:
    friend class zsafe;

    struct cctx_deleter {
        void operator()(ZSTD_CCtx * p) const { (void)::ZSTD_freeCCtx(p); }
    };

    /** @brief push @ref params_ into @ref native_ **/
    void apply_parameters();

private:
    /** @brief parameters in effect **/
    compress_parameters params_;
    /** @brief native compression context;  never null,  except in moved-from state **/
    std::unique_ptr<ZSTD_CCtx, cctx_deleter> native_;
};

/** @brief overload for @c swap(), so that @ref compress_zengine is swappable **/
inline void
swap(compress_zengine & lhs, compress_zengine & rhs) noexcept {
    lhs.swap(rhs);
}
