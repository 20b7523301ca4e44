/** @file decompress_zengine.hpp **/

#pragma once

#include "base_zengine.hpp"
#include "parameters.hpp"
#include <zstd.h>
#include <memory>

/**
   @class decompress_zengine zstdsafe/decompress_zengine.hpp

   @brief accept zstd frames and decompress (i.e. restore) them.

   Customer is responsible for supplying buffer space for
   compressed and uncompressed data.
   Concatenated frames decode one after another;
   a step with hint 0 marks the end of a frame.

   @see buffered_decompress_zengine for implementation that creates and manages i/o buffers.
**/
class decompress_zengine : public base_zengine {
public:
    /** @brief create decompression engine configured from @p p

        @throw allocation_error  if native context cannot be created
        @throw invalid_parameter if native layer rejects a parameter in @p p
     **/
    explicit decompress_zengine(decompress_parameters const & p = decompress_parameters());
    decompress_zengine(decompress_zengine const & x) = delete;
    decompress_zengine(decompress_zengine && x);
    /** @brief destructor;  calls @c ZSTD_freeDCtx() **/
    virtual ~decompress_zengine() = default;

    decompress_parameters const & parameters() const { return params_; }

    /** @brief replace parameters before first step.
        @throw already_started  if engine has taken a step since construction / rebuild
     **/
    void configure(decompress_parameters const & p);

    /** @brief abandon any partial frame,  restore nominal state with the same parameters **/
    void rebuild();
    void rebuild(decompress_parameters const & p);

    /** @brief decompress some input.

        @return chunk_result with:
        @c .consumed = span for compressed bytes consumed
        @c .produced = span for uncompressed bytes produced
        @c .hint     = 0 iff a frame was just completed (and all its content produced)

        After a step that fills the output range,  caller should provide more output
        and step again (even without new input):  engine may hold more decoded content.

        @pre output space attached by @c provide_output(),  with at least one byte available
     **/
    chunk_result decompress_chunk();

    void swap(decompress_zengine & x) {
        base_zengine::swap(x);
        std::swap(params_, x.params_);
        std::swap(native_, x.native_);
    }

    decompress_zengine & operator= (decompress_zengine && x) {
        this->swap(x);
        return *this;
    }

private:
    friend class zsafe;

    struct dctx_deleter {
        void operator()(ZSTD_DCtx * p) const { (void)::ZSTD_freeDCtx(p); }
    };

    void apply_parameters();

private:
    decompress_parameters params_;
    /** @brief native decompression context **/
    std::unique_ptr<ZSTD_DCtx, dctx_deleter> native_;
};

inline void
swap(decompress_zengine & lhs, decompress_zengine & rhs) noexcept {
    lhs.swap(rhs);
}
