/** @file dictionary.hpp **/

#pragma once

#include "span.hpp"
#include <zstd.h>
#include <vector>
#include <string>
#include <memory>
#include <cstdint>

/**
   @class dictionary zstdsafe/dictionary.hpp

   @brief Immutable dictionary bytes.

   Either a trained dictionary (zstd dictionary format, with dictionary id),
   or arbitrary raw content.  Copies of a @c dictionary share storage.

   Engines configured with a @c dictionary copy its bytes into native state
   (see @c compress_zengine::configure),  so a @c dictionary need not outlive them.
   For the zero-copy alternative see @ref encoder_dictionary / @ref decoder_dictionary.

   Example
   @code
     std::vector<std::vector<std::uint8_t>> samples = ...;
     dictionary dict = dictionary::train(samples, 16*1024);

     compress_parameters p;
     p.set_dictionary(dict);
   @endcode
 **/
class dictionary {
public:
    using size_type = std::uint64_t;

    /** @brief default dictionary size limit for training (110k,  same as zstd command line tool) **/
    static constexpr size_type c_default_max_z = 110UL * 1024UL;

public:
    /** @brief empty dictionary;  configuring an engine with it is a no-op **/
    dictionary() = default;
    /** @brief adopt @p bytes as dictionary content **/
    explicit dictionary(std::vector<std::uint8_t> bytes);

    /** @brief dictionary holding a copy of @p bytes **/
    static dictionary copy_of(cbyte_span const & bytes);
    /** @brief dictionary holding the contents of file @p path **/
    static dictionary from_file(std::string const & path);

    /** @brief train a dictionary from a set of samples

        @param samples  sample payloads,  each representative of data to be compressed later
        @param max_z    upper bound on dictionary size
     **/
    static dictionary train(std::vector<std::vector<std::uint8_t>> const & samples,
                            size_type max_z = c_default_max_z);
    /** @brief train a dictionary from samples stored back-to-back in @p data

        @param data         concatenated samples
        @param sample_sizes size of each sample;  must add up to @c data.size()
        @param max_z        upper bound on dictionary size
     **/
    static dictionary train_from_continuous(std::vector<std::uint8_t> const & data,
                                            std::vector<std::size_t> const & sample_sizes,
                                            size_type max_z = c_default_max_z);
    /** @brief train a dictionary using the contents of each file in @p paths as one sample **/
    static dictionary train_from_files(std::vector<std::string> const & paths,
                                       size_type max_z = c_default_max_z);

    bool empty() const { return this->size() == 0; }
    size_type size() const { return bytes_ ? bytes_->size() : 0; }
    std::uint8_t const * data() const { return bytes_ ? bytes_->data() : nullptr; }
    cbyte_span contents() const { return cbyte_span::from_size(this->data(), this->size()); }

    /** @brief dictionary id from zstd dictionary header;  0 for raw-content dictionaries **/
    unsigned dict_id() const;

private:
    std::shared_ptr<std::vector<std::uint8_t> const> bytes_;
};

/**
   @class encoder_dictionary zstdsafe/dictionary.hpp

   @brief Dictionary digested once for compression at a fixed level (holds a @c ZSTD_CDict).

   Engines reference (not copy) an @c encoder_dictionary.
   Configure via @c compress_parameters::set_dictionary(std::shared_ptr<encoder_dictionary const>);
   each engine keeps that @c shared_ptr,  so the dictionary stays alive as long as any engine borrowing it.
 **/
class encoder_dictionary {
public:
    /** @throw invalid_parameter  if @p dict carries a zstd dictionary header but is malformed
        @throw allocation_error   if native allocation fails
     **/
    encoder_dictionary(dictionary const & dict, int level);
    encoder_dictionary(encoder_dictionary const & x) = delete;
    encoder_dictionary & operator= (encoder_dictionary const & x) = delete;

    /** @brief compression level baked into this dictionary **/
    int level() const { return level_; }
    unsigned dict_id() const;

private:
    friend class compress_zengine;

    struct cdict_deleter {
        void operator()(ZSTD_CDict * p) const { (void)::ZSTD_freeCDict(p); }
    };

    ZSTD_CDict const * native() const { return native_.get(); }

private:
    int level_ = 0;
    std::unique_ptr<ZSTD_CDict, cdict_deleter> native_;
};

/**
   @class decoder_dictionary zstdsafe/dictionary.hpp

   @brief Dictionary digested once for decompression (holds a @c ZSTD_DDict).

   Referenced by decompression engines the same way @ref encoder_dictionary is referenced by compression engines.
 **/
class decoder_dictionary {
public:
    /** @throw invalid_parameter  if @p dict carries a zstd dictionary header but is malformed
        @throw allocation_error   if native allocation fails
     **/
    explicit decoder_dictionary(dictionary const & dict);
    decoder_dictionary(decoder_dictionary const & x) = delete;
    decoder_dictionary & operator= (decoder_dictionary const & x) = delete;

    unsigned dict_id() const;

private:
    friend class decompress_zengine;

    struct ddict_deleter {
        void operator()(ZSTD_DDict * p) const { (void)::ZSTD_freeDDict(p); }
    };

    ZSTD_DDict const * native() const { return native_.get(); }

private:
    std::unique_ptr<ZSTD_DDict, ddict_deleter> native_;
};
