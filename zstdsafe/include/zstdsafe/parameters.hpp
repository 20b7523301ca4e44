/** @file parameters.hpp **/

#pragma once

#include "engine_caps.hpp"
#include "dictionary.hpp"
#include <optional>
#include <memory>
#include <cstdint>
#include <iosfwd>

/**
   @class compress_parameters zstdsafe/parameters.hpp

   @brief Validated parameter set for a compression engine.

   Each setter validates against the engine capabilities captured at construction,
   so an invalid value is rejected before any engine sees it.

   Once given to a @c compress_zengine the engine keeps its own copy;
   later changes to this object do not affect that engine
   (use @c compress_zengine::rebuild to apply different parameters).

   Example
   @code
     compress_parameters p;
     p.set_level(19).set_checksum(true);

     compress_zengine zs(p);
   @endcode
 **/
class compress_parameters {
public:
    using size_type = std::uint64_t;

public:
    /** @brief default parameters;  queries engine capabilities **/
    compress_parameters();
    /** @brief default parameters,  using capabilities already obtained from @c engine_caps::query() **/
    explicit compress_parameters(engine_caps const & caps);

    ///@{

    /** @name getters **/

    engine_caps const & caps() const { return caps_; }
    int level() const { return level_; }
    /** @brief log2 of window size;  0 to let the engine choose from level and input size **/
    int window_log() const { return window_log_; }
    bool checksum() const { return checksum_; }
    int workers() const { return workers_; }
    /** @brief if set, uncompressed size promised for the next frame (recorded in frame header) **/
    std::optional<size_type> const & pledged_src_size() const { return pledged_src_size_; }
    /** @brief true to write content size in frame header when known **/
    bool content_size_flag() const { return content_size_flag_; }
    /** @brief dictionary copied into engine state (may be empty) **/
    dictionary const & dict() const { return dict_; }
    /** @brief prepared dictionary borrowed by engine (may be null) **/
    std::shared_ptr<encoder_dictionary const> const & dict_ref() const { return dict_ref_; }

    ///@}

    ///@{

    /** @name setters;  each validates its argument **/

    /** @throw invalid_parameter unless @c caps().min_level() <= @p x <= @c caps().max_level() **/
    compress_parameters & set_level(int x);
    /** @throw invalid_parameter unless @p x is 0 or within @c caps() window-log bounds **/
    compress_parameters & set_window_log(int x);
    compress_parameters & set_checksum(bool x);
    /** @throw invalid_parameter if @p x negative or above @c caps().max_workers()
        @throw unsupported_feature if @p x > 0 and library lacks multithreading
     **/
    compress_parameters & set_workers(int x);
    compress_parameters & set_pledged_src_size(std::optional<size_type> x);
    compress_parameters & set_content_size_flag(bool x);
    /** @brief use copy of @p x;  clears any prepared dictionary **/
    compress_parameters & set_dictionary(dictionary const & x);
    /** @brief borrow prepared dictionary @p x;  clears any copied dictionary.
        @throw invalid_parameter if @p x is null
     **/
    compress_parameters & set_dictionary(std::shared_ptr<encoder_dictionary const> x);

    ///@}

    void display(std::ostream & os) const;

private:
    engine_caps caps_;

    int level_ = 0;
    int window_log_ = 0;
    bool checksum_ = false;
    int workers_ = 0;
    std::optional<size_type> pledged_src_size_;
    bool content_size_flag_ = true;

    dictionary dict_;
    std::shared_ptr<encoder_dictionary const> dict_ref_;
};

/**
   @class decompress_parameters zstdsafe/parameters.hpp

   @brief Validated parameter set for a decompression engine.
 **/
class decompress_parameters {
public:
    decompress_parameters();
    explicit decompress_parameters(engine_caps const & caps);

    engine_caps const & caps() const { return caps_; }
    /** @brief refuse frames needing a window above 2^window_log_max;  0 for engine default **/
    int window_log_max() const { return window_log_max_; }
    dictionary const & dict() const { return dict_; }
    std::shared_ptr<decoder_dictionary const> const & dict_ref() const { return dict_ref_; }

    /** @throw invalid_parameter unless @p x is 0 or within @c caps() window-log-max bounds **/
    decompress_parameters & set_window_log_max(int x);
    decompress_parameters & set_dictionary(dictionary const & x);
    decompress_parameters & set_dictionary(std::shared_ptr<decoder_dictionary const> x);

    void display(std::ostream & os) const;

private:
    engine_caps caps_;

    int window_log_max_ = 0;
    dictionary dict_;
    std::shared_ptr<decoder_dictionary const> dict_ref_;
};

inline std::ostream &
operator<< (std::ostream & os, compress_parameters const & x) {
    x.display(os);
    return os;
}

inline std::ostream &
operator<< (std::ostream & os, decompress_parameters const & x) {
    x.display(os);
    return os;
}
