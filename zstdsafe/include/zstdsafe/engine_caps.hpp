/** @file engine_caps.hpp **/

#pragma once

#include <string>
#include <iosfwd>

/**
   @class engine_caps zstdsafe/engine_caps.hpp

   @brief Capabilities of the linked @c libzstd build.

   Obtained once by @ref query,  then carried by value on
   @c compress_parameters / @c decompress_parameters,
   so parameter validation never consults process-wide state again.
 **/
class engine_caps {
public:
    /** @brief ask the native library for its supported ranges **/
    static engine_caps query();

    ///@{

    /** @name getters **/

    /** @brief smallest supported compression level (negative levels are "fast" modes) **/
    int min_level() const { return min_level_; }
    /** @brief largest supported compression level **/
    int max_level() const { return max_level_; }
    /** @brief level used when none is requested **/
    int default_level() const { return default_level_; }
    /** @brief smallest explicit compression window log **/
    int min_window_log() const { return min_window_log_; }
    /** @brief largest explicit compression window log **/
    int max_window_log() const { return max_window_log_; }
    /** @brief smallest explicit decompression window-log limit **/
    int min_window_log_max() const { return min_window_log_max_; }
    /** @brief largest explicit decompression window-log limit **/
    int max_window_log_max() const { return max_window_log_max_; }
    /** @brief maximum worker count;  0 if library built without multithreading **/
    int max_workers() const { return max_workers_; }
    /** @brief true iff library built with multithreading support **/
    bool multithread() const { return max_workers_ > 0; }
    /** @brief library version, e.g. 10504 for v1.5.4 **/
    unsigned version_number() const { return version_number_; }
    /** @brief library version, e.g. "1.5.4" **/
    std::string const & version_string() const { return version_string_; }

    ///@}

    /** @brief print human-readable summary on @p os **/
    void display(std::ostream & os) const;

private:
    engine_caps() = default;

private:
    int min_level_ = 0;
    int max_level_ = 0;
    int default_level_ = 0;
    int min_window_log_ = 0;
    int max_window_log_ = 0;
    int min_window_log_max_ = 0;
    int max_window_log_max_ = 0;
    int max_workers_ = 0;
    unsigned version_number_ = 0;
    std::string version_string_;
};

inline std::ostream &
operator<< (std::ostream & os, engine_caps const & x) {
    x.display(os);
    return os;
}
