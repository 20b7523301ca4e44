/** @file zstd_error.hpp **/

#pragma once

#include <stdexcept>
#include <string>
#include <cstdint>
#include <cstddef>
#include <utility>

/**
   @class zstd_error zstdsafe/zstd_error.hpp

   @brief Base class for all errors reported by zstdsafe / zstdstream.

   Carries partial progress:  bytes consumed / produced by the failing operation
   before the error was detected.  Caller can use this to account for output
   already committed to a sink.

   Streaming layers annotate the error via @ref set_progress before rethrowing.
 **/
class zstd_error : public std::runtime_error {
public:
    using size_type = std::uint64_t;

public:
    explicit zstd_error(std::string const & msg) : std::runtime_error(msg) {}

    /** @brief input bytes consumed by the failed operation before the error **/
    size_type n_in() const { return n_in_; }
    /** @brief output bytes produced (and possibly delivered) by the failed operation before the error **/
    size_type n_out() const { return n_out_; }

    void set_progress(size_type n_in, size_type n_out) {
        n_in_ = n_in;
        n_out_ = n_out;
    }

private:
    size_type n_in_ = 0;
    size_type n_out_ = 0;
};

/** @brief native allocator returned null **/
class allocation_error : public zstd_error {
public:
    using zstd_error::zstd_error;
};

/** @brief parameter value rejected,  either by validation or by the native layer **/
class invalid_parameter : public zstd_error {
public:
    using zstd_error::zstd_error;
};

/** @brief request needs an engine feature not present in this libzstd build (e.g. multithreading) **/
class unsupported_feature : public zstd_error {
public:
    using zstd_error::zstd_error;
};

/** @brief attempt to configure an engine after its first step **/
class already_started : public zstd_error {
public:
    using zstd_error::zstd_error;
};

/** @brief operation on a closed (or failed) streaming session **/
class closed_error : public zstd_error {
public:
    using zstd_error::zstd_error;
};

/** @brief source ended before the current frame was complete **/
class truncated_frame : public zstd_error {
public:
    using zstd_error::zstd_error;
};

/** @brief content checksum at end of frame did not match decoded content **/
class checksum_mismatch : public zstd_error {
public:
    using zstd_error::zstd_error;
};

/** @brief output range had zero capacity on entry to a step.  Caller bug. **/
class short_buffer : public zstd_error {
public:
    using zstd_error::zstd_error;
};

/** @brief sink for compressed (or decompressed) bytes refused a write **/
class sink_error : public zstd_error {
public:
    using zstd_error::zstd_error;
};

/**
   @class engine_error zstdsafe/zstd_error.hpp

   @brief failure reported by @c libzstd mid-operation (e.g. corrupt input)
 **/
class engine_error : public zstd_error {
public:
    /**
       @param msg   context for message
       @param code  native result code (as returned by the failing zstd call)
       @param error_code  value of @c ZSTD_getErrorCode(code)
       @param name  value of @c ZSTD_getErrorName(code)
     **/
    engine_error(std::string const & msg,
                 std::size_t code,
                 int error_code,
                 std::string name)
        : zstd_error(msg + ": " + name),
          code_{code},
          error_code_{error_code},
          name_{std::move(name)}
        {}

    /** @brief packed native return value **/
    std::size_t code() const { return code_; }
    /** @brief @c ZSTD_ErrorCode enum value **/
    int error_code() const { return error_code_; }
    /** @brief native description **/
    std::string const & name() const { return name_; }

private:
    std::size_t code_ = 0;
    int error_code_ = 0;
    std::string name_;
};

/** @brief buffer cursor advanced past its capacity.  Programming error,  not an engine condition. **/
class cursor_overflow : public std::logic_error {
public:
    using std::logic_error::logic_error;
};
