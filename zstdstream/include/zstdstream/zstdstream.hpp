/** @file zstdstream.hpp **/

#pragma once

#include "zstdstreambuf.hpp"
#include <iostream>
#include <fstream>
#include <string>
#include <cstring>

/* note: need to allow out-of-memory-order initialization of basic_zstdstream
 * 1. basic_zstdstream::rdbuf needs to be constructed (so its in valid, nominal state)
 *    before passing it to (parent) basic_iostream ctor.
 * 2. This is out-of-memory order,  since memory for parent basic_iostream
 *    precedes memory for basic_zstdstream members,
 *
 */
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wreorder"

/**
   @class basic_zstdstream zstdstream/zstdstream.hpp

   @brief iostream implementation with automatic zstd compression/decompression

   @tparam CharT character type for stream elements
   @tparam Traits character traits;  typically @c std::char_traits<CharT>

   Example 1 - create a @c .zst file
   @code
   zstdstream zs(0, "path/to/foo.zst", ios::out);

   zs << "Some text to be compressed" << endl;
   zs.close();
   @endcode

   Example 2 - read from a @c .zst file
   @code
   zstdstream zs("path/to/foo.zst", ios::in);

   while (!zs.eof()) {
       string x;
       zs >> x;

       cout << "input: [" << x << "]" << endl;
   }
   @endcode

   Example 3 - compress into memory,  with explicit parameters
   @code
   std::unique_ptr<std::stringbuf> sbuf(new std::stringbuf());

   zstdstream zs(zstdstream::c_default_buffer_size, std::move(sbuf), ios::out,
                 compress_parameters().set_level(19).set_checksum(true));
   @endcode
 **/
template <typename CharT, typename Traits = std::char_traits<CharT>>
class basic_zstdstream : public std::basic_iostream<CharT, Traits> {
public:
    /** @brief imported from @p Traits **/
    ///@{

    using char_type = CharT; // = Traits::char_type
    using traits_type = Traits;
    using int_type = typename Traits::int_type;
    using pos_type = typename Traits::pos_type;
    using off_type = typename Traits::off_type;
    using zstdstreambuf_type = basic_zstdstreambuf<CharT, Traits>;

    ///@}

    /** @brief Default buffer size.  Buffers are used to hold both compressed and uncompressed data. **/
    static constexpr std::streamsize c_default_buffer_size = zstdstreambuf_type::c_default_buf_z;

public:
    ///@{

    /**
       @brief Create zstdstream in closed state.

       Before using stream for i/o,  application code must either
       - attach a streambuf for compressed i/o (call @c rdbuf() method @c adopt_native_sbuf(sbuf))
       - call @ref open
    **/
    basic_zstdstream(std::streamsize buf_z = c_default_buffer_size,
                     std::ios::openmode mode = std::ios::in)
        : rdbuf_(buf_z,
                 nullptr /*native_sbuf*/,
                 mode),
          std::basic_iostream<CharT, Traits>(&rdbuf_)
        {
            /* closed state = empty stream -> eof */
            this->setstate(std::ios_base::eofbit);
        }

    /**
       @brief Create zstdstream using supplied streambuf for compressed data

       @param buf_z  buffer size.
       @param native_sbuf  streambuf for compressed data.
       @param mode  combination of @c ios::in, @c ios::out, @c ios::binary.  Other @c openmode bits ignored.
       @param cparams  compression parameters (for @c ios::out)
       @param dparams  decompression parameters (for @c ios::in)
    **/
    basic_zstdstream(std::streamsize buf_z,
                     std::unique_ptr<std::streambuf> native_sbuf,
                     std::ios::openmode mode,
                     compress_parameters const & cparams = compress_parameters(),
                     decompress_parameters const & dparams = decompress_parameters())
        : rdbuf_(buf_z,
                 std::move(native_sbuf),
                 mode,
                 cparams,
                 dparams),
          std::basic_iostream<CharT, Traits>(&rdbuf_)
        {}

    /**
       @brief Create zstdstream using supplied streambuf for compressed data, with default buffer size
       @param native_sbuf  streambuf for compressed data.
       @param mode  combination of @c ios::in, @c ios::out, @c ios::binary.  Other @c openmode bits ignored.
    **/
    basic_zstdstream(std::unique_ptr<std::streambuf> native_sbuf,
                     std::ios::openmode mode)
        : basic_zstdstream(c_default_buffer_size,
                           std::move(native_sbuf),
                           mode)
        {}

    /**
       @brief Create zstdstream attached to a (compressed) file
       @param buf_z  buffer size.
       @param filename  Open file with this path to hold compressed data.  File will be in zstd format.
       @param mode  combination of @c ios::in, @c ios::out, @c ios::binary.  Other @c openmode bits ignored.
       @param cparams  compression parameters (for @c ios::out)
     **/
    basic_zstdstream(std::streamsize buf_z,
                     char const * filename,
                     std::ios::openmode mode = std::ios::in,
                     compress_parameters const & cparams = compress_parameters())
        : rdbuf_(buf_z,
                 nullptr /*native_sbuf*/,
                 mode,
                 cparams),
          std::basic_iostream<CharT, Traits>(&rdbuf_)
        {
            if (filename
                && (::strlen(filename) > 0))
            {
                this->rdbuf_.open(filename, mode);

                if (!this->rdbuf_.is_open()) {
                    /* open failed: want failbit set */
                    this->setstate(std::ios_base::failbit);
                }
            } else {
                /* no filename or empty filename:
                 * 1. do not create native sbuf
                 * 2. stream in eof state
                 */
                this->setstate(std::ios_base::eofbit);
            }
        }

    /* convenience ctor;  apply default buffer size */
    basic_zstdstream(char const * filename,
                     std::ios::openmode mode = std::ios::in)
        : basic_zstdstream(c_default_buffer_size, filename, mode) {}

    ///@}

    ~basic_zstdstream() = default;

    ///@{

    /** @name access methods **/

    zstdstreambuf_type * rdbuf() { return &rdbuf_; }
    std::ios::openmode openmode() const { return rdbuf_.openmode(); }
    /** @brief @c true iff this zstdstream is in an open state (available for i/o) **/
    bool is_open() const { return rdbuf_.is_open(); }
    /** @brief @c true iff this zstdstream is in a closed state (not available for i/o) **/
    bool is_closed() const { return rdbuf_.is_closed(); }
    /** @brief @c true iff this zstdstream was last opened with @c ios::binary set **/
    bool is_binary() const { return rdbuf_.is_binary(); }

    ///@}

    /** @brief  Allocate buffer space for compression/decompression.

        May use before reading/writing any data,  after calling ctor with 0 buf_z.
        Does not preserve any existing buffer contents.
    **/
    void alloc(std::streamsize buf_z = c_default_buffer_size) { rdbuf_.alloc(buf_z); }

    /** @brief (Re)open zstdstream,  connected to a .zst file
        @param filename   Connect zstdstream to file with this pathname.
        @param mode       Openmode. If @c ios::out, provide empty file, creating or truncating as need be.

        @post if successful, @c is_open() = @c true
     **/
    void open(char const * filename,
              std::ios::openmode mode = std::ios::in)
        {
            /* clear state bits,  in case we previously used this stream for i/o */
            this->clear();

            this->rdbuf_.open(filename, mode);

            if (!this->rdbuf_.is_open())
                this->setstate(std::ios_base::failbit);
        }

    /** @brief read characters up to (and including) delimiter

        Read up to @c n-1 chars, into memory @c s[0]..s[n-2],  then null-terminate.
        Stop when either:
        - @c s[] is full (contains @c n-1 chars)
        - @p check_delim_flag is true,  and reached character @p delim
        - input is exhausted (sets @c eofbit)

        Unlike @c .get(s,n,delim):
        - @c read_until returns the number of characters read instead of @c *this
        - @c read_until includes @p delim (if encountered) in @p s
        - reading an empty line does not set @c failbit

        @c read_until ignores the @c noskipws flag

        @retval number of chars written to @c s[],  excluding trailing null.

        @param s   write characters to this array.
        @param n   available space in @p s.  Will not write past @c s[n-1]
        @param check_delim_flag  @c true to stop after first occurrence of @p delim
        @param delim  if @p check_delim_flag is @c true stop after first occurrence of @p delim in input
     **/
    std::streamsize read_until(char_type * s,
                               std::streamsize n,
                               bool check_delim_flag,
                               char_type delim)
        {
            using sentry_type = typename std::basic_istream<CharT, Traits>::sentry;

            if (n <= 0)
                return 0;

            sentry_type sentry(*this, true /*noskipws*/);

            std::streamsize nr = 0;

            if (sentry) {
                try {
                    /* go directly to .rdbuf to ignore fmtflags. */
                    while (nr < n-1) {
                        int_type nextc = this->rdbuf_.sbumpc();

                        if (Traits::eq_int_type(nextc, Traits::eof())) {
                            this->setstate(std::ios_base::eofbit);
                            break;
                        }

                        s[nr] = Traits::to_char_type(nextc);
                        ++nr;

                        if (check_delim_flag && Traits::eq(s[nr-1], delim))
                            break;
                    }
                } catch (zstd_error &) {
                    /* decompression failed;  stream is no longer usable */
                    s[nr] = char_type();
                    this->setstate(std::ios::badbit);
                    throw;
                }
            }

            s[nr] = char_type();

            return nr;
        }

    /** @brief read characters up to delimiter and package into a string

        @param check_delim_flag If @c true read until after first occurrence of @p delim.
        Otherwise read until end of input.
        @param delim Stop after first occurrence of this character.  Ignored if @p check_delim_flag is @c false.
        @param block_z  Read in blocks of this size to assemble result.

        @retval string containing characters read
    **/
    std::basic_string<CharT, Traits> read_until(bool check_delim_flag,
                                                char_type delim,
                                                std::uint32_t block_z = 4095)
        {
            if (block_z == 0) {
                /* heuristic:
                 * - approx size of 1 disk page
                 * - less 1 byte (in case string allocs 1 byte extra for null)
                 */
                block_z = 4095;
            }

            std::basic_string<CharT, Traits> retval;
            std::basic_string<CharT, Traits> block(block_z + 1, char_type());

            for (;;) {
                std::streamsize n = this->read_until(block.data(), block_z + 1, check_delim_flag, delim);

                retval.append(block.data(), n);

                if ((n < static_cast<std::streamsize>(block_z))
                    || (check_delim_flag && Traits::eq(block[n-1], delim)))
                {
                    break;
                }
            }

            return retval;
        }

    /** @brief exchange state with @p x **/
    void swap(basic_zstdstream & x) {
        /* swap any base-class state */
        std::basic_iostream<CharT, Traits>::swap(x);
        /* swap streambuf state */
        this->rdbuf_.swap(x.rdbuf_);
    }

    /** @brief complete compressed frame;  promise not to write any more before closing

        Allow application code to read final counter values (e.g. @ref basic_zstdstreambuf::n_z_out_total) before
        @ref close resets them.  Otherwise application code can ignore this method.
     **/
    void final_sync() {
        this->flush();
        this->rdbuf_.final_sync();
    }

    /** @brief make all output written so far decodable by a reader of the compressed stream **/
    void flush_frame() {
        this->rdbuf_.flush_frame();
    }

    /** @brief close stream,  ensuring all buffered compressed data is written

        @post @ref is_closed = @c true
        @post @c eof() = @c true
        @post @c fail() = @c false
     **/
    void close() {
        this->rdbuf_.close();

        /* clear state bits:  in particular need to clear any of {failbit, badbit} */
        this->clear(std::ios::eofbit);
    }

#  ifndef NDEBUG
    /** @brief in debug build, mark streambuf to log some behavior to cerr **/
    void set_debug_flag(bool x) { rdbuf_.set_debug_flag(x); }
#  endif

private:
    /** @brief streambuf implementation;  performs decompression (on input) and compression (on output) **/
    basic_zstdstreambuf<CharT, Traits> rdbuf_;
}; /*basic_zstdstream*/
#pragma GCC diagnostic pop

/** @brief typealias for @c basic_zstdstream<char> **/
using zstdstream = basic_zstdstream<char>;

/** @brief Provide overload of @c swap(), so that @ref basic_zstdstream is swappable **/
template <typename CharT, typename Traits>
void swap(basic_zstdstream<CharT, Traits> & lhs,
          basic_zstdstream<CharT, Traits> & rhs)
{
    lhs.swap(rhs);
}
