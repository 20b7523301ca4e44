/** @file zstdstreambuf.hpp **/

#pragma once

#include "zstd_writer.hpp"
#include "zstd_reader.hpp"
#include "zstdsafe/buffer.hpp"
#include "zstdsafe/tostr.hpp"
#include "zstdsafe/hex.hpp"

#include <iostream>
#include <fstream>
#include <string>
#include <memory>
#include <cstring>

/**
   @class basic_zstdstreambuf zstdstream/zstdstreambuf.hpp

   @brief Implementation of @c std::basic_streambuf that provides automatic streaming compression/decompression to zstd format

   Output goes through a @ref zstd_writer,  input comes from a @ref zstd_reader;
   both attached to a streambuf for compressed data (@ref native_sbuf).

   Example - allocating buffer space from constructor.
   @code
     zstdstreambuf zbuf;

     std::unique_ptr<std::filebuf> p(new std::filebuf());
     if (p->open("path/to/file.zst", std::ios::in | std::ios::binary))
         zbuf.adopt_native_sbuf(std::move(p));
   @endcode

   Example - allocating buffer space after constructor returns.
   @code
     zstdstreambuf zbuf(0);

     zbuf.alloc(64UL*1024UL);
     zbuf.open("path/to/file.zst", std::ios::out);
   @endcode

   @note Only uses calling thread;  not threadsafe.

   @tparam CharT.  Typename for (uncompressed) characters.  Compressed stream always comprises @c uint8_t's
   @tparam Traits.  Typename for streambuf traits object.  Typically this will be @c std::char_traits<CharT>.
**/
template <typename CharT, typename Traits = std::char_traits<CharT>>
class basic_zstdstreambuf : public std::basic_streambuf<CharT, Traits> {
public:
    ///@{

    /** @brief type for buffer sizes **/
    using size_type = std::uint64_t;
    /** @brief type for character (the same as template parameter @c CharT) **/
    using char_type = typename Traits::char_type;
    /** @brief integral type large enough to hold a @c CharT **/
    using int_type = typename Traits::int_type;
    /** @brief integral type to represent a stream offset **/
    using off_type = typename Traits::off_type;
    /** @brief integral type to represent a stream position **/
    using pos_type = typename Traits::pos_type;

    ///@}

    /** @brief default buffer size for compression/decompression **/
    static constexpr size_type c_default_buf_z = zstd_writer::c_default_buf_z;

public:
    /**
     * @brief Creates new zstdstreambuf.
     *
     * @param buf_z   Buffer size.  Actual buffer memory consumption is a small multiple of this value,
     *        to account for:
     *             - uncompressed get area
     *             - uncompressed put area
     *             - compressed input held by @ref zstd_reader
     *             - pending input + compressed output held by @ref zstd_writer
     *        Can use 0 to defer buffer allocation
     * @param native_sbuf  @c streambuf for doing compressed i/o.
     *         If this is a filebuf,  it must be in an open state
     * @param mode    Openmode bitmask.  combination of @c std::ios::in, @c std::ios::out, @c std::ios::binary.
     *       Other openmode bits are ignored
     * @param cparams  parameters for compression (used if @p mode sets @c ios::out)
     * @param dparams  parameters for decompression (used if @p mode sets @c ios::in)
     **/
    basic_zstdstreambuf(size_type buf_z = c_default_buf_z,
                        std::unique_ptr<std::streambuf> native_sbuf = std::unique_ptr<std::streambuf>(),
                        std::ios::openmode mode = std::ios::in,
                        compress_parameters const & cparams = compress_parameters(),
                        decompress_parameters const & dparams = decompress_parameters())
        : openmode_{mode},
          cparams_{cparams},
          dparams_{dparams}
    {
        this->alloc(buf_z);
        this->adopt_native_sbuf(std::move(native_sbuf));
    }
    /** @brief Destructor.  Recovers resources,  closing stream if necessary. **/
    ~basic_zstdstreambuf() {
        try {
            this->close();
        } catch (std::exception & ex) {
            /* destructor cannot propagate */
            std::cerr << "basic_zstdstreambuf::~basic_zstdstreambuf: close failed: " << ex.what() << std::endl;
        }
    }

    ///@{

    /** @name Access methods **/

    /** @brief report openmode value recorded the last time this streambuf was opened **/
    std::ios::openmode openmode() const { return openmode_; }
    /** @brief @c true iff this zstdstreambuf is in an open state (available for i/o) **/
    bool is_open() const { return !closed_flag_; }
    /** @brief @c true iff this zstdstreambuf is in a closed state (not available for i/o) **/
    bool is_closed() const { return closed_flag_; }
    /** @brief @c true iff this zstdstreambuf was last opened with @c ios::binary set **/
    bool is_binary() const { return (this->openmode_ & std::ios::binary); }

    compress_parameters const & compress_params() const { return cparams_; }
    decompress_parameters const & decompress_params() const { return dparams_; }

    /** @brief number of bytes compressed input consumed since this stream last opened **/
    std::uint64_t n_z_in_total() const { return reader_ ? reader_->n_in_total() : 0; }
    /** @brief number of bytes of decompressed input produced since this stream last opened **/
    std::uint64_t n_uc_in_total() const { return reader_ ? reader_->n_out_total() : 0; }

    /** @brief number of bytes of uncompressed output consumed by compressor since this stream last opened **/
    std::uint64_t n_uc_out_total() const { return writer_ ? writer_->n_in_total() : 0; }
    /** @brief number of bytes of compressed output produced since this stream last opened **/
    std::uint64_t n_z_out_total() const { return writer_ ? writer_->n_out_total() : 0; }

    /** @brief streambuf responsible for compressed version of this streambuf **/
    std::streambuf * native_sbuf() const { return native_sbuf_.get(); }

    ///@}

    /** @brief parameters for compression;  take effect at next @ref open / @ref adopt_native_sbuf **/
    void set_compress_params(compress_parameters const & p) { cparams_ = p; }
    /** @brief parameters for decompression;  take effect at next @ref open / @ref adopt_native_sbuf **/
    void set_decompress_params(decompress_parameters const & p) { dparams_ = p; }

    /** @brief (Re)open streambuf,  connected to a file
     *
     *  If @p mode sets @c std::ios::out:  open @p filename for writing; if file with that name already exists, truncate it;  create new file if necessary.
     *  If @p mode does not set @c std::ios::out:  open file for reading.
     *
     *  @param filename   path to file.
     *  @param mode       @c ios::in, @c ios::out only are supported;  @c ios::binary is assumed, whether or not specified.
     *
     *  @post
     *  @c .is_open() if file was successfully opened;  @c .is_closed() otherwise
     **/
    void open(char const * filename,
              std::ios::openmode mode = std::ios::in)
        {
            /* 1. cleanup any existing state */
            this->close();

            /* 2. establish new state,  preserving buffer memory address ranges */
            this->openmode_ = mode;

            /* reminder: streambuf for compressed data always uses char + ignores CharT */
            std::unique_ptr<std::filebuf> p(new std::filebuf());
            if (p->open(filename, std::ios::binary | mode)) {
                this->adopt_native_sbuf(std::move(p));
            }
        }

    /** @brief Allocate buffer space before first initiating i/o.

        @warning Not intended to be used after beginning compression/decompression work.

        @param buf_z   Buffer size.
     **/
    void alloc(size_type buf_z = c_default_buf_z) {
        buf_z_ = aligned_upper_bound(buf_z);

        in_uc_buf_.alloc(buf_z_, alignment());
        out_uc_buf_.alloc(buf_z_, alignment());

        this->setg_span(in_uc_buf_.contents());
        this->setp_span(out_uc_buf_.avail());
    }

    /** @brief Attach a streambuf for dealing with compressed data.

        Creates a @ref zstd_writer if openmode includes @c ios::out,
        and a @ref zstd_reader if openmode includes @c ios::in.

        If @p x is a @c filebuf,  it must be in an open state,  and it's openmode should include @c ios::binary.

        @param x  streambuf for compressed data, for example @c stringbuf or @c filebuf will work here.

        @post @ref is_open = @c true,  if @p x is non-null
        @post @ref native_sbuf = address supplied with @p x
     */
    void adopt_native_sbuf(std::unique_ptr<std::streambuf> x)
        {
            native_sbuf_ = std::move(x);

            reader_.reset();
            writer_.reset();

            if (native_sbuf_) {
                if (buf_z_ == 0)
                    this->alloc(c_default_buf_z);

                if (openmode_ & std::ios::out)
                    writer_.reset(new zstd_writer(native_sbuf_.get(), cparams_, buf_z_));
                if (openmode_ & std::ios::in)
                    reader_.reset(new zstd_reader(native_sbuf_.get(), dparams_, buf_z_));

                final_sync_flag_ = false;
                closed_flag_ = false;
            } else {
                closed_flag_ = true;
            }
        }

    /** @brief Complete compressed frame;  promise not to write again

        Given that there will be no more uncompressed output,
        commit remaining compressed portion (including frame epilogue) to output stream.

        Exposed so that application code can observe final byte counters
        (@ref n_uc_out_total @ref n_z_out_total)
        before @ref close resets them
    **/
    void final_sync()
        {
            if (!final_sync_flag_ && !closed_flag_)
                this->sync_impl(true /*final_flag*/);
        }

    /** @brief Make all output so far decodable by a reader of @ref native_sbuf.

        Stronger than @c sync():  forces @c directive::e_flush,  at some cost in compression ratio.
     **/
    void flush_frame()
        {
            this->sync_impl(false /*!final_flag*/);

            if (writer_)
                writer_->flush();
        }

    /** @brief flush remaining ouput and put stream in a closed state.

        Resources are released even if completing the frame throws.
        Stream can be reopened using @ref open
     **/
    void close() {
        if (this->closed_flag_)
            return;

        try {
            this->final_sync();
        } catch (std::exception &) {
            this->release();
            throw;
        }

        this->release();
    }

    /** @brief swap state with another basic_zstdstreambuf **/
    void swap(basic_zstdstreambuf & x) {
        /* swap any base-class state */
        std::basic_streambuf<CharT, Traits>::swap(x);

        std::swap(openmode_, x.openmode_);
        std::swap(final_sync_flag_, x.final_sync_flag_);
        std::swap(closed_flag_, x.closed_flag_);

        std::swap(in_uc_pos_, x.in_uc_pos_);
        std::swap(out_uc_pos_, x.out_uc_pos_);

        std::swap(buf_z_, x.buf_z_);
        std::swap(cparams_, x.cparams_);
        std::swap(dparams_, x.dparams_);

        ::swap(in_uc_buf_, x.in_uc_buf_);
        ::swap(out_uc_buf_, x.out_uc_buf_);

        std::swap(reader_, x.reader_);
        std::swap(writer_, x.writer_);
        std::swap(native_sbuf_, x.native_sbuf_);

#      ifndef NDEBUG
        std::swap(debug_flag_, x.debug_flag_);
#      endif
    }

#  ifndef NDEBUG
    /** @brief in a debug build, control logging for this instance
        @param x  @c true to enable, @c false to disable
     **/
    void set_debug_flag(bool x) { debug_flag_ = x; }
#  endif

protected:
    /**
       @brief Ensure at least one character available for reading in input area.

       May update input pointers (@c gptr @c egptr @c eback) to define input data location

       @retval next input character (target of get-pointer)
    **/
    virtual int_type underflow() override final {
#      ifndef NDEBUG
        if (debug_flag_)
            std::cerr << "zstdstreambuf::underflow: enter" << std::endl;
#      endif

        if ((openmode_ & std::ios::in) == 0)
            throw std::runtime_error("basic_zstdstreambuf::underflow: expected ios::in bit set when reading from streambuf");

        if (this->gptr() < this->egptr()) {
            /* short-circuit unnecessary .underflow(),  so we don't trash state */
            return Traits::to_int_type(*this->gptr());
        }

        if (!reader_)
            throw std::runtime_error("basic_zstdstreambuf::underflow: attempt to read from closed stream");

        /* read position associated with start of buffer needs to include
         * buffer extent that we're about to replace
         */
        in_uc_pos_ += (this->egptr() - this->eback());

        /* previous content already consumed (otherwise not in underflow state) */
        in_uc_buf_.consume(in_uc_buf_.contents());

        /* fill with a whole number of CharT;  reader may deliver fewer bytes than requested */
        for (;;) {
            span<std::uint8_t> ucspan = in_uc_buf_.avail();

            size_type n = reader_->read(ucspan.lo(), ucspan.size());

            in_uc_buf_.produce(ucspan.prefix(n));

#          ifndef NDEBUG
            if (debug_flag_)
                std::cerr << "zstdstreambuf::underflow: read " << n << " uncompressed bytes (allowing space for "
                          << ucspan.size() << ")" << std::endl;
#          endif

            if ((n == 0) || (in_uc_buf_.contents().size() % sizeof(CharT) == 0))
                break;
        }

        span<std::uint8_t> ucspan = in_uc_buf_.contents();

        if (ucspan.size() % sizeof(CharT) != 0)
            throw truncated_frame(tostr("basic_zstdstreambuf::underflow: stream ends with partial character (",
                                        ucspan.size() % sizeof(CharT), " trailing bytes)"));

        this->setg_span(ucspan);

        if (ucspan.size())
            return Traits::to_int_type(*this->gptr());
        else
            return Traits::eof();
    }

    /** @brief Give buffered contents of output to @ref zstd_writer

        @warning After sync returns may still have un-emitted output held privately by the compressor.
        Prematurely forcing such output will degrade compression quality;
        use @ref flush_frame for that.

        @return @c 0 on success, @c -1 on failure (@c iostream will set @c failbit on failure).
     **/
    virtual int
    sync() override final {
#      ifndef NDEBUG
        if (debug_flag_)
            std::cerr << "zstdstreambuf::sync: enter" << std::endl;
#      endif

        return this->sync_impl(false /*!final_flag*/);
    }

    /** @brief attempt to write n bytes starting at s[] to this streambuf.

        @param s      write output starting from this address
        @param n_arg  number of characters to write
        @return       number of characters actually written
    **/
    virtual std::streamsize
    xsputn(CharT const * s, std::streamsize n_arg) override final {
#      ifndef NDEBUG
        if (debug_flag_) {
            std::cerr << "zstdstreambuf::xsputn: enter" << std::endl;
            std::cerr << hex_view(reinterpret_cast<std::uint8_t const *>(s),
                                  reinterpret_cast<std::uint8_t const *>(s + n_arg), true) << std::endl;
        }
#      endif

        this->require_writable("xsputn");

        std::streamsize n_remaining = n_arg;

        while (n_remaining > 0) {
            std::streamsize buf_avail = this->epptr() - this->pptr();

            if (buf_avail == 0) {
                /* compress some more output + free up buffer space */
                this->sync_impl(false);
            } else {
                std::streamsize n_copy = std::min(n_remaining, buf_avail);

                ::memcpy(this->pptr(), s, n_copy * sizeof(CharT));
                this->pbump(n_copy);

                this->out_uc_pos_ += n_copy;

                s += n_copy;
                n_remaining -= n_copy;
            }
        }

        return n_arg;
    }

    /** @brief put area is full;  make room,  then store @p new_ch (unless eof) **/
    virtual int_type
    overflow(int_type new_ch) override final
        {
            this->require_writable("overflow");

            this->sync_impl(false);

            if (!Traits::eq_int_type(new_ch, Traits::eof())) {
                *(this->pptr()) = Traits::to_char_type(new_ch);
                this->pbump(1);
                this->out_uc_pos_ += 1;

                return new_ch;
            }

            return Traits::not_eof(new_ch);
        }

    /** @brief Report input or output position

        @note
        Minimal implementation, necessary to support @c zstdstream methods @c tellg() and @c tellp().
        - @c tellg(): @c seekoff(0,ios_base::cur,ios::in)
        - @c tellp(): @c seekoff(0,ios_base::cur,ios::out)

        @retval desired position;  -1 for unsupported argument combinations
    **/
    virtual pos_type seekoff(off_type offset,
                             std::ios_base::seekdir way,
                             std::ios_base::openmode which) override final
        {
            /* repositioning would mean re-running the compressor;  only report position */
            if ((offset == 0)
                && (way == std::ios_base::cur))
            {
                if ((which & std::ios_base::out) == std::ios_base::out) {
                    return this->out_uc_pos_;
                } else {
                    return this->in_uc_pos_ + (this->gptr() - this->eback());
                }
            }

            return pos_type(off_type(-1));
        }

private:
    void require_writable(char const * op) const {
        if (final_sync_flag_)
            throw closed_error(tostr("basic_zstdstreambuf::", op, ": attempted write after final sync"));

        if (closed_flag_ || !writer_)
            throw closed_error(tostr("basic_zstdstreambuf::", op, ": attempted write to closed stream"));

        if ((openmode_ & std::ios::out) == 0)
            throw std::runtime_error(tostr("basic_zstdstreambuf::", op, ": expected ios::out bit set when writing to streambuf"));
    }

    /** @brief Give put area contents to @ref writer_

        No effect if openmode does not set @c ios::out

        @param final_flag
        if @c true: uncompressed stream is complete; finish frame and prevent further output
        if @c false: compress put area;  compressor may retain some state,  to be emitted with later output

        @return @c 0 on success, @c -1 on failure.
    **/
    int
    sync_impl(bool final_flag) {
#      ifndef NDEBUG
        if (debug_flag_)
            std::cerr << "zstdstreambuf::sync_impl: enter: :final_flag " << final_flag << std::endl;
#      endif

        if (final_sync_flag_) {
            /* implied duplicate call to .sync_impl(true) */
            return -1;
        }

        if (closed_flag_) {
            /* implies attempt to write more output after call to .close() */
            return -1;
        }

        if (final_flag)
            this->final_sync_flag_ = true;

        if (!writer_) {
            /* nothing to do if not using stream for output */
            return 0;
        }

        /* note: converting from CharT* -> uint8_t* ok here;
         * compressor imposes no alignment requirements
         */
        std::uint8_t const * lo = reinterpret_cast<std::uint8_t const *>(this->pbase());
        std::uint8_t const * hi = reinterpret_cast<std::uint8_t const *>(this->pptr());

        if (hi > lo)
            writer_->write(lo, hi - lo);

        if (final_flag)
            writer_->finish();

        /* everything in put area was given to writer;  can recycle it */
        this->setp_span(out_uc_buf_.avail());

        return 0;
    }

    /** @brief drop reader, writer and native streambuf;  reset positions **/
    void release() {
        this->closed_flag_ = true;

        this->in_uc_pos_ = 0;
        this->out_uc_pos_ = 0;

        /* writer + reader refer to .native_sbuf;  drop them first */
        this->writer_.reset();
        this->reader_.reset();

        in_uc_buf_.clear2empty(false /*zero_buffer_flag*/);
        out_uc_buf_.clear2empty(false /*zero_buffer_flag*/);

        /* .native_sbuf may need to flush (e.g. if it's actually a filebuf).
         * The only way to invoke that behavior through the basic_streambuf api
         * is to invoke destructor,  so that's what we do here
         */
        this->native_sbuf_.reset();

        /* also for consistency,  clear builtin streambuf pointers:
         * 1. no input (.setg_span())
         * 2. entire buffer available for output (.setp_span())
         */
        this->setg_span(this->in_uc_buf_.contents());
        this->setp_span(this->out_uc_buf_.avail());
    }

    /** @brief set @c streambuf input positions to span endpoints
        @param ucspan  span comprising entirety of available-and-uncompressed input to be read.
     **/
    void setg_span(span<std::uint8_t> const & ucspan) {
        this->setg(reinterpret_cast<CharT *>(ucspan.lo()),
                   reinterpret_cast<CharT *>(ucspan.lo()),
                   reinterpret_cast<CharT *>(ucspan.hi()));
    }

    /** @brief set @c streambuf output positions to span endpoints
        @param ucspan  span comprising entirety of available-and-not-compressed output to be written
    **/
    void setp_span(span<std::uint8_t> const & ucspan) {
        this->setp(reinterpret_cast<CharT *>(ucspan.lo()),
                   reinterpret_cast<CharT *>(ucspan.hi()));
    }

    /** @brief alignment to be used for a stream of @p CharT

        This is @c sizeof(CharT).
        @c alignof(CharT)>sizeof(CharT) would not work since implementation assumes packed buffer arithmetic
     **/
    static constexpr size_type alignment() {
        return sizeof(CharT);
    }

    /** @brief round up size @p z to a whole multiple of CharT size.

        For example if @c sizeof(CharT)=4, and @c z=5,  @c aligned_upper_bound(z) = @c 8
     **/
    static size_type aligned_upper_bound(size_type z) {
        constexpr size_type m = alignment();

        size_type extra = z % m;

        if (extra == 0)
            return z;
        else
            return z + (m - extra);
    }

private:
    /* Input:
     *                   .sgetn()            .read()
     *    .native_sbuf -----------> .reader_ ---------> .in_uc_buf -> .gptr, .egptr
     *
     * Output:
     *                                       .sync();
     *                   .write()            .sputn
     *   .pbeg, .pend ------------> .writer_ -------> .native_sbuf
     *
     * reminder:
     * 1. .eback() <= .gptr() <= .egptr()
     * 2. input buffer pointers .eback() .gptr() .egptr() are owned by basic_streambuf,
     *    and these methods are non-virtual.
     * 3. it's required that [.eback .. .egptr] represent contiguous memory
     */

    /** @brief openmode for compressed stream

        zstdstreambuf needs to know if intending to use this zstdstreambuf for output:
        compressing an empty input sequence produces non-empty output (a frame with no content).
        Therefore zstdstream("foo.zst",ios::out) should create valid @c foo.zst representing an empty sequence.
    **/
    std::ios::openmode openmode_;

    /** @brief @c true iff @ref final_sync has been called on this streambuf **/
    bool final_sync_flag_ = false;
    /** @brief @c true iff streambuf is in a closed state. **/
    bool closed_flag_ = true;

    /** @brief input position relative to beginning of stream,  after last call to @ref underflow

        @note EXCLUDES range [@c eback .. @c gptr],  since @c gptr updates non-virtually between calls
        to @ref underflow.
    **/
    pos_type in_uc_pos_ = 0;

    /** @brief output position relative to beginning of stream.  Updates on every call to @ref xsputn. **/
    pos_type out_uc_pos_ = 0;

    /** @brief size of each buffer **/
    size_type buf_z_ = 0;

    /** @brief parameters for next writer **/
    compress_parameters cparams_;
    /** @brief parameters for next reader **/
    decompress_parameters dparams_;

    /** @brief get area **/
    buffer<std::uint8_t> in_uc_buf_;
    /** @brief put area **/
    buffer<std::uint8_t> out_uc_buf_;

    /** @brief decompresses input from @ref native_sbuf_ **/
    std::unique_ptr<zstd_reader> reader_;
    /** @brief compresses output to @ref native_sbuf_ **/
    std::unique_ptr<zstd_writer> writer_;

    /** @brief i/o for compressed data **/
    std::unique_ptr<std::streambuf> native_sbuf_;

#  ifndef NDEBUG
    /** @brief in debug build, remembers whether logging enabled for this instance **/
    bool debug_flag_ = false;
#  endif
}; /*basic_zstdstreambuf*/

/** @brief typealias for basic_zstdstreambuf<char> **/
using zstdstreambuf = basic_zstdstreambuf<char>;

/** @brief provide overload for @c swap(), so that @ref basic_zstdstreambuf is swappable **/
template <typename CharT, typename Traits>
void swap(basic_zstdstreambuf<CharT, Traits> & lhs,
          basic_zstdstreambuf<CharT, Traits> & rhs)
{
    lhs.swap(rhs);
}
