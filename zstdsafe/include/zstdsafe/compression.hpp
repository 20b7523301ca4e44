/** @file compression.hpp **/

#pragma once

#include "parameters.hpp"
#include "span.hpp"
#include <vector>
#include <string>
#include <optional>
#include <cstdint>

/** @class compression zstdsafe/compression.hpp

    @brief Using class-as-namespace idiom to scope some global, non-streaming functions.

    More memory-efficient streaming versions in neighboring files
    @see compress_zengine
    @see buffered_compress_zengine
    @see decompress_zengine
    @see buffered_decompress_zengine

    Thanks to:
    - <a href="https://facebook.github.io/zstd/zstd_manual.html">zstd manual</a>
 **/
class compression {
public:
    /** @brief compress contents of og_data_v[] into a single frame,  return compressed data **/
    static std::vector<std::uint8_t> compress(std::vector<std::uint8_t> const & og_data_v,
                                              compress_parameters const & p = compress_parameters());

    /** @brief uncompress contents of z_data_v[],  return uncompressed data.

        Accepts any number of concatenated frames.

        @param z_data_v       compressed input
        @param p              decompression parameters
        @param capacity_hint  initial output allocation.  If 0,  use the size declared in the frame header,
        capped to a small multiple of the input size;  output grows as needed after that.

        @throw truncated_frame   if input ends mid-frame
        @throw allocation_error  if output space cannot be allocated
     **/
    static std::vector<std::uint8_t> decompress(std::vector<std::uint8_t> const & z_data_v,
                                                decompress_parameters const & p = decompress_parameters(),
                                                std::uint64_t capacity_hint = 0);

    /** @brief maximum compressed size of a single frame holding @p og_data_z bytes **/
    static std::uint64_t compress_bound(std::uint64_t og_data_z);

    /** @brief content size declared in header of frame starting at @p z_data

        @return empty if frame does not declare content size
        @throw engine_error  if @p z_data does not begin with a valid frame header
     **/
    static std::optional<std::uint64_t> frame_content_size(cbyte_span const & z_data);

    /** @brief id of dictionary needed to decode frame starting at @p z_data;  0 if none recorded **/
    static unsigned frame_dict_id(cbyte_span const & z_data);

    /** @brief length of the complete frame (regular or skippable) starting at @p z_data

        @return empty if @p z_data ends before the frame does
        @throw engine_error  if @p z_data does not begin with a valid frame
     **/
    static std::optional<std::uint64_t> frame_compressed_size(cbyte_span const & z_data);

    /** @brief true iff @p z_data begins with a skippable-frame magic number **/
    static bool is_skippable_frame(cbyte_span const & z_data);

    /** @brief wrap @p content in a skippable frame with magic number 0x184D2A50 + @p magic_variant.

        Decoders pass over skippable frames;  use them to embed application metadata.

        @throw invalid_parameter  if @p magic_variant > 15,  or content exceeds 4GiB - 1
     **/
    static std::vector<std::uint8_t> skippable_frame(cbyte_span const & content,
                                                     unsigned magic_variant);

    /** @brief extract content of skippable frame starting at @p z_data

        @param z_data               frame bytes;  may extend past the frame
        @param p_magic_variant      if non-null,  receives the frame's magic variant (0..15)

        @throw invalid_parameter  if @p z_data does not begin with a skippable frame
        @throw truncated_frame    if @p z_data ends before the frame does
     **/
    static std::vector<std::uint8_t> read_skippable_frame(cbyte_span const & z_data,
                                                          unsigned * p_magic_variant = nullptr);

    /** @brief compress file with path .in_file,  putting output in .out_file **/
    static void compress_file(std::string const & in_file,
                              std::string const & out_file,
                              compress_parameters const & p = compress_parameters(),
                              bool keep_flag = true,
                              bool verbose_flag = false);

    /** @brief uncompress file with path .in_file,  putting uncompressed output in .out_file **/
    static void decompress_file(std::string const & in_file,
                                std::string const & out_file,
                                decompress_parameters const & p = decompress_parameters(),
                                bool keep_flag = true,
                                bool verbose_flag = false);
};
