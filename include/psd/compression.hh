/**
 * @file compression.hh
 * @brief Channel compression codec
 * @author Igor
 * @date 04/09/2025
 *
 * Stateless conversion between a raster plane and one of the four on-wire
 * representations of channel image data. Sample bytes on the wire are
 * always big-endian, whatever the byte order of the enclosing block.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <vector>

#include <psd/export_psd.h>
#include <psd/byte_order.hh>
#include <psd/plane.hh>

namespace psd {

    class psd_format;

    /**
     * @enum compression
     * @brief Compression kind code stored ahead of each channel's image data
     */
    enum class compression : std::uint16_t {
        raw = 0,           ///< Uncompressed samples
        rle = 1,           ///< PackBits per scanline with a table of line lengths
        zip = 2,           ///< Deflate of the raw samples
        zip_predicted = 3  ///< Deflate of the raw samples after a horizontal predictor
    };

    /**
     * @brief Check if a stored code names a supported compression kind
     */
    PSD_EXPORT bool is_valid_compression(std::uint16_t code);

    PSD_EXPORT std::ostream& operator<<(std::ostream& os, compression kind);

    /**
     * @brief Compress a plane
     * @param p Plane to encode
     * @param kind Compression kind
     * @param count_width Width of the RLE line length fields (2 or 4)
     * @param count_order Byte order of the RLE line length fields
     * @return Encoded bytes; empty for an empty plane
     * @throws encode_error for unsupported sample types or compression kinds
     */
    PSD_EXPORT std::vector<std::byte> encode_plane(const plane& p, compression kind,
                                                   std::size_t count_width,
                                                   byte_order count_order = byte_order::big);

    /**
     * @brief Compress a plane with the line length layout of a format variant
     */
    PSD_EXPORT std::vector<std::byte> encode_plane(const plane& p, compression kind, const psd_format& format);

    /**
     * @brief Decompress a plane
     * @param data Encoded bytes
     * @param size Number of encoded bytes
     * @param kind Compression kind
     * @param rows Plane height
     * @param cols Plane width
     * @param type Element type
     * @param count_width Width of the RLE line length fields (2 or 4)
     * @param count_order Byte order of the RLE line length fields
     * @return Decoded plane. An empty shape yields an empty plane without consuming data.
     * @throws decode_error for truncated or inconsistent data, or a shape too large for the data
     */
    PSD_EXPORT plane decode_plane(const std::byte* data, std::size_t size, compression kind,
                                  std::size_t rows, std::size_t cols, sample_type type,
                                  std::size_t count_width,
                                  byte_order count_order = byte_order::big);

    PSD_EXPORT plane decode_plane(const std::vector<std::byte>& data, compression kind,
                                  std::size_t rows, std::size_t cols, sample_type type,
                                  const psd_format& format);

} // namespace psd
