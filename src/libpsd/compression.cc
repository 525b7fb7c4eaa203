//
// Created by igor on 04/09/2025.
//

#include <psd/compression.hh>
#include <psd/format.hh>
#include <psd/exceptions.hh>

#include "packbits.hh"
#include "predictor.hh"

#include <zlib.h>

#include <cstring>
#include <limits>
#include <utility>

namespace psd {

    namespace {
        // deflate emits at least 2 bits per 258 byte match
        constexpr std::size_t max_deflate_ratio = 1032;
        // a PackBits repeat run expands 2 bytes into 128
        constexpr std::size_t max_packbits_ratio = 64;

        void check_encodable(sample_type type) {
            switch (type) {
                case sample_type::u8:
                case sample_type::u16:
                case sample_type::f32:
                    return;
            }
            THROW_ENCODE("Sample type ", static_cast<int>(type), " not supported");
        }

        // Samples in big-endian byte order
        std::vector<std::byte> to_wire(const plane& p) {
            std::vector<std::byte> out(p.data(), p.data() + p.byte_size());
            const std::size_t width = sample_size(p.type());
            if (width == 1 || is_big_endian) {
                return out;
            }
            for (std::size_t i = 0; i + width <= out.size(); i += width) {
                for (std::size_t k = 0; k < width / 2; k++) {
                    std::swap(out[i + k], out[i + width - 1 - k]);
                }
            }
            return out;
        }

        void from_wire(const std::byte* src, plane& p) {
            std::memcpy(p.data(), src, p.byte_size());
            const std::size_t width = sample_size(p.type());
            if (width == 1 || is_big_endian) {
                return;
            }
            std::byte* data = p.data();
            for (std::size_t i = 0; i + width <= p.byte_size(); i += width) {
                for (std::size_t k = 0; k < width / 2; k++) {
                    std::swap(data[i + k], data[i + width - 1 - k]);
                }
            }
        }

        std::vector<std::byte> deflate_bytes(const std::vector<std::byte>& src) {
            THROW_ENCODE_IF(src.size() > std::numeric_limits<uLong>::max(), "Plane too large for deflate");
            uLongf bound = compressBound(static_cast<uLong>(src.size()));
            std::vector<std::byte> out(bound);
            int rc = compress2(reinterpret_cast<Bytef*>(out.data()), &bound,
                               reinterpret_cast<const Bytef*>(src.data()), static_cast<uLong>(src.size()),
                               Z_DEFAULT_COMPRESSION);
            THROW_ENCODE_IF(rc != Z_OK, "zip compression failed with code ", rc,
                            ": src_size=", src.size());
            out.resize(bound);
            return out;
        }

        std::vector<std::byte> inflate_bytes(const std::byte* src, std::size_t size, std::size_t expected) {
            THROW_DECODE_IF(size > std::numeric_limits<uInt>::max() || expected > std::numeric_limits<uInt>::max(),
                            "zip channel data too large to inflate: src_size=", size, ", dst_size=", expected);
            std::vector<std::byte> out(expected);

            z_stream stream{};
            stream.zalloc = Z_NULL;
            stream.zfree = Z_NULL;
            stream.opaque = Z_NULL;
            stream.avail_in = static_cast<uInt>(size);
            stream.next_in = reinterpret_cast<Bytef*>(const_cast<std::byte*>(src));
            stream.avail_out = static_cast<uInt>(expected);
            stream.next_out = reinterpret_cast<Bytef*>(out.data());

            THROW_DECODE_IF(inflateInit(&stream) != Z_OK,
                            "zip compression inflate init failed with: src_size=", size,
                            ", dst_size=", expected);

            int rc = inflate(&stream, Z_FINISH);
            std::size_t produced = stream.total_out;
            inflateEnd(&stream);

            THROW_DECODE_IF(rc != Z_STREAM_END,
                            "unable to decode zip compressed data: src_size=", size,
                            ", dst_size=", expected, ", code=", rc);
            THROW_DECODE_IF(produced != expected,
                            "zip compressed data decoded to ", produced, " bytes, expected ", expected);
            return out;
        }

        std::uint64_t read_count(const std::byte* p, std::size_t width, byte_order bo) {
            if (width == 2) {
                std::uint16_t v;
                std::memcpy(&v, p, 2);
                return to_byte_order(v, bo);
            }
            std::uint32_t v;
            std::memcpy(&v, p, 4);
            return to_byte_order(v, bo);
        }

        void write_count(std::byte* p, std::size_t value, std::size_t width, byte_order bo) {
            if (width == 2) {
                THROW_ENCODE_IF(value > std::numeric_limits<std::uint16_t>::max(),
                                "RLE scanline of ", value, " bytes does not fit a 2 byte count");
                auto v = to_byte_order(static_cast<std::uint16_t>(value), bo);
                std::memcpy(p, &v, 2);
                return;
            }
            THROW_ENCODE_IF(value > std::numeric_limits<std::uint32_t>::max(),
                            "RLE scanline of ", value, " bytes does not fit a 4 byte count");
            auto v = to_byte_order(static_cast<std::uint32_t>(value), bo);
            std::memcpy(p, &v, 4);
        }

        std::vector<std::byte> rle_encode(const std::vector<std::byte>& wire, std::size_t rows,
                                          std::size_t row_bytes, std::size_t count_width, byte_order bo) {
            std::vector<std::byte> out(rows * count_width);
            for (std::size_t y = 0; y < rows; y++) {
                std::size_t before = out.size();
                packbits_encode(wire.data() + y * row_bytes, row_bytes, out);
                write_count(out.data() + y * count_width, out.size() - before, count_width, bo);
            }
            return out;
        }

        void rle_decode(const std::byte* src, std::size_t size, std::byte* dst, std::size_t rows,
                        std::size_t row_bytes, std::size_t count_width, byte_order bo) {
            THROW_DECODE_IF(rows > size / count_width, "RLE line length table truncated: ", size,
                            " bytes for ", rows, " rows");
            const std::size_t table_size = rows * count_width;

            std::size_t offset = table_size;
            for (std::size_t y = 0; y < rows; y++) {
                std::uint64_t length = read_count(src + y * count_width, count_width, bo);
                THROW_DECODE_IF(length > size - offset, "RLE scanline ", y, " of ", length,
                                " bytes overruns the channel data");
                packbits_decode(src + offset, static_cast<std::size_t>(length), dst + y * row_bytes, row_bytes);
                offset += static_cast<std::size_t>(length);
            }
        }
    }

    bool is_valid_compression(std::uint16_t code) {
        return code <= static_cast<std::uint16_t>(compression::zip_predicted);
    }

    std::ostream& operator<<(std::ostream& os, compression kind) {
        switch (kind) {
            case compression::raw:
                return os << "RAW";
            case compression::rle:
                return os << "RLE";
            case compression::zip:
                return os << "ZIP";
            case compression::zip_predicted:
                return os << "ZIP_PREDICTED";
        }
        return os << "UNKNOWN(" << static_cast<unsigned>(kind) << ")";
    }

    std::vector<std::byte> encode_plane(const plane& p, compression kind,
                                        std::size_t count_width, byte_order count_order) {
        check_encodable(p.type());
        THROW_ENCODE_IF(count_width != 2 && count_width != 4, "Invalid RLE count width ", count_width);
        if (p.empty()) {
            return {};
        }

        auto wire = to_wire(p);
        switch (kind) {
            case compression::raw:
                return wire;
            case compression::zip:
                return deflate_bytes(wire);
            case compression::zip_predicted:
                predictor_encode(wire, p.rows(), p.cols(), p.type());
                return deflate_bytes(wire);
            case compression::rle:
                return rle_encode(wire, p.rows(), p.row_bytes(), count_width, count_order);
        }
        THROW_ENCODE("Unknown compression kind ", static_cast<unsigned>(kind));
    }

    std::vector<std::byte> encode_plane(const plane& p, compression kind, const psd_format& format) {
        return encode_plane(p, kind, format.count_field_width(), format.get_byte_order());
    }

    plane decode_plane(const std::byte* data, std::size_t size, compression kind,
                       std::size_t rows, std::size_t cols, sample_type type,
                       std::size_t count_width, byte_order count_order) {
        THROW_DECODE_UNLESS(is_valid_compression(static_cast<std::uint16_t>(kind)),
                            "Invalid compression kind ", static_cast<unsigned>(kind));
        THROW_DECODE_IF(count_width != 2 && count_width != 4, "Invalid RLE count width ", count_width);

        // shape and payload are checked against each other before anything is allocated
        const std::size_t expected = plane_byte_size(rows, cols, type);
        if (expected == 0) {
            return plane(rows, cols, type);
        }
        THROW_DECODE_IF(!data && size > 0, "Null channel data");

        switch (kind) {
            case compression::raw:
                THROW_DECODE_IF(size < expected, "Raw channel data truncated: ", size,
                                " bytes, expected ", expected);
                break;
            case compression::zip:
            case compression::zip_predicted:
                THROW_DECODE_IF(expected / max_deflate_ratio > size, "zip channel data of ", size,
                                " bytes cannot hold ", expected, " bytes");
                break;
            case compression::rle:
                THROW_DECODE_IF(rows > size / count_width, "RLE line length table truncated: ", size,
                                " bytes for ", rows, " rows");
                THROW_DECODE_IF(expected / max_packbits_ratio > size - rows * count_width,
                                "RLE channel data of ", size, " bytes cannot hold ", expected, " bytes");
                break;
        }

        plane result(rows, cols, type);
        switch (kind) {
            case compression::raw:
                from_wire(data, result);
                break;
            case compression::zip: {
                auto raw = inflate_bytes(data, size, expected);
                from_wire(raw.data(), result);
                break;
            }
            case compression::zip_predicted: {
                auto raw = inflate_bytes(data, size, expected);
                predictor_decode(raw, rows, cols, type);
                from_wire(raw.data(), result);
                break;
            }
            case compression::rle: {
                std::vector<std::byte> raw(expected);
                rle_decode(data, size, raw.data(), rows, result.row_bytes(), count_width, count_order);
                from_wire(raw.data(), result);
                break;
            }
        }
        return result;
    }

    plane decode_plane(const std::vector<std::byte>& data, compression kind,
                       std::size_t rows, std::size_t cols, sample_type type,
                       const psd_format& format) {
        return decode_plane(data.data(), data.size(), kind, rows, cols, type,
                            format.count_field_width(), format.get_byte_order());
    }

} // namespace psd
