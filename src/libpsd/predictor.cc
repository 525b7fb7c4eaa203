//
// Created by igor on 04/09/2025.
//

#include "predictor.hh"

#include <psd/exceptions.hh>

#include <cstdint>

namespace psd {

    namespace {
        std::uint16_t load_be16(const std::byte* p) {
            return static_cast<std::uint16_t>((std::to_integer<unsigned>(p[0]) << 8) |
                                              std::to_integer<unsigned>(p[1]));
        }

        void store_be16(std::byte* p, std::uint16_t v) {
            p[0] = static_cast<std::byte>(v >> 8);
            p[1] = static_cast<std::byte>(v & 0xFF);
        }

        void delta_encode_row8(std::byte* row, std::size_t cols) {
            for (std::size_t x = cols; x-- > 1;) {
                row[x] = static_cast<std::byte>(std::to_integer<unsigned>(row[x]) -
                                                std::to_integer<unsigned>(row[x - 1]));
            }
        }

        void delta_decode_row8(std::byte* row, std::size_t cols) {
            for (std::size_t x = 1; x < cols; x++) {
                row[x] = static_cast<std::byte>(std::to_integer<unsigned>(row[x]) +
                                                std::to_integer<unsigned>(row[x - 1]));
            }
        }

        void delta_encode_row16(std::byte* row, std::size_t cols) {
            for (std::size_t x = cols; x-- > 1;) {
                auto value = static_cast<std::uint16_t>(load_be16(row + 2 * x) - load_be16(row + 2 * (x - 1)));
                store_be16(row + 2 * x, value);
            }
        }

        void delta_decode_row16(std::byte* row, std::size_t cols) {
            for (std::size_t x = 1; x < cols; x++) {
                auto value = static_cast<std::uint16_t>(load_be16(row + 2 * x) + load_be16(row + 2 * (x - 1)));
                store_be16(row + 2 * x, value);
            }
        }

        // 1234 1234 1234 ... -> 111... 222... 333... 444...
        void float_encode_row(std::byte* row, std::size_t cols, std::vector<std::byte>& scratch) {
            const std::size_t row_bytes = cols * 4;
            scratch.assign(row, row + row_bytes);
            for (std::size_t x = 0; x < cols; x++) {
                for (std::size_t k = 0; k < 4; k++) {
                    row[k * cols + x] = scratch[x * 4 + k];
                }
            }
            delta_encode_row8(row, row_bytes);
        }

        void float_decode_row(std::byte* row, std::size_t cols, std::vector<std::byte>& scratch) {
            const std::size_t row_bytes = cols * 4;
            delta_decode_row8(row, row_bytes);
            scratch.assign(row, row + row_bytes);
            for (std::size_t x = 0; x < cols; x++) {
                for (std::size_t k = 0; k < 4; k++) {
                    row[x * 4 + k] = scratch[k * cols + x];
                }
            }
        }
    }

    void predictor_encode(std::vector<std::byte>& data, std::size_t rows, std::size_t cols, sample_type type) {
        const std::size_t total = plane_byte_size(rows, cols, type);
        THROW_ENCODE_IF(data.size() < total, "Predictor input of ", data.size(), " bytes smaller than the plane of ",
                        total, " bytes");
        const std::size_t row_bytes = cols * sample_size(type);

        std::vector<std::byte> scratch;
        for (std::size_t y = 0; y < rows; y++) {
            std::byte* row = data.data() + y * row_bytes;
            switch (type) {
                case sample_type::u8:
                    delta_encode_row8(row, cols);
                    break;
                case sample_type::u16:
                    delta_encode_row16(row, cols);
                    break;
                case sample_type::f32:
                    float_encode_row(row, cols, scratch);
                    break;
            }
        }
    }

    void predictor_decode(std::vector<std::byte>& data, std::size_t rows, std::size_t cols, sample_type type) {
        const std::size_t total = plane_byte_size(rows, cols, type);
        THROW_DECODE_IF(data.size() < total, "Predictor input of ", data.size(), " bytes smaller than the plane of ",
                        total, " bytes");
        const std::size_t row_bytes = cols * sample_size(type);

        std::vector<std::byte> scratch;
        for (std::size_t y = 0; y < rows; y++) {
            std::byte* row = data.data() + y * row_bytes;
            switch (type) {
                case sample_type::u8:
                    delta_decode_row8(row, cols);
                    break;
                case sample_type::u16:
                    delta_decode_row16(row, cols);
                    break;
                case sample_type::f32:
                    float_decode_row(row, cols, scratch);
                    break;
            }
        }
    }

}
