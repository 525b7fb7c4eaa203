/**
 * @file plane.hh
 * @brief Two dimensional raster plane of channel samples
 * @author Igor
 * @date 04/09/2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <type_traits>
#include <vector>

#include <psd/export_psd.h>
#include <psd/exceptions.hh>

namespace psd {

    /**
     * @enum sample_type
     * @brief Element type of a raster plane
     */
    enum class sample_type {
        u8,  ///< 8 bits per sample ('Layr')
        u16, ///< 16 bits per sample ('Lr16')
        f32  ///< 32 bit float per sample ('Lr32')
    };

    /**
     * @brief Size of one sample in bytes
     * @throws decode_error for an unknown sample type
     */
    PSD_EXPORT std::size_t sample_size(sample_type type);

    /**
     * @brief Bytes held by a plane of the given shape
     * @throws decode_error when rows * cols * sample_size does not fit std::size_t
     */
    PSD_EXPORT std::size_t plane_byte_size(std::size_t rows, std::size_t cols, sample_type type);

    /**
     * @class plane
     * @brief Row major raster of samples held in host byte order
     */
    class PSD_EXPORT plane {
    public:
        plane() = default;

        /**
         * @brief Create a zero filled plane
         * @throws decode_error when the shape overflows the addressable size
         */
        plane(std::size_t rows, std::size_t cols, sample_type type);

        [[nodiscard]] std::size_t rows() const { return m_rows; }
        [[nodiscard]] std::size_t cols() const { return m_cols; }
        [[nodiscard]] sample_type type() const { return m_type; }
        [[nodiscard]] std::size_t sample_count() const { return m_rows * m_cols; }
        [[nodiscard]] bool empty() const { return sample_count() == 0; }

        [[nodiscard]] std::size_t byte_size() const { return m_data.size(); }
        [[nodiscard]] std::size_t row_bytes() const { return m_cols * sample_size(m_type); }

        [[nodiscard]] const std::byte* data() const { return m_data.data(); }
        [[nodiscard]] std::byte* data() { return m_data.data(); }

        template<typename T>
        T at(std::size_t row, std::size_t col) const {
            check_access<T>(row, col);
            T value;
            std::memcpy(&value, m_data.data() + (row * m_cols + col) * sizeof(T), sizeof(T));
            return value;
        }

        template<typename T>
        void set(std::size_t row, std::size_t col, T value) {
            check_access<T>(row, col);
            std::memcpy(m_data.data() + (row * m_cols + col) * sizeof(T), &value, sizeof(T));
        }

        template<typename T>
        void fill(T value) {
            for (std::size_t r = 0; r < m_rows; r++) {
                for (std::size_t c = 0; c < m_cols; c++) {
                    set(r, c, value);
                }
            }
        }

        bool operator==(const plane& other) const;
        bool operator!=(const plane& other) const { return !(*this == other); }

    private:
        template<typename T>
        void check_access(std::size_t row, std::size_t col) const {
            static_assert(std::is_arithmetic_v<T>, "plane samples are arithmetic");
            THROW_DECODE_IF(sizeof(T) != sample_size(m_type), "Sample access with wrong element size");
            THROW_DECODE_IF(row >= m_rows || col >= m_cols, "Sample (", row, ", ", col,
                            ") outside plane of ", m_rows, "x", m_cols);
        }

        std::size_t m_rows = 0;
        std::size_t m_cols = 0;
        sample_type m_type = sample_type::u8;
        std::vector<std::byte> m_data;
    };

} // namespace psd
