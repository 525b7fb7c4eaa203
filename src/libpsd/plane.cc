//
// Created by igor on 04/09/2025.
//

#include <psd/plane.hh>

#include <limits>

namespace psd {

    std::size_t sample_size(sample_type type) {
        switch (type) {
            case sample_type::u8:
                return 1;
            case sample_type::u16:
                return 2;
            case sample_type::f32:
                return 4;
        }
        THROW_DECODE("Unsupported sample type ", static_cast<int>(type));
    }

    std::size_t plane_byte_size(std::size_t rows, std::size_t cols, sample_type type) {
        constexpr auto max_size = std::numeric_limits<std::size_t>::max();
        const std::size_t width = sample_size(type);
        THROW_DECODE_IF(cols > max_size / width, "Plane row of ", cols, " samples overflows");
        const std::size_t row_bytes = cols * width;
        THROW_DECODE_IF(row_bytes != 0 && rows > max_size / row_bytes,
                        "Plane of ", rows, "x", cols, " samples overflows");
        return rows * row_bytes;
    }

    plane::plane(std::size_t rows, std::size_t cols, sample_type type)
        : m_rows(rows), m_cols(cols), m_type(type), m_data(plane_byte_size(rows, cols, type)) {
    }

    bool plane::operator==(const plane& other) const {
        return m_rows == other.m_rows &&
               m_cols == other.m_cols &&
               m_type == other.m_type &&
               m_data == other.m_data;
    }

} // namespace psd
