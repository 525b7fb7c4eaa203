#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

#include <psd/fourcc.hh>
#include <psd/plane.hh>

// Build byte vectors from small integers
inline std::vector<std::byte> bytes(std::initializer_list<int> values) {
    std::vector<std::byte> result;
    result.reserve(values.size());
    for (int v : values) {
        result.push_back(static_cast<std::byte>(v));
    }
    return result;
}

inline std::vector<std::byte> ascii(std::string_view text) {
    std::vector<std::byte> result;
    for (char c : text) {
        result.push_back(static_cast<std::byte>(c));
    }
    return result;
}

// Hand assembled blobs with explicit byte order
class blob_builder {
public:
    blob_builder& u8(std::uint8_t v) {
        m_data.push_back(static_cast<std::byte>(v));
        return *this;
    }

    blob_builder& be16(std::uint16_t v) { return be(v, 2); }
    blob_builder& be32(std::uint32_t v) { return be(v, 4); }
    blob_builder& be64(std::uint64_t v) { return be(v, 8); }
    blob_builder& le16(std::uint16_t v) { return le(v, 2); }
    blob_builder& le32(std::uint32_t v) { return le(v, 4); }
    blob_builder& le64(std::uint64_t v) { return le(v, 8); }

    blob_builder& tag(std::string_view text) {
        for (char c : text) {
            m_data.push_back(static_cast<std::byte>(c));
        }
        return *this;
    }

    blob_builder& raw(const std::vector<std::byte>& data) {
        m_data.insert(m_data.end(), data.begin(), data.end());
        return *this;
    }

    blob_builder& zeros(std::size_t count) {
        m_data.insert(m_data.end(), count, std::byte{0});
        return *this;
    }

    [[nodiscard]] std::size_t size() const { return m_data.size(); }
    [[nodiscard]] const std::vector<std::byte>& data() const { return m_data; }

private:
    blob_builder& be(std::uint64_t v, int width) {
        for (int i = width - 1; i >= 0; i--) {
            m_data.push_back(static_cast<std::byte>((v >> (i * 8)) & 0xFF));
        }
        return *this;
    }

    blob_builder& le(std::uint64_t v, int width) {
        for (int i = 0; i < width; i++) {
            m_data.push_back(static_cast<std::byte>((v >> (i * 8)) & 0xFF));
        }
        return *this;
    }

    std::vector<std::byte> m_data;
};

// Image source data literal including its terminating zero
inline std::vector<std::byte> image_source_data_literal() {
    static const std::string_view literal{"Adobe Photoshop Document Data Block\0", 36};
    return ascii(literal);
}

// Plane with a deterministic, non trivial sample pattern
inline psd::plane make_plane(std::size_t rows, std::size_t cols, psd::sample_type type, unsigned seed = 1) {
    psd::plane p(rows, cols, type);
    for (std::size_t r = 0; r < rows; r++) {
        for (std::size_t c = 0; c < cols; c++) {
            unsigned v = static_cast<unsigned>(r * 31 + c * 7 + seed * 13);
            // runs of equal samples exercise the repeat packets of PackBits
            if (c % 8 < 4) {
                v = static_cast<unsigned>(r + seed);
            }
            switch (type) {
                case psd::sample_type::u8:
                    p.set<std::uint8_t>(r, c, static_cast<std::uint8_t>(v));
                    break;
                case psd::sample_type::u16:
                    p.set<std::uint16_t>(r, c, static_cast<std::uint16_t>(v * 257u));
                    break;
                case psd::sample_type::f32:
                    p.set<float>(r, c, static_cast<float>(v) * 0.25f - 3.0f);
                    break;
            }
        }
    }
    return p;
}

// Collects warnings reported through a warning_handler
struct warning_tracker {
    struct warning_info {
        std::uint64_t offset;
        std::string category;
        std::string message;
    };

    std::vector<warning_info> warnings;

    void operator()(std::uint64_t offset, std::string_view category, std::string_view message) {
        warnings.push_back({offset, std::string(category), std::string(message)});
    }

    bool has_warning(std::string_view category) const {
        return std::any_of(warnings.begin(), warnings.end(),
            [category](const warning_info& w) { return w.category == category; });
    }

    std::size_t count_category(std::string_view category) const {
        return static_cast<std::size_t>(std::count_if(warnings.begin(), warnings.end(),
            [category](const warning_info& w) { return w.category == category; }));
    }
};
