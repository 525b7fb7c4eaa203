//
// Created by igor on 02/09/2025.
//
#pragma once
#include <array>
#include <cstring>
#include <cstdint>
#include <string>
#include <string_view>
#include <algorithm>
#include <ostream>
#include <iomanip>
#include <stdexcept>

namespace psd {
    // Four byte key of a tagged block, stored in big-endian character order
    struct fourcc {
        std::array<char, 4> b{' ', ' ', ' ', ' '};

        constexpr fourcc() = default;

        constexpr fourcc(char c0, char c1, char c2, char c3)
            : b{ c0, c1, c2, c3 } {}

        // Constructor from string_view with padding (runtime)
        explicit fourcc(std::string_view sv) : b{' ', ' ', ' ', ' '} {
            std::copy_n(sv.begin(), std::min(sv.size(), size_t(4)), b.begin());
        }

        fourcc(const char* str) : fourcc(std::string_view(str)) {}

        // Constructor from raw bytes (no padding)
        static fourcc from_bytes(const void* data) {
            fourcc result;
            std::memcpy(result.b.data(), data, 4);
            return result;
        }

        [[nodiscard]] std::string to_string() const {
            return {b.data(), 4};
        }

        // Big-endian interpretation, stable across hosts
        [[nodiscard]] std::uint32_t to_uint32() const {
            return (static_cast<std::uint32_t>(static_cast<unsigned char>(b[0])) << 24) |
                   (static_cast<std::uint32_t>(static_cast<unsigned char>(b[1])) << 16) |
                   (static_cast<std::uint32_t>(static_cast<unsigned char>(b[2])) << 8) |
                   static_cast<std::uint32_t>(static_cast<unsigned char>(b[3]));
        }

        // Key as laid out by the little-endian format variants
        [[nodiscard]] constexpr fourcc reversed() const {
            return {b[3], b[2], b[1], b[0]};
        }

        void to_bytes(void* dest) const {
            std::memcpy(dest, b.data(), 4);
        }

        constexpr char operator[](std::size_t i) const { return b[i]; }

        bool operator==(const fourcc& o) const { return b == o.b; }
        bool operator!=(const fourcc& o) const { return !(*this == o); }
        bool operator<(const fourcc& o) const { return b < o.b; }

        [[nodiscard]] bool is_printable() const {
            return std::all_of(b.begin(), b.end(), [](char c) {
                return c >= 32 && c <= 126;
            });
        }

        friend std::ostream& operator<<(std::ostream& os, const fourcc& f) {
            os << '\'';
            for (char c : f.b) {
                if (c >= 32 && c <= 126) {
                    os << c;
                } else {
                    // Escape non-printable characters
                    auto flags = os.flags();
                    auto fill = os.fill();
                    os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                       << static_cast<unsigned>(static_cast<unsigned char>(c));
                    os.flags(flags);
                    os.fill(fill);
                }
            }
            os << '\'';
            return os;
        }
    };

    struct fourcc_hash {
        std::size_t operator()(const fourcc& f) const noexcept {
            return (static_cast<std::size_t>(f.to_uint32()) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // User-defined literal for compile-time fourcc creation
    constexpr fourcc operator""_4cc(const char* str, std::size_t len) {
        if (len > 4) {
            throw std::invalid_argument("FourCC literal must be 4 characters or less");
        }
        return {
            len > 0 ? str[0] : ' ',
            len > 1 ? str[1] : ' ',
            len > 2 ? str[2] : ' ',
            len > 3 ? str[3] : ' '
        };
    }
}

namespace std {
    template<>
    struct hash<psd::fourcc> {
        std::size_t operator()(const psd::fourcc& f) const noexcept {
            return psd::fourcc_hash{}(f);
        }
    };
}
