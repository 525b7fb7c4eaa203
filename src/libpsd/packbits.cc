//
// Created by igor on 04/09/2025.
//

#include "packbits.hh"

#include <psd/exceptions.hh>

#include <cstdint>
#include <cstring>

namespace psd {

    namespace {
        constexpr std::size_t max_run = 128;
    }

    void packbits_encode(const std::byte* src, std::size_t size, std::vector<std::byte>& out) {
        std::size_t i = 0;
        while (i < size) {
            std::size_t run = 1;
            while (i + run < size && run < max_run && src[i + run] == src[i]) {
                run++;
            }

            if (run > 1) {
                // repeat next byte (1 - n) times, n stored as signed header
                out.push_back(static_cast<std::byte>(257 - run));
                out.push_back(src[i]);
                i += run;
                continue;
            }

            // literal bytes until the next repeat starts
            std::size_t start = i;
            std::size_t count = 0;
            while (i < size && count < max_run) {
                if (i + 1 < size && src[i] == src[i + 1]) {
                    break;
                }
                i++;
                count++;
            }
            out.push_back(static_cast<std::byte>(count - 1));
            out.insert(out.end(), src + start, src + start + count);
        }
    }

    void packbits_decode(const std::byte* src, std::size_t size, std::byte* dst, std::size_t dst_size) {
        std::size_t src_pos = 0;
        std::size_t dst_pos = 0;

        while (src_pos < size && dst_pos < dst_size) {
            auto header = static_cast<std::int8_t>(src[src_pos++]);

            if (header == -128) {
                continue;
            }

            if (header >= 0) {
                // (1 + n) literal bytes
                std::size_t length = 1 + static_cast<std::size_t>(header);
                THROW_DECODE_IF(src_pos + length > size || dst_pos + length > dst_size,
                                "PackBits literal run of ", length, " bytes overruns the scanline");
                std::memcpy(dst + dst_pos, src + src_pos, length);
                src_pos += length;
                dst_pos += length;
            } else {
                // repeat byte (1 - n) times
                std::size_t length = static_cast<std::size_t>(1 - header);
                THROW_DECODE_IF(src_pos >= size || dst_pos + length > dst_size,
                                "PackBits repeat run of ", length, " bytes overruns the scanline");
                std::memset(dst + dst_pos, static_cast<int>(src[src_pos]), length);
                src_pos++;
                dst_pos += length;
            }
        }

        THROW_DECODE_IF(dst_pos != dst_size, "PackBits scanline decoded to ", dst_pos,
                        " bytes, expected ", dst_size);
    }

}
