//
// Created by igor on 04/09/2025.
//

#pragma once

#include <cstddef>
#include <vector>

namespace psd {

    // Append the PackBits encoding of one scanline to 'out'
    void packbits_encode(const std::byte* src, std::size_t size, std::vector<std::byte>& out);

    // Decode one PackBits scanline; 'dst' must be filled exactly
    void packbits_decode(const std::byte* src, std::size_t size, std::byte* dst, std::size_t dst_size);

}
