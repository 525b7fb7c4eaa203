//
// Created by igor on 04/09/2025.
//

#pragma once

#include <cstddef>
#include <vector>

#include <psd/plane.hh>

namespace psd {

    /*
     * Horizontal predictors for ZIP_PREDICTED channel data. Both operate in
     * place on big-endian sample bytes, one row at a time.
     *
     * Integer samples: each sample is replaced by its difference to the
     * previous sample of the row, modulo the sample width.
     *
     * Float samples: the bytes of a row are regrouped into byte planes, most
     * significant plane first, then each byte is replaced by its difference
     * to the previous byte of the row.
     */
    void predictor_encode(std::vector<std::byte>& data, std::size_t rows, std::size_t cols, sample_type type);
    void predictor_decode(std::vector<std::byte>& data, std::size_t rows, std::size_t cols, sample_type type);

}
