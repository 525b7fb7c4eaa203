/**
 * @file tagged_list.hh
 * @brief Generic reader and writer of tagged record lists
 * @author Igor
 * @date 06/09/2025
 *
 * A tagged list is a sequence of records, each made of the format
 * signature, a key, a size field and the payload. The list ends at a given
 * offset or at the first record that does not start with the signature.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include <psd/export_psd.h>
#include <psd/fourcc.hh>
#include <psd/format.hh>
#include <psd/io.hh>
#include <psd/options.hh>
#include <psd/structure.hh>

namespace psd {

    /**
     * @brief Read records up to an end offset
     *
     * Zero sized records become empty structures, keys without a decoder
     * become unknown structures (or are skipped when unknowns are not
     * preserved). After each record the reader moves to the record start
     * plus its size rounded up to the alignment, whatever the decoder
     * consumed.
     *
     * @param r Reader positioned at the first record
     * @param format Format variant of the list
     * @param end_offset Offset the list ends at
     * @param options Read options
     * @param alignment Record alignment (4 at top level, 2 inside layers)
     * @return Decoded records in file order
     * @throws decode_error on truncated data, on malformed records and, with
     *         strict sizes, on records running past the end offset
     */
    PSD_EXPORT std::vector<structure> read_structures(reader_base& r, const psd_format& format,
                                                      std::uint64_t end_offset,
                                                      const read_options& options = {},
                                                      std::size_t alignment = 4);

    /**
     * @brief Write records
     *
     * Every record is written with a placeholder size field which is
     * patched once the payload is complete, then padded with zero bytes to
     * the alignment. Unknown structures of a different format variant are
     * dropped with a "foreign_unknown" warning.
     *
     * @return Number of bytes written
     * @throws encode_error for values that cannot be represented
     */
    PSD_EXPORT std::uint64_t write_structures(writer_base& w, const psd_format& format,
                                              const write_options& options, std::size_t alignment,
                                              const std::vector<structure>& structures);

    /**
     * @brief Check whether records with this key are decoded into a typed structure
     */
    PSD_EXPORT bool has_decoder(const fourcc& key);

} // namespace psd
