//
// Created by igor on 07/09/2025.
//

#include "registry.hh"

#include <psd/exceptions.hh>

namespace psd {

    std::uint8_t layer_mask::parameter_flags() const {
        std::uint8_t result = 0;
        if (user_mask_density) {
            result |= mask_parameter_flags::USER_DENSITY;
        }
        if (user_mask_feather) {
            result |= mask_parameter_flags::USER_FEATHER;
        }
        if (vector_mask_density) {
            result |= mask_parameter_flags::VECTOR_DENSITY;
        }
        if (vector_mask_feather) {
            result |= mask_parameter_flags::VECTOR_FEATHER;
        }
        return result;
    }

    bool layer_mask::operator==(const layer_mask& o) const {
        return rect == o.rect &&
               default_color == o.default_color &&
               (flags & ~mask_flags::APPLIED) == (o.flags & ~mask_flags::APPLIED) &&
               user_mask_density == o.user_mask_density &&
               user_mask_feather == o.user_mask_feather &&
               vector_mask_density == o.vector_mask_density &&
               vector_mask_feather == o.vector_mask_feather &&
               real == o.real;
    }

    namespace detail {
        namespace {
            // rectangle, default colour and flags
            constexpr std::uint64_t BASE_SIZE = 18;
            constexpr std::uint64_t REAL_MASK_SIZE = 18;
            constexpr std::uint64_t MIN_RECORD_SIZE = 20;

            rectangle read_rect(reader_base& r, const psd_format& format) {
                auto v = format.read_array<std::int32_t, 4>(r);
                return {v[0], v[1], v[2], v[3]};
            }

            void write_rect(writer_base& w, const psd_format& format, const rectangle& rc) {
                format.write_values(w, rc.top, rc.left, rc.bottom, rc.right);
            }
        }

        layer_mask read_layer_mask(reader_base& r, const psd_format& format) {
            layer_mask mask;
            auto size = format.read<std::uint32_t>(r);
            if (size == 0) {
                return mask;
            }
            THROW_DECODE_IF(size < BASE_SIZE, "Layer mask record of ", size, " bytes at offset ", r.tell(),
                            " is too short");
            const std::uint64_t end = r.tell() + size;

            mask.rect = read_rect(r, format);
            mask.default_color = format.read<std::uint8_t>(r);
            mask.flags = format.read<std::uint8_t>(r);

            if (mask.flags & mask_flags::APPLIED) {
                auto parameters = format.read<std::uint8_t>(r);
                if (parameters & mask_parameter_flags::USER_DENSITY) {
                    mask.user_mask_density = format.read<std::uint8_t>(r);
                }
                if (parameters & mask_parameter_flags::USER_FEATHER) {
                    mask.user_mask_feather = format.read<double>(r);
                }
                if (parameters & mask_parameter_flags::VECTOR_DENSITY) {
                    mask.vector_mask_density = format.read<std::uint8_t>(r);
                }
                if (parameters & mask_parameter_flags::VECTOR_FEATHER) {
                    mask.vector_mask_feather = format.read<double>(r);
                }
            }
            mask.flags = static_cast<std::uint8_t>(mask.flags & ~mask_flags::APPLIED);
            THROW_DECODE_IF(r.tell() > end, "Layer mask parameters run past the ", size, " byte record");

            if (end - r.tell() >= REAL_MASK_SIZE) {
                real_mask real;
                real.flags = format.read<std::uint8_t>(r);
                real.background = format.read<std::uint8_t>(r);
                real.rect = read_rect(r, format);
                mask.real = real;
            }
            r.seek(end, reader_base::set);
            return mask;
        }

        void write_layer_mask(writer_base& w, const psd_format& format, const layer_mask& mask) {
            if (!mask.rect) {
                format.write<std::uint32_t>(w, 0);
                return;
            }

            size_placeholder size(w, format.get_byte_order(), 4);
            const auto parameters = mask.parameter_flags();
            const bool applied = parameters != 0;
            auto flags = static_cast<std::uint8_t>(mask.flags & ~mask_flags::APPLIED);
            if (applied) {
                flags = static_cast<std::uint8_t>(flags | mask_flags::APPLIED);
            }

            write_rect(w, format, *mask.rect);
            format.write_values(w, mask.default_color, flags);

            if (applied) {
                format.write(w, parameters);
                if (mask.user_mask_density) {
                    format.write(w, *mask.user_mask_density);
                }
                if (mask.user_mask_feather) {
                    format.write(w, *mask.user_mask_feather);
                }
                if (mask.vector_mask_density) {
                    format.write(w, *mask.vector_mask_density);
                }
                if (mask.vector_mask_feather) {
                    format.write(w, *mask.vector_mask_feather);
                }
            }

            if (mask.real) {
                format.write_values(w, mask.real->flags, mask.real->background);
                write_rect(w, format, mask.real->rect);
            }

            std::uint64_t written = w.tell() - size.payload_start();
            if (written < MIN_RECORD_SIZE) {
                w.write_zeros(static_cast<std::size_t>(MIN_RECORD_SIZE - written));
            } else {
                w.pad(size.payload_start(), 2);
            }
            size.patch();
        }
    } // namespace detail

} // namespace psd
