//
// Created by igor on 03/09/2025.
//

#pragma once

#include <iosfwd>
#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <cstring>

#include <psd/export_psd.h>
#include <psd/exceptions.hh>
#include <psd/byte_order.hh>
#include <psd/fourcc.hh>

namespace psd {

    // Base reader interface
    class PSD_EXPORT reader_base {
        public:
            enum whence_t {
                set,
                cur,
                end
            };

        public:
            virtual ~reader_base() = default;

            // Simple interface - throws on error, returns short counts at end of data
            virtual std::size_t read(void* dst, std::size_t size) = 0;
            virtual void seek(std::uint64_t offset, whence_t whence) = 0;
            virtual std::uint64_t tell() const = 0;
            virtual std::uint64_t size() const = 0;

            // Convenience methods
            std::vector<std::byte> read_exact(std::size_t size) {
                THROW_DECODE_IF(size > remaining(), "Unexpected end of data at offset ", tell(),
                                ": requested ", size, " bytes, ", remaining(), " available");
                std::vector<std::byte> buffer(size);
                std::size_t actual = size > 0 ? read(buffer.data(), size) : 0;
                THROW_DECODE_IF(actual != size, "Unexpected end of data at offset ", tell(),
                                ": requested ", size, " bytes, got ", actual);
                return buffer;
            }

            template<typename T>
            T read(byte_order bo) {
                std::array<std::byte, sizeof(T)> buff;
                std::size_t actual = read(buff.data(), sizeof(T));
                THROW_DECODE_IF(actual != sizeof(T), "Unexpected end of data at offset ", tell(),
                                ": failed to read ", sizeof(T), " bytes");

                T value;
                std::memcpy(&value, buff.data(), sizeof(T));
                return to_byte_order(value, bo);
            }

            fourcc read_fourcc();

            // Read four bytes and restore the position; false at end of data
            bool peek_fourcc(fourcc& out);

            void skip(std::uint64_t count) {
                seek(tell() + count, set);
            }

            [[nodiscard]] std::uint64_t remaining() const {
                auto pos = tell();
                auto total = size();
                return pos < total ? total - pos : 0;
            }
    };

    // Reads from a seekable stream without limits
    class PSD_EXPORT reader : public reader_base {
        public:
            explicit reader(std::istream& is);
            ~reader() override = default;

            using reader_base::read;

            std::size_t read(void* dst, std::size_t size) override;
            void seek(std::uint64_t offset, whence_t whence) override;
            std::uint64_t tell() const override;
            std::uint64_t size() const override;

        private:
            std::istream& m_stream;
    };

    // Reads from a caller-owned byte buffer
    class PSD_EXPORT memory_reader : public reader_base {
        public:
            memory_reader(const std::byte* data, std::size_t size);
            explicit memory_reader(const std::vector<std::byte>& data);

            using reader_base::read;

            std::size_t read(void* dst, std::size_t size) override;
            void seek(std::uint64_t offset, whence_t whence) override;
            std::uint64_t tell() const override;
            std::uint64_t size() const override;

        private:
            const std::byte* m_data;
            std::size_t m_size;
            std::uint64_t m_position;
    };

    // Base writer interface. Sinks must be seekable for size patching.
    class PSD_EXPORT writer_base {
        public:
            virtual ~writer_base() = default;

            virtual void write(const void* src, std::size_t size) = 0;
            virtual void seek(std::uint64_t offset) = 0;
            virtual std::uint64_t tell() const = 0;

            template<typename T>
            void write(T value, byte_order bo) {
                value = to_byte_order(value, bo);
                std::array<std::byte, sizeof(T)> buff;
                std::memcpy(buff.data(), &value, sizeof(T));
                write(buff.data(), sizeof(T));
            }

            void write_fourcc(const fourcc& id) {
                write(id.b.data(), 4);
            }

            void write_bytes(const std::vector<std::byte>& data) {
                if (!data.empty()) {
                    write(data.data(), data.size());
                }
            }

            void write_zeros(std::size_t count);

            // Pad the region that started at 'start' to a multiple of 'alignment'
            std::size_t pad(std::uint64_t start, std::size_t alignment);
    };

    // Writes to a seekable output stream
    class PSD_EXPORT stream_writer : public writer_base {
        public:
            explicit stream_writer(std::ostream& os);

            using writer_base::write;

            void write(const void* src, std::size_t size) override;
            void seek(std::uint64_t offset) override;
            std::uint64_t tell() const override;

        private:
            std::ostream& m_stream;
    };

    // Writes into a growable byte buffer
    class PSD_EXPORT memory_writer : public writer_base {
        public:
            explicit memory_writer(std::vector<std::byte>& buffer);

            using writer_base::write;

            void write(const void* src, std::size_t size) override;
            void seek(std::uint64_t offset) override;
            std::uint64_t tell() const override;

        private:
            std::vector<std::byte>& m_buffer;
            std::uint64_t m_position;
    };

    /**
     * @class size_placeholder
     * @brief Reserves a size field and patches it once the payload is written
     *
     * The constructor writes a zero of the given width. patch() seeks back,
     * stores the number of bytes written since the field and restores the
     * write position.
     */
    class PSD_EXPORT size_placeholder {
        public:
            size_placeholder(writer_base& w, byte_order bo, std::size_t width);

            size_placeholder(const size_placeholder&) = delete;
            size_placeholder& operator = (const size_placeholder&) = delete;

            [[nodiscard]] std::uint64_t payload_start() const { return m_payload_start; }

            std::uint64_t patch();

        private:
            writer_base& m_writer;
            byte_order m_byte_order;
            std::size_t m_width;
            std::uint64_t m_field_offset;
            std::uint64_t m_payload_start;
    };
}
