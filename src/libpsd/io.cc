//
// Created by igor on 03/09/2025.
//

#include <istream>
#include <ostream>
#include <algorithm>
#include <limits>

#include <psd/io.hh>

namespace psd {
    // reader_base implementation
    fourcc reader_base::read_fourcc() {
        std::array<char, 4> data;
        std::size_t actual = read(data.data(), 4);
        THROW_DECODE_IF(actual != 4, "Failed to read key at offset ", tell());
        return {data[0], data[1], data[2], data[3]};
    }

    bool reader_base::peek_fourcc(fourcc& out) {
        if (remaining() < 4) {
            return false;
        }
        std::uint64_t pos = tell();
        std::array<char, 4> data;
        std::size_t actual = read(data.data(), 4);
        seek(pos, set);
        if (actual != 4) {
            return false;
        }
        out = fourcc(data[0], data[1], data[2], data[3]);
        return true;
    }

    // reader implementation
    reader::reader(std::istream& is) : m_stream(is) {}

    std::size_t reader::read(void* dst, std::size_t size) {
        THROW_IO_UNLESS(dst, "Null buffer in read");

        if (size == 0) {
            return 0;
        }

        THROW_IO_UNLESS(m_stream.good(), "Stream in bad state");

        m_stream.read(static_cast<char*>(dst), static_cast<std::streamsize>(size));
        std::size_t bytes_read = static_cast<std::size_t>(m_stream.gcount());

        THROW_IO_IF(m_stream.bad(), "Stream read failed");
        if (m_stream.eof()) {
            // Short reads are reported through the return value
            m_stream.clear();
        }
        return bytes_read;
    }

    void reader::seek(std::uint64_t offset, whence_t whence) {
        m_stream.clear();

        std::ios_base::seekdir dir;
        switch (whence) {
            case set:
                dir = std::ios_base::beg;
                break;
            case cur:
                dir = std::ios_base::cur;
                break;
            case end:
                dir = std::ios_base::end;
                break;
            default:
                THROW_IO("Invalid whence value:", static_cast<int>(whence));
        }

        m_stream.seekg(static_cast<std::streamoff>(offset), dir);
        if (m_stream.fail()) {
            m_stream.clear();
            THROW_IO("Cannot seek to offset ", offset,
                     whence == reader_base::set ? " (absolute)" : " (relative)");
        }
    }

    std::uint64_t reader::tell() const {
        std::streampos pos = m_stream.tellg();
        THROW_IO_IF(pos == std::streampos(-1), "Tell failed");
        return static_cast<std::uint64_t>(pos);
    }

    std::uint64_t reader::size() const {
        std::streampos current_pos = m_stream.tellg();
        THROW_IO_IF(current_pos == std::streampos(-1), "Tell failed in size()");

        m_stream.seekg(0, std::ios_base::end);
        std::streampos end_pos = m_stream.tellg();
        m_stream.seekg(current_pos);

        THROW_IO_IF(end_pos == std::streampos(-1), "Failed to get stream size");
        return static_cast<std::uint64_t>(end_pos);
    }

    // memory_reader implementation
    memory_reader::memory_reader(const std::byte* data, std::size_t size)
        : m_data(data), m_size(size), m_position(0) {
        THROW_IO_IF(!data && size > 0, "Null buffer in memory_reader");
    }

    memory_reader::memory_reader(const std::vector<std::byte>& data)
        : memory_reader(data.data(), data.size()) {}

    std::size_t memory_reader::read(void* dst, std::size_t size) {
        THROW_IO_UNLESS(dst, "Null buffer in memory_reader::read");

        if (size == 0 || m_position >= m_size) {
            return 0;
        }

        std::size_t available = static_cast<std::size_t>(m_size - m_position);
        size = std::min(size, available);
        std::memcpy(dst, m_data + m_position, size);
        m_position += size;
        return size;
    }

    void memory_reader::seek(std::uint64_t offset, whence_t whence) {
        std::uint64_t new_pos;

        switch (whence) {
            case set:
                new_pos = offset;
                break;
            case cur:
                new_pos = m_position + offset;
                break;
            case end:
                THROW_IO_IF(offset > m_size, "Seek before start of buffer");
                new_pos = m_size - offset;
                break;
            default:
                THROW_IO("Invalid whence value in memory_reader");
        }

        THROW_IO_IF(new_pos > m_size, "Seek beyond buffer bounds: ", new_pos, " > ", m_size);
        m_position = new_pos;
    }

    std::uint64_t memory_reader::tell() const {
        return m_position;
    }

    std::uint64_t memory_reader::size() const {
        return m_size;
    }

    // writer_base implementation
    void writer_base::write_zeros(std::size_t count) {
        static const std::array<std::byte, 16> zeros{};
        while (count > 0) {
            std::size_t chunk = std::min(count, zeros.size());
            write(zeros.data(), chunk);
            count -= chunk;
        }
    }

    std::size_t writer_base::pad(std::uint64_t start, std::size_t alignment) {
        if (alignment <= 1) {
            return 0;
        }
        std::uint64_t size = tell() - start;
        std::size_t padding = static_cast<std::size_t>((alignment - size % alignment) % alignment);
        write_zeros(padding);
        return padding;
    }

    // stream_writer implementation
    stream_writer::stream_writer(std::ostream& os) : m_stream(os) {}

    void stream_writer::write(const void* src, std::size_t size) {
        THROW_IO_UNLESS(src, "Null buffer in write");
        if (size == 0) {
            return;
        }
        m_stream.write(static_cast<const char*>(src), static_cast<std::streamsize>(size));
        THROW_IO_UNLESS(m_stream.good(), "Stream write failed");
    }

    void stream_writer::seek(std::uint64_t offset) {
        m_stream.seekp(static_cast<std::streamoff>(offset), std::ios_base::beg);
        THROW_IO_UNLESS(m_stream.good(), "Cannot seek output to offset ", offset);
    }

    std::uint64_t stream_writer::tell() const {
        std::streampos pos = m_stream.tellp();
        THROW_IO_IF(pos == std::streampos(-1), "Output stream is not seekable");
        return static_cast<std::uint64_t>(pos);
    }

    // memory_writer implementation
    memory_writer::memory_writer(std::vector<std::byte>& buffer)
        : m_buffer(buffer), m_position(buffer.size()) {}

    void memory_writer::write(const void* src, std::size_t size) {
        THROW_IO_UNLESS(src, "Null buffer in write");
        if (size == 0) {
            return;
        }
        std::uint64_t end = m_position + size;
        if (end > m_buffer.size()) {
            m_buffer.resize(static_cast<std::size_t>(end));
        }
        std::memcpy(m_buffer.data() + m_position, src, size);
        m_position = end;
    }

    void memory_writer::seek(std::uint64_t offset) {
        THROW_IO_IF(offset > m_buffer.size(), "Seek beyond buffer end: ", offset, " > ", m_buffer.size());
        m_position = offset;
    }

    std::uint64_t memory_writer::tell() const {
        return m_position;
    }

    // size_placeholder implementation
    size_placeholder::size_placeholder(writer_base& w, byte_order bo, std::size_t width)
        : m_writer(w), m_byte_order(bo), m_width(width), m_field_offset(w.tell()), m_payload_start(0) {
        THROW_ENCODE_UNLESS(width == 2 || width == 4 || width == 8, "Invalid size field width ", width);
        m_writer.write_zeros(width);
        m_payload_start = m_writer.tell();
    }

    std::uint64_t size_placeholder::patch() {
        std::uint64_t end = m_writer.tell();
        std::uint64_t size = end - m_payload_start;

        m_writer.seek(m_field_offset);
        switch (m_width) {
            case 2:
                THROW_ENCODE_IF(size > std::numeric_limits<std::uint16_t>::max(),
                                "Size ", size, " does not fit a 2 byte field");
                m_writer.write(static_cast<std::uint16_t>(size), m_byte_order);
                break;
            case 4:
                THROW_ENCODE_IF(size > std::numeric_limits<std::uint32_t>::max(),
                                "Size ", size, " does not fit a 4 byte field");
                m_writer.write(static_cast<std::uint32_t>(size), m_byte_order);
                break;
            default:
                m_writer.write(size, m_byte_order);
                break;
        }
        m_writer.seek(end);
        return size;
    }
}
