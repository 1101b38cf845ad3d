/**
 * ipcwire - Growable two-cursor byte buffer used by every serializer.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace ipcwire
{

    /// Bytes are appended at the write cursor and consumed from the read cursor.
    /// Invariant: 0 <= read_position() <= write_position() <= capacity().
    class ByteBuffer
    {
    public:
        static constexpr std::size_t kDefaultCapacity = 256;

        explicit ByteBuffer(std::size_t initial_capacity = kDefaultCapacity);

        static ByteBuffer from_bytes(std::span<const std::byte> data);

        std::size_t read_position() const noexcept { return read_pos_; }
        std::size_t write_position() const noexcept { return write_pos_; }
        std::size_t available() const noexcept { return write_pos_ - read_pos_; }
        std::size_t capacity() const noexcept { return bytes_.size(); }

        /// Reserves `size` bytes at the write cursor and returns their offset.
        std::size_t allocate(std::size_t size);

        /// Consumes `size` bytes at the read cursor and returns their offset.
        /// Throws Error{BufferUnderflow} when fewer bytes are available.
        std::size_t advance(std::size_t size);

        void write_byte(std::uint8_t value);
        std::uint8_t read_byte();

        void write_bytes(std::span<const std::byte> data);
        std::vector<std::byte> read_bytes(std::size_t length);

        /// View of already written bytes [offset, offset + size).
        std::span<std::byte> bytes(std::size_t offset, std::size_t size);
        std::span<const std::byte> bytes(std::size_t offset, std::size_t size) const;

        std::span<const std::byte> view() const noexcept;
        std::vector<std::byte> to_bytes() const;

        void reset_read() noexcept { read_pos_ = 0; }
        void clear() noexcept;

    private:
        void ensure_capacity(std::size_t needed);

        std::vector<std::byte> bytes_;
        std::size_t write_pos_{0};
        std::size_t read_pos_{0};
    };

} // namespace ipcwire
