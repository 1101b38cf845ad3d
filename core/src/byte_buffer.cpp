#include "ipcwire/byte_buffer.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "ipcwire/error_codes.hpp"

namespace ipcwire
{

    ByteBuffer::ByteBuffer(std::size_t initial_capacity)
        : bytes_(initial_capacity)
    {
    }

    ByteBuffer ByteBuffer::from_bytes(std::span<const std::byte> data)
    {
        ByteBuffer buffer(data.size());
        buffer.write_bytes(data);
        buffer.reset_read();
        return buffer;
    }

    void ByteBuffer::ensure_capacity(std::size_t needed)
    {
        const auto required = write_pos_ + needed;
        if (required > bytes_.size())
        {
            bytes_.resize(std::max(bytes_.size() * 2, required));
        }
    }

    std::size_t ByteBuffer::allocate(std::size_t size)
    {
        ensure_capacity(size);
        const auto offset = write_pos_;
        write_pos_ += size;
        return offset;
    }

    std::size_t ByteBuffer::advance(std::size_t size)
    {
        if (size > available())
        {
            throw Error(ErrorCode::BufferUnderflow,
                        "requested " + std::to_string(size) + ", available " + std::to_string(available()));
        }
        const auto offset = read_pos_;
        read_pos_ += size;
        return offset;
    }

    void ByteBuffer::write_byte(std::uint8_t value)
    {
        const auto offset = allocate(1);
        bytes_[offset] = static_cast<std::byte>(value);
    }

    std::uint8_t ByteBuffer::read_byte()
    {
        const auto offset = advance(1);
        return std::to_integer<std::uint8_t>(bytes_[offset]);
    }

    void ByteBuffer::write_bytes(std::span<const std::byte> data)
    {
        const auto offset = allocate(data.size());
        std::copy(data.begin(), data.end(), bytes_.begin() + static_cast<std::ptrdiff_t>(offset));
    }

    std::vector<std::byte> ByteBuffer::read_bytes(std::size_t length)
    {
        const auto offset = advance(length);
        const auto begin = bytes_.begin() + static_cast<std::ptrdiff_t>(offset);
        return std::vector<std::byte>(begin, begin + static_cast<std::ptrdiff_t>(length));
    }

    std::span<std::byte> ByteBuffer::bytes(std::size_t offset, std::size_t size)
    {
        if (offset > write_pos_ || size > write_pos_ - offset)
        {
            throw std::out_of_range("ByteBuffer view outside written region");
        }
        return std::span<std::byte>(bytes_).subspan(offset, size);
    }

    std::span<const std::byte> ByteBuffer::bytes(std::size_t offset, std::size_t size) const
    {
        if (offset > write_pos_ || size > write_pos_ - offset)
        {
            throw std::out_of_range("ByteBuffer view outside written region");
        }
        return std::span<const std::byte>(bytes_).subspan(offset, size);
    }

    std::span<const std::byte> ByteBuffer::view() const noexcept
    {
        return std::span<const std::byte>(bytes_).first(write_pos_);
    }

    std::vector<std::byte> ByteBuffer::to_bytes() const
    {
        return std::vector<std::byte>(bytes_.begin(), bytes_.begin() + static_cast<std::ptrdiff_t>(write_pos_));
    }

    void ByteBuffer::clear() noexcept
    {
        write_pos_ = 0;
        read_pos_ = 0;
    }

} // namespace ipcwire
