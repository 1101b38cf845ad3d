/**
 * ipcwire - Serializer contract shared by primitive and composite encoders.
 */
#pragma once

#include <cstddef>
#include <memory>

#include "ipcwire/byte_buffer.hpp"
#include "ipcwire/job.hpp"

namespace ipcwire::proto
{

    /// Sender and receiver must use structurally identical serializers; nothing
    /// on the wire describes the schema.
    ///
    /// Arguments are taken by reference: whoever drives the returned job keeps
    /// `value` and `buffer` alive until it completes.
    template <typename T>
    class Serializer
    {
    public:
        using value_type = T;

        virtual ~Serializer() = default;

        virtual Job<void> serialize(const T &value, ByteBuffer &buffer) const = 0;

        virtual Job<T> deserialize(ByteBuffer &buffer) const = 0;

        /// Lower bound on the bytes one encoded value occupies. Collections use
        /// it to reject element counts the remaining input cannot hold.
        virtual std::size_t min_wire_size() const noexcept { return 1; }
    };

    template <typename T>
    using SerializerPtr = std::shared_ptr<const Serializer<T>>;

    template <typename T>
    ByteBuffer to_buffer(const Serializer<T> &serializer, const T &value)
    {
        ByteBuffer buffer;
        serializer.serialize(value, buffer).run();
        return buffer;
    }

    template <typename T>
    T from_buffer(const Serializer<T> &serializer, ByteBuffer &buffer)
    {
        return serializer.deserialize(buffer).run();
    }

} // namespace ipcwire::proto
