/**
 * ipcwire - Composite serializers built from child serializers.
 *
 * | Kind     | Wire shape                              |
 * |----------|-----------------------------------------|
 * | array    | varuint32 length + elements             |
 * | object   | fields in declared order, no prefix     |
 * | tuple    | elements in order, no prefix            |
 * | optional | 1-byte presence flag + value if present |
 * | map      | varuint32 count + key/value pairs       |
 * | set      | varuint32 count + elements              |
 */
#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "ipcwire/error_codes.hpp"
#include "ipcwire/proto/primitive.hpp"

namespace ipcwire::proto
{

    namespace detail
    {

        template <typename T>
        void require_child(const SerializerPtr<T> &child, const std::string &what)
        {
            if (!child)
            {
                throw Error(ErrorCode::MissingSerializer, what + " serializer is null");
            }
        }

        inline std::uint32_t collection_size(std::size_t size)
        {
            if (size > std::numeric_limits<std::uint32_t>::max())
            {
                throw Error(ErrorCode::InvalidArgument, "collection too large to serialize");
            }
            return static_cast<std::uint32_t>(size);
        }

        /// Upper bound on a declared count of elements that take no bytes.
        inline constexpr std::uint32_t kMaxZeroWidthEntries = 1u << 16;

        /// Checks a declared count against the input left before anything is
        /// allocated for it.
        inline void require_entries(std::uint32_t count, std::size_t entry_size, const ByteBuffer &buffer)
        {
            if (entry_size == 0)
            {
                if (count > kMaxZeroWidthEntries)
                {
                    throw Error(ErrorCode::InvalidArgument, "declared count " + std::to_string(count) +
                                                                " of zero-width entries exceeds " +
                                                                std::to_string(kMaxZeroWidthEntries));
                }
                return;
            }
            if (count > buffer.available() / entry_size)
            {
                throw Error(ErrorCode::BufferUnderflow, "declared count " + std::to_string(count) + ", available " +
                                                            std::to_string(buffer.available()));
            }
        }

    } // namespace detail

    template <typename T>
    class ArraySerializer final : public Serializer<std::vector<T>>
    {
    public:
        explicit ArraySerializer(SerializerPtr<T> element)
            : element_(std::move(element))
        {
            detail::require_child(element_, "array element");
        }

        Job<void> serialize(const std::vector<T> &value, ByteBuffer &buffer) const override
        {
            const auto size = detail::collection_size(value.size());
            co_await varint_.serialize(size, buffer);
            for (const auto &item : value)
            {
                co_await element_->serialize(item, buffer);
                co_yield checkpoint;
            }
        }

        Job<std::vector<T>> deserialize(ByteBuffer &buffer) const override
        {
            const auto size = co_await varint_.deserialize(buffer);
            detail::require_entries(size, element_->min_wire_size(), buffer);
            std::vector<T> result;
            for (std::uint32_t i = 0; i < size; ++i)
            {
                result.push_back(co_await element_->deserialize(buffer));
                co_yield checkpoint;
            }
            co_return result;
        }

    private:
        SerializerPtr<T> element_;
        VarUInt32Serializer varint_;
    };

    /// One named member of an object schema.
    template <typename Struct>
    class FieldBinding
    {
    public:
        explicit FieldBinding(std::string name) : name_(std::move(name)) {}
        virtual ~FieldBinding() = default;

        const std::string &name() const noexcept { return name_; }

        virtual Job<void> write(const Struct &object, ByteBuffer &buffer) const = 0;
        virtual Job<void> read(Struct &object, ByteBuffer &buffer) const = 0;
        virtual std::size_t min_wire_size() const noexcept = 0;

    private:
        std::string name_;
    };

    template <typename Struct, typename Member>
    class MemberField final : public FieldBinding<Struct>
    {
    public:
        MemberField(std::string name, Member Struct::*member, SerializerPtr<Member> serializer)
            : FieldBinding<Struct>(std::move(name)),
              member_(member),
              serializer_(std::move(serializer))
        {
            detail::require_child(serializer_, "field '" + this->name() + "'");
        }

        Job<void> write(const Struct &object, ByteBuffer &buffer) const override
        {
            co_await serializer_->serialize(object.*member_, buffer);
        }

        Job<void> read(Struct &object, ByteBuffer &buffer) const override
        {
            object.*member_ = co_await serializer_->deserialize(buffer);
        }

        std::size_t min_wire_size() const noexcept override { return serializer_->min_wire_size(); }

    private:
        Member Struct::*member_;
        SerializerPtr<Member> serializer_;
    };

    template <typename Struct>
    using FieldPtr = std::shared_ptr<const FieldBinding<Struct>>;

    template <typename Struct, typename Member>
    FieldPtr<Struct> field(std::string name, Member Struct::*member, SerializerPtr<Member> serializer)
    {
        return std::make_shared<const MemberField<Struct, Member>>(std::move(name), member, std::move(serializer));
    }

    /// Positional: fields travel in declaration order with no names or count.
    template <typename Struct>
    class ObjectSerializer final : public Serializer<Struct>
    {
    public:
        explicit ObjectSerializer(std::vector<FieldPtr<Struct>> fields)
            : fields_(std::move(fields))
        {
            for (std::size_t i = 0; i < fields_.size(); ++i)
            {
                if (!fields_[i])
                {
                    throw Error(ErrorCode::MissingSerializer, "object field #" + std::to_string(i) + " is null");
                }
            }
        }

        Job<void> serialize(const Struct &value, ByteBuffer &buffer) const override
        {
            for (const auto &binding : fields_)
            {
                co_await binding->write(value, buffer);
            }
        }

        Job<Struct> deserialize(ByteBuffer &buffer) const override
        {
            Struct result{};
            for (const auto &binding : fields_)
            {
                co_await binding->read(result, buffer);
            }
            co_return result;
        }

        std::size_t min_wire_size() const noexcept override
        {
            std::size_t total = 0;
            for (const auto &binding : fields_)
            {
                total += binding->min_wire_size();
            }
            return total;
        }

        const std::vector<FieldPtr<Struct>> &fields() const noexcept { return fields_; }

    private:
        std::vector<FieldPtr<Struct>> fields_;
    };

    template <typename... Ts>
    class TupleSerializer final : public Serializer<std::tuple<Ts...>>
    {
    public:
        explicit TupleSerializer(SerializerPtr<Ts>... elements)
            : elements_(std::move(elements)...)
        {
            check_elements<0>();
        }

        Job<void> serialize(const std::tuple<Ts...> &value, ByteBuffer &buffer) const override
        {
            co_await write_from<0>(value, buffer);
        }

        Job<std::tuple<Ts...>> deserialize(ByteBuffer &buffer) const override
        {
            std::tuple<Ts...> result{};
            co_await read_from<0>(result, buffer);
            co_return result;
        }

        std::size_t min_wire_size() const noexcept override
        {
            return std::apply([](const auto &...element)
                              { return (std::size_t{0} + ... + element->min_wire_size()); },
                              elements_);
        }

    private:
        template <std::size_t I>
        void check_elements() const
        {
            if constexpr (I < sizeof...(Ts))
            {
                detail::require_child(std::get<I>(elements_), "tuple element #" + std::to_string(I));
                check_elements<I + 1>();
            }
        }

        template <std::size_t I>
        Job<void> write_from(const std::tuple<Ts...> &value, ByteBuffer &buffer) const
        {
            if constexpr (I < sizeof...(Ts))
            {
                co_await std::get<I>(elements_)->serialize(std::get<I>(value), buffer);
                co_await write_from<I + 1>(value, buffer);
            }
            co_return;
        }

        template <std::size_t I>
        Job<void> read_from(std::tuple<Ts...> &result, ByteBuffer &buffer) const
        {
            if constexpr (I < sizeof...(Ts))
            {
                std::get<I>(result) = co_await std::get<I>(elements_)->deserialize(buffer);
                co_await read_from<I + 1>(result, buffer);
            }
            co_return;
        }

        std::tuple<SerializerPtr<Ts>...> elements_;
    };

    template <typename T>
    class OptionalSerializer final : public Serializer<std::optional<T>>
    {
    public:
        explicit OptionalSerializer(SerializerPtr<T> inner)
            : inner_(std::move(inner))
        {
            detail::require_child(inner_, "optional value");
        }

        Job<void> serialize(const std::optional<T> &value, ByteBuffer &buffer) const override
        {
            const bool present = value.has_value();
            co_await flag_.serialize(present, buffer);
            if (present)
            {
                co_await inner_->serialize(*value, buffer);
            }
        }

        Job<std::optional<T>> deserialize(ByteBuffer &buffer) const override
        {
            const auto present = co_await flag_.deserialize(buffer);
            if (!present)
            {
                co_return std::nullopt;
            }
            co_return co_await inner_->deserialize(buffer);
        }

    private:
        SerializerPtr<T> inner_;
        BoolSerializer flag_;
    };

    namespace detail
    {

        /// Associative maps: a key repeated on the wire keeps its last value.
        template <typename MapType>
        struct MapAccess
        {
            using Key = typename MapType::key_type;
            using Value = typename MapType::mapped_type;

            static void put(MapType &map, Key key, Value value)
            {
                map.insert_or_assign(std::move(key), std::move(value));
            }
        };

        /// Insertion-ordered maps: entries stay in wire order. A repeated key
        /// keeps its first position and takes the last value.
        template <typename K, typename V, typename Allocator>
        struct MapAccess<std::vector<std::pair<K, V>, Allocator>>
        {
            using Key = K;
            using Value = V;

            static void put(std::vector<std::pair<K, V>, Allocator> &map, Key key, Value value)
            {
                const auto existing = std::find_if(map.begin(), map.end(), [&](const auto &entry)
                                                   { return entry.first == key; });
                if (existing != map.end())
                {
                    existing->second = std::move(value);
                    return;
                }
                map.emplace_back(std::move(key), std::move(value));
            }
        };

    } // namespace detail

    /// Serializes entries in the container's iteration order.
    template <typename MapType>
    class MapSerializer final : public Serializer<MapType>
    {
        using Access = detail::MapAccess<MapType>;
        using Key = typename Access::Key;
        using Value = typename Access::Value;

    public:
        MapSerializer(SerializerPtr<Key> key, SerializerPtr<Value> value)
            : key_(std::move(key)),
              value_(std::move(value))
        {
            detail::require_child(key_, "map key");
            detail::require_child(value_, "map value");
        }

        Job<void> serialize(const MapType &value, ByteBuffer &buffer) const override
        {
            const auto size = detail::collection_size(value.size());
            co_await varint_.serialize(size, buffer);
            for (const auto &[k, v] : value)
            {
                co_await key_->serialize(k, buffer);
                co_await value_->serialize(v, buffer);
                co_yield checkpoint;
            }
        }

        Job<MapType> deserialize(ByteBuffer &buffer) const override
        {
            const auto size = co_await varint_.deserialize(buffer);
            detail::require_entries(size, key_->min_wire_size() + value_->min_wire_size(), buffer);
            MapType result;
            for (std::uint32_t i = 0; i < size; ++i)
            {
                auto k = co_await key_->deserialize(buffer);
                auto v = co_await value_->deserialize(buffer);
                Access::put(result, std::move(k), std::move(v));
                co_yield checkpoint;
            }
            co_return result;
        }

    private:
        SerializerPtr<Key> key_;
        SerializerPtr<Value> value_;
        VarUInt32Serializer varint_;
    };

    /// Duplicates on the wire collapse on insert.
    template <typename SetType>
    class SetSerializer final : public Serializer<SetType>
    {
        using Element = typename SetType::value_type;

    public:
        explicit SetSerializer(SerializerPtr<Element> element)
            : element_(std::move(element))
        {
            detail::require_child(element_, "set element");
        }

        Job<void> serialize(const SetType &value, ByteBuffer &buffer) const override
        {
            const auto size = detail::collection_size(value.size());
            co_await varint_.serialize(size, buffer);
            for (const auto &item : value)
            {
                co_await element_->serialize(item, buffer);
                co_yield checkpoint;
            }
        }

        Job<SetType> deserialize(ByteBuffer &buffer) const override
        {
            const auto size = co_await varint_.deserialize(buffer);
            detail::require_entries(size, element_->min_wire_size(), buffer);
            SetType result;
            for (std::uint32_t i = 0; i < size; ++i)
            {
                result.insert(co_await element_->deserialize(buffer));
                co_yield checkpoint;
            }
            co_return result;
        }

    private:
        SerializerPtr<Element> element_;
        VarUInt32Serializer varint_;
    };

    template <typename T>
    SerializerPtr<std::vector<T>> array(SerializerPtr<T> element)
    {
        return std::make_shared<const ArraySerializer<T>>(std::move(element));
    }

    template <typename Struct>
    SerializerPtr<Struct> object(std::vector<FieldPtr<Struct>> fields)
    {
        return std::make_shared<const ObjectSerializer<Struct>>(std::move(fields));
    }

    template <typename... Ts>
    SerializerPtr<std::tuple<Ts...>> tuple(SerializerPtr<Ts>... elements)
    {
        return std::make_shared<const TupleSerializer<Ts...>>(std::move(elements)...);
    }

    template <typename T>
    SerializerPtr<std::optional<T>> optional(SerializerPtr<T> inner)
    {
        return std::make_shared<const OptionalSerializer<T>>(std::move(inner));
    }

    /// Defaults to an insertion-ordered vector of pairs; pass std::map or
    /// std::unordered_map as MapType for keyed lookup.
    template <typename K, typename V, typename MapType = std::vector<std::pair<K, V>>>
    SerializerPtr<MapType> map(SerializerPtr<K> key, SerializerPtr<V> value)
    {
        return std::make_shared<const MapSerializer<MapType>>(std::move(key), std::move(value));
    }

    template <typename T, typename SetType = std::set<T>>
    SerializerPtr<SetType> set(SerializerPtr<T> element)
    {
        return std::make_shared<const SetSerializer<SetType>>(std::move(element));
    }

} // namespace ipcwire::proto
