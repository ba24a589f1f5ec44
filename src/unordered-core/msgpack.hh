#pragma once

#include <unordered-core/fixed_array.hh>
#include <unordered-core/fwd.hh>
#include <unordered-core/unordered_tuple.hh>

#include <msgpack.hpp>

#include <cstdint>
#include <format>
#include <string>
#include <utility>

// =========================================================================================================
// MessagePack binding
// =========================================================================================================
//
// unordered_tuple<T, N> travels as a msgpack array of exactly N elements in storage order, each
// element in T's own msgpack form. Nothing else is added:
//
//   msgpack::sbuffer buf;
//   msgpack::pack(buf, uc::unordered_pair<int>{0, 1}); // 0x92 0x00 0x01
//
//   auto oh = msgpack::unpack(buf.data(), buf.size());
//   auto edge = oh.get().as<uc::unordered_pair<int>>();
//
// Converting checks the array length before any element is looked at and throws
// uc::length_mismatch_error on a different count. Everything else (not an array, element type
// errors, truncated input during unpack) is msgpack's own exception, passed through unchanged.
// A failed convert leaves the target tuple untouched.
//

namespace uc
{
/// Thrown when a msgpack array does not hold exactly as many elements as the target tuple.
/// Derives from msgpack::type_error, so generic msgpack error handling still catches it.
struct length_mismatch_error : msgpack::type_error
{
    length_mismatch_error(isize expected, u64 actual)
      : expected(expected),
        actual(actual),
        _message(std::format("wrong number of elements (expected {}, got {})", expected, actual))
    {
    }

    [[nodiscard]] char const* what() const noexcept override { return _message.c_str(); }

    isize expected;
    u64 actual;

private:
    std::string _message;
};
} // namespace uc

namespace msgpack
{
MSGPACK_API_VERSION_NAMESPACE(MSGPACK_DEFAULT_API_NS)
{
    namespace adaptor
    {
    template <class T, uc::isize N>
    struct convert<uc::unordered_tuple<T, N>>
    {
        msgpack::object const& operator()(msgpack::object const& o, uc::unordered_tuple<T, N>& v) const
        {
            if (o.type != msgpack::type::ARRAY)
                throw msgpack::type_error();

            if (uc::u64(o.via.array.size) != uc::u64(N))
                throw uc::length_mismatch_error(N, o.via.array.size);

            // built in full before assigning, elements are converted left to right
            v = [&]<std::size_t... I>(std::index_sequence<I...>)
            {
                return uc::unordered_tuple<T, N>(uc::fixed_array<T, N>{o.via.array.ptr[I].template as<T>()...});
            }(std::make_index_sequence<std::size_t(N)>{});

            return o;
        }
    };

    template <class T, uc::isize N>
    struct pack<uc::unordered_tuple<T, N>>
    {
        static_assert(N <= uc::isize(UINT32_MAX), "msgpack arrays hold at most 2^32 - 1 elements");

        template <class Stream>
        msgpack::packer<Stream>& operator()(msgpack::packer<Stream>& o, uc::unordered_tuple<T, N> const& v) const
        {
            o.pack_array(uint32_t(N));
            for (auto const& e : v)
                o.pack(e);
            return o;
        }
    };

    template <class T, uc::isize N>
    struct object_with_zone<uc::unordered_tuple<T, N>>
    {
        void operator()(msgpack::object::with_zone& o, uc::unordered_tuple<T, N> const& v) const
        {
            o.type = msgpack::type::ARRAY;
            if constexpr (N == 0)
            {
                o.via.array.ptr = MSGPACK_NULLPTR;
                o.via.array.size = 0;
            }
            else
            {
                auto p = static_cast<msgpack::object*>(
                    o.zone.allocate_align(sizeof(msgpack::object) * N, MSGPACK_ZONE_ALIGNOF(msgpack::object)));
                o.via.array.ptr = p;
                o.via.array.size = uint32_t(N);
                for (auto const& e : v)
                    *p++ = msgpack::object(e, o.zone);
            }
        }
    };
    } // namespace adaptor
}
} // namespace msgpack
