#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace Tessera::Crypto {

using Byte = uint8_t;
using BytesSpan = std::span<const Byte>;
using Bytes = std::vector<Byte>;
using Hash256 = std::array<Byte, 32>;

inline BytesSpan as_span(std::string_view s)
{
    return BytesSpan(reinterpret_cast<const Byte*>(s.data()), s.size());
}

template <typename T>
inline uint8_t* u8ptr(T* p)
{
    return reinterpret_cast<uint8_t*>(p);
}

template <typename T>
inline const uint8_t* u8ptr(const T* p)
{
    return reinterpret_cast<const uint8_t*>(p);
}

inline const uint8_t* u8ptr(BytesSpan s)
{
    return s.data();
}

namespace Utils {

    Hash256 sha256(BytesSpan data);

    std::string to_hex(BytesSpan data);

    inline Bytes concat(std::initializer_list<BytesSpan> parts)
    {
        Bytes out;
        for (auto p : parts)
            out.insert(out.end(), p.begin(), p.end());
        return out;
    }

} // namespace Utils
} // namespace Tessera::Crypto
