#pragma once

#include <string>

#include "serialize.h"
#include "span.h"
#include "uint256.h"
#include "crypto/sha256.h"

namespace tapvault {

// Serializes objects into a hasher state copied from a precalculated midstate
template <typename H>
class HashWriter
{
    H mHash;
public:
    explicit HashWriter(const H& hashcache) : mHash(hashcache) {}

    void write(Span<const std::byte> src)
    { mHash.Write(reinterpret_cast<const unsigned char *>(src.data()), src.size()); }

    template <typename T>
    HashWriter& operator<<(const T& obj)
    {
        ::Serialize(*this, obj);
        return *this;
    }

    template <typename R>
    operator R()
    {
        R result;
        mHash.Finalize(result.begin());
        return result;
    }
};

// SHA256 midstate after SHA256(tag) || SHA256(tag)
inline CSHA256 PrecalculatedTaggedHash(const std::string &tag) noexcept
{
    uint256 taghash;
    CSHA256().Write((const unsigned char*)tag.data(), tag.size()).Finalize(taghash.begin());
    return CSHA256().Write(taghash.begin(), taghash.size()).Write(taghash.begin(), taghash.size());
}

inline uint256 TaggedHash(const std::string &tag, Span<const unsigned char> message)
{
    uint256 res;
    PrecalculatedTaggedHash(tag).Write(message.data(), message.size()).Finalize(res.begin());
    return res;
}

}
