#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <array>
#include <iostream>
#include <charconv>
#include <cassert>

#include "fixsizevector.hpp"

#include "uint256.h"
#include "support/allocators/secure.h"

#include "secp256k1_extrakeys.h"

#include "common_error.hpp"

class CScript;

namespace tapvault {

typedef std::vector<uint8_t> bytevector;
typedef std::vector<std::string> stringvector;


typedef cex::fixsize_vector<uint8_t, 32, secure_allocator<unsigned char>> seckey;
typedef cex::fixsize_vector<uint8_t, 33> compressed_pubkey;

class xonly_pubkey : public cex::fixsize_vector<uint8_t, 32>
{
public:
    typedef cex::fixsize_vector<uint8_t, 32> base;
    typedef base::base base_vector;

    xonly_pubkey() = default;
    xonly_pubkey(const xonly_pubkey&) = default;
    xonly_pubkey(xonly_pubkey&&) noexcept = default;
    xonly_pubkey(const base::base& v) : cex::fixsize_vector<uint8_t, 32>(v) {}
    xonly_pubkey(base::base&& v) noexcept : cex::fixsize_vector<uint8_t, 32>(std::move(v)) {}
    xonly_pubkey(const secp256k1_context *ctx, const secp256k1_xonly_pubkey &pk)
    : cex::fixsize_vector<uint8_t, 32>()
    { set(ctx, pk); }

    xonly_pubkey& operator=(const xonly_pubkey&) = default;
    xonly_pubkey& operator=(xonly_pubkey&&) = default;

    const base_vector& get_vector() const noexcept
    { return *this; }

    void set(const secp256k1_context *ctx, const secp256k1_xonly_pubkey &pk)
    {
        if (!secp256k1_xonly_pubkey_serialize(ctx, data(), &pk)) {
            throw KeyError("Cannot serialize x-only public key");
        }
    }

    secp256k1_xonly_pubkey get(const secp256k1_context *ctx) const {
        secp256k1_xonly_pubkey pk;
        if (!secp256k1_xonly_pubkey_parse(ctx, &pk, data())) {
            throw WrongKeyError("Not a valid x-only public key");
        }
        return pk;
    }

    // Checks BIP-340 signature. A 65 byte signature is checked by its first 64 bytes.
    bool verify(const secp256k1_context *ctx, const bytevector& sig, const uint256& msg) const;
};

CScript& operator<<(CScript& script, const xonly_pubkey& pk);

inline bool operator==(const xonly_pubkey& x, const xonly_pubkey& y)
{ return x.get_vector() == y.get_vector(); }

inline bool operator!=(const xonly_pubkey& x, const xonly_pubkey& y)
{ return !(x == y); }

class signature: public bytevector {
public:
    signature() : bytevector(65) { resize(64); }
};


extern const std::array<std::array<char, 2>, 256> byte_to_hex;

template<typename SPAN>
std::string hex(const SPAN& s)
{
    std::string res(s.size() * 2, '\0');

    char* it = res.data();
    for (uint8_t v : s) {
        *it = byte_to_hex[v][0];
        ++it;
        *it = byte_to_hex[v][1];
        ++it;
    }

    assert(it == res.data() + res.size());
    return res;
}

template<typename R>
R unhex(std::string_view str) {
    if (str.length()%2) {
        throw IllegalArgumentError("Wrong hex string length: " + std::string(str));
    }

    R res;
    res.resize(str.length() / 2);

    auto ins = res.begin();
    for (auto i = str.begin(); i != str.end(); i+=2) {
        auto conv_res = std::from_chars(i, i+2, *ins++, 16);
        if (conv_res.ec != std::errc() || conv_res.ptr != i+2) {
            throw IllegalArgumentError("Wrong hex string: " + std::string(str));
        }
    }
    return res;
}

}
