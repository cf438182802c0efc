#pragma once

#include <optional>
#include <utility>

#include "uint256.h"
#include "crypto/sha256.h"

#include "common.hpp"

namespace tapvault::core {

extern const CSHA256 TAPTWEAK_HASH;

// Output key material of a key path spend. Holds the tweaked secret only when it
// was derived from a private key; the secret buffer is cleansed on release.
struct TweakedKeyMaterial
{
    std::optional<seckey> tweaked_sk;
    compressed_pubkey tweaked_pk;
    uint8_t parity = 0;

    TweakedKeyMaterial() = default;
    TweakedKeyMaterial(const TweakedKeyMaterial&) = delete;
    TweakedKeyMaterial(TweakedKeyMaterial&&) noexcept = default;

    TweakedKeyMaterial& operator=(const TweakedKeyMaterial&) = delete;
    TweakedKeyMaterial& operator=(TweakedKeyMaterial&&) noexcept = default;

    xonly_pubkey GetXOnlyPubKey() const
    { return xonly_pubkey(bytevector(tweaked_pk.begin() + 1, tweaked_pk.end())); }
};

uint256 TapTweakHash(const xonly_pubkey& internal_pk, const std::optional<uint256>& merkle_root);

TweakedKeyMaterial TweakPrivate(const seckey& sk, const xonly_pubkey& internal_pk, const std::optional<uint256>& merkle_root);

std::pair<xonly_pubkey, uint8_t> TweakPublic(const xonly_pubkey& internal_pk, const std::optional<uint256>& merkle_root);

}
