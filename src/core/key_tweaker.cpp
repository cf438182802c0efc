#include "secp256k1.h"
#include "secp256k1_extrakeys.h"

#include "support/cleanse.h"

#include "key_tweaker.hpp"
#include "key_pair.hpp"
#include "hash_helper.hpp"

namespace tapvault::core {

const CSHA256 TAPTWEAK_HASH = PrecalculatedTaggedHash("TapTweak");

uint256 TapTweakHash(const xonly_pubkey& internal_pk, const std::optional<uint256>& merkle_root)
{
    HashWriter hash(TAPTWEAK_HASH);
    hash << Span(internal_pk);
    if (merkle_root.has_value()) {
        hash << *merkle_root;
    }
    return hash;
}

TweakedKeyMaterial TweakPrivate(const seckey& sk, const xonly_pubkey& internal_pk, const std::optional<uint256>& merkle_root)
{
    const secp256k1_context* ctx = KeyPair::GetStaticSecp256k1Context();
    uint256 tweak = TapTweakHash(internal_pk, merkle_root);

    TweakedKeyMaterial res;
    res.tweaked_sk.emplace();

    secp256k1_keypair keypair;
    secp256k1_pubkey tweaked_pubkey;

    try {
        if (!secp256k1_keypair_create(ctx, &keypair, sk.data())) {
            throw WrongKeyError("Private key is out of range");
        }

        // The secret is negated first when its point has odd Y, as BIP-341 requires
        if (!secp256k1_keypair_xonly_tweak_add(ctx, &keypair, tweak.data())) {
            throw TweakError("Tweaked private key is zero or out of range");
        }

        if (!secp256k1_keypair_sec(ctx, res.tweaked_sk->data(), &keypair)) {
            throw KeyError("Cannot extract tweaked private key");
        }

        if (!secp256k1_keypair_pub(ctx, &tweaked_pubkey, &keypair)) {
            throw KeyError("Cannot extract tweaked public key");
        }

        memory_cleanse(&keypair, sizeof(keypair));
    }
    catch(...) {
        memory_cleanse(&keypair, sizeof(keypair));
        std::rethrow_exception(std::current_exception());
    }

    size_t len = res.tweaked_pk.size();
    if (!secp256k1_ec_pubkey_serialize(ctx, res.tweaked_pk.data(), &len, &tweaked_pubkey, SECP256K1_EC_COMPRESSED)) {
        throw KeyError("Cannot serialize tweaked public key");
    }
    res.parity = (res.tweaked_pk[0] == 0x03) ? 1 : 0;

    return res;
}

std::pair<xonly_pubkey, uint8_t> TweakPublic(const xonly_pubkey& internal_pk, const std::optional<uint256>& merkle_root)
{
    const secp256k1_context* ctx = KeyPair::GetStaticSecp256k1Context();
    uint256 tweak = TapTweakHash(internal_pk, merkle_root);

    secp256k1_xonly_pubkey pubkey = internal_pk.get(ctx);

    secp256k1_pubkey out;
    if (!secp256k1_xonly_pubkey_tweak_add(ctx, &out, &pubkey, tweak.data())) {
        throw TweakError("Tweaked public key is invalid");
    }

    int parity = -1;
    secp256k1_xonly_pubkey out_xonly;
    if (!secp256k1_xonly_pubkey_from_pubkey(ctx, &out_xonly, &parity, &out)) {
        throw KeyError("Cannot derive tweaked x-only public key");
    }

    return std::make_pair(xonly_pubkey(ctx, out_xonly), static_cast<uint8_t>(parity));
}

}
