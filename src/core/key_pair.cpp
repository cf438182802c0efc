#include "secp256k1.h"
#include "secp256k1_schnorrsig.h"

#include "random.h"
#include "support/allocators/secure.h"
#include "support/cleanse.h"

#include "key_pair.hpp"
#include "transaction.hpp"

#include <mutex>
#include <atomic>

namespace tapvault::core {

namespace {

std::atomic<secp256k1_context*> ctx = nullptr;
std::mutex ctx_mutex;

}

const secp256k1_context *KeyPair::GetStaticSecp256k1Context()
{
    secp256k1_context* res = ctx.load();
    if (!res) {
        std::lock_guard lock(ctx_mutex);
        res = ctx.load();
        if (!res) {
            res = secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
            std::vector<unsigned char, secure_allocator<unsigned char>> vseed(32);
            RandomInit();
            GetRandBytes(Span<unsigned char>(vseed.data(), vseed.size()));
            if (!secp256k1_context_randomize(res, vseed.data())) {
                secp256k1_context_destroy(res);
                throw CryptoError("secp256k1 context randomization error");
            }
            ctx = res;
        }
    }
    return res;
}

void KeyPair::CachePubkey()
{
    secp256k1_pubkey pubkey;
    if (!secp256k1_ec_pubkey_create(m_ctx, &pubkey, m_sk.data())) {
        throw WrongKeyError("Private key is out of range");
    }

    size_t len = m_compressed_pk.size();
    if (!secp256k1_ec_pubkey_serialize(m_ctx, m_compressed_pk.data(), &len, &pubkey, SECP256K1_EC_COMPRESSED)) {
        throw KeyError("Cannot serialize public key");
    }

    secp256k1_xonly_pubkey xonly_pubkey;
    if (!secp256k1_xonly_pubkey_from_pubkey(m_ctx, &xonly_pubkey, nullptr, &pubkey)) {
        throw KeyError("Cannot derive x-only public key");
    }

    m_pk.set(m_ctx, xonly_pubkey);
}

seckey KeyPair::GetStrongRandomKey(const secp256k1_context* ctx)
{
    seckey key;
    do {
        GetStrongRandBytes(Span<unsigned char>(key.data(), key.size()));
    } while (!secp256k1_ec_seckey_verify(ctx, key.data()));
    return key;
}

signature KeyPair::SignSchnorr(const uint256& data) const
{
    signature sig;
    seckey aux = GetStrongRandomKey(m_ctx);

    secp256k1_keypair keypair;
    if (!secp256k1_keypair_create(m_ctx, &keypair, m_sk.data())) throw WrongKeyError("Private key is out of range");

    bool ret = secp256k1_schnorrsig_sign32(m_ctx, sig.data(), data.data(), &keypair, aux.data());
    if (ret) {
        // Additional verification step to prevent using a potentially corrupted signature
        secp256k1_xonly_pubkey pubkey_verify;
        ret = secp256k1_keypair_xonly_pub(m_ctx, &pubkey_verify, nullptr, &keypair);
        ret &= secp256k1_schnorrsig_verify(m_ctx, sig.data(), data.data(), data.size(), &pubkey_verify);
    }
    if (!ret) memory_cleanse(sig.data(), sig.size());
    memory_cleanse(&keypair, sizeof(keypair));

    if (!ret) throw SignatureError("Signing error");

    return sig;
}

signature KeyPair::SignTaprootTx(const CMutableTransaction &tx, uint32_t nin, std::vector<CTxOut> spent_outputs,
                                 const CScript& spend_script, int hashtype) const
{
    uint256 sighash = TaprootSighash(tx, nin, std::move(spent_outputs), spend_script, hashtype);

    signature sig = SignSchnorr(sighash);

    if(hashtype) {
        sig.push_back(static_cast<uint8_t>(hashtype));
    }

    return sig;
}

}
