#pragma once

#include <vector>

#include "secp256k1.h"
#include "secp256k1_extrakeys.h"

#include "primitives/transaction.h"
#include "script/interpreter.h"

#include "common.hpp"
#include "common_error.hpp"

namespace tapvault::core {

class KeyPair
{
    const secp256k1_context* m_ctx;
    seckey m_sk;
    xonly_pubkey m_pk;
    compressed_pubkey m_compressed_pk;

    void CachePubkey();
public:
    static const secp256k1_context* GetStaticSecp256k1Context();
    static seckey GetStrongRandomKey(const secp256k1_context* ctx);

    explicit KeyPair(): m_ctx(GetStaticSecp256k1Context()), m_sk(GetStrongRandomKey(m_ctx)) { CachePubkey(); }
    explicit KeyPair(seckey sk): m_ctx(GetStaticSecp256k1Context()), m_sk(std::move(sk)) { CachePubkey(); }

    KeyPair(const KeyPair&) = default;
    KeyPair(KeyPair&&) noexcept = default;

    KeyPair& operator=(const KeyPair&) = default;
    KeyPair& operator=(KeyPair&&) noexcept = default;

    const secp256k1_context* Secp256k1Context() const noexcept
    { return m_ctx; }

    const seckey& GetPrivKey() const
    { return m_sk; }

    const xonly_pubkey& GetPubKey() const
    { return m_pk; }

    const compressed_pubkey& GetCompressedPubKey() const
    { return m_compressed_pk; }

    signature SignSchnorr(const uint256& data) const;

    signature SignTaprootTx(const CMutableTransaction &tx, uint32_t nin, std::vector<CTxOut> spent_outputs,
                            const CScript &spend_script, int hashtype = SIGHASH_DEFAULT) const;
};

}
