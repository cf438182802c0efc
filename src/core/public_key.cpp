#include "public_key.hpp"
#include "key_pair.hpp"

namespace tapvault::core {

public_key ParsePublicKey(const bytevector& bytes)
{
    const secp256k1_context* ctx = KeyPair::GetStaticSecp256k1Context();

    if (bytes.size() == 33) {
        if (bytes[0] != 0x02 && bytes[0] != 0x03) {
            throw WrongKeyError("Invalid compressed pubkey prefix (must be 0x02 or 0x03): " + hex(bytes));
        }
        secp256k1_pubkey pubkey;
        if (!secp256k1_ec_pubkey_parse(ctx, &pubkey, bytes.data(), bytes.size())) {
            throw WrongKeyError("Compressed pubkey is not on the curve: " + hex(bytes));
        }
        compressed_pubkey res;
        std::copy(bytes.begin(), bytes.end(), res.begin());
        return res;
    }
    else if (bytes.size() == 32) {
        xonly_pubkey res(bytes);
        res.get(ctx);
        return res;
    }

    throw WrongKeyError("Invalid pubkey length (must be 32 or 33 bytes): " + std::to_string(bytes.size()));
}

public_key ParsePublicKey(const std::string &hexstr)
{
    return ParsePublicKey(unhex<bytevector>(hexstr));
}

xonly_pubkey GetXOnlyPubKey(const public_key& pk)
{
    if (const auto* compressed = std::get_if<compressed_pubkey>(&pk)) {
        return xonly_pubkey(bytevector(compressed->begin() + 1, compressed->end()));
    }
    return std::get<xonly_pubkey>(pk);
}

compressed_pubkey GetCompressedPubKey(const public_key& pk, uint8_t parity)
{
    if (const auto* compressed = std::get_if<compressed_pubkey>(&pk)) {
        return *compressed;
    }

    const auto& xonly = std::get<xonly_pubkey>(pk);
    compressed_pubkey res;
    res[0] = 0x02 | (parity & 1);
    std::copy(xonly.begin(), xonly.end(), res.begin() + 1);
    return res;
}

}
