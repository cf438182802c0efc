#pragma once

#include <variant>
#include <string>

#include "common.hpp"

namespace tapvault::core {

// Either a compressed SEC1 key (parity prefix + x) or a BIP-340 x-only key with unknown parity
typedef std::variant<compressed_pubkey, xonly_pubkey> public_key;

public_key ParsePublicKey(const bytevector& bytes);
public_key ParsePublicKey(const std::string& hex);

xonly_pubkey GetXOnlyPubKey(const public_key& pk);

// x-only keys resolve to even parity (0x02) unless the parity is known
compressed_pubkey GetCompressedPubKey(const public_key& pk, uint8_t parity = 0);

inline bool IsXOnly(const public_key& pk)
{ return std::holds_alternative<xonly_pubkey>(pk); }

}
