#pragma once

#include <vector>

#include "primitives/transaction.h"
#include "script/interpreter.h"

#include "common.hpp"

namespace tapvault::core {

// BIP-341 signature digest. An empty spend_script selects the key path, otherwise
// the digest commits to the tapleaf of spend_script.
uint256 TaprootSighash(const CMutableTransaction &tx, uint32_t nin, std::vector<CTxOut> spent_outputs,
                       const CScript &spend_script, int hashtype = SIGHASH_DEFAULT);

CScript TaprootOutputScript(const xonly_pubkey& pk);
// Throws TransactionError when the output is not a segwit v1 output
xonly_pubkey GetTaprootPubKey(const CTxOut& out);

} // tapvault::core
