#pragma once

#include <vector>
#include <optional>

#include "script/script.h"
#include "uint256.h"
#include "crypto/sha256.h"

#include "common.hpp"

namespace tapvault::core {

extern const CSHA256 TAPLEAF_HASH;
extern const CSHA256 TAPBRANCH_HASH;

constexpr uint8_t TAPLEAF_VERSION = 0xc0;


uint256 TapLeafHash(const CScript &script);
uint256 TapBranchHash(const uint256& a, const uint256& b);

// Tapscript tree committed by pairing adjacent nodes level by level.
// An unpaired trailing node is carried to the next level unchanged. The shape
// matches BIP-341 canonical trees for up to two leaves only.
class ScriptMerkleTree {
    std::vector<CScript> mScripts;

    std::vector<uint256> CalculateLeafHashes() const;
public:
    explicit ScriptMerkleTree(std::vector<CScript>&& scripts);
    ScriptMerkleTree(const ScriptMerkleTree& ) = default;
    ScriptMerkleTree(ScriptMerkleTree&& ) noexcept = default;

    ScriptMerkleTree& operator=(const ScriptMerkleTree& ) = default;
    ScriptMerkleTree& operator=(ScriptMerkleTree&& ) noexcept = default;

    const std::vector<CScript>& GetScripts() const { return mScripts; }
    size_t GetLeafCount() const { return mScripts.size(); }

    // Empty for a single-leaf tree
    std::optional<uint256> CalculateRoot() const;

    // Sibling hashes from the leaf up to the root
    std::vector<uint256> CalculateScriptPath(size_t leaf_index) const;
    std::vector<uint256> CalculateScriptPath(const CScript& script) const;

    bytevector CalculateControlBlock(const xonly_pubkey& internal_pk, uint8_t parity, size_t leaf_index) const;
};


}
