#include <algorithm>
#include <iterator>

#include "script_merkle_tree.hpp"
#include "hash_helper.hpp"
#include "common_error.hpp"


namespace tapvault::core {

const CSHA256 TAPLEAF_HASH = PrecalculatedTaggedHash("TapLeaf");
const CSHA256 TAPBRANCH_HASH = PrecalculatedTaggedHash("TapBranch");

namespace {

std::vector<uint256> NextLevel(const std::vector<uint256>& level)
{
    std::vector<uint256> next;
    next.reserve((level.size() + 1) / 2);
    for (size_t i = 0; i < level.size(); i += 2) {
        if (i + 1 < level.size()) {
            next.push_back(TapBranchHash(level[i], level[i + 1]));
        }
        else {
            next.push_back(level[i]);
        }
    }
    return next;
}

}

uint256 TapBranchHash(const uint256& a, const uint256& b)
{
    HashWriter writer(TAPBRANCH_HASH);
    if (a < b) {
        writer << a << b;
    } else {
        writer << b << a;
    }
    return writer;
}

uint256 TapLeafHash(const CScript &script)
{
    HashWriter writer(TAPLEAF_HASH);
    writer << TAPLEAF_VERSION << script;
    return writer;
}

ScriptMerkleTree::ScriptMerkleTree(std::vector<CScript>&& scripts) : mScripts(std::move(scripts))
{
    if (mScripts.empty()) {
        throw IllegalArgumentError("Script tree has no leaves");
    }
}

std::vector<uint256> ScriptMerkleTree::CalculateLeafHashes() const
{
    std::vector<uint256> hashes;
    hashes.reserve(mScripts.size());
    std::transform(mScripts.begin(), mScripts.end(), std::back_inserter(hashes), TapLeafHash);
    return hashes;
}

std::optional<uint256> ScriptMerkleTree::CalculateRoot() const
{
    if (mScripts.size() == 1) {
        return {};
    }

    std::vector<uint256> level = CalculateLeafHashes();
    while (level.size() > 1) {
        level = NextLevel(level);
    }
    return level.front();
}

std::vector<uint256> ScriptMerkleTree::CalculateScriptPath(size_t leaf_index) const
{
    if (leaf_index >= mScripts.size()) {
        throw IllegalArgumentError("Leaf index " + std::to_string(leaf_index) + " is out of the script tree");
    }

    std::vector<uint256> path;
    std::vector<uint256> level = CalculateLeafHashes();

    for (size_t idx = leaf_index; level.size() > 1; idx /= 2) {
        size_t sibling = (idx % 2) ? idx - 1 : idx + 1;
        if (sibling < level.size()) {
            path.push_back(level[sibling]);
        }
        level = NextLevel(level);
    }

    return path;
}

std::vector<uint256> ScriptMerkleTree::CalculateScriptPath(const CScript &script) const
{
    auto it = std::find(mScripts.begin(), mScripts.end(), script);
    if (it == mScripts.end()) {
        throw IllegalArgumentError("The script was not found at the script tree");
    }
    return CalculateScriptPath(static_cast<size_t>(it - mScripts.begin()));
}

bytevector ScriptMerkleTree::CalculateControlBlock(const xonly_pubkey& internal_pk, uint8_t parity, size_t leaf_index) const
{
    std::vector<uint256> scriptpath = CalculateScriptPath(leaf_index);

    bytevector controlblock = {static_cast<uint8_t>(TAPLEAF_VERSION | (parity & 1))};
    controlblock.reserve(1 + internal_pk.size() + scriptpath.size() * uint256::size());
    controlblock.insert(controlblock.end(), internal_pk.begin(), internal_pk.end());

    for (const uint256& branchhash: scriptpath) {
        controlblock.insert(controlblock.end(), branchhash.begin(), branchhash.end());
    }

    return controlblock;
}

}
