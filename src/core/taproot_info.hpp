#pragma once

#include <optional>
#include <vector>
#include <string>

#include "script/script.h"
#include "uint256.h"

#include "common.hpp"
#include "utils.hpp"
#include "public_key.hpp"
#include "script_merkle_tree.hpp"

namespace tapvault::core {

constexpr uint32_t DEFAULT_LOCK_DELTA = 2000;
constexpr uint32_t DEFAULT_THRESHOLD = 2;

constexpr size_t THRESHOLD_LEAF = 0;
constexpr size_t TIMELOCK_LEAF = 1;

// <x0> CHECKSIG <x1> CHECKSIGADD ... <xn-1> CHECKSIGADD <k> NUMEQUAL
CScript MakeThresholdScript(const std::vector<xonly_pubkey>& pubkeys, uint32_t threshold);

// <lock_height> CHECKLOCKTIMEVERIFY DROP <x> CHECKSIG
CScript MakeTimelockScript(uint32_t lock_height, const xonly_pubkey& pk);


// Taproot output committing to an internal key and a two leaf script tree:
// the k-of-n threshold leaf and the timelock leaf spendable by the first participant.
// Immutable once created.
class TaprootInfo
{
    compressed_pubkey m_internal_pk;
    xonly_pubkey m_internal_xonly_pk;
    std::vector<xonly_pubkey> m_participants;
    uint32_t m_threshold;
    uint32_t m_lock_height;
    ScriptMerkleTree m_tree;
    std::optional<uint256> m_merkle_root;
    xonly_pubkey m_output_pk;
    uint8_t m_output_parity;

    TaprootInfo(compressed_pubkey internal_pk, std::vector<xonly_pubkey> participants, uint32_t threshold, uint32_t lock_height);

public:
    static const std::string name_address;
    static const std::string name_internal_pk;
    static const std::string name_internal_xonly_pk;
    static const std::string name_participants;
    static const std::string name_threshold;
    static const std::string name_lock_height;
    static const std::string name_leaves;
    static const std::string name_merkle_root;
    static const std::string name_output_pk;
    static const std::string name_output_parity;
    static const std::string name_control_blocks;

    // Internal key defaults to the first participant key
    static TaprootInfo Create(const std::vector<public_key>& pubkeys, uint32_t current_height,
                              uint32_t lock_delta = DEFAULT_LOCK_DELTA, uint32_t threshold = DEFAULT_THRESHOLD,
                              const std::optional<public_key>& internal_pk = {});

    TaprootInfo(const TaprootInfo&) = default;
    TaprootInfo(TaprootInfo&&) noexcept = default;

    const compressed_pubkey& GetInternalPubKey() const { return m_internal_pk; }
    const xonly_pubkey& GetInternalXOnlyPubKey() const { return m_internal_xonly_pk; }
    const std::vector<xonly_pubkey>& GetParticipants() const { return m_participants; }
    uint32_t GetThreshold() const { return m_threshold; }
    uint32_t GetLockHeight() const { return m_lock_height; }
    const std::vector<CScript>& GetLeaves() const { return m_tree.GetScripts(); }
    const CScript& GetLeaf(size_t leaf_index) const;
    const ScriptMerkleTree& GetScriptTree() const { return m_tree; }
    const std::optional<uint256>& GetMerkleRoot() const { return m_merkle_root; }
    const xonly_pubkey& GetOutputPubKey() const { return m_output_pk; }
    uint8_t GetOutputParity() const { return m_output_parity; }

    bytevector GetControlBlock(size_t leaf_index) const;
    CScript GetOutputScript() const;
    std::string GetAddress(const IBech32Coder& bech) const;

    std::string Serialize(const IBech32Coder& bech) const;
};

}
