#include <algorithm>
#include <iterator>
#include <tuple>

#include "univalue.h"

#include "taproot_info.hpp"
#include "key_tweaker.hpp"
#include "transaction.hpp"

namespace tapvault::core {

namespace {

constexpr size_t MAX_PARTICIPANTS = 999;

}

const std::string TaprootInfo::name_address = "address";
const std::string TaprootInfo::name_internal_pk = "internal_pk";
const std::string TaprootInfo::name_internal_xonly_pk = "internal_xonly_pk";
const std::string TaprootInfo::name_participants = "participants";
const std::string TaprootInfo::name_threshold = "threshold";
const std::string TaprootInfo::name_lock_height = "lock_height";
const std::string TaprootInfo::name_leaves = "leaves";
const std::string TaprootInfo::name_merkle_root = "merkle_root";
const std::string TaprootInfo::name_output_pk = "output_pk";
const std::string TaprootInfo::name_output_parity = "output_parity";
const std::string TaprootInfo::name_control_blocks = "control_blocks";


CScript MakeThresholdScript(const std::vector<xonly_pubkey>& pubkeys, uint32_t threshold)
{
    CScript script;
    for (auto it = pubkeys.begin(); it != pubkeys.end(); ++it) {
        script << *it;
        script << ((it == pubkeys.begin()) ? OP_CHECKSIG : OP_CHECKSIGADD);
    }
    script << static_cast<int64_t>(threshold);
    script << OP_NUMEQUAL;
    return script;
}

CScript MakeTimelockScript(uint32_t lock_height, const xonly_pubkey& pk)
{
    CScript script;
    script << static_cast<int64_t>(lock_height);
    script << OP_CHECKLOCKTIMEVERIFY;
    script << OP_DROP;
    script << pk;
    script << OP_CHECKSIG;
    return script;
}


TaprootInfo::TaprootInfo(compressed_pubkey internal_pk, std::vector<xonly_pubkey> participants, uint32_t threshold, uint32_t lock_height)
    : m_internal_pk(std::move(internal_pk))
    , m_internal_xonly_pk(bytevector(m_internal_pk.begin() + 1, m_internal_pk.end()))
    , m_participants(std::move(participants))
    , m_threshold(threshold)
    , m_lock_height(lock_height)
    , m_tree(std::vector<CScript>{MakeThresholdScript(m_participants, m_threshold),
                                  MakeTimelockScript(m_lock_height, m_participants.front())})
    , m_merkle_root(m_tree.CalculateRoot())
    , m_output_parity(0)
{
    std::tie(m_output_pk, m_output_parity) = TweakPublic(m_internal_xonly_pk, m_merkle_root);
}

TaprootInfo TaprootInfo::Create(const std::vector<public_key>& pubkeys, uint32_t current_height,
                                uint32_t lock_delta, uint32_t threshold,
                                const std::optional<public_key>& internal_pk)
{
    if (pubkeys.empty() || pubkeys.size() > MAX_PARTICIPANTS) {
        throw IllegalArgumentError("Wrong participant key count: " + std::to_string(pubkeys.size()));
    }
    if (threshold == 0 || threshold > pubkeys.size()) {
        throw IllegalArgumentError("Wrong threshold: " + std::to_string(threshold) + " of " + std::to_string(pubkeys.size()));
    }
    if (static_cast<uint64_t>(current_height) + lock_delta >= LOCKTIME_THRESHOLD) {
        throw IllegalArgumentError("Lock height does not fit block height range: " + std::to_string(static_cast<uint64_t>(current_height) + lock_delta));
    }

    std::vector<xonly_pubkey> participants;
    participants.reserve(pubkeys.size());
    std::transform(pubkeys.begin(), pubkeys.end(), std::back_inserter(participants), GetXOnlyPubKey);

    std::vector<xonly_pubkey> sorted(participants);
    std::sort(sorted.begin(), sorted.end(), [](const xonly_pubkey& a, const xonly_pubkey& b) { return a.get_vector() < b.get_vector(); });
    if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end()) {
        throw IllegalArgumentError("Duplicate participant key");
    }

    compressed_pubkey internal = GetCompressedPubKey(internal_pk ? *internal_pk : pubkeys.front());

    return TaprootInfo(std::move(internal), std::move(participants), threshold, current_height + lock_delta);
}

const CScript& TaprootInfo::GetLeaf(size_t leaf_index) const
{
    if (leaf_index >= GetLeaves().size()) {
        throw IllegalArgumentError("Leaf index " + std::to_string(leaf_index) + " is out of the script tree");
    }
    return GetLeaves()[leaf_index];
}

bytevector TaprootInfo::GetControlBlock(size_t leaf_index) const
{
    return m_tree.CalculateControlBlock(m_internal_xonly_pk, m_output_parity, leaf_index);
}

CScript TaprootInfo::GetOutputScript() const
{
    return TaprootOutputScript(m_output_pk);
}

std::string TaprootInfo::GetAddress(const IBech32Coder& bech) const
{
    return bech.Encode(m_output_pk);
}

std::string TaprootInfo::Serialize(const IBech32Coder& bech) const
{
    UniValue info(UniValue::VOBJ);
    info.pushKV(name_address, GetAddress(bech));
    info.pushKV(name_internal_pk, hex(m_internal_pk));
    info.pushKV(name_internal_xonly_pk, hex(m_internal_xonly_pk));

    UniValue participants(UniValue::VARR);
    for (const auto& pk: m_participants) {
        participants.push_back(hex(pk));
    }
    info.pushKV(name_participants, participants);
    info.pushKV(name_threshold, static_cast<uint64_t>(m_threshold));
    info.pushKV(name_lock_height, static_cast<uint64_t>(m_lock_height));

    UniValue leaves(UniValue::VARR);
    UniValue control_blocks(UniValue::VARR);
    for (size_t i = 0; i < GetLeaves().size(); ++i) {
        leaves.push_back(hex(GetLeaves()[i]));
        control_blocks.push_back(hex(GetControlBlock(i)));
    }
    info.pushKV(name_leaves, leaves);
    info.pushKV(name_merkle_root, m_merkle_root ? hex(*m_merkle_root) : std::string());
    info.pushKV(name_output_pk, hex(m_output_pk));
    info.pushKV(name_output_parity, static_cast<uint64_t>(m_output_parity));
    info.pushKV(name_control_blocks, control_blocks);

    return info.write(2);
}

}
