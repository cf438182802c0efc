#include "transaction.hpp"
#include "script_merkle_tree.hpp"

namespace tapvault::core {

uint256 TaprootSighash(const CMutableTransaction &tx, uint32_t nin, std::vector<CTxOut> spent_outputs,
                       const CScript &spend_script, int hashtype)
{
    if (nin >= tx.vin.size()) {
        throw TransactionError("Input index is out of range: " + std::to_string(nin));
    }
    if (spent_outputs.size() != tx.vin.size()) {
        throw TransactionError("Spent outputs count does not match inputs count");
    }

    uint256 sighash;
    PrecomputedTransactionData txdata;
    txdata.Init(tx, std::move(spent_outputs), true);

    ScriptExecutionData execdata;
    execdata.m_annex_init = true;
    execdata.m_annex_present = false; // Only support annex-less signing for now.

    if(!spend_script.empty()) {
        execdata.m_codeseparator_pos_init = true;
        execdata.m_codeseparator_pos = 0xFFFFFFFF; // Only support non-OP_CODESEPARATOR BIP342 signing for now.
        execdata.m_tapleaf_hash_init = true;
        execdata.m_tapleaf_hash = TapLeafHash(spend_script);
    }

    SigVersion sigversion = spend_script.empty() ? SigVersion::TAPROOT : SigVersion::TAPSCRIPT;

    if(!SignatureHashSchnorr(sighash, execdata, tx, nin, static_cast<uint8_t>(hashtype), sigversion, txdata, MissingDataBehavior::FAIL)) {
        throw TransactionError("Sighash generation error");
    }
    return sighash;
}

CScript TaprootOutputScript(const xonly_pubkey& pk)
{
    CScript script;
    script << OP_1 << pk;
    return script;
}

xonly_pubkey GetTaprootPubKey(const CTxOut &out)
{
    int witversion;
    bytevector witnessprogram;
    if (!out.scriptPubKey.IsWitnessProgram(witversion, witnessprogram)) {
        throw TransactionError("Not SegWit output");
    }
    if (witversion != 1 || witnessprogram.size() != 32) {
        throw TransactionError("Wrong SegWit version: " + std::to_string(witversion));
    }
    return xonly_pubkey(std::move(witnessprogram));
}

} // tapvault::core
