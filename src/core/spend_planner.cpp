#include <algorithm>
#include <iterator>

#include "spend_planner.hpp"
#include "key_pair.hpp"
#include "key_tweaker.hpp"
#include "transaction.hpp"

namespace tapvault::core {

namespace {

void CheckHashType(int hashtype)
{
    bool valid = (hashtype >= SIGHASH_DEFAULT && hashtype <= SIGHASH_SINGLE) ||
                 (hashtype >= (SIGHASH_ANYONECANPAY | SIGHASH_ALL) && hashtype <= (SIGHASH_ANYONECANPAY | SIGHASH_SINGLE));
    if (!valid) {
        throw IllegalArgumentError("Wrong sighash type: " + std::to_string(hashtype));
    }
}

// 64 byte signature commits to SIGHASH_DEFAULT, 65 byte one carries an explicit sighash type
int SignatureHashType(const bytevector& sig)
{
    if (sig.size() == 64) {
        return SIGHASH_DEFAULT;
    }
    if (sig.size() == 65) {
        if (sig.back() == SIGHASH_DEFAULT) {
            throw IllegalArgumentError("Explicit SIGHASH_DEFAULT byte is not allowed");
        }
        CheckHashType(sig.back());
        return sig.back();
    }
    throw IllegalArgumentError("Wrong signature size: " + std::to_string(sig.size()));
}

bool CheckSignature(const xonly_pubkey& pk, const bytevector& sig, const CMutableTransaction& tx, uint32_t nin,
                    const std::vector<CTxOut>& spent_outputs, const CScript& spend_script)
{
    uint256 sighash = TaprootSighash(tx, nin, spent_outputs, spend_script, SignatureHashType(sig));
    return pk.verify(KeyPair::GetStaticSecp256k1Context(), sig, sighash);
}

void VerifySignature(const xonly_pubkey& pk, const bytevector& sig, const CMutableTransaction& tx, uint32_t nin,
                     const std::vector<CTxOut>& spent_outputs, const CScript& spend_script)
{
    if (!CheckSignature(pk, sig, tx, nin, spent_outputs, spend_script)) {
        throw IllegalArgumentError("Signature does not match the key: " + hex(pk));
    }
}

}

const char* ToString(SpendKind kind)
{
    switch (kind) {
    case SpendKind::SCRIPT_PATH_THRESHOLD: return "ScriptPathThreshold";
    case SpendKind::SCRIPT_PATH_TIMELOCK: return "ScriptPathTimelock";
    case SpendKind::KEY_PATH: return "KeyPath";
    }
    return "Unknown";
}

const char* ToString(SpendState state)
{
    switch (state) {
    case SpendState::REQUESTED: return "Requested";
    case SpendState::VALIDATED: return "Validated";
    case SpendState::WITNESS_BUILT: return "WitnessBuilt";
    case SpendState::REJECTED: return "Rejected";
    }
    return "Unknown";
}

const char* ToString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::NONE: return "None";
    case ErrorKind::INPUT_VALIDATION: return "InputValidation";
    case ErrorKind::PRECONDITION_FAILURE: return "PreconditionFailure";
    case ErrorKind::CRYPTO_FAILURE: return "CryptoFailure";
    case ErrorKind::INTERNAL_FAILURE: return "InternalFailure";
    }
    return "Unknown";
}

CMutableTransaction SpendPlan::SignedTransaction() const
{
    if (!IsBuilt()) {
        throw PreconditionError(std::string("Witness is not built, spend state: ") + ToString(state));
    }
    CMutableTransaction res = tx;
    res.vin[nin].scriptWitness.stack = witness;
    return res;
}


void SpendPlanner::ValidateTransaction(const SpendRequest& request) const
{
    if (request.nin >= request.tx.vin.size()) {
        throw TransactionError("Input index is out of range: " + std::to_string(request.nin));
    }
    if (request.spent_outputs.size() != request.tx.vin.size()) {
        throw TransactionError("Spent outputs count " + std::to_string(request.spent_outputs.size()) +
                               " does not match inputs count " + std::to_string(request.tx.vin.size()));
    }
    xonly_pubkey spent_pk = GetTaprootPubKey(request.spent_outputs[request.nin]);
    if (spent_pk != m_info.GetOutputPubKey()) {
        throw TransactionError("Spent output key does not match the taproot output key: " + hex(spent_pk));
    }
    if (!request.signatures.empty() && !request.signing_keys.empty()) {
        throw IllegalArgumentError("Both signatures and signing keys are supplied");
    }
    if (request.signatures.empty() && request.signing_keys.empty()) {
        throw IllegalArgumentError("Neither signatures nor signing keys are supplied");
    }
    CheckHashType(request.hashtype);
}

CMutableTransaction SpendPlanner::PrepareTimelockTransaction(const CMutableTransaction& tx, uint32_t nin) const
{
    if (nin >= tx.vin.size()) {
        throw TransactionError("Input index is out of range: " + std::to_string(nin));
    }
    if (tx.nLockTime >= LOCKTIME_THRESHOLD) {
        throw TransactionError("Transaction locktime is a timestamp: " + std::to_string(tx.nLockTime));
    }

    CMutableTransaction res = tx;
    if (res.nLockTime < m_info.GetLockHeight()) {
        res.nLockTime = m_info.GetLockHeight();
    }
    if (res.vin[nin].nSequence == CTxIn::SEQUENCE_FINAL) {
        res.vin[nin].nSequence = CTxIn::SEQUENCE_FINAL - 1;
    }
    return res;
}

void SpendPlanner::BuildThresholdWitness(const SpendRequest& request, SpendPlan& plan) const
{
    const auto& participants = m_info.GetParticipants();
    const CScript& leaf = m_info.GetLeaf(THRESHOLD_LEAF);
    const size_t threshold = m_info.GetThreshold();

    std::vector<bytevector> slots(participants.size());

    if (!request.signatures.empty()) {
        if (request.signatures.size() != participants.size()) {
            throw PreconditionError("Signature slot count " + std::to_string(request.signatures.size()) +
                                    " does not match participant count " + std::to_string(participants.size()));
        }
        size_t count = std::count_if(request.signatures.begin(), request.signatures.end(), [](const bytevector& s) { return !s.empty(); });
        if (count > threshold) {
            throw PreconditionError("Too many signatures: " + std::to_string(count) + " of " + std::to_string(threshold));
        }
        if (count < threshold) {
            throw PreconditionError("Not enough signatures: " + std::to_string(count) + " of " + std::to_string(threshold));
        }
        for (size_t i = 0; i < participants.size(); ++i) {
            const bytevector& sig = request.signatures[i];
            if (sig.empty() || CheckSignature(participants[i], sig, plan.tx, plan.nin, request.spent_outputs, leaf)) {
                continue;
            }
            // A signature of another participant placed into this slot breaks the key order
            for (size_t j = 0; j < participants.size(); ++j) {
                if (j != i && CheckSignature(participants[j], sig, plan.tx, plan.nin, request.spent_outputs, leaf)) {
                    throw PreconditionError("Signature of participant " + std::to_string(j) + " is in slot " + std::to_string(i));
                }
            }
            throw IllegalArgumentError("Signature does not match the key: " + hex(participants[i]));
        }
        plan.state = SpendState::VALIDATED;
        slots = request.signatures;
    }
    else {
        if (request.signing_keys.size() > threshold) {
            throw PreconditionError("Too many signing keys: " + std::to_string(request.signing_keys.size()) + " of " + std::to_string(threshold));
        }
        if (request.signing_keys.size() < threshold) {
            throw PreconditionError("Not enough signing keys: " + std::to_string(request.signing_keys.size()) + " of " + std::to_string(threshold));
        }

        std::vector<std::pair<size_t, KeyPair>> signers;
        for (const auto& sk: request.signing_keys) {
            KeyPair keypair(sk);
            auto it = std::find(participants.begin(), participants.end(), keypair.GetPubKey());
            if (it == participants.end()) {
                throw WrongKeyError("Signing key does not belong to a participant: " + hex(keypair.GetPubKey()));
            }
            size_t idx = it - participants.begin();
            if (std::any_of(signers.begin(), signers.end(), [idx](const auto& s) { return s.first == idx; })) {
                throw IllegalArgumentError("Duplicate signing key: " + hex(keypair.GetPubKey()));
            }
            signers.emplace_back(idx, std::move(keypair));
        }
        plan.state = SpendState::VALIDATED;

        for (const auto& signer: signers) {
            slots[signer.first] = signer.second.SignTaprootTx(plan.tx, plan.nin, request.spent_outputs, leaf, request.hashtype);
        }
    }

    // The first CHECKSIG consumes the stack top, so the slot of the first key goes last
    plan.witness.assign(slots.rbegin(), slots.rend());
    plan.witness.emplace_back(leaf.begin(), leaf.end());
    plan.witness.emplace_back(m_info.GetControlBlock(THRESHOLD_LEAF));
}

void SpendPlanner::BuildTimelockWitness(const SpendRequest& request, SpendPlan& plan) const
{
    if (request.chain_height < m_info.GetLockHeight()) {
        throw PreconditionError("Chain height " + std::to_string(request.chain_height) +
                                " is below the lock height " + std::to_string(m_info.GetLockHeight()));
    }

    plan.tx = PrepareTimelockTransaction(plan.tx, plan.nin);
    if (plan.tx.nLockTime > request.chain_height) {
        throw PreconditionError("Transaction locktime " + std::to_string(plan.tx.nLockTime) +
                                " is above the chain height " + std::to_string(request.chain_height));
    }

    if (request.signatures.size() + request.signing_keys.size() != 1) {
        throw PreconditionError("Timelock spend takes exactly one signature or signing key, got " +
                                std::to_string(request.signatures.size() + request.signing_keys.size()));
    }

    const xonly_pubkey& timelock_pk = m_info.GetParticipants().front();
    const CScript& leaf = m_info.GetLeaf(TIMELOCK_LEAF);

    bytevector sig;
    if (!request.signatures.empty()) {
        VerifySignature(timelock_pk, request.signatures.front(), plan.tx, plan.nin, request.spent_outputs, leaf);
        plan.state = SpendState::VALIDATED;
        sig = request.signatures.front();
    }
    else {
        KeyPair keypair(request.signing_keys.front());
        if (keypair.GetPubKey() != timelock_pk) {
            throw WrongKeyError("Signing key does not match the timelock key: " + hex(keypair.GetPubKey()));
        }
        plan.state = SpendState::VALIDATED;
        sig = keypair.SignTaprootTx(plan.tx, plan.nin, request.spent_outputs, leaf, request.hashtype);
    }

    plan.witness.clear();
    plan.witness.emplace_back(std::move(sig));
    plan.witness.emplace_back(leaf.begin(), leaf.end());
    plan.witness.emplace_back(m_info.GetControlBlock(TIMELOCK_LEAF));
}

void SpendPlanner::BuildKeyPathWitness(const SpendRequest& request, SpendPlan& plan) const
{
    if (request.signatures.size() + request.signing_keys.size() != 1) {
        throw IllegalArgumentError("Key path spend takes exactly one signature or internal private key");
    }

    bytevector sig;
    if (!request.signatures.empty()) {
        VerifySignature(m_info.GetOutputPubKey(), request.signatures.front(), plan.tx, plan.nin, request.spent_outputs, CScript());
        plan.state = SpendState::VALIDATED;
        sig = request.signatures.front();
    }
    else {
        const seckey& internal_sk = request.signing_keys.front();
        if (KeyPair(internal_sk).GetPubKey() != m_info.GetInternalXOnlyPubKey()) {
            throw WrongKeyError("Signing key does not match the internal key: " + hex(m_info.GetInternalXOnlyPubKey()));
        }
        plan.state = SpendState::VALIDATED;

        TweakedKeyMaterial tweaked = TweakInternalKey(internal_sk);
        KeyPair tweaked_keypair(std::move(*tweaked.tweaked_sk));
        tweaked.tweaked_sk.reset();

        if (tweaked_keypair.GetPubKey() != m_info.GetOutputPubKey()) {
            throw TweakError("Tweaked key does not match the output key");
        }
        sig = tweaked_keypair.SignTaprootTx(plan.tx, plan.nin, request.spent_outputs, CScript(), request.hashtype);
    }

    plan.witness.clear();
    plan.witness.emplace_back(std::move(sig));
}

TweakedKeyMaterial SpendPlanner::TweakInternalKey(const seckey& internal_sk) const
{
    return TweakPrivate(internal_sk, m_info.GetInternalXOnlyPubKey(), m_info.GetMerkleRoot());
}

SpendPlan SpendPlanner::Plan(const SpendRequest& request) const
{
    SpendPlan plan;
    plan.kind = request.kind;
    plan.tx = request.tx;
    plan.nin = request.nin;

    auto reject = [&plan](ErrorKind kind, std::string reason) {
        plan.state = SpendState::REJECTED;
        plan.error = kind;
        plan.reason = std::move(reason);
        plan.witness.clear();
    };

    try {
        ValidateTransaction(request);

        switch (request.kind) {
        case SpendKind::SCRIPT_PATH_THRESHOLD:
            BuildThresholdWitness(request, plan);
            break;
        case SpendKind::SCRIPT_PATH_TIMELOCK:
            BuildTimelockWitness(request, plan);
            break;
        case SpendKind::KEY_PATH:
            BuildKeyPathWitness(request, plan);
            break;
        default:
            throw IllegalArgumentError("Unknown spend kind");
        }
        plan.state = SpendState::WITNESS_BUILT;
    }
    catch (const PreconditionError& e) {
        reject(ErrorKind::PRECONDITION_FAILURE, std::string(e.what()) + ": " + e.details());
    }
    catch (const CryptoError& e) {
        reject(ErrorKind::CRYPTO_FAILURE, std::string(e.what()) + ": " + e.details());
    }
    catch (const InputError& e) {
        reject(ErrorKind::INPUT_VALIDATION, std::string(e.what()) + ": " + e.details());
    }
    catch (const std::exception& e) {
        reject(ErrorKind::INTERNAL_FAILURE, std::string("Unexpected error: ") + e.what());
    }

    return plan;
}

std::vector<SpendPlan> SpendPlanner::PlanBatch(const std::vector<SpendRequest>& requests) const
{
    std::vector<SpendPlan> res;
    res.reserve(requests.size());
    std::transform(requests.begin(), requests.end(), std::back_inserter(res), [this](const SpendRequest& r) { return Plan(r); });
    return res;
}

}
