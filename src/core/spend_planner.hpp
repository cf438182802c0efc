#pragma once

#include <vector>
#include <string>

#include "primitives/transaction.h"
#include "script/interpreter.h"

#include "common.hpp"
#include "key_tweaker.hpp"
#include "taproot_info.hpp"

namespace tapvault::core {

enum class SpendKind { SCRIPT_PATH_THRESHOLD, SCRIPT_PATH_TIMELOCK, KEY_PATH };

enum class SpendState { REQUESTED, VALIDATED, WITNESS_BUILT, REJECTED };

// INTERNAL_FAILURE is an unexpected failure of an underlying library, not caused by the request
enum class ErrorKind { NONE, INPUT_VALIDATION, PRECONDITION_FAILURE, CRYPTO_FAILURE, INTERNAL_FAILURE };

const char* ToString(SpendKind kind);
const char* ToString(SpendState state);
const char* ToString(ErrorKind kind);

struct SpendRequest
{
    SpendKind kind = SpendKind::KEY_PATH;
    CMutableTransaction tx;
    uint32_t nin = 0;
    // One per transaction input, required by the BIP-341 signature digest
    std::vector<CTxOut> spent_outputs;
    uint32_t chain_height = 0;

    // Threshold leaf: one slot per participant key in key order, empty slot for an absent signer.
    // Timelock leaf and key path: exactly one signature.
    std::vector<bytevector> signatures;

    // Alternative to signatures: the planner signs by itself.
    // Key path takes the internal private key.
    std::vector<seckey> signing_keys;
    int hashtype = SIGHASH_DEFAULT;
};

struct SpendPlan
{
    SpendKind kind = SpendKind::KEY_PATH;
    SpendState state = SpendState::REQUESTED;
    ErrorKind error = ErrorKind::NONE;
    std::string reason;

    CMutableTransaction tx;
    uint32_t nin = 0;
    std::vector<bytevector> witness;

    bool IsBuilt() const
    { return state == SpendState::WITNESS_BUILT; }

    // Transaction with the witness placed at the spending input
    CMutableTransaction SignedTransaction() const;
};


// Validates spend preconditions against a TaprootInfo and assembles the witness stack.
// Errors never escape Plan(): they are reported through SpendPlan::error and SpendPlan::reason.
class SpendPlanner
{
    const TaprootInfo& m_info;

    void ValidateTransaction(const SpendRequest& request) const;

    void BuildThresholdWitness(const SpendRequest& request, SpendPlan& plan) const;
    void BuildTimelockWitness(const SpendRequest& request, SpendPlan& plan) const;
    void BuildKeyPathWitness(const SpendRequest& request, SpendPlan& plan) const;

protected:
    // Key path signing secret derived from the internal private key
    virtual TweakedKeyMaterial TweakInternalKey(const seckey& internal_sk) const;

public:
    explicit SpendPlanner(const TaprootInfo& info) : m_info(info) {}
    virtual ~SpendPlanner() = default;

    const TaprootInfo& GetTaprootInfo() const { return m_info; }

    SpendPlan Plan(const SpendRequest& request) const;
    std::vector<SpendPlan> PlanBatch(const std::vector<SpendRequest>& requests) const;

    // Raises the locktime to the lock height and enables it for the input.
    // Must be applied before a timelock leaf signature is produced outside of the planner.
    CMutableTransaction PrepareTimelockTransaction(const CMutableTransaction& tx, uint32_t nin) const;
};

}
