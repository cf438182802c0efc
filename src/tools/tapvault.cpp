#include <iostream>
#include <algorithm>
#include <iterator>

#include "util/translation.h"
#include "univalue.h"

#include "common.hpp"
#include "config.hpp"
#include "public_key.hpp"
#include "taproot_info.hpp"
#include "key_tweaker.hpp"

const std::function<std::string(const char*)> G_TRANSLATION_FUN = nullptr;

using namespace tapvault;
using namespace tapvault::core;

namespace {

TaprootInfo MakeTaprootInfo(const Config& conf, const char* const subcommand)
{
    stringvector hex_pubkeys = conf.Value<stringvector>(subcommand, config::option::PUBKEY, {});

    std::vector<public_key> pubkeys;
    pubkeys.reserve(hex_pubkeys.size());
    std::transform(hex_pubkeys.begin(), hex_pubkeys.end(), std::back_inserter(pubkeys), [](const std::string& s) { return ParsePublicKey(s); });

    std::optional<public_key> internal_pk;
    if (auto internal_hex = conf.Value<std::string>(subcommand, config::option::INTERNAL_PUBKEY)) {
        internal_pk = ParsePublicKey(*internal_hex);
    }

    return TaprootInfo::Create(pubkeys,
                               conf.Value<uint32_t>(subcommand, config::option::HEIGHT, 0),
                               conf.Value<uint32_t>(subcommand, config::option::LOCK_DELTA, DEFAULT_LOCK_DELTA),
                               conf.Value<uint32_t>(subcommand, config::option::THRESHOLD, DEFAULT_THRESHOLD),
                               internal_pk);
}

std::string TweakKey(const Config& conf, const IBech32Coder& bech)
{
    xonly_pubkey internal_pk = GetXOnlyPubKey(ParsePublicKey(conf.Value<std::string>(config::TWEAK, config::option::PUBKEY, {})));

    std::optional<uint256> merkle_root;
    if (auto root_hex = conf.Value<std::string>(config::TWEAK, config::option::MERKLE_ROOT)) {
        bytevector root = unhex<bytevector>(*root_hex);
        if (root.size() != 32) {
            throw IllegalArgumentError("Wrong merkle root size: " + std::to_string(root.size()));
        }
        merkle_root.emplace();
        std::copy(root.begin(), root.end(), merkle_root->begin());
    }

    auto [output_pk, parity] = TweakPublic(internal_pk, merkle_root);

    UniValue res(UniValue::VOBJ);
    res.pushKV(TaprootInfo::name_address, bech.Encode(output_pk));
    res.pushKV(TaprootInfo::name_internal_xonly_pk, hex(internal_pk));
    res.pushKV(TaprootInfo::name_merkle_root, merkle_root ? hex(*merkle_root) : std::string());
    res.pushKV("tweak", hex(TapTweakHash(internal_pk, merkle_root)));
    res.pushKV(TaprootInfo::name_output_pk, hex(output_pk));
    res.pushKV(TaprootInfo::name_output_parity, static_cast<uint64_t>(parity));

    return res.write(2);
}

}

int main(int argc, char* argv[])
{
    Config conf;
    if (auto exit_code = conf.ProcessConfig(argc, argv)) {
        return *exit_code;
    }

    try {
        auto bech = MakeBech32Coder(conf.ChainMode());

        if (conf.Selected(config::CREATE)) {
            TaprootInfo info = MakeTaprootInfo(conf, config::CREATE);
            std::cout << info.Serialize(*bech) << std::endl;
        }
        else if (conf.Selected(config::CONTROLBLOCK)) {
            TaprootInfo info = MakeTaprootInfo(conf, config::CONTROLBLOCK);
            size_t leaf = conf.Value<size_t>(config::CONTROLBLOCK, config::option::LEAF, 0);
            std::clog << "Leaf " << leaf << " script: " << hex(info.GetLeaf(leaf)) << std::endl;
            std::cout << hex(info.GetControlBlock(leaf)) << std::endl;
        }
        else if (conf.Selected(config::TWEAK)) {
            std::cout << TweakKey(conf, *bech) << std::endl;
        }
    }
    catch (const Error& e) {
        print_error(e, std::cerr);
        return 1;
    }
    catch (const std::exception& e) {
        print_error(e, std::cerr);
        return 1;
    }

    return 0;
}
